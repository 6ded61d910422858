#pragma once

#include <filesystem>
#include <string>

namespace filesync
{

// Grants read access to a user-selected folder for as long as it is held
class FolderAccess
{
public:
    virtual ~FolderAccess() = default;

    virtual bool acquire(const std::filesystem::path& folder, std::string& outError) = 0;
    virtual void release(const std::filesystem::path& folder) = 0;
};

// Plain filesystem permissions; release has nothing to undo
class PosixFolderAccess : public FolderAccess
{
public:
    bool acquire(const std::filesystem::path& folder, std::string& outError) override;
    void release(const std::filesystem::path& folder) override;
};

// Holds a grant for one scope. release() runs exactly once, on destruction,
// and only when acquire() succeeded.
class ScopedFolderAccess
{
public:
    ScopedFolderAccess(FolderAccess& access, std::filesystem::path folder);
    ~ScopedFolderAccess();

    ScopedFolderAccess(const ScopedFolderAccess&) = delete;
    ScopedFolderAccess& operator=(const ScopedFolderAccess&) = delete;

    bool granted() const { return granted_; }
    const std::string& error() const { return error_; }

private:
    FolderAccess& access_;
    std::filesystem::path folder_;
    std::string error_;
    bool granted_ = false;
};

} // namespace filesync
