#include "FolderAccess.hpp"

#include <plog/Log.h>

#include <unistd.h>

namespace filesync
{

bool PosixFolderAccess::acquire(const std::filesystem::path& folder, std::string& outError)
{
    std::error_code ec;
    if (!std::filesystem::is_directory(folder, ec))
    {
        outError = "Not a folder: " + folder.string();
        return false;
    }

    if (::access(folder.c_str(), R_OK | X_OK) != 0)
    {
        outError = "Read access denied: " + folder.string();
        return false;
    }
    return true;
}

void PosixFolderAccess::release(const std::filesystem::path& folder)
{
    PLOG_DEBUG << "Released folder access: " << folder;
}

ScopedFolderAccess::ScopedFolderAccess(FolderAccess& access, std::filesystem::path folder)
    : access_(access)
    , folder_(std::move(folder))
{
    granted_ = access_.acquire(folder_, error_);
    if (!granted_ && error_.empty())
    {
        error_ = "Access to " + folder_.string() + " was denied";
    }
}

ScopedFolderAccess::~ScopedFolderAccess()
{
    if (granted_)
    {
        access_.release(folder_);
    }
}

} // namespace filesync
