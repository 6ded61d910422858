#pragma once

#include <filesystem>
#include <string>

namespace filesync
{

// Hands a finished download to the platform's share/export surface
class ExportPresenter
{
public:
    virtual ~ExportPresenter() = default;

    virtual bool present(const std::filesystem::path& file, std::string& outError) = 0;
};

class LogExportPresenter : public ExportPresenter
{
public:
    bool present(const std::filesystem::path& file, std::string& outError) override;
};

} // namespace filesync
