#include "ExportPresenter.hpp"

#include <plog/Log.h>

namespace filesync
{

bool LogExportPresenter::present(const std::filesystem::path& file, std::string& outError)
{
    std::error_code ec;
    if (!std::filesystem::exists(file, ec))
    {
        outError = "Nothing to share at " + file.string();
        return false;
    }

    PLOG_INFO << "Ready to share: " << file.string();
    return true;
}

} // namespace filesync
