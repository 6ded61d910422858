#include "FileUtils.hpp"

#include <plog/Log.h>

#include <chrono>
#include <cstdio>
#include <fstream>
#include <random>
#include <sstream>

namespace fs = std::filesystem;

namespace utils
{

std::optional<std::uint64_t> file_mtime_seconds(const fs::path& path)
{
    std::error_code ec;
    if (!fs::is_regular_file(path, ec))
        return std::nullopt;

    auto ftime = fs::last_write_time(path, ec);
    if (ec)
        return std::nullopt;

    auto sys = std::chrono::file_clock::to_sys(ftime);
    auto secs = std::chrono::floor<std::chrono::seconds>(sys).time_since_epoch().count();
    if (secs < 0)
        return 0;
    return static_cast<std::uint64_t>(secs);
}

bool allocate_unique_path(const fs::path& dir, const std::string& fileName, fs::path& outPath, std::string& outError)
{
    const std::string safeName = fileName.empty() ? "file" : fileName;

    std::error_code ec;
    fs::path candidate = dir / safeName;
    if (!fs::exists(candidate, ec))
    {
        outPath = candidate;
        return true;
    }

    const std::string stem = candidate.stem().string();
    const std::string ext = candidate.extension().string(); // includes the dot

    for (int n = 2; n <= 10000; ++n)
    {
        candidate = dir / (stem + " (" + std::to_string(n) + ")" + ext);
        if (!fs::exists(candidate, ec))
        {
            outPath = candidate;
            return true;
        }
    }

    outError = "Could not allocate unique filename";
    return false;
}

fs::path make_temp_sibling(const fs::path& dest)
{
    thread_local std::mt19937 rng{ std::random_device{}() };
    std::uniform_int_distribution<unsigned> dist(0, 0xFFFFFF);

    char token[8];
    std::snprintf(token, sizeof(token), "%06x", dist(rng));
    return dest.parent_path() / ("." + dest.filename().string() + "." + token + ".part");
}

bool replace_file(const fs::path& temp, const fs::path& dest, std::string& outError)
{
    std::error_code ec;
    if (fs::exists(dest, ec))
    {
        fs::remove(dest, ec);
        if (ec)
        {
            outError = "Failed to remove existing " + dest.string() + ": " + ec.message();
            return false;
        }
    }

    fs::rename(temp, dest, ec);
    if (!ec)
        return true;

    // rename cannot cross filesystems; fall back to copy + remove
    PLOG_DEBUG << "rename failed (" << ec.message() << "), copying " << temp << " -> " << dest;
    ec.clear();
    fs::copy_file(temp, dest, fs::copy_options::overwrite_existing, ec);
    if (ec)
    {
        outError = "Failed to move " + temp.string() + " into place: " + ec.message();
        return false;
    }
    fs::remove(temp, ec);
    return true;
}

bool is_hidden_name(const std::string& name) { return !name.empty() && name.front() == '.'; }

bool read_file(const fs::path& path, std::string& outContent, std::string& outError)
{
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open())
    {
        outError = "Failed to open " + path.string();
        return false;
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad())
    {
        outError = "Failed to read " + path.string();
        return false;
    }
    outContent = buffer.str();
    return true;
}

std::string format_size(std::uint64_t bytes)
{
    constexpr std::uint64_t KB = 1024;
    constexpr std::uint64_t MB = KB * 1024;
    constexpr std::uint64_t GB = MB * 1024;

    char buf[32];
    if (bytes >= GB)
        std::snprintf(buf, sizeof(buf), "%.2f GB", static_cast<double>(bytes) / GB);
    else if (bytes >= MB)
        std::snprintf(buf, sizeof(buf), "%.2f MB", static_cast<double>(bytes) / MB);
    else if (bytes >= KB)
        std::snprintf(buf, sizeof(buf), "%.2f KB", static_cast<double>(bytes) / KB);
    else
        std::snprintf(buf, sizeof(buf), "%llu B", static_cast<unsigned long long>(bytes));
    return buf;
}

std::string format_timestamp(std::uint64_t epochSeconds, std::uint64_t nowEpochSeconds)
{
    if (epochSeconds == 0)
        return "Unknown";

    std::uint64_t diff = nowEpochSeconds > epochSeconds ? nowEpochSeconds - epochSeconds : 0;
    if (diff < 60)
        return "Just now";
    if (diff < 3600)
        return std::to_string(diff / 60) + " min ago";
    if (diff < 86400)
        return std::to_string(diff / 3600) + " hr ago";
    return std::to_string(diff / 86400) + " days ago";
}

std::uint64_t now_epoch_seconds()
{
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(now).count());
}

} // namespace utils
