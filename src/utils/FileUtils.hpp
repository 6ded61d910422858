#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace utils
{

// Modification time of a regular file in whole seconds since the Unix epoch.
// nullopt when the path is missing or not a regular file.
std::optional<std::uint64_t> file_mtime_seconds(const std::filesystem::path& path);

// Picks dir/fileName, or "stem (n).ext" for n = 2..10000 when taken.
// Fails only when every candidate exists.
bool allocate_unique_path(const std::filesystem::path& dir, const std::string& fileName,
                          std::filesystem::path& outPath, std::string& outError);

// Hidden-file temp name next to dest, so renames stay on one filesystem
std::filesystem::path make_temp_sibling(const std::filesystem::path& dest);

// Removes dest if present, then moves temp into its place.
// Not atomic: dest is briefly absent between the two steps.
bool replace_file(const std::filesystem::path& temp, const std::filesystem::path& dest, std::string& outError);

bool is_hidden_name(const std::string& name);

bool read_file(const std::filesystem::path& path, std::string& outContent, std::string& outError);

std::string format_size(std::uint64_t bytes);

// "Just now", "5 min ago", ... relative to nowEpochSeconds; "Unknown" for 0
std::string format_timestamp(std::uint64_t epochSeconds, std::uint64_t nowEpochSeconds);

std::uint64_t now_epoch_seconds();

} // namespace utils
