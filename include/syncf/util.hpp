#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace syncf {

// Buffer size for copying entry data in and out of archives.
inline constexpr std::size_t kChunk = 64 * 1024;

// "  1.50 KB" style, fixed two decimals, up to GB.
std::string format_size(std::uintmax_t bytes);

// "today 14:05", "yesterday 09:12", "03-17 10:00" or "2023-11-02".
std::string format_age(std::chrono::system_clock::time_point at,
                       std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

// True when p (absolute, normalized) is base or lies beneath it.
bool is_within(const std::filesystem::path& base, const std::filesystem::path& p);

void fsync_dir(const std::filesystem::path& dir);

} // namespace syncf
