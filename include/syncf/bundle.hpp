#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace syncf {

inline constexpr const char* kBundleExt = ".tar.gz";

// A persisted archive inside the bundle store.
struct Bundle {
    std::string label;
    std::string stamp;                                  // YYYYMMDD_HHMMSS, local time
    std::chrono::system_clock::time_point timestamp;
    std::string filename;                               // {label}_{stamp}.tar.gz
    std::filesystem::path path;
    std::uintmax_t size_bytes{0};
    std::optional<std::size_t> file_count;              // known after write/inspect
};

} // namespace syncf
