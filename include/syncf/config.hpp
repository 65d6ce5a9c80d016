#pragma once
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace syncf {

struct Config {
    std::filesystem::path store_dir;
    std::filesystem::path root = ".";
    unsigned threads = 0;
    std::optional<std::filesystem::path> log_file;
    std::size_t log_max_bytes = 10 * 1024 * 1024;
    std::size_t log_files = 3;
    std::string log_level = "info";
};

// <exe>/../../.files, or .files in the current directory when the
// executable path cannot be resolved.
std::filesystem::path default_store_dir();

// Defaults overridden by SYNCF_STORE, SYNCF_THREADS, SYNCF_LOG_FILE,
// SYNCF_LOG_LEVEL, SYNCF_LOG_MAX_BYTES and SYNCF_LOG_FILES.
Config load_config();

} // namespace syncf
