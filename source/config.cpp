#include <syncf/config.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>

namespace fs = std::filesystem;

namespace syncf {

fs::path default_store_dir(){
    std::error_code ec;
    fs::path exe = fs::read_symlink("/proc/self/exe", ec);
    if (ec || exe.empty()) {
        return fs::current_path(ec) / ".files";
    }
    return exe.parent_path().parent_path() / ".files";
}

static std::size_t env_size(const char* name, std::size_t fallback){
    const char* e = std::getenv(name);
    if (!e || !*e) return fallback;
    char* end = nullptr;
    unsigned long long v = std::strtoull(e, &end, 10);
    if (end == e || *end != '\0' || v == 0) {
        spdlog::warn("ignoring {}={}: expected a positive number", name, e);
        return fallback;
    }
    return static_cast<std::size_t>(v);
}

Config load_config(){
    Config cfg;
    cfg.store_dir = default_store_dir();
    if (const char* e = std::getenv("SYNCF_STORE"); e && *e)     cfg.store_dir = e;
    if (const char* e = std::getenv("SYNCF_THREADS"))             cfg.threads   = static_cast<unsigned>(std::max(0, std::atoi(e)));
    if (const char* e = std::getenv("SYNCF_LOG_FILE"); e && *e)  cfg.log_file  = fs::path(e);
    if (const char* e = std::getenv("SYNCF_LOG_LEVEL"); e && *e) cfg.log_level = e;
    cfg.log_max_bytes = env_size("SYNCF_LOG_MAX_BYTES", cfg.log_max_bytes);
    cfg.log_files     = env_size("SYNCF_LOG_FILES", cfg.log_files);
    return cfg;
}

} // namespace syncf
