#include <syncf/util.hpp>

#include <fmt/format.h>

#include <ctime>

#include <fcntl.h>
#include <unistd.h>

namespace syncf {

std::string format_size(std::uintmax_t bytes){
    static const char* units[] = {"B", "KB", "MB", "GB"};
    double v = static_cast<double>(bytes);
    for (const char* u : units) {
        if (v < 1024.0 || std::string(u) == "GB") return fmt::format("{:6.2f} {}", v, u);
        v /= 1024.0;
    }
    return fmt::format("{:.2f} GB", v);
}

static std::tm local_tm(std::chrono::system_clock::time_point tp){
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    return tm;
}

std::string format_age(std::chrono::system_clock::time_point at,
                       std::chrono::system_clock::time_point now)
{
    const std::tm a = local_tm(at);
    const std::tm n = local_tm(now);
    const std::tm y = local_tm(now - std::chrono::hours(24));

    char buf[64];
    if (a.tm_year == n.tm_year && a.tm_yday == n.tm_yday) {
        std::strftime(buf, sizeof(buf), "today %H:%M", &a);
    } else if (a.tm_year == y.tm_year && a.tm_yday == y.tm_yday) {
        std::strftime(buf, sizeof(buf), "yesterday %H:%M", &a);
    } else if (a.tm_year == n.tm_year) {
        std::strftime(buf, sizeof(buf), "%m-%d %H:%M", &a);
    } else {
        std::strftime(buf, sizeof(buf), "%Y-%m-%d", &a);
    }
    return std::string(buf);
}

bool is_within(const std::filesystem::path& base, const std::filesystem::path& p){
    auto rel = p.lexically_relative(base);
    if (rel.empty()) return false;
    auto first = *rel.begin();
    return first != "..";
}

void fsync_dir(const std::filesystem::path& dir){
    int dfd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dfd >= 0) { (void)::fsync(dfd); ::close(dfd); }
}

} // namespace syncf
