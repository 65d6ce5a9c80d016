#include <syncf/naming.hpp>
#include <syncf/bundle.hpp>
#include <syncf/error.hpp>

#include <fmt/format.h>

#include <cctype>
#include <cstring>
#include <ctime>

namespace syncf {

static constexpr size_t kStampLen = 15; // YYYYMMDD_HHMMSS

static bool is_unsafe(char c){
    return c == '/' || c == '\\' || c == '\0' || std::iscntrl(static_cast<unsigned char>(c));
}

static bool is_trimmed(char c){
    return c == '_' || c == '.' || std::isspace(static_cast<unsigned char>(c));
}

std::string sanitize_label(const std::string& label){
    std::string s = label;
    for (auto& c : s) {
        if (is_unsafe(c)) c = '_';
    }
    size_t i = 0, j = s.size();
    while (i < j && is_trimmed(s[i])) ++i;
    while (j > i && is_trimmed(s[j-1])) --j;
    s = s.substr(i, j - i);
    if (s.empty()) {
        throw Error(ErrorKind::InvalidLabel,
                    fmt::format("bundle label '{}' is empty after removing unsafe characters", label));
    }
    return s;
}

std::string format_stamp(std::chrono::system_clock::time_point at){
    std::time_t t = std::chrono::system_clock::to_time_t(at);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm);
    return std::string(buf);
}

static bool all_digits(const std::string& s, size_t from, size_t len){
    for (size_t k = from; k < from + len; ++k) {
        if (!std::isdigit(static_cast<unsigned char>(s[k]))) return false;
    }
    return true;
}

static int num(const std::string& s, size_t from, size_t len){
    int v = 0;
    for (size_t k = from; k < from + len; ++k) v = v * 10 + (s[k] - '0');
    return v;
}

std::optional<std::chrono::system_clock::time_point> parse_stamp(const std::string& s){
    if (s.size() != kStampLen || s[8] != '_') return std::nullopt;
    if (!all_digits(s, 0, 8) || !all_digits(s, 9, 6)) return std::nullopt;

    std::tm tm{};
    tm.tm_year = num(s, 0, 4) - 1900;
    tm.tm_mon  = num(s, 4, 2) - 1;
    tm.tm_mday = num(s, 6, 2);
    tm.tm_hour = num(s, 9, 2);
    tm.tm_min  = num(s, 11, 2);
    tm.tm_sec  = num(s, 13, 2);
    tm.tm_isdst = -1;
    if (tm.tm_mon < 0 || tm.tm_mon > 11 || tm.tm_mday < 1 || tm.tm_mday > 31 ||
        tm.tm_hour > 23 || tm.tm_min > 59 || tm.tm_sec > 60) {
        return std::nullopt;
    }
    std::time_t t = std::mktime(&tm);
    if (t == static_cast<std::time_t>(-1)) return std::nullopt;
    return std::chrono::system_clock::from_time_t(t);
}

std::string bundle_name(const std::string& label, std::chrono::system_clock::time_point at){
    return fmt::format("{}_{}{}", sanitize_label(label), format_stamp(at), kBundleExt);
}

std::optional<BundleNameParts> parse_bundle_name(const std::string& filename){
    const size_t ext_len = std::strlen(kBundleExt);
    if (filename.size() < ext_len + kStampLen + 2) return std::nullopt;
    if (filename.compare(filename.size() - ext_len, ext_len, kBundleExt) != 0) return std::nullopt;

    std::string stem = filename.substr(0, filename.size() - ext_len);
    std::string stamp = stem.substr(stem.size() - kStampLen);
    if (stem[stem.size() - kStampLen - 1] != '_') return std::nullopt;
    if (!parse_stamp(stamp)) return std::nullopt;

    BundleNameParts parts;
    parts.label = stem.substr(0, stem.size() - kStampLen - 1);
    parts.stamp = std::move(stamp);
    if (parts.label.empty()) return std::nullopt;
    return parts;
}

} // namespace syncf
