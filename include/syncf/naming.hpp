#pragma once
#include <chrono>
#include <optional>
#include <string>

namespace syncf {

// Replaces separators, NUL and control characters with '_' and trims
// surrounding blanks, '_' and '.'. Throws Error(InvalidLabel) when nothing is left.
std::string sanitize_label(const std::string& label);

// YYYYMMDD_HHMMSS in local time.
std::string format_stamp(std::chrono::system_clock::time_point at);
std::optional<std::chrono::system_clock::time_point> parse_stamp(const std::string& stamp);

// {sanitized label}_{stamp}.tar.gz
std::string bundle_name(const std::string& label, std::chrono::system_clock::time_point at);

struct BundleNameParts {
    std::string label;
    std::string stamp;
};

std::optional<BundleNameParts> parse_bundle_name(const std::string& filename);

} // namespace syncf
