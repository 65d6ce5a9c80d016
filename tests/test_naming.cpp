#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include <syncf/error.hpp>
#include <syncf/naming.hpp>
#include <syncf/util.hpp>

#include <chrono>
#include <ctime>
#include <string>

using namespace syncf;
using namespace std::chrono_literals;

static std::chrono::system_clock::time_point local_time(int y, int mo, int d, int h, int mi, int s) {
    std::tm tm{};
    tm.tm_year = y - 1900;
    tm.tm_mon = mo - 1;
    tm.tm_mday = d;
    tm.tm_hour = h;
    tm.tm_min = mi;
    tm.tm_sec = s;
    tm.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&tm));
}

TEST_CASE("Labels are sanitized") {
    REQUIRE(sanitize_label("work") == "work");
    REQUIRE(sanitize_label("a/b\\c") == "a_b_c");
    REQUIRE(sanitize_label("  spaced  ") == "spaced");
    REQUIRE(sanitize_label("..hidden..") == "hidden");
    REQUIRE(sanitize_label(std::string("x\ty\nz", 5)) == "x_y_z");
    REQUIRE(sanitize_label("my label") == "my label");
}

TEST_CASE("Labels that sanitize to nothing are rejected") {
    for (const char* bad : {"", "   ", "/", "../..", "___"}) {
        try {
            sanitize_label(bad);
            FAIL("expected InvalidLabel for '" << bad << "'");
        } catch (const Error& e) {
            REQUIRE(e.kind() == ErrorKind::InvalidLabel);
        }
    }
}

TEST_CASE("Stamp is fixed width local time") {
    auto t = local_time(2024, 1, 2, 3, 4, 5);
    REQUIRE(format_stamp(t) == "20240102_030405");
    REQUIRE(format_stamp(t + 500ms) == "20240102_030405");
    auto back = parse_stamp("20240102_030405");
    REQUIRE(back);
    REQUIRE(*back == t);
}

TEST_CASE("Malformed stamps are rejected") {
    REQUIRE_FALSE(parse_stamp("2024010_030405"));
    REQUIRE_FALSE(parse_stamp("20240102-030405"));
    REQUIRE_FALSE(parse_stamp("20241302_030405"));
    REQUIRE_FALSE(parse_stamp("2024010x_030405"));
}

TEST_CASE("Bundle names sort by time for one label") {
    auto a = bundle_name("proj", local_time(2024, 1, 1, 23, 59, 59));
    auto b = bundle_name("proj", local_time(2024, 1, 2, 0, 0, 0));
    REQUIRE(a == "proj_20240101_235959.tar.gz");
    REQUIRE(a < b);
    REQUIRE_THROWS_AS(bundle_name("//", local_time(2024, 1, 1, 0, 0, 0)), Error);
}

TEST_CASE("Bundle names parse back") {
    auto parts = parse_bundle_name("my_proj_20240102_030405.tar.gz");
    REQUIRE(parts);
    REQUIRE(parts->label == "my_proj");
    REQUIRE(parts->stamp == "20240102_030405");

    REQUIRE_FALSE(parse_bundle_name("notes.txt"));
    REQUIRE_FALSE(parse_bundle_name("_20240102_030405.tar.gz"));
    REQUIRE_FALSE(parse_bundle_name("proj20240102_030405.tar.gz"));
    REQUIRE_FALSE(parse_bundle_name("proj_20240102_030405.tar"));
    REQUIRE_FALSE(parse_bundle_name(".proj_20240102_030405.tar.gz.tmp-42"));
}

TEST_CASE("Human readable sizes") {
    REQUIRE(format_size(0) == "  0.00 B");
    REQUIRE(format_size(1536) == "  1.50 KB");
    REQUIRE(format_size(5ull * 1024 * 1024) == "  5.00 MB");
    REQUIRE(format_size(3ull * 1024 * 1024 * 1024 * 1024) == "3072.00 GB");
}

TEST_CASE("Relative age") {
    auto now = local_time(2024, 6, 15, 12, 0, 0);
    REQUIRE(format_age(local_time(2024, 6, 15, 9, 30, 0), now) == "today 09:30");
    REQUIRE(format_age(local_time(2024, 6, 14, 22, 5, 0), now) == "yesterday 22:05");
    REQUIRE(format_age(local_time(2024, 3, 1, 8, 0, 0), now) == "03-01 08:00");
    REQUIRE(format_age(local_time(2023, 12, 31, 8, 0, 0), now) == "2023-12-31");
}

TEST_CASE("Path containment") {
    REQUIRE(is_within("/a/b", "/a/b"));
    REQUIRE(is_within("/a/b", "/a/b/c/d"));
    REQUIRE_FALSE(is_within("/a/b", "/a/bc"));
    REQUIRE_FALSE(is_within("/a/b", "/a"));
    REQUIRE_FALSE(is_within("/a/b", "/etc/passwd"));
}
