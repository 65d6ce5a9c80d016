#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include <syncf/error.hpp>
#include <syncf/pattern.hpp>

#include <string>

using namespace syncf;

static Matcher make(const std::string& text) {
    return Matcher::compile(parse_rules(text));
}

static ErrorKind kind_of(const std::string& text) {
    try {
        make(text);
    } catch (const Error& e) {
        return e.kind();
    }
    FAIL("expected syncf::Error");
    return ErrorKind::Io;
}

TEST_CASE("Comments, blank lines and trimming") {
    auto set = parse_rules("# header\n\n  *.txt  \n\\#hash\n!*.bak\n");
    REQUIRE(set.size() == 3);
    REQUIRE(set.rules[0].glob == "*.txt");
    REQUIRE(set.rules[0].line == 3);
    REQUIRE(set.rules[1].glob == "\\#hash");
    REQUIRE(set.rules[2].negated);
    REQUIRE(set.rules[2].glob == "*.bak");
}

TEST_CASE("Rule flags") {
    auto set = parse_rules("build/\n/top.txt\nsrc/*.c\nname\n");
    REQUIRE(set.rules[0].directory_only);
    REQUIRE_FALSE(set.rules[0].anchored);
    REQUIRE(set.rules[1].anchored);
    REQUIRE(set.rules[1].glob == "top.txt");
    REQUIRE(set.rules[2].anchored);
    REQUIRE_FALSE(set.rules[3].anchored);
    REQUIRE_FALSE(set.rules[3].directory_only);
}

TEST_CASE("Python sources without tests") {
    auto m = make("*.py\n!test_*.py\n");
    REQUIRE(m.matches("a.py", false));
    REQUIRE(m.matches("pkg/b.py", false));
    REQUIRE_FALSE(m.matches("test_a.py", false));
    REQUIRE_FALSE(m.matches("pkg/test_b.py", false));
    REQUIRE_FALSE(m.matches("README.md", false));
}

TEST_CASE("Last matching rule wins") {
    auto m = make("*.log\n!*.log\n*.log\n");
    REQUIRE(m.matches("x.log", false));
    auto n = make("*.log\n!debug.log\n");
    REQUIRE(n.matches("info.log", false));
    REQUIRE_FALSE(n.matches("debug.log", false));
}

TEST_CASE("Unmatched paths are excluded") {
    auto m = make("*.cpp\n");
    REQUIRE(m.evaluate("x.hpp", false) == Verdict::Unmatched);
    REQUIRE_FALSE(m.matches("x.hpp", false));
}

TEST_CASE("Anchored rules match from the root only") {
    auto m = make("/config.ini\nsrc/*.c\n");
    REQUIRE(m.matches("config.ini", false));
    REQUIRE_FALSE(m.matches("sub/config.ini", false));
    REQUIRE(m.matches("src/main.c", false));
    REQUIRE_FALSE(m.matches("lib/src/main.c", false));
    REQUIRE_FALSE(m.matches("src/deep/main.c", false));
}

TEST_CASE("Directory rules apply to the whole subtree") {
    auto m = make("docs/\n");
    REQUIRE(m.matches("docs/a.md", false));
    REQUIRE(m.matches("docs/img/b.png", false));
    REQUIRE(m.matches("nested/docs/c.md", false));
    REQUIRE_FALSE(m.matches("docs", false));
    REQUIRE_FALSE(m.matches("other/a.md", false));
}

TEST_CASE("Excluded directory short-circuits its subtree") {
    auto m = make("*\n!build/\n*.keep\n");
    REQUIRE(m.matches("src/a.c", false));
    REQUIRE_FALSE(m.matches("build/out.o", false));
    // a later rule cannot re-include a file under an excluded directory
    REQUIRE_FALSE(m.matches("build/x.keep", false));
    REQUIRE(m.matches("src/x.keep", false));
}

TEST_CASE("A file rule overrides the inherited directory verdict") {
    auto m = make("src/\n!*.o\n");
    REQUIRE(m.matches("src/a.c", false));
    REQUIRE_FALSE(m.matches("src/a.o", false));
    REQUIRE(m.resolve("src/a.c", false, Verdict::Include) == Verdict::Include);
    REQUIRE(m.resolve("src/a.o", false, Verdict::Include) == Verdict::Exclude);
}

TEST_CASE("Double star forms") {
    auto m = make("**/cache/*.bin\nlogs/**\na/**/z.txt\n");
    REQUIRE(m.matches("cache/x.bin", false));
    REQUIRE(m.matches("p/q/cache/x.bin", false));
    REQUIRE(m.matches("logs/2024/01/app.log", false));
    REQUIRE(m.matches("a/z.txt", false));
    REQUIRE(m.matches("a/b/c/z.txt", false));
    REQUIRE_FALSE(m.matches("b/z.txt", false));
}

TEST_CASE("Single star and question mark stay within a segment") {
    auto m = make("src/*.h\nv?.txt\n");
    REQUIRE(m.matches("src/a.h", false));
    REQUIRE_FALSE(m.matches("src/sub/a.h", false));
    REQUIRE(m.matches("v1.txt", false));
    REQUIRE_FALSE(m.matches("v10.txt", false));
}

TEST_CASE("Character classes") {
    auto m = make("file[0-9].txt\nlog[!a-c].txt\ndata[^xy].csv\n");
    REQUIRE(m.matches("file3.txt", false));
    REQUIRE_FALSE(m.matches("filex.txt", false));
    REQUIRE(m.matches("logd.txt", false));
    REQUIRE_FALSE(m.matches("logb.txt", false));
    REQUIRE(m.matches("dataz.csv", false));
    REQUIRE_FALSE(m.matches("datax.csv", false));
}

TEST_CASE("Escapes and regex metacharacters are literal") {
    auto m = make("a+b(1).txt\n\\*.md\n\\!important\n");
    REQUIRE(m.matches("a+b(1).txt", false));
    REQUIRE_FALSE(m.matches("aab(1).txt", false));
    REQUIRE(m.matches("*.md", false));
    REQUIRE_FALSE(m.matches("x.md", false));
    REQUIRE(m.matches("!important", false));
}

TEST_CASE("Evaluation is deterministic") {
    auto m = make("*.py\n!test_*.py\ndocs/\n");
    const char* paths[] = {"a.py", "test_a.py", "docs/x", "pkg/test_z.py", "other"};
    for (const char* p : paths) {
        bool first = m.matches(p, false);
        for (int i = 0; i < 5; ++i) REQUIRE(m.matches(p, false) == first);
    }
}

TEST_CASE("Malformed patterns name file and line") {
    try {
        Matcher::compile(parse_rules("*.txt\n\nfoo[abc\n", "rules.txt"));
        FAIL("expected InvalidPattern");
    } catch (const Error& e) {
        REQUIRE(e.kind() == ErrorKind::InvalidPattern);
        REQUIRE(std::string(e.what()).find("rules.txt:3") != std::string::npos);
    }
    REQUIRE(kind_of("*.txt\nbad\\") == ErrorKind::InvalidPattern);
    REQUIRE(kind_of("*.txt\n!\n") == ErrorKind::InvalidPattern);
}

TEST_CASE("Rules without any inclusion are rejected") {
    REQUIRE(kind_of("!*.tmp\n!*.bak\n") == ErrorKind::InvalidPattern);
    REQUIRE(kind_of("# only comments\n\n") == ErrorKind::InvalidPattern);
}

TEST_CASE("Missing pattern file") {
    REQUIRE_THROWS_AS(load_rules("/nonexistent/syncf/rules.txt"), Error);
}
