#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include <syncf/app.hpp>
#include <syncf/catalog.hpp>
#include <syncf/cli.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using namespace syncf;
namespace fs = std::filesystem;

static fs::path make_tmpdir(const std::string& prefix) {
    fs::path base = fs::temp_directory_path() / (prefix + "XXXXXX");
    std::string s = base.string();
    std::vector<char> buf(s.begin(), s.end());
    buf.push_back('\0');
    char* p = mkdtemp(buf.data());
    REQUIRE(p != nullptr);
    return fs::path(p);
}

static void touch(const fs::path& p, const std::string& content = "x") {
    fs::create_directories(p.parent_path());
    std::ofstream(p, std::ios::binary) << content;
}

static ParseResult parse(std::vector<std::string> args) {
    args.insert(args.begin(), "syncf");
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    return parse_cli(static_cast<int>(argv.size()), argv.data());
}

static int run_app(std::vector<std::string> args, const std::string& input, std::string& output) {
    args.insert(args.begin(), "syncf");
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    std::istringstream in(input);
    std::ostringstream out;
    int rc = App(in, out).run(static_cast<int>(argv.size()), argv.data());
    output = out.str();
    return rc;
}

static bool contains(const std::string& hay, const std::string& needle) {
    return hay.find(needle) != std::string::npos;
}

TEST_CASE("No arguments prints help") {
    auto r = parse({});
    REQUIRE(r.cmd);
    REQUIRE(std::holds_alternative<CmdHelp>(*r.cmd));
    REQUIRE(std::holds_alternative<CmdVersion>(*parse({"--version"}).cmd));
    REQUIRE(std::holds_alternative<CmdHelp>(*parse({"-l", "-h"}).cmd));
}

TEST_CASE("Pack command") {
    auto r = parse({"-z", "rules.txt", "backup", "--root", "/src", "-v"});
    REQUIRE(r.error.empty());
    auto* c = std::get_if<CmdPack>(&*r.cmd);
    REQUIRE(c != nullptr);
    REQUIRE(c->pattern_file.string() == "rules.txt");
    REQUIRE(c->label == "backup");
    REQUIRE(r.opts.root->string() == "/src");
    REQUIRE(r.opts.verbose);

    auto bad = parse({"-z", "rules.txt"});
    REQUIRE_FALSE(bad.cmd);
    REQUIRE_FALSE(bad.error.empty());
}

TEST_CASE("Unpack command with and without a bundle") {
    auto r = parse({"-u", "web", "-C", "/restore", "-y"});
    auto* c = std::get_if<CmdUnpack>(&*r.cmd);
    REQUIRE(c != nullptr);
    REQUIRE(*c->bundle == "web");
    REQUIRE(c->dest->string() == "/restore");
    REQUIRE(r.opts.assume_yes);

    auto bare = parse({"-u", "-y"});
    auto* b = std::get_if<CmdUnpack>(&*bare.cmd);
    REQUIRE(b != nullptr);
    REQUIRE_FALSE(b->bundle);
    REQUIRE_FALSE(b->dest);
}

TEST_CASE("Shared options") {
    auto r = parse({"--store", "/s", "--threads", "4", "--log-file", "/l.log", "-l"});
    REQUIRE(std::holds_alternative<CmdList>(*r.cmd));
    REQUIRE(r.opts.store->string() == "/s");
    REQUIRE(*r.opts.threads == 4u);
    REQUIRE(r.opts.log_file->string() == "/l.log");
    REQUIRE(std::holds_alternative<CmdClean>(*parse({"-c", "--yes"}).cmd));
}

TEST_CASE("Usage errors") {
    for (std::vector<std::string> args : std::vector<std::vector<std::string>>{
             {"-l", "-c"},
             {"-z", "r", "l", "-u"},
             {"-C", "/d", "-l"},
             {"--threads", "many", "-l"},
             {"--store"},
             {"-l", "extra"},
             {"--bogus"},
             {"-v"},
         }) {
        auto r = parse(args);
        REQUIRE_FALSE(r.cmd);
        REQUIRE_FALSE(r.error.empty());
    }
}

TEST_CASE("Pack, list, unpack and clean end to end") {
    auto tmp = make_tmpdir("app_e2e_");
    const std::string root = (tmp / "root").string();
    const std::string store = (tmp / "store").string();
    const std::string rules = (tmp / "rules.txt").string();
    touch(tmp / "root" / "main.py", "print('hi')\n");
    touch(tmp / "root" / "pkg" / "util.py", "x = 1\n");
    touch(tmp / "root" / "pkg" / "test_util.py", "assert True\n");
    touch(tmp / "root" / "README.md", "readme");
    touch(tmp / "rules.txt", "# python sources\n*.py\n!test_*.py\n");

    std::string out;
    REQUIRE(run_app({"-z", rules, "proj", "--root", root, "--store", store}, "", out) == 0);
    REQUIRE(contains(out, "Package complete"));
    REQUIRE(contains(out, "Packed 2 files"));

    REQUIRE(run_app({"-l", "--store", store}, "", out) == 0);
    REQUIRE(contains(out, "  1. proj_"));
    REQUIRE(run_app({"-l", "-v", "--store", store}, "", out) == 0);
    REQUIRE(contains(out, ", 2 files)"));

    const std::string dest1 = (tmp / "dest1").string();
    REQUIRE(run_app({"-u", "proj", "-C", dest1, "-y", "--store", store}, "", out) == 0);
    REQUIRE(contains(out, "unpack finished: proj_"));
    REQUIRE(contains(out, " (2 files, "));
    REQUIRE(fs::exists(tmp / "dest1" / "main.py"));
    REQUIRE(fs::exists(tmp / "dest1" / "pkg" / "util.py"));
    REQUIRE_FALSE(fs::exists(tmp / "dest1" / "pkg" / "test_util.py"));
    REQUIRE_FALSE(fs::exists(tmp / "dest1" / "README.md"));

    // interactive: pick the first bundle, accept the default answer
    const std::string dest2 = (tmp / "dest2").string();
    REQUIRE(run_app({"-u", "-C", dest2, "--store", store}, "1\n\n", out) == 0);
    REQUIRE(contains(out, "please select file, total: 1"));
    REQUIRE(fs::exists(tmp / "dest2" / "main.py"));

    const std::string dest3 = (tmp / "dest3").string();
    REQUIRE(run_app({"-u", "-C", dest3, "--store", store}, "0\n", out) == 0);
    REQUIRE(contains(out, "you select no files"));
    REQUIRE(run_app({"-u", "-C", dest3, "--store", store}, "00\n", out) == 0);
    REQUIRE(contains(out, "you select no files"));
    REQUIRE_FALSE(fs::exists(tmp / "dest3"));

    REQUIRE(run_app({"-c", "--store", store}, "n\n", out) == 0);
    REQUIRE(contains(out, "Found 1 package files"));
    REQUIRE(BundleCatalog(store).list().size() == 1);

    REQUIRE(run_app({"-c", "-y", "--store", store}, "", out) == 0);
    REQUIRE(contains(out, "Deleted 1 files."));
    REQUIRE(BundleCatalog(store).list().empty());
    fs::remove_all(tmp);
}

TEST_CASE("Exit codes") {
    auto tmp = make_tmpdir("app_rc_");
    const std::string root = (tmp / "root").string();
    const std::string store = (tmp / "store").string();
    touch(tmp / "root" / "a.txt");
    touch(tmp / "only_neg.txt", "!*.txt\n");
    touch(tmp / "none.txt", "*.nothing\n");
    touch(tmp / "bad.txt", "[oops\n");

    std::string out;
    REQUIRE(run_app({"--bogus"}, "", out) == 2);
    REQUIRE(run_app({"--version"}, "", out) == 0);
    REQUIRE(contains(out, "syncf "));
    REQUIRE(run_app({"-z", (tmp / "only_neg.txt").string(), "x", "--root", root, "--store", store}, "", out) == 2);
    REQUIRE(run_app({"-z", (tmp / "bad.txt").string(), "x", "--root", root, "--store", store}, "", out) == 2);
    REQUIRE(contains(out, ":1:"));
    REQUIRE(run_app({"-z", (tmp / "none.txt").string(), "x", "--root", root, "--store", store}, "", out) == 2);
    REQUIRE_FALSE(fs::exists(tmp / "store"));
    REQUIRE(run_app({"-z", (tmp / "missing.txt").string(), "x", "--root", root, "--store", store}, "", out) == 2);
    REQUIRE(run_app({"-z", (tmp / "none.txt").string(), "///", "--root", root, "--store", store}, "", out) == 2);
    REQUIRE(run_app({"-z", (tmp / "none.txt").string(), "x", "--root", (tmp / "nope").string(), "--store", store}, "", out) == 2);
    REQUIRE(run_app({"-u", "--store", store}, "", out) == 2);
    REQUIRE(run_app({"-u", "ghost", "--store", store}, "", out) == 2);

    // a plain file where the store should be
    REQUIRE(run_app({"-l", "--store", (tmp / "root" / "a.txt").string()}, "", out) == 1);
    fs::remove_all(tmp);
}
