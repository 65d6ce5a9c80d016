#include <syncf/cli.hpp>

#include <fmt/format.h>

#include <cstdlib>
#include <string_view>

namespace syncf {

static bool has_arg(int i, int argc) { return i + 1 < argc; }

static bool is_flag(const char* a) { return a[0] == '-' && a[1] != '\0'; }

static std::optional<unsigned> parse_count(std::string_view s){
    if (s.empty() || s.size() > 6) return std::nullopt;
    unsigned v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return std::nullopt;
        v = v * 10 + static_cast<unsigned>(c - '0');
    }
    return v;
}

ParseResult parse_cli(int argc, char** argv){
    ParseResult r{};
    if (argc < 2) {
        r.cmd = CmdHelp{};
        return r;
    }

    std::optional<Command> cmd;
    std::optional<std::filesystem::path> dest;
    auto set_cmd = [&](Command c, std::string_view flag) -> bool {
        if (cmd) {
            r.error = fmt::format("{}: only one of -z, -u, -l, -c may be given", flag);
            return false;
        }
        cmd = std::move(c);
        return true;
    };

    for (int i = 1; i < argc; ++i) {
        std::string_view a = argv[i];
        if (a == "-h" || a == "--help") {
            r.cmd = CmdHelp{};
            return r;
        }
        if (a == "--version") {
            r.cmd = CmdVersion{};
            return r;
        }
        if (a == "-z") {
            if (i + 2 >= argc) {
                r.error = "-z: pattern file and label required";
                return r;
            }
            CmdPack c{argv[i + 1], argv[i + 2]};
            i += 2;
            if (!set_cmd(c, a)) return r;
        } else if (a == "-u") {
            CmdUnpack c{};
            if (has_arg(i, argc) && !is_flag(argv[i + 1])) c.bundle = argv[++i];
            if (!set_cmd(c, a)) return r;
        } else if (a == "-l") {
            if (!set_cmd(CmdList{}, a)) return r;
        } else if (a == "-c") {
            if (!set_cmd(CmdClean{}, a)) return r;
        } else if (a == "-C") {
            if (!has_arg(i, argc)) {
                r.error = "-C: directory required";
                return r;
            }
            dest = argv[++i];
        } else if (a == "-v" || a == "--verbose") {
            r.opts.verbose = true;
        } else if (a == "-y" || a == "--yes") {
            r.opts.assume_yes = true;
        } else if (a == "--store" || a == "--root" || a == "--log-file" || a == "--threads") {
            if (!has_arg(i, argc)) {
                r.error = fmt::format("{}: value required", a);
                return r;
            }
            std::string_view v = argv[++i];
            if (a == "--store") r.opts.store = std::filesystem::path(v);
            else if (a == "--root") r.opts.root = std::filesystem::path(v);
            else if (a == "--log-file") r.opts.log_file = std::filesystem::path(v);
            else if (auto n = parse_count(v)) r.opts.threads = *n;
            else {
                r.error = fmt::format("--threads: expected a number, got '{}'", v);
                return r;
            }
        } else if (is_flag(argv[i])) {
            r.error = fmt::format("unknown option: {}", a);
            return r;
        } else {
            r.error = fmt::format("unexpected argument: {}", a);
            return r;
        }
    }

    if (!cmd) {
        r.error = "no command given (one of -z, -u, -l, -c)";
        return r;
    }
    if (dest) {
        auto* u = std::get_if<CmdUnpack>(&*cmd);
        if (!u) {
            r.error = "-C is only valid with -u";
            return r;
        }
        u->dest = dest;
    }
    r.cmd = std::move(cmd);
    return r;
}

} // namespace syncf
