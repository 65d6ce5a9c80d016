#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <variant>

namespace syncf {

struct CmdPack {
    std::filesystem::path pattern_file;
    std::string label;
};
struct CmdUnpack {
    std::optional<std::string> bundle;
    std::optional<std::filesystem::path> dest;
};
struct CmdList {};
struct CmdClean {};
struct CmdHelp {};
struct CmdVersion {};

using Command = std::variant<CmdPack, CmdUnpack, CmdList, CmdClean, CmdHelp, CmdVersion>;

// Flags shared by every command; they override the environment.
struct Options {
    bool verbose = false;
    bool assume_yes = false;
    std::optional<std::filesystem::path> store;
    std::optional<std::filesystem::path> root;
    std::optional<std::filesystem::path> log_file;
    std::optional<unsigned> threads;
};

struct ParseResult {
    std::optional<Command> cmd;
    Options opts;
    std::string error;
};

ParseResult parse_cli(int argc, char** argv);

} // namespace syncf
