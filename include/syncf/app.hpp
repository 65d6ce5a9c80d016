#pragma once
#include <syncf/bundle.hpp>
#include <syncf/cli.hpp>
#include <syncf/config.hpp>

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace syncf {

class App {
public:
    App();
    App(std::istream& in, std::ostream& out);

    // Returns the process exit code: 0 on success or cancel, 2 on a usage or
    // user error, 1 on an I/O failure.
    int run(int argc, char** argv);

private:
    std::istream& in_;
    std::ostream& out_;
    bool assume_yes_{false};
    bool verbose_{false};

    int pack(const CmdPack& c, const Config& cfg);
    int unpack(const CmdUnpack& c, const Config& cfg);
    int list(const Config& cfg);
    int clean(const Config& cfg);

    void print_bundles(const std::vector<Bundle>& bundles);
    // nullopt when the user leaves the prompt empty or enters 0.
    std::optional<Bundle> choose(const std::vector<Bundle>& bundles);
    bool confirm(const std::string& question, bool default_yes);
};

} // namespace syncf
