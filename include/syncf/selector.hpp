#pragma once
#include <syncf/error.hpp>
#include <syncf/pattern.hpp>

#include <filesystem>
#include <string>
#include <vector>

#include <sys/types.h>

namespace syncf {

struct SelectionResult {
    // Relative to the walk root, '/' separated, in walk order.
    std::vector<std::string> files;
    // Directories whose own or inherited verdict is inclusion, parents first.
    std::vector<std::string> directories;
    std::vector<Skip> skipped;

    bool empty() const { return files.empty() && directories.empty(); }
};

struct SelectOptions {
    // Never descended or selected (the bundle store when it lives under the root).
    std::vector<std::filesystem::path> prune;
    // 1 walks sequentially, 0 uses every core.
    unsigned threads{1};
};

class FileSelector {
public:
    FileSelector(const Matcher& matcher, SelectOptions options = {});

    // Throws Error(InvalidRoot) when root is not a readable directory.
    SelectionResult select(const std::filesystem::path& root) const;

private:
    struct DirKey {
        dev_t dev;
        ino_t ino;
        bool operator==(const DirKey& o) const { return dev == o.dev && ino == o.ino; }
    };

    struct Walk {
        std::vector<DirKey> stack;
        std::vector<DirKey> prune;
        std::vector<std::string> files;
        std::vector<std::string> dirs;
        std::vector<Skip> skipped;
    };

    Matcher matcher_;
    SelectOptions options_;

    void visit(const std::filesystem::path& parent_abs, const std::string& parent_rel,
               const std::string& name, Verdict inherited, Walk& w) const;
    void walk_dir(const std::filesystem::path& abs, const std::string& rel,
                  Verdict inherited, Walk& w) const;

    static std::vector<std::string> sorted_children(const std::filesystem::path& dir,
                                                    std::error_code& ec);
};

} // namespace syncf
