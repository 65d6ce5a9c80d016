#include <syncf/selector.hpp>
#include <syncf/thread_pool.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <exception>
#include <unordered_set>

#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace syncf {

FileSelector::FileSelector(const Matcher& matcher, SelectOptions options)
: matcher_(matcher), options_(std::move(options)) {}

static std::string join_rel(const std::string& parent, const std::string& name){
    return parent.empty() ? name : parent + "/" + name;
}

static SkipReason reason_for_errno(int err){
    switch (err){
        case EACCES:
        case EPERM:  return SkipReason::PermissionDenied;
        case ENOENT: return SkipReason::NotFound;
        case ELOOP:  return SkipReason::SymlinkCycle;
        default:     return SkipReason::ReadError;
    }
}

std::vector<std::string> FileSelector::sorted_children(const fs::path& dir, std::error_code& ec){
    std::vector<std::string> names;
    fs::directory_iterator it(dir, ec);
    if (ec) return names;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) return names;
        names.push_back(it->path().filename().string());
    }
    std::sort(names.begin(), names.end());
    return names;
}

void FileSelector::walk_dir(const fs::path& abs, const std::string& rel,
                            Verdict inherited, Walk& w) const
{
    std::error_code ec;
    auto names = sorted_children(abs, ec);
    if (ec) {
        auto reason = ec == std::errc::permission_denied ? SkipReason::PermissionDenied
                                                         : SkipReason::ReadError;
        spdlog::debug("cannot read directory {}: {}", abs.string(), ec.message());
        w.skipped.push_back({rel, reason, ec.message()});
        return;
    }
    for (const auto& name : names) visit(abs, rel, name, inherited, w);
}

void FileSelector::visit(const fs::path& parent_abs, const std::string& parent_rel,
                         const std::string& name, Verdict inherited, Walk& w) const
{
    const fs::path abs = parent_abs / name;
    const std::string rel = join_rel(parent_rel, name);

    struct stat lst{};
    if (::lstat(abs.c_str(), &lst) != 0) {
        int err = errno;
        w.skipped.push_back({rel, reason_for_errno(err), std::strerror(err)});
        return;
    }

    struct stat st = lst;
    const bool is_link = S_ISLNK(lst.st_mode);
    if (is_link && ::stat(abs.c_str(), &st) != 0) {
        int err = errno;
        if (matcher_.resolve(rel, false, inherited) != Verdict::Include) return;
        SkipReason reason = err == ENOENT ? SkipReason::DanglingSymlink : reason_for_errno(err);
        w.skipped.push_back({rel, reason, std::strerror(err)});
        return;
    }

    const DirKey key{st.st_dev, st.st_ino};
    if (std::find(w.prune.begin(), w.prune.end(), key) != w.prune.end()) {
        spdlog::debug("pruned (store): {}", rel);
        return;
    }

    if (S_ISDIR(st.st_mode)) {
        Verdict own = matcher_.evaluate(rel, true);
        if (own == Verdict::Exclude) {
            spdlog::debug("pruned: {}/", rel);
            return;
        }
        if (std::find(w.stack.begin(), w.stack.end(), key) != w.stack.end()) {
            w.skipped.push_back({rel, SkipReason::SymlinkCycle,
                                 fmt::format("{} leads back to an ancestor directory",
                                             is_link ? "symlink" : "directory")});
            return;
        }
        const Verdict effective = own == Verdict::Unmatched ? inherited : own;
        if (effective == Verdict::Include) {
            spdlog::debug("selected: {}/", rel);
            w.dirs.push_back(rel);
        }
        w.stack.push_back(key);
        walk_dir(abs, rel, effective, w);
        w.stack.pop_back();
        return;
    }

    if (matcher_.resolve(rel, false, inherited) != Verdict::Include) return;

    if (!S_ISREG(st.st_mode)) {
        w.skipped.push_back({rel, SkipReason::SpecialFile, "not a regular file"});
        return;
    }
    if (::access(abs.c_str(), R_OK) != 0) {
        int err = errno;
        w.skipped.push_back({rel, reason_for_errno(err), std::strerror(err)});
        return;
    }
    spdlog::debug("selected: {}", rel);
    w.files.push_back(rel);
}

SelectionResult FileSelector::select(const fs::path& root_in) const {
    std::error_code ec;
    fs::path root = fs::absolute(root_in, ec).lexically_normal();
    if (ec) root = root_in;

    struct stat rst{};
    if (::stat(root.c_str(), &rst) != 0 || !S_ISDIR(rst.st_mode)) {
        throw Error(ErrorKind::InvalidRoot,
                    fmt::format("selection root is not a directory: {}", root.string()));
    }

    Walk seed;
    seed.stack.push_back({rst.st_dev, rst.st_ino});
    for (const auto& p : options_.prune) {
        struct stat pst{};
        if (::stat(p.c_str(), &pst) == 0) seed.prune.push_back({pst.st_dev, pst.st_ino});
    }

    auto names = sorted_children(root, ec);
    if (ec) {
        throw Error(ErrorKind::InvalidRoot,
                    fmt::format("cannot read selection root {}: {}", root.string(), ec.message()));
    }

    // One slot per top-level entry; slots are concatenated in name order so
    // the parallel walk yields exactly the sequential result.
    std::vector<Walk> slots(names.size(), seed);
    std::vector<std::exception_ptr> errors(names.size());

    unsigned threads = options_.threads;
    if (threads != 1 && names.size() > 1) {
        ThreadPool pool(threads);
        spdlog::debug("walking {} top-level entries on {} workers", names.size(), pool.size());
        for (size_t i = 0; i < names.size(); ++i) {
            pool.submit([&, i]{
                try {
                    visit(root, "", names[i], Verdict::Unmatched, slots[i]);
                } catch (...) {
                    errors[i] = std::current_exception();
                }
            });
        }
        pool.wait_idle();
        for (auto& e : errors) {
            if (e) std::rethrow_exception(e);
        }
    } else {
        for (size_t i = 0; i < names.size(); ++i) {
            visit(root, "", names[i], Verdict::Unmatched, slots[i]);
        }
    }

    SelectionResult out;
    std::unordered_set<std::string> seen;
    std::unordered_set<std::string> seen_dirs;
    for (auto& s : slots) {
        for (auto& d : s.dirs) {
            if (seen_dirs.insert(d).second) out.directories.push_back(std::move(d));
        }
        for (auto& f : s.files) {
            if (seen.insert(f).second) out.files.push_back(std::move(f));
        }
        for (auto& k : s.skipped) out.skipped.push_back(std::move(k));
    }
    spdlog::debug("selection: {} files, {} directories, {} skipped under {}",
                  out.files.size(), out.directories.size(), out.skipped.size(), root.string());
    return out;
}

} // namespace syncf
