#include <syncf/reader.hpp>
#include <syncf/util.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <archive.h>
#include <archive_entry.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <memory>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace syncf {

namespace {

using ReadArchive = std::unique_ptr<struct archive, decltype(&archive_read_free)>;

struct FdGuard {
    int fd{-1};
    explicit FdGuard(int f) : fd(f) {}
    ~FdGuard() { if (fd >= 0) ::close(fd); }
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;
};

struct PendingDir {
    fs::path path;
    std::uint32_t mode;
    std::int64_t mtime;
};

} // namespace

const char* to_string(EntryType t){
    switch (t){
        case EntryType::File:      return "file";
        case EntryType::Directory: return "directory";
        case EntryType::Symlink:   return "symlink";
        case EntryType::Hardlink:  return "hardlink";
        case EntryType::Other:     return "special";
    }
    return "unknown";
}

std::size_t ArchiveIndex::file_count() const {
    return static_cast<std::size_t>(std::count_if(entries.begin(), entries.end(),
        [](const ArchiveEntry& e){ return e.type == EntryType::File; }));
}

static std::string last_error(struct archive* a){
    const char* s = archive_error_string(a);
    return s ? s : "unknown archive error";
}

static Error corrupt(const fs::path& archive, const std::string& what){
    return Error(ErrorKind::CorruptArchive,
                 fmt::format("bundle {} is corrupt: {}", archive.filename().string(), what));
}

static ReadArchive open_reader(int fd, const fs::path& archive){
    ReadArchive a(archive_read_new(), &archive_read_free);
    if (!a) throw Error(ErrorKind::Io, "cannot allocate archive reader");
    if (archive_read_support_filter_gzip(a.get()) < ARCHIVE_WARN ||
        archive_read_support_format_tar(a.get()) != ARCHIVE_OK) {
        throw Error(ErrorKind::Io, fmt::format("archive reader setup: {}", last_error(a.get())));
    }
    if (archive_read_open_fd(a.get(), fd, kChunk) != ARCHIVE_OK) {
        throw corrupt(archive, last_error(a.get()));
    }
    return a;
}

static ArchiveEntry describe(struct archive_entry* ae){
    ArchiveEntry e;
    const char* name = archive_entry_pathname(ae);
    e.name = name ? name : "";
    if (const char* hard = archive_entry_hardlink(ae)) {
        e.type = EntryType::Hardlink;
        e.linkname = hard;
    } else {
        switch (archive_entry_filetype(ae)){
            case AE_IFREG: e.type = EntryType::File; break;
            case AE_IFDIR: e.type = EntryType::Directory; break;
            case AE_IFLNK:
                e.type = EntryType::Symlink;
                if (const char* target = archive_entry_symlink(ae)) e.linkname = target;
                break;
            default:       e.type = EntryType::Other; break;
        }
    }
    if (e.type == EntryType::Directory) {
        while (e.name.size() > 1 && e.name.back() == '/') e.name.pop_back();
    }
    e.mode = static_cast<std::uint32_t>(archive_entry_perm(ae) & 07777);
    e.size = archive_entry_size_is_set(ae) ? static_cast<std::uint64_t>(archive_entry_size(ae)) : 0;
    e.mtime = static_cast<std::int64_t>(archive_entry_mtime(ae));
    return e;
}

// Next header, or nullopt at the end of the archive.
static std::optional<ArchiveEntry> next_entry(struct archive* a, const fs::path& archive){
    struct archive_entry* ae = nullptr;
    const int rc = archive_read_next_header(a, &ae);
    if (rc == ARCHIVE_EOF) return std::nullopt;
    if (rc == ARCHIVE_WARN) {
        spdlog::debug("{}: {}", archive.filename().string(), last_error(a));
    } else if (rc != ARCHIVE_OK) {
        throw corrupt(archive, last_error(a));
    }
    return describe(ae);
}

// Reads from the current entry's data; 0 once it is consumed.
static std::size_t read_chunk(struct archive* a, const fs::path& archive, std::vector<char>& buf){
    const la_ssize_t n = archive_read_data(a, buf.data(), buf.size());
    if (n < 0) throw corrupt(archive, last_error(a));
    return static_cast<std::size_t>(n);
}

ArchiveReader::ArchiveReader(fs::path archive) : archive_(std::move(archive)) {}

ArchiveReader::ArchiveReader(const Bundle& bundle) : archive_(bundle.path) {}

int ArchiveReader::open_archive() const {
    int fd = ::open(archive_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        int err = errno;
        if (err == ENOENT) {
            throw Error(ErrorKind::BundleNotFound, fmt::format("bundle {} does not exist", archive_.string()));
        }
        throw Error(ErrorKind::Io, fmt::format("cannot open {}: {}", archive_.string(), std::strerror(err)));
    }
    return fd;
}

ArchiveIndex ArchiveReader::validate() const {
    FdGuard fd(open_archive());
    ReadArchive a = open_reader(fd.fd, archive_);

    ArchiveIndex idx;
    std::vector<char> scratch(kChunk);
    while (auto e = next_entry(a.get(), archive_)) {
        while (read_chunk(a.get(), archive_, scratch) > 0) {}
        if (e->type == EntryType::File) idx.content_bytes += e->size;
        idx.entries.push_back(std::move(*e));
    }
    if (archive_filter_code(a.get(), 0) != ARCHIVE_FILTER_GZIP) {
        throw corrupt(archive_, "not gzip-compressed");
    }
    spdlog::debug("validated {}: {} entries", archive_.string(), idx.entries.size());
    return idx;
}

// Relative, normalized form of an entry name; nullopt when the name is
// absolute or climbs out with "..". "./" yields an empty path.
static std::optional<fs::path> safe_relative(const std::string& name){
    if (name.empty() || name[0] == '/') return std::nullopt;
    fs::path out;
    for (const auto& part : fs::path(name)) {
        const std::string s = part.string();
        if (s.empty() || s == ".") continue;
        if (s == "..") return std::nullopt;
        out /= part;
    }
    return out;
}

// Walks the components of rel below dest and checks that no existing
// symlink among them leads outside dest. The last component is only
// checked when check_last is set (a file in the way is replaced instead).
static bool resolves_inside(const fs::path& dest, const fs::path& rel, bool check_last){
    fs::path cur = dest;
    auto it = rel.begin();
    auto end = rel.end();
    while (it != end) {
        cur /= *it;
        ++it;
        if (it == end && !check_last) break;
        std::error_code ec;
        auto st = fs::symlink_status(cur, ec);
        if (ec || !fs::exists(st)) return true;
        if (fs::is_symlink(st)) {
            auto target = fs::weakly_canonical(cur, ec);
            if (ec || !is_within(dest, target)) return false;
        }
    }
    return true;
}

static void record_skip(ExtractionReport& report, const std::string& name,
                        SkipReason reason, std::string detail)
{
    spdlog::debug("skip {}: {} ({})", name, to_string(reason), detail);
    EntryOutcome o;
    o.path = name;
    o.reason = reason;
    o.detail = std::move(detail);
    report.entries.push_back(std::move(o));
    ++report.skipped;
}

static void record_extracted(ExtractionReport& report, const std::string& name, std::uint64_t bytes){
    report.entries.push_back({name, true, std::nullopt, {}, bytes});
    ++report.extracted;
    report.bytes += bytes;
}

// Sets mtime on fd, or on path when fd is negative. Failure is not fatal.
static void apply_mtime(int fd, const fs::path& path, std::int64_t mtime){
    struct timespec ts[2];
    ts[0].tv_sec = 0;
    ts[0].tv_nsec = UTIME_OMIT;
    ts[1].tv_sec = static_cast<time_t>(mtime);
    ts[1].tv_nsec = 0;
    int rc = fd >= 0 ? ::futimens(fd, ts) : ::utimensat(AT_FDCWD, path.c_str(), ts, 0);
    if (rc != 0) {
        spdlog::debug("cannot set mtime on {}: {}", path.string(), std::strerror(errno));
    }
}

static std::string write_file(struct archive* a, const fs::path& archive, const ArchiveEntry& e,
                              const fs::path& target, std::vector<char>& buf, std::uint64_t& written)
{
    std::error_code ec;
    auto st = fs::symlink_status(target, ec);
    if (!ec && fs::exists(st)) {
        if (fs::is_directory(st)) return "a directory is in the way";
        if (::unlink(target.c_str()) != 0) {
            return fmt::format("cannot replace existing file: {}", std::strerror(errno));
        }
    }

    int fd = ::open(target.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW | O_CLOEXEC, 0600);
    if (fd < 0) return std::strerror(errno);
    FdGuard guard(fd);

    int err = 0;
    for (;;) {
        size_t n = read_chunk(a, archive, buf);
        if (n == 0) break;
        size_t off = 0;
        while (off < n && err == 0) {
            ssize_t w = ::write(fd, buf.data() + off, n - off);
            if (w < 0) {
                if (errno == EINTR) continue;
                err = errno;
                break;
            }
            off += static_cast<size_t>(w);
        }
        if (err != 0) break;
        written += n;
    }
    if (err == 0 && ::fchmod(fd, static_cast<mode_t>(e.mode & 07777)) != 0) err = errno;
    if (err == 0) apply_mtime(fd, target, e.mtime);
    const int rc = ::close(guard.fd);
    guard.fd = -1;
    if (err == 0 && rc != 0) err = errno;

    if (err != 0) {
        ::unlink(target.c_str());
        written = 0;
        return std::strerror(err);
    }
    return {};
}

ExtractionReport ArchiveReader::extract(const fs::path& destination) const {
    const ArchiveIndex idx = validate();

    std::error_code ec;
    fs::create_directories(destination, ec);
    if (ec) {
        throw Error(ErrorKind::Io, fmt::format("cannot create destination {}: {}",
                                               destination.string(), ec.message()));
    }
    const fs::path dest = fs::weakly_canonical(fs::absolute(destination), ec);
    if (ec) {
        throw Error(ErrorKind::Io, fmt::format("cannot resolve destination {}: {}",
                                               destination.string(), ec.message()));
    }

    ExtractionReport report;
    report.destination = dest;
    std::vector<PendingDir> dirs;
    std::vector<char> buf(kChunk);

    FdGuard fd(open_archive());
    ReadArchive a = open_reader(fd.fd, archive_);

    while (auto e = next_entry(a.get(), archive_)) {
        const auto safe = safe_relative(e->name);
        if (!safe) {
            record_skip(report, e->name, SkipReason::PathTraversal, "absolute path or '..' segment");
            continue;
        }
        const fs::path& rel = *safe;
        const bool is_dir = e->type == EntryType::Directory;
        if (rel.empty()) {
            // the destination itself
            if (is_dir) record_extracted(report, e->name, 0);
            else record_skip(report, e->name, SkipReason::UnsupportedEntry, "entry names the destination itself");
            continue;
        }
        if (e->type != EntryType::File && !is_dir) {
            record_skip(report, e->name, SkipReason::UnsupportedEntry,
                        fmt::format("{} entry", to_string(e->type)));
            continue;
        }
        if (!resolves_inside(dest, rel, is_dir)) {
            record_skip(report, e->name, SkipReason::PathTraversal, "symlink leads outside the destination");
            continue;
        }

        const fs::path target = dest / rel;
        if (is_dir) {
            fs::create_directories(target, ec);
            if (ec) {
                record_skip(report, e->name, SkipReason::IoError, ec.message());
                continue;
            }
            dirs.push_back({target, e->mode, e->mtime});
            spdlog::debug("extracted: {}/", rel.generic_string());
            record_extracted(report, e->name, 0);
            continue;
        }

        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            record_skip(report, e->name, SkipReason::IoError, ec.message());
            continue;
        }
        std::uint64_t written = 0;
        std::string failure = write_file(a.get(), archive_, *e, target, buf, written);
        if (!failure.empty()) {
            record_skip(report, e->name, SkipReason::IoError, std::move(failure));
            continue;
        }
        spdlog::debug("extracted: {} ({})", rel.generic_string(), format_size(written));
        record_extracted(report, e->name, written);
        ++report.files;
    }

    // Deepest first so a read-only parent does not block its children.
    for (auto it = dirs.rbegin(); it != dirs.rend(); ++it) {
        if (::chmod(it->path.c_str(), static_cast<mode_t>(it->mode & 07777)) != 0) {
            spdlog::warn("cannot set mode on {}: {}", it->path.string(), std::strerror(errno));
            continue;
        }
        apply_mtime(-1, it->path, it->mtime);
    }

    spdlog::info("extracted {} of {} entries to {}", report.extracted, idx.entries.size(), dest.string());
    return report;
}

} // namespace syncf
