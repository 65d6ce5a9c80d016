#include <syncf/writer.hpp>
#include <syncf/naming.hpp>
#include <syncf/util.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <archive.h>
#include <archive_entry.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <vector>

#include <fcntl.h>
#include <signal.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace syncf {

static constexpr const char* kTempMarker = ".tmp-";

namespace {

using WriteArchive = std::unique_ptr<struct archive, decltype(&archive_write_free)>;
using EntryPtr = std::unique_ptr<struct archive_entry, decltype(&archive_entry_free)>;

// Output file that only becomes visible under its final name on commit().
class TempFile {
public:
    explicit TempFile(fs::path path) : path_(std::move(path)) {
        fd_ = ::open(path_.c_str(), O_CREAT | O_TRUNC | O_WRONLY | O_CLOEXEC, 0644);
        if (fd_ < 0) {
            throw Error(ErrorKind::StoreUnavailable,
                        fmt::format("cannot create {}: {}", path_.string(), std::strerror(errno)));
        }
    }

    ~TempFile() {
        if (fd_ >= 0) ::close(fd_);
        if (!committed_) {
            std::error_code ec;
            fs::remove(path_, ec);
        }
    }

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    int fd() const { return fd_; }

    void commit(const fs::path& final_path) {
        if (::fsync(fd_) != 0) {
            throw Error(ErrorKind::Io, fmt::format("fsync {}: {}", path_.string(), std::strerror(errno)));
        }
        int rc = ::close(fd_);
        fd_ = -1;
        if (rc != 0) {
            throw Error(ErrorKind::Io, fmt::format("close {}: {}", path_.string(), std::strerror(errno)));
        }
        if (::rename(path_.c_str(), final_path.c_str()) != 0) {
            throw Error(ErrorKind::StoreUnavailable,
                        fmt::format("cannot move bundle into place at {}: {}",
                                    final_path.string(), std::strerror(errno)));
        }
        committed_ = true;
    }

private:
    fs::path path_;
    int fd_{-1};
    bool committed_{false};
};

} // namespace

static SkipReason skip_reason(int err){
    switch (err){
        case EACCES:
        case EPERM:  return SkipReason::PermissionDenied;
        case ENOENT: return SkipReason::NotFound;
        default:     return SkipReason::ReadError;
    }
}

ArchiveWriter::ArchiveWriter(fs::path store_dir)
: store_(std::move(store_dir)) {}

void ArchiveWriter::ensure_store() const {
    std::error_code ec;
    if (fs::is_directory(store_, ec)) return;
    if (fs::exists(store_, ec)) {
        throw Error(ErrorKind::StoreUnavailable,
                    fmt::format("bundle store {} exists but is not a directory", store_.string()));
    }
    fs::create_directories(store_, ec);
    if (ec) {
        throw Error(ErrorKind::StoreUnavailable,
                    fmt::format("cannot create bundle store {}: {}", store_.string(), ec.message()));
    }
    spdlog::info("created bundle store {}", store_.string());
}

bool ArchiveWriter::is_temp_name(const std::string& filename){
    if (filename.empty() || filename[0] != '.') return false;
    auto pos = filename.rfind(kTempMarker);
    if (pos == std::string::npos) return false;
    std::string pid = filename.substr(pos + std::strlen(kTempMarker));
    return !pid.empty() && std::all_of(pid.begin(), pid.end(), ::isdigit);
}

std::size_t ArchiveWriter::purge_stale_temps(const fs::path& store_dir){
    std::size_t removed = 0;
    std::error_code ec;
    fs::directory_iterator it(store_dir, ec);
    if (ec) return 0;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;
        const std::string name = it->path().filename().string();
        if (!is_temp_name(name)) continue;
        const pid_t pid = static_cast<pid_t>(std::atol(name.c_str() + name.rfind(kTempMarker) + std::strlen(kTempMarker)));
        if (pid == ::getpid()) continue;
        if (pid > 0 && (::kill(pid, 0) == 0 || errno == EPERM)) continue;
        std::error_code rec;
        if (fs::remove(it->path(), rec)) {
            spdlog::info("removed stale temporary file {}", it->path().string());
            ++removed;
        } else if (rec) {
            spdlog::warn("cannot remove stale temporary file {}: {}", it->path().string(), rec.message());
        }
    }
    return removed;
}

static std::string last_error(struct archive* a){
    const char* s = archive_error_string(a);
    return s ? s : "unknown archive error";
}

static Error write_failure(struct archive* a, const fs::path& tmp){
    return Error(ErrorKind::Io, fmt::format("cannot write {}: {}", tmp.string(), last_error(a)));
}

// False when only this entry was rejected; that is recorded as a skip.
static bool put_header(struct archive* a, struct archive_entry* entry,
                       const std::string& rel, PackReport& report)
{
    const int rc = archive_write_header(a, entry);
    if (rc == ARCHIVE_OK) return true;
    if (rc == ARCHIVE_WARN) {
        spdlog::debug("{}: {}", rel, last_error(a));
        return true;
    }
    if (rc == ARCHIVE_FAILED) {
        report.skipped.push_back({rel, SkipReason::IoError, last_error(a)});
        return false;
    }
    throw Error(ErrorKind::Io, fmt::format("cannot write archive header for {}: {}", rel, last_error(a)));
}

static void finish_entry(struct archive* a, const std::string& rel){
    if (archive_write_finish_entry(a) < ARCHIVE_WARN) {
        throw Error(ErrorKind::Io, fmt::format("cannot finish archive entry {}: {}", rel, last_error(a)));
    }
}

static void add_directory(struct archive* a, struct archive_entry* entry,
                          const fs::path& abs, const std::string& rel, PackReport& report)
{
    struct stat st{};
    if (::stat(abs.c_str(), &st) != 0) {
        int err = errno;
        report.skipped.push_back({rel, skip_reason(err), std::strerror(err)});
        return;
    }
    if (!S_ISDIR(st.st_mode)) {
        report.skipped.push_back({rel, SkipReason::SpecialFile, "no longer a directory"});
        return;
    }

    archive_entry_clear(entry);
    archive_entry_set_pathname(entry, (rel + "/").c_str());
    archive_entry_set_filetype(entry, AE_IFDIR);
    archive_entry_set_perm(entry, st.st_mode & 07777);
    archive_entry_set_uid(entry, st.st_uid);
    archive_entry_set_gid(entry, st.st_gid);
    archive_entry_set_size(entry, 0);
    archive_entry_set_mtime(entry, st.st_mtime, 0);
    if (!put_header(a, entry, rel, report)) return;
    finish_entry(a, rel);

    report.directories.push_back(rel);
    spdlog::debug("added: {}/", rel);
}

static void add_file(struct archive* a, struct archive_entry* entry, const fs::path& abs,
                     const std::string& rel, std::vector<char>& buf, PackReport& report)
{
    int fd = ::open(abs.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        int err = errno;
        spdlog::debug("skip {}: {}", rel, std::strerror(err));
        report.skipped.push_back({rel, skip_reason(err), std::strerror(err)});
        return;
    }
    struct stat st{};
    if (::fstat(fd, &st) != 0) {
        int err = errno;
        ::close(fd);
        report.skipped.push_back({rel, skip_reason(err), std::strerror(err)});
        return;
    }
    if (!S_ISREG(st.st_mode)) {
        ::close(fd);
        report.skipped.push_back({rel, SkipReason::SpecialFile, "no longer a regular file"});
        return;
    }

    const std::uint64_t size = static_cast<std::uint64_t>(st.st_size);
    archive_entry_clear(entry);
    archive_entry_set_pathname(entry, rel.c_str());
    archive_entry_set_filetype(entry, AE_IFREG);
    archive_entry_set_perm(entry, st.st_mode & 07777);
    archive_entry_set_uid(entry, st.st_uid);
    archive_entry_set_gid(entry, st.st_gid);
    archive_entry_set_size(entry, static_cast<la_int64_t>(size));
    archive_entry_set_mtime(entry, st.st_mtime, 0);
    if (!put_header(a, entry, rel, report)) {
        ::close(fd);
        return;
    }

    std::uint64_t left = size;
    int read_err = 0;
    while (left > 0) {
        size_t want = static_cast<size_t>(std::min<std::uint64_t>(left, buf.size()));
        ssize_t n = ::read(fd, buf.data(), want);
        if (n < 0) {
            if (errno == EINTR) continue;
            read_err = errno;
            break;
        }
        if (n == 0) break;
        if (archive_write_data(a, buf.data(), static_cast<size_t>(n)) < 0) {
            ::close(fd);
            throw Error(ErrorKind::Io, fmt::format("cannot write {} into archive: {}", rel, last_error(a)));
        }
        left -= static_cast<std::uint64_t>(n);
    }
    ::close(fd);

    // The header already promised the full size; libarchive zero-fills
    // whatever is missing when the entry is finished.
    finish_entry(a, rel);
    if (read_err != 0) {
        report.skipped.push_back({rel, SkipReason::ReadError,
                                  fmt::format("{}; {} bytes zero-filled", std::strerror(read_err), left)});
        return;
    }
    report.archived.push_back(rel);
    report.content_bytes += size - left;
    if (left > 0) {
        report.skipped.push_back({rel, SkipReason::ChangedDuringRead,
                                  fmt::format("file shrank while archiving; {} bytes zero-filled", left)});
    }
    spdlog::debug("added: {} ({})", rel, format_size(size));
}

PackReport ArchiveWriter::write(const SelectionResult& selection,
                                const fs::path& root,
                                const std::string& label,
                                std::chrono::system_clock::time_point at) const
{
    const std::string filename = bundle_name(label, at);
    if (selection.empty()) {
        throw Error(ErrorKind::EmptySelection, "no files matched the pattern rules");
    }

    ensure_store();
    purge_stale_temps(store_);

    const fs::path final_path = store_ / filename;
    const fs::path tmp_path = store_ / fmt::format(".{}{}{}", filename, kTempMarker, ::getpid());

    spdlog::info("start pack <{}> files, <{}> directories to {}",
                 selection.files.size(), selection.directories.size(), final_path.string());

    PackReport report;
    report.skipped = selection.skipped;

    TempFile tmp(tmp_path);
    {
        WriteArchive a(archive_write_new(), &archive_write_free);
        if (!a) throw Error(ErrorKind::Io, "cannot allocate archive writer");
        if (archive_write_add_filter_gzip(a.get()) < ARCHIVE_WARN ||
            archive_write_set_format_pax_restricted(a.get()) != ARCHIVE_OK ||
            archive_write_open_fd(a.get(), tmp.fd()) != ARCHIVE_OK) {
            throw write_failure(a.get(), tmp_path);
        }
        EntryPtr entry(archive_entry_new(), &archive_entry_free);
        if (!entry) throw Error(ErrorKind::Io, "cannot allocate archive entry");

        std::vector<char> buf(kChunk);
        for (const auto& rel : selection.directories) {
            add_directory(a.get(), entry.get(), root / rel, rel, report);
        }
        for (const auto& rel : selection.files) {
            add_file(a.get(), entry.get(), root / rel, rel, buf, report);
        }
        if (report.archived.empty() && report.directories.empty()) {
            throw Error(ErrorKind::EmptySelection,
                        fmt::format("none of the {} selected entries could be archived",
                                    selection.files.size() + selection.directories.size()));
        }
        if (archive_write_close(a.get()) != ARCHIVE_OK) {
            throw write_failure(a.get(), tmp_path);
        }
    }

    std::error_code ec;
    if (fs::exists(final_path, ec)) {
        spdlog::warn("bundle {} already exists and is replaced (same label within one second)", filename);
    }
    tmp.commit(final_path);
    fsync_dir(store_);

    auto parts = parse_bundle_name(filename);
    Bundle& b = report.bundle;
    b.label = parts ? parts->label : sanitize_label(label);
    b.stamp = parts ? parts->stamp : format_stamp(at);
    b.timestamp = parse_stamp(b.stamp).value_or(std::chrono::time_point_cast<std::chrono::seconds>(at));
    b.filename = filename;
    b.path = final_path;
    auto size = fs::file_size(final_path, ec);
    b.size_bytes = ec ? 0 : size;
    b.file_count = report.archived.size();
    return report;
}

} // namespace syncf
