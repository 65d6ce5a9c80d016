#pragma once
#include <syncf/bundle.hpp>
#include <syncf/error.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace syncf {

enum class EntryType {
    File,
    Directory,
    Symlink,
    Hardlink,
    Other,
};

const char* to_string(EntryType t);

struct ArchiveEntry {
    std::string name;
    EntryType type{EntryType::File};
    std::uint32_t mode{0644};
    std::uint64_t size{0};
    std::int64_t mtime{0};
    std::string linkname;
};

struct ArchiveIndex {
    std::vector<ArchiveEntry> entries;
    std::uint64_t content_bytes{0};

    std::size_t file_count() const;
};

struct EntryOutcome {
    std::string path;
    bool extracted{false};
    std::optional<SkipReason> reason;
    std::string detail;
    std::uint64_t bytes{0};
};

// One outcome per archive entry; extracted + skipped == entries.size().
struct ExtractionReport {
    std::filesystem::path destination;
    std::vector<EntryOutcome> entries;
    std::size_t extracted{0};
    std::size_t files{0};           // regular files among the extracted entries
    std::size_t skipped{0};
    std::uint64_t bytes{0};
};

class ArchiveReader {
public:
    explicit ArchiveReader(std::filesystem::path archive);
    explicit ArchiveReader(const Bundle& bundle);

    // Decodes every header and all entry data without writing anything.
    // Throws Error(CorruptArchive) naming the archive.
    ArchiveIndex validate() const;

    // Validates first, then extracts regular files and directories beneath
    // destination. Existing files are overwritten. Entries that would land
    // outside destination are skipped with SkipReason::PathTraversal.
    ExtractionReport extract(const std::filesystem::path& destination) const;

    const std::filesystem::path& path() const { return archive_; }

private:
    std::filesystem::path archive_;

    int open_archive() const;
};

} // namespace syncf
