#pragma once
#include <stdexcept>
#include <string>

namespace syncf {

enum class ErrorKind {
    InvalidPattern,
    InvalidLabel,
    EmptySelection,
    CorruptArchive,
    StoreUnavailable,
    InvalidRoot,
    BundleNotFound,
    Io,
};

const char* to_string(ErrorKind k);

// Structural failure that aborts the whole operation.
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& what);

    ErrorKind kind() const noexcept { return kind_; }
    bool is_user_error() const noexcept;

private:
    ErrorKind kind_;
};

// Per-entry outcome recorded in reports instead of thrown.
enum class SkipReason {
    PermissionDenied,
    SymlinkCycle,
    DanglingSymlink,
    NotFound,
    ReadError,
    ChangedDuringRead,
    SpecialFile,
    PathTraversal,
    UnsupportedEntry,
    IoError,
};

const char* to_string(SkipReason r);

struct Skip {
    std::string path;
    SkipReason reason;
    std::string detail;
};

} // namespace syncf
