#include <syncf/error.hpp>

namespace syncf {

const char* to_string(ErrorKind k){
    switch (k){
        case ErrorKind::InvalidPattern:   return "invalid-pattern";
        case ErrorKind::InvalidLabel:     return "invalid-label";
        case ErrorKind::EmptySelection:   return "empty-selection";
        case ErrorKind::CorruptArchive:   return "corrupt-archive";
        case ErrorKind::StoreUnavailable: return "store-unavailable";
        case ErrorKind::InvalidRoot:      return "invalid-root";
        case ErrorKind::BundleNotFound:   return "bundle-not-found";
        case ErrorKind::Io:               return "io";
    }
    return "unknown";
}

const char* to_string(SkipReason r){
    switch (r){
        case SkipReason::PermissionDenied:  return "permission-denied";
        case SkipReason::SymlinkCycle:      return "symlink-cycle";
        case SkipReason::DanglingSymlink:   return "dangling-symlink";
        case SkipReason::NotFound:          return "not-found";
        case SkipReason::ReadError:         return "read-error";
        case SkipReason::ChangedDuringRead: return "changed-during-read";
        case SkipReason::SpecialFile:       return "special-file";
        case SkipReason::PathTraversal:     return "path-traversal";
        case SkipReason::UnsupportedEntry:  return "unsupported-entry";
        case SkipReason::IoError:           return "io-error";
    }
    return "unknown";
}

Error::Error(ErrorKind kind, const std::string& what)
: std::runtime_error(what), kind_(kind) {}

bool Error::is_user_error() const noexcept {
    switch (kind_){
        case ErrorKind::InvalidPattern:
        case ErrorKind::InvalidLabel:
        case ErrorKind::EmptySelection:
        case ErrorKind::InvalidRoot:
        case ErrorKind::BundleNotFound:
            return true;
        case ErrorKind::CorruptArchive:
        case ErrorKind::StoreUnavailable:
        case ErrorKind::Io:
            return false;
    }
    return false;
}

} // namespace syncf
