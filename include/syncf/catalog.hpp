#pragma once
#include <syncf/bundle.hpp>
#include <syncf/error.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace syncf {

struct DeletionReport {
    std::vector<Bundle> deleted;
    std::vector<std::pair<Bundle, std::string>> failed;
    std::uintmax_t freed_bytes{0};
};

// Read-mostly view over the bundle store. Every call goes back to disk.
class BundleCatalog {
public:
    explicit BundleCatalog(std::filesystem::path store_dir);

    // Newest first by stamp, ties by filename. A missing store is empty;
    // a store path that cannot be read throws Error(StoreUnavailable).
    // Files not named {label}_{stamp}.tar.gz are ignored.
    std::vector<Bundle> list() const;

    // id is a file name, a file name without extension, a label (newest
    // bundle with that label wins) or a 1-based position in list().
    std::optional<Bundle> find(const std::string& id) const;
    Bundle require(const std::string& id) const;

    // Best effort: each bundle is removed independently.
    DeletionReport remove(const std::vector<Bundle>& bundles) const;
    DeletionReport clean() const;

    // Fills file_count through a full validation pass of the archive.
    void inspect(Bundle& bundle) const;

    std::size_t purge_stale_temps() const;

    const std::filesystem::path& store() const { return store_; }

private:
    std::filesystem::path store_;
};

} // namespace syncf
