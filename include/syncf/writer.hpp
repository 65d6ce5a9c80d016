#pragma once
#include <syncf/bundle.hpp>
#include <syncf/error.hpp>
#include <syncf/selector.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace syncf {

struct PackReport {
    Bundle bundle;
    // Files whose content was archived in full (possibly zero-filled after
    // shrinking); a file whose read failed is only in skipped.
    std::vector<std::string> archived;
    std::vector<std::string> directories;
    // Selection skips followed by entries that failed while being archived.
    std::vector<Skip> skipped;
    std::uint64_t content_bytes{0};
};

class ArchiveWriter {
public:
    explicit ArchiveWriter(std::filesystem::path store_dir);

    // Streams the selected directories and then the selected files (paths
    // relative to root) into {label}_{stamp}.tar.gz inside the store. The
    // bundle appears under its final name only once it is complete. A bundle
    // written earlier in the same second under the same label is replaced.
    //
    // Throws Error(InvalidLabel), Error(EmptySelection),
    // Error(StoreUnavailable) or Error(Io).
    PackReport write(const SelectionResult& selection,
                     const std::filesystem::path& root,
                     const std::string& label,
                     std::chrono::system_clock::time_point at = std::chrono::system_clock::now()) const;

    // Removes temporary files whose writer process is gone. Returns the count.
    static std::size_t purge_stale_temps(const std::filesystem::path& store_dir);

    static bool is_temp_name(const std::string& filename);

private:
    std::filesystem::path store_;

    void ensure_store() const;
};

} // namespace syncf
