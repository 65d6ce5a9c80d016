#include <syncf/catalog.hpp>
#include <syncf/naming.hpp>
#include <syncf/reader.hpp>
#include <syncf/util.hpp>
#include <syncf/writer.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace fs = std::filesystem;

namespace syncf {

BundleCatalog::BundleCatalog(fs::path store_dir) : store_(std::move(store_dir)) {}

std::vector<Bundle> BundleCatalog::list() const {
    std::vector<Bundle> out;
    std::error_code ec;
    auto st = fs::status(store_, ec);
    if (ec || !fs::exists(st)) {
        if (ec && ec != std::errc::no_such_file_or_directory) {
            throw Error(ErrorKind::StoreUnavailable,
                        fmt::format("cannot access bundle store {}: {}", store_.string(), ec.message()));
        }
        return out;
    }
    if (!fs::is_directory(st)) {
        throw Error(ErrorKind::StoreUnavailable,
                    fmt::format("bundle store {} is not a directory", store_.string()));
    }

    fs::directory_iterator it(store_, ec);
    if (ec) {
        throw Error(ErrorKind::StoreUnavailable,
                    fmt::format("cannot read bundle store {}: {}", store_.string(), ec.message()));
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            throw Error(ErrorKind::StoreUnavailable,
                        fmt::format("cannot read bundle store {}: {}", store_.string(), ec.message()));
        }
        std::error_code fec;
        if (!it->is_regular_file(fec)) continue;
        const std::string name = it->path().filename().string();
        auto parts = parse_bundle_name(name);
        if (!parts) continue;
        auto ts = parse_stamp(parts->stamp);
        if (!ts) continue;

        Bundle b;
        b.label = parts->label;
        b.stamp = parts->stamp;
        b.timestamp = *ts;
        b.filename = name;
        b.path = it->path();
        auto size = it->file_size(fec);
        b.size_bytes = fec ? 0 : size;
        out.push_back(std::move(b));
    }

    std::sort(out.begin(), out.end(), [](const Bundle& a, const Bundle& b){
        if (a.stamp != b.stamp) return a.stamp > b.stamp;
        return a.filename < b.filename;
    });
    return out;
}

static bool all_digits(const std::string& s){
    return !s.empty() && std::all_of(s.begin(), s.end(),
        [](unsigned char c){ return std::isdigit(c) != 0; });
}

std::optional<Bundle> BundleCatalog::find(const std::string& id) const {
    if (id.empty()) return std::nullopt;
    const auto bundles = list();

    for (const auto& b : bundles)
        if (b.filename == id) return b;

    const std::string ext = kBundleExt;
    for (const auto& b : bundles)
        if (b.filename.size() > ext.size() && b.filename.substr(0, b.filename.size() - ext.size()) == id)
            return b;

    // list() is newest first
    for (const auto& b : bundles)
        if (b.label == id) return b;

    if (all_digits(id) && id.size() < 10) {
        const auto pos = static_cast<std::size_t>(std::strtoul(id.c_str(), nullptr, 10));
        if (pos >= 1 && pos <= bundles.size()) return bundles[pos - 1];
    }
    return std::nullopt;
}

Bundle BundleCatalog::require(const std::string& id) const {
    auto b = find(id);
    if (!b) {
        throw Error(ErrorKind::BundleNotFound,
                    fmt::format("no bundle '{}' in {}", id, store_.string()));
    }
    return *b;
}

DeletionReport BundleCatalog::remove(const std::vector<Bundle>& bundles) const {
    DeletionReport report;
    std::error_code ec;
    const fs::path store = fs::weakly_canonical(fs::absolute(store_), ec);

    for (const auto& b : bundles) {
        std::error_code pec;
        const fs::path p = fs::weakly_canonical(fs::absolute(b.path), pec);
        if (ec || pec || p.parent_path() != store || !parse_bundle_name(p.filename().string())) {
            spdlog::warn("refusing to delete {}: not a bundle in {}", b.path.string(), store_.string());
            report.failed.emplace_back(b, "not a bundle in the store");
            continue;
        }
        std::error_code rec;
        const auto size = fs::file_size(p, rec);
        const std::uintmax_t freed = rec ? b.size_bytes : size;
        if (!fs::remove(p, rec)) {
            const std::string why = rec ? rec.message() : std::string("no such file");
            spdlog::warn("cannot delete {}: {}", b.filename, why);
            report.failed.emplace_back(b, why);
            continue;
        }
        spdlog::debug("deleted: {}", b.filename);
        report.deleted.push_back(b);
        report.freed_bytes += freed;
    }
    if (!report.deleted.empty()) fsync_dir(store_);
    return report;
}

DeletionReport BundleCatalog::clean() const {
    return remove(list());
}

void BundleCatalog::inspect(Bundle& bundle) const {
    ArchiveReader reader(bundle);
    bundle.file_count = reader.validate().file_count();
}

std::size_t BundleCatalog::purge_stale_temps() const {
    return ArchiveWriter::purge_stale_temps(store_);
}

} // namespace syncf
