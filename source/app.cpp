#include <syncf/app.hpp>
#include <syncf/catalog.hpp>
#include <syncf/error.hpp>
#include <syncf/naming.hpp>
#include <syncf/pattern.hpp>
#include <syncf/reader.hpp>
#include <syncf/selector.hpp>
#include <syncf/util.hpp>
#include <syncf/writer.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <algorithm>
#include <cctype>
#include <iostream>
#include <memory>
#include <string>
#include <type_traits>

#ifndef SYNCF_VERSION
#define SYNCF_VERSION "unknown"
#endif

namespace fs = std::filesystem;

namespace syncf {

static constexpr std::size_t kShownSkips = 5;

static void print_help(std::ostream& out){
    out <<
        R"(syncf - select files by pattern rules and keep them as timestamped bundles

Usage:
  syncf -z <pattern_file> <label> [--root DIR] [-v]   pack matching files
  syncf -u [BUNDLE] [-C DIR] [-y] [-v]                unpack a bundle
  syncf -l [-v]                                       list bundles
  syncf -c [-y] [-v]                                  delete all bundles

Options:
  --store DIR      bundle store (env SYNCF_STORE)
  --root DIR       directory the pattern rules apply to (default: .)
  --threads N      walker threads, 0 = all cores (env SYNCF_THREADS)
  --log-file PATH  also log to a rotating file (env SYNCF_LOG_FILE)
  -y, --yes        do not ask for confirmation
  -v, --verbose    debug logging
  -h, --help       show this help
  --version        show version

BUNDLE is a file name, a label (newest wins) or a position from -l.
)";
}

static void setup_logging(const Config& cfg, bool verbose){
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    if (cfg.log_file) {
        try {
            auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                cfg.log_file->string(), cfg.log_max_bytes, cfg.log_files);
            auto logger = std::make_shared<spdlog::logger>("syncf", sink);
            spdlog::set_default_logger(logger);
            spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        } catch (const spdlog::spdlog_ex& e) {
            spdlog::warn("failed to initialize rotating log sink ({}), fallback to default", e.what());
        }
    }
    auto level = spdlog::level::from_str(cfg.log_level);
    if (level == spdlog::level::off && cfg.log_level != "off") {
        spdlog::warn("unknown log level '{}', using info", cfg.log_level);
        level = spdlog::level::info;
    }
    spdlog::set_level(verbose ? spdlog::level::debug : level);
}

App::App() : in_(std::cin), out_(std::cout) {}

App::App(std::istream& in, std::ostream& out) : in_(in), out_(out) {}

int App::run(int argc, char** argv){
    auto pr = parse_cli(argc, argv);
    if (!pr.cmd) {
        if (!pr.error.empty()) {
            out_ << fmt::format("error: {}\n", pr.error);
            out_ << "use 'syncf -h' for help\n";
            return 2;
        }
        print_help(out_);
        return 0;
    }

    Config cfg = load_config();
    if (pr.opts.store) cfg.store_dir = *pr.opts.store;
    if (pr.opts.root) cfg.root = *pr.opts.root;
    if (pr.opts.threads) cfg.threads = *pr.opts.threads;
    if (pr.opts.log_file) cfg.log_file = pr.opts.log_file;
    assume_yes_ = pr.opts.assume_yes;
    verbose_ = pr.opts.verbose;

    setup_logging(cfg, pr.opts.verbose);
    spdlog::debug("store={} root={} threads={}", cfg.store_dir.string(), cfg.root.string(), cfg.threads);

    try {
        return std::visit(
            [&](auto&& c) -> int {
                using T = std::decay_t<decltype(c)>;

                if constexpr (std::is_same_v<T, CmdHelp>) {
                    print_help(out_);
                    return 0;
                } else if constexpr (std::is_same_v<T, CmdVersion>) {
                    out_ << fmt::format("syncf {}\n", SYNCF_VERSION);
                    return 0;
                } else if constexpr (std::is_same_v<T, CmdPack>) {
                    return pack(c, cfg);
                } else if constexpr (std::is_same_v<T, CmdUnpack>) {
                    return unpack(c, cfg);
                } else if constexpr (std::is_same_v<T, CmdList>) {
                    return list(cfg);
                } else {
                    return clean(cfg);
                }
            },
            *pr.cmd);
    } catch (const Error& e) {
        spdlog::error("{}", e.what());
        out_ << fmt::format("error: {}\n", e.what());
        return e.is_user_error() ? 2 : 1;
    } catch (const std::exception& e) {
        spdlog::error("unexpected failure: {}", e.what());
        out_ << fmt::format("error: {}\n", e.what());
        return 1;
    }
}

int App::pack(const CmdPack& c, const Config& cfg){
    // fail on a bad label before walking anything
    const std::string label = sanitize_label(c.label);
    spdlog::debug("label '{}' -> '{}'", c.label, label);

    const Matcher matcher = Matcher::compile(load_rules(c.pattern_file));

    SelectOptions opts;
    opts.prune.push_back(cfg.store_dir);
    opts.threads = cfg.threads;
    const SelectionResult sel = FileSelector(matcher, opts).select(cfg.root);

    const PackReport rep = ArchiveWriter(cfg.store_dir).write(sel, cfg.root, c.label);

    out_ << fmt::format("✓ Package complete: {}\n", rep.bundle.path.string());
    std::string dirs;
    if (!rep.directories.empty()) dirs = fmt::format(" and {} directories", rep.directories.size());
    out_ << fmt::format("Packed {} files{}, total size: {}\n",
                        rep.archived.size(), dirs, format_size(rep.bundle.size_bytes));
    if (!rep.skipped.empty()) {
        out_ << fmt::format("Skipped {} items:\n", rep.skipped.size());
        const std::size_t shown = std::min(rep.skipped.size(), kShownSkips);
        for (std::size_t i = 0; i < shown; ++i) {
            const Skip& s = rep.skipped[i];
            out_ << fmt::format("  {}: {}{}\n", s.path, to_string(s.reason),
                                s.detail.empty() ? "" : " (" + s.detail + ")");
        }
        if (rep.skipped.size() > shown) {
            out_ << fmt::format("  ... and {} more\n", rep.skipped.size() - shown);
        }
    }
    return 0;
}

void App::print_bundles(const std::vector<Bundle>& bundles){
    std::size_t index = 1;
    for (const auto& b : bundles) {
        std::string size = format_size(b.size_bytes);
        size.erase(0, size.find_first_not_of(' '));
        std::string files;
        if (b.file_count) files = fmt::format(", {} files", *b.file_count);
        out_ << fmt::format("{:3d}. {} ({}, {}{})\n", index++, b.filename, size, format_age(b.timestamp), files);
    }
}

std::optional<Bundle> App::choose(const std::vector<Bundle>& bundles){
    out_ << fmt::format("please select file, total: {}\n", bundles.size());
    print_bundles(bundles);
    out_ << "  0. exit\n> " << std::flush;

    std::string line;
    if (!std::getline(in_, line)) return std::nullopt;
    line.erase(0, line.find_first_not_of(" \t"));
    line.erase(line.find_last_not_of(" \t\r") + 1);
    if (line.empty() || line == "0") return std::nullopt;

    const bool numeric = std::all_of(line.begin(), line.end(),
        [](unsigned char ch){ return std::isdigit(ch) != 0; });
    if (!numeric || line.size() > 9) {
        throw Error(ErrorKind::BundleNotFound, fmt::format("invalid selection '{}'", line));
    }
    const std::size_t pos = std::stoul(line);
    if (pos == 0) return std::nullopt;
    if (pos > bundles.size()) {
        throw Error(ErrorKind::BundleNotFound,
                    fmt::format("invalid selection {}: choose 1..{}", pos, bundles.size()));
    }
    out_ << fmt::format("select package {}\n", bundles[pos - 1].filename);
    return bundles[pos - 1];
}

bool App::confirm(const std::string& question, bool default_yes){
    if (assume_yes_) return true;
    out_ << question << (default_yes ? " [Y/n] " : " [y/N] ") << std::flush;
    std::string line;
    if (!std::getline(in_, line)) return false;
    line.erase(0, line.find_first_not_of(" \t"));
    if (line.empty() || line[0] == '\r') return default_yes;
    return line[0] == 'y' || line[0] == 'Y';
}

int App::unpack(const CmdUnpack& c, const Config& cfg){
    BundleCatalog catalog(cfg.store_dir);

    Bundle bundle;
    if (c.bundle) {
        bundle = catalog.require(*c.bundle);
    } else {
        const auto bundles = catalog.list();
        if (bundles.empty()) {
            throw Error(ErrorKind::BundleNotFound,
                        fmt::format("no bundles in {}", cfg.store_dir.string()));
        }
        auto chosen = choose(bundles);
        if (!chosen) {
            out_ << "you select no files\n";
            return 0;
        }
        bundle = *chosen;
    }

    std::error_code ec;
    const fs::path dest = c.dest ? *c.dest : fs::current_path(ec);
    if (ec) {
        throw Error(ErrorKind::Io, fmt::format("cannot determine current directory: {}", ec.message()));
    }
    if (!confirm(fmt::format("are you sure unpack to this dir ({}) ?", dest.string()), true)) {
        out_ << "cancel unpack action\n";
        return 0;
    }

    out_ << fmt::format("Will unpackage the file: {}\n", bundle.path.string());
    const ExtractionReport rep = ArchiveReader(bundle).extract(dest);
    for (const auto& e : rep.entries) {
        if (e.reason) {
            out_ << fmt::format("  skipped {}: {} ({})\n", e.path, to_string(*e.reason), e.detail);
        }
    }
    out_ << fmt::format("✓ unpack finished: {} ({} files, {})\n",
                        bundle.filename, rep.files, format_size(rep.bytes));
    return 0;
}

int App::list(const Config& cfg){
    BundleCatalog catalog(cfg.store_dir);
    auto bundles = catalog.list();
    if (bundles.empty()) {
        out_ << fmt::format("no bundles in {}\n", cfg.store_dir.string());
        return 0;
    }
    if (verbose_) {
        for (auto& b : bundles) {
            try {
                catalog.inspect(b);
            } catch (const Error& e) {
                spdlog::warn("{}", e.what());
            }
        }
    }
    out_ << fmt::format("{} bundles in {}\n", bundles.size(), cfg.store_dir.string());
    print_bundles(bundles);
    return 0;
}

int App::clean(const Config& cfg){
    BundleCatalog catalog(cfg.store_dir);
    const auto bundles = catalog.list();
    if (const auto purged = catalog.purge_stale_temps()) {
        spdlog::info("removed {} stale temporary files", purged);
    }
    if (bundles.empty()) {
        out_ << fmt::format("have no {} files need clean.\n", kBundleExt);
        return 0;
    }

    std::uintmax_t total = 0;
    for (const auto& b : bundles) total += b.size_bytes;
    out_ << fmt::format("Found {} package files (total: {})\n", bundles.size(), format_size(total));

    if (!confirm("delete all of them ?", false)) {
        out_ << "cancel clean action\n";
        return 0;
    }

    const DeletionReport rep = catalog.remove(bundles);
    for (const auto& [b, why] : rep.failed) {
        out_ << fmt::format("  Failed to delete {}: {}\n", b.filename, why);
    }
    out_ << fmt::format("✓ Deleted {} files.\n", rep.deleted.size());
    return rep.failed.empty() ? 0 : 1;
}

} // namespace syncf
