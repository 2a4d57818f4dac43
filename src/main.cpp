/// @file src/main.cpp
/// @brief hypecycle CLI entry point.
///
/// Usage:
///   hypecycle --analyze <stream> <file> [options]   Classify one evidence stream
///   hypecycle --technology <dir> [options]          Classify every stream in a directory
///   hypecycle --help                                Print usage
///
/// Exit codes: 0 success, 1 usage or I/O failure, 2 insufficient data.

#include "hype/analysis.hpp"
#include "hype/calendar.hpp"
#include "hype/config_loader.hpp"
#include "hype/data_loader.hpp"
#include "hype/record_loader.hpp"
#include "hype/serialization.hpp"

#include <fmt/core.h>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace {

constexpr int EXIT_USAGE        = 1;
constexpr int EXIT_INSUFFICIENT = 2;

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  hypecycle --analyze <paper|patent|social|news|finance> <file> [options]\n"
        "  hypecycle --technology <dir> [options]\n"
        "  hypecycle --help\n"
        "\n"
        "Options:\n"
        "  --info <json>        Ticker fundamentals (finance only)\n"
        "  --config <json>      Threshold overlay applied to the defaults\n"
        "  --now YYYY-MM-DD     Reference date (default: today, UTC)\n"
        "  --json               Print snapshot and verdict as JSON\n"
        "  --verbose            Trace pipeline steps to stderr\n"
        "\n"
        "A technology directory may hold papers.json, patents.json, social.json,\n"
        "news.json, prices.csv and stock_info.json.\n"
    );
}

struct Options {
    std::string                command;
    std::vector<std::string>   positional;
    std::optional<std::string> info_path;
    std::optional<std::string> config_path;
    std::optional<std::string> now_date;
    bool                       json    = false;
    bool                       verbose = false;
};

/// Returns `nullopt` (after printing the reason) on a malformed command line.
std::optional<Options> parse_args(int argc, char* argv[]) {
    Options opts;
    opts.command = argv[1];
    for (int i = 2; i < argc; ++i) {
        const std::string arg(argv[i]);
        const auto value = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) {
                fmt::print(stderr, "Error: {} requires a value\n", arg);
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };
        if (arg == "--json") {
            opts.json = true;
        } else if (arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "--info" || arg == "--config" || arg == "--now") {
            auto v = value();
            if (!v) return std::nullopt;
            if (arg == "--info") opts.info_path = std::move(v);
            else if (arg == "--config") opts.config_path = std::move(v);
            else opts.now_date = std::move(v);
        } else if (arg.starts_with("--")) {
            fmt::print(stderr, "Unknown option: {}\n", arg);
            return std::nullopt;
        } else {
            opts.positional.push_back(arg);
        }
    }
    return opts;
}

/// Build the analyzer from the config overlay and reference date.
std::optional<hype::core::Analyzer> make_analyzer(const Options& opts) {
    hype::AnalysisConfig config;
    if (opts.config_path) {
        auto loaded = hype::io::ConfigLoader::load(*opts.config_path);
        if (!loaded) {
            fmt::print(stderr, "Error: cannot load config '{}'\n", *opts.config_path);
            return std::nullopt;
        }
        config = std::move(*loaded);
    }
    if (opts.verbose) config.verbose = true;

    std::int64_t now = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    if (opts.now_date) {
        const auto parsed = hype::calendar::parse_date(*opts.now_date);
        if (!parsed) {
            fmt::print(stderr, "Error: --now expects YYYY-MM-DD, got '{}'\n", *opts.now_date);
            return std::nullopt;
        }
        now = *parsed;
    }
    return hype::core::Analyzer(std::move(config), now);
}

template <typename Snapshot>
void print_result(const std::string& stream, const hype::core::StreamResult<Snapshot>& r,
                  bool json) {
    if (json) {
        Json::Value out(Json::objectValue);
        out["stream"]   = stream;
        out["snapshot"] = hype::io::to_json(r.snapshot);
        out["verdict"]  = hype::io::to_json(r.verdict);
        fmt::print("{}\n", hype::io::write_json(out));
        return;
    }
    fmt::print("[{}] {} (confidence {:.2f})\n{}\n\n{}\n\n", stream,
               hype::display_name(r.verdict.phase), r.verdict.confidence,
               hype::description(r.verdict.phase), r.verdict.rationale);
}

void print_load_error(const std::string& path) {
    fmt::print(stderr, "Error: cannot read records from '{}'\n", path);
}

/// Load, analyse and print one stream.
/// Returns 0 on success, 1 on I/O failure, 2 when the stream is below its gate.
int run_analyze(const Options& opts) {
    if (opts.positional.size() != 2) {
        fmt::print(stderr, "Error: --analyze requires a stream and a file path\n");
        print_usage();
        return EXIT_USAGE;
    }
    const std::string& stream = opts.positional[0];
    const std::string& path   = opts.positional[1];

    const auto analyzer = make_analyzer(opts);
    if (!analyzer) return EXIT_USAGE;

    try {
        if (stream == "paper") {
            const auto records = hype::io::RecordLoader::load_papers(path);
            if (!records) { print_load_error(path); return EXIT_USAGE; }
            print_result(stream, analyzer->analyze_papers(*records), opts.json);
        } else if (stream == "patent") {
            const auto records = hype::io::RecordLoader::load_patents(path);
            if (!records) { print_load_error(path); return EXIT_USAGE; }
            print_result(stream, analyzer->analyze_patents(*records), opts.json);
        } else if (stream == "social") {
            const auto records = hype::io::RecordLoader::load_posts(path);
            if (!records) { print_load_error(path); return EXIT_USAGE; }
            print_result(stream, analyzer->analyze_posts(*records), opts.json);
        } else if (stream == "news") {
            const auto records = hype::io::RecordLoader::load_articles(path);
            if (!records) { print_load_error(path); return EXIT_USAGE; }
            print_result(stream, analyzer->analyze_articles(*records), opts.json);
        } else if (stream == "finance") {
            const auto bars = hype::io::DataLoader::load_csv(path);
            if (!bars) { print_load_error(path); return EXIT_USAGE; }
            std::vector<hype::TickerInfo> info;
            if (opts.info_path) {
                auto loaded = hype::io::RecordLoader::load_ticker_info(*opts.info_path);
                if (!loaded) { print_load_error(*opts.info_path); return EXIT_USAGE; }
                info = std::move(*loaded);
            }
            print_result(stream, analyzer->analyze_prices(*bars, info), opts.json);
        } else {
            fmt::print(stderr, "Unknown stream: {}\n", stream);
            print_usage();
            return EXIT_USAGE;
        }
    } catch (const hype::InsufficientDataError& e) {
        fmt::print(stderr, "Insufficient data: {}\n", e.what());
        return EXIT_INSUFFICIENT;
    }
    return 0;
}

/// Load every stream file present in `dir`. Missing files leave the stream
/// empty; unreadable ones are reported and fail the load.
std::optional<hype::core::TechnologyEvidence> load_evidence(const std::filesystem::path& dir) {
    namespace fs = std::filesystem;
    hype::core::TechnologyEvidence ev;
    std::size_t found = 0;

    const auto load = [&](const char* name, auto loader, auto& out) {
        const fs::path file = dir / name;
        std::error_code ec;
        if (!fs::exists(file, ec)) return true;
        ++found;
        auto records = loader(file.string());
        if (!records) {
            print_load_error(file.string());
            return false;
        }
        out = std::move(*records);
        return true;
    };

    using hype::io::RecordLoader;
    const bool ok = load("papers.json", RecordLoader::load_papers, ev.papers)
                 && load("patents.json", RecordLoader::load_patents, ev.patents)
                 && load("social.json", RecordLoader::load_posts, ev.posts)
                 && load("news.json", RecordLoader::load_articles, ev.articles)
                 && load("prices.csv", hype::io::DataLoader::load_csv, ev.prices)
                 && load("stock_info.json", RecordLoader::load_ticker_info, ev.ticker_info);
    if (!ok) return std::nullopt;
    if (found == 0) {
        fmt::print(stderr, "Error: no stream files found in '{}'\n", dir.string());
        return std::nullopt;
    }
    return ev;
}

/// Analyse every stream of a technology directory concurrently.
/// Returns 0 when at least one stream was classified, 2 when every stream
/// present was below its gate, 1 on I/O failure.
int run_technology(const Options& opts) {
    if (opts.positional.size() != 1) {
        fmt::print(stderr, "Error: --technology requires a directory\n");
        print_usage();
        return EXIT_USAGE;
    }
    const auto analyzer = make_analyzer(opts);
    if (!analyzer) return EXIT_USAGE;

    const auto evidence = load_evidence(opts.positional[0]);
    if (!evidence) return EXIT_USAGE;

    const hype::core::TechnologyReport report = analyzer->analyze_technology(*evidence);

    if (report.paper)   print_result("paper", *report.paper, opts.json);
    if (report.patent)  print_result("patent", *report.patent, opts.json);
    if (report.social)  print_result("social", *report.social, opts.json);
    if (report.news)    print_result("news", *report.news, opts.json);
    if (report.finance) print_result("finance", *report.finance, opts.json);

    for (const auto& s : report.shortfalls) {
        fmt::print(stderr, "Skipped {}: {}\n", s.stream, s.message);
    }
    return report.analysed() > 0 ? 0 : EXIT_INSUFFICIENT;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return EXIT_USAGE;
    }

    const std::string mode(argv[1]);
    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }

    const auto opts = parse_args(argc, argv);
    if (!opts) {
        print_usage();
        return EXIT_USAGE;
    }

    if (mode == "--analyze") return run_analyze(*opts);
    if (mode == "--technology") return run_technology(*opts);

    fmt::print(stderr, "Unknown option: {}\n", mode);
    print_usage();
    return EXIT_USAGE;
}
