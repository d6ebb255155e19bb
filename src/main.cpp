/// @file src/main.cpp
/// @brief semdiff CLI entry point.
///
/// Usage:
///   semdiff --items <items.csv> --responses <responses.csv> [options]
///                                   Statistics, group profiles and clusters
///   semdiff --flips <session_id> --items <items.csv> [--randomize]
///                                   Print the flip pattern of one session
///   semdiff --help                  Print usage
///
/// ## Exit Codes
///   0 - success
///   1 - usage or fatal error

#include "semdiff/data_loader.hpp"
#include "semdiff/engine.hpp"

#include <fmt/core.h>

#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  semdiff --items <items.csv> --responses <responses.csv>\n"
        "          [--mode discrete|continuous] [--points N] [--k N]\n"
        "          [--max-iter N] [--seed N] [--verbose]\n"
        "  semdiff --flips <session_id> --items <items.csv> [--randomize]\n"
        "  semdiff --help\n"
        "\n"
        "Items CSV (header required):\n"
        "  id,low_label,high_label[,category]\n"
        "Responses CSV (header required):\n"
        "  session_id,group_id,group_label,status,item_id,raw_value,was_flipped,timestamp\n"
    );
}

// ─── Argument Parsing ────────────────────────────────────────────────────────

struct Args {
    std::string items_path;
    std::string responses_path;
    std::string flips_session;
    bool        flips_mode = false;
    semdiff::core::EngineConfig config;
};

int parse_int(const std::string& flag, const std::string& value) {
    std::size_t pos = 0;
    int v = 0;
    try {
        v = std::stoi(value, &pos);
    } catch (const std::exception&) {
        throw std::runtime_error(fmt::format("{} expects an integer, got '{}'", flag, value));
    }
    if (pos != value.size()) {
        throw std::runtime_error(fmt::format("{} expects an integer, got '{}'", flag, value));
    }
    return v;
}

/// Returns nullopt when required arguments are missing.
/// Throws std::runtime_error on malformed values.
std::optional<Args> parse_args(int argc, char* argv[]) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        const std::string key(argv[i]);

        if (key == "--verbose") {
            args.config.verbose = true;
            continue;
        }
        if (key == "--randomize") {
            args.config.randomize = true;
            continue;
        }
        if (i + 1 >= argc) {
            throw std::runtime_error(fmt::format("{} requires a value", key));
        }
        const std::string val(argv[++i]);

        if (key == "--items") {
            args.items_path = val;
        } else if (key == "--responses") {
            args.responses_path = val;
        } else if (key == "--flips") {
            args.flips_session = val;
            args.flips_mode    = true;
        } else if (key == "--mode") {
            auto mode = semdiff::parse_mode(val);
            if (!mode) {
                throw std::runtime_error(fmt::format("unknown scale mode '{}'", val));
            }
            args.config.scale.mode = *mode;
        } else if (key == "--points") {
            args.config.scale.points = parse_int(key, val);
        } else if (key == "--k") {
            args.config.cluster_count = parse_int(key, val);
        } else if (key == "--max-iter") {
            args.config.max_iterations = parse_int(key, val);
        } else if (key == "--seed") {
            try {
                args.config.cluster_seed = std::stoull(val);
            } catch (const std::exception&) {
                throw std::runtime_error(fmt::format("--seed expects an integer, got '{}'", val));
            }
        } else {
            throw std::runtime_error(fmt::format("unknown option {}", key));
        }
    }

    if (args.items_path.empty()) return std::nullopt;
    if (!args.flips_mode && args.responses_path.empty()) return std::nullopt;
    return args;
}

// ─── Modes ───────────────────────────────────────────────────────────────────

std::vector<semdiff::ScaleItem> load_items_or_throw(const std::string& path) {
    auto items = semdiff::core::DataLoader::load_items(path);
    if (!items) {
        throw std::runtime_error("Cannot open: " + path);
    }
    if (items->empty()) {
        throw std::runtime_error("No valid scale items in " + path);
    }
    return std::move(*items);
}

int run_flips(Args args) {
    args.config.items = load_items_or_throw(args.items_path);
    const semdiff::core::AnalysisEngine engine(std::move(args.config));

    const auto pattern = engine.flip_pattern(args.flips_session);
    fmt::print("Session '{}' (randomize={})\n", args.flips_session, engine.config().randomize);
    for (const auto& item : engine.config().items) {
        const bool flipped = pattern.at(item.id);
        fmt::print("  {:<12} {}  {} <-> {}\n", item.id, flipped ? "flipped" : "normal ",
                   flipped ? item.high_label : item.low_label,
                   flipped ? item.low_label  : item.high_label);
    }
    return 0;
}

int run_analysis(Args args) {
    args.config.items = load_items_or_throw(args.items_path);
    const semdiff::core::AnalysisEngine engine(std::move(args.config));

    auto sessions = semdiff::core::DataLoader::load_sessions(args.responses_path,
                                                             engine.config().scale);
    if (!sessions) {
        throw std::runtime_error("Cannot open: " + args.responses_path);
    }
    fmt::print("Loaded {} sessions from '{}'\n", sessions->size(), args.responses_path);

    const auto report = engine.analyze(*sessions);
    fmt::print("{}", report.to_string());
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string first(argv[1]);
    if (first == "--help" || first == "-h") {
        print_usage();
        return 0;
    }

    try {
        auto args = parse_args(argc, argv);
        if (!args) {
            print_usage();
            return 1;
        }
        return args->flips_mode ? run_flips(std::move(*args)) : run_analysis(std::move(*args));
    } catch (const std::exception& ex) {
        fmt::print(stderr, "[FATAL] {}\n", ex.what());
        return 1;
    }
}
