#include <iostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "core/types.hpp"
#include "core/config.hpp"
#include "analysis/analyzer.hpp"
#include "io/csv_loader.hpp"
#include "io/json_codec.hpp"

#ifndef MARKETLENS_VERSION
#define MARKETLENS_VERSION "0.0.0"
#endif

using json = nlohmann::json;

static void usage(){
    std::cerr << "Usage: marketlens_analyzer <candles.csv> [--config <file.json>]"
                 " [--mode indicators|patterns|structure|all] [--verbose]\n"
                 "       marketlens_analyzer --version\n";
}

int main(int argc, char** argv) {
    // stdout carries the JSON document only
    spdlog::set_default_logger(spdlog::stderr_color_mt("marketlens"));

    std::string csv_path, config_path, mode = "all";
    bool verbose = false;
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "--version") {
            std::cout << json{{"status", "ok"}, {"service", "marketlens"},
                              {"version", MARKETLENS_VERSION}}.dump() << "\n";
            return 0;
        }
        if (a == "--verbose") { verbose = true; continue; }
        if ((a == "--config" || a == "--mode") && i + 1 < argc) {
            (a == "--config" ? config_path : mode) = argv[++i];
            continue;
        }
        if (!a.empty() && a[0] != '-' && csv_path.empty()) { csv_path = a; continue; }
        usage();
        return 1;
    }
    if (csv_path.empty() ||
        (mode != "indicators" && mode != "patterns" && mode != "structure" && mode != "all")) {
        usage();
        return 1;
    }
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);

    AnalysisConfig cfg;
    if (!config_path.empty()) {
        try {
            cfg = load_config(config_path);
        } catch (const std::exception& e) {
            spdlog::error("config: {}", e.what());
            return 3;
        }
    }

    std::vector<Candle> candles;
    if (!io::load_candles_csv(csv_path, candles)) {
        spdlog::error("no candles loaded from {}", csv_path);
        return 2;
    }

    json out = json::object();
    if (mode == "indicators" || mode == "all") {
        const auto close = closes(candles);
        const auto set = analysis::compute_indicators(close, highs(candles), lows(candles), close, cfg);
        out["indicators"] = io::indicators_json(set, cfg.output);
    }
    if (mode == "patterns" || mode == "all")
        out["patterns"] = analysis::detect_patterns(candles, cfg);
    if (mode == "structure" || mode == "all") {
        const auto report = analysis::analyze_structure(candles, cfg);
        for (const auto& z : report.sr_zones)
            spdlog::info("{} zone {:.2f} [{:.2f}, {:.2f}] strength {} distance {:.4f}",
                         sr::to_string(z.type), z.level, z.bottom, z.top, z.strength, z.distance);
        out["structure"] = report;
    }

    std::cout << out.dump() << "\n";
    return 0;
}
