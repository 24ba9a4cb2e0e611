#include "io/csv_loader.hpp"
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace io {

static std::string trim(const std::string& s){
    const auto b = s.find_first_not_of(" \t");
    if (b == std::string::npos) return {};
    const auto e = s.find_last_not_of(" \t");
    return s.substr(b, e-b+1);
}

static bool parse_row(const std::string& line, Candle& c){
    std::stringstream ss(line);
    std::string x;
    double f[4]{};
    if (!std::getline(ss, x, ',')) return false;  // time, unused
    for (double& v : f){
        if (!std::getline(ss, x, ',')) return false;
        x = trim(x);
        std::size_t used = 0;
        v = std::stod(x, &used);
        if (used != x.size() || !std::isfinite(v)) return false;
    }
    c = Candle{f[0], f[1], f[2], f[3]};
    return true;
}

bool load_candles_csv(const std::string& path, std::vector<Candle>& out){
    std::ifstream f(path);
    if (!f.good()) {
        spdlog::error("cannot open candle file: {}", path);
        return false;
    }
    std::string line;
    std::getline(f, line);  // header
    std::size_t line_no = 1, skipped = 0;
    while (std::getline(f, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        Candle c;
        bool ok = false;
        try {
            ok = parse_row(line, c);
        } catch (const std::exception& e) {
            spdlog::warn("{}:{}: {}", path, line_no, e.what());
        }
        if (!ok) { ++skipped; continue; }
        out.push_back(c);
    }
    if (skipped) spdlog::warn("{}: skipped {} malformed rows", path, skipped);
    spdlog::info("loaded {} candles from {}", out.size(), path);
    return !out.empty();
}

} // namespace io
