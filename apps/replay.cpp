#include <iostream>
#include <fstream>
#include <sstream>
#include <vector>
#include <string>
#include <algorithm>
#include <cctype>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include "app/config.hpp"
#include "app/replay.hpp"

static bool load_csv(const std::string& path, core::CandleSeries& out) {
    std::ifstream f(path);
    if (!f.good()) return false;
    std::string line;
    while (std::getline(f, line)) {
        if (line.empty()) continue;
        // optional header line
        if (!std::isdigit(static_cast<unsigned char>(line[0]))) continue;
        std::stringstream ss(line);
        std::string x; core::Candle c{};
        try {
            if (!std::getline(ss,x,',')) continue; c.ts_ms = std::stoll(x);
            if (!std::getline(ss,x,',')) continue; c.open = std::stod(x);
            if (!std::getline(ss,x,',')) continue; c.high = std::stod(x);
            if (!std::getline(ss,x,',')) continue; c.low = std::stod(x);
            if (!std::getline(ss,x,',')) continue; c.close = std::stod(x);
            if (std::getline(ss,x,',') && !x.empty()) c.volume = std::stod(x);
        } catch (const std::exception& e) {
            spdlog::warn("skipping bad CSV line '{}': {}", line, e.what());
            continue;
        }
        out.push_back(c);
    }
    return !out.empty();
}

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cout << "Usage: liqmatrix_replay <csv_5m> [instrument_key] [config.json]\n";
        return 1;
    }
    const std::string path = argv[1];
    const std::string key = argc >= 3 ? argv[2] : "XAU";

    app::AppConfig cfg = app::default_config();
    if (argc >= 4) {
        std::string err;
        if (!app::load_config(argv[3], cfg, &err)) {
            std::cerr << "Config error: " << err << "\n";
            return 2;
        }
    }
    spdlog::set_level(spdlog::level::from_str(cfg.log_level));

    auto inst_it = std::find_if(cfg.instruments.begin(), cfg.instruments.end(),
                                [&](const core::Instrument& i) { return i.key == key; });
    if (inst_it == cfg.instruments.end()) {
        std::cerr << "Unknown instrument: " << key << "\n";
        return 2;
    }
    const core::Instrument inst = *inst_it;

    core::CandleSeries c5;
    if (!load_csv(path, c5)) {
        std::cerr << "CSV load failed: " << path << "\n";
        return 2;
    }
    const auto st = app::run_replay(inst, c5, cfg);

    std::cout << fmt::format("{} | 5m candles: {} | 15m candles: {}\n", inst.symbol, c5.size(), st.candles_15m)
              << fmt::format("Armed: {} | Triggered: {} | Suppressed: {} | Expired: {}\n",
                             st.armed, st.triggered, st.suppressed, st.expired)
              << fmt::format("Wins: {} | Losses: {} | Open: {} | Total R: {:.1f}\n",
                             st.wins, st.losses, st.open, st.total_r);
    return 0;
}
