#include "common/Config.h"
#include "common/Errors.h"

#include <cassert>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

using namespace rankfolio;

namespace {
bool rejects(const nlohmann::json& j) {
    try {
        Config::getInstance().loadFromJson(j);
    } catch (const ConfigError&) {
        return true;
    }
    return false;
}
}

int main() {
    std::cout << "[TEST] Starting Config Test..." << std::endl;
    Config& config = Config::getInstance();

    {
        // Empty document: defaults.
        config.loadFromJson(nlohmann::json::object());
        const auto w = config.getWeights();
        assert(std::abs(w.returnWeight() - 0.8) < 1e-12);
        assert(config.getPortfolioRules().top_n == 15);
        assert(config.getPortfolioRules().band == 5);
        assert(config.getFilterConfig().min_history_bars == 252);
        assert(config.getFilterConfig().max_stale_sessions == 5);
        assert(!config.getRegimeConfig().enabled());
        assert(config.getEngineConfig().mode == engine::TradingMode::PAPER);

        const auto bt = config.getBacktestConfig();
        assert(bt.start == Date::fromYmd(2020, 1, 1));
        assert(bt.rebalance_day == Weekday::WEDNESDAY);
        assert(bt.initial_capital == 1000000.0);
    }

    {
        const auto j = nlohmann::json::parse(R"({
            "logging": {"level": "debug"},
            "data": {"universe": ["AAA", "BBB"], "warmup_calendar_days": 400},
            "strategy": {"top_n": 10, "band": 3, "weights": [0.5, 0.3, 0.2],
                         "cash_symbol": "LIQUIDCASE", "benchmark_symbol": "NIFTY", "breadth_threshold": 0.5},
            "filters": {"min_price": 10, "short_term_exclusion_stage": 3, "max_stale_sessions": 2},
            "backtest": {"start": "2021-01-01", "end": "2021-12-31", "rebalance_day": "Friday",
                         "frequency": "monthly", "transaction_cost_pct": 0.001},
            "optimizer": {"step": 0.05, "workers": 4, "max_drawdown": 0.25},
            "live": {"mode": "live", "dry_run": true, "additional_capital": 5000}
        })");
        config.loadFromJson(j);

        assert(config.getLoggingConfig().level == "debug" || std::getenv("RANKFOLIO_LOG_LEVEL"));
        assert(config.getUniverse().size() == 2);
        assert(config.getPortfolioRules().top_n == 10);
        assert(config.getPortfolioRules().cash_symbol == "LIQUIDCASE");
        assert(config.getWeights() == ranking::WeightTriple(0.5, 0.3, 0.2));
        assert(config.getRegimeConfig().benchmark_symbol == "NIFTY");
        assert(config.getFilterConfig().short_term_exclusion_stage == 3);
        assert(config.getFilterConfig().max_stale_sessions == 2);
        assert(config.getOptimizerConfig().workers == 4);
        assert(config.getEngineConfig().mode == engine::TradingMode::LIVE);
        assert(config.getEngineConfig().dry_run);

        const auto bt = config.getBacktestConfig();
        assert(bt.rebalance_day == Weekday::FRIDAY);
        assert(bt.frequency == backtest::RebalanceFrequency::MONTHLY);
        assert(bt.warmup_calendar_days == 400);
        assert(bt.universe.size() == 2);
        assert(std::abs(bt.transaction_cost_pct - 0.001) < 1e-12);

        const auto settings = config.getRebalancerSettings();
        assert(settings.rules.band == 3);
        assert(settings.engine.additional_capital == 5000.0);
        assert(std::abs(settings.engine.transaction_cost_pct - 0.001) < 1e-12);
    }

    {
        // Every invalid value is caught before any run.
        assert(rejects(nlohmann::json::parse(R"({"strategy": {"weights": [0.5, 0.5, 0.5]}})")));
        assert(rejects(nlohmann::json::parse(R"({"strategy": {"weights": [1.0, 0.0]}})")));
        assert(rejects(nlohmann::json::parse(R"({"filters": {"max_stale_sessions": -1}})")));
        assert(rejects(nlohmann::json::parse(R"({"strategy": {"top_n": 0}})")));
        assert(rejects(nlohmann::json::parse(R"({"strategy": {"band": -1}})")));
        assert(rejects(nlohmann::json::parse(R"({"backtest": {"initial_capital": 0}})")));
        assert(rejects(nlohmann::json::parse(R"({"backtest": {"start": "2022-01-01", "end": "2021-01-01"}})")));
        assert(rejects(nlohmann::json::parse(R"({"backtest": {"start": "01/01/2022"}})")));
        assert(rejects(nlohmann::json::parse(R"({"backtest": {"transaction_cost_pct": 1.5}})")));
        assert(rejects(nlohmann::json::parse(R"({"backtest": {"frequency": "hourly"}})")));
        assert(rejects(nlohmann::json::parse(R"({"backtest": {"rebalance_day": "Funday"}})")));
        assert(rejects(nlohmann::json::parse(R"({"strategy": {"top_n": "ten"}})")));
        assert(rejects(nlohmann::json::parse(R"({"optimizer": {"workers": 0}})")));
        assert(rejects(nlohmann::json::parse(R"({"live": {"mode": "margin"}})")));
    }

    {
        // Files: universe list, missing file keeps defaults, broken JSON is rejected.
        const auto dir = std::filesystem::temp_directory_path() / "rankfolio_config_test";
        std::filesystem::create_directories(dir);
        const auto universe = dir / "universe.csv";
        std::ofstream(universe) << "symbol,name\nAAA,Alpha\nBBB,Beta # comment\n\nAAA,dup\n";
        const auto config_file = dir / "config.json";
        std::ofstream(config_file) << "{\"data\": {\"universe_file\": \"" << universe.generic_string() << "\"}}";

        config.load(config_file.string());
        assert(config.getUniverse().size() == 2);
        assert(config.getUniverse()[1] == "BBB");

        config.load((dir / "missing.json").string());
        assert(config.getUniverse().empty());
        assert(config.getPortfolioRules().top_n == 15);

        const auto broken = dir / "broken.json";
        std::ofstream(broken) << "{\"strategy\": ";
        bool threw = false;
        try { config.load(broken.string()); } catch (const ConfigError&) { threw = true; }
        assert(threw);

        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    {
        config.loadFromJson(nlohmann::json::object());
        config.setWeights(ranking::WeightTriple(0.2, 0.3, 0.5));
        config.setBacktestRange(Date::fromYmd(2022, 1, 1), Date::fromYmd(2022, 6, 30));
        config.setAdditionalCapital(1000.0);
        assert(config.getWeights() == ranking::WeightTriple(0.2, 0.3, 0.5));
        assert(config.getBacktestConfig().end == Date::fromYmd(2022, 6, 30));
        assert(config.getEngineConfig().additional_capital == 1000.0);

        bool threw = false;
        try { config.setAdditionalCapital(-5.0); } catch (const ConfigError&) { threw = true; }
        assert(threw);
    }

    std::cout << "[TEST] Config Test PASSED!" << std::endl;
    return 0;
}
