#pragma once

#include <array>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "backtest/BacktestSimulator.h"
#include "data/SurveillanceRestrictionProvider.h"
#include "engine/EngineConfig.h"
#include "engine/LiveRebalancer.h"
#include "optimization/WeightOptimizer.h"
#include "portfolio/PortfolioReconciler.h"
#include "ranking/MarketRegimeFilter.h"
#include "ranking/UniverseFilter.h"
#include "ranking/WeightTriple.h"

namespace rankfolio {

struct LoggingConfig {
    std::string level = "info";
    std::string dir = "logs";
};

struct DataConfig {
    std::string prices_csv = "data/prices.csv";
    // Symbols listed inline, or one per line in universe_file.
    std::vector<std::string> universe;
    std::string universe_file;
    int warmup_calendar_days = 600;
    data::SurveillanceSourceConfig surveillance;
};

// Loaded from a JSON file; every section is optional and missing keys keep
// their defaults. Invalid values throw ConfigError from load().
class Config {
public:
    static Config& getInstance();

    void load(const std::string& config_path);
    // Replaces the whole configuration with `j` (defaults for anything missing).
    void loadFromJson(const nlohmann::json& j);

    const LoggingConfig& getLoggingConfig() const { return logging_; }
    const DataConfig& getDataConfig() const { return data_; }
    const std::vector<std::string>& getUniverse() const { return data_.universe; }

    ranking::WeightTriple getWeights() const;
    const portfolio::PortfolioRules& getPortfolioRules() const { return rules_; }
    const ranking::FilterConfig& getFilterConfig() const { return filters_; }
    const ranking::RegimeConfig& getRegimeConfig() const { return regime_; }
    const optimization::OptimizerConfig& getOptimizerConfig() const { return optimizer_; }
    const engine::EngineConfig& getEngineConfig() const { return engine_; }

    backtest::BacktestConfig getBacktestConfig() const;
    engine::RebalancerSettings getRebalancerSettings() const;

    // Command line overrides.
    void setWeights(const ranking::WeightTriple& w);
    void setBacktestRange(const Date& start, const Date& end);
    void setAdditionalCapital(double amount);
    void setDryRun(bool dry_run) { engine_.dry_run = dry_run; }

private:
    Config() = default;
    void reset();
    void validate() const;
    void loadUniverseFile(const std::string& path);

    LoggingConfig logging_;
    DataConfig data_;
    std::array<double, 3> weights_ = {0.8, 0.1, 0.1};
    portfolio::PortfolioRules rules_;
    ranking::FilterConfig filters_;
    ranking::RegimeConfig regime_;
    optimization::OptimizerConfig optimizer_;
    engine::EngineConfig engine_;

    Date backtest_start_ = Date::fromYmd(2020, 1, 1);
    Date backtest_end_ = Date::fromYmd(2023, 12, 31);
    Weekday rebalance_day_ = Weekday::WEDNESDAY;
    backtest::RebalanceFrequency frequency_ = backtest::RebalanceFrequency::WEEKLY;
    double initial_capital_ = 1000000.0;
    double transaction_cost_pct_ = 0.0;
    double risk_free_rate_ = 0.05;
};

} // namespace rankfolio
