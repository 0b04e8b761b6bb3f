#include "common/Config.h"
#include "common/Errors.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace rankfolio {

namespace {
std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string readEnvVar(const char* name) {
    const char* value = std::getenv(name);
    return value ? trimCopy(value) : "";
}

Date parseDateField(const nlohmann::json& section, const char* key, const Date& fallback) {
    if (!section.contains(key)) {
        return fallback;
    }
    const std::string text = section[key].get<std::string>();
    try {
        return Date::parse(text);
    } catch (const std::invalid_argument&) {
        throw ConfigError(std::string("Invalid date for ") + key + ": " + text);
    }
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::reset() {
    logging_ = LoggingConfig();
    data_ = DataConfig();
    weights_ = {0.8, 0.1, 0.1};
    rules_ = portfolio::PortfolioRules();
    rules_.entry_jump_threshold = 0.15;
    filters_ = ranking::FilterConfig();
    regime_ = ranking::RegimeConfig();
    optimizer_ = optimization::OptimizerConfig();
    engine_ = engine::EngineConfig();
    backtest_start_ = Date::fromYmd(2020, 1, 1);
    backtest_end_ = Date::fromYmd(2023, 12, 31);
    rebalance_day_ = Weekday::WEDNESDAY;
    frequency_ = backtest::RebalanceFrequency::WEEKLY;
    initial_capital_ = 1000000.0;
    transaction_cost_pct_ = 0.0;
    risk_free_rate_ = 0.05;
}

void Config::load(const std::string& path) {
    std::filesystem::path config_path;
    if (std::filesystem::path(path).is_absolute()) {
        config_path = path;
    } else {
        config_path = utils::PathUtils::resolveRelativePath(path);
    }

    std::cout << "Config file: " << config_path.string() << std::endl;

    nlohmann::json j = nlohmann::json::object();
    if (!std::filesystem::exists(config_path)) {
        std::cout << "Warning: config file not found, using defaults." << std::endl;
    } else {
        std::ifstream file(config_path);
        if (!file.is_open()) {
            throw ConfigError("Cannot open config file: " + config_path.string());
        }
        try {
            file >> j;
        } catch (const nlohmann::json::exception& e) {
            throw ConfigError("Invalid JSON in " + config_path.string() + ": " + e.what());
        }
    }

    loadFromJson(j);

    if (!data_.universe_file.empty()) {
        loadUniverseFile(data_.universe_file);
    }

    std::cout << "Config loaded: universe=" << data_.universe.size()
              << ", top_n=" << rules_.top_n << ", band=" << rules_.band << std::endl;
}

void Config::loadFromJson(const nlohmann::json& j) {
    reset();

    try {
        if (j.contains("logging")) {
            auto& l = j["logging"];
            logging_.level = l.value("level", logging_.level);
            logging_.dir = l.value("dir", logging_.dir);
        }

        if (j.contains("data")) {
            auto& d = j["data"];
            data_.prices_csv = d.value("prices_csv", data_.prices_csv);
            data_.universe_file = d.value("universe_file", std::string());
            data_.warmup_calendar_days = d.value("warmup_calendar_days", data_.warmup_calendar_days);
            if (d.contains("universe")) {
                data_.universe = d["universe"].get<std::vector<std::string>>();
            }
            data_.surveillance.asm_file = d.value("restrictions_json", std::string());
            data_.surveillance.gsm_file = d.value("gsm_json", std::string());
            data_.surveillance.fetch_online = d.value("fetch_restrictions", false);
            data_.surveillance.base_url = d.value("restrictions_base_url", data_.surveillance.base_url);
            data_.surveillance.cache_dir = d.value("restrictions_cache_dir", data_.surveillance.cache_dir);
        }

        if (j.contains("strategy")) {
            auto& s = j["strategy"];
            rules_.top_n = s.value("top_n", rules_.top_n);
            rules_.band = s.value("band", rules_.band);
            rules_.cash_symbol = s.value("cash_symbol", rules_.cash_symbol);
            rules_.entry_jump_threshold = s.value("entry_jump_threshold", rules_.entry_jump_threshold);
            if (s.contains("weights")) {
                auto w = s["weights"].get<std::vector<double>>();
                if (w.size() != 3) {
                    throw ConfigError("strategy.weights needs exactly three values");
                }
                weights_ = {w[0], w[1], w[2]};
            }
            regime_.benchmark_symbol = s.value("benchmark_symbol", regime_.benchmark_symbol);
            regime_.breadth_threshold = s.value("breadth_threshold", regime_.breadth_threshold);
            regime_.breadth_dma_period = s.value("breadth_dma_period", regime_.breadth_dma_period);
            if (s.contains("benchmark_ema_periods")) {
                regime_.ema_periods = s["benchmark_ema_periods"].get<std::vector<int>>();
            }
        }

        if (j.contains("filters")) {
            auto& f = j["filters"];
            filters_.min_history_bars = f.value("min_history_bars", filters_.min_history_bars);
            filters_.short_term_exclusion_stage = f.value("short_term_exclusion_stage", filters_.short_term_exclusion_stage);
            filters_.min_price = f.value("min_price", filters_.min_price);
            filters_.max_price = f.value("max_price", filters_.max_price);
            filters_.min_median_traded_value = f.value("min_median_traded_value", filters_.min_median_traded_value);
            filters_.min_avg_volume = f.value("min_avg_volume", filters_.min_avg_volume);
            filters_.liquidity_window = f.value("liquidity_window", filters_.liquidity_window);
            filters_.max_stale_sessions = f.value("max_stale_sessions", filters_.max_stale_sessions);
        }

        if (j.contains("backtest")) {
            auto& b = j["backtest"];
            backtest_start_ = parseDateField(b, "start", backtest_start_);
            backtest_end_ = parseDateField(b, "end", backtest_end_);
            try {
                rebalance_day_ = parseWeekday(b.value("rebalance_day", std::string("Wednesday")));
            } catch (const std::invalid_argument& e) {
                throw ConfigError(e.what());
            }
            frequency_ = backtest::parseFrequency(b.value("frequency", std::string("weekly")));
            initial_capital_ = b.value("initial_capital", initial_capital_);
            transaction_cost_pct_ = b.value("transaction_cost_pct", transaction_cost_pct_);
            risk_free_rate_ = b.value("risk_free_rate", risk_free_rate_);
        }

        if (j.contains("optimizer")) {
            auto& o = j["optimizer"];
            optimizer_.step = o.value("step", optimizer_.step);
            optimizer_.max_drawdown = o.value("max_drawdown", optimizer_.max_drawdown);
            optimizer_.workers = o.value("workers", optimizer_.workers);
            optimizer_.max_iterations = o.value("max_iterations", optimizer_.max_iterations);
            optimizer_.tolerance = o.value("tolerance", optimizer_.tolerance);
        }

        if (j.contains("live")) {
            auto& l = j["live"];
            engine_.mode = engine::parseTradingMode(l.value("mode", std::string("paper")));
            engine_.dry_run = l.value("dry_run", engine_.dry_run);
            engine_.additional_capital = l.value("additional_capital", engine_.additional_capital);
            engine_.journal_path = l.value("journal_path", engine_.journal_path);
            engine_.account_file = l.value("account_file", engine_.account_file);
        }
        engine_.transaction_cost_pct = transaction_cost_pct_;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("Invalid config value: ") + e.what());
    }

    const std::string env_level = readEnvVar("RANKFOLIO_LOG_LEVEL");
    if (!env_level.empty()) {
        logging_.level = env_level;
    }

    validate();
}

void Config::loadUniverseFile(const std::string& path) {
    std::ifstream file(utils::PathUtils::resolveRelativePath(path));
    if (!file.is_open()) {
        throw ConfigError("Cannot open universe file: " + path);
    }
    std::string line;
    while (std::getline(file, line)) {
        // First CSV column; '#' starts a comment.
        line = trimCopy(line.substr(0, line.find_first_of(",#")));
        if (line.empty() || line == "symbol" || line == "Symbol") continue;
        if (std::find(data_.universe.begin(), data_.universe.end(), line) == data_.universe.end()) {
            data_.universe.push_back(line);
        }
    }
}

void Config::validate() const {
    getWeights();
    rules_.validate();
    filters_.validate();
    regime_.validate();
    optimizer_.validate();
    engine_.validate();
    if (data_.warmup_calendar_days < 0) {
        throw ConfigError("warmup_calendar_days must be >= 0");
    }
    if (backtest_start_ > backtest_end_) {
        throw ConfigError("Backtest start is after end");
    }
    if (initial_capital_ <= 0.0) {
        throw ConfigError("initial_capital must be positive");
    }
    if (transaction_cost_pct_ < 0.0 || transaction_cost_pct_ >= 1.0) {
        throw ConfigError("transaction_cost_pct must be within [0, 1)");
    }
}

ranking::WeightTriple Config::getWeights() const {
    return ranking::WeightTriple(weights_[0], weights_[1], weights_[2]);
}

void Config::setWeights(const ranking::WeightTriple& w) {
    weights_ = {w.returnWeight(), w.rsiWeight(), w.proximityWeight()};
}

void Config::setBacktestRange(const Date& start, const Date& end) {
    if (start > end) {
        throw ConfigError("Backtest start " + start.toString() + " is after end " + end.toString());
    }
    backtest_start_ = start;
    backtest_end_ = end;
}

void Config::setAdditionalCapital(double amount) {
    if (amount < 0.0) {
        throw ConfigError("additional_capital must be >= 0");
    }
    engine_.additional_capital = amount;
}

backtest::BacktestConfig Config::getBacktestConfig() const {
    backtest::BacktestConfig cfg;
    cfg.start = backtest_start_;
    cfg.end = backtest_end_;
    cfg.rebalance_day = rebalance_day_;
    cfg.frequency = frequency_;
    cfg.initial_capital = initial_capital_;
    cfg.transaction_cost_pct = transaction_cost_pct_;
    cfg.risk_free_rate = risk_free_rate_;
    cfg.warmup_calendar_days = data_.warmup_calendar_days;
    cfg.universe = data_.universe;
    cfg.rules = rules_;
    cfg.filters = filters_;
    cfg.regime = regime_;
    return cfg;
}

engine::RebalancerSettings Config::getRebalancerSettings() const {
    engine::RebalancerSettings settings;
    settings.universe = data_.universe;
    settings.warmup_calendar_days = data_.warmup_calendar_days;
    settings.rules = rules_;
    settings.filters = filters_;
    settings.regime = regime_;
    settings.engine = engine_;
    return settings;
}

} // namespace rankfolio
