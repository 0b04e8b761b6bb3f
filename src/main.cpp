#include "common/Config.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "common/PathUtils.h"
#include "backtest/BacktestSimulator.h"
#include "core/state/RebalanceJournalJsonl.h"
#include "data/CsvPriceHistoryProvider.h"
#include "data/SurveillanceRestrictionProvider.h"
#include "engine/IBrokerAccount.h"
#include "engine/LiveRebalancer.h"
#include "execution/PaperOrderExecutor.h"
#include "network/CurlHttpClient.h"
#include "optimization/InterruptGuard.h"
#include "optimization/WeightOptimizer.h"
#include "report/ReportWriter.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

using namespace rankfolio;

namespace {

void printUsage() {
    std::cout
        << "Usage: rankfolio [--config <path>] <command> [options]\n\n"
        << "Commands:\n"
        << "  rank       [--date YYYY-MM-DD] [--weights r,s,p] [--out ranking.csv]\n"
        << "  backtest   [--start YYYY-MM-DD] [--end YYYY-MM-DD] [--weights r,s,p] [--out-dir dir] [--json]\n"
        << "  optimize   [--method grid|directed|compare] [--step 0.1] [--workers N]\n"
        << "             [--start YYYY-MM-DD] [--end YYYY-MM-DD] [--out optimization.csv]\n"
        << "  rebalance  [--date YYYY-MM-DD] [--paper] [--dry-run] [--additional-capital X]\n";
}

Date today() {
    const std::time_t now = std::time(nullptr);
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &now);
#else
    localtime_r(&now, &local);
#endif
    return Date::fromYmd(local.tm_year + 1900, static_cast<unsigned>(local.tm_mon + 1),
                         static_cast<unsigned>(local.tm_mday));
}

// --key value pairs and bare --flags.
struct CommandArgs {
    std::map<std::string, std::string> options;
    std::map<std::string, bool> flags;

    bool has(const std::string& key) const { return options.count(key) > 0; }
    bool flag(const std::string& key) const { return flags.count(key) > 0; }
    std::string get(const std::string& key, const std::string& fallback = {}) const {
        auto it = options.find(key);
        return it == options.end() ? fallback : it->second;
    }
};

CommandArgs parseArgs(int argc, char* argv[], int first, const std::vector<std::string>& flag_names) {
    CommandArgs args;
    for (int i = first; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg.rfind("--", 0) != 0) {
            throw ConfigError("Unexpected argument: " + arg);
        }
        const std::string key = arg.substr(2);
        if (std::find(flag_names.begin(), flag_names.end(), key) != flag_names.end()) {
            args.flags[key] = true;
            continue;
        }
        if (i + 1 >= argc) {
            throw ConfigError("Missing value for " + arg);
        }
        args.options[key] = argv[++i];
    }
    return args;
}

double parseNumber(const std::string& key, const std::string& text) {
    try {
        size_t used = 0;
        const double value = std::stod(text, &used);
        if (used != text.size()) {
            throw ConfigError("Invalid --" + key + " value: " + text);
        }
        return value;
    } catch (const std::logic_error&) {
        throw ConfigError("Invalid --" + key + " value: " + text);
    }
}

ranking::WeightTriple parseWeights(const std::string& text) {
    std::vector<double> values;
    size_t start = 0;
    while (start <= text.size()) {
        const size_t comma = text.find(',', start);
        const std::string token = comma == std::string::npos ? text.substr(start)
                                                             : text.substr(start, comma - start);
        values.push_back(parseNumber("weights", token));
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
    if (values.size() != 3) {
        throw ConfigError("--weights needs three comma separated values");
    }
    return ranking::WeightTriple(values[0], values[1], values[2]);
}

void applyCommonOverrides(Config& config, const CommandArgs& args) {
    if (args.has("weights")) {
        config.setWeights(parseWeights(args.get("weights")));
    }
    if (args.has("start") || args.has("end")) {
        const auto current = config.getBacktestConfig();
        const Date start = args.has("start") ? Date::parse(args.get("start")) : current.start;
        const Date end = args.has("end") ? Date::parse(args.get("end")) : current.end;
        config.setBacktestRange(start, end);
    }
}

std::shared_ptr<const data::IPriceHistoryProvider> makePriceProvider(const Config& config) {
    const auto path = utils::PathUtils::resolveRelativePath(config.getDataConfig().prices_csv);
    return std::make_shared<data::CsvPriceHistoryProvider>(path.string());
}

std::shared_ptr<const data::IRestrictionListProvider> makeRestrictionProvider(const Config& config) {
    auto source = config.getDataConfig().surveillance;
    if (!source.asm_file.empty()) {
        source.asm_file = utils::PathUtils::resolveRelativePath(source.asm_file).string();
    }
    if (!source.gsm_file.empty()) {
        source.gsm_file = utils::PathUtils::resolveRelativePath(source.gsm_file).string();
    }
    std::shared_ptr<network::IHttpClient> http;
    if (source.fetch_online) {
        http = std::make_shared<network::CurlHttpClient>();
    }
    return std::make_shared<data::SurveillanceRestrictionProvider>(source, http);
}

void printWarnings(const std::vector<std::string>& warnings) {
    for (const auto& w : warnings) {
        std::cout << "  ! " << w << "\n";
    }
}

int runRank(Config& config, const CommandArgs& args) {
    applyCommonOverrides(config, args);
    const Date as_of = args.has("date") ? Date::parse(args.get("date")) : today();

    engine::LiveRebalancer rebalancer(config.getRebalancerSettings(), config.getWeights(),
                                      makePriceProvider(config), makeRestrictionProvider(config),
                                      nullptr, nullptr);
    const auto snapshot = rebalancer.rank(as_of);

    std::cout << "\nRanking as of " << as_of.toString() << " (weights "
              << config.getWeights().toString() << ")\n";
    std::cout << "---------------------------------------------\n";
    if (snapshot.defensive) {
        std::cout << "Defensive mode: " << snapshot.regime_reason << "\n";
    }
    const int top_n = config.getPortfolioRules().top_n;
    const int band = config.getPortfolioRules().band;
    for (const auto& r : snapshot.scoring.ranked) {
        if (r.rank > top_n + band) break;
        std::cout << std::setw(4) << r.rank << "  " << std::left << std::setw(14) << r.symbol
                  << std::right << std::fixed << std::setprecision(4) << r.composite_score
                  << (r.rank <= top_n ? "" : "  (band)") << "\n";
    }
    std::cout << "Eligible: " << snapshot.universe.symbols.size()
              << ", excluded: " << snapshot.universe.excluded.size()
              << ", ranked: " << snapshot.scoring.ranked.size() << "\n";
    printWarnings(snapshot.scoring.warnings);
    std::cout << "---------------------------------------------\n";

    if (args.has("out")) {
        report::ReportWriter::writeRanking(args.get("out"), snapshot.scoring);
    }
    return 0;
}

int runBacktest(Config& config, const CommandArgs& args) {
    applyCommonOverrides(config, args);
    const auto bt_config = config.getBacktestConfig();

    LOG_INFO("Starting backtest {} .. {} with weights {}", bt_config.start.toString(),
             bt_config.end.toString(), config.getWeights().toString());

    backtest::BacktestSimulator simulator(bt_config, makePriceProvider(config),
                                          makeRestrictionProvider(config), config.getWeights());
    simulator.run();
    const auto& result = simulator.getResult();

    if (args.flag("json")) {
        nlohmann::json j;
        j["cagr"] = result.metrics.cagr;
        j["total_return"] = result.metrics.total_return;
        j["max_drawdown"] = result.metrics.max_drawdown;
        j["volatility"] = result.metrics.volatility;
        j["sharpe"] = result.metrics.sharpe;
        j["sortino"] = result.metrics.sortino;
        j["num_trades"] = result.metrics.num_trades;
        j["skipped_rebalances"] = result.skipped_rebalances;
        j["final_value"] = result.daily.empty() ? 0.0 : result.daily.back().portfolio_value;
        if (result.metrics.benchmark_cagr) j["benchmark_cagr"] = *result.metrics.benchmark_cagr;
        if (result.metrics.alpha) j["alpha"] = *result.metrics.alpha;
        j["warnings"] = result.warnings;
        std::cout << j.dump() << "\n";
    } else {
        std::cout << "\nBacktest result\n";
        std::cout << "---------------------------------------------\n";
        std::cout << "Period:         " << bt_config.start.toString() << " .. " << bt_config.end.toString() << "\n";
        std::cout << "Rebalances:     " << result.rebalances.size()
                  << " (" << result.skipped_rebalances << " skipped)\n";
        if (!result.daily.empty()) {
            std::cout << "Final value:    " << std::fixed << std::setprecision(2)
                      << result.daily.back().portfolio_value << "\n";
        }
        report::ReportWriter::writeSummary(std::cout, result.metrics);
        printWarnings(result.warnings);
        std::cout << "---------------------------------------------\n";
    }

    if (args.has("out-dir")) {
        const std::string dir = args.get("out-dir");
        report::ReportWriter::writeEquityCurve(dir + "/equity_curve.csv", result);
        report::ReportWriter::writeRebalanceLog(dir + "/rebalance_log.csv", result);
    }
    return 0;
}

int runOptimize(Config& config, const CommandArgs& args) {
    applyCommonOverrides(config, args);
    auto opt_config = config.getOptimizerConfig();
    if (args.has("step")) opt_config.step = parseNumber("step", args.get("step"));
    if (args.has("workers")) opt_config.workers = static_cast<int>(parseNumber("workers", args.get("workers")));
    const std::string method = args.get("method", "grid");

    const auto bt_config = config.getBacktestConfig();
    const auto prices = makePriceProvider(config);
    const auto restrictions = makeRestrictionProvider(config);

    optimization::WeightOptimizer optimizer(
        [bt_config, prices, restrictions](const ranking::WeightTriple& weights) {
            backtest::BacktestSimulator simulator(bt_config, prices, restrictions, weights);
            simulator.run();
            return simulator.getResult();
        },
        opt_config);

    optimization::OptimizationReport report;
    {
        // Ctrl+C skips the candidates not yet started.
        optimization::InterruptGuard interrupt(optimizer);
        if (method == "grid") {
            report = optimizer.gridSearch();
        } else if (method == "directed") {
            report = optimizer.directedSearch(config.getWeights());
        } else if (method == "compare") {
            report = optimizer.compareCombinations(optimization::WeightOptimizer::defaultComparisonSet());
        } else {
            throw ConfigError("Unknown optimisation method: " + method);
        }
    }

    std::cout << "\nOptimisation result (" << method << ")\n";
    std::cout << "---------------------------------------------\n";
    std::cout << "Evaluated: " << report.evaluated << ", feasible: " << report.ranked.size()
              << ", infeasible: " << report.infeasible.size() << ", failed: " << report.failed.size()
              << (report.stopped ? " (stopped)" : "") << "\n";
    int shown = 0;
    for (const auto& c : report.ranked) {
        if (++shown > 10) break;
        std::cout << std::setw(3) << shown << "  " << c.weights.toString() << "  CAGR "
                  << std::fixed << std::setprecision(2) << c.metrics.cagr * 100.0 << "%  MDD "
                  << c.metrics.max_drawdown * 100.0 << "%\n";
    }
    for (const auto& c : report.failed) {
        std::cout << "  FAILED " << c.weights.toString() << ": " << c.failure << "\n";
    }
    if (const auto* best = report.best()) {
        std::cout << "Best weights: " << best->weights.toString() << "\n";
    } else {
        std::cout << "No candidate met the drawdown limit of "
                  << opt_config.max_drawdown * 100.0 << "%\n";
    }
    std::cout << "---------------------------------------------\n";

    if (args.has("out")) {
        report::ReportWriter::writeOptimization(args.get("out"), report);
    }
    return 0;
}

int runRebalance(Config& config, const CommandArgs& args) {
    applyCommonOverrides(config, args);
    if (args.has("additional-capital")) {
        config.setAdditionalCapital(parseNumber("additional-capital", args.get("additional-capital")));
    }
    if (args.flag("dry-run")) {
        config.setDryRun(true);
    }
    auto settings = config.getRebalancerSettings();
    if (args.flag("paper")) {
        settings.engine.mode = engine::TradingMode::PAPER;
    }
    if (settings.engine.mode == engine::TradingMode::LIVE && !settings.engine.dry_run) {
        LOG_ERROR("Live order placement has no broker executor configured; use --paper or --dry-run");
        return 1;
    }

    const Date as_of = args.has("date") ? Date::parse(args.get("date")) : today();
    const auto account_path = utils::PathUtils::resolveRelativePath(settings.engine.account_file);
    auto account = std::make_shared<engine::JsonFileBrokerAccount>(account_path.string());
    auto executor = std::make_shared<execution::PaperOrderExecutor>(as_of.toString());
    auto journal = std::make_shared<core::RebalanceJournalJsonl>(
        utils::PathUtils::resolveRelativePath(settings.engine.journal_path));

    engine::LiveRebalancer rebalancer(settings, config.getWeights(), makePriceProvider(config),
                                      makeRestrictionProvider(config), account, executor, journal);
    const auto result = rebalancer.rebalance(as_of);

    std::cout << "\nRebalance " << as_of.toString()
              << (settings.engine.dry_run ? " (dry run)" : "") << "\n";
    std::cout << "---------------------------------------------\n";
    for (const auto& s : result.decision.sells) {
        std::cout << "  SELL " << s.symbol << " (" << s.reason << ")\n";
    }
    for (const auto& b : result.decision.buys) {
        std::cout << "  BUY  " << b.symbol << (b.top_up ? " (top-up)" : "")
                  << (b.placeholder ? " (cash placeholder)" : "") << "\n";
    }
    for (const auto& h : result.decision.holds) {
        std::cout << "  HOLD " << h << "\n";
    }
    std::cout << "Orders planned: " << result.plan.orders.size()
              << ", executed: " << result.reports.size() << "\n";
    for (const auto& r : result.reports) {
        std::cout << "  " << r.order_id << " " << r.symbol << " "
                  << execution::orderStatusToString(r.status) << " " << r.filled_quantity << "/"
                  << r.requested_quantity << "\n";
    }
    printWarnings(result.warnings);
    std::cout << "---------------------------------------------\n";
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        std::string config_path = "config/config.json";
        int index = 1;
        if (argc > 2 && std::string(argv[1]) == "--config") {
            config_path = argv[2];
            index = 3;
        }
        if (index >= argc) {
            printUsage();
            return 1;
        }
        const std::string command = argv[index];
        if (command == "--help" || command == "help") {
            printUsage();
            return 0;
        }

        auto& config = Config::getInstance();
        config.load(config_path);
        const auto& logging = config.getLoggingConfig();
        Logger::getInstance().initialize(utils::PathUtils::resolveRelativePath(logging.dir).string(),
                                         logging.level);

        if (command == "rank") {
            return runRank(config, parseArgs(argc, argv, index + 1, {}));
        }
        if (command == "backtest") {
            return runBacktest(config, parseArgs(argc, argv, index + 1, {"json"}));
        }
        if (command == "optimize") {
            return runOptimize(config, parseArgs(argc, argv, index + 1, {}));
        }
        if (command == "rebalance") {
            return runRebalance(config, parseArgs(argc, argv, index + 1, {"paper", "dry-run"}));
        }

        std::cerr << "Unknown command: " << command << "\n";
        printUsage();
        return 1;
    } catch (const ConfigError& e) {
        LOG_ERROR("Configuration error: {}", e.what());
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: {}", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
