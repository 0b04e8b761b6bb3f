#include "report/ReportWriter.h"
#include "common/Logger.h"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace rankfolio {
namespace report {

namespace {
std::string optionalField(const std::optional<double>& value) {
    return value ? fmt::format("{:.4f}", *value) : std::string();
}

std::string joinWarnings(const std::vector<std::string>& warnings) {
    std::string joined;
    for (const auto& w : warnings) {
        if (!joined.empty()) joined += " | ";
        joined += w;
    }
    return joined;
}

template <typename Writer>
void writeFile(const std::string& path, Writer&& writer) {
    const std::filesystem::path file_path(path);
    if (file_path.has_parent_path()) {
        std::filesystem::create_directories(file_path.parent_path());
    }
    std::ofstream out(file_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        LOG_ERROR("Report open failed: {}", path);
        throw std::runtime_error("Cannot write report: " + path);
    }
    writer(out);
    LOG_INFO("Report written: {}", path);
}

void writeCandidateRows(std::ostream& out,
                        const std::vector<optimization::CandidateResult>& rows,
                        int& position) {
    for (const auto& c : rows) {
        const bool ok = c.status == optimization::CandidateStatus::OK;
        out << ++position << ','
            << fmt::format("{:.4f},{:.4f},{:.4f}", c.weights.returnWeight(),
                           c.weights.rsiWeight(), c.weights.proximityWeight()) << ','
            << optimization::candidateStatusToString(c.status) << ','
            << (c.feasible ? "yes" : "no") << ',';
        if (ok) {
            out << fmt::format("{:.6f},{:.6f},{:.6f},{:.4f},{:.4f},{}",
                               c.metrics.cagr, c.metrics.max_drawdown, c.metrics.total_return,
                               c.metrics.sharpe, c.metrics.sortino, c.metrics.num_trades);
        } else {
            out << ",,,,,";
        }
        out << ',' << ReportWriter::escapeField(c.failure) << '\n';
    }
}
}

std::string ReportWriter::escapeField(const std::string& field) {
    if (field.find_first_of(",\"\n\r") == std::string::npos) {
        return field;
    }
    std::string quoted = "\"";
    for (char c : field) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

void ReportWriter::writeRanking(std::ostream& out, const ranking::ScoringResult& result) {
    out << "rank,symbol,composite,return_subrank,rsi_subrank,proximity_subrank,"
           "close,return_22d,return_44d,return_66d,rsi_22d,rsi_44d,rsi_66d,pct_from_52w_high\n";
    for (const auto& r : result.ranked) {
        const auto& s = r.snapshot;
        out << r.rank << ',' << escapeField(r.symbol) << ','
            << fmt::format("{:.6f},{:.6f},{:.6f},{:.6f},{:.4f}", r.composite_score,
                           r.return_subrank, r.rsi_subrank, r.proximity_subrank, s.close_price)
            << ',' << optionalField(s.return_22d)
            << ',' << optionalField(s.return_44d)
            << ',' << optionalField(s.return_66d)
            << ',' << optionalField(s.rsi_22d)
            << ',' << optionalField(s.rsi_44d)
            << ',' << optionalField(s.rsi_66d)
            << ',' << optionalField(s.pct_from_52w_high) << '\n';
    }
}

void ReportWriter::writeEquityCurve(std::ostream& out, const backtest::BacktestResult& result) {
    out << "date,portfolio_value,cash,positions\n";
    for (const auto& p : result.daily) {
        out << p.date.toString() << ','
            << fmt::format("{:.2f},{:.2f}", p.portfolio_value, p.cash) << ','
            << p.holdings.size() << '\n';
    }
}

void ReportWriter::writeRebalanceLog(std::ostream& out, const backtest::BacktestResult& result) {
    out << "date,status,eligible,ranked,sells,buys,holds,orders,defensive,warnings\n";
    for (const auto& r : result.rebalances) {
        out << r.date.toString() << ','
            << (r.skipped ? "skipped" : "rebalanced") << ','
            << r.eligible_count << ',' << r.ranked_count << ','
            << r.decision.sells.size() << ',' << r.decision.buys.size() << ','
            << r.decision.holds.size() << ',' << r.orders.size() << ','
            << (r.decision.defensive ? "yes" : "no") << ','
            << escapeField(joinWarnings(r.warnings)) << '\n';
    }
}

void ReportWriter::writeOptimization(std::ostream& out, const optimization::OptimizationReport& report) {
    out << "position,return_weight,rsi_weight,proximity_weight,status,feasible,"
           "cagr,max_drawdown,total_return,sharpe,sortino,trades,failure\n";
    int position = 0;
    writeCandidateRows(out, report.ranked, position);
    writeCandidateRows(out, report.infeasible, position);
    writeCandidateRows(out, report.failed, position);
}

void ReportWriter::writeSummary(std::ostream& out, const backtest::PerformanceSummary& summary) {
    out << fmt::format("CAGR:           {:.2f}%\n", summary.cagr * 100.0)
        << fmt::format("Total return:   {:.2f}%\n", summary.total_return * 100.0)
        << fmt::format("Max drawdown:   {:.2f}%\n", summary.max_drawdown * 100.0)
        << fmt::format("Volatility:     {:.2f}%\n", summary.volatility * 100.0)
        << fmt::format("Sharpe:         {:.2f}\n", summary.sharpe)
        << fmt::format("Sortino:        {:.2f}\n", summary.sortino)
        << fmt::format("Trades:         {}\n", summary.num_trades);
    if (summary.benchmark_cagr) {
        out << fmt::format("Benchmark CAGR: {:.2f}%\n", *summary.benchmark_cagr * 100.0);
    }
    if (summary.alpha) {
        out << fmt::format("Alpha:          {:.2f}%\n", *summary.alpha * 100.0);
    }
}

void ReportWriter::writeRanking(const std::string& path, const ranking::ScoringResult& result) {
    writeFile(path, [&](std::ostream& out) { writeRanking(out, result); });
}

void ReportWriter::writeEquityCurve(const std::string& path, const backtest::BacktestResult& result) {
    writeFile(path, [&](std::ostream& out) { writeEquityCurve(out, result); });
}

void ReportWriter::writeRebalanceLog(const std::string& path, const backtest::BacktestResult& result) {
    writeFile(path, [&](std::ostream& out) { writeRebalanceLog(out, result); });
}

void ReportWriter::writeOptimization(const std::string& path, const optimization::OptimizationReport& report) {
    writeFile(path, [&](std::ostream& out) { writeOptimization(out, report); });
}

} // namespace report
} // namespace rankfolio
