#pragma once

#include <string>

namespace rankfolio {
namespace engine {

enum class TradingMode {
    LIVE,           // orders go to the broker
    PAPER           // orders filled by the paper executor
};

TradingMode parseTradingMode(const std::string& text);

// Live rebalance settings.
struct EngineConfig {
    TradingMode mode = TradingMode::PAPER;
    // Plan and journal the orders without executing them.
    bool dry_run = false;
    // Fresh capital added to the account cash for this rebalance.
    double additional_capital = 0.0;
    double transaction_cost_pct = 0.0;
    std::string journal_path = "logs/rebalance_journal.jsonl";
    // Account snapshot used by the file-backed broker account.
    std::string account_file = "config/account.json";

    // Throws ConfigError.
    void validate() const;
};

} // namespace engine
} // namespace rankfolio
