#include "engine/EngineConfig.h"
#include "common/Errors.h"
#include <algorithm>
#include <cctype>

namespace rankfolio {
namespace engine {

TradingMode parseTradingMode(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "live") return TradingMode::LIVE;
    if (lower == "paper") return TradingMode::PAPER;
    throw ConfigError("Unknown trading mode: " + text);
}

void EngineConfig::validate() const {
    if (additional_capital < 0.0) {
        throw ConfigError("additional_capital must be >= 0");
    }
    if (transaction_cost_pct < 0.0 || transaction_cost_pct >= 1.0) {
        throw ConfigError("transaction_cost_pct must be within [0, 1)");
    }
}

} // namespace engine
} // namespace rankfolio
