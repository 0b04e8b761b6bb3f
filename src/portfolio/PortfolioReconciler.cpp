#include "portfolio/PortfolioReconciler.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include <algorithm>
#include <set>
#include <spdlog/fmt/fmt.h>

namespace rankfolio {
namespace portfolio {

void PortfolioRules::validate() const {
    if (top_n <= 0) {
        throw ConfigError("top_n must be positive, got " + std::to_string(top_n));
    }
    if (band < 0) {
        throw ConfigError("band must be >= 0, got " + std::to_string(band));
    }
    if (entry_jump_threshold < 0.0) {
        throw ConfigError("entry_jump_threshold must be >= 0");
    }
}

PortfolioReconciler::PortfolioReconciler(PortfolioRules rules)
    : rules_(std::move(rules))
{
    rules_.validate();
}

RebalanceDecision PortfolioReconciler::defensiveDecision(const Date& date, const Portfolio& current) const {
    RebalanceDecision decision;
    decision.date = date;
    decision.defensive = true;

    for (const auto& symbol : current.heldSymbols()) {
        if (symbol == rules_.cash_symbol) continue;
        decision.sells.push_back({symbol, 0, "defensive mode"});
    }

    if (!rules_.cash_symbol.empty()) {
        const bool held = current.holds(rules_.cash_symbol);
        if (held) {
            decision.holds.push_back(rules_.cash_symbol);
        }
        if (!held || !decision.sells.empty()) {
            BuyInstruction buy;
            buy.symbol = rules_.cash_symbol;
            buy.target_weight = 1.0;
            buy.top_up = held;
            buy.placeholder = true;
            decision.buys.push_back(buy);
        }
    }
    return decision;
}

RebalanceDecision PortfolioReconciler::reconcile(const Date& date,
                                                 const Portfolio& current,
                                                 const ranking::ScoringResult& ranking,
                                                 bool defensive) const {
    if (defensive) {
        return defensiveDecision(date, current);
    }

    RebalanceDecision decision;
    decision.date = date;
    decision.warnings = ranking.warnings;

    const int n = rules_.top_n;
    const double slot_weight = 1.0 / static_cast<double>(n);
    const int keep_limit = n + rules_.band;

    // 1. Retain or sell current holdings.
    std::set<std::string> retained;
    bool placeholder_held = false;
    for (const auto& symbol : current.heldSymbols()) {
        if (!rules_.cash_symbol.empty() && symbol == rules_.cash_symbol) {
            placeholder_held = true;
            continue;
        }
        const auto* ranked = ranking.find(symbol);
        if (!ranked) {
            decision.sells.push_back({symbol, 0, "not ranked"});
        } else if (ranked->rank > keep_limit) {
            decision.sells.push_back({symbol, ranked->rank,
                                      fmt::format("rank {} outside top {}", ranked->rank, keep_limit)});
        } else {
            retained.insert(symbol);
        }
    }

    // 2. New entries from the top N, limited to the free slots.
    const int free_slots = std::max(0, n - static_cast<int>(retained.size()));
    std::vector<const ranking::RankedSymbol*> candidates;
    for (const auto& r : ranking.ranked) {
        if (r.rank > n || static_cast<int>(candidates.size()) >= free_slots) break;
        if (r.symbol == rules_.cash_symbol || retained.count(r.symbol)) continue;
        candidates.push_back(&r);
    }

    std::vector<BuyInstruction> entries;
    for (const auto* r : candidates) {
        if (rules_.entry_jump_threshold > 0.0 && r->snapshot.daily_return &&
            *r->snapshot.daily_return > rules_.entry_jump_threshold) {
            std::string warning = fmt::format("Skipping {} on {}: daily jump {:.2f}%",
                                              r->symbol, date.toString(), *r->snapshot.daily_return * 100.0);
            LOG_WARN("{}", warning);
            decision.warnings.push_back(std::move(warning));
            continue;
        }
        BuyInstruction buy;
        buy.symbol = r->symbol;
        buy.target_weight = slot_weight;
        buy.rank = r->rank;
        entries.push_back(buy);
    }

    // 3. Cash-equivalent placeholder for slots left empty.
    const int unfilled = free_slots - static_cast<int>(entries.size());
    const double placeholder_weight = static_cast<double>(unfilled) * slot_weight;
    bool placeholder_buy = false;
    if (placeholder_held) {
        if (unfilled <= 0) {
            decision.sells.push_back({rules_.cash_symbol, 0, "placeholder not needed"});
        } else {
            decision.holds.push_back(rules_.cash_symbol);
        }
    } else if (!rules_.cash_symbol.empty() && unfilled > 0) {
        placeholder_buy = true;
    }

    for (const auto& symbol : retained) {
        decision.holds.push_back(symbol);
    }
    std::sort(decision.holds.begin(), decision.holds.end());

    // 4. Nothing changes: holds only.
    if (decision.sells.empty() && entries.empty() && !placeholder_buy) {
        return decision;
    }

    decision.buys = std::move(entries);
    for (const auto& symbol : retained) {
        BuyInstruction top_up;
        top_up.symbol = symbol;
        top_up.target_weight = slot_weight;
        top_up.top_up = true;
        const auto* ranked = ranking.find(symbol);
        top_up.rank = ranked ? ranked->rank : 0;
        decision.buys.push_back(top_up);
    }
    if (!rules_.cash_symbol.empty() && unfilled > 0) {
        BuyInstruction buy;
        buy.symbol = rules_.cash_symbol;
        buy.target_weight = placeholder_weight;
        buy.top_up = placeholder_held;
        buy.placeholder = true;
        decision.buys.push_back(buy);
    }

    LOG_INFO("Decision {}: {} sells, {} buys, {} holds",
             date.toString(), decision.sells.size(), decision.buys.size(), decision.holds.size());
    return decision;
}

} // namespace portfolio
} // namespace rankfolio
