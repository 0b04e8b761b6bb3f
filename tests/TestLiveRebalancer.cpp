#include "engine/LiveRebalancer.h"
#include "execution/PaperOrderExecutor.h"
#include "common/Errors.h"
#include "TestFixtures.h"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>

using namespace rankfolio;

namespace {
class FixedAccount : public engine::IBrokerAccount {
public:
    std::map<std::string, Holding> getHoldings() override { return holdings; }
    Amount getAvailableCash() override { return cash; }

    std::map<std::string, Holding> holdings;
    Amount cash = 0.0;
};

class MemoryJournal : public core::IRebalanceJournal {
public:
    bool append(const core::JournalEvent& event) override {
        events.push_back(event);
        events.back().seq = events.size();
        return true;
    }
    std::vector<core::JournalEvent> readFrom(std::uint64_t seq_inclusive) override {
        std::vector<core::JournalEvent> out;
        for (const auto& e : events) {
            if (e.seq >= seq_inclusive) out.push_back(e);
        }
        return out;
    }
    std::uint64_t lastSeq() const override { return events.size(); }

    std::vector<core::JournalEvent> events;
};

class BrokenExecutor : public execution::IOrderExecutor {
public:
    execution::OrderReport execute(const portfolio::PlannedOrder&) override {
        throw std::runtime_error("broker unavailable");
    }
};

engine::RebalancerSettings settings() {
    engine::RebalancerSettings s;
    s.universe = testing::momentumSymbols();
    s.rules.top_n = 3;
    s.rules.band = 1;
    return s;
}
}

int main() {
    const auto dates = testing::weekdays(Date::fromYmd(2022, 1, 3), 340);
    const Date as_of = Date::fromYmd(2023, 3, 1);
    auto prices = std::make_shared<data::InMemoryPriceHistoryProvider>(testing::momentumUniverse(dates));
    const ranking::WeightTriple weights(0.8, 0.1, 0.1);

    auto account = std::make_shared<FixedAccount>();
    account->cash = 50000.0;
    account->holdings["M1"] = Holding{"M1", 100, 90.0};

    {
        // Paper fills, sells before buys, everything journalled.
        auto journal = std::make_shared<MemoryJournal>();
        engine::LiveRebalancer rebalancer(settings(), weights, prices, nullptr, account,
                                          std::make_shared<execution::PaperOrderExecutor>(as_of.toString()),
                                          journal);
        auto result = rebalancer.rebalance(as_of);

        assert(result.ranking.scoring.ranked.size() == 6);
        assert(!result.plan.orders.empty());
        assert(result.reports.size() == result.plan.orders.size());
        for (const auto& r : result.reports) {
            assert(r.status == OrderStatus::FILLED);
        }
        bool seen_buy = false;
        for (const auto& o : result.plan.orders) {
            if (o.side == OrderSide::BUY) seen_buy = true;
            else assert(!seen_buy);
        }

        assert(journal->events.size() == 2 + 2 * result.reports.size());
        assert(journal->events.front().type == core::JournalEventType::DECISION_MADE);
        assert(journal->events.back().type == core::JournalEventType::REBALANCE_COMPLETED);
        assert(journal->events.front().as_of == "2023-03-01");
        assert(journal->events.front().payload.contains("orders"));
    }

    {
        // Dry run plans but sends nothing.
        auto s = settings();
        s.engine.dry_run = true;
        auto journal = std::make_shared<MemoryJournal>();
        engine::LiveRebalancer rebalancer(s, weights, prices, nullptr, account,
                                          std::make_shared<execution::PaperOrderExecutor>(), journal);
        auto result = rebalancer.rebalance(as_of);
        assert(!result.plan.orders.empty());
        assert(result.reports.empty());
        assert(journal->events.size() == 1);
    }

    {
        // Executor failures are recorded, not retried, and do not stop the run.
        auto journal = std::make_shared<MemoryJournal>();
        engine::LiveRebalancer rebalancer(settings(), weights, prices, nullptr, account,
                                          std::make_shared<BrokenExecutor>(), journal);
        auto result = rebalancer.rebalance(as_of);
        assert(result.reports.size() == result.plan.orders.size());
        for (const auto& r : result.reports) {
            assert(r.status == OrderStatus::FAILED);
            assert(r.message == "broker unavailable");
        }
        assert(journal->events.back().payload["not_filled"] == result.reports.size());
    }

    {
        // Additional capital is planned on top of the account cash.
        auto s = settings();
        s.engine.dry_run = true;
        auto empty = std::make_shared<FixedAccount>();
        engine::LiveRebalancer rebalancer(s, weights, prices, nullptr, empty,
                                          std::make_shared<execution::PaperOrderExecutor>());
        assert(rebalancer.rebalance(as_of).plan.orders.empty());

        s.engine.additional_capital = 30000.0;
        engine::LiveRebalancer funded(s, weights, prices, nullptr, empty,
                                      std::make_shared<execution::PaperOrderExecutor>());
        auto result = funded.rebalance(as_of);
        assert(result.plan.orders.size() == 3);
        assert(result.plan.projected_cash >= 0.0);
    }

    {
        // Ranking only, and a date before any data.
        engine::LiveRebalancer ranker(settings(), weights, prices, nullptr, nullptr, nullptr);
        auto snapshot = ranker.rank(as_of);
        assert(snapshot.universe.symbols.size() == 6);
        assert(snapshot.scoring.ranked.front().rank == 1);

        bool threw = false;
        try { ranker.rank(Date::fromYmd(2010, 1, 1)); } catch (const DataError&) { threw = true; }
        assert(threw);

        threw = false;
        try { ranker.rebalance(as_of); } catch (const ConfigError&) { threw = true; }
        assert(threw);
    }

    {
        // Account snapshot from a JSON file.
        const auto path = std::filesystem::temp_directory_path() / "rankfolio_account_test.json";
        std::ofstream(path) << R"({"cash": 1234.5, "holdings": [
            {"symbol": "M2", "quantity": 7, "avg_cost": 101.0},
            {"symbol": "", "quantity": 3}
        ]})";
        engine::JsonFileBrokerAccount file_account(path.string());
        assert(file_account.getAvailableCash() == 1234.5);
        assert(file_account.getHoldings().size() == 1);
        assert(file_account.getHoldings().at("M2").quantity == 7);
        std::error_code ec;
        std::filesystem::remove(path, ec);

        bool threw = false;
        try { engine::JsonFileBrokerAccount missing("/nonexistent/account.json"); } catch (const std::runtime_error&) { threw = true; }
        assert(threw);
    }

    std::cout << "[TEST] LiveRebalancer PASSED\n";
    return 0;
}
