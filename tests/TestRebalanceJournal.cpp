#include "core/state/RebalanceJournalJsonl.h"

#include <filesystem>
#include <fstream>
#include <iostream>

using rankfolio::core::JournalEvent;
using rankfolio::core::JournalEventType;
using rankfolio::core::RebalanceJournalJsonl;

int main() {
    const auto path = std::filesystem::temp_directory_path() / "rankfolio_test" / "rebalance_journal.jsonl";
    std::error_code ec;
    std::filesystem::remove(path, ec);

    {
        RebalanceJournalJsonl journal(path);

        JournalEvent decision;
        decision.ts_ms = 1000;
        decision.type = JournalEventType::DECISION_MADE;
        decision.as_of = "2024-01-03";
        decision.entity_id = "decision-2024-01-03";
        decision.payload["sells"] = nlohmann::json::array({"OLD"});

        JournalEvent order;
        order.ts_ms = 2000;
        order.type = JournalEventType::ORDER_UPDATED;
        order.as_of = "2024-01-03";
        order.entity_id = "NEW";
        order.payload["filled_quantity"] = 12;

        if (!journal.append(decision) || !journal.append(order)) {
            std::cerr << "[TEST] append failed\n";
            return 1;
        }
        if (journal.lastSeq() != 2) {
            std::cerr << "[TEST] lastSeq should be 2, got " << journal.lastSeq() << "\n";
            return 1;
        }

        const auto rows = journal.readFrom(2);
        if (rows.size() != 1 || rows.front().entity_id != "NEW") {
            std::cerr << "[TEST] readFrom(2) should return the order update only\n";
            return 1;
        }
        if (rows.front().payload.value("filled_quantity", 0) != 12) {
            std::cerr << "[TEST] payload lost\n";
            return 1;
        }
    }

    {
        // A garbage line does not stop a reopened journal from continuing the sequence.
        std::ofstream(path, std::ios::app) << "not json\n";

        RebalanceJournalJsonl reopened(path);
        if (reopened.lastSeq() != 2) {
            std::cerr << "[TEST] reopened lastSeq should be 2, got " << reopened.lastSeq() << "\n";
            return 1;
        }

        JournalEvent done;
        done.type = JournalEventType::REBALANCE_COMPLETED;
        done.as_of = "2024-01-03";
        if (!reopened.append(done)) {
            std::cerr << "[TEST] append after reopen failed\n";
            return 1;
        }

        const auto rows = reopened.readFrom(1);
        if (rows.size() != 3 || rows.back().seq != 3 ||
            rows.back().type != JournalEventType::REBALANCE_COMPLETED ||
            rows.front().type != JournalEventType::DECISION_MADE) {
            std::cerr << "[TEST] unexpected rows after reopen\n";
            return 1;
        }
    }

    if (RebalanceJournalJsonl::fromString(RebalanceJournalJsonl::toString(JournalEventType::ORDER_SUBMITTED)) !=
        JournalEventType::ORDER_SUBMITTED) {
        std::cerr << "[TEST] event type names do not round-trip\n";
        return 1;
    }

    std::filesystem::remove_all(path.parent_path(), ec);
    std::cout << "[TEST] RebalanceJournal PASSED\n";
    return 0;
}
