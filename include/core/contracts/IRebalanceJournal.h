#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace rankfolio {
namespace core {

enum class JournalEventType {
    DECISION_MADE,
    ORDER_SUBMITTED,
    ORDER_UPDATED,
    REBALANCE_COMPLETED
};

struct JournalEvent {
    std::uint64_t seq = 0;
    long long ts_ms = 0;
    JournalEventType type = JournalEventType::ORDER_UPDATED;
    // Rebalance date (YYYY-MM-DD).
    std::string as_of;
    std::string entity_id;
    nlohmann::json payload;
};

class IRebalanceJournal {
public:
    virtual ~IRebalanceJournal() = default;

    virtual bool append(const JournalEvent& event) = 0;
    virtual std::vector<JournalEvent> readFrom(std::uint64_t seq_inclusive) = 0;
    virtual std::uint64_t lastSeq() const = 0;
};

} // namespace core
} // namespace rankfolio
