#include "core/state/RebalanceJournalJsonl.h"
#include "common/Logger.h"

#include <algorithm>
#include <fstream>

namespace rankfolio {
namespace core {

namespace {
std::uint64_t parseSeq(const nlohmann::json& line) {
    return line.value("seq", static_cast<std::uint64_t>(0));
}
}

RebalanceJournalJsonl::RebalanceJournalJsonl(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return;
    }

    std::string row;
    size_t line_no = 0;
    while (std::getline(in, row)) {
        ++line_no;
        if (row.empty()) {
            continue;
        }
        try {
            nlohmann::json line = nlohmann::json::parse(row);
            last_seq_ = (std::max)(last_seq_, parseSeq(line));
        } catch (const nlohmann::json::exception& e) {
            LOG_WARN("Skipping malformed journal line {} in {}: {}", line_no, file_path_.string(), e.what());
        }
    }
}

bool RebalanceJournalJsonl::append(const JournalEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (file_path_.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(file_path_.parent_path(), ec);
    }
    std::ofstream out(file_path_, std::ios::binary | std::ios::app);
    if (!out.is_open()) {
        LOG_ERROR("Journal open failed: {}", file_path_.string());
        return false;
    }

    const std::uint64_t next_seq = last_seq_ + 1;
    nlohmann::json line;
    line["seq"] = next_seq;
    line["ts_ms"] = event.ts_ms;
    line["type"] = toString(event.type);
    line["as_of"] = event.as_of;
    line["entity_id"] = event.entity_id;
    line["payload"] = event.payload;

    out << line.dump() << "\n";
    last_seq_ = next_seq;
    return true;
}

std::vector<JournalEvent> RebalanceJournalJsonl::readFrom(std::uint64_t seq_inclusive) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<JournalEvent> out;
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return out;
    }

    std::string row;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }

        nlohmann::json line;
        try {
            line = nlohmann::json::parse(row);
        } catch (const nlohmann::json::exception&) {
            continue;
        }

        const auto seq = parseSeq(line);
        if (seq < seq_inclusive) {
            continue;
        }

        JournalEvent event;
        event.seq = seq;
        event.ts_ms = line.value("ts_ms", 0LL);
        event.type = fromString(line.value("type", std::string("ORDER_UPDATED")));
        event.as_of = line.value("as_of", std::string());
        event.entity_id = line.value("entity_id", std::string());
        event.payload = line.value("payload", nlohmann::json::object());
        out.push_back(std::move(event));
    }

    return out;
}

std::uint64_t RebalanceJournalJsonl::lastSeq() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_seq_;
}

std::string RebalanceJournalJsonl::toString(JournalEventType type) {
    switch (type) {
        case JournalEventType::DECISION_MADE: return "DECISION_MADE";
        case JournalEventType::ORDER_SUBMITTED: return "ORDER_SUBMITTED";
        case JournalEventType::ORDER_UPDATED: return "ORDER_UPDATED";
        case JournalEventType::REBALANCE_COMPLETED: return "REBALANCE_COMPLETED";
    }
    return "ORDER_UPDATED";
}

JournalEventType RebalanceJournalJsonl::fromString(const std::string& value) {
    if (value == "DECISION_MADE") return JournalEventType::DECISION_MADE;
    if (value == "ORDER_SUBMITTED") return JournalEventType::ORDER_SUBMITTED;
    if (value == "ORDER_UPDATED") return JournalEventType::ORDER_UPDATED;
    if (value == "REBALANCE_COMPLETED") return JournalEventType::REBALANCE_COMPLETED;
    return JournalEventType::ORDER_UPDATED;
}

} // namespace core
} // namespace rankfolio
