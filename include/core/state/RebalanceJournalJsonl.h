#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>

#include "core/contracts/IRebalanceJournal.h"

namespace rankfolio {
namespace core {

// Append-only JSON-lines journal. Sequence numbers continue across restarts.
class RebalanceJournalJsonl : public IRebalanceJournal {
public:
    explicit RebalanceJournalJsonl(std::filesystem::path file_path);

    bool append(const JournalEvent& event) override;
    std::vector<JournalEvent> readFrom(std::uint64_t seq_inclusive) override;
    std::uint64_t lastSeq() const override;

    static std::string toString(JournalEventType type);
    static JournalEventType fromString(const std::string& value);

private:
    std::filesystem::path file_path_;
    mutable std::mutex mutex_;
    std::uint64_t last_seq_ = 0;
};

} // namespace core
} // namespace rankfolio
