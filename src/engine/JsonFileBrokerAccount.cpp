#include "engine/IBrokerAccount.h"
#include "common/Logger.h"
#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace rankfolio {
namespace engine {

JsonFileBrokerAccount::JsonFileBrokerAccount(std::string file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        LOG_ERROR("Failed to open account file: {}", file_path);
        throw std::runtime_error("Failed to open account file: " + file_path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid account file " + file_path + ": " + e.what());
    }

    cash_ = j.value("cash", 0.0);
    if (j.contains("holdings")) {
        for (const auto& item : j["holdings"]) {
            Holding h;
            h.symbol = item.value("symbol", std::string());
            h.quantity = item.value("quantity", 0LL);
            h.avg_cost = item.value("avg_cost", 0.0);
            if (h.symbol.empty() || h.quantity <= 0) {
                LOG_WARN("Ignoring account holding without symbol or quantity in {}", file_path);
                continue;
            }
            holdings_[h.symbol] = h;
        }
    }

    LOG_INFO("Account snapshot {}: {} holdings, cash {:.2f}", file_path, holdings_.size(), cash_);
}

} // namespace engine
} // namespace rankfolio
