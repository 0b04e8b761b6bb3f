#include "data/CsvPriceHistoryProvider.h"
#include "common/Logger.h"
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace rankfolio {
namespace data {

namespace {

std::string trim(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.erase(s.begin());
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.pop_back();
    }
    return s;
}

std::string normalizeCell(std::string s) {
    s = trim(std::move(s));

    // Strip UTF-8 BOM if present at first cell.
    if (s.size() >= 3 &&
        static_cast<unsigned char>(s[0]) == 0xEF &&
        static_cast<unsigned char>(s[1]) == 0xBB &&
        static_cast<unsigned char>(s[2]) == 0xBF) {
        s = s.substr(3);
    }

    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        s = s.substr(1, s.size() - 2);
    }
    return trim(std::move(s));
}

} // namespace

CsvPriceHistoryProvider::CsvPriceHistoryProvider(const std::string& file_path)
    : table_(loadCSV(file_path))
{
}

PriceTable CsvPriceHistoryProvider::getPrices(const std::vector<std::string>& symbols,
                                              const Date& start, const Date& end) const {
    return table_.slice(symbols, start, end);
}

PriceTable CsvPriceHistoryProvider::loadCSV(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        LOG_ERROR("Failed to open CSV file: {}", file_path);
        throw std::runtime_error("Failed to open price file: " + file_path);
    }

    PriceTable table;
    std::string line;
    size_t skipped = 0;

    while (std::getline(file, line)) {
        std::stringstream ss(line);
        std::string cell;
        std::vector<std::string> row;

        while (std::getline(ss, cell, ',')) {
            row.push_back(normalizeCell(cell));
        }

        if (row.size() < 3) continue;
        if (row[0].empty()) continue;
        if (!std::isdigit(static_cast<unsigned char>(row[0][0]))) {
            // Header or malformed row.
            continue;
        }

        try {
            Date date = Date::parse(row[0]);
            double close = std::stod(row[2]);
            double volume = (row.size() > 3 && !row[3].empty()) ? std::stod(row[3]) : 0.0;
            if (row[1].empty() || close <= 0.0) {
                ++skipped;
                continue;
            }
            table.addBar(date, row[1], close, volume);
        } catch (const std::exception& e) {
            ++skipped;
            LOG_WARN("Error parsing row: {} - {}", line, e.what());
        }
    }

    if (skipped > 0) {
        LOG_WARN("{} rows skipped in {}", skipped, file_path);
    }
    LOG_INFO("Loaded {} bars for {} symbols from {}", table.barCount(), table.symbols().size(), file_path);
    return table;
}

} // namespace data
} // namespace rankfolio
