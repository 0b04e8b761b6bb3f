#include "data/SurveillanceRestrictionProvider.h"
#include "common/Logger.h"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace rankfolio {
namespace data {

namespace {

std::string trim(std::string s) {
    s.erase(0, s.find_first_not_of(" \t\r\n"));
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
    return s;
}

std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

nlohmann::json readJsonFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_ERROR("Failed to open surveillance report: {}", path);
        throw std::runtime_error("Failed to open surveillance report: " + path);
    }
    nlohmann::json j;
    file >> j;
    return j;
}

} // namespace

SurveillanceRestrictionProvider::SurveillanceRestrictionProvider(SurveillanceSourceConfig config,
                                                                 std::shared_ptr<network::IHttpClient> http)
    : config_(std::move(config))
    , http_(std::move(http))
{
    if (config_.fetch_online && !http_) {
        throw std::invalid_argument("Online surveillance fetch requires an HTTP client");
    }
}

RestrictionList SurveillanceRestrictionProvider::getRestrictions(const Date& date) const {
    std::lock_guard<std::mutex> lock(mutex_);

    // File reports carry no dates: one parse serves every date.
    const bool file_mode = !config_.fetch_online;
    const Date key = file_mode ? Date() : date;

    auto it = cache_.find(key);
    if (it != cache_.end()) {
        return it->second;
    }

    RestrictionList list;
    if (!config_.asm_file.empty() || config_.fetch_online) {
        parseAsmReport(loadReport("asm", config_.asm_file, date), list);
    }
    if (!config_.gsm_file.empty() || config_.fetch_online) {
        parseGsmReport(loadReport("gsm", config_.gsm_file, date), list);
    }

    LOG_INFO("Loaded {} surveillance entries{}", list.entries().size(),
             file_mode ? std::string() : " for " + date.toString());
    cache_.emplace(key, list);
    return list;
}

nlohmann::json SurveillanceRestrictionProvider::loadReport(const std::string& measure,
                                                           const std::string& file,
                                                           const Date& date) const {
    if (!config_.fetch_online) {
        return readJsonFile(file);
    }

    std::filesystem::path cache_path =
        std::filesystem::path(config_.cache_dir) / (measure + "-" + date.toString() + ".json");
    std::error_code ec;
    if (std::filesystem::exists(cache_path, ec)) {
        LOG_DEBUG("Using cached {} report {}", measure, cache_path.string());
        return readJsonFile(cache_path.string());
    }

    nlohmann::json report = fetchReport(measure, date);

    std::filesystem::create_directories(cache_path.parent_path(), ec);
    std::ofstream out(cache_path);
    if (out.is_open()) {
        out << report.dump(2);
    } else {
        LOG_WARN("Could not write surveillance cache {}", cache_path.string());
    }
    return report;
}

nlohmann::json SurveillanceRestrictionProvider::fetchReport(const std::string& measure, const Date& date) const {
    const std::string page = config_.base_url + "/reports/" + measure;
    std::map<std::string, std::string> headers = {
        {"Referer", page},
        {"Accept", "application/json"},
    };

    // The landing page sets the session cookies the API insists on.
    auto landing = http_->get(page, {}, headers);
    if (!landing.isSuccess()) {
        LOG_WARN("Surveillance landing page returned HTTP {}", landing.status_code);
    }

    auto response = http_->get(config_.base_url + "/api/report" + upper(measure), {{"json", "true"}}, headers);
    if (!response.isSuccess()) {
        LOG_ERROR("Fetching {} report for {} failed with status {}", measure, date.toString(), response.status_code);
        throw std::runtime_error("Failed to fetch " + measure + " report: HTTP " +
                                 std::to_string(response.status_code));
    }
    try {
        return response.json();
    } catch (const nlohmann::json::parse_error& e) {
        LOG_ERROR("{} report for {} is not JSON: {}", measure, date.toString(), e.what());
        throw std::runtime_error("Invalid " + measure + " report: " + e.what());
    }
}

int SurveillanceRestrictionProvider::parseStage(const std::string& indicator) {
    std::string text = upper(trim(indicator));
    const std::string prefix = "STAGE";
    if (text.compare(0, prefix.size(), prefix) == 0) {
        text = trim(text.substr(prefix.size()));
    }

    if (!text.empty() && std::isdigit(static_cast<unsigned char>(text[0]))) {
        return std::stoi(text);
    }

    static const std::map<std::string, int> kRoman = {
        {"I", 1}, {"II", 2}, {"III", 3}, {"IV", 4}, {"V", 5}, {"VI", 6}
    };
    auto it = kRoman.find(text);
    return it == kRoman.end() ? 1 : it->second;
}

void SurveillanceRestrictionProvider::parseAsmReport(const nlohmann::json& report, RestrictionList& out) {
    auto section = [&](const char* name) -> const nlohmann::json* {
        if (!report.contains(name)) return nullptr;
        const auto& node = report.at(name);
        if (node.is_object() && node.contains("data") && node.at("data").is_array()) {
            return &node.at("data");
        }
        return node.is_array() ? &node : nullptr;
    };

    if (const auto* longterm = section("longterm")) {
        for (const auto& entry : *longterm) {
            if (!entry.contains("symbol")) continue;
            Restriction r;
            r.symbol = trim(entry.at("symbol").get<std::string>());
            r.kind = RestrictionKind::LONG_TERM;
            r.stage = parseStage(entry.value("asmSurvIndicator", ""));
            out.add(std::move(r));
        }
    }

    if (const auto* shortterm = section("shortterm")) {
        for (const auto& entry : *shortterm) {
            if (!entry.contains("symbol")) continue;
            Restriction r;
            r.symbol = trim(entry.at("symbol").get<std::string>());
            r.kind = RestrictionKind::SHORT_TERM;
            r.stage = parseStage(entry.value("asmSurvIndicator", ""));
            out.add(std::move(r));
        }
    }
}

void SurveillanceRestrictionProvider::parseGsmReport(const nlohmann::json& report, RestrictionList& out) {
    const nlohmann::json* items = &report;
    if (report.is_object() && report.contains("data")) {
        items = &report.at("data");
    }
    if (!items->is_array()) {
        LOG_WARN("GSM report has no entry list");
        return;
    }

    for (const auto& entry : *items) {
        if (!entry.is_object() || !entry.contains("symbol")) continue;
        Restriction r;
        r.symbol = trim(entry.at("symbol").get<std::string>());
        r.kind = RestrictionKind::LONG_TERM;
        out.add(std::move(r));
    }
}

} // namespace data
} // namespace rankfolio
