#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

#include "data/IRestrictionListProvider.h"
#include "network/IHttpClient.h"

namespace rankfolio {
namespace data {

struct SurveillanceSourceConfig {
    // Local report files; when set they are used as-is for every date.
    std::string asm_file;
    std::string gsm_file;

    // Otherwise reports are fetched from the exchange and cached per date.
    bool fetch_online = false;
    std::string base_url = "https://www.nseindia.com";
    std::string cache_dir = "cache/filters";
};

// Exchange ASM (additional surveillance measure) and GSM (graded surveillance
// measure) reports turned into a RestrictionList. ASM long-term entries and
// every GSM entry become long-term restrictions; ASM short-term entries keep
// their stage.
class SurveillanceRestrictionProvider : public IRestrictionListProvider {
public:
    explicit SurveillanceRestrictionProvider(SurveillanceSourceConfig config,
                                             std::shared_ptr<network::IHttpClient> http = nullptr);

    RestrictionList getRestrictions(const Date& date) const override;

    static void parseAsmReport(const nlohmann::json& report, RestrictionList& out);
    static void parseGsmReport(const nlohmann::json& report, RestrictionList& out);

    // "Stage II" -> 2. Unknown text maps to stage 1.
    static int parseStage(const std::string& indicator);

private:
    nlohmann::json loadReport(const std::string& measure, const std::string& file, const Date& date) const;
    nlohmann::json fetchReport(const std::string& measure, const Date& date) const;

    SurveillanceSourceConfig config_;
    std::shared_ptr<network::IHttpClient> http_;

    mutable std::mutex mutex_;
    mutable std::map<Date, RestrictionList> cache_;
};

} // namespace data
} // namespace rankfolio
