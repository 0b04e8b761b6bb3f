#include "data/SurveillanceRestrictionProvider.h"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

using namespace rankfolio;
using data::RestrictionKind;
using data::SurveillanceRestrictionProvider;
using data::SurveillanceSourceConfig;

namespace {
const char* kAsmReport = R"({
    "longterm": {"data": [{"symbol": "AAA", "asmSurvIndicator": "Stage IV"}]},
    "shortterm": {"data": [
        {"symbol": "BBB", "asmSurvIndicator": "Stage I"},
        {"symbol": " CCC ", "asmSurvIndicator": "Stage II"}
    ]}
})";

const char* kGsmReport = R"({"data": [{"symbol": "DDD", "gsmStage": "Stage 0"}, {"name": "no symbol"}]})";

// Serves the exchange endpoints from memory and counts API calls.
class FakeHttpClient : public network::IHttpClient {
public:
    network::HttpResponse get(const std::string& url,
                              const std::map<std::string, std::string>&,
                              const std::map<std::string, std::string>&) override {
        network::HttpResponse response;
        response.status_code = status;
        if (url.find("/api/reportASM") != std::string::npos) {
            ++api_calls;
            response.body = kAsmReport;
        } else if (url.find("/api/reportGSM") != std::string::npos) {
            ++api_calls;
            response.body = kGsmReport;
        }
        return response;
    }

    int status = 200;
    int api_calls = 0;
};
}

int main() {
    {
        assert(SurveillanceRestrictionProvider::parseStage("Stage II") == 2);
        assert(SurveillanceRestrictionProvider::parseStage(" stage iii ") == 3);
        assert(SurveillanceRestrictionProvider::parseStage("4") == 4);
        assert(SurveillanceRestrictionProvider::parseStage("") == 1);
        assert(SurveillanceRestrictionProvider::parseStage("unknown") == 1);
    }

    const Date date = Date::fromYmd(2024, 1, 3);

    {
        data::RestrictionList list;
        SurveillanceRestrictionProvider::parseAsmReport(nlohmann::json::parse(kAsmReport), list);
        SurveillanceRestrictionProvider::parseGsmReport(nlohmann::json::parse(kGsmReport), list);
        assert(list.entries().size() == 4);
        assert(list.isLongTermRestricted("AAA", date));
        assert(list.isLongTermRestricted("DDD", date));
        assert(*list.shortTermStage("BBB", date) == 1);
        assert(*list.shortTermStage("CCC", date) == 2);

        const auto restricted = list.restrictedSymbols(date);
        assert(restricted.count("AAA") && restricted.count("CCC") && restricted.count("DDD"));
        assert(!restricted.count("BBB"));

        // A bare array is accepted for GSM too.
        data::RestrictionList bare;
        SurveillanceRestrictionProvider::parseGsmReport(nlohmann::json::parse(R"([{"symbol": "EEE"}])"), bare);
        assert(bare.isLongTermRestricted("EEE", date));
    }

    const auto dir = std::filesystem::temp_directory_path() / "rankfolio_surveillance_test";
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    std::filesystem::create_directories(dir);

    {
        // Local report files.
        std::ofstream(dir / "asm.json") << kAsmReport;
        SurveillanceSourceConfig source;
        source.asm_file = (dir / "asm.json").string();
        SurveillanceRestrictionProvider provider(source);
        assert(provider.restrictedSymbols(date).size() == 2);
        assert(provider.getRestrictions(date.addDays(30)).entries().size() == 3);

        source.asm_file = (dir / "missing.json").string();
        SurveillanceRestrictionProvider missing(source);
        bool threw = false;
        try { missing.getRestrictions(date); } catch (const std::runtime_error&) { threw = true; }
        assert(threw);

        // Nothing configured: no restrictions.
        SurveillanceRestrictionProvider none{SurveillanceSourceConfig{}};
        assert(none.getRestrictions(date).empty());
    }

    {
        // Online: fetched once per date, then served from the disk cache.
        SurveillanceSourceConfig source;
        source.fetch_online = true;
        source.cache_dir = (dir / "cache").string();

        auto http = std::make_shared<FakeHttpClient>();
        SurveillanceRestrictionProvider provider(source, http);
        assert(provider.restrictedSymbols(date).size() == 3);
        assert(http->api_calls == 2);
        provider.getRestrictions(date);
        assert(http->api_calls == 2);
        assert(std::filesystem::exists(dir / "cache" / "asm-2024-01-03.json"));

        auto second_http = std::make_shared<FakeHttpClient>();
        SurveillanceRestrictionProvider reloaded(source, second_http);
        assert(reloaded.restrictedSymbols(date).size() == 3);
        assert(second_http->api_calls == 0);

        auto failing = std::make_shared<FakeHttpClient>();
        failing->status = 503;
        SurveillanceRestrictionProvider down(source, failing);
        bool threw = false;
        try { down.getRestrictions(date.addDays(1)); } catch (const std::runtime_error&) { threw = true; }
        assert(threw);

        threw = false;
        try { SurveillanceRestrictionProvider no_client(source); } catch (const std::invalid_argument&) { threw = true; }
        assert(threw);
    }

    std::filesystem::remove_all(dir, ec);
    std::cout << "[TEST] SurveillanceRestrictions PASSED\n";
    return 0;
}
