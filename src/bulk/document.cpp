#include <cstdio>
#include <ctime>

#include "wiredive/bulk/document.hpp"
#include "wiredive/core/extractor/user_record.hpp"

#include "lcr/json.hpp"


namespace wiredive::bulk {

std::string iso8601_utc(std::chrono::system_clock::time_point tp) {
    using namespace std::chrono;

    const auto t = system_clock::to_time_t(tp);
    const auto us = duration_cast<microseconds>(tp.time_since_epoch()).count() % 1000000;

    std::tm tm{};
    gmtime_r(&t, &tm);

    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &tm);

    char buf[64];
    std::snprintf(buf, sizeof(buf), "%s.%06lld+00:00", date, static_cast<long long>(us < 0 ? us + 1000000 : us));
    return buf;
}

std::string make_document(const Target& target,
                          const core::pipeline::RunResult& run,
                          std::chrono::system_clock::time_point fetched_at)
{
    std::string out;
    out.reserve(4096);

    out += "{\"user_address\":";
    lcr::json::append_string(out, target.id);

    for (const auto& [column, value] : target.extras) {
        out += ',';
        lcr::json::append_string(out, column);
        out += ':';
        lcr::json::append(out, value);
    }

    out += ",\"fetched_at\":";
    lcr::json::append_string(out, iso8601_utc(fetched_at));
    out += ",\"frames_processed\":";
    lcr::json::append(out, static_cast<std::uint64_t>(run.frames_processed));
    out += ",\"complete\":";
    lcr::json::append(out, run.complete);

    core::extractor::append_fields(out, run.record);
    out += '}';
    return out;
}

} // namespace wiredive::bulk
