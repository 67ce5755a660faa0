#include "sandbox/record.hpp"
#include <fmt/chrono.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <cstdio>
#include <ctime>
#include "common/exceptions.hpp"

namespace sandbox {
using namespace std;
using namespace nlohmann;

string format_timestamp(const timestamp &time) {
    auto millis = chrono::duration_cast<chrono::milliseconds>(time.time_since_epoch()).count() % 1000;
    time_t seconds = chrono::system_clock::to_time_t(time);
    tm utc;
    gmtime_r(&seconds, &utc);
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:03d}Z", utc, millis);
}

timestamp parse_timestamp(const string &text) {
    tm utc = {};
    int millis = 0;
    int n = sscanf(text.c_str(), "%d-%d-%dT%d:%d:%d.%dZ",
                   &utc.tm_year, &utc.tm_mon, &utc.tm_mday,
                   &utc.tm_hour, &utc.tm_min, &utc.tm_sec, &millis);
    if (n < 6)
        throw invalid_argument("Malformed timestamp " + text);
    utc.tm_year -= 1900;
    utc.tm_mon -= 1;
    return chrono::system_clock::from_time_t(timegm(&utc)) + chrono::milliseconds(millis);
}

execution_record execution_record::create(const execution_request &request, int timeout_seconds, int memory_limit_mb) {
    static thread_local boost::uuids::random_generator generator;

    execution_record record;
    record.id = boost::uuids::to_string(generator());
    record.caller_id = request.caller_id;
    record.session_id = request.session_id;
    record.lang = request.lang;
    record.code = request.code;
    record.status = execution_status::PENDING;
    record.timeout_seconds = timeout_seconds;
    record.memory_limit_mb = memory_limit_mb;
    record.created_at = chrono::system_clock::now();
    return record;
}

void execution_record::transition_to(execution_status next) {
    bool allowed = false;
    switch (status) {
        case execution_status::PENDING:
            allowed = next == execution_status::RUNNING || next == execution_status::FAILED;
            break;
        case execution_status::RUNNING:
            allowed = next == execution_status::COMPLETED || next == execution_status::FAILED;
            break;
        case execution_status::COMPLETED:
        case execution_status::FAILED:
            allowed = false;
            break;
    }
    if (!allowed)
        throw internal_error(fmt::format("Illegal transition of execution {} from {} to {}", id, to_string(status), to_string(next)));

    DLOG(INFO) << "Execution " << id << ": " << to_string(status) << " -> " << to_string(next);
    status = next;
    if (finished()) finished_at = chrono::system_clock::now();
}

bool execution_record::finished() const {
    return status == execution_status::COMPLETED || status == execution_status::FAILED;
}

void to_json(json &j, const execution_record &record) {
    j = {{"id", record.id},
         {"caller_id", record.caller_id},
         {"session_id", record.session_id ? json(*record.session_id) : json()},
         {"language", to_string(record.lang)},
         {"code", record.code},
         {"status", to_string(record.status)},
         {"output", record.output},
         {"error_message", record.error_message},
         {"error_kind", to_string(record.kind)},
         {"execution_time_ms", record.execution_time_ms},
         {"cpu_time_ms", record.cpu_time_ms},
         {"memory_peak_mb", record.memory_peak_mb},
         {"timeout_seconds", record.timeout_seconds},
         {"memory_limit_mb", record.memory_limit_mb},
         {"image_ids", record.image_ids},
         {"created_at", format_timestamp(record.created_at)},
         {"finished_at", record.finished_at ? json(format_timestamp(*record.finished_at)) : json()}};
}

void from_json(const json &j, execution_record &record) {
    j.at("id").get_to(record.id);
    j.at("caller_id").get_to(record.caller_id);
    if (j.count("session_id") && !j.at("session_id").is_null())
        record.session_id = j.at("session_id").get<string>();
    record.lang = parse_language(j.at("language").get<string>());
    j.at("code").get_to(record.code);
    record.status = parse_execution_status(j.at("status").get<string>());
    j.at("output").get_to(record.output);
    j.at("error_message").get_to(record.error_message);
    if (j.count("error_kind"))
        record.kind = parse_error_kind(j.at("error_kind").get<string>());
    j.at("execution_time_ms").get_to(record.execution_time_ms);
    j.at("cpu_time_ms").get_to(record.cpu_time_ms);
    j.at("memory_peak_mb").get_to(record.memory_peak_mb);
    j.at("timeout_seconds").get_to(record.timeout_seconds);
    j.at("memory_limit_mb").get_to(record.memory_limit_mb);
    if (j.count("image_ids"))
        j.at("image_ids").get_to(record.image_ids);
    record.created_at = parse_timestamp(j.at("created_at").get<string>());
    if (j.count("finished_at") && !j.at("finished_at").is_null())
        record.finished_at = parse_timestamp(j.at("finished_at").get<string>());
}

void to_json(json &j, const execution_outcome &outcome) {
    j = {{"success", outcome.success},
         {"status", to_string(outcome.status)},
         {"output", outcome.output},
         {"error", outcome.error},
         {"execution_time_ms", outcome.execution_time_ms},
         {"cpu_time_ms", outcome.cpu_time_ms},
         {"memory_peak_mb", outcome.memory_peak_mb},
         {"images", outcome.images},
         {"execution_id", outcome.execution_id},
         {"image_ids", outcome.image_ids}};
    if (outcome.kind != error_kind::NONE) j["error_kind"] = to_string(outcome.kind);
    if (outcome.repaired_code) j["repaired_code"] = *outcome.repaired_code;
}

}  // namespace sandbox
