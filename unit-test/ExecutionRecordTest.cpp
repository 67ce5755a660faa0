#include <chrono>
#include <filesystem>
#include <fstream>
#include "common/exceptions.hpp"
#include "gtest/gtest.h"
#include "sandbox/history.hpp"
#include "sandbox/record.hpp"
#include "test/assertions.hpp"

using namespace std;
using namespace sandbox;
using namespace nlohmann;
namespace fs = std::filesystem;

static execution_request make_request(const string &caller, const string &code = "print(1)") {
    execution_request request;
    request.code = code;
    request.caller_id = caller;
    request.session_id = "session-1";
    return request;
}

TEST(ExecutionRecordTest, CreatePending) {
    auto record = execution_record::create(make_request("alice"), 5, 256);
    EXPECT_EQ(record.status, execution_status::PENDING);
    EXPECT_EQ(record.id.size(), 36u);
    EXPECT_EQ(record.caller_id, "alice");
    EXPECT_EQ(record.timeout_seconds, 5);
    EXPECT_EQ(record.memory_limit_mb, 256);
    EXPECT_FALSE(record.finished_at);
    EXPECT_FALSE(record.finished());

    auto other = execution_record::create(make_request("alice"), 5, 256);
    EXPECT_NE(record.id, other.id);
}

TEST(ExecutionRecordTest, LegalTransitions) {
    auto record = execution_record::create(make_request("alice"), 5, 256);
    record.transition_to(execution_status::RUNNING);
    EXPECT_FALSE(record.finished_at);
    record.transition_to(execution_status::COMPLETED);
    EXPECT_TRUE(record.finished());
    ASSERT_TRUE(record.finished_at);
    EXPECT_GE(*record.finished_at, record.created_at);

    auto rejected = execution_record::create(make_request("bob"), 5, 256);
    rejected.transition_to(execution_status::FAILED);
    EXPECT_TRUE(rejected.finished());
}

TEST(ExecutionRecordTest, IllegalTransitions) {
    auto record = execution_record::create(make_request("alice"), 5, 256);
    EXPECT_THROW(record.transition_to(execution_status::COMPLETED), internal_error);
    EXPECT_THROW(record.transition_to(execution_status::PENDING), internal_error);

    record.transition_to(execution_status::RUNNING);
    EXPECT_THROW(record.transition_to(execution_status::RUNNING), internal_error);
    record.transition_to(execution_status::FAILED);
    EXPECT_THROW(record.transition_to(execution_status::COMPLETED), internal_error);
    EXPECT_THROW(record.transition_to(execution_status::FAILED), internal_error);
    EXPECT_EQ(record.status, execution_status::FAILED);
}

TEST(ExecutionRecordTest, Timestamp) {
    timestamp time = chrono::system_clock::from_time_t(1704110400) + chrono::milliseconds(123);
    EXPECT_EQ(format_timestamp(time), "2024-01-01T12:00:00.123Z");
    EXPECT_EQ(parse_timestamp("2024-01-01T12:00:00.123Z"), time);
    EXPECT_THROW(parse_timestamp("yesterday"), invalid_argument);
}

TEST(ExecutionRecordTest, JsonRoundTrip) {
    auto record = execution_record::create(make_request("alice", "print('中文')"), 30, 512);
    record.transition_to(execution_status::RUNNING);
    record.output = "中文";
    record.execution_time_ms = 42;
    record.memory_peak_mb = 12.5;
    record.image_ids = {"a.png"};
    record.transition_to(execution_status::COMPLETED);

    json j = record;
    EXPECT_EQ(j["status"], "completed");
    EXPECT_EQ(j["language"], "python");
    EXPECT_EQ(j["session_id"], "session-1");
    EXPECT_EQ(j["error_kind"], "");

    // 时间戳只保留到毫秒
    execution_record parsed = j.get<execution_record>();
    EXPECT_JSON_EQ(json(parsed), j);
}

TEST(ExecutionRecordTest, OutcomeJson) {
    execution_outcome outcome;
    outcome.success = false;
    outcome.status = execution_status::FAILED;
    outcome.kind = error_kind::TIMEOUT_EXCEEDED;
    outcome.error = "Execution timeout after 1 seconds";
    outcome.execution_id = "id";

    json expected = {{"success", false},
                     {"status", "failed"},
                     {"output", ""},
                     {"error", "Execution timeout after 1 seconds"},
                     {"error_kind", "timeout_exceeded"},
                     {"execution_time_ms", 0},
                     {"cpu_time_ms", 0},
                     {"memory_peak_mb", 0.0},
                     {"images", json::array()},
                     {"execution_id", "id"},
                     {"image_ids", json::array()}};
    EXPECT_JSON_EQ(json(outcome), expected);
}

class HistoryTest : public ::testing::Test {
protected:
    fs::path dir = fs::temp_directory_path() / "sandbox-unit-test-history";

    void SetUp() override {
        fs::remove_all(dir);
    }

    void TearDown() override {
        fs::remove_all(dir);
    }
};

TEST_F(HistoryTest, RecentKeepsLatestState) {
    jsonl_history_sink history(dir / "history.jsonl");
    EXPECT_TRUE(history.recent("alice", 10).empty());

    auto first = execution_record::create(make_request("alice", "print(1)"), 5, 256);
    history.record(first);
    first.transition_to(execution_status::RUNNING);
    history.record(first);
    first.output = "1";
    first.transition_to(execution_status::COMPLETED);
    history.record(first);

    auto second = execution_record::create(make_request("alice", "print(2)"), 5, 256);
    second.created_at = first.created_at + chrono::seconds(1);
    history.record(second);

    auto other = execution_record::create(make_request("bob"), 5, 256);
    history.record(other);

    auto records = history.recent("alice", 10);
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].id, second.id);
    EXPECT_EQ(records[0].status, execution_status::PENDING);
    EXPECT_EQ(records[1].id, first.id);
    EXPECT_EQ(records[1].status, execution_status::COMPLETED);
    EXPECT_EQ(records[1].output, "1");

    EXPECT_EQ(history.recent("alice", 1).size(), 1u);
    EXPECT_EQ(history.recent("", 10).size(), 3u);
}

TEST_F(HistoryTest, InvalidUtf8Replaced) {
    jsonl_history_sink history(dir / "history.jsonl");
    auto record = execution_record::create(make_request("alice", "x = '\xff'\n"), 5, 256);
    record.transition_to(execution_status::FAILED);
    record.error_message = "bad \xc3";
    ASSERT_NO_THROW(history.record(record));

    auto records = history.recent("alice", 10);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].code, "x = '\xEF\xBF\xBD'\n");
    EXPECT_EQ(records[0].error_message, "bad \xEF\xBF\xBD");
    EXPECT_EQ(records[0].status, execution_status::FAILED);
}

TEST_F(HistoryTest, MalformedLinesSkipped) {
    jsonl_history_sink history(dir / "history.jsonl");
    auto record = execution_record::create(make_request("alice"), 5, 256);
    history.record(record);
    {
        ofstream fout(dir / "history.jsonl", ios::app);
        fout << "{not json\n"
             << "{\"id\": \"x\"}\n";
    }
    auto records = history.recent("alice", 10);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].id, record.id);
}
