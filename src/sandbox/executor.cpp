#include "sandbox/executor.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <algorithm>
#include "common/exceptions.hpp"
#include "config.hpp"

namespace sandbox {
using namespace std;
using namespace nlohmann;

void from_json(const json &j, named_code_block &block) {
    j.at("name").get_to(block.name);
    j.at("code").get_to(block.code);
}

void to_json(json &j, const batch_entry &entry) {
    j = {{"name", entry.name},
         {"outcome", entry.outcome}};
}

sandbox_executor::sandbox_executor(const code_validator &validator,
                                   const context_builder &builder,
                                   process_runner &runner,
                                   history_sink &history,
                                   image_store &images,
                                   bool inline_images)
    : validator(validator), builder(builder), runner(runner), history(history), images(images), inline_images(inline_images) {}

int sandbox_executor::clamp_timeout(int timeout_seconds) {
    return max(1, min(timeout_seconds, MAX_TIMEOUT));
}

int sandbox_executor::clamp_memory_limit(int memory_limit_mb) {
    return max(16, min(memory_limit_mb, MAX_MEMORY_LIMIT));
}

static execution_outcome failed_outcome(error_kind kind, const string &error) {
    execution_outcome outcome;
    outcome.success = false;
    outcome.status = execution_status::FAILED;
    outcome.kind = kind;
    outcome.error = error;
    return outcome;
}

static const char *language_display_name(language lang) {
    switch (lang) {
        case language::PYTHON:
            return "Python";
        case language::R:
            return "R";
        case language::JAVASCRIPT:
            return "JavaScript";
        case language::SQL:
            return "SQL";
    }
    return "Unknown";
}

void sandbox_executor::save(const execution_record &record) {
    try {
        history.record(record);
    } catch (exception &ex) {
        LOG(WARNING) << "Unable to record execution " << record.id << ": " << ex.what();
    }
}

execution_outcome sandbox_executor::reject(execution_record &record, error_kind kind, const string &error) {
    record.kind = kind;
    record.error_message = error;
    record.transition_to(execution_status::FAILED);
    save(record);

    LOG(INFO) << "Execution " << record.id << " rejected: " << error;
    execution_outcome outcome = failed_outcome(kind, error);
    outcome.execution_id = record.id;
    return outcome;
}

execution_outcome sandbox_executor::execute(const execution_request &request, const cancellation *cancel) {
    if (boost::algorithm::trim_copy(request.code).empty())
        return failed_outcome(error_kind::INVALID_REQUEST, "No code provided");

    execution_record record;
    try {
        record = execution_record::create(request, clamp_timeout(request.timeout_seconds), clamp_memory_limit(request.memory_limit_mb));
        LOG(INFO) << "Execution " << record.id << " created for caller " << record.caller_id
                  << " (" << to_string(record.lang) << ", " << record.timeout_seconds << "s, " << record.memory_limit_mb << "MB)";
        save(record);
        return run(record, request, cancel);
    } catch (exception &ex) {
        LOG(ERROR) << "Sandbox execution failed: " << ex.what();
        execution_outcome outcome = failed_outcome(error_kind::INTERNAL_ERROR, fmt::format("Sandbox execution failed: {}", ex.what()));
        outcome.execution_id = record.id;
        if (!record.id.empty() && !record.finished()) {
            record.kind = outcome.kind;
            record.error_message = outcome.error;
            try {
                record.transition_to(execution_status::FAILED);
                save(record);
            } catch (internal_error &inner) {
                LOG(ERROR) << inner;
            }
        }
        return outcome;
    }
}

execution_outcome sandbox_executor::run(execution_record &record, const execution_request &request, const cancellation *cancel) {
    switch (request.lang) {
        case language::PYTHON:
            break;
        case language::R:
        case language::JAVASCRIPT:
        case language::SQL:
            return reject(record, error_kind::UNSUPPORTED_LANGUAGE,
                          fmt::format("{} execution not implemented", language_display_name(request.lang)));
    }

    validation_result validation = validator.validate(request.code, request.lang);
    if (!validation.valid)
        return reject(record, validation.kind, validation.error);

    const string &code = validation.repaired_code ? *validation.repaired_code : request.code;
    string script = builder.build(code, request.session_id);
    if (DEBUG)
        LOG(INFO) << "Full script of execution " << record.id << ":\n" << script;

    // running 状态只在内存中，历史记录只保存创建和终止两次
    record.transition_to(execution_status::RUNNING);

    run_result result = runner.run(script, record.timeout_seconds, record.memory_limit_mb, cancel);
    capture_result captured = extract_images(result.stdout_text, inline_images);

    execution_outcome outcome;
    outcome.execution_id = record.id;
    outcome.repaired_code = validation.repaired_code;
    outcome.success = result.status == execution_status::COMPLETED;
    outcome.status = result.status;
    outcome.output = captured.output;
    // 执行成功时 stderr 中可能有警告信息，同样返回给调用方
    outcome.error = outcome.success ? result.stderr_text : result.error;
    outcome.kind = result.kind;
    outcome.execution_time_ms = result.wall_time_ms;
    outcome.cpu_time_ms = result.cpu_time_ms;
    outcome.memory_peak_mb = result.memory_peak_mb;

    for (auto &image : captured.images) {
        try {
            outcome.image_ids.push_back(images.store(image));
        } catch (exception &ex) {
            LOG(WARNING) << "Unable to store image " << image.name << " of execution " << record.id << ": " << ex.what();
        }
    }
    outcome.images = move(captured.images);

    record.output = outcome.output;
    record.error_message = outcome.error;
    record.kind = outcome.kind;
    record.execution_time_ms = outcome.execution_time_ms;
    record.cpu_time_ms = outcome.cpu_time_ms;
    record.memory_peak_mb = outcome.memory_peak_mb;
    record.image_ids = outcome.image_ids;
    record.transition_to(outcome.status);
    save(record);

    LOG(INFO) << "Execution " << record.id << " " << to_string(record.status)
              << (outcome.success ? "" : ": " + to_string(outcome.kind))
              << " in " << outcome.execution_time_ms << "ms with " << outcome.images.size() << " images";
    return outcome;
}

execution_outcome sandbox_executor::execute(const string &code,
                                            const string &language_name,
                                            int timeout_seconds,
                                            int memory_limit_mb,
                                            const string &caller_id,
                                            const optional<string> &session_id) {
    execution_request request;
    try {
        request.lang = parse_language(language_name);
    } catch (invalid_language &ex) {
        LOG(INFO) << ex.what();
        return failed_outcome(error_kind::UNSUPPORTED_LANGUAGE, ex.what());
    }
    request.code = code;
    request.timeout_seconds = timeout_seconds;
    request.memory_limit_mb = memory_limit_mb;
    request.caller_id = caller_id;
    request.session_id = session_id;
    return execute(request);
}

vector<batch_entry> sandbox_executor::execute_batch(const vector<named_code_block> &blocks, const execution_request &base) {
    vector<batch_entry> entries;
    for (auto &block : blocks) {
        execution_request request = base;
        request.code = block.code;
        LOG(INFO) << "Executing batch block " << block.name;
        entries.push_back({block.name, execute(request)});
    }
    return entries;
}

}  // namespace sandbox
