#include "common/status.hpp"
#include <boost/assign.hpp>
#include <stdexcept>
#include <unordered_map>

namespace sandbox {
using namespace std;

// clang-format off
static const unordered_map<execution_status, const char *> status_string = boost::assign::map_list_of
    (execution_status::PENDING, "Pending")
    (execution_status::RUNNING, "Running")
    (execution_status::COMPLETED, "Completed")
    (execution_status::FAILED, "Failed");

static const unordered_map<execution_status, const char *> status_name = boost::assign::map_list_of
    (execution_status::PENDING, "pending")
    (execution_status::RUNNING, "running")
    (execution_status::COMPLETED, "completed")
    (execution_status::FAILED, "failed");

static const unordered_map<error_kind, const char *> error_kind_string = boost::assign::map_list_of
    (error_kind::NONE, "None")
    (error_kind::INVALID_REQUEST, "Invalid Request")
    (error_kind::SYNTAX_ERROR, "Syntax Error")
    (error_kind::SECURITY_VIOLATION, "Security Violation")
    (error_kind::TIMEOUT_EXCEEDED, "Timeout Exceeded")
    (error_kind::MEMORY_LIMIT_EXCEEDED, "Memory Limit Exceeded")
    (error_kind::OUTPUT_SIZE_EXCEEDED, "Output Size Exceeded")
    (error_kind::RUNTIME_ERROR, "Runtime Error")
    (error_kind::PROCESS_SPAWN_FAILURE, "Process Spawn Failure")
    (error_kind::UNSUPPORTED_LANGUAGE, "Unsupported Language")
    (error_kind::CANCELLED, "Cancelled")
    (error_kind::INTERNAL_ERROR, "Internal Error");

static const unordered_map<error_kind, const char *> error_kind_name = boost::assign::map_list_of
    (error_kind::NONE, "")
    (error_kind::INVALID_REQUEST, "invalid_request")
    (error_kind::SYNTAX_ERROR, "syntax_error")
    (error_kind::SECURITY_VIOLATION, "security_violation")
    (error_kind::TIMEOUT_EXCEEDED, "timeout_exceeded")
    (error_kind::MEMORY_LIMIT_EXCEEDED, "memory_limit_exceeded")
    (error_kind::OUTPUT_SIZE_EXCEEDED, "output_size_exceeded")
    (error_kind::RUNTIME_ERROR, "runtime_error")
    (error_kind::PROCESS_SPAWN_FAILURE, "process_spawn_failure")
    (error_kind::UNSUPPORTED_LANGUAGE, "unsupported_language")
    (error_kind::CANCELLED, "cancelled")
    (error_kind::INTERNAL_ERROR, "internal_error");
// clang-format on

const char *get_display_message(execution_status status) {
    return status_string.at(status);
}

const char *get_display_message(error_kind kind) {
    return error_kind_string.at(kind);
}

string to_string(execution_status status) {
    return status_name.at(status);
}

execution_status parse_execution_status(const string &name) {
    for (auto &[status, status_text] : status_name)
        if (name == status_text) return status;
    throw invalid_argument("Unrecognized execution status " + name);
}

string to_string(error_kind kind) {
    return error_kind_name.at(kind);
}

error_kind parse_error_kind(const string &name) {
    for (auto &[kind, kind_text] : error_kind_name)
        if (name == kind_text) return kind;
    throw invalid_argument("Unrecognized error kind " + name);
}

}  // namespace sandbox
