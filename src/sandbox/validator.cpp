#include "sandbox/validator.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <fstream>
#include "common/exceptions.hpp"

namespace sandbox {
using namespace std;
using namespace nlohmann;

validator_config validator_config::defaults() {
    validator_config config;
    config.allowed_modules = {
        // 数据分析
        "pandas", "numpy", "matplotlib", "seaborn", "scipy", "sklearn", "statsmodels",
        // 标准库
        "math", "statistics", "json", "csv", "datetime", "time", "collections",
        "itertools", "functools", "operator", "random", "re", "string", "decimal",
        "fractions", "textwrap", "warnings", "typing", "dataclasses", "enum", "copy",
        "pprint", "calendar", "heapq", "bisect"};
    config.forbidden_builtins = {
        "exec", "eval", "compile", "open", "file", "input", "raw_input", "exit",
        "quit", "reload", "dir", "vars", "globals", "locals", "getattr", "setattr",
        "delattr", "hasattr", "callable", "breakpoint", "__import__"};
    // 排除 re.compile( 这类属性调用
    config.dangerous_patterns = {
        R"((^|[^\w.])__import__\s*\()",
        R"((^|[^\w.])getattr\s*\()",
        R"((^|[^\w.])setattr\s*\()",
        R"((^|[^\w.])exec\s*\()",
        R"((^|[^\w.])eval\s*\()",
        R"((^|[^\w.])compile\s*\()",
        R"((^|[^\w.])open\s*\()",
        R"((^|[^\w.])file\s*\()",
        R"((^|[^\w.])input\s*\()",
        R"((^|[^\w.])raw_input\s*\()",
        R"(__(subclasses|globals|builtins|code|bases|mro)__)"};
    return config;
}

void from_json(const json &j, validator_config &config) {
    config = validator_config::defaults();
    if (j.count("allowed_modules"))
        j.at("allowed_modules").get_to(config.allowed_modules);
    if (j.count("forbidden_builtins"))
        j.at("forbidden_builtins").get_to(config.forbidden_builtins);
    if (j.count("dangerous_patterns"))
        j.at("dangerous_patterns").get_to(config.dangerous_patterns);
}

void to_json(json &j, const validator_config &config) {
    j = {{"allowed_modules", config.allowed_modules},
         {"forbidden_builtins", config.forbidden_builtins},
         {"dangerous_patterns", config.dangerous_patterns}};
}

validator_config load_validator_config(const filesystem::path &path) {
    ifstream fin(path);
    if (!fin)
        throw runtime_error("Unable to open validator config " + path.string());
    return json::parse(fin).get<validator_config>();
}

void to_json(json &j, const validation_result &result) {
    j = {{"valid", result.valid},
         {"error", result.error}};
    if (!result.valid) j["error_kind"] = to_string(result.kind);
    if (result.repaired_code) j["repaired_code"] = *result.repaired_code;
}

code_validator::code_validator(const script_parser &parser, validator_config config)
    : parser(parser), configuration(move(config)), repairer(parser) {
    for (auto &pattern : configuration.dangerous_patterns)
        patterns.emplace_back(pattern, regex(pattern, regex::ECMAScript | regex::icase));
}

const validator_config &code_validator::config() const {
    return configuration;
}

validation_result code_validator::validate(const string &code, language lang) const {
    validation_result result;
    if (boost::algorithm::trim_copy(code).empty()) {
        result.kind = error_kind::INVALID_REQUEST;
        result.error = "No code provided";
        return result;
    }

    if (lang != language::PYTHON) {
        result.valid = true;
        return result;
    }

    string source = code;
    parse_result parsed = parser.parse(code);
    if (!parsed.ok) {
        string repaired = repairer.repair(code);
        parse_result reparsed;
        if (repaired != code) reparsed = parser.parse(repaired);

        if (!reparsed.ok) {
            result.kind = error_kind::SYNTAX_ERROR;
            result.error = parsed.error_line > 0
                               ? fmt::format("Invalid syntax: {} (line {})", parsed.error, parsed.error_line)
                               : fmt::format("Invalid syntax: {}", parsed.error);
            LOG(INFO) << "Validation rejected code: " << result.error;
            return result;
        }

        source = repaired;
        parsed = move(reparsed);
        result.repaired_code = repaired;
    }

    try {
        check_nodes(parsed.nodes);
        check_patterns(source);
    } catch (security_violation &ex) {
        result.kind = error_kind::SECURITY_VIOLATION;
        result.error = ex.what();
        LOG(WARNING) << "Validation rejected code: " << result.error;
        return result;
    }

    result.valid = true;
    return result;
}

void code_validator::check_nodes(const vector<syntax_node> &nodes) const {
    auto check_module = [this](const string &module, int line) {
        string top_level = module.substr(0, module.find('.'));
        if (!configuration.allowed_modules.count(top_level))
            throw security_violation(fmt::format("Forbidden import: {} (line {})", module, line));
    };

    for (auto &node : nodes) {
        switch (node.type) {
            case syntax_node::node_type::IMPORT:
                check_module(node.name, node.line);
                break;
            case syntax_node::node_type::IMPORT_FROM:
                // 单个脚本没有包结构，相对导入一律拒绝
                if (node.level > 0)
                    throw security_violation(fmt::format("Forbidden import: {}{} (line {})", string(node.level, '.'), node.name, node.line));
                check_module(node.name, node.line);
                break;
            case syntax_node::node_type::CALL:
                if (configuration.forbidden_builtins.count(node.name))
                    throw security_violation(fmt::format("Forbidden function call: {} (line {})", node.name, node.line));
                break;
            case syntax_node::node_type::NAME:
                // f = open; f(...) 这类间接调用
                if (configuration.forbidden_builtins.count(node.name))
                    throw security_violation(fmt::format("Forbidden function reference: {} (line {})", node.name, node.line));
                break;
            case syntax_node::node_type::ATTRIBUTE:
                // 白名单中的模块可能通过私有属性暴露其他模块，比如 random._os
                if (boost::algorithm::starts_with(node.name, "_"))
                    throw security_violation(fmt::format("Forbidden private attribute: {} (line {})", node.name, node.line));
                break;
        }
    }
}

void code_validator::check_patterns(const string &code) const {
    for (auto &[pattern, expression] : patterns) {
        if (regex_search(code, expression))
            throw security_violation("Dangerous pattern detected: " + pattern);
    }
}

}  // namespace sandbox
