#include "sandbox/repair.hpp"
#include <glog/logging.h>
#include <set>
#include "sandbox/source_lines.hpp"

namespace sandbox {
using namespace std;

static bool ends_with_newline(const string &code) {
    return !code.empty() && code.back() == '\n';
}

syntax_repairer::syntax_repairer(const script_parser &parser)
    : parser(parser) {}

string syntax_repairer::repair(const string &code) const {
    if (parser.parse(code).ok) return code;

    struct repair_pass {
        const char *name;
        string (*apply)(const string &);
    };
    static const repair_pass passes[] = {
        {"indentation", &syntax_repairer::normalize_indentation},
        {"string literal", &syntax_repairer::close_string_literals},
        {"basic syntax", &syntax_repairer::indent_block_bodies}};

    for (auto &pass : passes) {
        string repaired = pass.apply(code);
        if (repaired == code) continue;
        if (parser.parse(repaired).ok) {
            LOG(INFO) << "Syntax repaired by " << pass.name << " pass";
            return repaired;
        }
    }

    LOG(INFO) << "Unable to repair syntax";
    return code;
}

string syntax_repairer::normalize_indentation(const string &code) {
    static const set<string> continuation_keywords = {"else", "elif", "except", "finally"};

    struct frame {
        int width;
        int level;
    };

    scan_result scan = scan_lines(split_lines(code));
    vector<frame> frames = {{0, 0}};
    bool expect_indent = false;
    vector<string> output;

    for (auto &line : scan.lines) {
        if (line.in_string || line.continuation || line.blank) {
            output.push_back(line.text);
            continue;
        }

        int width = line.indent_width;
        if (expect_indent) {
            frame &top = frames.back();
            frames.push_back({width > top.width ? width : top.width + 1, top.level + 1});
            expect_indent = false;
        } else {
            bool popped = false;
            while (frames.size() > 1 && width < frames.back().width) {
                frames.pop_back();
                popped = true;
            }
            // else 写在了块内部的缩进上，回到块开始的那一级
            if (!popped && frames.size() > 1 && continuation_keywords.count(line.first_word))
                frames.pop_back();
        }

        output.push_back(string(frames.back().level * 4, ' ') + line.content);
        if (line.opens_block) expect_indent = true;
    }

    return join_lines(output, ends_with_newline(code));
}

string syntax_repairer::close_string_literals(const string &code) {
    scan_result scan = scan_lines(split_lines(code));
    vector<string> output;
    for (auto &line : scan.lines) {
        if (line.open_quote)
            output.push_back(line.text + line.open_quote);
        else
            output.push_back(line.text);
    }
    if (!scan.open_triple_quote.empty()) {
        if (output.empty()) output.emplace_back();
        output.back() += scan.open_triple_quote;
    }
    return join_lines(output, ends_with_newline(code));
}

string syntax_repairer::indent_block_bodies(const string &code) {
    scan_result scan = scan_lines(split_lines(code));
    auto &lines = scan.lines;
    vector<int> widths;
    vector<string> output;
    for (auto &line : lines) {
        widths.push_back(line.indent_width);
        output.push_back(line.text);
    }

    for (size_t i = 0; i < lines.size(); ++i) {
        if (!lines[i].opens_block || lines[i].in_string || lines[i].continuation) continue;
        size_t j = i + 1;
        while (j < lines.size() && lines[j].blank) ++j;
        if (j == lines.size() || lines[j].in_string || lines[j].continuation) continue;
        if (widths[j] > widths[i]) continue;

        widths[j] = widths[i] + 4;
        output[j] = string(widths[j], ' ') + lines[j].content;
    }

    return join_lines(output, ends_with_newline(code));
}

}  // namespace sandbox
