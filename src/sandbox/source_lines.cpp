#include "sandbox/source_lines.hpp"
#include <fmt/core.h>
#include <algorithm>
#include <cctype>

namespace sandbox {
using namespace std;

vector<string> split_lines(const string &code) {
    vector<string> lines;
    size_t start = 0;
    while (start <= code.size()) {
        size_t end = code.find('\n', start);
        if (end == string::npos) end = code.size();
        string line = code.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(move(line));
        start = end + 1;
    }
    // "a\n" 分割为 ["a", ""]，末尾的空行由 join_lines 的 trailing_newline 还原
    if (!lines.empty() && lines.back().empty() && !code.empty() && code.back() == '\n')
        lines.pop_back();
    return lines;
}

string join_lines(const vector<string> &lines, bool trailing_newline) {
    string code;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) code += '\n';
        code += lines[i];
    }
    if (trailing_newline && !lines.empty()) code += '\n';
    return code;
}

static bool is_identifier_start(char c) {
    return isalpha((unsigned char)c) || c == '_';
}

static bool is_identifier_char(char c) {
    return isalnum((unsigned char)c) || c == '_';
}

scan_result scan_lines(const vector<string> &lines) {
    scan_result result;
    string delim;  // 当前所在字符串的定界符，可能跨行
    int depth = 0;
    bool backslash = false;

    for (const string &text : lines) {
        line_info info;
        info.text = text;
        info.in_string = !delim.empty();
        info.continuation = !info.in_string && (depth > 0 || backslash);
        backslash = false;

        size_t start = 0;
        int width = 0;
        for (; start < text.size(); ++start) {
            if (text[start] == ' ')
                ++width;
            else if (text[start] == '\t')
                width = (width / 8 + 1) * 8;
            else if (text[start] == '\f')
                width = 0;
            else
                break;
        }
        info.indent_width = width;
        info.content = text.substr(start);

        if (!info.in_string) {
            info.blank = info.content.empty() || info.content[0] == '#';
            if (!info.content.empty() && is_identifier_start(info.content[0])) {
                size_t len = 1;
                while (len < info.content.size() && is_identifier_char(info.content[len])) ++len;
                info.first_word = info.content.substr(0, len);
            }
        }

        char last = 0;
        bool escaped_eol = false;
        size_t i = info.in_string ? 0 : start;
        while (i < text.size()) {
            char c = text[i];
            if (!delim.empty()) {
                if (c == '\\') {
                    if (i + 1 >= text.size()) escaped_eol = true;
                    i += 2;
                } else if (text.compare(i, delim.size(), delim) == 0) {
                    i += delim.size();
                    delim.clear();
                    last = c;
                } else {
                    ++i;
                }
                continue;
            }

            if (c == '#') break;
            if (c == '"' || c == '\'') {
                string triple(3, c);
                if (text.compare(i, 3, triple) == 0) {
                    delim = triple;
                    i += 3;
                } else {
                    delim = string(1, c);
                    ++i;
                }
                continue;
            }
            if (c == '\\' && i + 1 == text.size()) {
                backslash = true;
                break;
            }

            if (c == '(' || c == '[' || c == '{')
                ++depth;
            else if (c == ')' || c == ']' || c == '}')
                depth = max(0, depth - 1);
            if (!isspace((unsigned char)c)) last = c;
            ++i;
        }

        // 单引号字符串不能跨行，除非行尾有反斜杠
        if (delim.size() == 1 && !escaped_eol) {
            info.open_quote = delim[0];
            delim.clear();
        }

        info.opens_block = last == ':' && depth == 0 && delim.empty() && !info.open_quote && !backslash;
        result.lines.push_back(move(info));
    }

    if (delim.size() == 3) result.open_triple_quote = delim;
    return result;
}

string mask_literals(const string &text) {
    string masked = text;
    string delim;
    size_t i = 0;
    while (i < text.size()) {
        char c = text[i];
        if (!delim.empty()) {
            if (c == '\\' && i + 1 < text.size()) {
                masked[i] = ' ';
                if (text[i + 1] != '\n') masked[i + 1] = ' ';
                i += 2;
            } else if (c == '\n') {
                // 单引号字符串不能跨行
                if (delim.size() == 1) delim.clear();
                ++i;
            } else if (text.compare(i, delim.size(), delim) == 0) {
                fill_n(masked.begin() + i, delim.size(), ' ');
                i += delim.size();
                delim.clear();
            } else {
                masked[i++] = ' ';
            }
            continue;
        }

        if (c == '#') {
            while (i < text.size() && text[i] != '\n') masked[i++] = ' ';
        } else if (c == '"' || c == '\'') {
            string triple(3, c);
            delim = text.compare(i, 3, triple) == 0 ? triple : string(1, c);
            fill_n(masked.begin() + i, delim.size(), ' ');
            i += delim.size();
        } else {
            ++i;
        }
    }
    return masked;
}

string python_string_literal(const string &value) {
    string literal = "'";
    for (char c : value) {
        switch (c) {
            case '\\': literal += "\\\\"; break;
            case '\'': literal += "\\'"; break;
            case '\n': literal += "\\n"; break;
            case '\r': literal += "\\r"; break;
            case '\t': literal += "\\t"; break;
            default:
                if ((unsigned char)c < 0x20 || c == 0x7f)
                    literal += fmt::format("\\x{:02x}", (unsigned char)c);
                else
                    literal += c;
        }
    }
    literal += '\'';
    return literal;
}

}  // namespace sandbox
