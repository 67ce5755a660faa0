#include "sandbox/context.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <regex>
#include "sandbox/capture.hpp"
#include "sandbox/source_lines.hpp"

namespace sandbox {
using namespace std;

// 前置代码中的名字都以 _sandbox_ 开头，避免与用户代码冲突
static const char preamble_template[] = R"PY(try:
    import matplotlib as _sandbox_mpl
    _sandbox_mpl.use("Agg")
    import matplotlib.pyplot as _sandbox_plt
    import matplotlib.figure as _sandbox_figure
    import base64 as _sandbox_base64
    import io as _sandbox_io
    import struct as _sandbox_struct

    _sandbox_emitted = set()
    _sandbox_original_savefig = _sandbox_figure.Figure.savefig

    def _sandbox_emit_figure(fig):
        buffer = _sandbox_io.BytesIO()
        _sandbox_original_savefig(fig, buffer, format="png", dpi=100, bbox_inches="tight")
        data = buffer.getvalue()
        width, height = _sandbox_struct.unpack(">II", data[16:24])
        payload = _sandbox_base64.b64encode(data).decode("ascii")
        print("\n%s[%dx%d]data:image/png;base64,%s" % ("{marker}", width, height, payload), flush=True)
        _sandbox_emitted.add(id(fig))

    def _sandbox_show(*args, **kwargs):
        for num in _sandbox_plt.get_fignums():
            fig = _sandbox_plt.figure(num)
            if id(fig) not in _sandbox_emitted:
                _sandbox_emit_figure(fig)
        _sandbox_plt.close("all")
        _sandbox_emitted.clear()

    def _sandbox_figure_savefig(self, *args, **kwargs):
        _sandbox_emit_figure(self)

    def _sandbox_pyplot_savefig(*args, **kwargs):
        _sandbox_emit_figure(_sandbox_plt.gcf())

    _sandbox_plt.show = _sandbox_show
    _sandbox_plt.savefig = _sandbox_pyplot_savefig
    _sandbox_figure.Figure.savefig = _sandbox_figure_savefig

    import atexit as _sandbox_atexit
    _sandbox_atexit.register(_sandbox_show)
except ImportError:
    pass
)PY";

static const char dataset_template[] = R"PY(try:
    import pandas as _sandbox_pd
    df = _sandbox_pd.{reader}({path})
    print(f"Dataset loaded: {{df.shape[0]}} rows, {{df.shape[1]}} columns")
except Exception as _sandbox_error:
    import sys as _sandbox_sys
    print(f"Unable to load dataset: {{_sandbox_error}}", file=_sandbox_sys.stderr)
)PY";

context_builder::context_builder(const dataset_loader &loader)
    : loader(loader) {}

string context_builder::preamble() {
    // 模板中没有其他花括号，可以直接替换
    string text = preamble_template;
    static const string placeholder = "{marker}";
    text.replace(text.find(placeholder), placeholder.size(), IMAGE_MARKER);
    return text;
}

string context_builder::dataset_code(const tabular_dataset &dataset) {
    string reader;
    if (dataset.format == "parquet")
        reader = "read_parquet";
    else if (dataset.format == "json")
        reader = "read_json";
    else if (dataset.format == "xlsx")
        reader = "read_excel";
    else
        reader = "read_csv";
    return fmt::format(fmt::runtime(dataset_template),
                       fmt::arg("reader", reader),
                       fmt::arg("path", python_string_literal(dataset.path.string())));
}

static const regex file_read(R"(\b(pd|pandas|np|numpy)\s*\.\s*(read_\w+|loadtxt|genfromtxt|load|fromfile)\s*\()");

/**
 * @brief 查找语句中直接读取文件的调用，忽略字符串和注释中的内容
 * @return 每个调用表达式在 statement 中的 [begin, end) 区间，按位置排序且互不重叠
 */
static vector<pair<size_t, size_t>> find_file_reads(const string &statement) {
    string masked = mask_literals(statement);
    vector<pair<size_t, size_t>> calls;
    for (sregex_iterator it(masked.begin(), masked.end(), file_read), end; it != end; ++it) {
        size_t begin = it->position(0);
        if (!calls.empty() && begin < calls.back().second) continue;  // 位于上一个调用的参数中
        if (begin > 0 && masked[begin - 1] == '.') continue;          // obj.pd.read_csv
        size_t pos = begin + it->length(0);
        for (int depth = 1; pos < masked.size() && depth > 0; ++pos) {
            if (masked[pos] == '(')
                ++depth;
            else if (masked[pos] == ')')
                --depth;
        }
        calls.emplace_back(begin, pos);
    }
    return calls;
}

string context_builder::rewrite_file_reads(const string &code, bool has_dataset) {
    scan_result scan = scan_lines(split_lines(code));
    auto &lines = scan.lines;
    const string placeholder = has_dataset ? "df" : "None";
    vector<string> output;
    bool rewritten = false;

    for (size_t i = 0; i < lines.size(); ++i) {
        // 一条逻辑行包括括号内的续行和跨行的三引号字符串
        size_t last = i;
        while (last + 1 < lines.size() && (lines[last + 1].continuation || lines[last + 1].in_string))
            ++last;

        string statement = lines[i].text;
        for (size_t k = i + 1; k <= last; ++k)
            statement += '\n' + lines[k].text;

        auto calls = find_file_reads(statement);
        if (calls.empty()) {
            for (size_t k = i; k <= last; ++k)
                output.push_back(lines[k].text);
            i = last;
            continue;
        }

        const line_info &line = lines[i];
        string indent = line.text.substr(0, line.text.size() - line.content.size());
        output.push_back(indent + "# File access is disabled in the sandbox: " + line.content);
        for (size_t k = i + 1; k <= last; ++k)
            output.push_back(indent + "# " + lines[k].content);

        if (lines[last].opens_block && (line.first_word == "with" || line.first_word == "for")) {
            output.push_back(indent + "if False:");
        } else {
            for (auto it = calls.rbegin(); it != calls.rend(); ++it)
                statement.replace(it->first, it->second - it->first, placeholder);
            for (string &text : split_lines(statement))
                output.push_back(move(text));
        }
        rewritten = true;
        i = last;
    }

    if (rewritten)
        LOG(INFO) << "Rewrote direct file reads in user code";
    return join_lines(output, !code.empty() && code.back() == '\n');
}

string context_builder::build(const string &code, const optional<string> &session_id) const {
    string script = preamble();

    bool has_dataset = false;
    if (session_id) {
        if (auto dataset = loader.load(*session_id)) {
            script += dataset_code(*dataset);
            has_dataset = true;
        }
    }

    script += rewrite_file_reads(code, has_dataset);
    if (script.back() != '\n') script += '\n';
    return script;
}

}  // namespace sandbox
