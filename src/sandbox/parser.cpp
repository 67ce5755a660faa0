#include "sandbox/parser.hpp"
#include <fmt/core.h>
#include <boost/python.hpp>
#include "common/exceptions.hpp"
#include "common/python.hpp"

namespace sandbox {
using namespace std;
namespace bp = boost::python;

script_parser::~script_parser() = default;

/**
 * @brief 取出当前的 Python 异常并清除异常状态
 * @param line 如果异常带有行号（SyntaxError），写入行号
 * @return 异常信息，SyntaxError 只返回 msg 部分
 */
static string fetch_python_error(int &line) {
    PyObject *type, *value, *traceback;
    PyErr_Fetch(&type, &value, &traceback);
    PyErr_NormalizeException(&type, &value, &traceback);
    bp::handle<> htype(bp::allow_null(type)), hvalue(bp::allow_null(value)), htraceback(bp::allow_null(traceback));
    line = 0;
    if (!hvalue) return "unknown parser error";

    bp::object exc(hvalue);
    if (PyErr_GivenExceptionMatches(htype.get(), PyExc_SyntaxError)) {
        bp::object lineno = exc.attr("lineno");
        if (!lineno.is_none()) line = bp::extract<int>(lineno)();
        bp::object msg = exc.attr("msg");
        if (!msg.is_none()) return bp::extract<string>(bp::str(msg))();
    }
    return bp::extract<string>(bp::str(exc))();
}

static bool is_instance(const bp::object &node, const bp::object &type) {
    return PyObject_IsInstance(node.ptr(), type.ptr()) == 1;
}

/**
 * @brief 计算被调用的表达式的名字
 * Name 返回标识符，Attribute 返回带前缀的名字，其他表达式返回空字符串
 */
static string callee_name(const bp::object &func, const bp::object &name_type, const bp::object &attribute_type) {
    if (is_instance(func, name_type))
        return bp::extract<string>(func.attr("id"))();
    if (is_instance(func, attribute_type)) {
        string base = callee_name(func.attr("value"), name_type, attribute_type);
        if (base.empty()) return "";
        return base + "." + bp::extract<string>(func.attr("attr"))();
    }
    return "";
}

parse_result python_ast_parser::parse(const string &code) const {
    GIL_guard guard;
    parse_result result;

    bp::object ast, tree;
    try {
        ast = bp::import("ast");
        tree = ast.attr("parse")(code, "<sandbox>", "exec");
    } catch (bp::error_already_set &) {
        result.ok = false;
        result.error = fetch_python_error(result.error_line);
        return result;
    }

    try {
        bp::object import_type = ast.attr("Import");
        bp::object import_from_type = ast.attr("ImportFrom");
        bp::object call_type = ast.attr("Call");
        bp::object name_type = ast.attr("Name");
        bp::object attribute_type = ast.attr("Attribute");
        bp::object load_type = ast.attr("Load");

        bp::object walker = ast.attr("walk")(tree);
        for (bp::stl_input_iterator<bp::object> it(walker), end; it != end; ++it) {
            bp::object node = *it;
            if (is_instance(node, import_type)) {
                int line = bp::extract<int>(node.attr("lineno"))();
                bp::object names = node.attr("names");
                for (bp::stl_input_iterator<bp::object> alias(names), alias_end; alias != alias_end; ++alias) {
                    syntax_node item;
                    item.type = syntax_node::node_type::IMPORT;
                    item.name = bp::extract<string>((*alias).attr("name"))();
                    item.line = line;
                    result.nodes.push_back(item);
                }
            } else if (is_instance(node, import_from_type)) {
                syntax_node item;
                item.type = syntax_node::node_type::IMPORT_FROM;
                bp::object module = node.attr("module");
                if (!module.is_none()) item.name = bp::extract<string>(module)();
                item.line = bp::extract<int>(node.attr("lineno"))();
                item.level = bp::extract<int>(node.attr("level"))();
                result.nodes.push_back(item);
            } else if (is_instance(node, call_type)) {
                syntax_node item;
                item.type = syntax_node::node_type::CALL;
                item.name = callee_name(node.attr("func"), name_type, attribute_type);
                item.line = bp::extract<int>(node.attr("lineno"))();
                result.nodes.push_back(item);
            } else if (is_instance(node, name_type) && is_instance(node.attr("ctx"), load_type)) {
                syntax_node item;
                item.type = syntax_node::node_type::NAME;
                item.name = bp::extract<string>(node.attr("id"))();
                item.line = bp::extract<int>(node.attr("lineno"))();
                result.nodes.push_back(item);
            } else if (is_instance(node, attribute_type)) {
                syntax_node item;
                item.type = syntax_node::node_type::ATTRIBUTE;
                item.name = bp::extract<string>(node.attr("attr"))();
                item.line = bp::extract<int>(node.attr("lineno"))();
                result.nodes.push_back(item);
            }
        }
    } catch (bp::error_already_set &) {
        int line;
        string message = fetch_python_error(line);
        throw internal_error(fmt::format("Unable to walk syntax tree: {}", message));
    }

    result.ok = true;
    return result;
}

}  // namespace sandbox
