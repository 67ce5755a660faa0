#include "sandbox/language.hpp"
#include <boost/algorithm/string.hpp>
#include "common/exceptions.hpp"

namespace sandbox {
using namespace std;

language parse_language(const string &name) {
    string lower = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(name));
    if (lower == "python" || lower == "python3" || lower == "py")
        return language::PYTHON;
    else if (lower == "r")
        return language::R;
    else if (lower == "javascript" || lower == "js")
        return language::JAVASCRIPT;
    else if (lower == "sql")
        return language::SQL;
    else
        throw invalid_language(name);
}

string to_string(language lang) {
    switch (lang) {
        case language::PYTHON:
            return "python";
        case language::R:
            return "r";
        case language::JAVASCRIPT:
            return "javascript";
        case language::SQL:
            return "sql";
    }
    throw internal_error("unknown language enum value");
}

}  // namespace sandbox
