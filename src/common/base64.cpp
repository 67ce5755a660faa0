#include "common/base64.hpp"
#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/binary_from_base64.hpp>
#include <boost/archive/iterators/dataflow_exception.hpp>
#include <boost/archive/iterators/transform_width.hpp>
#include <algorithm>
#include <stdexcept>

namespace sandbox {
using namespace std;
using namespace boost::archive::iterators;

string encode_base64(const string &bytes) {
    using base64_iterator = base64_from_binary<transform_width<string::const_iterator, 6, 8>>;
    string text(base64_iterator(bytes.begin()), base64_iterator(bytes.end()));
    text.append((3 - bytes.size() % 3) % 3, '=');
    return text;
}

string decode_base64(const string &text) {
    using binary_iterator = transform_width<binary_from_base64<string::const_iterator>, 8, 6>;
    if (text.size() % 4 != 0)
        throw invalid_argument("base64 length is not a multiple of 4");
    if (text.empty()) return string();

    size_t padding = 0;
    string padded = text;
    for (auto it = padded.rbegin(); it != padded.rend() && *it == '=' && padding < 2; ++it, ++padding)
        *it = 'A';

    string bytes;
    try {
        bytes.assign(binary_iterator(padded.cbegin()), binary_iterator(padded.cend()));
    } catch (dataflow_exception &ex) {
        throw invalid_argument(string("malformed base64: ") + ex.what());
    }
    bytes.erase(bytes.size() - min(padding, bytes.size()));
    return bytes;
}

}  // namespace sandbox
