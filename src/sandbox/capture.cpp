#include "sandbox/capture.hpp"
#include <fmt/chrono.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <cctype>
#include <chrono>
#include <ctime>
#include "common/base64.hpp"

namespace sandbox {
using namespace std;
using namespace nlohmann;

const char IMAGE_MARKER[] = "__SANDBOX_IMAGE_BASE64__";

void to_json(json &j, const captured_image &image) {
    j = {{"name", image.name},
         {"width", image.width},
         {"height", image.height},
         {"format", image.format},
         {"size", image.data.size()}};
}

bool read_png_size(const string &data, int &width, int &height) {
    static const char signature[] = "\x89PNG\r\n\x1a\n";
    if (data.size() < 24 || data.compare(0, 8, signature, 8) != 0 || data.compare(12, 4, "IHDR") != 0)
        return false;
    auto read_u32 = [&data](size_t offset) {
        return (uint32_t)(unsigned char)data[offset] << 24 |
               (uint32_t)(unsigned char)data[offset + 1] << 16 |
               (uint32_t)(unsigned char)data[offset + 2] << 8 |
               (uint32_t)(unsigned char)data[offset + 3];
    };
    width = (int)read_u32(16);
    height = (int)read_u32(20);
    return true;
}

static string generate_image_name(const string &format) {
    static thread_local boost::uuids::random_generator generator;
    auto now = chrono::system_clock::now();
    auto millis = chrono::duration_cast<chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    time_t seconds = chrono::system_clock::to_time_t(now);
    tm utc;
    gmtime_r(&seconds, &utc);
    string suffix = boost::uuids::to_string(generator()).substr(0, 8);
    return fmt::format("sandbox_{:%Y%m%d_%H%M%S}_{:03d}_{}.{}", utc, millis, suffix, format);
}

/**
 * @brief 一个已经定位的图片标记
 */
struct image_marker {
    size_t begin, end;  // [begin, end) 为标记在输出中的范围
    int width = 0, height = 0;
    string format;
    string payload;
};

static bool is_base64_char(char c) {
    return isalnum((unsigned char)c) || c == '+' || c == '/' || c == '=';
}

static size_t read_number(const string &text, size_t pos, int &value) {
    size_t end = pos;
    while (end < text.size() && isdigit((unsigned char)text[end]) && end - pos < 9) ++end;
    if (end == pos) return string::npos;
    value = stoi(text.substr(pos, end - pos));
    return end;
}

/**
 * @brief 解析从 begin 开始的标记，begin 指向 IMAGE_MARKER
 * 标记格式不完整时返回 false，此时 marker.end 指向 IMAGE_MARKER 之后
 */
static bool parse_marker(const string &text, size_t begin, image_marker &marker) {
    static const string data_prefix = "data:image/";
    static const string base64_prefix = ";base64,";

    size_t pos = begin + sizeof(IMAGE_MARKER) - 1;
    marker.begin = begin;
    marker.end = pos;

    if (pos < text.size() && text[pos] == '[') {
        int width, height;
        size_t p = read_number(text, pos + 1, width);
        if (p == string::npos || p >= text.size() || text[p] != 'x') return false;
        p = read_number(text, p + 1, height);
        if (p == string::npos || p >= text.size() || text[p] != ']') return false;
        marker.width = width;
        marker.height = height;
        pos = p + 1;
    }

    if (text.compare(pos, data_prefix.size(), data_prefix) != 0) return false;
    pos += data_prefix.size();
    size_t format_begin = pos;
    while (pos < text.size() && isalnum((unsigned char)text[pos])) ++pos;
    marker.format = text.substr(format_begin, pos - format_begin);
    if (marker.format.empty() || text.compare(pos, base64_prefix.size(), base64_prefix) != 0) return false;
    pos += base64_prefix.size();

    size_t payload_begin = pos;
    while (pos < text.size() && is_base64_char(text[pos])) ++pos;
    marker.payload = text.substr(payload_begin, pos - payload_begin);
    marker.end = pos;
    return true;
}

/**
 * @brief 合并连续的空行，去掉开头和结尾的空行
 */
static string collapse_blank_lines(const string &text) {
    string result;
    bool previous_blank = true;
    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find('\n', start);
        if (end == string::npos) end = text.size();
        string line = text.substr(start, end - start);
        bool blank = line.find_first_not_of(" \t\r\f\v") == string::npos;
        if (!(blank && previous_blank)) {
            if (!result.empty() || blank) result += '\n';
            if (!blank) result += line;
        }
        previous_blank = blank;
        start = end + 1;
    }
    while (!result.empty() && result.back() == '\n') result.pop_back();
    while (!result.empty() && result.front() == '\n') result.erase(0, 1);
    return result;
}

capture_result extract_images(const string &stdout_text, bool inline_images) {
    capture_result result;
    string output;
    size_t last = 0;

    for (size_t pos = stdout_text.find(IMAGE_MARKER); pos != string::npos; pos = stdout_text.find(IMAGE_MARKER, last)) {
        output.append(stdout_text, last, pos - last);

        image_marker marker;
        if (!parse_marker(stdout_text, pos, marker)) {
            LOG(WARNING) << "Dropping malformed image marker at offset " << pos;
            last = marker.end;
            continue;
        }
        last = marker.end;

        captured_image image;
        try {
            image.data = decode_base64(marker.payload);
        } catch (invalid_argument &ex) {
            LOG(WARNING) << "Dropping image with malformed payload: " << ex.what();
            continue;
        }
        if (image.data.empty()) {
            LOG(WARNING) << "Dropping empty image";
            continue;
        }

        image.format = marker.format;
        image.width = marker.width;
        image.height = marker.height;
        if (image.width <= 0 || image.height <= 0) {
            int width, height;
            if (read_png_size(image.data, width, height)) {
                image.width = width;
                image.height = height;
            }
        }
        image.name = generate_image_name(image.format);

        if (inline_images)
            output += fmt::format("![{0}]({0})", image.name);
        result.images.push_back(move(image));
    }
    output.append(stdout_text, last, string::npos);

    result.output = collapse_blank_lines(output);
    return result;
}

}  // namespace sandbox
