#include "common/io_utils.hpp"
#include <fcntl.h>
#include <glog/logging.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <fstream>
#include <system_error>

namespace sandbox {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(filesystem::path const &path) {
    ifstream fin(path.string(), ios::binary);
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path.string(), ios::binary | ios::trunc);
    if (!fout)
        throw system_error(errno, system_category(), "unable to open file " + path.string());
    fout.write(content.data(), content.size());
    if (!fout)
        throw system_error(errno, system_category(), "unable to write file " + path.string());
}

/**
 * @return 以 bytes[i] 开头的合法 UTF-8 序列的长度，不合法时返回 0
 */
static size_t utf8_sequence_length(const string &bytes, size_t i) {
    unsigned char c = bytes[i];
    size_t n;
    if (c <= 0x7f)
        return 1;  // 0bbbbbbb
    else if ((c & 0xE0) == 0xC0)
        n = 1;  // 110bbbbb
    else if (c == 0xed && i + 1 < bytes.size() && ((unsigned char)bytes[i + 1] & 0xa0) == 0xa0)
        return 0;  // U+d800 to U+dfff
    else if ((c & 0xF0) == 0xE0)
        n = 2;  // 1110bbbb
    else if ((c & 0xF8) == 0xF0)
        n = 3;  // 11110bbb
    else
        return 0;
    for (size_t j = 1; j <= n; ++j) {  // n bytes matching 10bbbbbb follow ?
        if (i + j >= bytes.size() || ((unsigned char)bytes[i + j] & 0xC0) != 0x80)
            return 0;
    }
    return n + 1;
}

string utf8_sanitize(const string &bytes) {
    static const char replacement[] = "\xEF\xBF\xBD";
    string result;
    result.reserve(bytes.size());
    for (size_t i = 0; i < bytes.size();) {
        size_t len = utf8_sequence_length(bytes, i);
        if (len == 0) {
            result += replacement;
            ++i;
        } else {
            result.append(bytes, i, len);
            i += len;
        }
    }
    return result;
}

string assert_safe_path(const string &subpath) {
    if (subpath.empty() || subpath.find("..") != string::npos || subpath.find('/') != string::npos)
        throw runtime_error("subpath is not safe " + subpath);
    return subpath;
}

scoped_fd::scoped_fd() : fd(-1) {}

scoped_fd::scoped_fd(int fd) : fd(fd) {}

scoped_fd::scoped_fd(scoped_fd &&other) : fd(other.release()) {}

scoped_fd::~scoped_fd() {
    reset();
}

scoped_fd &scoped_fd::operator=(scoped_fd &&other) {
    reset(other.release());
    return *this;
}

int scoped_fd::get() const {
    return fd;
}

bool scoped_fd::valid() const {
    return fd >= 0;
}

int scoped_fd::release() {
    int old = fd;
    fd = -1;
    return old;
}

void scoped_fd::reset(int new_fd) {
    if (fd >= 0 && close(fd) != 0)
        PLOG(WARNING) << "Unable to close file descriptor " << fd;
    fd = new_fd;
}

scoped_file_lock::scoped_file_lock(const fs::path &path, bool shared)
    : fd(open(path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644)) {
    if (!fd.valid())
        throw system_error(errno, system_category(), "unable to open lock file " + path.string());
    int r;
    do {
        r = flock(fd.get(), shared ? LOCK_SH : LOCK_EX);
    } while (r != 0 && errno == EINTR);
    if (r != 0)
        throw system_error(errno, system_category(), "unable to lock file " + path.string());
}

scoped_file_lock::~scoped_file_lock() {
    // 关闭文件描述符时锁会被自动释放
    if (flock(fd.get(), LOCK_UN) != 0)
        PLOG(WARNING) << "Unable to unlock file descriptor " << fd.get();
}

scoped_temp_file::scoped_temp_file(const fs::path &dir, const string &suffix) {
    fs::create_directories(dir);

    static thread_local boost::uuids::random_generator generator;
    file_path = dir / ("sandbox_" + boost::uuids::to_string(generator()) + suffix);
    fd.reset(open(file_path.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0600));
    if (!fd.valid())
        throw system_error(errno, system_category(), "unable to create temporary file " + file_path.string());
}

scoped_temp_file::~scoped_temp_file() {
    fd.reset();
    error_code ec;
    fs::remove(file_path, ec);
    if (ec)
        LOG(WARNING) << "Unable to remove temporary file " << file_path << ": " << ec.message();
}

const fs::path &scoped_temp_file::path() const {
    return file_path;
}

void scoped_temp_file::write(const string &content) {
    size_t written = 0;
    while (written < content.size()) {
        ssize_t n = ::write(fd.get(), content.data() + written, content.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw system_error(errno, system_category(), "unable to write temporary file " + file_path.string());
        }
        written += n;
    }
    fd.reset();
}

}  // namespace sandbox
