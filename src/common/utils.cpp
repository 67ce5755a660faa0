#include "common/utils.hpp"
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>
#include <boost/algorithm/string.hpp>
#include <csignal>
#include <system_error>
using namespace std;
namespace fs = std::filesystem;

int exec_program(const char **argv) {
    // 使用 POSIX 提供的函数来实现外部程序调用
    pid_t pid;
    switch (pid = fork()) {
        case -1:  // fork 失败
            throw system_error(errno, system_category(), "fork");
        case 0: {  // 子进程
            // 避免子进程被终止，要求父进程处理中断信号
            signal(SIGINT, SIG_IGN);
            int devnull = open("/dev/null", O_RDWR);
            if (devnull >= 0) {
                dup2(devnull, STDOUT_FILENO);
                dup2(devnull, STDERR_FILENO);
            }
            execvp(argv[0], (char **)argv);
            _exit(EXIT_FAILURE);
        }
        default:  // 父进程
            int status;
            while (waitpid(pid, &status, 0) < 0) {
                if (errno != EINTR)
                    throw system_error(errno, system_category(), "waitpid");
            }
            if (WIFEXITED(status))
                return WEXITSTATUS(status);
            else
                return -1;
    }
}

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

void set_env(const string &key, const string &value, bool replace) {
    setenv(key.c_str(), value.c_str(), replace);
}

optional<fs::path> find_executable(const string &name) {
    if (name.empty()) return nullopt;
    if (name.find('/') != string::npos) {
        if (access(name.c_str(), X_OK) == 0)
            return fs::absolute(name);
        return nullopt;
    }

    vector<string> dirs;
    boost::split(dirs, get_env("PATH", "/usr/local/bin:/usr/bin:/bin"), boost::is_any_of(":"));
    for (auto &dir : dirs) {
        if (dir.empty()) continue;
        fs::path candidate = fs::path(dir) / name;
        error_code ec;
        if (fs::is_regular_file(candidate, ec) && access(candidate.c_str(), X_OK) == 0)
            return candidate;
    }
    return nullopt;
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}
