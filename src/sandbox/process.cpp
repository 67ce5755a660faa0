#include "sandbox/process.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <sys/eventfd.h>
#include <sys/resource.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>
#include <algorithm>
#include <cstring>
#include <system_error>
#include <vector>
#include "common/defer.hpp"
#include "common/utils.hpp"
#include "config.hpp"

namespace sandbox {
using namespace std;
namespace fs = std::filesystem;

static const size_t BUF_SIZE = 65536;

// 每次最多连续读取的块数，避免持续输出的子进程阻止父进程检查超时
static const int MAX_READS_PER_PUMP = 16;

template <typename... Args>
[[noreturn]] static void error(int err, const char *format, const Args &... args) {
    throw system_error(err, system_category(), fmt::format(fmt::runtime(format), args...));
}

cancellation::cancellation()
    : event(eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK)) {
    if (!event.valid()) error(errno, "unable to create eventfd");
}

void cancellation::cancel() {
    uint64_t one = 1;
    if (write(event.get(), &one, sizeof(one)) < 0 && errno != EAGAIN)
        PLOG(WARNING) << "Unable to signal cancellation";
}

bool cancellation::cancelled() const {
    pollfd fd = {event.get(), POLLIN, 0};
    return poll(&fd, 1, 0) > 0 && (fd.revents & POLLIN);
}

int cancellation::fd() const {
    return event.get();
}

void to_json(nlohmann::json &j, const run_result &result) {
    j = {{"status", to_string(result.status)},
         {"error", result.error},
         {"exit_code", result.exit_code},
         {"signal", result.signal},
         {"stdout", result.stdout_text},
         {"stderr", result.stderr_text},
         {"output_bytes", result.output_bytes},
         {"timed_out", result.timed_out},
         {"cancelled", result.cancelled},
         {"wall_time_ms", result.wall_time_ms},
         {"cpu_time_ms", result.cpu_time_ms},
         {"memory_peak_mb", result.memory_peak_mb}};
    if (result.kind != error_kind::NONE) j["error_kind"] = to_string(result.kind);
}

process_runner::~process_runner() = default;

process_options process_options::from_config() {
    process_options options;
    options.python = PYTHON_EXECUTABLE;
    options.temp_dir = TEMP_DIR;
    options.max_output_size = MAX_OUTPUT_SIZE;
    return options;
}

process_sandbox::process_sandbox(process_options options)
    : options(move(options)) {}

run_result process_sandbox::run(const string &script, int timeout_seconds, int memory_limit_mb, const cancellation *cancel) {
    try {
        return execute(script, timeout_seconds, memory_limit_mb, cancel);
    } catch (exception &ex) {
        LOG(ERROR) << "Sandbox execution failed: " << ex.what();
        run_result result;
        result.status = execution_status::FAILED;
        result.kind = error_kind::PROCESS_SPAWN_FAILURE;
        result.error = fmt::format("Sandbox execution failed: {}", ex.what());
        return result;
    }
}

/**
 * @brief 子进程输出的读取状态，stdout 与 stderr 共享输出上限
 */
struct output_pump {
    size_t limit;
    size_t stored = 0;
    size_t total = 0;

    /**
     * @brief 读取管道中当前可读的数据，读到 EOF 时关闭管道
     */
    void pump(scoped_fd &fd, string &buffer) {
        char buf[BUF_SIZE];
        for (int i = 0; i < MAX_READS_PER_PUMP && fd.valid(); ++i) {
            ssize_t nread = read(fd.get(), buf, BUF_SIZE);
            if (nread > 0) {
                total += nread;
                if (stored < limit) {
                    // 超出上限的部分只计数，不保存
                    size_t keep = min((size_t)nread, limit - stored);
                    buffer.append(buf, keep);
                    stored += keep;
                }
            } else if (nread == 0) {
                fd.reset();
            } else if (errno == EINTR) {
                continue;
            } else if (errno == EAGAIN || errno == EWOULDBLOCK) {
                return;
            } else {
                error(errno, "reading output of child process");
            }
        }
    }

    bool exceeded() const {
        return total > limit;
    }
};

static void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL);
    if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0)
        error(errno, "unable to set pipe {} non-blocking", fd);
}

static void make_pipe(scoped_fd &read_end, scoped_fd &write_end) {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0)
        error(errno, "unable to create pipe");
    read_end.reset(fds[0]);
    write_end.reset(fds[1]);
}

static int open_pidfd(pid_t pid) {
#ifdef SYS_pidfd_open
    int fd = (int)syscall(SYS_pidfd_open, pid, 0);
    if (fd < 0) PLOG(INFO) << "pidfd_open is not available, falling back to periodic wakeups";
    return fd;
#else
    return -1;
#endif
}

static void sleep_for(chrono::milliseconds duration) {
    struct timespec delay;
    delay.tv_sec = duration.count() / 1000;
    delay.tv_nsec = (duration.count() % 1000) * 1000000L;
    // Prefer nanosleep over sleep because of higher resolution and it does not interfere with signals.
    while (nanosleep(&delay, &delay) != 0 && errno == EINTR) {}
}

static void kill_group(pid_t pid, int sig) {
    if (kill(-pid, sig) != 0 && errno != ESRCH)
        PLOG(WARNING) << "Unable to send signal " << sig << " to process group " << pid;
}

run_result process_sandbox::execute(const string &script, int timeout_seconds, int memory_limit_mb, const cancellation *cancel) {
    run_result result;

    auto python = find_executable(options.python.string());
    if (!python) {
        result.kind = error_kind::PROCESS_SPAWN_FAILURE;
        result.error = fmt::format("Sandbox execution failed: Python interpreter {} not found", options.python);
        LOG(ERROR) << result.error;
        return result;
    }

    scoped_temp_file script_file(options.temp_dir, ".py");
    script_file.write(script);

    fs::path mpl_config_dir = options.temp_dir / ".matplotlib";
    fs::create_directories(mpl_config_dir);

    // fork 之后子进程只能调用 async-signal-safe 的函数，所有参数都在 fork 之前准备好
    string python_path = python->string();
    string script_path = script_file.path().string();
    string work_dir = options.temp_dir.string();
    vector<string> environment = {
        "PATH=" + get_env("PATH", "/usr/local/bin:/usr/bin:/bin"),
        "PYTHONIOENCODING=utf-8:replace",
        "MPLBACKEND=Agg",
        "MPLCONFIGDIR=" + mpl_config_dir.string(),
        "PYTHONDONTWRITEBYTECODE=1",
        "PYTHONUNBUFFERED=1"};
    vector<char *> argv = {python_path.data(), script_path.data(), nullptr};
    vector<char *> envp;
    for (auto &entry : environment) envp.push_back(entry.data());
    envp.push_back(nullptr);

    struct rlimit cpu_limit, core_limit, file_limit;
    // 软限制触发 SIGXCPU，硬限制触发 SIGKILL
    cpu_limit.rlim_cur = timeout_seconds + 1;
    cpu_limit.rlim_max = timeout_seconds + 2;
    core_limit.rlim_cur = core_limit.rlim_max = 0;
    file_limit.rlim_cur = file_limit.rlim_max = options.file_size_limit;

    scoped_fd stdout_read, stdout_write, stderr_read, stderr_write, exec_read, exec_write;
    make_pipe(stdout_read, stdout_write);
    make_pipe(stderr_read, stderr_write);
    make_pipe(exec_read, exec_write);
    scoped_fd devnull(open("/dev/null", O_RDONLY | O_CLOEXEC));
    if (!devnull.valid()) error(errno, "unable to open /dev/null");

    elapsed_time timer;
    pid_t pid = fork();
    if (pid < 0) error(errno, "unable to fork");

    if (pid == 0) {
        // 子进程
        sigset_t empty_mask;
        sigemptyset(&empty_mask);
        sigprocmask(SIG_SETMASK, &empty_mask, nullptr);
        signal(SIGPIPE, SIG_DFL);
        signal(SIGINT, SIG_DFL);
        signal(SIGTERM, SIG_DFL);
        signal(SIGXCPU, SIG_DFL);

        if (setsid() < 0 ||
            dup2(devnull.get(), STDIN_FILENO) < 0 ||
            dup2(stdout_write.get(), STDOUT_FILENO) < 0 ||
            dup2(stderr_write.get(), STDERR_FILENO) < 0 ||
            setrlimit(RLIMIT_CPU, &cpu_limit) != 0 ||
            setrlimit(RLIMIT_CORE, &core_limit) != 0 ||
            setrlimit(RLIMIT_FSIZE, &file_limit) != 0 ||
            chdir(work_dir.c_str()) != 0) {
            int err = errno;
            (void)!write(exec_write.get(), &err, sizeof(err));
            _exit(127);
        }

        execve(argv[0], argv.data(), envp.data());
        int err = errno;
        (void)!write(exec_write.get(), &err, sizeof(err));
        _exit(127);
    }

    // 父进程
    bool reaped = false;
    int status = 0;
    struct rusage usage;
    memset(&usage, 0, sizeof(usage));

    auto wait_child = [&](int flags) {
        while (true) {
            pid_t r = wait4(pid, &status, flags, &usage);
            if (r == pid) {
                reaped = true;
                return;
            }
            if (r == 0) return;
            if (errno != EINTR) error(errno, "unable to wait for child process {}", pid);
        }
    };

    defer {
        // 出现异常时仍然要保证子进程被杀死并回收
        if (!reaped) {
            kill_group(pid, SIGKILL);
            waitpid(pid, nullptr, 0);
        }
    };

    stdout_write.reset();
    stderr_write.reset();
    exec_write.reset();
    devnull.reset();

    LOG(INFO) << "Spawned sandbox process " << pid << " for " << script_path;

    // exec 成功时管道因为 O_CLOEXEC 被关闭，读到 EOF
    int exec_errno = 0;
    ssize_t nread;
    do {
        nread = read(exec_read.get(), &exec_errno, sizeof(exec_errno));
    } while (nread < 0 && errno == EINTR);
    if (nread == sizeof(exec_errno)) {
        wait_child(0);
        result.kind = error_kind::PROCESS_SPAWN_FAILURE;
        result.error = fmt::format("Sandbox execution failed: unable to start {}: {}", python_path, strerror(exec_errno));
        LOG(ERROR) << result.error;
        return result;
    }
    exec_read.reset();

    set_nonblocking(stdout_read.get());
    set_nonblocking(stderr_read.get());
    scoped_fd pidfd(open_pidfd(pid));

    output_pump pump{options.max_output_size};
    string stdout_bytes, stderr_bytes;
    auto deadline = chrono::steady_clock::now() + chrono::seconds(timeout_seconds);

    while (!reaped) {
        auto now = chrono::steady_clock::now();
        if (now >= deadline) {
            result.timed_out = true;
            break;
        }
        if (cancel && cancel->cancelled()) {
            result.cancelled = true;
            break;
        }
        if (pump.exceeded()) break;

        pollfd fds[4];
        nfds_t nfds = 0;
        if (stdout_read.valid()) fds[nfds++] = {stdout_read.get(), POLLIN, 0};
        if (stderr_read.valid()) fds[nfds++] = {stderr_read.get(), POLLIN, 0};
        if (pidfd.valid()) fds[nfds++] = {pidfd.get(), POLLIN, 0};
        if (cancel) fds[nfds++] = {cancel->fd(), POLLIN, 0};

        int wait_ms = (int)chrono::duration_cast<chrono::milliseconds>(deadline - now).count() + 1;
        if (!pidfd.valid()) wait_ms = min(wait_ms, 100);

        if (poll(fds, nfds, wait_ms) < 0) {
            if (errno == EINTR) continue;
            error(errno, "unable to poll child process {}", pid);
        }

        pump.pump(stdout_read, stdout_bytes);
        pump.pump(stderr_read, stderr_bytes);
        wait_child(WNOHANG);
    }

    if (!reaped) {
        if (result.timed_out)
            LOG(WARNING) << "Sandbox process " << pid << " exceeded " << timeout_seconds << "s, terminating";
        else if (result.cancelled)
            LOG(WARNING) << "Sandbox process " << pid << " cancelled, terminating";
        else
            LOG(WARNING) << "Sandbox process " << pid << " exceeded output limit, terminating";

        // First try to kill graciously, then hard.
        kill_group(pid, SIGTERM);
        sleep_for(options.kill_delay);
        kill_group(pid, SIGKILL);
        wait_child(0);
    } else if (stdout_read.valid() || stderr_read.valid()) {
        // 子进程已经退出，杀死它留下的同组进程，以便管道能读到 EOF
        kill_group(pid, SIGKILL);
    }
    result.wall_time_ms = timer.duration<chrono::milliseconds>().count();

    // 读取管道中剩余的输出
    auto drain_deadline = chrono::steady_clock::now() + options.drain_timeout;
    while (stdout_read.valid() || stderr_read.valid()) {
        auto now = chrono::steady_clock::now();
        if (now >= drain_deadline) {
            LOG(WARNING) << "Output of sandbox process " << pid << " not closed, dropping the rest";
            break;
        }
        pollfd fds[2];
        nfds_t nfds = 0;
        if (stdout_read.valid()) fds[nfds++] = {stdout_read.get(), POLLIN, 0};
        if (stderr_read.valid()) fds[nfds++] = {stderr_read.get(), POLLIN, 0};
        int wait_ms = (int)chrono::duration_cast<chrono::milliseconds>(drain_deadline - now).count() + 1;
        if (poll(fds, nfds, wait_ms) < 0) {
            if (errno == EINTR) continue;
            error(errno, "unable to poll child process {}", pid);
        }
        pump.pump(stdout_read, stdout_bytes);
        pump.pump(stderr_read, stderr_bytes);
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signal = WTERMSIG(status);
        if (result.signal == SIGXCPU && !result.cancelled) result.timed_out = true;
    }
    result.cpu_time_ms = (int64_t)usage.ru_utime.tv_sec * 1000 + usage.ru_utime.tv_usec / 1000 +
                         (int64_t)usage.ru_stime.tv_sec * 1000 + usage.ru_stime.tv_usec / 1000;
    result.memory_peak_mb = usage.ru_maxrss / 1024.0;  // ru_maxrss 的单位是 KB
    result.output_bytes = pump.total;
    result.stdout_text = utf8_sanitize(stdout_bytes);
    result.stderr_text = utf8_sanitize(stderr_bytes);

    LOG(INFO) << fmt::format("Sandbox process {} finished: exit code {}, signal {}, wall {}ms, cpu {}ms, memory {:.1f}MB",
                             pid, result.exit_code, result.signal, result.wall_time_ms, result.cpu_time_ms, result.memory_peak_mb);

    result.status = execution_status::FAILED;
    if (result.cancelled) {
        result.kind = error_kind::CANCELLED;
        result.error = "Execution cancelled";
    } else if (result.timed_out) {
        result.kind = error_kind::TIMEOUT_EXCEEDED;
        result.error = fmt::format("Execution timeout after {} seconds", timeout_seconds);
    } else if (result.memory_peak_mb > memory_limit_mb) {
        result.kind = error_kind::MEMORY_LIMIT_EXCEEDED;
        result.error = fmt::format("Memory limit exceeded: {:.1f}MB", result.memory_peak_mb);
    } else if (pump.exceeded()) {
        result.kind = error_kind::OUTPUT_SIZE_EXCEEDED;
        result.error = fmt::format("Output size limit exceeded: {} bytes", result.output_bytes);
    } else if (result.signal != 0) {
        result.kind = error_kind::RUNTIME_ERROR;
        result.error = !result.stderr_text.empty()
                           ? result.stderr_text
                           : fmt::format("Process terminated by signal {} ({})", result.signal, strsignal(result.signal));
    } else if (result.exit_code != 0) {
        result.kind = error_kind::RUNTIME_ERROR;
        result.error = !result.stderr_text.empty()
                           ? result.stderr_text
                           : fmt::format("Process exited with code {}", result.exit_code);
    } else {
        result.status = execution_status::COMPLETED;
    }
    return result;
}

}  // namespace sandbox
