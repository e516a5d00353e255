#include "judge/executor.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <limits>
#include <mutex>
#include <system_error>
#include "common/defer.hpp"
#include "config.hpp"

namespace codejudge {
using namespace std;
namespace fs = std::filesystem;

namespace {

constexpr size_t PIPE_CHUNK = 65536;

// 一次唤醒最多读取的次数，避免持续输出的程序让循环错过截止时间
constexpr int MAX_READS_PER_WAKEUP = 16;

// 子进程退出后等待管道关闭的最长时间
constexpr chrono::milliseconds DRAIN_GRACE(1000);

/**
 * @brief 文件描述符，析构时关闭
 */
struct file_descriptor {
    int fd = -1;

    file_descriptor() = default;
    explicit file_descriptor(int fd) : fd(fd) {}
    file_descriptor(const file_descriptor &) = delete;
    file_descriptor &operator=(const file_descriptor &) = delete;
    file_descriptor(file_descriptor &&other) noexcept : fd(other.fd) { other.fd = -1; }
    ~file_descriptor() { close(); }

    bool valid() const { return fd >= 0; }

    void close() {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }
};

struct pipe_pair {
    file_descriptor read_end;
    file_descriptor write_end;
};

pipe_pair make_pipe() {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0)
        throw system_error(errno, system_category(), "unable to create pipe");
    return {file_descriptor(fds[0]), file_descriptor(fds[1])};
}

void set_nonblocking(const file_descriptor &fd) {
    int flags = fcntl(fd.fd, F_GETFL);
    if (flags < 0 || fcntl(fd.fd, F_SETFL, flags | O_NONBLOCK) < 0)
        throw system_error(errno, system_category(), "unable to set pipe non-blocking");
}

/**
 * @brief 打开 pidfd，子进程退出时可读，用于唤醒 poll
 * 内核不支持时返回无效的描述符，此时退出只能在 poll 超时后检测到
 */
file_descriptor open_pidfd(pid_t pid) {
#ifdef SYS_pidfd_open
    return file_descriptor(static_cast<int>(syscall(SYS_pidfd_open, pid, 0)));
#else
    return file_descriptor();
#endif
}

[[noreturn]] void child_fail(int fd) {
    int err = errno;
    ssize_t n = write(fd, &err, sizeof(err));
    (void)n;
    _exit(127);
}

/**
 * @brief 读出管道中当前可读的数据，读到 EOF 时关闭管道
 * 超过 limit 的部分被丢弃
 */
void drain(file_descriptor &fd, string &buffer, size_t limit) {
    char chunk[PIPE_CHUNK];
    for (int i = 0; i < MAX_READS_PER_WAKEUP; ++i) {
        ssize_t n = read(fd.fd, chunk, sizeof(chunk));
        if (n > 0) {
            if (buffer.size() < limit)
                buffer.append(chunk, min(static_cast<size_t>(n), limit - buffer.size()));
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;
        fd.close();
        return;
    }
}

/**
 * @brief 向标准输入写入尽可能多的数据，写完后关闭管道以发送 EOF
 */
void feed(file_descriptor &fd, const string &input, size_t &offset) {
    while (offset < input.size()) {
        ssize_t n = write(fd.fd, input.data() + offset, min(input.size() - offset, PIPE_CHUNK));
        if (n > 0) {
            offset += n;
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;
        // 程序关闭了标准输入，剩余的输入不再需要
        fd.close();
        return;
    }
    fd.close();
}

bool child_exited(pid_t pid) {
    siginfo_t info;
    memset(&info, 0, sizeof(info));
    if (waitid(P_PID, pid, &info, WEXITED | WNOHANG | WNOWAIT) != 0)
        return errno == ECHILD;
    return info.si_pid == pid;
}

void kill_process_group(pid_t pid) {
    if (kill(-pid, SIGKILL) != 0 && errno != ESRCH)
        LOG(WARNING) << "unable to send SIGKILL to process group " << pid << ": " << strerror(errno);
    kill(pid, SIGKILL);
}

void wait_for(pid_t pid, int &status) {
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR)
            throw system_error(errno, system_category(), "unable to wait for child process");
    }
}

void drain_until_closed(file_descriptor &out_fd, string &out, file_descriptor &err_fd, string &err) {
    auto give_up = chrono::steady_clock::now() + DRAIN_GRACE;
    while (out_fd.valid() || err_fd.valid()) {
        auto now = chrono::steady_clock::now();
        if (now >= give_up) break;

        pollfd fds[2];
        nfds_t nfds = 0;
        int out_idx = -1, err_idx = -1;
        if (out_fd.valid()) {
            out_idx = nfds;
            fds[nfds++] = {out_fd.fd, POLLIN, 0};
        }
        if (err_fd.valid()) {
            err_idx = nfds;
            fds[nfds++] = {err_fd.fd, POLLIN, 0};
        }

        int timeout = static_cast<int>(chrono::duration_cast<chrono::milliseconds>(give_up - now).count()) + 1;
        int r = poll(fds, nfds, timeout);
        if (r < 0 && errno == EINTR) continue;
        if (r <= 0) break;
        if (out_idx >= 0 && fds[out_idx].revents) drain(out_fd, out, OUTPUT_LIMIT);
        if (err_idx >= 0 && fds[err_idx].revents) drain(err_fd, err, OUTPUT_LIMIT);
    }
    if (out_fd.valid() || err_fd.valid())
        LOG(WARNING) << "output pipes are still held open by a detached process, remaining output dropped";
}

template <typename T>
void try_to_parse(const string &text, T &value) {
    try {
        value = boost::lexical_cast<T>(text);
    } catch (boost::bad_lexical_cast &) {
        // 保持原值
    }
}

}  // namespace

uint64_t read_process_memory(pid_t pid) {
    ifstream fin(fmt::format("/proc/{}/status", pid));
    if (!fin) return 0;

    uint64_t hwm = 0, rss = 0;
    string line;
    while (getline(fin, line)) {
        vector<string> tokens;
        boost::split(tokens, line, boost::is_any_of(" \t"), boost::token_compress_on);
        if (tokens.size() < 2) continue;
        if (tokens[0] == "VmHWM:")
            try_to_parse(tokens[1], hwm);
        else if (tokens[0] == "VmRSS:")
            try_to_parse(tokens[1], rss);
    }
    return hwm ? hwm : rss;
}

executor::executor(uint64_t time_limit, uint64_t memory_limit, fs::path workdir)
    : time_limit(min(time_limit, MAX_TIME_LIMIT)), memory_limit(memory_limit), workdir(move(workdir)) {
    // 程序提前关闭标准输入时 write 会返回 EPIPE，而不是让评测进程退出
    static once_flag ignore_sigpipe;
    call_once(ignore_sigpipe, [] { ::signal(SIGPIPE, SIG_IGN); });
}

execution_result executor::execute(const fs::path &executable, const string &input) const {
    // 子进程会切换到 workdir，带目录的相对路径需要先转换为绝对路径
    if (executable.is_relative() && executable.has_parent_path())
        return run({fs::absolute(executable).string()}, input);
    return run({executable.string()}, input);
}

execution_result executor::run(const vector<string> &argv, const string &input) const {
    try {
        return spawn_and_wait(argv, input);
    } catch (system_error &ex) {
        LOG(ERROR) << "Unable to run " << (argv.empty() ? string() : argv[0]) << ": " << ex.what();
        execution_result result;
        result.error = fmt::format("Process error: {}", ex.what());
        return result;
    }
}

execution_result executor::spawn_and_wait(const vector<string> &argv, const string &input) const {
    execution_result result;
    if (argv.empty()) {
        result.error = "Failed to start process: empty command";
        return result;
    }

    // fork 之后子进程不能再分配内存，参数需要提前准备好
    vector<char *> args;
    for (auto &arg : argv)
        args.push_back(const_cast<char *>(arg.c_str()));
    args.push_back(nullptr);
    string dir = workdir.string();

    auto stdin_pipe = make_pipe();
    auto stdout_pipe = make_pipe();
    auto stderr_pipe = make_pipe();
    auto exec_pipe = make_pipe();

    pid_t pid = fork();
    if (pid < 0)
        throw system_error(errno, system_category(), "unable to fork");

    if (pid == 0) {
        setpgid(0, 0);
        sigset_t mask;
        sigemptyset(&mask);
        sigprocmask(SIG_SETMASK, &mask, nullptr);
        ::signal(SIGPIPE, SIG_DFL);
        if (dup2(stdin_pipe.read_end.fd, STDIN_FILENO) < 0 ||
            dup2(stdout_pipe.write_end.fd, STDOUT_FILENO) < 0 ||
            dup2(stderr_pipe.write_end.fd, STDERR_FILENO) < 0)
            child_fail(exec_pipe.write_end.fd);
        if (!dir.empty() && chdir(dir.c_str()) != 0)
            child_fail(exec_pipe.write_end.fd);
        execvp(args[0], args.data());
        child_fail(exec_pipe.write_end.fd);
    }

    // 子进程可能还没来得及调用 setpgid，这里再设置一次，失败说明子进程已经设置过
    setpgid(pid, pid);

    bool reaped = false;
    int status = 0;
    defer {
        if (!reaped) {
            kill_process_group(pid);
            while (waitpid(pid, &status, 0) < 0 && errno == EINTR)
                ;
        }
    };

    stdin_pipe.read_end.close();
    stdout_pipe.write_end.close();
    stderr_pipe.write_end.close();
    exec_pipe.write_end.close();

    // exec 成功时管道因为 O_CLOEXEC 被关闭，read 返回 0
    int exec_errno = 0;
    ssize_t n;
    do {
        n = read(exec_pipe.read_end.fd, &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    if (n == sizeof(exec_errno)) {
        wait_for(pid, status);
        reaped = true;
        result.error = fmt::format("Failed to start process: {}: {}", argv[0], strerror(exec_errno));
        return result;
    }

    auto start = chrono::steady_clock::now();
    set_nonblocking(stdin_pipe.write_end);
    set_nonblocking(stdout_pipe.read_end);
    set_nonblocking(stderr_pipe.read_end);
    auto pidfd = open_pidfd(pid);

    size_t offset = 0;
    if (input.empty()) stdin_pipe.write_end.close();

    auto deadline = start + time_limit;
    auto sample_interval = chrono::milliseconds(max(1, MEMORY_SAMPLE_INTERVAL));
    auto next_sample = start;
    uint64_t memory_limit_kb = memory_limit > numeric_limits<uint64_t>::max() / 1024
                                   ? numeric_limits<uint64_t>::max()
                                   : memory_limit * 1024;
    uint64_t peak_memory = 0;
    bool timed_out = false, memory_exceeded = false;
    string output, error_output;
    chrono::steady_clock::time_point finish;

    while (true) {
        auto now = chrono::steady_clock::now();
        if (now >= next_sample) {
            peak_memory = max(peak_memory, read_process_memory(pid));
            next_sample = now + sample_interval;
            if (ENFORCE_MEMORY_LIMIT && memory_limit_kb > 0 && peak_memory > memory_limit_kb) {
                memory_exceeded = true;
                finish = now;
                break;
            }
        }
        if (child_exited(pid)) {
            finish = chrono::steady_clock::now();
            break;
        }
        if (now >= deadline) {
            timed_out = true;
            finish = now;
            break;
        }

        pollfd fds[4];
        nfds_t nfds = 0;
        int stdin_idx = -1, stdout_idx = -1, stderr_idx = -1;
        if (stdin_pipe.write_end.valid()) {
            stdin_idx = nfds;
            fds[nfds++] = {stdin_pipe.write_end.fd, POLLOUT, 0};
        }
        if (stdout_pipe.read_end.valid()) {
            stdout_idx = nfds;
            fds[nfds++] = {stdout_pipe.read_end.fd, POLLIN, 0};
        }
        if (stderr_pipe.read_end.valid()) {
            stderr_idx = nfds;
            fds[nfds++] = {stderr_pipe.read_end.fd, POLLIN, 0};
        }
        if (pidfd.valid())
            fds[nfds++] = {pidfd.fd, POLLIN, 0};

        auto wake = min(deadline, next_sample);
        int timeout = static_cast<int>(chrono::duration_cast<chrono::milliseconds>(wake - now).count()) + 1;
        if (poll(fds, nfds, timeout) < 0) {
            if (errno == EINTR) continue;
            throw system_error(errno, system_category(), "unable to poll child pipes");
        }

        if (stdin_idx >= 0 && fds[stdin_idx].revents) feed(stdin_pipe.write_end, input, offset);
        if (stdout_idx >= 0 && fds[stdout_idx].revents) drain(stdout_pipe.read_end, output, OUTPUT_LIMIT);
        if (stderr_idx >= 0 && fds[stderr_idx].revents) drain(stderr_pipe.read_end, error_output, OUTPUT_LIMIT);
    }

    // 程序已经退出时这里只会清理它留下的后台进程
    kill_process_group(pid);
    wait_for(pid, status);
    reaped = true;
    stdin_pipe.write_end.close();
    drain_until_closed(stdout_pipe.read_end, output, stderr_pipe.read_end, error_output);

    if (output.size() >= OUTPUT_LIMIT || error_output.size() >= OUTPUT_LIMIT)
        LOG(WARNING) << "Output of " << argv[0] << " truncated to " << OUTPUT_LIMIT << " bytes";

    result.execution_time = chrono::duration_cast<chrono::milliseconds>(finish - start).count();
    result.memory_usage = peak_memory;

    if (timed_out) {
        LOG(INFO) << fmt::format("Process {} exceeded time limit of {} ms, killed", argv[0], time_limit.count());
        result.error = TIME_LIMIT_EXCEEDED_MESSAGE;
        return result;
    }

    if (memory_exceeded) {
        LOG(INFO) << fmt::format("Process {} used {} KB, exceeding memory limit of {} MB, killed", argv[0], peak_memory, memory_limit);
        result.error = MEMORY_LIMIT_EXCEEDED_MESSAGE;
        return result;
    }

    if (WIFEXITED(status))
        result.exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status))
        result.signal = WTERMSIG(status);
    result.success = WIFEXITED(status) && WEXITSTATUS(status) == 0;
    result.output = move(output);
    if (!result.success && !error_output.empty())
        result.error = move(error_output);
    return result;
}

}  // namespace codejudge
