#include "exec/process.hpp"
#include <errno.h>
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <string.h>
#include <sys/resource.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>
#include <algorithm>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace pyexec {
using namespace std;

static const struct timespec killdelay = {0, 100000000L};  // 0.1s

static const int BUF_SIZE = 4096;

static const int PIPE_IN = 1;
static const int PIPE_OUT = 0;

template <typename... Args>
[[noreturn]] static void error(int err, Args &&... args) {
    throw internal_error(fmt::format("{}: {}", fmt::format(args...), strerror(err)));
}

static void append_limited(string &buffer, const char *data, size_t size, size_t limit) {
    buffer.append(data, size);
    // 摊还删除，避免每次读取都移动整个缓冲区
    if (buffer.size() > limit * 2)
        buffer.erase(0, buffer.size() - limit);
}

static void kill_process_group(pid_t pid) {
    LOG(INFO) << "sending SIGTERM to process group " << pid;
    if (kill(-pid, SIGTERM) != 0 && errno != ESRCH)
        LOG(WARNING) << "unable to send SIGTERM to process group " << pid << ": " << strerror(errno);

    nanosleep(&killdelay, nullptr);

    LOG(INFO) << "sending SIGKILL to process group " << pid;
    if (kill(-pid, SIGKILL) != 0 && errno != ESRCH)
        LOG(WARNING) << "unable to send SIGKILL to process group " << pid << ": " << strerror(errno);
}

/**
 * @brief 读取一次管道中可用的数据
 * @return 管道是否仍然打开
 */
static bool pump_pipe(int &fd, string &buffer, size_t limit) {
    char buf[BUF_SIZE];
    while (true) {
        ssize_t nread = read(fd, buf, BUF_SIZE);
        if (nread > 0) {
            append_limited(buffer, buf, nread, limit);
            continue;
        }
        if (nread == 0) {
            // EOF：关闭管道并用 -1 标记
            close(fd);
            fd = -1;
            return false;
        }
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
        error(errno, "reading from child pipe");
    }
}

static void apply_limits_in_child(const process_options &opt) {
    if (opt.memory_limit > 0) {
        struct rlimit lim;
        lim.rlim_cur = lim.rlim_max = (rlim_t)opt.memory_limit;
        setrlimit(RLIMIT_AS, &lim);
    }
}

execution_outcome run_process(const process_options &opt) {
    if (opt.command.empty())
        throw invalid_argument("command must not be empty");

    // fork 之后的子进程只能调用异步信号安全的函数，因此所有内存分配都在 fork 之前完成
    vector<char *> args;
    for (auto &arg : opt.command) args.push_back(const_cast<char *>(arg.c_str()));
    args.push_back(nullptr);
    string exec_failure = fmt::format("unable to start command {}\n", opt.command[0]);

    int child_pipefd[3][2] = {{-1, -1}, {-1, -1}, {-1, -1}};
    defer {
        for (int i = 1; i <= 2; ++i)
            for (int j = 0; j < 2; ++j)
                if (child_pipefd[i][j] >= 0) close(child_pipefd[i][j]);
    };

    for (int i = 1; i <= 2; i++) {
        if (pipe2(child_pipefd[i], O_CLOEXEC) != 0) error(errno, "creating pipe for fd {}", i);
    }

    execution_outcome outcome;
    elapsed_time timer;

    pid_t child_pid = fork();
    switch (child_pid) {
        case -1:
            error(errno, "unable to fork");
        case 0: {  // 子进程
            setpgid(0, 0);

            sigset_t emptymask;
            sigemptyset(&emptymask);
            sigprocmask(SIG_SETMASK, &emptymask, nullptr);
            signal(SIGPIPE, SIG_DFL);
            signal(SIGINT, SIG_DFL);
            signal(SIGTERM, SIG_DFL);

            int devnull = open("/dev/null", O_RDONLY);
            if (devnull >= 0) dup2(devnull, STDIN_FILENO);

            // 将管道连接到 stdout/stderr，dup2 得到的描述符不带 O_CLOEXEC
            for (int i = 1; i <= 2; ++i) {
                if (dup2(child_pipefd[i][PIPE_IN], i) < 0) _exit(127);
            }

            apply_limits_in_child(opt);

            execvp(args[0], args.data());
            ssize_t ignored = write(STDERR_FILENO, exec_failure.data(), exec_failure.size());
            (void)ignored;
            _exit(127);
        }
        default:
            break;
    }

    // 父进程同样设置一次进程组，避免子进程还没来得及 setpgid 时就需要 kill(-pid)
    setpgid(child_pid, child_pid);

    for (int i = 1; i <= 2; i++) {
        close(child_pipefd[i][PIPE_IN]);
        child_pipefd[i][PIPE_IN] = -1;
        int flags = fcntl(child_pipefd[i][PIPE_OUT], F_GETFL);
        if (flags == -1 || fcntl(child_pipefd[i][PIPE_OUT], F_SETFL, flags | O_NONBLOCK) == -1) {
            int err = errno;
            kill_process_group(child_pid);
            waitpid(child_pid, nullptr, 0);
            error(err, "setting pipe for fd {} to non-blocking", i);
        }
    }

    string *buffers[3] = {nullptr, &outcome.stdout_text, &outcome.stderr_text};
    bool use_wall_limit = opt.wall_limit.count() > 0;
    int status = 0;
    bool exited = false;

    while (true) {
        long remaining = -1;
        if (use_wall_limit) {
            remaining = (long)(opt.wall_limit - timer.duration<chrono::milliseconds>()).count();
            if (remaining <= 0) {
                LOG(WARNING) << fmt::format("timelimit exceeded (hard wall time {:.3f}s): aborting command",
                                            opt.wall_limit.count() / 1000.0);
                outcome.timed_out = true;
                kill_process_group(child_pid);
                break;
            }
        }

        if (!exited) {
            pid_t pid = waitpid(child_pid, &status, WNOHANG);
            if (pid < 0 && errno != EINTR) error(errno, "waiting on child");
            if (pid == child_pid) exited = true;
        }

        struct pollfd fds[2];
        int nfds = 0;
        for (int i = 1; i <= 2; i++) {
            if (child_pipefd[i][PIPE_OUT] >= 0) {
                fds[nfds].fd = child_pipefd[i][PIPE_OUT];
                fds[nfds].events = POLLIN;
                fds[nfds].revents = 0;
                ++nfds;
            }
        }

        // 子进程已退出且管道都已关闭
        if (exited && nfds == 0) break;
        // 管道仍被子进程（或其后代）持有时，数据到达或超时才会唤醒；
        // 管道已关闭但子进程仍在运行时，每 10ms 检查一次子进程状态
        int wait_ms = nfds == 0 ? 10 : 50;
        if (remaining >= 0) wait_ms = (int)min<long>(wait_ms, remaining);

        if (nfds == 0) {
            struct timespec ts = {0, wait_ms * 1000000L};
            nanosleep(&ts, nullptr);
            continue;
        }

        int r = poll(fds, nfds, wait_ms);
        if (r == -1 && errno != EINTR) error(errno, "waiting for child data");

        for (int i = 1; i <= 2; i++)
            if (child_pipefd[i][PIPE_OUT] >= 0)
                pump_pipe(child_pipefd[i][PIPE_OUT], *buffers[i], opt.stream_limit);

        // 子进程退出后，其后代进程可能继续持有管道，这种情况下不再等待管道关闭
        if (exited) {
            for (int i = 1; i <= 2; i++)
                if (child_pipefd[i][PIPE_OUT] >= 0 && r == 0) {
                    close(child_pipefd[i][PIPE_OUT]);
                    child_pipefd[i][PIPE_OUT] = -1;
                }
        }
    }

    // 读取超时前已经写入管道的数据
    for (int i = 1; i <= 2; i++)
        if (child_pipefd[i][PIPE_OUT] >= 0)
            pump_pipe(child_pipefd[i][PIPE_OUT], *buffers[i], opt.stream_limit);

    if (!exited) {
        while (waitpid(child_pid, &status, 0) < 0) {
            if (errno != EINTR) error(errno, "waiting on child");
        }
    }

    outcome.wall_time = timer.duration<chrono::microseconds>().count() / 1e6;

    if (WIFEXITED(status)) {
        outcome.exitcode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        outcome.signal = WTERMSIG(status);
        outcome.exitcode = outcome.signal + 128;
        if (!outcome.timed_out)
            LOG(WARNING) << "Command terminated with signal (" << outcome.signal << ", " << strsignal(outcome.signal) << ")";
    } else {
        throw internal_error(fmt::format("unknown status: {:x}", status));
    }

    return outcome;
}

}  // namespace pyexec
