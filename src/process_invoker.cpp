#include "process_invoker.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

static const auto kTerminateGrace = std::chrono::milliseconds(500);
static const auto kReapInterval = std::chrono::milliseconds(10);

static void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

static bool drain_fd(int& fd, std::string& sink) {
    char buffer[4096];
    ssize_t n = ::read(fd, buffer, sizeof(buffer));
    if (n > 0) {
        sink.append(buffer, static_cast<size_t>(n));
        return true;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
        return true;
    }
    close_fd(fd);
    return false;
}

static bool reap_until(pid_t pid, int& status, std::chrono::steady_clock::time_point deadline) {
    while (true) {
        pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid) return true;
        if (r < 0 && errno != EINTR) return true;
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(kReapInterval);
    }
}

static void terminate_child(pid_t pid, int& status) {
    ::kill(pid, SIGTERM);
    if (reap_until(pid, status, std::chrono::steady_clock::now() + kTerminateGrace)) {
        return;
    }
    ::kill(pid, SIGKILL);
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
}

const char* toString(ProcessError error) {
    switch (error) {
        case ProcessError::None: return "ok";
        case ProcessError::NonZeroExit: return "non-zero exit";
        case ProcessError::TimedOut: return "timed out";
        case ProcessError::LaunchFailed: return "launch failed";
    }
    return "unknown";
}

std::string ProcessResult::describe() const {
    std::string text = toString(error);
    if (error == ProcessError::NonZeroExit) {
        text += " (code " + std::to_string(exit_code) + ")";
    }
    std::string detail = stderr_text;
    while (!detail.empty() && (detail.back() == '\n' || detail.back() == ' ')) {
        detail.pop_back();
    }
    if (!detail.empty()) {
        text += ": " + detail;
    }
    return text;
}

SleepFunction realSleep() {
    return [](std::chrono::milliseconds duration) { std::this_thread::sleep_for(duration); };
}

std::string joinCommand(const std::vector<std::string>& argv) {
    std::string joined;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) joined += ' ';
        joined += argv[i];
    }
    return joined;
}

ProcessResult PosixProcessInvoker::run(const std::vector<std::string>& argv,
                                       std::chrono::milliseconds timeout) {
    ProcessResult result;

    if (argv.empty()) {
        result.error = ProcessError::LaunchFailed;
        result.stderr_text = "empty command";
        return result;
    }

    spdlog::trace("[Process] run {} ({} args)", argv.front(), argv.size() - 1);

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};

    if (::pipe2(out_pipe, O_CLOEXEC) < 0 || ::pipe2(err_pipe, O_CLOEXEC) < 0 ||
        ::pipe2(exec_pipe, O_CLOEXEC) < 0) {
        result.error = ProcessError::LaunchFailed;
        result.stderr_text = std::string("pipe: ") + std::strerror(errno);
        for (int* fds : {out_pipe, err_pipe, exec_pipe}) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }
        return result;
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        result.error = ProcessError::LaunchFailed;
        result.stderr_text = std::string("fork: ") + std::strerror(errno);
        for (int* fds : {out_pipe, err_pipe, exec_pipe}) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }
        return result;
    }

    if (pid == 0) {
        int null_fd = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (null_fd >= 0) {
            ::dup2(null_fd, STDIN_FILENO);
            if (null_fd != STDIN_FILENO) {
                ::close(null_fd);
            }
        }
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::execvp(args[0], args.data());
        int exec_errno = errno;
        ssize_t ignored = ::write(exec_pipe[1], &exec_errno, sizeof(exec_errno));
        (void)ignored;
        ::_exit(127);
    }

    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(exec_pipe[1]);

    // The exec pipe closes on a successful exec and carries errno otherwise.
    int exec_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);

    int status = 0;
    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        close_fd(out_pipe[0]);
        close_fd(err_pipe[0]);
        result.error = ProcessError::LaunchFailed;
        result.stderr_text = argv.front() + ": " + std::strerror(exec_errno);
        return result;
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    bool timed_out = false;

    while (out_pipe[0] >= 0 || err_pipe[0] >= 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            timed_out = true;
            break;
        }

        struct pollfd fds[2];
        nfds_t count = 0;
        int* owners[2];
        for (int* fd : {&out_pipe[0], &err_pipe[0]}) {
            if (*fd >= 0) {
                fds[count].fd = *fd;
                fds[count].events = POLLIN;
                fds[count].revents = 0;
                owners[count] = fd;
                ++count;
            }
        }

        int ready = ::poll(fds, count, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) continue;
            spdlog::debug("[Process] poll failed: {}", std::strerror(errno));
            break;
        }

        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) {
                std::string& sink = (owners[i] == &out_pipe[0]) ? result.stdout_text
                                                                : result.stderr_text;
                drain_fd(*owners[i], sink);
            }
        }
    }

    close_fd(out_pipe[0]);
    close_fd(err_pipe[0]);

    if (!timed_out && !reap_until(pid, status, deadline)) {
        timed_out = true;
    }

    if (timed_out) {
        terminate_child(pid, status);
        result.error = ProcessError::TimedOut;
        spdlog::debug("[Process] {} timed out after {} ms", argv.front(), timeout.count());
        return result;
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }

    if (result.exit_code != 0) {
        result.error = ProcessError::NonZeroExit;
    }
    return result;
}
