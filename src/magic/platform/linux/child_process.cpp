#include "platform/linux/child_process.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

// Child side of a failed exec/chdir: report errno to the parent and exit.
[[noreturn]] void child_fail(int err_fd, int stage) {
    int msg[2] = {stage, errno};
    ssize_t ignored = ::write(err_fd, msg, sizeof(msg));
    (void)ignored;
    ::_exit(127);
}

enum : int { STAGE_CHDIR = 1, STAGE_EXEC = 2, STAGE_STDIO = 3 };

} // namespace

ChildProcess::~ChildProcess() {
    kill();
}

ChildProcess::ChildProcess(ChildProcess&& other) noexcept
    : pid_(other.pid_), stdin_fd_(other.stdin_fd_), exit_status_(other.exit_status_) {
    other.pid_ = -1;
    other.stdin_fd_ = -1;
    other.exit_status_.reset();
}

ChildProcess& ChildProcess::operator=(ChildProcess&& other) noexcept {
    if (this != &other) {
        kill();
        pid_ = other.pid_;
        stdin_fd_ = other.stdin_fd_;
        exit_status_ = other.exit_status_;
        other.pid_ = -1;
        other.stdin_fd_ = -1;
        other.exit_status_.reset();
    }
    return *this;
}

std::expected<ChildProcess, std::string> ChildProcess::spawn(const SpawnOptions& opts) {
    // Build argv before forking; only async-signal-safe calls in the child.
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(opts.program.c_str()));
    for (auto& a : opts.args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    std::string cwd = opts.cwd ? opts.cwd->string() : std::string();

    // A socket rather than a pipe so writes can use MSG_NOSIGNAL.
    int stdin_pair[2];
    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, stdin_pair) < 0) {
        return std::unexpected(std::string("socketpair() failed: ") + std::strerror(errno));
    }

    // Closed by a successful exec, so a zero-length read means exec worked.
    int err_pipe[2];
    if (::pipe2(err_pipe, O_CLOEXEC) < 0) {
        int err = errno;
        ::close(stdin_pair[0]);
        ::close(stdin_pair[1]);
        return std::unexpected(std::string("pipe2() failed: ") + std::strerror(err));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        ::close(stdin_pair[0]);
        ::close(stdin_pair[1]);
        ::close(err_pipe[0]);
        ::close(err_pipe[1]);
        return std::unexpected(std::string("fork() failed: ") + std::strerror(err));
    }

    if (pid == 0) {
        ::close(err_pipe[0]);
        ::close(stdin_pair[0]);

        int devnull = ::open("/dev/null", O_WRONLY);
        if (devnull < 0) child_fail(err_pipe[1], STAGE_STDIO);
        if (::dup2(stdin_pair[1], STDIN_FILENO) < 0) child_fail(err_pipe[1], STAGE_STDIO);
        if (::dup2(devnull, STDOUT_FILENO) < 0) child_fail(err_pipe[1], STAGE_STDIO);
        if (::dup2(devnull, STDERR_FILENO) < 0) child_fail(err_pipe[1], STAGE_STDIO);
        ::close(devnull);
        ::close(stdin_pair[1]);

        if (!cwd.empty() && ::chdir(cwd.c_str()) < 0) child_fail(err_pipe[1], STAGE_CHDIR);

        ::execvp(argv[0], argv.data());
        child_fail(err_pipe[1], STAGE_EXEC);
    }

    ::close(stdin_pair[1]);
    ::close(err_pipe[1]);

    ChildProcess child;
    child.pid_ = pid;
    child.stdin_fd_ = stdin_pair[0];

    int msg[2];
    ssize_t n;
    do {
        n = ::read(err_pipe[0], msg, sizeof(msg));
    } while (n < 0 && errno == EINTR);
    ::close(err_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(msg))) {
        // child has already called _exit; kill() just reaps it
        child.kill();
        const char* what = msg[0] == STAGE_CHDIR ? "chdir"
                         : msg[0] == STAGE_EXEC  ? "exec"
                                                 : "stdio setup";
        std::string target = msg[0] == STAGE_CHDIR ? cwd : opts.program;
        return std::unexpected(std::string(what) + " " + target + " failed: " +
                               std::strerror(msg[1]));
    }

    return child;
}

std::expected<void, std::string> ChildProcess::write_stdin(std::string_view data) {
    if (stdin_fd_ < 0) {
        return std::unexpected(std::string("stdin is not open"));
    }

    size_t total_written = 0;
    while (total_written < data.size()) {
        ssize_t n = ::send(stdin_fd_, data.data() + total_written,
                           data.size() - total_written, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(std::string("send() failed: ") + std::strerror(errno));
        }
        total_written += static_cast<size_t>(n);
    }
    return {};
}

bool ChildProcess::running() {
    if (pid_ < 0 || exit_status_) return false;

    int status;
    pid_t r;
    do {
        r = ::waitpid(pid_, &status, WNOHANG);
    } while (r < 0 && errno == EINTR);

    if (r == pid_) {
        exit_status_ = status;
        return false;
    }
    // Not reaped by us (still alive, or reaped elsewhere, e.g. SIGCHLD
    // ignored). Only a status we collected counts as exited.
    return true;
}

void ChildProcess::kill() {
    if (stdin_fd_ >= 0) {
        ::close(stdin_fd_);
        stdin_fd_ = -1;
    }

    if (pid_ < 0) return;

    if (!exit_status_) {
        // ESRCH or a zombie child are both fine here
        ::kill(pid_, SIGKILL);

        int status;
        while (::waitpid(pid_, &status, 0) < 0) {
            if (errno != EINTR) break;
        }
    }

    pid_ = -1;
    exit_status_.reset();
}

std::string describe_wait_status(int status) {
    if (WIFEXITED(status)) return "exited with code " + std::to_string(WEXITSTATUS(status));
    if (WIFSIGNALED(status)) return "killed by signal " + std::to_string(WTERMSIG(status));
    return "stopped";
}
