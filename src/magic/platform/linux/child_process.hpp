#pragma once

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <sys/types.h>
#include <vector>

struct SpawnOptions {
    std::string program;              // resolved through PATH if it has no '/'
    std::vector<std::string> args;    // not including argv[0]
    std::optional<std::filesystem::path> cwd;
};

// A forked child whose stdin is writable by us and whose stdout/stderr go to
// /dev/null. The child is killed and reaped when this object is destroyed.
class ChildProcess {
public:
    ChildProcess() = default;
    ~ChildProcess();

    ChildProcess(ChildProcess&& other) noexcept;
    ChildProcess& operator=(ChildProcess&& other) noexcept;

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    // Fails if fork fails, or if chdir/exec fails in the child.
    static std::expected<ChildProcess, std::string> spawn(const SpawnOptions& opts);

    std::expected<void, std::string> write_stdin(std::string_view data);

    // Non-blocking. Reaps the child if it has exited. Returns true unless
    // this call (or an earlier one) collected the exit status.
    bool running();

    // Raw wait status, set once the child has been reaped by running().
    std::optional<int> exit_status() const { return exit_status_; }

    // SIGKILL and reap. Safe to call on an exited or empty process.
    void kill();

    pid_t pid() const { return pid_; }

private:
    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    std::optional<int> exit_status_;
};

// "exited with code N" / "killed by signal N"
std::string describe_wait_status(int status);
