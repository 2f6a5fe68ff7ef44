#include "magic_instance.hpp"

#include "bootstrap.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <format>
#include <print>
#include <thread>

namespace {

constexpr auto BACKOFF_INITIAL = std::chrono::milliseconds(1);
constexpr auto BACKOFF_MAX = std::chrono::milliseconds(100);

// Errors that mean "nobody is listening yet".
bool retryable(int err) {
    return err == ECONNREFUSED || err == ECONNRESET || err == ETIMEDOUT ||
           err == EINTR || err == EAGAIN || err == ECONNABORTED;
}

std::expected<LineConnection, MagicError>
wait_for_listener(ChildProcess& child, const MagicConfig& config) {
    using clock = std::chrono::steady_clock;

    const bool bounded = config.startup_timeout.count() > 0;
    const auto deadline = clock::now() + config.startup_timeout;
    auto backoff = std::chrono::milliseconds(BACKOFF_INITIAL);

    for (int attempt = 1;; ++attempt) {
        auto conn = LineConnection::connect_loopback(config.port);
        if (conn) {
            if (config.verbose) {
                std::println(stderr, "magic: connected to port {} after {} attempt(s)",
                             config.port, attempt);
            }
            return std::move(*conn);
        }

        if (!retryable(conn.error())) {
            return std::unexpected(MagicError{
                MagicErrc::Connect,
                std::format("connect to 127.0.0.1:{} failed: {}", config.port,
                            std::strerror(conn.error()))});
        }

        if (!child.running()) {
            auto status = child.exit_status();
            return std::unexpected(MagicError{
                MagicErrc::Connect,
                std::format("magic {} before opening port {}",
                            status ? describe_wait_status(*status) : std::string("exited"),
                            config.port)});
        }

        if (bounded) {
            auto now = clock::now();
            if (now >= deadline) {
                return std::unexpected(MagicError{
                    MagicErrc::StartupTimeout,
                    std::format("port {} not open after {} ms ({} attempts)", config.port,
                                config.startup_timeout.count(), attempt)});
            }
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
            std::this_thread::sleep_for(std::min(backoff, left));
        } else {
            std::this_thread::sleep_for(backoff);
        }
        backoff = std::min(backoff * 2, std::chrono::milliseconds(BACKOFF_MAX));
    }
}

} // namespace

std::expected<MagicInstance, MagicError> MagicConfig::build() const {
    return MagicInstance::start(*this);
}

MagicInstance::MagicInstance(ChildProcess child, LineConnection conn, uint16_t port)
    : child_(std::move(child)), conn_(std::move(conn)), port_(port) {}

std::expected<MagicInstance, MagicError> MagicInstance::start(const MagicConfig& config) {
    SpawnOptions opts;
    opts.program = config.binary();
    opts.args = {"-dnull", "-noconsole"};
    if (config.tech) {
        opts.args.push_back("-T");
        opts.args.push_back(*config.tech);
    }
    opts.cwd = config.cwd;

    auto child = ChildProcess::spawn(opts);
    if (!child) {
        return std::unexpected(MagicError{MagicErrc::Spawn, child.error()});
    }

    if (config.verbose) {
        std::println(stderr, "magic: started {} (pid {}), command port {}",
                     opts.program, child->pid(), config.port);
    }

    // From here on, returning early destroys `child`, which kills it.
    if (auto res = child->write_stdin(bootstrap::payload(config.port)); !res) {
        return std::unexpected(MagicError{MagicErrc::HandshakeWrite, res.error()});
    }

    auto conn = wait_for_listener(*child, config);
    if (!conn) return std::unexpected(conn.error());

    return MagicInstance(std::move(*child), std::move(*conn), config.port);
}

std::expected<std::string, MagicError> MagicInstance::command(std::string_view line) {
    if (auto res = conn_.write_line(line); !res) {
        return std::unexpected(res.error());
    }
    return conn_.read_line();
}

std::expected<void, MagicError> MagicInstance::getcell(std::string_view cell) {
    auto reply = command(std::format("getcell {}", cell));
    if (!reply) return std::unexpected(reply.error());
    return {};
}

std::expected<void, MagicError> MagicInstance::sideways() {
    auto reply = command("sideways");
    if (!reply) return std::unexpected(reply.error());
    return {};
}

std::expected<void, MagicError> MagicInstance::select_bbox() {
    auto reply = command("select bbox");
    if (!reply) return std::unexpected(reply.error());
    return {};
}
