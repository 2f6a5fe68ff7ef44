#pragma once

#include "config.hpp"
#include "error.hpp"
#include "line_connection.hpp"
#include "platform/linux/child_process.hpp"

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

// A running magic process and the command connection to it. The process is
// killed when the instance is destroyed.
//
// Not thread-safe: calls on one instance must be serialized by the caller.
// Separate instances on separate ports are independent.
class MagicInstance {
public:
    // Spawns magic, sends it the bootstrap script and waits for its command
    // port to accept a connection.
    static std::expected<MagicInstance, MagicError> start(const MagicConfig& config);

    ~MagicInstance() = default;

    MagicInstance(MagicInstance&&) noexcept = default;
    MagicInstance& operator=(MagicInstance&&) noexcept = default;

    MagicInstance(const MagicInstance&) = delete;
    MagicInstance& operator=(const MagicInstance&) = delete;

    // Sends one command line and returns magic's one-line reply.
    std::expected<std::string, MagicError> command(std::string_view line);

    // Places an instance of `cell` in the current edit cell.
    std::expected<void, MagicError> getcell(std::string_view cell);

    // Flips the selection left to right.
    std::expected<void, MagicError> sideways();

    // Queries the selection bounding box. The reply is not decoded.
    std::expected<void, MagicError> select_bbox();

    pid_t pid() const { return child_.pid(); }
    uint16_t port() const { return port_; }

private:
    MagicInstance(ChildProcess child, LineConnection conn, uint16_t port);

    // Destroyed after conn_, so the socket closes before the kill.
    ChildProcess child_;
    LineConnection conn_;
    uint16_t port_;
};
