#pragma once

#include "error.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

// Newline-delimited text over a TCP socket. Owns the socket and a residual
// buffer holding bytes received past the last delimiter.
class LineConnection {
public:
    static constexpr size_t CHUNK_SIZE = 512;

    explicit LineConnection(int fd) : fd_(fd) {}
    ~LineConnection();

    LineConnection(LineConnection&& other) noexcept;
    LineConnection& operator=(LineConnection&& other) noexcept;

    LineConnection(const LineConnection&) = delete;
    LineConnection& operator=(const LineConnection&) = delete;

    // One connection attempt to 127.0.0.1:<port>. Returns errno on failure.
    static std::expected<LineConnection, int> connect_loopback(uint16_t port);

    // Sends `line` followed by '\n'. Embedded newlines are rejected.
    std::expected<void, MagicError> write_line(std::string_view line);

    // Blocks until a full line is available; the delimiter is stripped.
    std::expected<std::string, MagicError> read_line();

    bool is_open() const { return fd_ >= 0; }
    const std::string& pending() const { return buf_; }
    void close();

private:
    int fd_ = -1;
    std::string buf_;
};

// Reads one line from `fd` without keeping state between calls. Anything
// received after the delimiter in the same chunk is discarded.
std::expected<std::string, MagicError> read_line_unbuffered(int fd);
