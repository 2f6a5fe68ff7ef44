#include "line_connection.hpp"

#include "utf8.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace {

std::expected<std::string, MagicError> decoded(std::string line) {
    if (!utf8::is_valid(line)) {
        return std::unexpected(MagicError{MagicErrc::Decode, "reply is not valid UTF-8"});
    }
    return line;
}

// recv() one chunk, retrying on EINTR. End of stream is an error.
std::expected<size_t, MagicError> recv_chunk(int fd, char* buf, size_t len) {
    while (true) {
        ssize_t n = ::recv(fd, buf, len, 0);
        if (n > 0) return static_cast<size_t>(n);
        if (n == 0) {
            return std::unexpected(MagicError{MagicErrc::ReplyRead, "connection closed by peer"});
        }
        if (errno == EINTR) continue;
        return std::unexpected(MagicError{MagicErrc::ReplyRead,
                                          std::string("recv() failed: ") + std::strerror(errno)});
    }
}

} // namespace

LineConnection::~LineConnection() {
    close();
}

LineConnection::LineConnection(LineConnection&& other) noexcept
    : fd_(other.fd_), buf_(std::move(other.buf_)) {
    other.fd_ = -1;
    other.buf_.clear();
}

LineConnection& LineConnection::operator=(LineConnection&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        buf_ = std::move(other.buf_);
        other.fd_ = -1;
        other.buf_.clear();
    }
    return *this;
}

std::expected<LineConnection, int> LineConnection::connect_loopback(uint16_t port) {
    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return std::unexpected(errno);

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        int err = errno;
        ::close(fd);
        return std::unexpected(err);
    }
    return LineConnection(fd);
}

std::expected<void, MagicError> LineConnection::write_line(std::string_view line) {
    if (fd_ < 0) {
        return std::unexpected(MagicError{MagicErrc::CommandWrite, "not connected"});
    }
    if (line.find('\n') != std::string_view::npos) {
        return std::unexpected(MagicError{MagicErrc::CommandWrite, "command contains a newline"});
    }

    std::string msg(line);
    msg.push_back('\n');

    size_t total_written = 0;
    while (total_written < msg.size()) {
        ssize_t n = ::send(fd_, msg.data() + total_written, msg.size() - total_written,
                           MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(MagicError{MagicErrc::CommandWrite,
                                              std::string("send() failed: ") + std::strerror(errno)});
        }
        total_written += static_cast<size_t>(n);
    }
    return {};
}

std::expected<std::string, MagicError> LineConnection::read_line() {
    if (fd_ < 0) {
        return std::unexpected(MagicError{MagicErrc::ReplyRead, "not connected"});
    }

    size_t scanned = 0;
    while (true) {
        auto pos = buf_.find('\n', scanned);
        if (pos != std::string::npos) {
            std::string line = buf_.substr(0, pos);
            buf_.erase(0, pos + 1);
            return decoded(std::move(line));
        }
        scanned = buf_.size();

        char chunk[CHUNK_SIZE];
        auto n = recv_chunk(fd_, chunk, sizeof(chunk));
        if (!n) return std::unexpected(n.error());
        buf_.append(chunk, *n);
    }
}

void LineConnection::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    buf_.clear();
}

std::expected<std::string, MagicError> read_line_unbuffered(int fd) {
    std::string line;
    char chunk[LineConnection::CHUNK_SIZE];

    while (true) {
        auto n = recv_chunk(fd, chunk, sizeof(chunk));
        if (!n) return std::unexpected(n.error());

        std::string_view got(chunk, *n);
        auto pos = got.find('\n');
        if (pos != std::string_view::npos) {
            line.append(got.substr(0, pos));
            return decoded(std::move(line));
        }
        line.append(got);
    }
}
