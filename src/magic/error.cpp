#include "error.hpp"

std::string_view to_string(MagicErrc code) {
    switch (code) {
        case MagicErrc::Spawn: return "spawn";
        case MagicErrc::HandshakeWrite: return "handshake-write";
        case MagicErrc::Connect: return "connect";
        case MagicErrc::StartupTimeout: return "startup-timeout";
        case MagicErrc::CommandWrite: return "command-write";
        case MagicErrc::ReplyRead: return "reply-read";
        case MagicErrc::Decode: return "decode";
    }
    return "unknown";
}

std::string MagicError::describe() const {
    return std::string(to_string(code)) + ": " + message;
}
