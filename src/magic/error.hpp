#pragma once

#include <string>
#include <string_view>

// Phase in which a MagicInstance operation failed.
enum class MagicErrc {
    Spawn,           // binary missing, exec or chdir failed
    HandshakeWrite,  // bootstrap script could not be written to magic's stdin
    Connect,         // non-retryable socket error, or magic exited during startup
    StartupTimeout,  // listener never came up within the startup timeout
    CommandWrite,
    ReplyRead,
    Decode,          // reply is not valid UTF-8
};

struct MagicError {
    MagicErrc code;
    std::string message;

    // "<phase>: <message>"
    std::string describe() const;
};

std::string_view to_string(MagicErrc code);
