#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace bootstrap {

// Tcl variable the server script reads its port from.
inline constexpr std::string_view PORT_VARIABLE = "svcPort";

// Tcl source run inside magic. Opens a loopback command server on $svcPort
// that evaluates one command per line and answers with one line.
extern const std::string_view SERVER_SCRIPT;

// Bytes written to magic's stdin: the port assignment, then SERVER_SCRIPT.
std::string payload(uint16_t port);

} // namespace bootstrap
