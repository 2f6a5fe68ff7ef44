#include "bootstrap.hpp"

#include <format>

namespace bootstrap {

const std::string_view SERVER_SCRIPT = R"tcl(
proc magicsrv_reply {sock line} {
    if {[catch {uplevel #0 $line} result]} {
        set result "error: $result"
    }
    # One reply line per request, whatever the command printed.
    puts $sock [string map {"\n" " " "\r" " "} $result]
    flush $sock
}

proc magicsrv_readable {sock} {
    if {[gets $sock line] < 0} {
        if {[eof $sock]} {
            close $sock
        }
        return
    }
    magicsrv_reply $sock $line
}

proc magicsrv_accept {sock addr port} {
    fconfigure $sock -buffering line -blocking 0 -translation lf
    fileevent $sock readable [list magicsrv_readable $sock]
}

socket -server magicsrv_accept -myaddr 127.0.0.1 $svcPort
vwait magicsrv_forever
)tcl";

std::string payload(uint16_t port) {
    std::string out = std::format("set {} {}\n", PORT_VARIABLE, port);
    out.append(SERVER_SCRIPT);
    return out;
}

} // namespace bootstrap
