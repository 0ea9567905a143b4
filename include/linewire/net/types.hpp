#ifndef LINEWIRE_NET_TYPES_HPP
#define LINEWIRE_NET_TYPES_HPP

#include <string>
#include <string_view>

namespace linewire::net {

/*
    reply code classes, as used by SMTP and FTP:
        1xx positive preliminary        x0x syntax
        2xx positive completion         x1x information
        3xx positive intermediate       x2x connection
        4xx transient negative          x3x authentication and accounting
        5xx permanent negative          x5x mail system / file system
    only kGoodbye and kUnavailable mean anything to the engine.
*/
inline constexpr int kHello = 220;           // conventional greeting code
inline constexpr int kGoodbye = 221;         // reply is sent, then the session ends
inline constexpr int kUnavailable = 421;     // same as kGoodbye
inline constexpr int kUnknownCommand = 500;  // sent for unmatched or empty lines
inline constexpr std::string_view kUnknownCommandMessage = "Unknown command";

// code in [0, 999]; lines of message are separated by '\n'
struct Reply {
    int code = 0;
    std::string message;

    [[nodiscard]] bool terminates() const noexcept {
        return code == kGoodbye || code == kUnavailable;
    }

    static Reply unknown_command() {
        return {kUnknownCommand, std::string(kUnknownCommandMessage)};
    }
};

enum class IoErrorKind {
    Eof,    // peer closed the connection
    Read,
    Write,
};

// transport failure. always ends the session it happened on
struct IoError {
    IoErrorKind kind = IoErrorKind::Read;
    int sys_errno = 0;
    std::string message;

    static IoError eof() {
        return {IoErrorKind::Eof, 0, "end of stream"};
    }

    bool operator==(const IoError& other) const {
        return kind == other.kind && sys_errno == other.sys_errno && message == other.message;
    }
    bool operator!=(const IoError& other) const {
        return !(*this == other);
    }
};

std::string to_string(const IoError& error);

}  // namespace linewire::net

#endif
