#include "linewire/net/reply.hpp"

#include <cstdio>

namespace linewire::net {

std::string ReplyEncoder::format_code(int code) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%03d", code);
    return buf;
}

std::string ReplyEncoder::encode(int code, const std::string& message) {
    const std::string prefix = format_code(code);
    std::string out;
    out.reserve(message.size() + prefix.size() + 3);

    size_t start = 0;
    while (true) {
        size_t nl = message.find('\n', start);
        if (nl == std::string::npos) {
            out += prefix;
            out += ' ';
            out.append(message, start, std::string::npos);
            out += "\r\n";
            break;
        }
        out += prefix;
        out += '-';
        out.append(message, start, nl - start);
        out += "\r\n";
        start = nl + 1;
    }
    return out;
}

std::optional<IoError> send_reply(IStream& stream, int code, const std::string& message) {
    return stream.write_all(ReplyEncoder::encode(code, message));
}

}  // namespace linewire::net
