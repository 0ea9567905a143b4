#ifndef LINEWIRE_NET_REPLY_HPP
#define LINEWIRE_NET_REPLY_HPP

#include <optional>
#include <string>

#include "linewire/net/stream.hpp"
#include "linewire/net/types.hpp"

namespace linewire::net {

class ReplyEncoder {
   public:
    /*
        "250", "a\nb" -> "250-a\r\n250 b\r\n"
        every line but the last uses '-' after the code, the last uses ' '.
        an empty message still produces one line ("250 \r\n").
    */
    static std::string encode(int code, const std::string& message);
    static std::string encode(const Reply& reply) {
        return encode(reply.code, reply.message);
    }

    // zero padded to at least three digits
    static std::string format_code(int code);
};

// encodes and writes the reply with a single write_all
[[nodiscard]] std::optional<IoError> send_reply(IStream& stream, int code,
                                                const std::string& message);

}  // namespace linewire::net

#endif
