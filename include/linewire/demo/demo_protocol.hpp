#ifndef LINEWIRE_DEMO_DEMO_PROTOCOL_HPP
#define LINEWIRE_DEMO_DEMO_PROTOCOL_HPP

#include <cstddef>
#include <string>

#include "linewire/net/command.hpp"

namespace linewire::demo {

// per-connection state of the demo protocol
struct Conversation {
    bool greeted = false;
    std::size_t messages_told = 0;
};

/*
    small conversational protocol served by linewire_server:
        help            list of commands (214)
        helo            250, and unlocks how
        how are you     200
        how is [name]   201
        tell [someone]  354, reads a body up to ".", then 250 with its line count
        quit            221
        mail/rcpt/data  421, the client is mistaking us for an SMTP server
*/
net::ProtocolTable<Conversation> make_demo_protocol(const std::string& greeting);

}  // namespace linewire::demo

#endif
