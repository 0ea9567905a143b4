#include "linewire/demo/demo_protocol.hpp"

#include <string>
#include <vector>

namespace linewire::demo {

namespace {

using Session = net::Session<Conversation>;
using Args = std::vector<std::string>;

net::Reply help(const Args&, Session&) {
    return {214,
            "commands:\n"
            "help\n"
            "helo\n"
            "how are you\n"
            "how is [someone]\n"
            "tell [someone]\n"
            "quit"};
}

net::Reply helo(const Args&, Session& session) {
    session.context().greeted = true;
    return {250, "oh, hi!"};
}

net::Reply how(const Args& args, Session& session) {
    if (!session.context().greeted) {
        return {503, "say helo first"};
    }
    const net::Reply usage{501, "usage:\n    how are you\n    how is [name]"};
    if (args.size() != 2) {
        return usage;
    }
    if (args[0] == "are" && args[1] == "you") {
        return {200, "fine, thanks"};
    }
    if (args[0] == "is") {
        return {201, args[1] + " is ok"};
    }
    return usage;
}

net::Reply tell(const Args& args, Session& session) {
    if (args.size() != 1) {
        return {501, "usage: tell [someone]"};
    }
    auto body = session.read_body(354, "What should I tell them?\nTell me, terminate with \".\"",
                                  ".");
    if (!body.ok()) {
        return {};  // the session is over, this reply is never sent
    }
    ++session.context().messages_told;
    return {250, "Ok, I'll tell " + args[0] + " (" + std::to_string(body.lines.size()) +
                     " lines)."};
}

net::Reply smtp(const Args&, Session&) {
    return {net::kUnavailable, "what is it, ESMTP?  service unavailable!"};
}

net::Reply quit(const Args&, Session&) {
    return {net::kGoodbye, "bye"};
}

}  // namespace

net::ProtocolTable<Conversation> make_demo_protocol(const std::string& greeting) {
    return net::ProtocolTable<Conversation>{
        {"", [greeting](const Args&, Session&) { return net::Reply{net::kHello, greeting}; }},
        {"help", help},
        {"helo", helo},
        {"how", how},
        {"tell", tell},
        {"quit", quit},
        {"mail", smtp},
        {"rcpt", smtp},
        {"data", smtp},
    };
}

}  // namespace linewire::demo
