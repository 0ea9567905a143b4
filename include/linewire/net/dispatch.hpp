#ifndef LINEWIRE_NET_DISPATCH_HPP
#define LINEWIRE_NET_DISPATCH_HPP

#include <iterator>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "linewire/net/command.hpp"
#include "linewire/net/session.hpp"
#include "linewire/net/stream.hpp"
#include "linewire/net/types.hpp"

namespace linewire::net {

// tokenizes line and calls the matching handler. unmatched and empty lines get 500
template <typename Context>
Reply dispatch(const ProtocolTable<Context>& table, const std::string& line,
               Session<Context>& session) {
    std::vector<std::string> fields = tokenize(line);
    if (fields.empty()) {
        return Reply::unknown_command();
    }
    const auto* entry = table.find(fields.front());
    if (entry == nullptr) {
        return Reply::unknown_command();
    }
    std::vector<std::string> args(std::make_move_iterator(fields.begin() + 1),
                                  std::make_move_iterator(fields.end()));
    return entry->handler(args, session);
}

/*
    drives one connection to completion:
        1. greeting, if the table has one
        2. read a line, dispatch it, send the reply
        3. stop after a 221 or 421 reply, otherwise back to 2

    returns nullopt when the session ended with 221/421, otherwise the I/O error that
    ended it (IoErrorKind::Eof when the client hung up). if a handler's read_body()
    failed, that failure is returned and the handler's reply is never sent.
    the stream is closed before this returns. exceptions thrown by handlers propagate
    to the caller, after the stream is closed.
*/
template <typename Context>
std::optional<IoError> run(const ProtocolTable<Context>& table, IStream& stream,
                           Context& context) {
    Session<Context> session(stream, context);
    SessionBase& io = session;
    std::optional<IoError> result;
    bool done = false;

    if (const auto* greet = table.greeting()) {
        const std::vector<std::string> no_args;
        done = io.deliver(greet->handler(no_args, session), result);
    }

    std::string line;
    while (!done) {
        if (auto err = io.read_line(line)) {
            result = std::move(err);
            break;
        }
        done = io.deliver(dispatch(table, line, session), result);
    }

    io.close();
    return result;
}

}  // namespace linewire::net

#endif
