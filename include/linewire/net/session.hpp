#ifndef LINEWIRE_NET_SESSION_HPP
#define LINEWIRE_NET_SESSION_HPP

#include <optional>
#include <string>
#include <vector>

#include "linewire/net/line_reader.hpp"
#include "linewire/net/stream.hpp"
#include "linewire/net/types.hpp"

namespace linewire::net {

template <typename Context>
class ProtocolTable;

template <typename Context>
std::optional<IoError> run(const ProtocolTable<Context>& table, IStream& stream,
                           Context& context);

// lines received by read_body(), and the failure that cut the read short if any
struct BodyResult {
    std::vector<std::string> lines;
    std::optional<IoError> error;

    [[nodiscard]] bool ok() const noexcept {
        return !error.has_value();
    }
};

/*
    per-connection state shared by the dispatch loop and the handlers it calls.
    the stream is closed exactly once: by run() on termination, or by the destructor
    if a handler throws.
*/
class SessionBase {
   public:
    explicit SessionBase(IStream& stream) : stream_(stream), reader_(stream) {}
    ~SessionBase();

    SessionBase(const SessionBase&) = delete;
    SessionBase& operator=(const SessionBase&) = delete;

    /*
        sends (code, message) as a reply, then collects lines until one equals terminator
        once its trailing "\n" and "\r" are stripped. that line is consumed and dropped.
        body lines are kept exactly as received, line endings included.

        a transport failure is returned in the result and also recorded on the session:
        when the handler returns, run() ends the session with that error no matter what
        reply the handler produced.

            Reply data(const std::vector<std::string>&, Session<Mailbox>& s) {
                auto body = s.read_body(354, "End data with <CR><LF>.<CR><LF>", ".");
                if (!body.ok()) {
                    return {};  // not sent
                }
                s.context().store(body.lines);
                return {250, "Ok"};
            }
    */
    BodyResult read_body(int code, const std::string& message, const std::string& terminator);

    // first transport failure seen by read_body(). never cleared
    [[nodiscard]] const std::optional<IoError>& failure() const noexcept {
        return failure_;
    }

   private:
    template <typename Context>
    friend std::optional<IoError> run(const ProtocolTable<Context>& table, IStream& stream,
                                      Context& context);

    [[nodiscard]] std::optional<IoError> read_line(std::string& line) {
        return reader_.read_line(line);
    }
    /*
        sends a handler's reply unless the handler's read_body() already failed.
        returns true when the session is over, with result holding the error if any.
    */
    [[nodiscard]] bool deliver(const Reply& reply, std::optional<IoError>& result);
    void record(const IoError& error);
    void close();

    IStream& stream_;
    LineReader reader_;
    std::optional<IoError> failure_;
    bool closed_ = false;
};

template <typename Context>
class Session : public SessionBase {
   public:
    Session(IStream& stream, Context& context) : SessionBase(stream), context_(context) {}

    // the application state this connection was started with
    [[nodiscard]] Context& context() const noexcept {
        return context_;
    }

   private:
    Context& context_;
};

}  // namespace linewire::net

#endif
