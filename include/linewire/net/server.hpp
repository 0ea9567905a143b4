#ifndef LINEWIRE_NET_SERVER_HPP
#define LINEWIRE_NET_SERVER_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "linewire/net/command.hpp"
#include "linewire/net/dispatch.hpp"
#include "linewire/net/stream.hpp"
#include "linewire/net/types.hpp"

namespace linewire::net {

struct ServerOptions {
    std::string host = "127.0.0.1";
    uint16_t port = 1234;  // 0 picks a free port, see Server::port()
    std::size_t max_connections = 1000;
    // socket level read/write timeout per connection, 0 disables. the engine has none of its own
    int client_timeout_seconds = 300;
};

// serves one accepted connection, returning how the session ended
using ConnectionHandler = std::function<std::optional<IoError>(IStream& stream)>;

/*
    TCP listener. every accepted connection gets its own thread running the handler;
    sessions share nothing but the handler itself.
*/
class Server {
   public:
    Server(ConnectionHandler handler, const ServerOptions& options = {});

    /*
        runs table on every connection with a fresh context from make_context().
        table is held by reference and must outlive the server.
    */
    template <typename Context, typename ContextFactory>
    Server(const ProtocolTable<Context>& table, ContextFactory make_context,
           const ServerOptions& options = {})
        : Server(
              [&table, make_context](IStream& stream) -> std::optional<IoError> {
                  Context context = make_context();
                  return run(table, stream, context);
              },
              options) {}

    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;
    Server(Server&&) noexcept;
    Server& operator=(Server&&) noexcept;

    // throws std::runtime_error if the socket can't be set up
    void start();
    // closes the listener, shuts down open connections and waits for their threads
    void stop();

    [[nodiscard]] bool running() const noexcept;
    [[nodiscard]] uint16_t port() const noexcept;
    [[nodiscard]] std::size_t active_connections() const;

   private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace linewire::net

#endif
