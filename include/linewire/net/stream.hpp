#ifndef LINEWIRE_NET_STREAM_HPP
#define LINEWIRE_NET_STREAM_HPP

#include <cstddef>
#include <optional>
#include <string_view>

#include "linewire/net/types.hpp"

namespace linewire::net {

// byte stream a session runs on. one session uses it from one thread at a time
class IStream {
   public:
    virtual ~IStream() = default;

    // reads at least one byte into buf, setting n. end of stream is IoErrorKind::Eof
    [[nodiscard]] virtual std::optional<IoError> read_some(char* buf, std::size_t len,
                                                           std::size_t& n) = 0;
    // writes all of data or fails
    [[nodiscard]] virtual std::optional<IoError> write_all(std::string_view data) = 0;
    virtual void close() = 0;
};

/*
    stream over a connected socket. does not take ownership of the descriptor:
    close() shuts the connection down in both directions (the peer sees the close and
    blocked reads on this side return) while releasing the descriptor is left to whoever
    accepted it. this keeps the fd number valid until the owner is done with it.
*/
class FdStream : public IStream {
   public:
    explicit FdStream(int fd) : fd_(fd) {}

    FdStream(const FdStream&) = delete;
    FdStream& operator=(const FdStream&) = delete;

    [[nodiscard]] std::optional<IoError> read_some(char* buf, std::size_t len,
                                                   std::size_t& n) override;
    [[nodiscard]] std::optional<IoError> write_all(std::string_view data) override;
    void close() override;

   private:
    int fd_;
    bool closed_ = false;
};

}  // namespace linewire::net

#endif
