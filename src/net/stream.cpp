#include "linewire/net/stream.hpp"

#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <string>

namespace linewire::net {

namespace {

IoError errno_error(IoErrorKind kind, int err) {
    return {kind, err, std::strerror(err)};
}

}  // namespace

std::optional<IoError> FdStream::read_some(char* buf, std::size_t len, std::size_t& n) {
    n = 0;
    if (closed_) {
        return IoError{IoErrorKind::Read, EBADF, "stream closed"};
    }
    while (true) {
        ssize_t got = recv(fd_, buf, len, 0);
        if (got > 0) {
            n = static_cast<std::size_t>(got);
            return std::nullopt;
        }
        if (got == 0) {
            return IoError::eof();
        }
        if (errno == EINTR) {
            continue;
        }
        // EAGAIN/EWOULDBLOCK here means SO_RCVTIMEO expired
        return errno_error(IoErrorKind::Read, errno);
    }
}

std::optional<IoError> FdStream::write_all(std::string_view data) {
    if (closed_) {
        return IoError{IoErrorKind::Write, EBADF, "stream closed"};
    }
    const char* ptr = data.data();
    size_t total_sent = 0;
    while (total_sent < data.size()) {
        // MSG_NOSIGNAL: a closed peer gives EPIPE instead of killing the process with SIGPIPE
        ssize_t sent = send(fd_, ptr + total_sent, data.size() - total_sent, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) {
                continue;
            }
            return errno_error(IoErrorKind::Write, errno);
        }
        if (sent == 0) {
            return IoError{IoErrorKind::Write, 0, "connection closed during write"};
        }
        total_sent += static_cast<size_t>(sent);
    }
    return std::nullopt;
}

void FdStream::close() {
    if (closed_) {
        return;
    }
    closed_ = true;
    // ENOTCONN if the peer is already gone, nothing to do about it
    shutdown(fd_, SHUT_RDWR);
}

}  // namespace linewire::net
