#include "linewire/net/session.hpp"

#include <utility>

#include "linewire/net/reply.hpp"

namespace linewire::net {

SessionBase::~SessionBase() {
    close();
}

BodyResult SessionBase::read_body(int code, const std::string& message,
                                  const std::string& terminator) {
    BodyResult result;
    if (auto err = send_reply(stream_, code, message)) {
        record(*err);
        result.error = std::move(err);
        return result;
    }

    std::string line;
    while (true) {
        if (auto err = reader_.read_line(line)) {
            record(*err);
            result.error = std::move(err);
            return result;
        }
        if (chop(line) == terminator) {
            break;
        }
        result.lines.push_back(std::move(line));
    }
    return result;
}

void SessionBase::record(const IoError& error) {
    if (!failure_) {
        failure_ = error;
    }
}

bool SessionBase::deliver(const Reply& reply, std::optional<IoError>& result) {
    if (failure_) {
        result = failure_;
        return true;
    }
    if (auto err = send_reply(stream_, reply.code, reply.message)) {
        result = std::move(err);
        return true;
    }
    return reply.terminates();
}

void SessionBase::close() {
    if (closed_) {
        return;
    }
    closed_ = true;
    stream_.close();
}

}  // namespace linewire::net
