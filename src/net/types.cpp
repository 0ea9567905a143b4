#include "linewire/net/types.hpp"

#include <string>

namespace linewire::net {

std::string to_string(const IoError& error) {
    std::string s;
    switch (error.kind) {
        case IoErrorKind::Eof:
            return error.message;
        case IoErrorKind::Read:
            s = "read error: ";
            break;
        case IoErrorKind::Write:
            s = "write error: ";
            break;
    }
    s += error.message;
    if (error.sys_errno != 0) {
        s += " (errno " + std::to_string(error.sys_errno) + ")";
    }
    return s;
}

}  // namespace linewire::net
