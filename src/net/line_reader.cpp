#include "linewire/net/line_reader.hpp"

namespace linewire::net {

std::optional<IoError> LineReader::read_line(std::string& line) {
    line.clear();
    char chunk[kChunkSize];

    // only the bytes appended since the last scan can hold the newline
    size_t scanned = 0;
    while (true) {
        size_t pos = buffer_.find('\n', scanned);
        if (pos != std::string::npos) {
            line = buffer_.substr(0, pos + 1);
            buffer_.erase(0, pos + 1);
            return std::nullopt;
        }
        scanned = buffer_.size();

        size_t n = 0;
        if (auto err = stream_.read_some(chunk, sizeof(chunk), n)) {
            return err;
        }
        buffer_.append(chunk, n);
    }
}

std::string chop(const std::string& line) {
    std::string s = line;
    if (!s.empty() && s.back() == '\n') {
        s.pop_back();
    }
    if (!s.empty() && s.back() == '\r') {
        s.pop_back();
    }
    return s;
}

}  // namespace linewire::net
