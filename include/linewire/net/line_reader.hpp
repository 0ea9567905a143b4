#ifndef LINEWIRE_NET_LINE_READER_HPP
#define LINEWIRE_NET_LINE_READER_HPP

#include <cstddef>
#include <optional>
#include <string>

#include "linewire/net/stream.hpp"
#include "linewire/net/types.hpp"

namespace linewire::net {

// buffered reader that hands out '\n' terminated lines from an IStream
class LineReader {
   public:
    explicit LineReader(IStream& stream) : stream_(stream) {}

    /*
        reads up to and including the next '\n'. the line is returned raw, with its
        '\n' and any '\r' before it. on failure line holds nothing and bytes of an
        unterminated tail stay buffered.
    */
    [[nodiscard]] std::optional<IoError> read_line(std::string& line);

    [[nodiscard]] std::size_t buffered() const noexcept {
        return buffer_.size();
    }

   private:
    static constexpr std::size_t kChunkSize = 4096;

    IStream& stream_;
    std::string buffer_;
};

// strips one trailing '\n', then one trailing '\r'
std::string chop(const std::string& line);

}  // namespace linewire::net

#endif
