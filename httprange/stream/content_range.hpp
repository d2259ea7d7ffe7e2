#ifndef HTTPRANGE_STREAM_CONTENT_RANGE_HPP
#define HTTPRANGE_STREAM_CONTENT_RANGE_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace httprange {

    /// Parsed `Content-Range: bytes first-last/complete` value.
    struct content_range {
        uint64_t first = 0;
        uint64_t last = 0;
        // complete length, empty when the server sent "*"
        std::optional<uint64_t> complete_length;

        static std::optional<content_range> parse(const std::string& value);
    };

    /// `bytes=first-last` for a Range request header (last is inclusive)
    std::string format_range(uint64_t first, uint64_t last);

}

#endif
