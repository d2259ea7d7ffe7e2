#include "range_streambuf.hpp"
#include <algorithm>
#include <cstring>

namespace httprange {

range_streambuf::range_streambuf(range_stream& stream, std::size_t buffer_size)
    : stream_(stream)
    , buffer_(std::clamp<std::size_t>(buffer_size, 1, MAX_BUFFER_SIZE)) {
    setg(buffer_.data(), buffer_.data(), buffer_.data());
}

uint64_t range_streambuf::logical_position() const {
    return stream_.tell() - static_cast<uint64_t>(egptr() - gptr());
}

range_streambuf::int_type range_streambuf::underflow() {
    if (gptr() < egptr()) {
        return traits_type::to_int_type(*gptr());
    }

    auto count = stream_.read(buffer_.data(), buffer_.size());
    setg(buffer_.data(), buffer_.data(), buffer_.data() + count);
    if (count == 0) {
        return traits_type::eof();
    }
    return traits_type::to_int_type(*gptr());
}

std::streamsize range_streambuf::xsgetn(char_type* s, std::streamsize count) {
    std::streamsize copied = 0;

    // drain what is already buffered
    auto buffered = std::min<std::streamsize>(count, egptr() - gptr());
    if (buffered > 0) {
        std::memcpy(s, gptr(), static_cast<size_t>(buffered));
        gbump(static_cast<int>(buffered));
        copied = buffered;
    }

    // large reads go straight to the stream
    if (copied < count) {
        copied += static_cast<std::streamsize>(
            stream_.read(s + copied, static_cast<size_t>(count - copied)));
    }
    return copied;
}

std::streamsize range_streambuf::showmanyc() {
    auto position = logical_position();
    if (position >= stream_.size()) {
        return -1;
    }
    return static_cast<std::streamsize>(stream_.size() - position);
}

range_streambuf::pos_type range_streambuf::seekoff(off_type off, std::ios_base::seekdir dir,
                                                   std::ios_base::openmode which) {
    if (which & std::ios_base::out) {
        return pos_type(off_type(-1));
    }

    // tellg
    if (dir == std::ios_base::cur && off == 0) {
        return pos_type(static_cast<off_type>(logical_position()));
    }

    seek_origin origin;
    int64_t offset = off;
    switch (dir) {
        case std::ios_base::beg:
            origin = seek_origin::begin;
            break;
        case std::ios_base::cur:
            origin = seek_origin::begin;
            offset = static_cast<int64_t>(logical_position()) + off;
            break;
        case std::ios_base::end:
            origin = seek_origin::end;
            break;
        default:
            return pos_type(off_type(-1));
    }

    setg(buffer_.data(), buffer_.data(), buffer_.data());
    return pos_type(static_cast<off_type>(stream_.seek(offset, origin)));
}

range_streambuf::pos_type range_streambuf::seekpos(pos_type pos, std::ios_base::openmode which) {
    return seekoff(off_type(pos), std::ios_base::beg, which);
}

}
