#ifndef HTTPRANGE_STREAM_RANGE_STREAMBUF_HPP
#define HTTPRANGE_STREAM_RANGE_STREAMBUF_HPP

#include <streambuf>
#include <vector>
#include "range_stream.hpp"

namespace httprange {

    /**
     * Input-only std::streambuf over a range_stream, for consumers reading
     * through std::istream. The range_stream must outlive the buffer.
     *
     *   httprange::range_streambuf buffer(stream);
     *   std::istream in(&buffer);
     *   in.seekg(-22, std::ios::end);
     */
    class range_streambuf : public std::streambuf {
    public:
        static constexpr std::size_t DEFAULT_BUFFER_SIZE = 64 * 1024;
        // keeps buffered counts within the int range of gbump()
        static constexpr std::size_t MAX_BUFFER_SIZE = 16 * 1024 * 1024;

        /// `buffer_size` is clamped to [1, MAX_BUFFER_SIZE]
        explicit range_streambuf(range_stream& stream, std::size_t buffer_size = DEFAULT_BUFFER_SIZE);

        std::size_t buffer_size() const { return buffer_.size(); }

    protected:
        int_type underflow() override;
        std::streamsize xsgetn(char_type* s, std::streamsize count) override;
        std::streamsize showmanyc() override;
        pos_type seekoff(off_type off, std::ios_base::seekdir dir,
                         std::ios_base::openmode which = std::ios_base::in) override;
        pos_type seekpos(pos_type pos, std::ios_base::openmode which = std::ios_base::in) override;

    private:
        uint64_t logical_position() const;

        range_stream& stream_;
        std::vector<char> buffer_;
    };

}

#endif
