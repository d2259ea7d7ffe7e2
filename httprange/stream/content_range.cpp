#include "content_range.hpp"
#include <regex>
#include <boost/lexical_cast.hpp>

namespace httprange {

    std::optional<content_range> content_range::parse(const std::string& value) {
        static const std::regex range_regex(R"(^\s*bytes\s+(\d+)-(\d+)/(\d+|\*)\s*$)", std::regex::icase);
        std::smatch what;
        if (!std::regex_match(value, what, range_regex)) {
            return std::nullopt;
        }

        content_range range;
        try {
            range.first = boost::lexical_cast<uint64_t>(what[1].str());
            range.last = boost::lexical_cast<uint64_t>(what[2].str());
            if (what[3].str() != "*") {
                range.complete_length = boost::lexical_cast<uint64_t>(what[3].str());
            }
        } catch (const boost::bad_lexical_cast&) {
            return std::nullopt;
        }

        if (range.last < range.first) {
            return std::nullopt;
        }
        return range;
    }

    std::string format_range(uint64_t first, uint64_t last) {
        return "bytes=" + std::to_string(first) + "-" + std::to_string(last);
    }

}
