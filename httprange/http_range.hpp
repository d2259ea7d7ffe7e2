#ifndef HTTPRANGE_HTTP_RANGE_HPP
#define HTTPRANGE_HTTP_RANGE_HPP

// Random-access streams over HTTP byte ranges

#include <httprange/stream/errors.hpp>
#include <httprange/stream/stream_options.hpp>
#include <httprange/stream/range_stream.hpp>
#include <httprange/stream/range_streambuf.hpp>

// Transport layer, for callers supplying or sharing their own
#include <httprange/http/client/transport.hpp>
#include <httprange/http/client/http_transport.hpp>

#include <httprange/util/logger.hpp>

#endif
