#include <charconv>

#include <boost/algorithm/string/trim.hpp>
#include <fmt/core.h>

#include "errors.hpp"
#include "length_prober.hpp"

std::uint64_t parse_content_length(const std::string &value)
{
    auto trimmed = boost::algorithm::trim_copy(value);
    std::uint64_t length = 0;
    auto first = trimmed.data();
    auto last = trimmed.data() + trimmed.size();
    auto [end, ec] = std::from_chars(first, last, length);
    if (trimmed.empty() || ec != std::errc{} || end != last)
    {
        throw ProtocolError(
            fmt::format("invalid Content-Length value '{}'", value));
    }
    return length;
}

std::uint64_t probe_length(Transport &transport)
{
    Response response;
    try
    {
        response = transport.request(std::nullopt);
    }
    catch (const TransportError &e)
    {
        throw ProtocolError(fmt::format("length probe failed: {}", e.what()));
    }

    if (!response.is_success())
    {
        throw ProtocolError(fmt::format(
            "length probe answered with status {}", response.status));
    }
    auto content_length = response.header("Content-Length");
    if (!content_length)
    {
        throw ProtocolError("length probe response has no Content-Length");
    }
    return parse_content_length(*content_length);
}
