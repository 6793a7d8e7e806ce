#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/container/flat_map.hpp>

#include "byte_range.hpp"

using bytes_t = std::vector<std::uint8_t>;

struct Response
{
    using headers_t = boost::container::flat_map<std::string, std::string>;

    unsigned status{0};
    headers_t headers; // names are stored lower-cased
    bytes_t body;

    void set_header(std::string_view name, std::string_view value);

    /// Case-insensitive header lookup
    std::optional<std::string> header(std::string_view name) const;

    bool is_success() const { return status >= 200 && status < 300; }
};

/**
 * One HTTP exchange against the stream's server.
 *
 * A ranged request returns whatever body bytes the server sent before it
 * ended or closed the response, which may be fewer than requested. An
 * unranged request is only used to learn the declared length, and
 * implementations may skip its body.
 *
 * Implementations must be safe to call from several threads at once and
 * report failures below HTTP by throwing TransportError.
 */
class Transport {
  public:
    virtual ~Transport() = default;

    virtual Response request(const std::optional<ByteRange> &range) = 0;
};
