#pragma once

#include <cstdint>

#include "transport.hpp"

/**
 * Asks the server for the declared length of the stream with one unranged
 * request.
 *
 * @throw ProtocolError if the request fails, the status is not 2xx or the
 *        Content-Length header is missing or not a decimal integer
 */
std::uint64_t probe_length(Transport &transport);

/// Strict decimal parse of a Content-Length value, surrounding blanks allowed
std::uint64_t parse_content_length(const std::string &value);
