#pragma once

#include <cstdint>
#include <string>
#include <vector>

/**
 * Half-open interval [begin, end) of stream offsets.
 *
 * Every component works with this convention. The inclusive form HTTP uses
 * only appears in to_header().
 */
struct ByteRange
{
    std::uint64_t begin{0};
    std::uint64_t end{0};

    std::uint64_t size() const { return end - begin; }
    bool empty() const { return begin == end; }

    /// Value for a `Range` request header, e.g. "bytes=0-65535"
    std::string to_header() const;

    /// Remainder of this range once `received` leading bytes are in hand
    ByteRange tail(std::uint64_t received) const
    {
        return ByteRange{begin + received, end};
    }

    bool operator==(const ByteRange &) const = default;
};

std::string to_string(const ByteRange &range);

/**
 * Splits [0, total_length) into `parts` contiguous ranges of
 * total_length / parts bytes; the last range absorbs the remainder.
 *
 * `parts` is clamped to [1, total_length] so that no empty range is produced.
 * An empty stream yields no ranges.
 */
std::vector<ByteRange> partition(std::uint64_t total_length, std::size_t parts);

/// Sum of the sizes of `ranges`
std::uint64_t total_size(const std::vector<ByteRange> &ranges);
