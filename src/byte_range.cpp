#include <algorithm>
#include <numeric>

#include <fmt/core.h>

#include "byte_range.hpp"

std::string ByteRange::to_header() const
{
    return fmt::format("bytes={}-{}", begin, end - 1);
}

std::string to_string(const ByteRange &range)
{
    return fmt::format("[{}, {})", range.begin, range.end);
}

std::vector<ByteRange> partition(std::uint64_t total_length, std::size_t parts)
{
    std::vector<ByteRange> ranges;
    if (total_length == 0)
    {
        return ranges;
    }

    std::uint64_t count =
        std::clamp<std::uint64_t>(parts, 1, total_length);
    std::uint64_t range_size = total_length / count;

    ranges.reserve(count);
    for (std::uint64_t i = 0; i != count; i++)
    {
        auto begin = range_size * i;
        auto end = (i + 1 == count) ? total_length : begin + range_size;
        ranges.push_back(ByteRange{begin, end});
    }
    return ranges;
}

std::uint64_t total_size(const std::vector<ByteRange> &ranges)
{
    return std::accumulate(ranges.begin(), ranges.end(), std::uint64_t{0},
                           [](std::uint64_t sum, const ByteRange &range)
                           { return sum + range.size(); });
}
