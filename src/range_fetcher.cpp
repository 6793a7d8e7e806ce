#include <algorithm>

#include <fmt/core.h>

#include "errors.hpp"
#include "range_fetcher.hpp"

RangeFetcher::RangeFetcher(Transport &transport, FetchStats &stats,
                           const std::atomic<bool> &cancelled,
                           std::size_t stall_limit, bool verbose)
    : m_transport(transport), m_stats(stats), m_cancelled(cancelled),
      m_stall_limit(std::max<std::size_t>(stall_limit, 1)), m_verbose(verbose)
{}

void RangeFetcher::fetch(const ByteRange &range, bytes_t &out)
{
    out.clear();
    out.reserve(range.size());

    std::uint64_t received = 0;
    std::size_t stalls = 0;

    auto stalled = [&]()
    {
        if (++stalls < m_stall_limit)
        {
            return;
        }
        m_stats.add_stalled_range();
        throw TruncationStalled(range, received, stalls);
    };

    while (received < range.size())
    {
        if (m_cancelled.load())
        {
            throw Cancelled();
        }

        auto remaining = range.tail(received);
        if (m_verbose)
        {
            fmt::print("Requesting range: {}\n", remaining.to_header());
        }

        Response response;
        try
        {
            response = m_transport.request(remaining);
        }
        catch (const TransportError &e)
        {
            m_stats.add_transport_error();
            if (m_verbose)
            {
                fmt::print(stderr, "Request for {} failed: {}\n",
                           remaining.to_header(), e.what());
            }
            stalled();
            continue;
        }

        if (response.status != 200 && response.status != 206)
        {
            throw ProtocolError(fmt::format("unexpected status {} for {}",
                                            response.status,
                                            remaining.to_header()));
        }
        if (response.body.size() > remaining.size())
        {
            throw ProtocolError(fmt::format(
                "{} bytes returned for {} ({} requested)",
                response.body.size(), remaining.to_header(), remaining.size()));
        }

        m_stats.request_completed(remaining.size(), response.body.size());
        if (response.body.empty())
        {
            stalled();
            continue;
        }

        stalls = 0;
        out.insert(out.end(), response.body.begin(), response.body.end());
        received += response.body.size();
        if (m_verbose)
        {
            fmt::print("Received {} bytes, total now: {}/{}\n",
                       response.body.size(), received, range.size());
        }
    }
}
