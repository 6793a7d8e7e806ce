#pragma once

#include <atomic>
#include <cstddef>

#include "byte_range.hpp"
#include "fetch_stats.hpp"
#include "transport.hpp"

/**
 * Collects the exact bytes of a range from a server that may answer any
 * request with only a prefix of what was asked for.
 *
 * Each attempt asks for the part of the range still missing. An attempt that
 * yields no bytes, or fails at transport level, is a stall; `stall_limit`
 * consecutive stalls abandon the range.
 */
class RangeFetcher {
  public:
    RangeFetcher(Transport &transport, FetchStats &stats,
                 const std::atomic<bool> &cancelled, std::size_t stall_limit,
                 bool verbose = false);

    /**
     * Replaces the content of `out` with the bytes of `range`.
     *
     * When a TruncationStalled is thrown, `out` holds the prefix of the range
     * received before giving up.
     *
     * @throw ProtocolError on a status other than 200/206 or a body longer
     *        than requested
     * @throw TruncationStalled after `stall_limit` consecutive stalls
     * @throw Cancelled if the shared cancellation flag is raised
     */
    void fetch(const ByteRange &range, bytes_t &out);

    bytes_t fetch(const ByteRange &range)
    {
        bytes_t bytes;
        fetch(range, bytes);
        return bytes;
    }

    std::size_t stall_limit() const { return m_stall_limit; }

  private:
    Transport &m_transport;
    FetchStats &m_stats;
    const std::atomic<bool> &m_cancelled;
    std::size_t m_stall_limit;
    bool m_verbose;
};
