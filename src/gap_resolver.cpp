#include <algorithm>
#include <string>

#include <fmt/core.h>

#include "errors.hpp"
#include "gap_resolver.hpp"
#include "range_fetcher.hpp"

GapResolver::GapResolver(Transport &transport, ChunkStore &store,
                         FetchStats &stats, const std::atomic<bool> &cancelled,
                         std::size_t stall_limit,
                         std::size_t max_stalled_passes, bool verbose)
    : m_transport(transport), m_store(store), m_stats(stats),
      m_cancelled(cancelled), m_stall_limit(stall_limit),
      m_max_stalled_passes(std::max<std::size_t>(max_stalled_passes, 1)),
      m_verbose(verbose)
{}

std::size_t GapResolver::run()
{
    RangeFetcher fetcher(m_transport, m_stats, m_cancelled, m_stall_limit,
                         m_verbose);

    std::size_t passes = 0;
    std::size_t stalled_passes = 0;
    std::string last_error;

    auto gaps = m_store.gaps();
    auto missing = total_size(gaps);
    while (!gaps.empty())
    {
        ++passes;
        fmt::print("Gap resolution pass {}: {} gaps, {} bytes missing\n",
                   passes, gaps.size(), missing);

        for (const auto &gap : gaps)
        {
            bytes_t bytes;
            try
            {
                fetcher.fetch(gap, bytes);
            }
            catch (const TruncationStalled &e)
            {
                last_error = e.what();
                if (m_verbose)
                {
                    fmt::print(stderr, "Gap {}: {}\n", to_string(gap),
                               e.what());
                }
            }
            if (!bytes.empty())
            {
                m_store.insert(gap.begin, std::move(bytes));
            }
        }

        gaps = m_store.gaps();
        auto still_missing = total_size(gaps);
        if (still_missing < missing)
        {
            stalled_passes = 0;
        }
        else if (++stalled_passes >= m_max_stalled_passes)
        {
            throw GapResolutionFailed(passes, still_missing, last_error);
        }
        missing = still_missing;
    }
    return passes;
}
