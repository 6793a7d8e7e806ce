#pragma once

#include <atomic>
#include <cstddef>

#include "chunk_store.hpp"
#include "fetch_stats.hpp"
#include "transport.hpp"

/**
 * Fills whatever the worker phase left uncovered, one gap at a time.
 *
 * A pass fetches every gap currently in the store. Passes repeat until no
 * gap remains; `max_stalled_passes` consecutive passes that fail to shrink
 * the total missing size end with GapResolutionFailed.
 */
class GapResolver {
  public:
    GapResolver(Transport &transport, ChunkStore &store, FetchStats &stats,
                const std::atomic<bool> &cancelled, std::size_t stall_limit,
                std::size_t max_stalled_passes, bool verbose = false);

    /// @return Number of passes that fetched something, 0 if nothing was missing
    std::size_t run();

  private:
    Transport &m_transport;
    ChunkStore &m_store;
    FetchStats &m_stats;
    const std::atomic<bool> &m_cancelled;
    std::size_t m_stall_limit;
    std::size_t m_max_stalled_passes;
    bool m_verbose;
};
