#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

#include "byte_range.hpp"
#include "chunk_store.hpp"
#include "fetch_stats.hpp"
#include "transport.hpp"

struct WorkerOutcome
{
    ByteRange range;
    std::uint64_t received{0};
    std::string error; // empty when the whole range was stored

    bool completed() const { return error.empty(); }
};

/**
 * Fetches [0, store.total_length()) with one thread per range of
 * partition().
 *
 * A range that stalls is recorded and whatever prefix it got is stored; the
 * other workers keep going and the missing bytes are left to the gap
 * resolver. Any other failure raises the cancellation flag, which stops the
 * remaining workers at their next request, and is rethrown once every thread
 * has been joined.
 */
class WorkerPool {
  public:
    WorkerPool(Transport &transport, ChunkStore &store, FetchStats &stats,
               std::atomic<bool> &cancelled, std::size_t stall_limit,
               bool verbose = false);

    std::vector<WorkerOutcome> run(std::size_t n_threads);

  private:
    void run_worker(std::size_t index, WorkerOutcome &outcome);

    Transport &m_transport;
    ChunkStore &m_store;
    FetchStats &m_stats;
    std::atomic<bool> &m_cancelled;
    std::size_t m_stall_limit;
    bool m_verbose;
};
