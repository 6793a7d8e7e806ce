#pragma once

#include <atomic>
#include <cstdint>
#include <vector>

#include "digest.hpp"
#include "fetch_stats.hpp"
#include "timer.hpp"
#include "transport.hpp"
#include "worker_pool.hpp"

struct DownloadSettings
{
    std::size_t n_threads{1};
    std::size_t stall_limit{16};
    std::size_t max_gap_passes{8};
    bool verbose{false};
};

struct DownloadResult
{
    std::uint64_t total_length{0};
    digest_t digest{};
    std::vector<WorkerOutcome> workers;
    std::size_t gap_passes{0};
    Timer::duration elapsed{0};
};

/**
 * Runs a whole download: length probe, parallel range fetch, gap resolution
 * and ordered hashing.
 *
 * Every failure propagates as an exception; a digest is only returned when
 * each byte of the stream has been hashed exactly once.
 */
class Downloader {
  public:
    Downloader(Transport &transport, DownloadSettings settings);

    DownloadResult run();

    /// Stops the workers at their next request, run() then throws Cancelled
    void cancel() { m_cancelled = true; }

    /// Declared stream length, 0 until the probe completed
    std::uint64_t total_length() const { return m_total_length.load(); }

    const FetchStats &stats() const { return m_stats; }

  private:
    Transport &m_transport;
    DownloadSettings m_settings;
    FetchStats m_stats;
    std::atomic<bool> m_cancelled{false};
    std::atomic<std::uint64_t> m_total_length{0};
};
