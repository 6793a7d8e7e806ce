#pragma once

#include <chrono>
#include <cstdint>

#include <indicators/progress_bar.hpp>

#include "downloader.hpp"

/// Console progress bar fed from the counters of a running Downloader
class Progress {
  public:
    explicit Progress(const Downloader &downloader);
    ~Progress();

    void mark_as_completed() { m_progress_bar.mark_as_completed(); }

    /// @return true once the whole stream has been received
    bool update_progress_bar();

  private:
    const Downloader &m_downloader;
    indicators::ProgressBar m_progress_bar;
    std::chrono::steady_clock::time_point m_last_update_time{
        std::chrono::steady_clock::now()};
    std::uint64_t m_last_reported_bytes_received{0};
    std::size_t m_last_reported_requests{0};
};
