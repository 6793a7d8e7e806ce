#pragma once

#include <atomic>
#include <cstdint>

/// Counters shared by every fetcher, read by the progress display
class FetchStats {
  public:
    void request_completed(std::uint64_t requested, std::uint64_t received)
    {
        ++m_requests;
        m_bytes_received += received;
        if (received == 0)
        {
            ++m_empty_responses;
        }
        else if (received < requested)
        {
            ++m_short_responses;
        }
    }

    void add_transport_error()
    {
        ++m_requests;
        ++m_transport_errors;
    }
    void add_stalled_range() { ++m_stalled_ranges; }

    std::size_t requests() const { return m_requests; }
    std::uint64_t bytes_received() const { return m_bytes_received; }
    std::size_t short_responses() const { return m_short_responses; }
    std::size_t empty_responses() const { return m_empty_responses; }
    std::size_t transport_errors() const { return m_transport_errors; }
    std::size_t stalled_ranges() const { return m_stalled_ranges; }

  private:
    std::atomic<std::size_t> m_requests{0};
    std::atomic<std::uint64_t> m_bytes_received{0};
    std::atomic<std::size_t> m_short_responses{0};
    std::atomic<std::size_t> m_empty_responses{0};
    std::atomic<std::size_t> m_transport_errors{0};
    std::atomic<std::size_t> m_stalled_ranges{0};
};
