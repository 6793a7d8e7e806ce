#include <algorithm>
#include <vector>

#include <fmt/core.h>
#include <indicators/cursor_control.hpp>

#include "progress.hpp"

Progress::Progress(const Downloader &downloader)
    : m_downloader(downloader),
      m_progress_bar(
          indicators::option::BarWidth{60}, indicators::option::Start{"["},
          indicators::option::Fill{"■"}, indicators::option::Lead{"■"},
          indicators::option::Remainder{"-"}, indicators::option::End{" ]"},
          indicators::option::MaxProgress{100},
          indicators::option::ShowElapsedTime{true},
          indicators::option::ShowRemainingTime{true},
          indicators::option::PostfixText{"probing length"},
          indicators::option::ForegroundColor{indicators::Color::cyan},
          indicators::option::FontStyles{
              std::vector<indicators::FontStyle>{indicators::FontStyle::bold}})
{
    indicators::show_console_cursor(false);
}

Progress::~Progress() { indicators::show_console_cursor(true); }

bool Progress::update_progress_bar()
{
    auto total_length = m_downloader.total_length();
    if (total_length == 0)
    {
        return false;
    }

    auto update_time = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                        update_time - m_last_update_time)
                        .count() /
                    1000.f;
    if (duration <= 0.f)
    {
        return false;
    }
    m_last_update_time = update_time;

    const auto &stats = m_downloader.stats();
    auto bytes_received = std::min(stats.bytes_received(), total_length);
    auto mb_per_sec = (bytes_received - m_last_reported_bytes_received) /
                      duration / 1024 / 1024;
    m_last_reported_bytes_received = bytes_received;

    auto requests = stats.requests();
    auto req_per_sec = (requests - m_last_reported_requests) / duration;
    m_last_reported_requests = requests;

    auto postfix = fmt::format(
        "{:6.2f} MB/s, {:8.2f} req/s, S:{}/E:{}/X:{} - {}/{}", mb_per_sec,
        req_per_sec, stats.short_responses(), stats.empty_responses(),
        stats.transport_errors(), bytes_received, total_length);
    m_progress_bar.set_option(indicators::option::PostfixText{postfix});
    m_progress_bar.set_progress(
        static_cast<std::size_t>(bytes_received * 100 / total_length));
    return m_progress_bar.is_completed();
}
