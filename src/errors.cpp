#include <fmt/core.h>

#include "errors.hpp"

TruncationStalled::TruncationStalled(const ByteRange &range,
                                     std::uint64_t received,
                                     std::size_t attempts)
    : RangeHashError(fmt::format(
          "range {} stalled after {} attempts without progress ({}/{} bytes)",
          to_string(range), attempts, received, range.size())),
      m_range(range), m_received(received), m_attempts(attempts)
{}

GapResolutionFailed::GapResolutionFailed(std::size_t passes,
                                         std::uint64_t missing_bytes,
                                         const std::string &last_error)
    : RangeHashError(fmt::format(
          "{} bytes still missing after {} gap resolution passes{}{}",
          missing_bytes, passes, last_error.empty() ? "" : ": ", last_error)),
      m_passes(passes), m_missing_bytes(missing_bytes)
{}
