#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

#include "byte_range.hpp"

class RangeHashError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/// Malformed or missing headers, unexpected status, oversize body
class ProtocolError : public RangeHashError {
  public:
    using RangeHashError::RangeHashError;
};

/// A single request failed below HTTP (connect, reset, timeout, ...)
class TransportError : public RangeHashError {
  public:
    using RangeHashError::RangeHashError;
};

/// A range made no progress for `attempts` consecutive requests
class TruncationStalled : public RangeHashError {
  public:
    TruncationStalled(const ByteRange &range, std::uint64_t received,
                      std::size_t attempts);

    const ByteRange &range() const { return m_range; }
    std::uint64_t received() const { return m_received; }
    std::size_t attempts() const { return m_attempts; }

  private:
    ByteRange m_range;
    std::uint64_t m_received;
    std::size_t m_attempts;
};

class GapResolutionFailed : public RangeHashError {
  public:
    GapResolutionFailed(std::size_t passes, std::uint64_t missing_bytes,
                        const std::string &last_error);

    std::size_t passes() const { return m_passes; }
    std::uint64_t missing_bytes() const { return m_missing_bytes; }

  private:
    std::size_t m_passes;
    std::uint64_t m_missing_bytes;
};

/// Coverage logic produced something the assembler cannot hash
class AssemblyInvariantViolation : public RangeHashError {
  public:
    using RangeHashError::RangeHashError;
};

/// Insert into the chunk store that would claim already covered offsets
class ChunkOverlap : public AssemblyInvariantViolation {
  public:
    using AssemblyInvariantViolation::AssemblyInvariantViolation;
};

class Cancelled : public RangeHashError {
  public:
    Cancelled() : RangeHashError("download cancelled") {}
};
