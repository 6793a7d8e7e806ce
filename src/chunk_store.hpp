#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <span>
#include <utility>
#include <vector>

#include "byte_range.hpp"
#include "transport.hpp"

/**
 * Byte runs of the stream keyed by their starting offset.
 *
 * Runs never overlap and are never modified once inserted. Workers insert
 * concurrently; readers take a shared lock.
 */
class ChunkStore {
    using chunks_t = std::map<std::uint64_t, bytes_t>;

  public:
    using entry_t = std::pair<std::uint64_t, std::span<const std::uint8_t>>;

    /**
     * Pull cursor over the runs in ascending offset order.
     *
     * Holds the store's shared lock for its whole lifetime, inserts block
     * until it is destroyed.
     */
    class OrderedReader {
      public:
        std::optional<entry_t> next();

        /// Goes back to the lowest offset
        void restart() { m_position = m_chunks->begin(); }

      private:
        friend class ChunkStore;

        explicit OrderedReader(const ChunkStore &store);

        std::shared_lock<std::shared_mutex> m_lock;
        const chunks_t *m_chunks;
        chunks_t::const_iterator m_position;
    };

    explicit ChunkStore(std::uint64_t total_length);

    /**
     * Stores `bytes` as the content of [offset, offset + bytes.size()).
     *
     * Throws ChunkOverlap if any of those offsets is already covered, and
     * AssemblyInvariantViolation if the run lies outside the stream. The store
     * is left unchanged in both cases.
     */
    void insert(std::uint64_t offset, bytes_t bytes);

    /// Covered intervals, sorted, adjacent runs merged
    std::vector<ByteRange> coverage() const;

    /// Complement of coverage() within [0, total_length)
    std::vector<ByteRange> gaps() const;

    std::uint64_t covered_bytes() const;
    std::size_t size() const;
    std::uint64_t total_length() const { return m_total_length; }

    OrderedReader ordered() const { return OrderedReader{*this}; }

  private:
    std::vector<ByteRange> coverage_locked() const;

    std::uint64_t m_total_length;
    mutable std::shared_mutex m_access_mutex;
    chunks_t m_chunks;
};
