#include <iterator>
#include <stdexcept>

#include <fmt/core.h>

#include "chunk_store.hpp"
#include "errors.hpp"

ChunkStore::OrderedReader::OrderedReader(const ChunkStore &store)
    : m_lock(store.m_access_mutex), m_chunks(&store.m_chunks),
      m_position(store.m_chunks.begin())
{}

std::optional<ChunkStore::entry_t> ChunkStore::OrderedReader::next()
{
    if (m_position == m_chunks->end())
    {
        return std::nullopt;
    }
    entry_t entry{m_position->first, std::span{m_position->second}};
    ++m_position;
    return entry;
}

ChunkStore::ChunkStore(std::uint64_t total_length)
    : m_total_length(total_length)
{}

void ChunkStore::insert(std::uint64_t offset, bytes_t bytes)
{
    if (bytes.empty())
    {
        throw std::invalid_argument(
            fmt::format("empty chunk inserted at offset {}", offset));
    }
    ByteRange range{offset, offset + bytes.size()};
    if (range.end > m_total_length || range.end < range.begin)
    {
        throw AssemblyInvariantViolation(
            fmt::format("chunk {} exceeds stream length {}", to_string(range),
                        m_total_length));
    }

    auto _lock = std::unique_lock{m_access_mutex};

    auto next = m_chunks.lower_bound(range.begin);
    if (next != m_chunks.end() && next->first < range.end)
    {
        throw ChunkOverlap(
            fmt::format("chunk {} overlaps chunk at offset {}",
                        to_string(range), next->first));
    }
    if (next != m_chunks.begin())
    {
        auto previous = std::prev(next);
        auto previous_end = previous->first + previous->second.size();
        if (previous_end > range.begin)
        {
            throw ChunkOverlap(fmt::format(
                "chunk {} overlaps chunk [{}, {})", to_string(range),
                previous->first, previous_end));
        }
    }
    m_chunks.emplace_hint(next, range.begin, std::move(bytes));
}

std::vector<ByteRange> ChunkStore::coverage_locked() const
{
    std::vector<ByteRange> covered;
    for (const auto &[offset, bytes] : m_chunks)
    {
        auto end = offset + bytes.size();
        if (!covered.empty() && covered.back().end == offset)
        {
            covered.back().end = end;
        }
        else
        {
            covered.push_back(ByteRange{offset, end});
        }
    }
    return covered;
}

std::vector<ByteRange> ChunkStore::coverage() const
{
    auto _lock = std::shared_lock{m_access_mutex};
    return coverage_locked();
}

std::vector<ByteRange> ChunkStore::gaps() const
{
    std::vector<ByteRange> missing;
    std::uint64_t position = 0;
    for (const auto &covered : coverage())
    {
        if (covered.begin > position)
        {
            missing.push_back(ByteRange{position, covered.begin});
        }
        position = covered.end;
    }
    if (position < m_total_length)
    {
        missing.push_back(ByteRange{position, m_total_length});
    }
    return missing;
}

std::uint64_t ChunkStore::covered_bytes() const
{
    auto _lock = std::shared_lock{m_access_mutex};
    std::uint64_t covered = 0;
    for (const auto &[offset, bytes] : m_chunks)
    {
        covered += bytes.size();
    }
    return covered;
}

std::size_t ChunkStore::size() const
{
    auto _lock = std::shared_lock{m_access_mutex};
    return m_chunks.size();
}
