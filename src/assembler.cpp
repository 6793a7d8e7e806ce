#include <fmt/core.h>

#include "assembler.hpp"
#include "errors.hpp"

digest_t assemble(const ChunkStore &store, Hasher &hasher,
                  std::uint64_t &bytes_hashed)
{
    bytes_hashed = 0;
    {
        auto reader = store.ordered();
        while (auto entry = reader.next())
        {
            auto [offset, bytes] = *entry;
            if (offset != bytes_hashed)
            {
                throw AssemblyInvariantViolation(fmt::format(
                    "{} at offset {} while {} bytes were hashed",
                    offset > bytes_hashed ? "gap" : "overlap", offset,
                    bytes_hashed));
            }
            hasher.update(bytes);
            bytes_hashed += bytes.size();
        }
    }

    if (bytes_hashed != store.total_length())
    {
        throw AssemblyInvariantViolation(
            fmt::format("hashed {} bytes of a {} byte stream", bytes_hashed,
                        store.total_length()));
    }
    return hasher.finalize();
}
