#include <algorithm>

#include <fmt/core.h>

#include "assembler.hpp"
#include "chunk_store.hpp"
#include "downloader.hpp"
#include "gap_resolver.hpp"
#include "length_prober.hpp"

Downloader::Downloader(Transport &transport, DownloadSettings settings)
    : m_transport(transport), m_settings(settings)
{}

DownloadResult Downloader::run()
{
    Timer timer;
    DownloadResult result;

    result.total_length = probe_length(m_transport);
    m_total_length = result.total_length;
    fmt::print("Total size to download: {} bytes\n", result.total_length);

    ChunkStore store(result.total_length);

    WorkerPool pool(m_transport, store, m_stats, m_cancelled,
                    m_settings.stall_limit, m_settings.verbose);
    result.workers = pool.run(m_settings.n_threads);
    auto failed = std::count_if(result.workers.begin(), result.workers.end(),
                                [](const WorkerOutcome &outcome)
                                { return !outcome.completed(); });
    fmt::print("{} workers finished, {} incomplete, {}/{} bytes covered\n",
               result.workers.size(), failed, store.covered_bytes(),
               result.total_length);

    GapResolver resolver(m_transport, store, m_stats, m_cancelled,
                         m_settings.stall_limit, m_settings.max_gap_passes,
                         m_settings.verbose);
    result.gap_passes = resolver.run();

    Sha256Hasher hasher;
    std::uint64_t bytes_hashed = 0;
    result.digest = assemble(store, hasher, bytes_hashed);
    fmt::print("Downloaded {} bytes in {}\n", bytes_hashed, timer.get_fmt());

    result.elapsed = timer.get_millis();
    return result;
}
