#include <exception>
#include <mutex>
#include <thread>

#include <fmt/core.h>

#include "errors.hpp"
#include "range_fetcher.hpp"
#include "worker_pool.hpp"

WorkerPool::WorkerPool(Transport &transport, ChunkStore &store,
                       FetchStats &stats, std::atomic<bool> &cancelled,
                       std::size_t stall_limit, bool verbose)
    : m_transport(transport), m_store(store), m_stats(stats),
      m_cancelled(cancelled), m_stall_limit(stall_limit), m_verbose(verbose)
{}

void WorkerPool::run_worker(std::size_t index, WorkerOutcome &outcome)
{
    RangeFetcher fetcher(m_transport, m_stats, m_cancelled, m_stall_limit,
                         m_verbose);
    bytes_t bytes;
    try
    {
        fetcher.fetch(outcome.range, bytes);
    }
    catch (const TruncationStalled &e)
    {
        outcome.error = e.what();
        fmt::print(stderr, "Worker {}: {}\n", index, e.what());
    }
    catch (const Cancelled &e)
    {
        outcome.error = e.what();
        return;
    }

    outcome.received = bytes.size();
    if (!bytes.empty())
    {
        m_store.insert(outcome.range.begin, std::move(bytes));
    }
    if (m_verbose && outcome.completed())
    {
        fmt::print("Worker {} completed {}\n", index,
                   to_string(outcome.range));
    }
}

std::vector<WorkerOutcome> WorkerPool::run(std::size_t n_threads)
{
    auto ranges = partition(m_store.total_length(), n_threads);
    std::vector<WorkerOutcome> outcomes(ranges.size());
    for (std::size_t i = 0; i != ranges.size(); i++)
    {
        outcomes[i].range = ranges[i];
    }

    std::mutex error_mutex;
    std::exception_ptr first_error;

    std::vector<std::thread> threads;
    threads.reserve(ranges.size());
    for (std::size_t i = 0; i != ranges.size(); i++)
    {
        auto entrypoint = [this, i, &outcomes, &error_mutex, &first_error]()
        {
            try
            {
                run_worker(i, outcomes[i]);
            }
            catch (const std::exception &e)
            {
                outcomes[i].error = e.what();
                std::lock_guard<std::mutex> lock(error_mutex);
                if (!first_error)
                {
                    first_error = std::current_exception();
                }
                m_cancelled = true;
            }
        };
        threads.push_back(std::thread{entrypoint});
    }

    for (auto &thread : threads)
    {
        thread.join();
    }

    if (first_error)
    {
        std::rethrow_exception(first_error);
    }
    if (m_cancelled.load())
    {
        throw Cancelled();
    }
    return outcomes;
}
