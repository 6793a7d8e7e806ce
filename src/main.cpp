#include <atomic>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include <boost/asio/deadline_timer.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/program_options.hpp>
#include <fmt/core.h>

#include "beast_transport.hpp"
#include "digest.hpp"
#include "downloader.hpp"
#include "progress.hpp"
#include "timer.hpp"

namespace io = boost::asio;

void do_monitoring(io::io_context &ioc, Progress *progress,
                   const std::atomic<bool> &finished,
                   io::signal_set &signals_handler, io::yield_context yield)
{
    io::deadline_timer timer(ioc);
    while (!finished.load())
    {
        if (progress != nullptr)
        {
            progress->update_progress_bar();
        }
        timer.expires_from_now(boost::posix_time::milliseconds(200));
        timer.async_wait(yield);
    }
    if (progress != nullptr)
    {
        progress->update_progress_bar();
        progress->mark_as_completed();
    }
    signals_handler.cancel();
}

struct Options
{
    std::string address;
    std::string port;
    std::string target;
    std::size_t timeout;
    bool show_progress;
    DownloadSettings settings;
};

auto parse_options(int argc, char *argv[])
{
    Options options;
    namespace po = boost::program_options;
    unsigned short port = 0;
    po::options_description desc("Allowed options");
    po::positional_options_description positional;
    positional.add("address", 1).add("port", 1).add("threads", 1);
    desc.add_options()("help,h", "show this help message")(
        "address", po::value<std::string>(&options.address),
        "server address")("port", po::value<unsigned short>(&port),
                          "server port")(
        "threads,t",
        po::value<std::size_t>(&options.settings.n_threads)->default_value(1),
        "number of parallel range workers")(
        "target,p",
        po::value<std::string>(&options.target)->default_value("/"),
        "request target")(
        "stall-limit,s",
        po::value<std::size_t>(&options.settings.stall_limit)
            ->default_value(options.settings.stall_limit),
        "consecutive requests without progress before a range is abandoned")(
        "max-gap-passes,g",
        po::value<std::size_t>(&options.settings.max_gap_passes)
            ->default_value(options.settings.max_gap_passes),
        "gap resolution passes without progress before giving up")(
        "timeout,T", po::value<std::size_t>(&options.timeout)->default_value(0),
        "requests timeout in milliseconds (0 = no timeout)")(
        "verbose,v", "log every range request")("no-progress",
                                                "Don't show a progress bar");

    po::variables_map vm;
    po::store(po::command_line_parser(argc, argv)
                  .options(desc)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);

    if (vm.count("help"))
    {
        fmt::print("Usage: {} <address> <port> [num_threads]\n", argv[0]);
        std::cout << desc << '\n';
        exit(EXIT_SUCCESS);
    }
    else if (vm.count("address") == 0 || vm.count("port") == 0)
    {
        throw po::error("<address> and <port> must be given. "
                        "Use -h to see the help");
    }
    if (options.settings.n_threads == 0)
    {
        throw po::error("the number of threads must be at least 1");
    }
    if (options.settings.stall_limit == 0 ||
        options.settings.max_gap_passes == 0)
    {
        throw po::error("--stall-limit and --max-gap-passes must be positive");
    }

    options.port = std::to_string(port);
    options.settings.verbose = vm.count("verbose") > 0;
    options.show_progress =
        vm.count("no-progress") == 0 && !options.settings.verbose;
    return options;
}

int main(int argc, char *argv[])
{
    Options options;
    try
    {
        options = parse_options(argc, argv);
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "error: {}\n", e.what());
        return EXIT_FAILURE;
    }

    BeastTransport transport(options.address, options.port, options.target,
                             options.timeout);
    Downloader downloader(transport, options.settings);
    fmt::print("Downloading from {}:{}{} with {} threads\n", options.address,
               options.port, options.target, options.settings.n_threads);

    io::io_context ioc;

    // Start an asynchronous wait for one of the signals to occur.
    io::signal_set signals_handler(ioc, SIGINT, SIGTERM);
    signals_handler.async_wait(
        [&downloader](const boost::system::error_code &error, int signal_number)
        {
            if (!error)
            {
                downloader.cancel();
            }
        });

    std::unique_ptr<Progress> progress;
    if (options.show_progress)
    {
        progress = std::make_unique<Progress>(downloader);
    }

    std::atomic<bool> finished{false};
    std::optional<DownloadResult> result;
    std::exception_ptr failure;
    std::thread download_thread{
        [&]()
        {
            try
            {
                result = downloader.run();
            }
            catch (...)
            {
                failure = std::current_exception();
            }
            finished = true;
        }};

    io::spawn(ioc,
              [&](io::yield_context yield) {
                  do_monitoring(ioc, progress.get(), finished, signals_handler,
                                yield);
              });

    ioc.run();
    download_thread.join();
    progress.reset();

    try
    {
        if (failure)
        {
            std::rethrow_exception(failure);
        }
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "error: {}\n", e.what());
        return EXIT_FAILURE;
    }
    catch (...)
    {
        fmt::print(stderr, "error: unknown failure\n");
        return EXIT_FAILURE;
    }

    const auto &stats = downloader.stats();
    fmt::print("Fetched {} bytes in {} at {:.2f} MB/s: {} requests, {} short, "
               "{} empty, {} failed, {} gap passes\n",
               result->total_length, Timer::format(result->elapsed),
               Timer::mb_per_sec(result->total_length, result->elapsed),
               stats.requests(), stats.short_responses(),
               stats.empty_responses(), stats.transport_errors(),
               result->gap_passes);
    fmt::print("SHA-256 hash of the downloaded data: {}\n",
               to_hex(result->digest));

    return EXIT_SUCCESS;
}
