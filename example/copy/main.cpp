#include <fmt/format.h>

#include <slurp/cancellation.hpp>
#include <slurp/exception.hpp>
#include <slurp/file_transfer.hpp>
#include <slurp/log.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <clipp.h>

#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

/*
 * Copies a file by reading it completely into memory and writing
 * the bytes to the destination.
 *
 * The source is read in the background. Pressing Ctrl+C while the
 * read is in progress cancels it; the destination is not touched in that case.
 */

namespace {

struct settings {
    std::string source;
    std::string destination;
    bool verbose = false;
};

void parse(settings& s, int argc, char** argv) {
    using namespace clipp;

    bool show_help = false;

    auto cli = (
        value("source", s.source)                   % "the file to copy",
        value("destination", s.destination)         % "the new file (replaced if it exists)",
        option("-v", "--verbose").set(s.verbose)    % "enable debug logging"
    ) | option("-h", "--help").set(show_help);

    parsing_result result = parse(argc, argv, cli);
    if (show_help || !result) {
        std::cout << "Usage:\n"
                  << usage_lines(cli, argv[0], doc_formatting().start_column(4)) << "\n\n"
                  << documentation(cli) << "\n";
        std::exit(1);
    }
}

} // namespace

int main(int argc, char** argv) {
    settings s;
    parse(s, argc, argv);

    if (s.verbose)
        slurp::set_log_level(slurp::log_level::debug);

    slurp::cancellation_source cancel;

    // Signals are handled on a separate thread while the read is running.
    boost::asio::io_context signal_context;
    boost::asio::signal_set signals(signal_context, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signal) {
        if (!ec) {
            fmt::print(stderr, "Received signal {}, cancelling.\n", signal);
            cancel.cancel();
        }
    });
    std::thread signal_thread([&] { signal_context.run(); });

    int status = 0;
    try {
        slurp::file_transfer transfer;

        auto start = std::chrono::steady_clock::now();
        slurp::outcome<std::vector<slurp::byte>> content =
            transfer.read_all_bytes_async(s.source.c_str(), cancel.token()).get();

        if (content.is_cancelled()) {
            fmt::print(stderr, "Copy cancelled.\n");
            status = 2;
        } else {
            transfer.write_all_bytes(s.destination.c_str(), content.value());

            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start);
            fmt::print("Copied {} bytes in {} ms.\n", content.value().size(), elapsed.count());
        }
    } catch (const slurp::exception& e) {
        fmt::print(stderr, "Error: {}\n", e.what());
        status = 1;
    }

    signal_context.stop();
    signal_thread.join();
    return status;
}
