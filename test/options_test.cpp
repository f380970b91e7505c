#include <catch.hpp>

#include <slurp/cancellation.hpp>
#include <slurp/detail/io_strategy.hpp>
#include <slurp/exception.hpp>
#include <slurp/log.hpp>
#include <slurp/options.hpp>

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace slurp;

TEST_CASE("transfer options", "[options]") {
    transfer_options defaults;
    REQUIRE(defaults.initial_buffer_size() == 512);
    REQUIRE(defaults.max_buffer_length() == max_buffer_length);
    REQUIRE(defaults.read_chunk_size() == 4096);
    REQUIRE(defaults.write_buffer_size() == 4096);
    REQUIRE(defaults.newline() == "\n");
    REQUIRE_NOTHROW(defaults.validate());

    SECTION("chained setters") {
        transfer_options opts;
        opts.initial_buffer_size(64).max_buffer_length(1 << 20).newline("\r\n");
        REQUIRE(opts.initial_buffer_size() == 64);
        REQUIRE(opts.max_buffer_length() == 1 << 20);
        REQUIRE(opts.newline() == "\r\n");
        REQUIRE_NOTHROW(opts.validate());
    }

    SECTION("invalid values") {
        REQUIRE_THROWS_AS(transfer_options().initial_buffer_size(0).validate(), bad_argument);
        REQUIRE_THROWS_AS(transfer_options().max_buffer_length(0).validate(), bad_argument);
        REQUIRE_THROWS_AS(transfer_options().max_buffer_length(max_buffer_length + 1).validate(),
                          bad_argument);
        REQUIRE_THROWS_AS(transfer_options().max_buffer_length(100).validate(), bad_argument);
        REQUIRE_THROWS_AS(transfer_options().read_chunk_size(0).validate(), bad_argument);
        REQUIRE_THROWS_AS(transfer_options().write_buffer_size(0).validate(), bad_argument);
        REQUIRE_THROWS_AS(transfer_options().newline("").validate(), bad_argument);
        REQUIRE_THROWS_AS(transfer_options().newline("\n\r").validate(), bad_argument);
    }
}

TEST_CASE("log levels", "[log]") {
    REQUIRE(std::string(log_level_name(log_level::debug)) == "debug");
    REQUIRE(parse_log_level("trace", log_level::off) == log_level::trace);
    REQUIRE(parse_log_level("error", log_level::off) == log_level::error);
    REQUIRE(parse_log_level("verbose", log_level::info) == log_level::info);
    REQUIRE(parse_log_level("", log_level::warn) == log_level::warn);
}

TEST_CASE("log handlers", "[log]") {
    std::vector<std::pair<log_level, std::string>> messages;
    const log_level previous = get_log_level();

    set_log_handler([&](log_level level, std::string_view message) {
        messages.emplace_back(level, std::string(message));
    });
    set_log_level(log_level::info);

    SLURP_LOG_DEBUG("dropped {}", 1);
    SLURP_LOG_INFO("kept {}", 2);
    SLURP_LOG_ERROR("kept {}", "three");
    REQUIRE(log_enabled(log_level::warn));
    REQUIRE(!log_enabled(log_level::trace));

    set_log_level(log_level::off);
    SLURP_LOG_ERROR("dropped");
    REQUIRE(!log_enabled(log_level::error));

    set_log_handler(log_handler());
    set_log_level(previous);

    REQUIRE(messages.size() == 2);
    REQUIRE(messages[0].first == log_level::info);
    REQUIRE(messages[0].second == "kept 2");
    REQUIRE(messages[1].first == log_level::error);
    REQUIRE(messages[1].second == "kept three");
}

TEST_CASE("errors of log handlers reach the caller", "[log]") {
    const log_level previous = get_log_level();
    set_log_handler([](log_level, std::string_view) { throw std::runtime_error("handler failed"); });
    set_log_level(log_level::debug);

    cancellation_source source;
    source.cancel();
    detail::cancellable_io io(source.token());

    // Observing the cancellation logs a debug message.
    REQUIRE_THROWS_AS(io.cancelled(), std::runtime_error);

    set_log_handler(log_handler());
    set_log_level(previous);

    REQUIRE(io.cancelled());
}
