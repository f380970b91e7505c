#include <catch.hpp>

#include <slurp/cancellation.hpp>
#include <slurp/file_transfer.hpp>

#include "./test_support.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>

using namespace slurp;

namespace {

using lines_t = std::vector<std::string>;

template<typename T>
bool is_ready(const std::future<T>& future) {
    return future.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

struct async_fixture {
    async_fixture(vfs& v)
        : executor(2)
        , transfer(v, transfer_options(), bytes, chars, executor) {}

    tracking_pool<byte> bytes;
    tracking_pool<char> chars;
    io_executor executor;
    file_transfer transfer;
};

} // namespace

TEST_CASE("already cancelled operations do not touch the file system", "[async]") {
    counting_vfs fs(memory_vfs());
    async_fixture fx(fs);

    cancellation_source source;
    source.cancel();
    cancellation_token token = source.token();

    auto bytes = fx.transfer.read_all_bytes_async("/async/never", token);
    REQUIRE(is_ready(bytes));
    REQUIRE(bytes.get().is_cancelled());

    auto write = fx.transfer.write_all_bytes_async("/async/never", std::vector<byte>{1, 2}, token);
    REQUIRE(write.get().is_cancelled());

    auto text = fx.transfer.read_all_text_async("/async/never", utf8(), token);
    REQUIRE(text.get().is_cancelled());

    auto write_text = fx.transfer.write_all_text_async("/async/never", "x", utf8_no_bom(), token);
    REQUIRE(write_text.get().is_cancelled());

    auto append_text = fx.transfer.append_all_text_async("/async/never", "x", utf8_no_bom(), token);
    REQUIRE(append_text.get().is_cancelled());

    auto lines = fx.transfer.read_all_lines_async("/async/never", utf8(), token);
    REQUIRE(lines.get().is_cancelled());

    auto write_lines = fx.transfer.write_all_lines_async("/async/never", {"a"}, utf8_no_bom(), token);
    REQUIRE(write_lines.get().is_cancelled());

    auto append_lines =
        fx.transfer.append_all_lines_async("/async/never", {"a"}, utf8_no_bom(), token);
    REQUIRE(append_lines.get().is_cancelled());

    REQUIRE(fs.opens() == 0);
    REQUIRE(fx.bytes.rent_sizes().empty());
}

TEST_CASE("asynchronous round trips", "[async]") {
    async_fixture fx(memory_vfs());

    SECTION("bytes") {
        const std::vector<byte> content = random_bytes(5000);
        fx.transfer.write_all_bytes_async("/async/bytes", content).get().value();
        REQUIRE(fx.transfer.read_all_bytes_async("/async/bytes").get().value() == content);
        memory_vfs().remove("/async/bytes");
    }

    SECTION("bytes from a pointer") {
        const byte data[] = {9, 8, 7};
        fx.transfer.write_all_bytes_async("/async/pointer", data, 3).get().value();
        REQUIRE(fx.transfer.read_all_bytes_async("/async/pointer").get().value() ==
                std::vector<byte>{9, 8, 7});
        memory_vfs().remove("/async/pointer");
    }

    SECTION("text") {
        fx.transfer.write_all_text_async("/async/text", "hello", utf16le()).get().value();
        fx.transfer.append_all_text_async("/async/text", " world", utf16le()).get().value();
        REQUIRE(fx.transfer.read_all_text_async("/async/text").get().value() == "hello world");
        memory_vfs().remove("/async/text");
    }

    SECTION("lines") {
        fx.transfer.write_all_lines_async("/async/lines", {"a", "b"}).get().value();
        fx.transfer.append_all_lines_async("/async/lines", {"c"}).get().value();
        REQUIRE(fx.transfer.read_all_lines_async("/async/lines").get().value() ==
                lines_t{"a", "b", "c"});
        memory_vfs().remove("/async/lines");
    }

    REQUIRE(fx.bytes.outstanding() == 0);
    REQUIRE(fx.chars.outstanding() == 0);
}

TEST_CASE("asynchronous errors", "[async]") {
    async_fixture fx(memory_vfs());

    SECTION("validation errors are thrown immediately") {
        REQUIRE_THROWS_AS(fx.transfer.read_all_bytes_async(nullptr), bad_argument);
        REQUIRE_THROWS_AS(fx.transfer.read_all_text_async(""), bad_argument);
        REQUIRE_THROWS_AS(fx.transfer.write_all_bytes_async("/async/x", nullptr, 1), bad_argument);
        REQUIRE_THROWS_AS(fx.transfer.write_all_lines_async("", {"a"}), bad_argument);
    }

    SECTION("other errors are stored in the future") {
        auto future = fx.transfer.read_all_bytes_async("/async/missing");
        REQUIRE_THROWS_AS(future.get(), io_error);
    }

    SECTION("cancelled values cannot be accessed") {
        cancellation_source source;
        source.cancel();

        auto result = fx.transfer.read_all_text_async("/async/missing", utf8(), source.token()).get();
        REQUIRE(!result);
        REQUIRE_THROWS_AS(result.value(), operation_cancelled);
    }
}

TEST_CASE("cancellation at a checkpoint", "[async]") {
    cancellation_source source;
    std::atomic<bool> closed{false};

    // Cancels the operation after its third read.
    counting_vfs fs([&](vfs& self, const char*) {
        auto f = std::make_unique<scripted_file>(self, random_bytes(10000), std::nullopt,
                                                 scripted_file::chunks_of(100));
        scripted_file* raw = f.get();
        raw->on_read = [raw, &source] {
            if (raw->reads() == 3)
                source.cancel();
        };
        raw->on_close = [&closed] { closed = true; };
        return std::unique_ptr<file>(std::move(f));
    });
    async_fixture fx(fs);

    SECTION("reading bytes") {
        auto result = fx.transfer.read_all_bytes_async("/scripted", source.token()).get();
        REQUIRE(result.is_cancelled());
    }

    SECTION("reading lines") {
        auto result = fx.transfer.read_all_lines_async("/scripted", utf8(), source.token()).get();
        REQUIRE(result.is_cancelled());
    }

    REQUIRE(fs.opens() == 1);
    REQUIRE(closed.load());
    REQUIRE(fx.bytes.outstanding() == 0);
    REQUIRE(fx.chars.outstanding() == 0);
}

TEST_CASE("asynchronous line reading", "[async]") {
    async_fixture fx(memory_vfs());
    fx.transfer.write_all_lines("/async/lazy", lines_t{"x", "y"});

    line_reader reader = fx.transfer.read_lines("/async/lazy");
    REQUIRE(*reader.next_async(fx.executor).get().value() == "x");
    REQUIRE(*reader.next_async(fx.executor).get().value() == "y");
    REQUIRE(!reader.next_async(fx.executor).get().value().has_value());
    REQUIRE(!reader.is_open());

    cancellation_source source;
    source.cancel();
    REQUIRE(reader.next_async(fx.executor, source.token()).get().is_cancelled());

    memory_vfs().remove("/async/lazy");
}

TEST_CASE("io executor", "[async]") {
    io_executor executor(3);
    REQUIRE(executor.thread_count() == 3);

    std::atomic<int> sum{0};
    std::vector<std::future<int>> futures;
    for (int i = 1; i <= 100; ++i) {
        futures.push_back(executor.submit([i, &sum] {
            sum += i;
            return i;
        }));
    }

    int total = 0;
    for (auto& f : futures)
        total += f.get();
    REQUIRE(total == 5050);
    REQUIRE(sum.load() == 5050);

    auto failing = executor.submit([]() -> int { throw std::runtime_error("failure"); });
    REQUIRE_THROWS_AS(failing.get(), std::runtime_error);
}
