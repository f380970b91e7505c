#include <catch.hpp>

#include <slurp/cancellation.hpp>
#include <slurp/detail/io_strategy.hpp>
#include <slurp/growable_reader.hpp>
#include <slurp/log.hpp>

#include "./test_support.hpp"

using namespace slurp;

namespace {

// Reports cancellation once a number of reads have been performed.
class cancel_after_reads {
public:
    explicit cancel_after_reads(size_t reads)
        : m_remaining(reads) {}

    size_t read(file& f, void* buffer, size_t count) {
        if (m_remaining > 0)
            --m_remaining;
        return f.read(buffer, count);
    }

    size_t write(file& f, const void* buffer, size_t count) { return f.write(buffer, count); }

    bool cancelled() const { return m_remaining == 0; }

private:
    size_t m_remaining;
};

} // namespace

TEST_CASE("growable reader with unknown length", "[growable-reader]") {
    tracking_pool<byte> pool;
    growable_reader reader(pool, 512, max_buffer_length);

    SECTION("randomized short reads") {
        const std::vector<byte> content = random_bytes(10000);
        scripted_file f(memory_vfs(), content, std::nullopt, scripted_file::random_chunks(333));

        std::vector<byte> result = reader.read_all(f);
        REQUIRE(result.size() == 10000);
        REQUIRE(result == content);
        REQUIRE(pool.outstanding() == 0);
    }

    SECTION("one byte more than the initial buffer doubles once") {
        const std::vector<byte> content = random_bytes(513);
        scripted_file f(memory_vfs(), content, std::nullopt);

        std::vector<byte> result = reader.read_all(f);
        REQUIRE(result == content);
        REQUIRE(pool.rent_sizes() == std::vector<size_t>{512, 1024});
        REQUIRE(pool.outstanding() == 0);
    }

    SECTION("growth doubles the capacity") {
        scripted_file f(memory_vfs(), random_bytes(5000), std::nullopt);

        REQUIRE(reader.read_all(f).size() == 5000);
        REQUIRE(pool.rent_sizes() == std::vector<size_t>{512, 1024, 2048, 4096, 8192});
    }

    SECTION("empty file") {
        scripted_file f(memory_vfs(), {}, std::nullopt);

        REQUIRE(reader.read_all(f).empty());
        REQUIRE(f.reads() == 1);
        REQUIRE(pool.outstanding() == 0);

        // The end of the file is reported again on every further read.
        scripted_file chunked(memory_vfs(), {}, std::nullopt, scripted_file::chunks_of(3));
        byte buffer[4];
        REQUIRE(chunked.read(buffer, sizeof(buffer)) == 0);
        REQUIRE(chunked.read(buffer, sizeof(buffer)) == 0);
        REQUIRE(reader.read_all(chunked).empty());
    }

    SECTION("reported length of zero is not trusted") {
        scripted_file f(memory_vfs(), to_bytes("hello"), u64(0));

        REQUIRE(to_string(reader.read_all(f)) == "hello");
        REQUIRE(pool.outstanding() == 0);
    }
}

TEST_CASE("growable reader with known length", "[growable-reader]") {
    tracking_pool<byte> pool;
    growable_reader reader(pool, 512, max_buffer_length);

    SECTION("short reads are accumulated") {
        const std::vector<byte> content = random_bytes(10000, 7);
        scripted_file f(memory_vfs(), content, u64(10000), scripted_file::random_chunks(333, 7));

        REQUIRE(reader.read_all(f) == content);
        REQUIRE(pool.rent_sizes().empty());
    }

    SECTION("truncated file") {
        scripted_file f(memory_vfs(), random_bytes(60), u64(100));

        REQUIRE_THROWS_AS(reader.read_all(f), end_of_file);
        REQUIRE(pool.outstanding() == 0);
    }

    SECTION("the reported length limits the result") {
        const std::vector<byte> content = random_bytes(60);
        scripted_file f(memory_vfs(), content, u64(50));

        std::vector<byte> result = reader.read_all(f);
        REQUIRE(result.size() == 50);
        REQUIRE(std::equal(result.begin(), result.end(), content.begin()));
    }

    SECTION("oversized file is rejected before reading") {
        scripted_file f(memory_vfs(), random_bytes(10), u64(max_buffer_length) + 1);

        REQUIRE_THROWS_AS(reader.read_all(f), file_too_large);
        REQUIRE(f.reads() == 0);
        REQUIRE(pool.rent_sizes().empty());
    }
}

TEST_CASE("growable reader respects the ceiling", "[growable-reader]") {
    tracking_pool<byte> pool;
    growable_reader reader(pool, 512, 1000);

    SECTION("file of exactly the ceiling") {
        const std::vector<byte> content = random_bytes(1000);
        scripted_file f(memory_vfs(), content, std::nullopt, scripted_file::chunks_of(100));

        REQUIRE(reader.read_all(f) == content);
        REQUIRE(pool.rent_sizes() == std::vector<size_t>{512, 1000});
        REQUIRE(pool.outstanding() == 0);
    }

    SECTION("file larger than the ceiling") {
        scripted_file f(memory_vfs(), random_bytes(1001), std::nullopt);

        REQUIRE_THROWS_AS(reader.read_all(f), file_too_large);
        for (size_t size : pool.rent_sizes())
            REQUIRE(size <= 1000);
        REQUIRE(pool.outstanding() == 0);
    }

    SECTION("reported length larger than the ceiling") {
        scripted_file f(memory_vfs(), random_bytes(1001), u64(1001));

        REQUIRE_THROWS_AS(reader.read_all(f), file_too_large);
        REQUIRE(f.reads() == 0);
    }
}

TEST_CASE("growable reader cancellation", "[growable-reader]") {
    tracking_pool<byte> pool;
    growable_reader reader(pool, 512, max_buffer_length);

    SECTION("cancelled before the start") {
        cancellation_source source;
        source.cancel();

        scripted_file f(memory_vfs(), random_bytes(100), std::nullopt);
        detail::cancellable_io io(source.token());

        outcome<std::vector<byte>> result = reader.read_all(io, f);
        REQUIRE(result.is_cancelled());
        REQUIRE_THROWS_AS(result.value(), operation_cancelled);
        REQUIRE(f.reads() == 0);
        REQUIRE(pool.rent_sizes().empty());
    }

    SECTION("cancelled while growing") {
        scripted_file f(memory_vfs(), random_bytes(10000), std::nullopt,
                        scripted_file::chunks_of(100));
        cancel_after_reads io(8);

        outcome<std::vector<byte>> result = reader.read_all(io, f);
        REQUIRE(result.is_cancelled());
        REQUIRE(f.reads() == 8);
        REQUIRE(pool.outstanding() == 0);
    }

    SECTION("cancelled with known length") {
        scripted_file f(memory_vfs(), random_bytes(10000), u64(10000),
                        scripted_file::chunks_of(100));
        cancel_after_reads io(3);

        REQUIRE(reader.read_all(io, f).is_cancelled());
        REQUIRE(f.reads() == 3);
    }
}

TEST_CASE("growable reader errors", "[growable-reader]") {
    tracking_pool<byte> pool;

    REQUIRE_THROWS_AS(growable_reader(pool, 0, 1000), bad_argument);
    REQUIRE_THROWS_AS(growable_reader(pool, 2000, 1000), bad_argument);

    SECTION("pool too small") {
        tracking_pool<byte> small_pool(256);
        growable_reader reader(small_pool, 512, 1000);
        scripted_file f(memory_vfs(), random_bytes(100), std::nullopt);

        REQUIRE_THROWS_AS(reader.read_all(f), capacity_exceeded);
    }
}

TEST_CASE("growable reader logs the unknown length fallback", "[growable-reader][log]") {
    std::vector<std::string> messages;
    const log_level old_level = get_log_level();
    set_log_level(log_level::debug);
    set_log_handler([&](log_level level, std::string_view message) {
        if (level == log_level::debug)
            messages.emplace_back(message);
    });

    tracking_pool<byte> pool;
    growable_reader reader(pool, 512, max_buffer_length);
    scripted_file f(memory_vfs(), to_bytes("abc"), u64(0));
    reader.read_all(f);

    set_log_handler(nullptr);
    set_log_level(old_level);

    REQUIRE(messages.size() == 1);
    REQUIRE(messages[0].find("reports a length of 0") != std::string::npos);
}
