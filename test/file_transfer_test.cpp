#include <catch.hpp>

#include <slurp/file_transfer.hpp>

#include "./test_support.hpp"

#include <list>

using namespace slurp;

namespace {

using lines_t = std::vector<std::string>;

const std::string sample = "Gr\xC3\xBC\xC3\x9F" "e, \xE4\xB8\x96\xE7\x95\x8C \xF0\x9F\x8C\x8D!";

struct transfer_fixture {
    transfer_fixture(transfer_options options = transfer_options())
        : fs(memory_vfs())
        , executor(1)
        , transfer(fs, std::move(options), bytes, chars, executor) {}

    ~transfer_fixture() {
        // Files of the memory vfs are shared by all tests.
        for (const std::string& path : paths) {
            try {
                memory_vfs().remove(path.c_str());
            } catch (const io_error&) {
            }
        }
    }

    const char* path(const std::string& name) {
        paths.push_back("/transfer-test/" + name);
        return paths.back().c_str();
    }

    std::vector<byte> raw(const char* p) {
        std::unique_ptr<file> f = memory_vfs().open(p, vfs::open_existing, vfs::read_only);
        std::vector<byte> content(static_cast<size_t>(*f->length()));
        if (!content.empty())
            REQUIRE(f->read(content.data(), content.size()) == content.size());
        return content;
    }

    void no_leaks() {
        REQUIRE(bytes.outstanding() == 0);
        REQUIRE(chars.outstanding() == 0);
    }

    std::list<std::string> paths;
    tracking_pool<byte> bytes;
    tracking_pool<char> chars;
    counting_vfs fs;
    io_executor executor;
    file_transfer transfer;
};

} // namespace

TEST_CASE("bytes", "[file-transfer]") {
    transfer_fixture fx;

    SECTION("round trip") {
        const char* p = fx.path("bytes");
        for (size_t size : {0, 1, 511, 512, 513, 100000}) {
            const std::vector<byte> content = random_bytes(size, static_cast<unsigned>(size));
            fx.transfer.write_all_bytes(p, content);
            REQUIRE(fx.transfer.read_all_bytes(p) == content);
        }
        fx.no_leaks();
    }

    SECTION("pointer and size") {
        const char* p = fx.path("pointer");
        const byte data[] = {1, 2, 3};
        fx.transfer.write_all_bytes(p, data, 3);
        REQUIRE(fx.raw(p) == std::vector<byte>{1, 2, 3});

        // Writing truncates.
        fx.transfer.write_all_bytes(p, data, 1);
        REQUIRE(fx.raw(p) == std::vector<byte>{1});
    }

    SECTION("missing file") {
        try {
            fx.transfer.read_all_bytes(fx.path("missing"));
            FAIL("Expected an io error.");
        } catch (const io_error& e) {
            REQUIRE(e.code() == std::errc::no_such_file_or_directory);
        }
        fx.no_leaks();
    }
}

TEST_CASE("arguments are validated before any file is opened", "[file-transfer]") {
    transfer_fixture fx;
    const byte data[] = {1};
    const std::vector<std::string> lines = {"a"};

    REQUIRE_THROWS_AS(fx.transfer.read_all_bytes(nullptr), bad_argument);
    REQUIRE_THROWS_AS(fx.transfer.read_all_bytes(""), bad_argument);
    REQUIRE_THROWS_AS(fx.transfer.write_all_bytes("", data, 1), bad_argument);
    REQUIRE_THROWS_AS(fx.transfer.write_all_bytes("/x", nullptr, 0), bad_argument);
    REQUIRE_THROWS_AS(fx.transfer.read_all_text(nullptr), bad_argument);
    REQUIRE_THROWS_AS(fx.transfer.write_all_text("", "text"), bad_argument);
    REQUIRE_THROWS_AS(fx.transfer.append_all_text(nullptr, "text"), bad_argument);
    REQUIRE_THROWS_AS(fx.transfer.read_all_lines(""), bad_argument);
    REQUIRE_THROWS_AS(fx.transfer.read_lines(""), bad_argument);
    REQUIRE_THROWS_AS(fx.transfer.write_all_lines("", lines), bad_argument);
    REQUIRE_THROWS_AS(fx.transfer.append_all_lines(nullptr, lines), bad_argument);
    REQUIRE_THROWS_AS(fx.transfer.create_text(""), bad_argument);
    REQUIRE_THROWS_AS(fx.transfer.append_text(nullptr), bad_argument);

    REQUIRE(fx.fs.opens() == 0);
}

TEST_CASE("invalid options are rejected", "[file-transfer]") {
    REQUIRE_THROWS_AS(transfer_fixture(transfer_options().newline("\t")), bad_argument);
    REQUIRE_THROWS_AS(transfer_fixture(transfer_options().initial_buffer_size(0)), bad_argument);
}

TEST_CASE("text", "[file-transfer]") {
    transfer_fixture fx;
    const char* p = fx.path("text");

    SECTION("round trip") {
        fx.transfer.write_all_text(p, sample);
        REQUIRE(fx.raw(p) == to_bytes(sample));
        REQUIRE(fx.transfer.read_all_text(p) == sample);
        fx.no_leaks();
    }

    SECTION("round trip through other encodings") {
        for (const text_codec* codec : {&utf8_bom(), &utf16le(), &utf16be(), &utf32le(), &utf32be()}) {
            fx.transfer.write_all_text(p, sample, *codec);

            const std::vector<byte> content = fx.raw(p);
            const byte_range bom = codec->bom();
            REQUIRE(content.size() > bom.size);
            REQUIRE(std::equal(bom.begin(), bom.end(), content.begin()));

            // The byte order mark overrides the requested codec.
            REQUIRE(fx.transfer.read_all_text(p) == sample);
            REQUIRE(fx.transfer.read_all_text(p, latin1()) == sample);
        }
        fx.no_leaks();
    }

    SECTION("empty text writes nothing") {
        fx.transfer.write_all_text(p, "previous content");
        fx.transfer.write_all_text(p, "", utf8_bom());
        REQUIRE(fx.raw(p).empty());
        REQUIRE(fx.transfer.read_all_text(p) == "");
    }

    SECTION("append") {
        fx.transfer.append_all_text(p, "a", utf8_bom());
        fx.transfer.append_all_text(p, "b", utf8_bom());
        REQUIRE(fx.raw(p) == std::vector<byte>{0xEF, 0xBB, 0xBF, 'a', 'b'});
        REQUIRE(fx.transfer.read_all_text(p) == "ab");
    }

    SECTION("latin-1 without byte order mark") {
        fx.transfer.write_all_text(p, "caf\xC3\xA9", latin1());
        REQUIRE(fx.raw(p) == std::vector<byte>{'c', 'a', 'f', 0xE9});
        REQUIRE(fx.transfer.read_all_text(p, latin1()) == "caf\xC3\xA9");
    }

    SECTION("malformed input") {
        const byte data[] = {'a', 0xFF, 'b'};
        fx.transfer.write_all_bytes(p, data, 3);

        // Reads replace malformed input by default.
        REQUIRE(fx.transfer.read_all_text(p) == "a\xEF\xBF\xBD" "b");
        REQUIRE_THROWS_AS(fx.transfer.read_all_text(p, codec_for(unicode_form::utf8, true)),
                          decode_error);

        // Writes reject it by default.
        REQUIRE_THROWS_AS(fx.transfer.write_all_text(p, "a\xFF"), encode_error);
        fx.no_leaks();
    }

    SECTION("characters the codec cannot represent") {
        REQUIRE_THROWS_AS(fx.transfer.write_all_text(p, "\xE2\x82\xAC", latin1()), encode_error);
        fx.no_leaks();
    }
}

TEST_CASE("lines", "[file-transfer]") {
    SECTION("all newline conventions read back the same lines") {
        for (const char* newline : {"\n", "\r\n", "\r"}) {
            transfer_fixture fx(transfer_options().newline(newline));
            const char* p = fx.path("lines");

            fx.transfer.write_all_lines(p, lines_t{"a", "b", "c"});
            REQUIRE(fx.raw(p) == to_bytes(std::string("a") + newline + "b" + newline + "c" + newline));
            REQUIRE(fx.transfer.read_all_lines(p) == lines_t{"a", "b", "c"});
            fx.no_leaks();
        }
    }

    transfer_fixture fx(transfer_options().read_chunk_size(7).write_buffer_size(5));
    const char* p = fx.path("lines");

    SECTION("empty sequence") {
        fx.transfer.write_all_lines(p, lines_t());
        REQUIRE(fx.raw(p).empty());
        REQUIRE(fx.transfer.read_all_lines(p).empty());
    }

    SECTION("empty lines are kept") {
        const lines_t lines = {"", "x", "", ""};
        fx.transfer.write_all_lines(p, lines);
        REQUIRE(fx.transfer.read_all_lines(p) == lines);
    }

    SECTION("append") {
        fx.transfer.append_all_lines(p, lines_t{"first"});
        fx.transfer.append_all_lines(p, std::vector<const char*>{"second", "third"});
        REQUIRE(fx.transfer.read_all_lines(p) == lines_t{"first", "second", "third"});
    }

    SECTION("long lines in other encodings") {
        const lines_t lines = {std::string(1000, 'x') + sample, sample, ""};
        fx.transfer.write_all_lines(p, lines, utf16be());
        REQUIRE(fx.transfer.read_all_lines(p) == lines);
        fx.no_leaks();
    }

    SECTION("lazy reading") {
        fx.transfer.write_all_lines(p, lines_t{"1", "2", "3", "4"});

        line_reader reader = fx.transfer.read_lines(p);
        lines_t seen;
        for (const std::string& line : reader) {
            seen.push_back(line);
            if (line == "2")
                break;
        }
        REQUIRE(seen == lines_t{"1", "2"});
        REQUIRE(reader.is_open());

        reader.close();
        fx.no_leaks();
    }
}

TEST_CASE("text writers", "[file-transfer]") {
    transfer_fixture fx(transfer_options().write_buffer_size(8).newline("\r\n"));
    const char* p = fx.path("writer");

    SECTION("write and close") {
        text_writer writer = fx.transfer.create_text(p);
        writer.write("abc");
        writer.write_line("def");
        writer.write_line(std::string(100, 'g'));
        REQUIRE(writer.is_open());
        writer.close();
        REQUIRE(!writer.is_open());

        REQUIRE(fx.transfer.read_all_text(p) == "abcdef\r\n" + std::string(100, 'g') + "\r\n");
        REQUIRE_THROWS_AS(writer.write("x"), bad_operation);
        fx.no_leaks();
    }

    SECTION("destruction flushes") {
        {
            text_writer writer = fx.transfer.create_text(p, utf8_bom());
            writer.write("x");
            REQUIRE(writer.buffered() == 4);
        }
        REQUIRE(fx.raw(p) == std::vector<byte>{0xEF, 0xBB, 0xBF, 'x'});
        fx.no_leaks();
    }

    SECTION("encoding errors keep previous text") {
        {
            text_writer writer = fx.transfer.create_text(p);
            writer.write_line("ok");
            REQUIRE_THROWS_AS(writer.write("\xFF"), encode_error);
            REQUIRE(!writer.broken());
        }
        REQUIRE(fx.transfer.read_all_lines(p) == lines_t{"ok"});
    }

    SECTION("append") {
        fx.transfer.write_all_text(p, "a");
        {
            text_writer writer = fx.transfer.append_text(p, utf8_bom());
            writer.write("b");
        }
        REQUIRE(fx.raw(p) == std::vector<byte>{'a', 'b'});
    }

    SECTION("discard") {
        text_writer writer = fx.transfer.create_text(p);
        writer.write("lost");
        writer.discard();
        REQUIRE(fx.raw(p).empty());
    }
}
