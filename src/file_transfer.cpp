#include <slurp/file_transfer.hpp>

#include <slurp/exception.hpp>
#include <slurp/growable_reader.hpp>
#include <slurp/log.hpp>
#include <slurp/shared_buffer_pool.hpp>

#include <algorithm>
#include <utility>

namespace slurp {

// Number of bytes decoded at a time by read_all_text.
static constexpr size_t decode_slice_size = 16384;

// Decodes the complete content of a file. A byte order mark selects the encoding
// (keeping the strictness of `codec`) and is not part of the result.
static std::string
decode_text(const std::vector<byte>& bytes, const text_codec& codec, buffer_pool<char>& chars) {
    const byte* data = bytes.data();
    size_t size = bytes.size();

    const text_codec* active = &codec;
    if (auto bom = detect_bom(data, size)) {
        active = &codec_for(bom->form, codec.strict());
        data += bom->length;
        size -= bom->length;
    }

    std::unique_ptr<text_decoder> decoder = active->make_decoder();
    pooled_buffer<char> out = chars.rent(text_decoder::max_output(decode_slice_size));

    std::string text;
    text.reserve(size);
    while (size > 0) {
        const size_t n = std::min(size, decode_slice_size);
        text.append(out.data(), decoder->decode(data, n, out.data()));
        data += n;
        size -= n;
    }
    text.append(out.data(), decoder->finish(out.data()));
    return text;
}

file_transfer::file_transfer(vfs& fs, transfer_options options)
    : file_transfer(fs, std::move(options), shared_byte_pool(), shared_char_pool(),
                    default_executor()) {}

file_transfer::file_transfer(vfs& fs, transfer_options options, buffer_pool<byte>& bytes,
                             buffer_pool<char>& chars, io_executor& executor)
    : m_vfs(&fs)
    , m_options(std::move(options))
    , m_bytes(&bytes)
    , m_chars(&chars)
    , m_executor(&executor) {
    m_options.validate();
}

void file_transfer::check_path(const char* path) {
    if (path == nullptr)
        SLURP_THROW(bad_argument("Path must not be a null pointer."));
    if (*path == '\0')
        SLURP_THROW(bad_argument("Path must not be empty."));
}

void file_transfer::check_data(const byte* data) {
    if (data == nullptr)
        SLURP_THROW(bad_argument("Data must not be a null pointer."));
}

std::unique_ptr<file> file_transfer::open_read(const char* path) {
    SLURP_LOG_TRACE("Opening `{}` for reading.", path);
    return m_vfs->open(path, vfs::open_existing, vfs::read_only, vfs::share_read);
}

text_writer file_transfer::open_writer(const char* path, vfs::open_mode mode,
                                       const text_codec& codec, bool allow_preamble) {
    SLURP_LOG_TRACE("Opening `{}` for writing.", path);
    std::unique_ptr<file> f = m_vfs->open(path, mode, vfs::write_only, vfs::share_read);

    // Appending to existing content must not insert a second byte order mark.
    bool preamble = allow_preamble && codec.emit_bom();
    if (preamble && mode != vfs::create)
        preamble = f->length().value_or(1) == 0;

    return text_writer(std::move(f), codec, *m_bytes, m_options.write_buffer_size(),
                       m_options.newline(), preamble);
}

line_reader file_transfer::open_reader(const char* path, const text_codec& codec) {
    return line_reader(open_read(path), codec, *m_bytes, *m_chars, m_options.read_chunk_size());
}

/*
 * Blocking operations.
 */

std::vector<byte> file_transfer::read_all_bytes(const char* path) {
    check_path(path);

    detail::blocking_io io;
    return do_read_all_bytes(io, path).value();
}

void file_transfer::write_all_bytes(const char* path, const byte* data, size_t size) {
    check_path(path);
    check_data(data);

    detail::blocking_io io;
    do_write_all_bytes(io, path, data, size).value();
}

void file_transfer::write_all_bytes(const char* path, const std::vector<byte>& bytes) {
    check_path(path);

    detail::blocking_io io;
    do_write_all_bytes(io, path, bytes.data(), bytes.size()).value();
}

std::string file_transfer::read_all_text(const char* path, const text_codec& codec) {
    check_path(path);

    detail::blocking_io io;
    return do_read_all_text(io, path, codec).value();
}

void file_transfer::write_all_text(const char* path, std::string_view text,
                                   const text_codec& codec) {
    check_path(path);

    detail::blocking_io io;
    do_write_text(io, path, vfs::create, text, codec).value();
}

void file_transfer::append_all_text(const char* path, std::string_view text,
                                    const text_codec& codec) {
    check_path(path);

    detail::blocking_io io;
    do_write_text(io, path, vfs::append, text, codec).value();
}

std::vector<std::string> file_transfer::read_all_lines(const char* path, const text_codec& codec) {
    check_path(path);

    detail::blocking_io io;
    return do_read_all_lines(io, path, codec).value();
}

line_reader file_transfer::read_lines(const char* path, const text_codec& codec) {
    check_path(path);
    return open_reader(path, codec);
}

text_writer file_transfer::create_text(const char* path, const text_codec& codec) {
    check_path(path);
    return open_writer(path, vfs::create, codec, true);
}

text_writer file_transfer::append_text(const char* path, const text_codec& codec) {
    check_path(path);
    return open_writer(path, vfs::append, codec, true);
}

/*
 * Non-blocking operations.
 */

template<typename Function>
auto file_transfer::run_async(cancellation_token token, Function fn) {
    using result_type = decltype(fn(std::declval<detail::cancellable_io&>()));

    if (token.cancelled()) {
        SLURP_LOG_DEBUG("Operation cancelled before it started.");
        return detail::ready_future(result_type::cancelled());
    }

    return m_executor->submit([fn = std::move(fn), token = std::move(token)]() mutable {
        detail::cancellable_io io(std::move(token));
        return fn(io);
    });
}

std::future<outcome<std::vector<byte>>>
file_transfer::read_all_bytes_async(const char* path, cancellation_token token) {
    check_path(path);

    return run_async(std::move(token), [this, path = std::string(path)](auto& io) {
        return do_read_all_bytes(io, path.c_str());
    });
}

std::future<outcome<void>> file_transfer::write_all_bytes_async(const char* path, const byte* data,
                                                                size_t size,
                                                                cancellation_token token) {
    check_path(path);
    check_data(data);

    return write_all_bytes_async(path, std::vector<byte>(data, data + size), std::move(token));
}

std::future<outcome<void>> file_transfer::write_all_bytes_async(const char* path,
                                                                std::vector<byte> bytes,
                                                                cancellation_token token) {
    check_path(path);

    return run_async(std::move(token),
                     [this, path = std::string(path), bytes = std::move(bytes)](auto& io) {
                         return do_write_all_bytes(io, path.c_str(), bytes.data(), bytes.size());
                     });
}

std::future<outcome<std::string>> file_transfer::read_all_text_async(const char* path,
                                                                     const text_codec& codec,
                                                                     cancellation_token token) {
    check_path(path);

    return run_async(std::move(token), [this, path = std::string(path), &codec](auto& io) {
        return do_read_all_text(io, path.c_str(), codec);
    });
}

std::future<outcome<void>> file_transfer::write_all_text_async(const char* path, std::string text,
                                                               const text_codec& codec,
                                                               cancellation_token token) {
    check_path(path);

    return run_async(std::move(token),
                     [this, path = std::string(path), text = std::move(text), &codec](auto& io) {
                         return do_write_text(io, path.c_str(), vfs::create, text, codec);
                     });
}

std::future<outcome<void>> file_transfer::append_all_text_async(const char* path, std::string text,
                                                                const text_codec& codec,
                                                                cancellation_token token) {
    check_path(path);

    return run_async(std::move(token),
                     [this, path = std::string(path), text = std::move(text), &codec](auto& io) {
                         return do_write_text(io, path.c_str(), vfs::append, text, codec);
                     });
}

std::future<outcome<std::vector<std::string>>>
file_transfer::read_all_lines_async(const char* path, const text_codec& codec,
                                    cancellation_token token) {
    check_path(path);

    return run_async(std::move(token), [this, path = std::string(path), &codec](auto& io) {
        return do_read_all_lines(io, path.c_str(), codec);
    });
}

std::future<outcome<void>> file_transfer::write_all_lines_async(const char* path,
                                                                std::vector<std::string> lines,
                                                                const text_codec& codec,
                                                                cancellation_token token) {
    check_path(path);

    return run_async(std::move(token),
                     [this, path = std::string(path), lines = std::move(lines), &codec](auto& io) {
                         return do_write_lines(io, path.c_str(), vfs::create, lines, codec);
                     });
}

std::future<outcome<void>> file_transfer::append_all_lines_async(const char* path,
                                                                 std::vector<std::string> lines,
                                                                 const text_codec& codec,
                                                                 cancellation_token token) {
    check_path(path);

    return run_async(std::move(token),
                     [this, path = std::string(path), lines = std::move(lines), &codec](auto& io) {
                         return do_write_lines(io, path.c_str(), vfs::append, lines, codec);
                     });
}

/*
 * Core algorithms, shared by both forms.
 */

template<typename Io>
outcome<std::vector<byte>> file_transfer::do_read_all_bytes(Io& io, const char* path) {
    if (io.cancelled())
        return outcome<std::vector<byte>>::cancelled();

    std::unique_ptr<file> f = open_read(path);
    growable_reader reader(*m_bytes, m_options);
    outcome<std::vector<byte>> result = reader.read_all(io, *f);
    if (result) {
        SLURP_LOG_TRACE("Read {} bytes from `{}`.", result.value().size(), path);
        f->close();
    }
    return result;
}

template<typename Io>
outcome<void>
file_transfer::do_write_all_bytes(Io& io, const char* path, const byte* data, size_t size) {
    if (io.cancelled())
        return outcome<void>::cancelled();

    SLURP_LOG_TRACE("Opening `{}` for writing.", path);
    std::unique_ptr<file> f = m_vfs->open(path, vfs::create, vfs::write_only, vfs::share_read);
    if (!detail::write_all(io, *f, data, size))
        return outcome<void>::cancelled();

    SLURP_LOG_TRACE("Wrote {} bytes to `{}`.", size, path);
    f->close();
    return outcome<void>::completed();
}

template<typename Io>
outcome<std::string>
file_transfer::do_read_all_text(Io& io, const char* path, const text_codec& codec) {
    outcome<std::vector<byte>> bytes = do_read_all_bytes(io, path);
    if (!bytes)
        return outcome<std::string>::cancelled();

    return decode_text(bytes.value(), codec, *m_chars);
}

template<typename Io>
outcome<void> file_transfer::do_write_text(Io& io, const char* path, vfs::open_mode mode,
                                           std::string_view text, const text_codec& codec) {
    if (io.cancelled())
        return outcome<void>::cancelled();

    text_writer writer = open_writer(path, mode, codec, !text.empty());
    if (!writer.write(io, text)) {
        writer.discard();
        return outcome<void>::cancelled();
    }
    if (!writer.close(io))
        return outcome<void>::cancelled();
    return outcome<void>::completed();
}

template<typename Io>
outcome<std::vector<std::string>>
file_transfer::do_read_all_lines(Io& io, const char* path, const text_codec& codec) {
    using result_type = outcome<std::vector<std::string>>;

    if (io.cancelled())
        return result_type::cancelled();

    line_reader reader = open_reader(path, codec);
    std::vector<std::string> lines;
    std::string line;
    while (true) {
        switch (reader.next(io, line)) {
        case read_status::line:
            lines.push_back(std::move(line));
            break;
        case read_status::end:
            return result_type(std::move(lines));
        case read_status::cancelled:
            return result_type::cancelled();
        }
    }
}

file_transfer& default_transfer() {
    static file_transfer transfer;
    return transfer;
}

} // namespace slurp
