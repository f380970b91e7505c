#include <slurp/text_writer.hpp>

#include <slurp/assert.hpp>
#include <slurp/deferred.hpp>
#include <slurp/detail/io_strategy.hpp>
#include <slurp/exception.hpp>
#include <slurp/log.hpp>

#include <algorithm>
#include <cstring>
#include <exception>
#include <utility>

namespace slurp {

// Room for the longest byte order mark.
static constexpr size_t min_buffer_size = 4;

text_writer::text_writer(std::unique_ptr<file> f, const text_codec& codec, buffer_pool<byte>& pool,
                         size_t buffer_size, std::string newline, bool write_preamble)
    : m_file(std::move(f))
    , m_codec(&codec)
    , m_newline(std::move(newline)) {
    SLURP_ASSERT(m_file, "Null file.");

    m_buffer = pool.rent(std::max(buffer_size, min_buffer_size));
    if (write_preamble) {
        byte_range preamble = codec.preamble();
        std::memcpy(m_buffer.data(), preamble.data, preamble.size);
        m_size = preamble.size;
    }
}

text_writer::text_writer(text_writer&& other) noexcept
    : m_file(std::move(other.m_file))
    , m_codec(other.m_codec)
    , m_buffer(std::move(other.m_buffer))
    , m_size(std::exchange(other.m_size, 0))
    , m_newline(std::move(other.m_newline))
    , m_encoded(std::move(other.m_encoded))
    , m_broken(std::exchange(other.m_broken, false)) {}

text_writer& text_writer::operator=(text_writer&& other) noexcept {
    if (this != &other) {
        close_quietly();
        m_file = std::move(other.m_file);
        m_codec = other.m_codec;
        m_buffer = std::move(other.m_buffer);
        m_size = std::exchange(other.m_size, 0);
        m_newline = std::move(other.m_newline);
        m_encoded = std::move(other.m_encoded);
        m_broken = std::exchange(other.m_broken, false);
    }
    return *this;
}

text_writer::~text_writer() {
    close_quietly();
}

void text_writer::close_quietly() noexcept {
    if (!m_file)
        return;

    if (!m_broken) {
        std::string name = m_file->name();
        try {
            close();
        } catch (const std::exception& e) {
            SLURP_LOG_WARN("Failed to close `{}`: {}", name, e.what());
        }
    }
    discard();
}

void text_writer::write(std::string_view text) {
    detail::blocking_io io;
    bool done = write(io, text);
    SLURP_ASSERT(done, "Blocking writes cannot be cancelled.");
    unused(done);
}

void text_writer::write_line(std::string_view text) {
    detail::blocking_io io;
    bool done = write_line(io, text);
    SLURP_ASSERT(done, "Blocking writes cannot be cancelled.");
    unused(done);
}

void text_writer::flush() {
    detail::blocking_io io;
    bool done = flush(io);
    SLURP_ASSERT(done, "Blocking writes cannot be cancelled.");
    unused(done);
}

void text_writer::close() {
    detail::blocking_io io;
    bool done = close(io);
    SLURP_ASSERT(done, "Blocking writes cannot be cancelled.");
    unused(done);
}

void text_writer::discard() noexcept {
    m_file.reset();
    m_buffer.reset();
    m_size = 0;
}

void text_writer::check_open() const {
    if (!m_file)
        SLURP_THROW(bad_operation("The writer has been closed."));
    if (m_broken)
        SLURP_THROW(bad_operation(fmt::format(
            "The writer for `{}` is broken because a previous write failed.", m_file->name())));
}

template<typename Io>
bool text_writer::write(Io& io, std::string_view text) {
    check_open();

    m_encoded.clear();
    m_codec->encode(text, m_encoded);
    return append(io, m_encoded.data(), m_encoded.size());
}

template<typename Io>
bool text_writer::write_line(Io& io, std::string_view text) {
    check_open();

    m_encoded.clear();
    m_codec->encode(text, m_encoded);
    m_codec->encode(m_newline, m_encoded);
    return append(io, m_encoded.data(), m_encoded.size());
}

template<typename Io>
bool text_writer::flush(Io& io) {
    check_open();
    return flush_buffer(io);
}

template<typename Io>
bool text_writer::close(Io& io) {
    if (!m_file)
        return true;

    // The file and the buffer are released on every path.
    deferred guard = [&] { discard(); };
    if (!m_broken && !flush_buffer(io))
        return false;

    SLURP_LOG_TRACE("Closing `{}`.", m_file->name());
    m_file->close();
    return true;
}

template<typename Io>
bool text_writer::append(Io& io, const byte* data, size_t size) {
    const size_t capacity = m_buffer.capacity();
    while (size > 0) {
        if (m_size == 0 && size >= capacity) {
            // Nothing to combine with: write large blocks directly.
            deferred guard = [&] { m_broken = true; };
            if (!detail::write_all(io, *m_file, data, size))
                return false;
            guard.disable();
            return true;
        }

        const size_t n = std::min(capacity - m_size, size);
        std::memcpy(m_buffer.data() + m_size, data, n);
        m_size += n;
        data += n;
        size -= n;

        if (m_size == capacity && !flush_buffer(io))
            return false;
    }
    return true;
}

template<typename Io>
bool text_writer::flush_buffer(Io& io) {
    if (m_size == 0)
        return true;

    // A partially written buffer cannot be retried.
    deferred guard = [&] { m_broken = true; };
    const size_t size = std::exchange(m_size, 0);
    if (!detail::write_all(io, *m_file, m_buffer.data(), size))
        return false;
    guard.disable();
    return true;
}

template bool text_writer::write(detail::blocking_io&, std::string_view);
template bool text_writer::write(detail::cancellable_io&, std::string_view);
template bool text_writer::write_line(detail::blocking_io&, std::string_view);
template bool text_writer::write_line(detail::cancellable_io&, std::string_view);
template bool text_writer::flush(detail::blocking_io&);
template bool text_writer::flush(detail::cancellable_io&);
template bool text_writer::close(detail::blocking_io&);
template bool text_writer::close(detail::cancellable_io&);

} // namespace slurp
