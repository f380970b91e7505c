#include <slurp/line_reader.hpp>

#include <slurp/assert.hpp>
#include <slurp/deferred.hpp>
#include <slurp/detail/io_strategy.hpp>
#include <slurp/exception.hpp>
#include <slurp/log.hpp>

#include <algorithm>
#include <cstring>
#include <utility>

namespace slurp {

// The byte order mark is at most 4 bytes long.
static constexpr size_t min_chunk_size = 4;

line_reader::line_reader(std::unique_ptr<file> f, const text_codec& codec,
                         buffer_pool<byte>& bytes, buffer_pool<char>& chars, size_t chunk_size)
    : m_file(std::move(f))
    , m_codec(&codec) {
    SLURP_ASSERT(m_file, "Null file.");

    deferred guard = [&] { release(); };
    m_raw = bytes.rent(std::max(chunk_size, min_chunk_size));
    m_text = chars.rent(text_decoder::max_output(m_raw.capacity()));
    guard.disable();
}

line_reader::line_reader(line_reader&& other) noexcept {
    *this = std::move(other);
}

line_reader& line_reader::operator=(line_reader&& other) noexcept {
    if (this != &other) {
        release();
        m_file = std::move(other.m_file);
        m_codec = other.m_codec;
        m_active_codec = other.m_active_codec;
        m_decoder = std::move(other.m_decoder);
        m_raw = std::move(other.m_raw);
        m_text = std::move(other.m_text);
        m_text_pos = std::exchange(other.m_text_pos, 0);
        m_text_size = std::exchange(other.m_text_size, 0);
        m_line = std::move(other.m_line);
        m_in_line = other.m_in_line;
        m_skip_lf = other.m_skip_lf;
        m_eof = other.m_eof;
    }
    return *this;
}

line_reader::~line_reader() {
    release();
}

void line_reader::release() noexcept {
    // The file's destructor closes it and logs failures.
    m_file.reset();
    m_decoder.reset();
    m_raw.reset();
    m_text.reset();
    m_text_pos = m_text_size = 0;
}

void line_reader::close() {
    if (m_file) {
        deferred guard = [&] { release(); };
        m_file->close();
    }
    release();
}

const char* line_reader::codec_name() const noexcept {
    if (m_active_codec)
        return m_active_codec->name();
    return m_codec ? m_codec->name() : "";
}

bool line_reader::next(std::string& line) {
    detail::blocking_io io;
    read_status status = next(io, line);
    SLURP_ASSERT(status != read_status::cancelled, "Blocking reads cannot be cancelled.");
    unused(status);
    return status == read_status::line;
}

std::future<outcome<std::optional<std::string>>>
line_reader::next_async(io_executor& executor, cancellation_token token) {
    using result_type = outcome<std::optional<std::string>>;

    if (token.cancelled())
        return detail::ready_future(result_type::cancelled());

    return executor.submit([this, token = std::move(token)]() {
        detail::cancellable_io io(token);
        std::string line;
        switch (next(io, line)) {
        case read_status::line:
            return result_type(std::optional<std::string>(std::move(line)));
        case read_status::end:
            return result_type(std::optional<std::string>());
        case read_status::cancelled:
            break;
        }
        return result_type::cancelled();
    });
}

line_reader::iterator line_reader::begin() {
    return iterator(this);
}

line_reader::iterator line_reader::end() {
    return iterator();
}

template<typename Io>
read_status line_reader::next(Io& io, std::string& line) {
    if (!m_file && m_text_pos == m_text_size)
        return read_status::end;
    if (io.cancelled())
        return read_status::cancelled;

    // Errors close the file; the sequence is over.
    deferred guard = [&] { release(); };

    while (true) {
        if (m_text_pos == m_text_size) {
            if (m_eof) {
                close();
                guard.disable();
                if (!m_in_line)
                    return read_status::end;

                m_in_line = false;
                line = std::move(m_line);
                m_line.clear();
                return read_status::line;
            }

            if (!fill(io)) {
                guard.disable();
                return read_status::cancelled;
            }
            continue;
        }

        const char* text = m_text.data();
        if (m_skip_lf) {
            m_skip_lf = false;
            if (text[m_text_pos] == '\n') {
                ++m_text_pos;
                continue;
            }
        }

        const char* begin = text + m_text_pos;
        const char* end = text + m_text_size;
        const char* pos = std::find_if(begin, end, [](char c) { return c == '\n' || c == '\r'; });
        m_line.append(begin, pos);
        if (pos == end) {
            m_in_line = true;
            m_text_pos = m_text_size;
            continue;
        }

        m_skip_lf = *pos == '\r';
        m_text_pos = static_cast<size_t>(pos - text) + 1;
        m_in_line = false;
        line = std::move(m_line);
        m_line.clear();
        guard.disable();
        return read_status::line;
    }
}

template<typename Io>
bool line_reader::fill(Io& io) {
    SLURP_ASSERT(m_file, "File must be open.");

    if (io.cancelled())
        return false;

    if (!m_decoder)
        return start(io);

    size_t n = io.read(*m_file, m_raw.data(), m_raw.capacity());
    if (n == 0) {
        finish();
    } else {
        decode(n);
    }
    return true;
}

template<typename Io>
bool line_reader::start(Io& io) {
    // Collect enough bytes to recognize any byte order mark.
    size_t have = 0;
    bool eof = false;
    while (have < min_chunk_size) {
        size_t n = io.read(*m_file, m_raw.data() + have, m_raw.capacity() - have);
        if (n == 0) {
            eof = true;
            break;
        }
        have += n;
    }

    size_t skip = 0;
    m_active_codec = m_codec;
    if (auto bom = detect_bom(m_raw.data(), have)) {
        m_active_codec = &codec_for(bom->form, m_codec->strict());
        skip = bom->length;
    }
    m_decoder = m_active_codec->make_decoder();
    SLURP_LOG_TRACE("Reading lines of `{}` as {}.", m_file->name(), m_active_codec->name());

    if (skip > 0)
        std::memmove(m_raw.data(), m_raw.data() + skip, have - skip);
    decode(have - skip);
    if (eof)
        finish();
    return true;
}

void line_reader::decode(size_t raw_size) {
    m_text_pos = 0;
    m_text_size = m_decoder->decode(m_raw.data(), raw_size, m_text.data());
}

// Appends the decoder's final output to the text that has not been consumed yet.
// Both fit because the text buffer is sized for a full chunk plus the final output.
void line_reader::finish() {
    const size_t remaining = m_text_size - m_text_pos;
    std::memmove(m_text.data(), m_text.data() + m_text_pos, remaining);
    m_text_pos = 0;
    m_text_size = remaining + m_decoder->finish(m_text.data() + remaining);
    m_eof = true;
}

template read_status line_reader::next(detail::blocking_io&, std::string&);
template read_status line_reader::next(detail::cancellable_io&, std::string&);

} // namespace slurp
