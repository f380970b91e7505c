#include <slurp/text_codec.hpp>

#include <slurp/assert.hpp>
#include <slurp/exception.hpp>

#include <algorithm>
#include <cstring>
#include <initializer_list>

namespace slurp {

text_decoder::~text_decoder() {}

text_codec::~text_codec() {}

namespace {

constexpr char32_t replacement_char = 0xFFFD;

enum class scan_status {
    /// A code point was decoded.
    ok,

    /// The input ends in the middle of a (so far valid) sequence.
    incomplete,

    /// The input starts with a malformed sequence.
    invalid,
};

struct scan_result {
    scan_status status;
    char32_t cp = 0;

    /// Input bytes covered by the code point or the malformed sequence.
    size_t length = 0;
};

bool is_surrogate(char32_t cp) {
    return cp >= 0xD800 && cp <= 0xDFFF;
}

/*
 * Decodes the first code point of a UTF-8 sequence. Malformed input is
 * reported as the maximal prefix of a valid sequence (at least one byte),
 * so that each malformed subsequence produces exactly one replacement.
 */
scan_result scan_utf8(const byte* p, size_t avail) {
    SLURP_ASSERT(avail > 0, "empty input");

    const byte b0 = p[0];
    if (b0 < 0x80)
        return {scan_status::ok, b0, 1};

    size_t need;
    byte lo = 0x80, hi = 0xBF;
    char32_t cp;
    if (b0 >= 0xC2 && b0 <= 0xDF) {
        need = 2;
        cp = b0 & 0x1F;
    } else if (b0 >= 0xE0 && b0 <= 0xEF) {
        need = 3;
        cp = b0 & 0x0F;
        if (b0 == 0xE0)
            lo = 0xA0; // overlong
        else if (b0 == 0xED)
            hi = 0x9F; // surrogates
    } else if (b0 >= 0xF0 && b0 <= 0xF4) {
        need = 4;
        cp = b0 & 0x07;
        if (b0 == 0xF0)
            lo = 0x90; // overlong
        else if (b0 == 0xF4)
            hi = 0x8F; // above U+10FFFF
    } else {
        return {scan_status::invalid, 0, 1};
    }

    for (size_t i = 1; i < need; ++i) {
        if (i >= avail)
            return {scan_status::incomplete, 0, 0};

        const byte b = p[i];
        const byte min = i == 1 ? lo : 0x80;
        const byte max = i == 1 ? hi : 0xBF;
        if (b < min || b > max)
            return {scan_status::invalid, 0, i};
        cp = (cp << 6) | (b & 0x3F);
    }
    return {scan_status::ok, cp, need};
}

u32 load_u16(const byte* p, bool big_endian) {
    return big_endian ? (u32(p[0]) << 8) | p[1] : (u32(p[1]) << 8) | p[0];
}

u32 load_u32(const byte* p, bool big_endian) {
    return big_endian ? (u32(p[0]) << 24) | (u32(p[1]) << 16) | (u32(p[2]) << 8) | p[3]
                      : (u32(p[3]) << 24) | (u32(p[2]) << 16) | (u32(p[1]) << 8) | p[0];
}

scan_result scan_utf16(const byte* p, size_t avail, bool big_endian) {
    if (avail < 2)
        return {scan_status::incomplete, 0, 0};

    const u32 u0 = load_u16(p, big_endian);
    if (u0 < 0xD800 || u0 > 0xDFFF)
        return {scan_status::ok, u0, 2};
    if (u0 >= 0xDC00)
        return {scan_status::invalid, 0, 2}; // unpaired low surrogate

    if (avail < 4)
        return {scan_status::incomplete, 0, 0};

    const u32 u1 = load_u16(p + 2, big_endian);
    if (u1 < 0xDC00 || u1 > 0xDFFF)
        return {scan_status::invalid, 0, 2}; // unpaired high surrogate

    return {scan_status::ok, 0x10000 + ((u0 - 0xD800) << 10) + (u1 - 0xDC00), 4};
}

scan_result scan_utf32(const byte* p, size_t avail, bool big_endian) {
    if (avail < 4)
        return {scan_status::incomplete, 0, 0};

    const u32 cp = load_u32(p, big_endian);
    if (cp > 0x10FFFF || is_surrogate(cp))
        return {scan_status::invalid, 0, 4};
    return {scan_status::ok, cp, 4};
}

scan_result scan(unicode_form form, const byte* p, size_t avail) {
    switch (form) {
    case unicode_form::utf8:
        return scan_utf8(p, avail);
    case unicode_form::utf16le:
        return scan_utf16(p, avail, false);
    case unicode_form::utf16be:
        return scan_utf16(p, avail, true);
    case unicode_form::utf32le:
        return scan_utf32(p, avail, false);
    case unicode_form::utf32be:
        return scan_utf32(p, avail, true);
    }
    SLURP_UNREACHABLE("invalid unicode form");
}

// Writes the UTF-8 encoding of `cp` and returns the number of chars written (1 to 4).
size_t put_utf8(char32_t cp, char* out) {
    auto put = [&](size_t i, u32 value) { out[i] = static_cast<char>(static_cast<byte>(value)); };

    if (cp < 0x80) {
        put(0, cp);
        return 1;
    }
    if (cp < 0x800) {
        put(0, 0xC0 | (cp >> 6));
        put(1, 0x80 | (cp & 0x3F));
        return 2;
    }
    if (cp < 0x10000) {
        put(0, 0xE0 | (cp >> 12));
        put(1, 0x80 | ((cp >> 6) & 0x3F));
        put(2, 0x80 | (cp & 0x3F));
        return 3;
    }
    put(0, 0xF0 | (cp >> 18));
    put(1, 0x80 | ((cp >> 12) & 0x3F));
    put(2, 0x80 | ((cp >> 6) & 0x3F));
    put(3, 0x80 | (cp & 0x3F));
    return 4;
}

/*
 * Shared implementation of all decoders. `Scanner` decodes a single code point
 * from the start of its input. Up to three bytes of an incomplete sequence are
 * carried over between calls.
 */
template<typename Scanner>
class basic_decoder final : public text_decoder {
public:
    basic_decoder(Scanner scanner, const char* encoding, bool strict)
        : m_scanner(scanner)
        , m_encoding(encoding)
        , m_strict(strict) {}

    size_t decode(const byte* data, size_t size, char* out) override;
    size_t finish(char* out) override;
    u64 position() const noexcept override { return m_position; }

private:
    // Emits the result of a successful or failed scan. Advances the position.
    size_t emit(const scan_result& r, char* out);

private:
    Scanner m_scanner;
    const char* m_encoding;
    bool m_strict;

    // Bytes of an incomplete sequence.
    byte m_pending[4];
    size_t m_pending_size = 0;

    // Offset of the first byte that has not been emitted.
    u64 m_position = 0;
};

template<typename Scanner>
size_t basic_decoder<Scanner>::emit(const scan_result& r, char* out) {
    SLURP_ASSERT(r.status != scan_status::incomplete, "incomplete sequence");

    size_t written;
    if (r.status == scan_status::ok) {
        written = put_utf8(r.cp, out);
    } else {
        if (m_strict) {
            SLURP_THROW(decode_error(
                fmt::format("Malformed {} sequence at byte offset {}.", m_encoding, m_position),
                m_position));
        }
        written = put_utf8(replacement_char, out);
    }
    m_position += r.length;
    return written;
}

template<typename Scanner>
size_t basic_decoder<Scanner>::decode(const byte* data, size_t size, char* out) {
    SLURP_ASSERT(data != nullptr || size == 0, "null input");

    char* const begin = out;
    size_t i = 0;

    // Complete the sequence left over from the previous call first.
    while (m_pending_size > 0 && i < size) {
        byte tmp[8];
        const size_t n = m_pending_size;
        const size_t take = std::min(size - i, sizeof(tmp) - n);
        std::memcpy(tmp, m_pending, n);
        std::memcpy(tmp + n, data + i, take);

        const scan_result r = m_scanner(tmp, n + take);
        if (r.status == scan_status::incomplete) {
            SLURP_ASSERT(n + take <= sizeof(m_pending), "pending sequence too long");
            std::memcpy(m_pending, tmp, n + take);
            m_pending_size = n + take;
            return static_cast<size_t>(out - begin);
        }

        out += emit(r, out);
        if (r.length >= n) {
            i += r.length - n;
            m_pending_size = 0;
        } else {
            std::memmove(m_pending, m_pending + r.length, n - r.length);
            m_pending_size = n - r.length;
        }
    }

    while (i < size) {
        const scan_result r = m_scanner(data + i, size - i);
        if (r.status == scan_status::incomplete) {
            SLURP_ASSERT(size - i < sizeof(m_pending), "pending sequence too long");
            std::memcpy(m_pending, data + i, size - i);
            m_pending_size = size - i;
            break;
        }
        out += emit(r, out);
        i += r.length;
    }
    return static_cast<size_t>(out - begin);
}

template<typename Scanner>
size_t basic_decoder<Scanner>::finish(char* out) {
    if (m_pending_size == 0)
        return 0;

    // A truncated sequence is a single malformed subsequence.
    const scan_result r{scan_status::invalid, 0, m_pending_size};
    m_pending_size = 0;
    return emit(r, out);
}

struct unicode_scanner {
    unicode_form form;

    scan_result operator()(const byte* p, size_t avail) const { return scan(form, p, avail); }
};

struct latin1_scanner {
    scan_result operator()(const byte* p, size_t avail) const {
        SLURP_ASSERT(avail > 0, "empty input");
        unused(avail);
        return {scan_status::ok, p[0], 1};
    }
};

void put_encoded(unicode_form form, char32_t cp, std::vector<byte>& out) {
    switch (form) {
    case unicode_form::utf8: {
        char buf[4];
        size_t n = put_utf8(cp, buf);
        out.insert(out.end(), reinterpret_cast<byte*>(buf), reinterpret_cast<byte*>(buf) + n);
        return;
    }
    case unicode_form::utf16le:
    case unicode_form::utf16be: {
        const bool be = form == unicode_form::utf16be;
        auto put_unit = [&](u32 unit) {
            byte hi = static_cast<byte>(unit >> 8), lo = static_cast<byte>(unit);
            out.push_back(be ? hi : lo);
            out.push_back(be ? lo : hi);
        };
        if (cp < 0x10000) {
            put_unit(cp);
        } else {
            const u32 v = cp - 0x10000;
            put_unit(0xD800 + (v >> 10));
            put_unit(0xDC00 + (v & 0x3FF));
        }
        return;
    }
    case unicode_form::utf32le:
    case unicode_form::utf32be: {
        byte b[4] = {static_cast<byte>(cp >> 24), static_cast<byte>(cp >> 16),
                     static_cast<byte>(cp >> 8), static_cast<byte>(cp)};
        if (form == unicode_form::utf32le)
            std::reverse(b, b + 4);
        out.insert(out.end(), b, b + 4);
        return;
    }
    }
    SLURP_UNREACHABLE("invalid unicode form");
}

/*
 * Iterates over the code points of UTF-8 `text`. Malformed input is passed
 * to `on_invalid(offset)`, which either throws or returns a substitute.
 */
template<typename OnCodePoint, typename OnInvalid>
void for_each_code_point(std::string_view text, OnCodePoint&& on_cp, OnInvalid&& on_invalid) {
    const byte* data = reinterpret_cast<const byte*>(text.data());
    const size_t size = text.size();

    size_t i = 0;
    while (i < size) {
        scan_result r = scan_utf8(data + i, size - i);
        if (r.status == scan_status::ok) {
            on_cp(r.cp);
            i += r.length;
            continue;
        }

        // The text ends within a sequence: everything that is left is malformed.
        if (r.status == scan_status::incomplete)
            r.length = size - i;
        on_invalid(i);
        i += r.length;
    }
}

} // namespace

const char* unicode_codec::name() const noexcept {
    switch (m_form) {
    case unicode_form::utf8:
        return "utf-8";
    case unicode_form::utf16le:
        return "utf-16le";
    case unicode_form::utf16be:
        return "utf-16be";
    case unicode_form::utf32le:
        return "utf-32le";
    case unicode_form::utf32be:
        return "utf-32be";
    }
    return "???";
}

byte_range unicode_codec::bom() const noexcept {
    static constexpr byte utf8_bom[] = {0xEF, 0xBB, 0xBF};
    static constexpr byte utf16le_bom[] = {0xFF, 0xFE};
    static constexpr byte utf16be_bom[] = {0xFE, 0xFF};
    static constexpr byte utf32le_bom[] = {0xFF, 0xFE, 0x00, 0x00};
    static constexpr byte utf32be_bom[] = {0x00, 0x00, 0xFE, 0xFF};

    switch (m_form) {
    case unicode_form::utf8:
        return {utf8_bom, sizeof(utf8_bom)};
    case unicode_form::utf16le:
        return {utf16le_bom, sizeof(utf16le_bom)};
    case unicode_form::utf16be:
        return {utf16be_bom, sizeof(utf16be_bom)};
    case unicode_form::utf32le:
        return {utf32le_bom, sizeof(utf32le_bom)};
    case unicode_form::utf32be:
        return {utf32be_bom, sizeof(utf32be_bom)};
    }
    return {};
}

std::unique_ptr<text_decoder> unicode_codec::make_decoder() const {
    return std::make_unique<basic_decoder<unicode_scanner>>(unicode_scanner{m_form}, name(),
                                                            strict());
}

void unicode_codec::encode(std::string_view text, std::vector<byte>& out) const {
    // Valid UTF-8 input needs at most 4 bytes per char in the target encodings.
    out.reserve(out.size() + (m_form == unicode_form::utf8 ? text.size() : 2 * text.size()));

    for_each_code_point(
        text, [&](char32_t cp) { put_encoded(m_form, cp, out); },
        [&](size_t offset) {
            if (strict()) {
                SLURP_THROW(encode_error(
                    fmt::format("Invalid UTF-8 sequence at offset {} of the text.", offset),
                    offset));
            }
            put_encoded(m_form, replacement_char, out);
        });
}

std::unique_ptr<text_decoder> latin1_codec::make_decoder() const {
    return std::make_unique<basic_decoder<latin1_scanner>>(latin1_scanner(), name(), strict());
}

void latin1_codec::encode(std::string_view text, std::vector<byte>& out) const {
    out.reserve(out.size() + text.size());

    size_t offset = 0;
    auto substitute = [&](size_t at, const char* reason) {
        if (strict()) {
            SLURP_THROW(
                encode_error(fmt::format("{} at offset {} of the text.", reason, at), at));
        }
        out.push_back('?');
    };

    for_each_code_point(
        text,
        [&](char32_t cp) {
            if (cp > 0xFF) {
                substitute(offset, "Character not representable in ISO-8859-1");
            } else {
                out.push_back(static_cast<byte>(cp));
            }
            offset += cp < 0x80 ? 1 : cp < 0x800 ? 2 : cp < 0x10000 ? 3 : 4;
        },
        [&](size_t at) {
            substitute(at, "Invalid UTF-8 sequence");
            offset = at + 1;
        });
}

std::optional<bom_match> detect_bom(const byte* data, size_t size) noexcept {
    auto starts_with = [&](std::initializer_list<byte> sig) {
        return size >= sig.size() && std::equal(sig.begin(), sig.end(), data);
    };

    if (starts_with({0xEF, 0xBB, 0xBF}))
        return bom_match{unicode_form::utf8, 3};
    if (starts_with({0xFF, 0xFE, 0x00, 0x00}))
        return bom_match{unicode_form::utf32le, 4};
    if (starts_with({0xFF, 0xFE}))
        return bom_match{unicode_form::utf16le, 2};
    if (starts_with({0xFE, 0xFF}))
        return bom_match{unicode_form::utf16be, 2};
    if (starts_with({0x00, 0x00, 0xFE, 0xFF}))
        return bom_match{unicode_form::utf32be, 4};
    return std::nullopt;
}

const text_codec& utf8() {
    static const unicode_codec codec(unicode_form::utf8, false, false);
    return codec;
}

const text_codec& utf8_no_bom() {
    static const unicode_codec codec(unicode_form::utf8, false, true);
    return codec;
}

const text_codec& utf8_bom() {
    static const unicode_codec codec(unicode_form::utf8, true, true);
    return codec;
}

const text_codec& utf16le() {
    return codec_for(unicode_form::utf16le, true);
}

const text_codec& utf16be() {
    return codec_for(unicode_form::utf16be, true);
}

const text_codec& utf32le() {
    return codec_for(unicode_form::utf32le, true);
}

const text_codec& utf32be() {
    return codec_for(unicode_form::utf32be, true);
}

const text_codec& latin1() {
    static const latin1_codec codec(true);
    return codec;
}

const text_codec& codec_for(unicode_form form, bool strict) {
    // Indexed by [form][strict].
    static const unicode_codec codecs[5][2] = {
        {{unicode_form::utf8, false, false}, {unicode_form::utf8, false, true}},
        {{unicode_form::utf16le, true, false}, {unicode_form::utf16le, true, true}},
        {{unicode_form::utf16be, true, false}, {unicode_form::utf16be, true, true}},
        {{unicode_form::utf32le, true, false}, {unicode_form::utf32le, true, true}},
        {{unicode_form::utf32be, true, false}, {unicode_form::utf32be, true, true}},
    };
    return codecs[static_cast<size_t>(form)][strict ? 1 : 0];
}

} // namespace slurp
