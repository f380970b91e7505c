#ifndef SLURP_TEXT_CODEC_HPP
#define SLURP_TEXT_CODEC_HPP

#include <slurp/defs.hpp>

#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace slurp {

/// A view of a constant byte sequence.
struct byte_range {
    const byte* data = nullptr;
    size_t size = 0;

    bool empty() const noexcept { return size == 0; }
    const byte* begin() const noexcept { return data; }
    const byte* end() const noexcept { return data + size; }
};

/// Converts a stream of encoded bytes into UTF-8 text.
///
/// Decoders are stateful: a multi-byte sequence that is split between
/// two calls to decode() is completed by the second call.
class text_decoder {
public:
    text_decoder() = default;

    virtual ~text_decoder();

    /// Upper bound for the number of chars produced by decode() for `size` input bytes,
    /// including the output of bytes still pending from previous calls.
    /// Also bounds the output of finish() (use `size == 0`).
    static constexpr size_t max_output(size_t size) noexcept { return 3 * (size + 4); }

    /// Decodes `size` bytes and writes the resulting UTF-8 text to `out`, which
    /// must have room for at least `max_output(size)` chars.
    /// Returns the number of chars written.
    ///
    /// Throws @ref decode_error for malformed input if the codec is strict;
    /// otherwise malformed input is replaced by U+FFFD.
    virtual size_t decode(const byte* data, size_t size, char* out) = 0;

    /// Signals the end of the input. An incomplete trailing sequence
    /// is malformed. Returns the number of chars written to `out`.
    virtual size_t finish(char* out) = 0;

    /// Number of input bytes consumed so far.
    virtual u64 position() const noexcept = 0;

    text_decoder(const text_decoder&) = delete;
    text_decoder& operator=(const text_decoder&) = delete;
};

/// A text encoding: converts between encoded bytes and UTF-8 text.
class text_codec {
public:
    text_codec(bool emit_bom, bool strict)
        : m_emit_bom(emit_bom)
        , m_strict(strict) {}

    virtual ~text_codec();

    /// Name of the encoding, e.g. "utf-8".
    virtual const char* name() const noexcept = 0;

    /// The byte order mark of this encoding. Empty if the encoding has none.
    virtual byte_range bom() const noexcept = 0;

    /// Creates a new decoder for this encoding.
    virtual std::unique_ptr<text_decoder> make_decoder() const = 0;

    /// Encodes the UTF-8 `text` and appends the result to `out`.
    ///
    /// Throws @ref encode_error if the text is not valid UTF-8 or contains
    /// a character this encoding cannot represent and the codec is strict.
    /// Otherwise such characters are replaced.
    virtual void encode(std::string_view text, std::vector<byte>& out) const = 0;

    /// The bytes written before the text: the byte order mark if `emit_bom()`
    /// is set, nothing otherwise.
    byte_range preamble() const noexcept {
        return m_emit_bom ? bom() : byte_range();
    }

    /// True if writes start with the byte order mark.
    bool emit_bom() const noexcept { return m_emit_bom; }

    /// True if malformed input raises errors instead of being replaced.
    bool strict() const noexcept { return m_strict; }

    text_codec(const text_codec&) = delete;
    text_codec& operator=(const text_codec&) = delete;

private:
    bool m_emit_bom;
    bool m_strict;
};

/// The encoding schemes of Unicode.
enum class unicode_form { utf8, utf16le, utf16be, utf32le, utf32be };

/// A codec for one of the Unicode encoding forms.
class unicode_codec final : public text_codec {
public:
    unicode_codec(unicode_form form, bool emit_bom, bool strict)
        : text_codec(emit_bom, strict)
        , m_form(form) {}

    unicode_form form() const noexcept { return m_form; }

    const char* name() const noexcept override;
    byte_range bom() const noexcept override;
    std::unique_ptr<text_decoder> make_decoder() const override;
    void encode(std::string_view text, std::vector<byte>& out) const override;

private:
    unicode_form m_form;
};

/// ISO-8859-1. Every byte maps to the code point of the same value;
/// code points above U+00FF are not representable.
class latin1_codec final : public text_codec {
public:
    explicit latin1_codec(bool strict)
        : text_codec(false, strict) {}

    const char* name() const noexcept override { return "iso-8859-1"; }
    byte_range bom() const noexcept override { return {}; }
    std::unique_ptr<text_decoder> make_decoder() const override;
    void encode(std::string_view text, std::vector<byte>& out) const override;
};

/// A byte order mark found at the start of a byte sequence.
struct bom_match {
    unicode_form form;

    /// Length of the byte order mark, in bytes.
    size_t length;
};

/// Inspects the start of `data` for a byte order mark.
///
/// \note UTF-16LE and UTF-32LE share their first two bytes, so callers
/// should pass at least 4 bytes unless the input is shorter than that.
std::optional<bom_match> detect_bom(const byte* data, size_t size) noexcept;

/// \defgroup codecs Built-in codecs
/// Process wide codec instances.
/// @{

/// UTF-8 without byte order mark; malformed input is replaced. The default for reading.
const text_codec& utf8();

/// UTF-8 without byte order mark; malformed input is rejected. The default for writing.
const text_codec& utf8_no_bom();

/// UTF-8 with byte order mark; malformed input is rejected.
const text_codec& utf8_bom();

/// UTF-16 little endian with byte order mark; malformed input is rejected.
const text_codec& utf16le();

/// UTF-16 big endian with byte order mark; malformed input is rejected.
const text_codec& utf16be();

/// UTF-32 little endian with byte order mark; malformed input is rejected.
const text_codec& utf32le();

/// UTF-32 big endian with byte order mark; malformed input is rejected.
const text_codec& utf32be();

/// ISO-8859-1; unrepresentable characters are rejected.
const text_codec& latin1();

/// @}

/// Returns the built-in codec for the given form with the given strictness.
/// The returned codec emits a byte order mark except for UTF-8.
const text_codec& codec_for(unicode_form form, bool strict);

} // namespace slurp

#endif // SLURP_TEXT_CODEC_HPP
