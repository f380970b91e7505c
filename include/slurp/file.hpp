#ifndef SLURP_FILE_HPP
#define SLURP_FILE_HPP

#include <slurp/file_transfer.hpp>

#include <string>
#include <string_view>
#include <vector>

/*
 * Convenience functions for the system file system. They use the process wide
 * transfer object (see default_transfer()) with the default options.
 * Use a file_transfer object for custom options or non-blocking operations.
 */

namespace slurp {

inline std::vector<byte> read_all_bytes(const char* path) {
    return default_transfer().read_all_bytes(path);
}

inline void write_all_bytes(const char* path, const byte* data, size_t size) {
    default_transfer().write_all_bytes(path, data, size);
}

inline void write_all_bytes(const char* path, const std::vector<byte>& bytes) {
    default_transfer().write_all_bytes(path, bytes);
}

inline std::string read_all_text(const char* path, const text_codec& codec = utf8()) {
    return default_transfer().read_all_text(path, codec);
}

inline void
write_all_text(const char* path, std::string_view text, const text_codec& codec = utf8_no_bom()) {
    default_transfer().write_all_text(path, text, codec);
}

inline void
append_all_text(const char* path, std::string_view text, const text_codec& codec = utf8_no_bom()) {
    default_transfer().append_all_text(path, text, codec);
}

inline std::vector<std::string> read_all_lines(const char* path, const text_codec& codec = utf8()) {
    return default_transfer().read_all_lines(path, codec);
}

inline line_reader read_lines(const char* path, const text_codec& codec = utf8()) {
    return default_transfer().read_lines(path, codec);
}

template<typename Range>
void write_all_lines(const char* path, const Range& lines, const text_codec& codec = utf8_no_bom()) {
    default_transfer().write_all_lines(path, lines, codec);
}

template<typename Range>
void append_all_lines(const char* path, const Range& lines,
                      const text_codec& codec = utf8_no_bom()) {
    default_transfer().append_all_lines(path, lines, codec);
}

inline text_writer create_text(const char* path, const text_codec& codec = utf8_no_bom()) {
    return default_transfer().create_text(path, codec);
}

inline text_writer append_text(const char* path, const text_codec& codec = utf8_no_bom()) {
    return default_transfer().append_text(path, codec);
}

} // namespace slurp

#endif // SLURP_FILE_HPP
