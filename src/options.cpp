#include <slurp/options.hpp>

#include <slurp/exception.hpp>

namespace slurp {

void transfer_options::validate() const {
    if (m_initial_buffer_size == 0)
        SLURP_THROW(bad_argument("The initial buffer size must not be zero."));
    if (m_max_buffer_length == 0 || m_max_buffer_length > slurp::max_buffer_length) {
        SLURP_THROW(bad_argument(fmt::format("The maximum buffer length must be in [1, {}] (got {}).",
                                             slurp::max_buffer_length, m_max_buffer_length)));
    }
    if (m_initial_buffer_size > m_max_buffer_length) {
        SLURP_THROW(bad_argument(
            fmt::format("The initial buffer size ({}) exceeds the maximum buffer length ({}).",
                        m_initial_buffer_size, m_max_buffer_length)));
    }
    if (m_read_chunk_size == 0)
        SLURP_THROW(bad_argument("The read chunk size must not be zero."));
    if (m_write_buffer_size == 0)
        SLURP_THROW(bad_argument("The write buffer size must not be zero."));
    if (m_newline != "\n" && m_newline != "\r\n" && m_newline != "\r")
        SLURP_THROW(bad_argument("The newline must be one of \"\\n\", \"\\r\\n\" or \"\\r\"."));
}

} // namespace slurp
