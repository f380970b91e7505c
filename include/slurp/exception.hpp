#ifndef SLURP_EXCEPTION_HPP
#define SLURP_EXCEPTION_HPP

#include <slurp/defs.hpp>

#include <exception>
#include <stdexcept>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>

#include <fmt/format.h>

/// @defgroup exception_support Exception support macros
/// @{

/**
 * Expands to the current source location (file, line, function).
 */
#define SLURP_SOURCE_LOCATION (::slurp::source_location(__FILE__, __LINE__, __func__))

/**
 * Augments a @ref slurp::exception with the current source location.
 */
#define SLURP_AUGMENT_EXCEPTION(e) (::slurp::detail::with_location((e), SLURP_SOURCE_LOCATION))

/**
 * Throw the given @ref slurp::exception with added source location information.
 */
#define SLURP_THROW(e) throw(SLURP_AUGMENT_EXCEPTION(e))

/**
 * Throw a new @ref slurp::exception `e` with added source location information
 * and the currently active exception (if any) as its cause.
 */
#define SLURP_THROW_NESTED(e) (::std::throw_with_nested(SLURP_AUGMENT_EXCEPTION(e)))

/// @}

namespace slurp {

/**
 * Represents the source code location at which an exception was thrown.
 */
class source_location {
public:
    source_location() = default;

    source_location(const char* file, int line, const char* function)
        : m_file(file)
        , m_line(line)
        , m_function(function) {}

    const char* file() const { return m_file; }
    int line() const { return m_line; }
    const char* function() const { return m_function; }

private:
    const char* m_file = "";
    int m_line = 0;
    const char* m_function = "";
};

class exception;

namespace detail {

template<typename Exception>
Exception with_location(Exception&& e, const source_location& where) {
    static_assert(std::is_base_of<exception, std::decay_t<Exception>>::value,
                  "Exception must be derived from slurp::exception.");
    e.set_where(where);
    return std::forward<Exception>(e);
}

} // namespace detail

/**
 * Base class for all exceptions thrown by this library.
 */
class exception : public std::runtime_error {
public:
    using runtime_error::runtime_error;

    /**
     * Returns the source code location that threw this exception.
     *
     * \note Requires that the exception was thrown using
     * @ref SLURP_THROW or @ref SLURP_THROW_NESTED, otherwise `where()`
     * will return an empty source location.
     */
    const source_location& where() const { return m_where; }

private:
    template<typename T>
    friend T detail::with_location(T&&, const source_location&);

    void set_where(const source_location& loc) { m_where = loc; }

private:
    source_location m_where;
};

/**
 * Exceptions of this class or its subclasses are thrown when an object
 * is being misused, i.e. it is being passed the wrong arguments
 * or it is in the wrong state.
 */
class usage_error : public exception {
public:
    using exception::exception;
};

/**
 * Thrown when an invalid argument is being passed to some operation,
 * e.g. a null or empty path. Always raised before any I/O takes place.
 */
class bad_argument : public usage_error {
public:
    using usage_error::usage_error;
};

/**
 * Thrown when an object cannot perform an operation in its current state.
 */
class bad_operation : public usage_error {
public:
    using usage_error::usage_error;
};

/**
 * Thrown when data could not be read from or written to a file.
 * Errors reported by the operating system keep their original error code.
 */
class io_error : public exception {
public:
    explicit io_error(const std::string& what)
        : exception(what) {}

    io_error(const std::string& what, std::error_code code)
        : exception(what)
        , m_code(code) {}

    /// The operating system error that caused this exception, if any.
    const std::error_code& code() const noexcept { return m_code; }

private:
    std::error_code m_code;
};

/**
 * Thrown when a file is too large to be held in a single buffer.
 */
class file_too_large : public io_error {
public:
    using io_error::io_error;
};

/**
 * Thrown when a file ends before the number of bytes it advertised
 * has been read.
 */
class end_of_file : public io_error {
public:
    using io_error::io_error;
};

/**
 * Thrown when a buffer pool cannot provide a buffer of the requested size.
 */
class capacity_exceeded : public exception {
public:
    using exception::exception;
};

/**
 * Base class of decoding and encoding failures.
 * `offset()` is the position of the offending input unit.
 */
class codec_error : public exception {
public:
    codec_error(const std::string& what, u64 offset)
        : exception(what)
        , m_offset(offset) {}

    u64 offset() const noexcept { return m_offset; }

private:
    u64 m_offset = 0;
};

/**
 * Thrown when a byte sequence is malformed under a strict text codec.
 */
class decode_error : public codec_error {
public:
    using codec_error::codec_error;
};

/**
 * Thrown when text contains a character that a strict codec cannot represent,
 * or when the UTF-8 input itself is malformed.
 */
class encode_error : public codec_error {
public:
    using codec_error::codec_error;
};

/**
 * Thrown when the value of a cancelled operation is requested.
 */
class operation_cancelled : public exception {
public:
    operation_cancelled()
        : exception("The operation was cancelled.") {}
};

/// Creates an io_error from the current value of `errno`.
io_error errno_error(const std::string& what);

} // namespace slurp

#endif // SLURP_EXCEPTION_HPP
