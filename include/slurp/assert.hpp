#ifndef SLURP_ASSERT_HPP
#define SLURP_ASSERT_HPP

/// \defgroup assertions Assertion Macros
/// @{

/// Evaluates the expression `x` and gives a hint to the compiler
/// that it is likely to be true.
#define SLURP_LIKELY(x) (__builtin_expect(!!(x), 1))

/// Evaluates the expression `x` and gives a hint to the compiler
/// that it is likely to be false.
#define SLURP_UNLIKELY(x) (__builtin_expect(!!(x), 0))

#if !defined(NDEBUG) && !defined(SLURP_DEBUG)

/// SLURP_DEBUG is defined when this library is used in debug mode.
#    define SLURP_DEBUG

#endif

#ifdef SLURP_DEBUG

/// When in debug mode, check against the given condition
/// and abort the program with a message if the check fails.
/// Does nothing in release mode.
#    define SLURP_ASSERT(cond, message)                                             \
        do {                                                                        \
            if (!(cond)) {                                                          \
                ::slurp::detail::assert_impl(__FILE__, __LINE__, #cond, (message)); \
            }                                                                       \
        } while (0)

/// Same as SLURP_ASSERT, but usable in constexpr functions.
#    define SLURP_CONSTEXPR_ASSERT(cond, message)                                         \
        do {                                                                              \
            if (!(cond)) {                                                                \
                throw ::slurp::detail::assertion_failure_impl_(__FILE__, __LINE__, #cond, \
                                                               (message));                \
            }                                                                             \
        } while (0)

#else

#    define SLURP_ASSERT(cond, message)

#    define SLURP_CONSTEXPR_ASSERT(cond, message)

#endif

/// Always check against a (rare) error condition and abort the program
/// with a message if the check fails.
#define SLURP_CHECK(cond, message)                                              \
    do {                                                                        \
        if (SLURP_UNLIKELY(!(cond))) {                                          \
            ::slurp::detail::assert_impl(__FILE__, __LINE__, #cond, (message)); \
        }                                                                       \
    } while (0)

/// Unconditionally terminate the program when unreachable code is executed.
#define SLURP_UNREACHABLE(message) \
    (::slurp::detail::unreachable_impl_(__FILE__, __LINE__, (message)))

/// @}

/// \cond INTERNAL
namespace slurp::detail {

struct assertion_failure_impl_ {
    /// The constructor simply calls assert_impl, this is part of the assertion implemention
    /// for constexpr functions.
    assertion_failure_impl_(const char* file, int line, const char* cond, const char* message);
};

[[noreturn]] void assert_impl(const char* file, int line, const char* cond, const char* message);
[[noreturn]] void unreachable_impl_(const char* file, int line, const char* message);

} // namespace slurp::detail
/// \endcond

#endif // SLURP_ASSERT_HPP
