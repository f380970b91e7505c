#ifndef SLURP_DEFS_HPP
#define SLURP_DEFS_HPP

#include <climits>
#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace slurp {

/// \defgroup defs Definitions
/// @{

using u8 = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using i8 = std::int8_t;
using i16 = std::int16_t;
using i32 = std::int32_t;
using i64 = std::int64_t;

using byte = unsigned char;

using std::ptrdiff_t;
using std::size_t;
using std::uintptr_t;

/// The largest buffer the engine will ever hold in one piece, in bytes.
/// Files whose content exceeds this length cannot be read into memory.
inline constexpr size_t max_buffer_length = 0x7FFFFFC7;

/*
 * Guards against weird platforms.
 */
static_assert(CHAR_BIT == 8, "Bytes with a size other than 8 bits are not supported.");
static_assert(sizeof(size_t) >= sizeof(u32), "size_t must be able to hold the buffer ceiling.");

// Marks the passed arguments as "used" to shut up warnings.
// The function will do nothing with its argument.
template<typename... Args>
void unused(Args&&...) {}

/// @}

} // namespace slurp

#endif // SLURP_DEFS_HPP
