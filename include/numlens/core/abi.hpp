#ifndef NUMLENS_CORE_ABI_HPP
#define NUMLENS_CORE_ABI_HPP

#include <concepts>

namespace numlens {

// Widths of the C native integer types. Chosen at compile time rather
// than queried from the host, so results don't depend on where the
// library happens to run.
template <typename A>
concept AbiPolicy = requires {
  { A::short_bits } -> std::convertible_to<int>;
  { A::int_bits } -> std::convertible_to<int>;
  { A::long_bits } -> std::convertible_to<int>;
  { A::long_long_bits } -> std::convertible_to<int>;
} && (A::short_bits <= A::int_bits) && (A::int_bits <= A::long_bits) &&
    (A::long_bits <= A::long_long_bits);

namespace abi {

// Linux, macOS, most 64-bit Unix
struct LP64 {
  static constexpr int short_bits = 16;
  static constexpr int int_bits = 32;
  static constexpr int long_bits = 64;
  static constexpr int long_long_bits = 64;
};

// 64-bit Windows
struct LLP64 {
  static constexpr int short_bits = 16;
  static constexpr int int_bits = 32;
  static constexpr int long_bits = 32;
  static constexpr int long_long_bits = 64;
};

// 32-bit targets
struct ILP32 {
  static constexpr int short_bits = 16;
  static constexpr int int_bits = 32;
  static constexpr int long_bits = 32;
  static constexpr int long_long_bits = 64;
};

using Default = LP64;

static_assert(AbiPolicy<LP64>);
static_assert(AbiPolicy<LLP64>);
static_assert(AbiPolicy<ILP32>);

} // namespace abi
} // namespace numlens

#endif // NUMLENS_CORE_ABI_HPP
