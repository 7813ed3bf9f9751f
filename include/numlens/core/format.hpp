#ifndef NUMLENS_CORE_FORMAT_HPP
#define NUMLENS_CORE_FORMAT_HPP

#include <concepts>

namespace numlens {

// Bit geometry of a binary interchange format: [S][E][M], sign in the
// MSB, mantissa in the LSBs. Says nothing about how values round; that
// is the codec's job.
template <int ExpBits, int MantBits>
struct IEEE_Layout {
  static constexpr int sign_bits = 1;
  static constexpr int exp_bits = ExpBits;
  static constexpr int mant_bits = MantBits;
  static constexpr int mant_offset = 0;
  static constexpr int exp_offset = MantBits;
  static constexpr int sign_offset = ExpBits + MantBits;
  static constexpr int total_bits = 1 + ExpBits + MantBits;

  static_assert(ExpBits >= 2, "exponent needs room for the reserved all-ones code");
  static_assert(MantBits >= 1, "mantissa field must be at least 1 bit");
  static_assert(total_bits <= 64, "bit patterns are carried in 64-bit words");
};

template <typename L>
concept ValidLayout = requires {
  { L::exp_bits } -> std::convertible_to<int>;
  { L::mant_bits } -> std::convertible_to<int>;
  { L::total_bits } -> std::convertible_to<int>;
} && (L::total_bits == 1 + L::exp_bits + L::mant_bits);

using fp16_layout = IEEE_Layout<5, 10>;
using fp32_layout = IEEE_Layout<8, 23>;
using fp64_layout = IEEE_Layout<11, 52>;

static_assert(ValidLayout<fp16_layout>);
static_assert(ValidLayout<fp32_layout>);
static_assert(ValidLayout<fp64_layout>);

} // namespace numlens

#endif // NUMLENS_CORE_FORMAT_HPP
