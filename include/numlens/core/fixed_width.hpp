#ifndef NUMLENS_CORE_FIXED_WIDTH_HPP
#define NUMLENS_CORE_FIXED_WIDTH_HPP

// Fixed-width integer semantics: two's-complement wraparound and the
// canonical bit string of a value in N bits.

#include <string>
#include <string_view>

#include "numlens/core/big_int.hpp"
#include "numlens/core/integer_types.hpp"

namespace numlens {

struct WrapResult {
  BigInt Wrapped;
  bool Overflow = false;  // input was above the type's maximum
  bool Underflow = false; // input was below the type's minimum
};

// The flags describe the input; Wrapped is computed either way.
inline WrapResult wrapInteger(const BigInt &Value,
                              const IntegerTypeDescriptor &Type) {
  BigInt Modulus = Type.modulus();
  BigInt UnsignedWrapped = Value.floorMod(Modulus);

  WrapResult R;
  R.Overflow = Value > Type.maxValue();
  R.Underflow = Value < Type.minValue();
  if (Type.Signed && UnsignedWrapped >= BigInt::pow2(Type.Bits - 1))
    R.Wrapped = UnsignedWrapped - Modulus;
  else
    R.Wrapped = std::move(UnsignedWrapped);
  return R;
}

// Low BitWidth bits of Value (two's complement for negatives), zero padded.
inline std::string integerBits(const BigInt &Value, int BitWidth) {
  BigInt Masked = Value.lowBitsMasked(BitWidth);
  std::string Digits = Masked.magnitudeDigits(2);
  if (Digits.size() < static_cast<size_t>(BitWidth))
    Digits.insert(0, BitWidth - Digits.size(), '0');
  return Digits;
}

inline BigInt unsignedView(std::string_view BitText) {
  return BigInt::fromDigits(BitText, 2);
}

// Unsigned view minus 2^N when the top bit is set.
inline BigInt signedView(std::string_view BitText) {
  BigInt U = unsignedView(BitText);
  if (!BitText.empty() && BitText.front() == '1')
    return U - BigInt::pow2(BitText.size());
  return U;
}

} // namespace numlens

#endif // NUMLENS_CORE_FIXED_WIDTH_HPP
