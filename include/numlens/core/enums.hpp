#ifndef NUMLENS_CORE_ENUMS_HPP
#define NUMLENS_CORE_ENUMS_HPP

namespace numlens {

// Classification of a decoded IEEE 754 bit pattern.
enum class FloatClass {
  Normal,
  Subnormal,
  PositiveZero,
  NegativeZero,
  PositiveInfinity,
  NegativeInfinity,
  NaN, // all-ones exponent, non-zero mantissa (quiet or signaling)
};

inline const char *floatClassName(FloatClass C) {
  switch (C) {
  case FloatClass::Normal:           return "normal";
  case FloatClass::Subnormal:        return "subnormal";
  case FloatClass::PositiveZero:     return "+0";
  case FloatClass::NegativeZero:     return "-0";
  case FloatClass::PositiveInfinity: return "+inf";
  case FloatClass::NegativeInfinity: return "-inf";
  case FloatClass::NaN:              return "NaN";
  }
  return "???";
}

inline bool isZeroClass(FloatClass C) {
  return C == FloatClass::PositiveZero || C == FloatClass::NegativeZero;
}

inline bool isInfinityClass(FloatClass C) {
  return C == FloatClass::PositiveInfinity || C == FloatClass::NegativeInfinity;
}

// Text radices understood by the integer codec.
enum class Radix { Binary = 2, Decimal = 10, Hexadecimal = 16 };

inline constexpr int radixValue(Radix R) { return static_cast<int>(R); }

// Digits per '_'-separated group when displaying in this radix.
inline constexpr int radixGroupSize(Radix R) {
  return R == Radix::Decimal ? 3 : 4;
}

} // namespace numlens

#endif // NUMLENS_CORE_ENUMS_HPP
