#ifndef NUMLENS_CORE_EXPLAIN_HPP
#define NUMLENS_CORE_EXPLAIN_HPP

// Human-readable derivations over DecodedFloatFields. Pure formatting:
// the arithmetic lives in ieee754.hpp.

#include <cmath>
#include <cstdio>
#include <string>

#include "numlens/core/decimal.hpp"
#include "numlens/core/float_types.hpp"
#include "numlens/core/ieee754.hpp"

namespace numlens {

// "3.5 -> single: 0 | 10000000 | 11000000000000000000000"
inline std::string forwardExplanation(const Decimal &Input,
                                      const DecodedFloatFields &F,
                                      const FloatTypeDescriptor &Type) {
  return Input.toString() + " -> " + std::string(Type.Name) + ": " +
         F.SignBits + " | " + F.ExponentBits + " | " + F.MantissaBits;
}

inline std::string reverseExplanation(const DecodedFloatFields &F,
                                      const FloatTypeDescriptor &Type) {
  std::string S = std::to_string(F.Sign);
  std::string M = std::to_string(F.MantissaRaw);
  std::string MBits = std::to_string(Type.MantissaBits);
  std::string Bias = std::to_string(Type.bias());

  switch (F.Class) {
  case FloatClass::NaN:
    return "Exponent all 1s with non-zero mantissa -> NaN";
  case FloatClass::PositiveInfinity:
  case FloatClass::NegativeInfinity:
    return "Exponent all 1s with zero mantissa -> infinity";
  case FloatClass::PositiveZero:
  case FloatClass::NegativeZero:
    return "(-1)^" + S + " * 0 -> " + floatClassName(F.Class);
  case FloatClass::Subnormal:
    return "(-1)^" + S + " * (" + M + " / 2^" + MBits + ") * 2^(1-" + Bias + ")";
  case FloatClass::Normal:
    break;
  }
  return "(-1)^" + S + " * (1 + " + M + "/2^" + MBits + ") * 2^(" +
         std::to_string(F.ExponentRaw) + "-" + Bias + ")";
}

// One line per field, each showing the factor it contributes.
struct FieldFactors {
  std::string Sign;
  std::string Exponent;
  std::string Mantissa;
};

inline FieldFactors fieldFactors(const DecodedFloatFields &F,
                                 const FloatTypeDescriptor &Type) {
  FieldFactors Out;
  Out.Sign = "(-1)^" + std::to_string(F.Sign) + " = " + (F.Sign ? "-1" : "1");

  std::string E = std::to_string(F.ExponentRaw);
  std::string M = std::to_string(F.MantissaRaw);
  std::string MBits = std::to_string(Type.MantissaBits);
  int Bias = Type.bias();
  Decimal Fraction = mulPow2(Decimal::fromInteger(BigInt::fromUnsigned(F.MantissaRaw)),
                             -static_cast<long>(Type.MantissaBits));

  switch (F.Class) {
  case FloatClass::Normal: {
    long Unbiased = static_cast<long>(F.ExponentRaw) - Bias;
    Decimal Significand = subtract(Decimal::fromInteger(BigInt(1)), negate(Fraction));
    Out.Exponent = "2^(" + E + "-" + std::to_string(Bias) + ") = 2^" +
                   std::to_string(Unbiased);
    Out.Mantissa = "1 + " + M + "/2^" + MBits + " = " + formatGeneral(Significand, 17);
    break;
  }
  case FloatClass::Subnormal:
    Out.Exponent = "2^(1-" + std::to_string(Bias) + ") = 2^" + std::to_string(1 - Bias);
    Out.Mantissa = M + "/2^" + MBits + " = " + formatGeneral(Fraction, 17);
    break;
  case FloatClass::PositiveZero:
  case FloatClass::NegativeZero:
    Out.Exponent = "zero case";
    Out.Mantissa = "0";
    break;
  case FloatClass::PositiveInfinity:
  case FloatClass::NegativeInfinity:
    Out.Exponent = E + " (all 1s)";
    Out.Mantissa = "0 -> infinity";
    break;
  case FloatClass::NaN:
    Out.Exponent = E + " (all 1s)";
    Out.Mantissa = M + "/2^" + MBits + " (non-zero) -> NaN";
    break;
  }
  return Out;
}

// 17 significant digits: enough to round-trip any binary64 value.
inline std::string formatQuantized(double Value) {
  if (std::isnan(Value))
    return "NaN";
  if (std::isinf(Value))
    return Value > 0 ? "+inf" : "-inf";
  if (Value == 0.0 && std::signbit(Value))
    return "-0.0";
  char Buf[64];
  std::snprintf(Buf, sizeof(Buf), "%.17g", Value);
  return Buf;
}

} // namespace numlens

#endif // NUMLENS_CORE_EXPLAIN_HPP
