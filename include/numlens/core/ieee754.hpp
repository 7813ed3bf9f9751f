#ifndef NUMLENS_CORE_IEEE754_HPP
#define NUMLENS_CORE_IEEE754_HPP

// IEEE 754 binary interchange codec for the catalog formats.
//
// Provides:
//   decodeRawBits      - split a raw word into sign/exponent/mantissa and classify
//   decomposeFloatBits - same, from user bit text (validated)
//   composeFloatBits   - same, from separately edited field texts
//   encodeFields       - inverse of decodeRawBits
//   roundToFormat      - exact decimal -> nearest representable bits (ties to even)
//   quantizeFloat      - roundToFormat + decode + platform value
//   reconstructValue   - bit pattern -> the platform's binary floating-point value
//   exactValueOf       - bit pattern -> its exact mathematical value (MPFR)
//
// Bit patterns travel in the low TotalBits of a uint64_t.

#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>

#include <gmp.h>
#include <mpfr.h>

extern "C" {
#include "softfloat.h"
}

#include "numlens/core/big_int.hpp"
#include "numlens/core/decimal.hpp"
#include "numlens/core/enums.hpp"
#include "numlens/core/float_types.hpp"
#include "numlens/core/mpfr_float.hpp"
#include "numlens/core/status.hpp"
#include "numlens/core/text.hpp"

namespace numlens {

// Decimal inputs whose leading digit sits beyond 10^+-QuantizeExponentLimit
// overflow or underflow every catalog format; they short-circuit before
// any big-number work.
inline constexpr int64_t QuantizeExponentLimit = 4000;

struct DecodedFloatFields {
  uint64_t Raw = 0;
  std::string BitText;
  std::string SignBits;
  std::string ExponentBits;
  std::string MantissaBits;
  unsigned Sign = 0;
  uint64_t ExponentRaw = 0;
  uint64_t MantissaRaw = 0;
  FloatClass Class = FloatClass::PositiveZero;
};

struct QuantizedFloat {
  uint64_t Raw = 0;
  double Value = 0.0; // exact: every catalog format embeds in binary64
  DecodedFloatFields Fields;
};

// ===================================================================
// Classification and field split
// ===================================================================

inline FloatClass classifyFields(unsigned Sign, uint64_t ExponentRaw,
                                 uint64_t MantissaRaw,
                                 const FloatTypeDescriptor &Type) {
  if (ExponentRaw == Type.exponentAllOnes()) {
    if (MantissaRaw != 0)
      return FloatClass::NaN;
    return Sign ? FloatClass::NegativeInfinity : FloatClass::PositiveInfinity;
  }
  if (ExponentRaw == 0) {
    if (MantissaRaw == 0)
      return Sign ? FloatClass::NegativeZero : FloatClass::PositiveZero;
    return FloatClass::Subnormal;
  }
  return FloatClass::Normal;
}

inline DecodedFloatFields decodeRawBits(uint64_t Raw,
                                        const FloatTypeDescriptor &Type) {
  DecodedFloatFields F;
  F.Raw = Raw & Type.wordMask();
  F.BitText = bitsToText(F.Raw, Type.TotalBits);
  F.SignBits = F.BitText.substr(0, 1);
  F.ExponentBits = F.BitText.substr(1, Type.ExponentBits);
  F.MantissaBits = F.BitText.substr(1 + Type.ExponentBits);
  F.Sign = static_cast<unsigned>((F.Raw & Type.signBit()) != 0);
  F.ExponentRaw = (F.Raw >> Type.MantissaBits) & Type.exponentAllOnes();
  F.MantissaRaw = F.Raw & Type.mantissaMask();
  F.Class = classifyFields(F.Sign, F.ExponentRaw, F.MantissaRaw, Type);
  return F;
}

inline uint64_t encodeFields(const DecodedFloatFields &F,
                             const FloatTypeDescriptor &Type) {
  uint64_t Raw = (F.ExponentRaw & Type.exponentAllOnes()) << Type.MantissaBits;
  Raw |= F.MantissaRaw & Type.mantissaMask();
  if (F.Sign)
    Raw |= Type.signBit();
  return Raw;
}

// Accepts the same separators as the numeral parsers ("0 01111111 000...").
inline Result<DecodedFloatFields>
decomposeFloatBits(std::string_view BitText, const FloatTypeDescriptor &Type) {
  std::string Cleaned = cleanInput(BitText);
  if (Cleaned.size() != static_cast<size_t>(Type.TotalBits))
    return Result<DecodedFloatFields>::failure(
        ErrorKind::MalformedBitPattern,
        "Expected " + std::to_string(Type.TotalBits) + " bits for " +
            std::string(Type.Name) + "; got " + std::to_string(Cleaned.size()) +
            ".");
  if (!isBitText(Cleaned))
    return Result<DecodedFloatFields>::failure(
        ErrorKind::MalformedBitPattern,
        "Bit text for " + std::string(Type.Name) + " must contain only 0/1.");
  return Result<DecodedFloatFields>::success(
      decodeRawBits(textToBits(Cleaned), Type));
}

inline Result<DecodedFloatFields>
composeFloatBits(std::string_view SignText, std::string_view ExponentText,
                 std::string_view MantissaText, const FloatTypeDescriptor &Type) {
  if (SignText.size() != 1 ||
      ExponentText.size() != static_cast<size_t>(Type.ExponentBits) ||
      MantissaText.size() != static_cast<size_t>(Type.MantissaBits))
    return Result<DecodedFloatFields>::failure(
        ErrorKind::MalformedBitPattern,
        "Editing " + std::string(Type.Name) + ": sign " +
            std::to_string(SignText.size()) + "/1, exponent " +
            std::to_string(ExponentText.size()) + "/" +
            std::to_string(Type.ExponentBits) + ", mantissa " +
            std::to_string(MantissaText.size()) + "/" +
            std::to_string(Type.MantissaBits));
  std::string Joined = std::string(SignText) + std::string(ExponentText) +
                       std::string(MantissaText);
  return decomposeFloatBits(Joined, Type);
}

// ===================================================================
// Platform reinterpretation
// ===================================================================

// The raw word viewed as the host's floating-point type of the same
// width. The host has no binary16 arithmetic type, so half goes through
// SoftFloat's exact widening conversion.
inline double reconstructValue(const DecodedFloatFields &F,
                               const FloatTypeDescriptor &Type) {
  uint64_t Raw = encodeFields(F, Type);
  if (Type.TotalBits == 16) {
    float16_t H;
    H.v = static_cast<uint16_t>(Raw);
    float64_t Wide = f16_to_f64(H);
    double Out;
    std::memcpy(&Out, &Wide.v, sizeof(double));
    return Out;
  }
  if (Type.TotalBits == 32) {
    uint32_t U = static_cast<uint32_t>(Raw);
    float Out;
    std::memcpy(&Out, &U, sizeof(float));
    return static_cast<double>(Out);
  }
  double Out;
  std::memcpy(&Out, &Raw, sizeof(double));
  return Out;
}

// Inverse of reconstructValue for values representable in Type.
inline uint64_t nativeBitsOf(double Value, const FloatTypeDescriptor &Type) {
  if (Type.TotalBits == 16) {
    float64_t Wide;
    std::memcpy(&Wide.v, &Value, sizeof(double));
    return f64_to_f16(Wide).v;
  }
  if (Type.TotalBits == 32) {
    float Narrow = static_cast<float>(Value);
    uint32_t U;
    std::memcpy(&U, &Narrow, sizeof(float));
    return U;
  }
  uint64_t U;
  std::memcpy(&U, &Value, sizeof(double));
  return U;
}

// ===================================================================
// Exact values
// ===================================================================

inline MpfrFloat exactValueOf(const DecodedFloatFields &F,
                              const FloatTypeDescriptor &Type) {
  MpfrFloat Result;
  switch (F.Class) {
  case FloatClass::NaN:
    mpfr_set_nan(Result.get());
    return Result;
  case FloatClass::PositiveInfinity:
  case FloatClass::NegativeInfinity:
    mpfr_set_inf(Result.get(), F.Sign ? -1 : +1);
    return Result;
  case FloatClass::PositiveZero:
  case FloatClass::NegativeZero:
    mpfr_set_zero(Result.get(), F.Sign ? -1 : +1);
    return Result;
  case FloatClass::Subnormal:
    // No implicit bit, minimum exponent
    Result = MpfrFloat::fromDyadic(BigInt::fromUnsigned(F.MantissaRaw),
                                   Type.minExponent() - Type.MantissaBits);
    break;
  case FloatClass::Normal:
    Result = MpfrFloat::fromDyadic(
        BigInt::fromUnsigned((uint64_t{1} << Type.MantissaBits) | F.MantissaRaw),
        static_cast<long>(F.ExponentRaw) - Type.bias() - Type.MantissaBits);
    break;
  }
  if (F.Sign)
    mpfr_neg(Result.get(), Result.get(), MPFR_RNDN);
  return Result;
}

inline Decimal toDecimal(const MpfrFloat &V) {
  if (V.isNan())
    return Decimal::nan();
  if (V.isInf())
    return Decimal::infinity(V.isNegative());
  if (V.isZero())
    return Decimal::zero(V.isNegative());
  auto [Mant, Exp2] = V.toDyadic();
  return Decimal::fromDyadic(Mant, Exp2);
}

inline Decimal exactDecimalOf(double Value) {
  return toDecimal(MpfrFloat::fromDouble(Value));
}

// ===================================================================
// Decimal -> format, round to nearest, ties to even
// ===================================================================

namespace detail {

// Sign of Num - Den * 2^E.
inline int compareScaled(const BigInt &Num, const BigInt &Den, long E) {
  auto Cmp = E >= 0 ? (Num <=> Den.shiftedLeft(static_cast<unsigned long>(E)))
                    : (Num.shiftedLeft(static_cast<unsigned long>(-E)) <=> Den);
  if (Cmp < 0)
    return -1;
  return Cmp > 0 ? 1 : 0;
}

} // namespace detail

inline uint64_t roundToFormat(const Decimal &Exact,
                              const FloatTypeDescriptor &Type) {
  const int MantBits = Type.MantissaBits;
  const int Bias = Type.bias();
  const int Emin = Type.minExponent();
  const uint64_t InfBits = Type.exponentAllOnes() << MantBits;

  // Quiet NaN: all-ones exponent, top mantissa bit set, positive
  if (Exact.isNan())
    return InfBits | (uint64_t{1} << (MantBits - 1));

  const uint64_t SignBit = Exact.Negative ? Type.signBit() : 0;
  if (Exact.isInfinite())
    return SignBit | InfBits;
  if (Exact.isZero())
    return SignBit;

  int64_t Adjusted = Exact.adjustedExponent();
  if (Adjusted > QuantizeExponentLimit)
    return SignBit | InfBits;
  if (Adjusted < -QuantizeExponentLimit)
    return SignBit;

  // |value| = Num / Den exactly
  BigInt Num = Exact.Coefficient;
  BigInt Den(1);
  if (Exact.Exponent >= 0)
    Num = Num * BigInt::pow10(static_cast<unsigned long>(Exact.Exponent));
  else
    Den = BigInt::pow10(static_cast<unsigned long>(-Exact.Exponent));

  // E = floor(log2(Num / Den))
  long E = static_cast<long>(Num.bitLength()) - static_cast<long>(Den.bitLength());
  if (detail::compareScaled(Num, Den, E) < 0)
    --E;

  bool Subnormal = E < Emin;
  // Scale so the rounded integer carries MantBits fraction bits (normal)
  // or the fixed subnormal quantum 2^(Emin - MantBits).
  long Shift = Subnormal ? MantBits - Emin : MantBits - E;
  BigInt ScaledNum = Num;
  BigInt ScaledDen = Den;
  if (Shift >= 0)
    ScaledNum = Num.shiftedLeft(static_cast<unsigned long>(Shift));
  else
    ScaledDen = Den.shiftedLeft(static_cast<unsigned long>(-Shift));
  BigInt IntSig = divRoundHalfEven(ScaledNum, ScaledDen);

  if (!Subnormal) {
    // Rounding may carry into the next binade
    if (IntSig >= BigInt::pow2(MantBits + 1)) {
      ++E;
      IntSig = IntSig.shiftedRight(1);
    }
    long BiasedExp = E + Bias;
    if (BiasedExp > Type.maxBiasedExponent())
      return SignBit | InfBits;
    return SignBit | (static_cast<uint64_t>(BiasedExp) << MantBits) |
           (IntSig.lowBits() & Type.mantissaMask());
  }

  if (IntSig.isZero())
    return SignBit;
  if (IntSig >= BigInt::pow2(MantBits))
    return SignBit | (uint64_t{1} << MantBits); // rounded up to min normal
  return SignBit | IntSig.lowBits();
}

inline QuantizedFloat quantizeFloat(const Decimal &Exact,
                                    const FloatTypeDescriptor &Type) {
  QuantizedFloat Q;
  Q.Raw = roundToFormat(Exact, Type);
  Q.Fields = decodeRawBits(Q.Raw, Type);
  Q.Value = reconstructValue(Q.Fields, Type);
  return Q;
}

} // namespace numlens

#endif // NUMLENS_CORE_IEEE754_HPP
