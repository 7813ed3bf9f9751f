#ifndef NUMLENS_TESTS_ORACLE_MPFR_ORACLE_HPP
#define NUMLENS_TESTS_ORACLE_MPFR_ORACLE_HPP

// Independent decimal -> binary rounding through MPFR.
//
// Provides:
//   mpfrRoundDecimal - correctly rounded conversion of a decimal string
//                      to any catalog format, via mpfr_strtofr with the
//                      format's precision and exponent range
//   mpfrToBits       - pack an MPFR value already representable in the
//                      format into its bit pattern
//   branchlessDecode - the textbook formula, no special cases beyond exp==0
//
// None of this shares code with the library's GMP rounding path.

#include <cstdint>
#include <string>

#include <gmp.h>
#include <mpfr.h>

#include "numlens/numlens.hpp"

namespace numlens::oracle {

// Packs a value that is exactly representable in Type.
inline uint64_t mpfrToBits(const MpfrFloat &Val, const FloatTypeDescriptor &Type) {
  const int M = Type.MantissaBits;
  const uint64_t InfBits = Type.exponentAllOnes() << M;

  if (Val.isNan())
    return InfBits | (uint64_t{1} << (M - 1));
  uint64_t SignBit = Val.isNegative() ? Type.signBit() : 0;
  if (Val.isInf())
    return SignBit | InfBits;
  if (Val.isZero())
    return SignBit;

  // MPFR: |Val| = f * 2^e with f in [0.5, 1), so the IEEE exponent is e - 1
  long IeeeExp = static_cast<long>(mpfr_get_exp(Val.get())) - 1;
  MpfrFloat Scaled(ExactPrecision);
  mpfr_abs(Scaled.get(), Val.get(), MPFR_RNDN);

  BigInt Sig;
  if (IeeeExp >= Type.minExponent()) {
    mpfr_mul_2si(Scaled.get(), Scaled.get(), M - IeeeExp, MPFR_RNDN);
    mpfr_get_z(Sig.get(), Scaled.get(), MPFR_RNDN);
    uint64_t Biased = static_cast<uint64_t>(IeeeExp + Type.bias());
    return SignBit | (Biased << M) | (Sig.lowBits() & Type.mantissaMask());
  }
  mpfr_mul_2si(Scaled.get(), Scaled.get(), M - Type.minExponent(), MPFR_RNDN);
  mpfr_get_z(Sig.get(), Scaled.get(), MPFR_RNDN);
  return SignBit | Sig.lowBits();
}

inline uint64_t mpfrRoundDecimal(const std::string &Text,
                                 const FloatTypeDescriptor &Type) {
  const int M = Type.MantissaBits;
  mpfr_exp_t OldEmin = mpfr_get_emin();
  mpfr_exp_t OldEmax = mpfr_get_emax();
  // Smallest subnormal is 2^(Emin - M), i.e. MPFR exponent Emin - M + 1;
  // every finite value is below 2^(bias + 1).
  mpfr_set_emin(Type.minExponent() - M + 1);
  mpfr_set_emax(Type.bias() + 1);

  MpfrFloat Val(M + 1);
  int Ternary = mpfr_strtofr(Val.get(), Text.c_str(), nullptr, 10, MPFR_RNDN);
  Ternary = mpfr_check_range(Val.get(), Ternary, MPFR_RNDN);
  mpfr_subnormalize(Val.get(), Ternary, MPFR_RNDN);

  mpfr_set_emin(OldEmin);
  mpfr_set_emax(OldEmax);
  return mpfrToBits(Val, Type);
}

// value = (-1)^sign * significand * 2^(effective_exp - bias - M), with the
// implicit bit present unless the exponent field is zero.
inline MpfrFloat branchlessDecode(uint64_t Bits, const FloatTypeDescriptor &Type) {
  const int M = Type.MantissaBits;
  bool IsNegative = (Bits & Type.signBit()) != 0;
  uint64_t RawExp = (Bits >> M) & Type.exponentAllOnes();
  uint64_t RawMant = Bits & Type.mantissaMask();

  long EffExp = RawExp == 0 ? 1 : static_cast<long>(RawExp);
  uint64_t Sig = RawExp == 0 ? RawMant : (RawMant | (uint64_t{1} << M));

  MpfrFloat Result;
  BigInt Z = BigInt::fromUnsigned(Sig);
  mpfr_set_z_2exp(Result.get(), Z.get(), EffExp - Type.bias() - M, MPFR_RNDN);
  if (IsNegative)
    mpfr_neg(Result.get(), Result.get(), MPFR_RNDN);
  return Result;
}

} // namespace numlens::oracle

#endif // NUMLENS_TESTS_ORACLE_MPFR_ORACLE_HPP
