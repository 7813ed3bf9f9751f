#ifndef NUMLENS_CORE_MPFR_FLOAT_HPP
#define NUMLENS_CORE_MPFR_FLOAT_HPP

// MpfrFloat: RAII wrapper around mpfr_t, used wherever a binary value
// must be held exactly (decoded bit patterns, neighbour distances).
//
// Every value produced by the codecs is dyadic with at most 53
// significant bits, so ExactPrecision never rounds them.

#include <utility>

#include <gmp.h>
#include <mpfr.h>

#include "numlens/core/big_int.hpp"

namespace numlens {

inline constexpr mpfr_prec_t ExactPrecision = 256;

class MpfrFloat {
public:
  explicit MpfrFloat(mpfr_prec_t Prec = ExactPrecision) {
    mpfr_init2(Val, Prec);
    mpfr_set_zero(Val, +1);
  }

  ~MpfrFloat() { mpfr_clear(Val); }

  // Non-copyable (mpfr_t holds heap-allocated limb data)
  MpfrFloat(const MpfrFloat &) = delete;
  MpfrFloat &operator=(const MpfrFloat &) = delete;

  // Move: steal contents, leave source in a valid NaN state
  MpfrFloat(MpfrFloat &&Other) noexcept {
    Val[0] = Other.Val[0];
    mpfr_init2(Other.Val, 2);
    mpfr_set_nan(Other.Val);
  }

  MpfrFloat &operator=(MpfrFloat &&Other) noexcept {
    if (this != &Other) {
      mpfr_clear(Val);
      Val[0] = Other.Val[0];
      mpfr_init2(Other.Val, 2);
      mpfr_set_nan(Other.Val);
    }
    return *this;
  }

  static MpfrFloat fromDouble(double D) {
    MpfrFloat R;
    mpfr_set_d(R.Val, D, MPFR_RNDN);
    return R;
  }

  // Mant * 2^Exp2
  static MpfrFloat fromDyadic(const BigInt &Mant, long Exp2) {
    MpfrFloat R;
    mpfr_set_z_2exp(R.Val, Mant.get(), Exp2, MPFR_RNDN);
    return R;
  }

  mpfr_ptr get() { return Val; }
  mpfr_srcptr get() const { return Val; }

  bool isNan() const { return mpfr_nan_p(Val) != 0; }
  bool isInf() const { return mpfr_inf_p(Val) != 0; }
  bool isZero() const { return mpfr_zero_p(Val) != 0; }
  int sign() const { return mpfr_sgn(Val); }
  bool isNegative() const { return mpfr_signbit(Val) != 0; }

  double toDouble() const { return mpfr_get_d(Val, MPFR_RNDN); }

  // Split a finite value into {Mant, Exp2} with value == Mant * 2^Exp2
  // and Mant odd (zero gives {0, 0}).
  std::pair<BigInt, long> toDyadic() const {
    BigInt Mant;
    if (isZero())
      return {std::move(Mant), 0};
    long Exp2 = static_cast<long>(mpfr_get_z_2exp(Mant.get(), Val));
    unsigned long Zeros = mpz_scan1(Mant.get(), 0);
    Mant = Mant.shiftedRight(Zeros);
    return {std::move(Mant), Exp2 + static_cast<long>(Zeros)};
  }

private:
  mpfr_t Val;
};

// |A - B|, exact for adjacent values of any catalog format.
inline MpfrFloat absDifference(const MpfrFloat &A, const MpfrFloat &B) {
  MpfrFloat Result;
  mpfr_sub(Result.get(), A.get(), B.get(), MPFR_RNDN);
  mpfr_abs(Result.get(), Result.get(), MPFR_RNDN);
  return Result;
}

} // namespace numlens

#endif // NUMLENS_CORE_MPFR_FLOAT_HPP
