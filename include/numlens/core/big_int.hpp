#ifndef NUMLENS_CORE_BIG_INT_HPP
#define NUMLENS_CORE_BIG_INT_HPP

// BigInt: RAII value wrapper around GMP's mpz_t.
//
// Copyable (deep copy of the limb data) and cheaply movable. Arithmetic is
// exact; the only lossy conversions are the explicit narrowing accessors,
// which document what they keep.

#include <compare>
#include <cstdint>
#include <cstdlib>
#include <memory>
#include <string>
#include <string_view>

#include <gmp.h>

namespace numlens {

class BigInt {
public:
  BigInt() { mpz_init(Val); }
  BigInt(long V) { mpz_init_set_si(Val, V); }

  ~BigInt() { mpz_clear(Val); }

  BigInt(const BigInt &Other) { mpz_init_set(Val, Other.Val); }

  BigInt &operator=(const BigInt &Other) {
    if (this != &Other)
      mpz_set(Val, Other.Val);
    return *this;
  }

  // Move: steal the limbs, leave the source a valid zero
  BigInt(BigInt &&Other) noexcept {
    Val[0] = Other.Val[0];
    mpz_init(Other.Val);
  }

  BigInt &operator=(BigInt &&Other) noexcept {
    if (this != &Other)
      mpz_swap(Val, Other.Val);
    return *this;
  }

  static BigInt fromUnsigned(uint64_t V) {
    BigInt R;
    mpz_import(R.Val, 1, -1, sizeof(V), 0, 0, &V);
    return R;
  }

  // Digits must already be validated for Base; no sign, no separators.
  static BigInt fromDigits(std::string_view Digits, int Base) {
    BigInt R;
    std::string Buf(Digits);
    if (!Buf.empty())
      mpz_set_str(R.Val, Buf.c_str(), Base);
    return R;
  }

  static BigInt pow2(unsigned long N) {
    BigInt R;
    mpz_setbit(R.Val, N);
    return R;
  }

  static BigInt pow5(unsigned long N) {
    BigInt R;
    mpz_ui_pow_ui(R.Val, 5, N);
    return R;
  }

  static BigInt pow10(unsigned long N) {
    BigInt R;
    mpz_ui_pow_ui(R.Val, 10, N);
    return R;
  }

  mpz_ptr get() { return Val; }
  mpz_srcptr get() const { return Val; }

  int sign() const { return mpz_sgn(Val); }
  bool isZero() const { return mpz_sgn(Val) == 0; }
  bool isNegative() const { return mpz_sgn(Val) < 0; }
  bool isOdd() const { return mpz_odd_p(Val) != 0; }
  bool testBit(unsigned long N) const { return mpz_tstbit(Val, N) != 0; }

  // Number of significant bits of |x|; 0 for zero.
  unsigned long bitLength() const {
    return isZero() ? 0 : static_cast<unsigned long>(mpz_sizeinbase(Val, 2));
  }

  // Number of decimal digits of |x|; 1 for zero.
  unsigned long digitCount() const {
    if (isZero())
      return 1;
    unsigned long N = static_cast<unsigned long>(mpz_sizeinbase(Val, 10));
    // mpz_sizeinbase may overshoot by one for bases that aren't powers of 2
    BigInt Lower = pow10(N - 1);
    if (mpz_cmpabs(Val, Lower.Val) < 0)
      --N;
    return N;
  }

  bool fitsInt64() const {
    BigInt Lo(-1);
    mpz_mul_2exp(Lo.Val, Lo.Val, 63);
    BigInt Hi = pow2(63);
    return mpz_cmp(Val, Lo.Val) >= 0 && mpz_cmp(Val, Hi.Val) < 0;
  }

  // Low 64 bits of the two's-complement representation.
  uint64_t lowBits() const {
    BigInt Masked;
    mpz_fdiv_r_2exp(Masked.Val, Val, 64);
    uint64_t Out = 0;
    mpz_export(&Out, nullptr, -1, sizeof(Out), 0, 0, Masked.Val);
    return Out;
  }

  int64_t toInt64() const { return static_cast<int64_t>(lowBits()); }

  // Magnitude digits in Base (2..36), lowercase unless Upper.
  std::string magnitudeDigits(int Base, bool Upper = false) const {
    BigInt Mag = abs();
    std::unique_ptr<char, decltype(&std::free)> Text{
        mpz_get_str(nullptr, Upper ? -Base : Base, Mag.Val), std::free};
    return std::string(Text.get());
  }

  std::string toString(int Base = 10) const {
    return (isNegative() ? "-" : "") + magnitudeDigits(Base);
  }

  BigInt abs() const {
    BigInt R;
    mpz_abs(R.Val, Val);
    return R;
  }

  BigInt operator-() const {
    BigInt R;
    mpz_neg(R.Val, Val);
    return R;
  }

  BigInt shiftedLeft(unsigned long N) const {
    BigInt R;
    mpz_mul_2exp(R.Val, Val, N);
    return R;
  }

  // Floor division by 2^N.
  BigInt shiftedRight(unsigned long N) const {
    BigInt R;
    mpz_fdiv_q_2exp(R.Val, Val, N);
    return R;
  }

  // Low N bits, always non-negative.
  BigInt lowBitsMasked(unsigned long N) const {
    BigInt R;
    mpz_fdiv_r_2exp(R.Val, Val, N);
    return R;
  }

  // Remainder with the sign of Modulus (floor semantics).
  BigInt floorMod(const BigInt &Modulus) const {
    BigInt R;
    mpz_fdiv_r(R.Val, Val, Modulus.Val);
    return R;
  }

  friend BigInt operator+(const BigInt &A, const BigInt &B) {
    BigInt R;
    mpz_add(R.Val, A.Val, B.Val);
    return R;
  }

  friend BigInt operator-(const BigInt &A, const BigInt &B) {
    BigInt R;
    mpz_sub(R.Val, A.Val, B.Val);
    return R;
  }

  friend BigInt operator*(const BigInt &A, const BigInt &B) {
    BigInt R;
    mpz_mul(R.Val, A.Val, B.Val);
    return R;
  }

  friend bool operator==(const BigInt &A, const BigInt &B) {
    return mpz_cmp(A.Val, B.Val) == 0;
  }

  friend std::strong_ordering operator<=>(const BigInt &A, const BigInt &B) {
    int C = mpz_cmp(A.Val, B.Val);
    if (C < 0)
      return std::strong_ordering::less;
    if (C > 0)
      return std::strong_ordering::greater;
    return std::strong_ordering::equal;
  }

private:
  mpz_t Val;
};

// Quotient of Num / Den (Den > 0) rounded to nearest, ties to even.
inline BigInt divRoundHalfEven(const BigInt &Num, const BigInt &Den) {
  BigInt Q, R;
  mpz_fdiv_qr(Q.get(), R.get(), Num.get(), Den.get());
  BigInt Twice = R.shiftedLeft(1);
  auto Cmp = Twice <=> Den;
  if (Cmp > 0 || (Cmp == 0 && Q.isOdd()))
    Q = Q + BigInt(1);
  return Q;
}

} // namespace numlens

#endif // NUMLENS_CORE_BIG_INT_HPP
