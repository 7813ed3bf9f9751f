#ifndef NUMLENS_CORE_DECIMAL_HPP
#define NUMLENS_CORE_DECIMAL_HPP

// Decimal: an exact, arbitrary-precision decimal number.
//
//   value = (-1)^Negative * Coefficient * 10^Exponent
//
// plus the special values NaN and +/-Infinity. It is the lossless source
// of every float conversion and the carrier of exact error results.
// Binary values (Mant * 2^E) convert into it without rounding because
// 2^-k = 5^k * 10^-k.

#include <cctype>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "numlens/core/big_int.hpp"
#include "numlens/core/status.hpp"
#include "numlens/core/text.hpp"

namespace numlens {

// Parsed exponents are clamped to this magnitude. Anything beyond it is
// far outside every catalog format and rounds to zero or infinity.
inline constexpr int64_t DecimalExponentClamp = 100000000000000000;

struct Decimal {
  enum class Kind { Finite, Infinity, NaN };

  Kind K = Kind::Finite;
  bool Negative = false;
  BigInt Coefficient; // magnitude, never negative
  int64_t Exponent = 0;

  static Decimal zero(bool Neg = false) {
    Decimal D;
    D.Negative = Neg;
    return D;
  }

  static Decimal nan() {
    Decimal D;
    D.K = Kind::NaN;
    return D;
  }

  static Decimal infinity(bool Neg) {
    Decimal D;
    D.K = Kind::Infinity;
    D.Negative = Neg;
    return D;
  }

  static Decimal finite(bool Neg, BigInt Coef, int64_t Exp) {
    Decimal D;
    D.Negative = Neg;
    D.Coefficient = std::move(Coef);
    D.Exponent = Exp;
    return D;
  }

  static Decimal fromInteger(const BigInt &V) {
    return finite(V.isNegative(), V.abs(), 0);
  }

  // Mant * 2^Exp2, exactly. The sign comes from Mant.
  static Decimal fromDyadic(const BigInt &Mant, long Exp2) {
    if (Exp2 >= 0)
      return finite(Mant.isNegative(), Mant.abs().shiftedLeft(Exp2), 0);
    return finite(Mant.isNegative(),
                  Mant.abs() * BigInt::pow5(static_cast<unsigned long>(-Exp2)),
                  Exp2);
  }

  bool isNan() const { return K == Kind::NaN; }
  bool isInfinite() const { return K == Kind::Infinity; }
  bool isFinite() const { return K == Kind::Finite; }
  bool isZero() const { return isFinite() && Coefficient.isZero(); }

  // Power of ten of the leading digit.
  int64_t adjustedExponent() const {
    return Exponent + static_cast<int64_t>(Coefficient.digitCount()) - 1;
  }

  bool isIntegral() const {
    if (!isFinite())
      return false;
    if (Exponent >= 0 || Coefficient.isZero())
      return true;
    if (-Exponent > static_cast<int64_t>(Coefficient.digitCount()))
      return false;
    return Coefficient
        .floorMod(BigInt::pow10(static_cast<unsigned long>(-Exponent)))
        .isZero();
  }

  // Exact integer value, truncated toward zero; only meaningful when
  // isIntegral(). Zero returns before any power of ten is built.
  BigInt toInteger() const {
    if (Coefficient.isZero())
      return BigInt(0);
    BigInt Mag;
    if (Exponent < 0 &&
        -Exponent > static_cast<int64_t>(Coefficient.digitCount()))
      return Mag;
    if (Exponent >= 0) {
      Mag = Coefficient * BigInt::pow10(static_cast<unsigned long>(Exponent));
    } else {
      BigInt Den = BigInt::pow10(static_cast<unsigned long>(-Exponent));
      mpz_tdiv_q(Mag.get(), Coefficient.get(), Den.get());
    }
    return Negative ? -Mag : Mag;
  }

  // Canonical scientific string: "1.25E+3", "0.001", "-0", "Infinity", "NaN".
  std::string toString() const {
    if (isNan())
      return "NaN";
    std::string Sign = Negative ? "-" : "";
    if (isInfinite())
      return Sign + "Infinity";

    std::string Digits = Coefficient.magnitudeDigits(10);
    int64_t Len = static_cast<int64_t>(Digits.size());
    int64_t LeftDigits = Exponent + Len;
    int64_t DotPlace = (Exponent <= 0 && LeftDigits > -6) ? LeftDigits : 1;

    std::string IntPart, FracPart;
    if (DotPlace <= 0) {
      IntPart = "0";
      FracPart = "." + std::string(static_cast<size_t>(-DotPlace), '0') + Digits;
    } else if (DotPlace >= Len) {
      IntPart = Digits + std::string(static_cast<size_t>(DotPlace - Len), '0');
    } else {
      IntPart = Digits.substr(0, static_cast<size_t>(DotPlace));
      FracPart = "." + Digits.substr(static_cast<size_t>(DotPlace));
    }

    std::string ExpPart;
    if (LeftDigits != DotPlace) {
      int64_t E = LeftDigits - DotPlace;
      ExpPart = std::string("E") + (E < 0 ? "-" : "+") +
                std::to_string(E < 0 ? -E : E);
    }
    return Sign + IntPart + FracPart + ExpPart;
  }
};

inline Decimal negate(const Decimal &A) {
  Decimal R = A;
  if (!R.isNan())
    R.Negative = !R.Negative;
  return R;
}

inline Decimal abs(const Decimal &A) {
  Decimal R = A;
  R.Negative = false;
  return R;
}

namespace detail {

// Signed coefficient of A scaled to exponent E (E <= A.Exponent).
inline BigInt alignedCoefficient(const Decimal &A, int64_t E) {
  BigInt C = A.Coefficient;
  if (A.Exponent > E)
    C = C * BigInt::pow10(static_cast<unsigned long>(A.Exponent - E));
  return A.Negative ? -C : C;
}

} // namespace detail

// A - B for finite operands, exact.
inline Decimal subtract(const Decimal &A, const Decimal &B) {
  if (B.isZero())
    return A.isZero() ? Decimal::zero() : A;
  if (A.isZero())
    return negate(B);
  int64_t E = A.Exponent < B.Exponent ? A.Exponent : B.Exponent;
  BigInt Diff = detail::alignedCoefficient(A, E) - detail::alignedCoefficient(B, E);
  return Decimal::finite(Diff.isNegative(), Diff.abs(), E);
}

// Sign of A - B for finite operands.
inline int compare(const Decimal &A, const Decimal &B) {
  Decimal D = subtract(A, B);
  if (D.isZero())
    return 0;
  return D.Negative ? -1 : 1;
}

// A * 2^K, exact.
inline Decimal mulPow2(const Decimal &A, long K) {
  if (!A.isFinite() || A.isZero())
    return A;
  if (K >= 0)
    return Decimal::finite(A.Negative, A.Coefficient.shiftedLeft(K), A.Exponent);
  return Decimal::finite(A.Negative,
                         A.Coefficient * BigInt::pow5(static_cast<unsigned long>(-K)),
                         A.Exponent + K);
}

// printf-style "%.{Precision}g" of the exact value: round half to even at
// Precision significant digits, trailing zeros dropped, scientific form
// when the exponent is below -4 or at least Precision.
inline std::string formatGeneral(const Decimal &V, int Precision) {
  if (V.isNan())
    return "NaN";
  if (V.isInfinite())
    return V.Negative ? "-Infinity" : "Infinity";
  if (V.isZero())
    return "0";

  std::string Digits = V.Coefficient.magnitudeDigits(10);
  int64_t Exp = V.Exponent;
  if (Digits.size() > static_cast<size_t>(Precision)) {
    unsigned long Drop = static_cast<unsigned long>(Digits.size() - Precision);
    BigInt Rounded = divRoundHalfEven(V.Coefficient, BigInt::pow10(Drop));
    Exp += static_cast<int64_t>(Drop);
    Digits = Rounded.magnitudeDigits(10);
    if (Digits.size() > static_cast<size_t>(Precision)) {
      Digits.pop_back(); // carry produced 10^Precision
      ++Exp;
    }
  }
  while (Digits.size() > 1 && Digits.back() == '0') {
    Digits.pop_back();
    ++Exp;
  }

  int64_t X = Exp + static_cast<int64_t>(Digits.size()) - 1;
  std::string Out = V.Negative ? "-" : "";
  if (X < -4 || X >= Precision) {
    Out += Digits[0];
    if (Digits.size() > 1)
      Out += "." + Digits.substr(1);
    std::string ExpDigits = std::to_string(X < 0 ? -X : X);
    if (ExpDigits.size() < 2)
      ExpDigits.insert(0, "0");
    Out += std::string("e") + (X < 0 ? "-" : "+") + ExpDigits;
  } else if (X >= 0) {
    size_t IntLen = static_cast<size_t>(X) + 1;
    if (Digits.size() <= IntLen) {
      Out += Digits + std::string(IntLen - Digits.size(), '0');
    } else {
      Out += Digits.substr(0, IntLen) + "." + Digits.substr(IntLen);
    }
  } else {
    Out += "0." + std::string(static_cast<size_t>(-X - 1), '0') + Digits;
  }
  return Out;
}

namespace detail {

inline bool equalsIgnoreCase(std::string_view A, std::string_view B) {
  if (A.size() != B.size())
    return false;
  for (size_t I = 0; I < A.size(); ++I)
    if (std::tolower(static_cast<unsigned char>(A[I])) !=
        std::tolower(static_cast<unsigned char>(B[I])))
      return false;
  return true;
}

inline bool allDigits(std::string_view S) {
  for (char C : S)
    if (C < '0' || C > '9')
      return false;
  return true;
}

} // namespace detail

// Decimal literal: [sign] (digits [. [digits]] | . digits) [(e|E) [sign] digits]
// or [sign] Inf / Infinity / NaN / sNaN (any case, NaN may carry a digit
// payload). Empty text and a bare sign parse as zero.
inline Result<Decimal> parseDecimal(std::string_view Text) {
  std::string Cleaned = cleanInput(Text);
  if (isBareSign(Cleaned))
    return Result<Decimal>::success(Decimal::zero());

  auto invalid = [&]() {
    return Result<Decimal>::failure(ErrorKind::InvalidDecimal,
                                    "Invalid decimal input: '" +
                                        std::string(Text) + "'");
  };

  std::string_view Body = Cleaned;
  bool Negative = false;
  if (Body.front() == '+' || Body.front() == '-') {
    Negative = Body.front() == '-';
    Body.remove_prefix(1);
  }

  if (detail::equalsIgnoreCase(Body, "inf") ||
      detail::equalsIgnoreCase(Body, "infinity"))
    return Result<Decimal>::success(Decimal::infinity(Negative));
  for (std::string_view Prefix : {std::string_view("nan"), std::string_view("snan")}) {
    if (Body.size() >= Prefix.size() &&
        detail::equalsIgnoreCase(Body.substr(0, Prefix.size()), Prefix) &&
        detail::allDigits(Body.substr(Prefix.size())))
      return Result<Decimal>::success(Decimal::nan());
  }

  size_t Pos = 0;
  std::string Digits;
  size_t IntStart = Pos;
  while (Pos < Body.size() && Body[Pos] >= '0' && Body[Pos] <= '9')
    ++Pos;
  Digits.append(Body.substr(IntStart, Pos - IntStart));
  bool SawDigits = Pos > IntStart;

  int64_t FracDigits = 0;
  if (Pos < Body.size() && Body[Pos] == '.') {
    ++Pos;
    size_t FracStart = Pos;
    while (Pos < Body.size() && Body[Pos] >= '0' && Body[Pos] <= '9')
      ++Pos;
    Digits.append(Body.substr(FracStart, Pos - FracStart));
    FracDigits = static_cast<int64_t>(Pos - FracStart);
    SawDigits = SawDigits || Pos > FracStart;
  }
  if (!SawDigits)
    return invalid();

  int64_t Exp = 0;
  if (Pos < Body.size() && (Body[Pos] == 'e' || Body[Pos] == 'E')) {
    ++Pos;
    bool ExpNegative = false;
    if (Pos < Body.size() && (Body[Pos] == '+' || Body[Pos] == '-')) {
      ExpNegative = Body[Pos] == '-';
      ++Pos;
    }
    size_t ExpStart = Pos;
    while (Pos < Body.size() && Body[Pos] >= '0' && Body[Pos] <= '9') {
      if (Exp < DecimalExponentClamp)
        Exp = Exp * 10 + (Body[Pos] - '0');
      ++Pos;
    }
    if (Pos == ExpStart)
      return invalid();
    if (Exp > DecimalExponentClamp)
      Exp = DecimalExponentClamp;
    if (ExpNegative)
      Exp = -Exp;
  }
  if (Pos != Body.size())
    return invalid();

  return Result<Decimal>::success(
      Decimal::finite(Negative, BigInt::fromDigits(Digits, 10), Exp - FracDigits));
}

} // namespace numlens

#endif // NUMLENS_CORE_DECIMAL_HPP
