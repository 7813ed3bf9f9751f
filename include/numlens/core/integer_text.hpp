#ifndef NUMLENS_CORE_INTEGER_TEXT_HPP
#define NUMLENS_CORE_INTEGER_TEXT_HPP

// Arbitrary-precision integer <-> text in base 2, 10 and 16.
//
// Display text groups digits from the right with '_' (3 per group in
// decimal, 4 in binary and hex), renders hex uppercase and prefixes
// negative values with '-'. Parsing accepts exactly that, plus any
// spacing, lowercase hex and a leading '+'.

#include <cctype>
#include <string>
#include <string_view>

#include "numlens/core/big_int.hpp"
#include "numlens/core/enums.hpp"
#include "numlens/core/status.hpp"
#include "numlens/core/text.hpp"

namespace numlens {

inline Result<Radix> radixFromInt(int Base) {
  switch (Base) {
  case 2:  return Result<Radix>::success(Radix::Binary);
  case 10: return Result<Radix>::success(Radix::Decimal);
  case 16: return Result<Radix>::success(Radix::Hexadecimal);
  }
  return Result<Radix>::failure(ErrorKind::UnsupportedBase,
                                "Unsupported base: " + std::to_string(Base));
}

inline bool isRadixDigit(char C, Radix R) {
  switch (R) {
  case Radix::Binary:      return C == '0' || C == '1';
  case Radix::Decimal:     return C >= '0' && C <= '9';
  case Radix::Hexadecimal: return std::isxdigit(static_cast<unsigned char>(C)) != 0;
  }
  return false;
}

inline std::string normalizeNumeral(std::string_view Text) {
  return cleanInput(Text);
}

// Empty text and a bare sign parse as zero.
inline Result<BigInt> parseInteger(std::string_view Text, Radix Base) {
  std::string Cleaned = normalizeNumeral(Text);
  if (isBareSign(Cleaned))
    return Result<BigInt>::success(BigInt(0));

  std::string_view Digits = Cleaned;
  bool Negative = false;
  if (Digits.front() == '+' || Digits.front() == '-') {
    Negative = Digits.front() == '-';
    Digits.remove_prefix(1);
  }

  for (char C : Digits) {
    if (!isRadixDigit(C, Base))
      return Result<BigInt>::failure(
          ErrorKind::InvalidNumeral,
          "Invalid base-" + std::to_string(radixValue(Base)) + " numeral: '" +
              std::string(Text) + "'");
  }

  BigInt Value = BigInt::fromDigits(Digits, radixValue(Base));
  if (Negative)
    Value = -Value;
  return Result<BigInt>::success(std::move(Value));
}

inline std::string formatInteger(const BigInt &Value, Radix Base) {
  std::string Digits =
      Value.magnitudeDigits(radixValue(Base), Base == Radix::Hexadecimal);
  return (Value.isNegative() ? "-" : "") +
         groupFromRight(Digits, radixGroupSize(Base));
}

// Regroup what the user typed without canonicalizing it: leading zeros
// survive and only the separators move. Bare signs echo back unchanged.
inline std::string formatSourceInteger(std::string_view OriginalText,
                                       Radix Base) {
  std::string Cleaned = normalizeNumeral(OriginalText);
  if (isBareSign(Cleaned))
    return std::string(OriginalText);

  bool Negative = Cleaned.front() == '-';
  std::string Digits = Cleaned;
  if (Digits.front() == '+' || Digits.front() == '-')
    Digits.erase(0, 1);
  if (Base == Radix::Hexadecimal)
    for (char &C : Digits)
      C = static_cast<char>(std::toupper(static_cast<unsigned char>(C)));

  return (Negative ? "-" : "") + groupFromRight(Digits, radixGroupSize(Base));
}

} // namespace numlens

#endif // NUMLENS_CORE_INTEGER_TEXT_HPP
