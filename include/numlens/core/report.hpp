#ifndef NUMLENS_CORE_REPORT_HPP
#define NUMLENS_CORE_REPORT_HPP

// Display-ready results assembled from the codecs.
//
// Each report is a plain value built fresh per request: the integer view
// of a whole number in a catalog type, the three-base conversion of a
// numeral, and the per-format float report with its error analysis.

#include <array>
#include <string>
#include <string_view>
#include <vector>

#include "numlens/core/decimal.hpp"
#include "numlens/core/enums.hpp"
#include "numlens/core/error_metrics.hpp"
#include "numlens/core/explain.hpp"
#include "numlens/core/fixed_width.hpp"
#include "numlens/core/float_types.hpp"
#include "numlens/core/ieee754.hpp"
#include "numlens/core/integer_text.hpp"
#include "numlens/core/integer_types.hpp"
#include "numlens/core/status.hpp"
#include "numlens/core/text.hpp"

namespace numlens {

// Largest decimal exponent integer mode expands into a full integer.
inline constexpr int64_t IntegerInputDigitLimit = 100000;

// ===================================================================
// Integer mode
// ===================================================================

// Integer mode takes any decimal literal ("1.3e2" included) as long as
// it denotes a finite whole number.
inline Result<BigInt> parseIntegerInput(std::string_view Text) {
  Result<Decimal> Parsed = parseDecimal(Text);
  if (!Parsed)
    return Result<BigInt>::from(Parsed);
  const Decimal &V = Parsed.Value;
  if (!V.isFinite())
    return Result<BigInt>::failure(ErrorKind::NotWholeNumber,
                                   "Integer mode only accepts finite values.");
  if (!V.isIntegral())
    return Result<BigInt>::failure(ErrorKind::NotWholeNumber,
                                   "Integer mode requires a whole number.");
  if (!V.isZero() && V.adjustedExponent() >= IntegerInputDigitLimit)
    return Result<BigInt>::failure(
        ErrorKind::InvalidDecimal,
        "Integer input exceeds " + std::to_string(IntegerInputDigitLimit) +
            " digits.");
  return Result<BigInt>::success(V.toInteger());
}

struct IntegerReport {
  IntegerTypeDescriptor Type;
  BigInt Input;
  BigInt Wrapped; // signed or unsigned view, per Type
  BigInt SignedView;
  BigInt UnsignedView;
  std::string BitText;
  bool Overflow = false;
  bool Underflow = false;
  std::string TypeInfo;
  std::string Calculation;
  std::string RangeText;
  std::string ViewsText;
  std::string CommittedText; // grouped decimal for commit-on-blur
};

inline IntegerReport buildIntegerReport(const BigInt &Value,
                                        const IntegerTypeDescriptor &Type) {
  IntegerReport R;
  R.Type = Type;
  R.Input = Value;

  WrapResult W = wrapInteger(Value, Type);
  R.Overflow = W.Overflow;
  R.Underflow = W.Underflow;
  R.BitText = integerBits(W.Wrapped, Type.Bits);
  R.UnsignedView = unsignedView(R.BitText);
  R.SignedView = signedView(R.BitText);
  R.Wrapped = Type.Signed ? R.SignedView : R.UnsignedView;

  std::string Bits = std::to_string(Type.Bits);
  R.TypeInfo = std::string(Type.Name) + " (" +
               (Type.Signed ? "signed" : "unsigned") + ", " + Bits + "-bit)";
  if (R.Overflow || R.Underflow)
    R.Calculation = Value.toString() + " mod 2^" + Bits + " = " +
                    R.UnsignedView.toString() + " (active value wraps)";
  else
    R.Calculation = Value.toString() + " fits in " + Bits +
                    " bits without wrapping";
  R.RangeText = "Range for " + std::string(Type.Name) + ": [" +
                Type.minValue().toString() + ", " +
                Type.maxValue().toString() + "]";
  R.ViewsText = "Bit pattern interpreted as signed=" +
                R.SignedView.toString() +
                ", unsigned=" + R.UnsignedView.toString() + ".";
  R.CommittedText = formatInteger(Value, Radix::Decimal);
  return R;
}

// ===================================================================
// Base conversion
// ===================================================================

// One positional column of the numeral as typed: digit times Base^Power.
struct DigitColumn {
  char Digit;
  size_t Power;
};

struct BaseConversion {
  Radix Source = Radix::Decimal;
  BigInt Value;
  std::string BinaryText;
  std::string DecimalText;
  std::string HexText;
  std::string SourceText; // the typed numeral, regrouped
  bool Negative = false;
  std::vector<DigitColumn> Columns;

  const std::string &textFor(Radix R) const {
    switch (R) {
    case Radix::Binary:
      return BinaryText;
    case Radix::Hexadecimal:
      return HexText;
    case Radix::Decimal:
      break;
    }
    return DecimalText;
  }
};

inline Result<BaseConversion> convertBases(std::string_view Text,
                                           Radix Source) {
  Result<BigInt> Parsed = parseInteger(Text, Source);
  if (!Parsed)
    return Result<BaseConversion>::from(Parsed);

  BaseConversion C;
  C.Source = Source;
  C.Value = std::move(Parsed.Value);
  C.BinaryText = formatInteger(C.Value, Radix::Binary);
  C.DecimalText = formatInteger(C.Value, Radix::Decimal);
  C.HexText = formatInteger(C.Value, Radix::Hexadecimal);
  C.SourceText = formatSourceInteger(Text, Source);

  std::string Digits = cleanInput(Text);
  if (!Digits.empty() && (Digits.front() == '+' || Digits.front() == '-')) {
    C.Negative = Digits.front() == '-';
    Digits.erase(0, 1);
  }
  if (Digits.empty())
    Digits = "0";
  for (size_t I = 0; I < Digits.size(); ++I)
    C.Columns.push_back({Digits[I], Digits.size() - 1 - I});
  return Result<BaseConversion>::success(std::move(C));
}

// ===================================================================
// Float mode
// ===================================================================

struct FloatReport {
  FloatTypeDescriptor Type;
  DecodedFloatFields Fields;
  double Quantized = 0.0;
  ErrorReport Errors;
  std::string QuantizedText;
  std::string Classification;
  std::string ForwardCalc;
  std::string ReverseCalc;
  std::string AbsErrorText;
  std::string UlpSizeText;
  std::string UlpErrorText;
  std::string UlpFormula;
  FieldFactors Factors;
  std::array<int, 2> RoleBoundaries{}; // sign|exponent, exponent|mantissa
};

namespace detail {

inline FloatReport assembleFloatReport(const Decimal &Input,
                                       const DecodedFloatFields &F,
                                       const FloatTypeDescriptor &Type) {
  FloatReport R;
  R.Type = Type;
  R.Fields = F;
  R.Quantized = reconstructValue(F, Type);
  R.Errors = computeErrorMetrics(Input, R.Quantized, Type);

  R.QuantizedText = formatQuantized(R.Quantized);
  R.Classification = floatClassName(F.Class);
  R.ForwardCalc = forwardExplanation(Input, F, Type);
  R.ReverseCalc = reverseExplanation(F, Type);
  R.AbsErrorText = formatErrorValue(R.Errors.AbsoluteError);
  R.UlpSizeText = formatUlpSize(R.Errors.UlpSize);
  R.UlpErrorText = formatErrorValue(R.Errors.UlpError);
  R.UlpFormula = ulpErrorFormula(Input.toString(), R.QuantizedText,
                                 R.AbsErrorText, R.Errors.UlpSize,
                                 R.UlpErrorText);
  R.Factors = fieldFactors(F, Type);
  R.RoleBoundaries = {1, 1 + Type.ExponentBits};
  return R;
}

} // namespace detail

inline FloatReport buildFloatReport(const Decimal &Input,
                                    const FloatTypeDescriptor &Type) {
  QuantizedFloat Q = quantizeFloat(Input, Type);
  return detail::assembleFloatReport(Input, Q.Fields, Type);
}

// Report for an explicit bit pattern, measured against Input.
inline Result<FloatReport> buildFloatReportFromBits(const Decimal &Input,
                                                    const FloatTypeDescriptor &Type,
                                                    std::string_view BitText) {
  Result<DecodedFloatFields> F = decomposeFloatBits(BitText, Type);
  if (!F)
    return Result<FloatReport>::from(F);
  return Result<FloatReport>::success(
      detail::assembleFloatReport(Input, F.Value, Type));
}

using FloatReportSet = std::array<FloatReport, FloatCatalog.size()>;

// Half, single and double, in catalog order.
inline FloatReportSet buildAllFloatReports(const Decimal &Input) {
  FloatReportSet Out;
  for (size_t I = 0; I < FloatCatalog.size(); ++I)
    Out[I] = buildFloatReport(Input, FloatCatalog[I]);
  return Out;
}

// Text put back into the decimal entry after a bit-field edit.
inline std::string decimalTextForValue(const Decimal &V) {
  if (!V.isFinite())
    return V.toString();
  return formatGeneral(V, 12);
}

struct FieldSync {
  Decimal SharedValue;
  std::string DecimalText;
  FloatReportSet Reports;
  std::string Status;
};

// A bit-field edit in one format: the exact value of the edited pattern
// becomes the input of every format.
inline Result<FieldSync> synchronizeFromFields(const FloatTypeDescriptor &Type,
                                               std::string_view SignBits,
                                               std::string_view ExponentBits,
                                               std::string_view MantissaBits) {
  Result<DecodedFloatFields> F =
      composeFloatBits(SignBits, ExponentBits, MantissaBits, Type);
  if (!F)
    return Result<FieldSync>::from(F);

  FieldSync S;
  S.SharedValue = exactDecimalOf(reconstructValue(F.Value, Type));
  S.DecimalText = decimalTextForValue(S.SharedValue);
  S.Reports = buildAllFloatReports(S.SharedValue);
  S.Status = "Synchronized all float formats from " + std::string(Type.Name) +
             " bit fields.";
  return Result<FieldSync>::success(std::move(S));
}

} // namespace numlens

#endif // NUMLENS_CORE_REPORT_HPP
