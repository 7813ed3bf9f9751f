#ifndef NUMLENS_CORE_ERROR_METRICS_HPP
#define NUMLENS_CORE_ERROR_METRICS_HPP

// Quantization error of a decimal input against its binary representation.
//
// std::nullopt stands for "not applicable" throughout. Absolute and ULP
// errors are exact decimals: the quantized value is converted to decimal
// without rounding before the subtraction.

#include <cmath>
#include <cstdio>
#include <optional>
#include <string>

#include "numlens/core/decimal.hpp"
#include "numlens/core/float_types.hpp"
#include "numlens/core/ieee754.hpp"
#include "numlens/core/mpfr_float.hpp"

namespace numlens {

struct ErrorReport {
  std::optional<Decimal> AbsoluteError;
  std::optional<double> UlpSize;
  std::optional<Decimal> UlpError;
};

inline std::optional<Decimal> absoluteError(const Decimal &Input,
                                            double Quantized) {
  if (Input.isNan() || std::isnan(Quantized))
    return std::nullopt;
  if (Input.isInfinite() || std::isinf(Quantized)) {
    bool SameInfinity = Input.isInfinite() && std::isinf(Quantized) &&
                        Input.Negative == std::signbit(Quantized);
    if (SameInfinity)
      return Decimal::zero();
    return std::nullopt;
  }
  return abs(subtract(Input, exactDecimalOf(Quantized)));
}

namespace detail {

// Adjacent bit patterns in value order. Both zeros step to the smallest
// subnormal of the requested sign.
inline uint64_t nextUpBits(const DecodedFloatFields &F) {
  if (isZeroClass(F.Class))
    return 1;
  return F.Sign ? F.Raw - 1 : F.Raw + 1;
}

inline uint64_t nextDownBits(const DecodedFloatFields &F,
                             const FloatTypeDescriptor &Type) {
  if (isZeroClass(F.Class))
    return Type.signBit() | 1;
  return F.Sign ? F.Raw + 1 : F.Raw - 1;
}

} // namespace detail

// The smaller of the gaps to the representable neighbours above and below.
// A neighbour that is infinite contributes no gap.
inline std::optional<double> ulpSize(double Quantized,
                                     const FloatTypeDescriptor &Type) {
  if (!std::isfinite(Quantized))
    return std::nullopt;

  DecodedFloatFields Here = decodeRawBits(nativeBitsOf(Quantized, Type), Type);
  MpfrFloat HereValue = exactValueOf(Here, Type);

  std::optional<double> Best;
  for (uint64_t Neighbour : {detail::nextUpBits(Here),
                             detail::nextDownBits(Here, Type)}) {
    DecodedFloatFields Next = decodeRawBits(Neighbour, Type);
    MpfrFloat Gap = absDifference(exactValueOf(Next, Type), HereValue);
    if (Gap.isNan() || Gap.isInf() || Gap.isZero())
      continue;
    double D = Gap.toDouble();
    if (!Best || D < *Best)
      Best = D;
  }
  return Best ? Best : std::optional<double>(0.0);
}

inline std::optional<Decimal> ulpError(const std::optional<Decimal> &AbsError,
                                       const std::optional<double> &Ulp) {
  if (!AbsError)
    return std::nullopt;
  if (AbsError->isZero())
    return Decimal::zero();
  if (!Ulp || *Ulp == 0.0)
    return std::nullopt;
  // Gaps between adjacent binary values are powers of two, so the
  // division is an exact rescale.
  int Exp2 = 0;
  std::frexp(*Ulp, &Exp2);
  return mulPow2(*AbsError, -static_cast<long>(Exp2 - 1));
}

inline ErrorReport computeErrorMetrics(const Decimal &Input, double Quantized,
                                       const FloatTypeDescriptor &Type) {
  ErrorReport R;
  R.AbsoluteError = absoluteError(Input, Quantized);
  R.UlpSize = ulpSize(Quantized, Type);
  R.UlpError = ulpError(R.AbsoluteError, R.UlpSize);
  return R;
}

// ===================================================================
// Display text
// ===================================================================

inline std::string formatErrorValue(const std::optional<Decimal> &V) {
  if (!V)
    return "n/a";
  return formatGeneral(*V, 12);
}

inline std::string formatUlpSize(const std::optional<double> &Ulp) {
  if (!Ulp)
    return "n/a";
  if (*Ulp == 0.0)
    return "0";
  char Buf[64];
  std::snprintf(Buf, sizeof(Buf), "%.12g", *Ulp);
  return Buf;
}

inline std::string ulpErrorFormula(const std::string &InputText,
                                   const std::string &QuantizedText,
                                   const std::string &AbsErrorText,
                                   const std::optional<double> &Ulp,
                                   const std::string &UlpErrorText) {
  std::string Head = "ULP error = |input - quantized| / ULP size = |" +
                     InputText + " - " + QuantizedText + "|";
  if (AbsErrorText == "n/a" || UlpErrorText == "n/a" || !Ulp)
    return Head + " / n/a";
  std::string UlpText = formatUlpSize(Ulp);
  return Head + " / " + UlpText + " = " + AbsErrorText + " / " + UlpText +
         " = " + UlpErrorText;
}

} // namespace numlens

#endif // NUMLENS_CORE_ERROR_METRICS_HPP
