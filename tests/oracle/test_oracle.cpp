// Cross-validation: the library's conversions against independent
// implementations.
//
// Every test takes two paths that should agree, runs them on the same
// inputs and compares bit patterns. MPFR covers every format; the host's
// strtof/strtod and nextafter cover single and double.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "harness/test_harness.hpp"
#include "oracle/mpfr_oracle.hpp"

using namespace numlens;
using namespace numlens::testing;

struct SoftFloatInit {
  SoftFloatInit() {
    softfloat_roundingMode = softfloat_round_near_even;
    softfloat_detectTininess = softfloat_tininess_afterRounding;
  }
};

static SoftFloatInit GlobalSoftFloatInit;

// Decimal exponent span that reaches past both ends of each format.
struct ExponentSpan {
  int Min;
  int Max;
};

static ExponentSpan spanOf(const FloatTypeDescriptor &Type) {
  switch (Type.TotalBits) {
  case 16:
    return {-10, 6};
  case 32:
    return {-48, 40};
  default:
    return {-330, 310};
  }
}

static TestOutput libraryRound(const std::string &Text,
                               const FloatTypeDescriptor &Type) {
  Result<Decimal> D = parseDecimal(Text);
  REQUIRE_MESSAGE(D.ok(), Text);
  return {quantizeFloat(D.Value, Type).Raw};
}

// ===================================================================
// Decimal -> binary rounding
// ===================================================================

TEST_CASE("quantizeFloat vs MPFR") {
  for (const FloatTypeDescriptor &Type : FloatCatalog) {
    SUBCASE(std::string(Type.Name).c_str()) {
      ExponentSpan Span = spanOf(Type);
      auto Iter = combined(TargetedInputs{interestingDecimals(Type)},
                           RandomDecimals{42, 50000, Span.Min, Span.Max},
                           MidpointDecimals{Type, 7, 20000});
      auto Lib = [&](const std::string &S) { return libraryRound(S, Type); };
      auto Mpfr = [&](const std::string &S) {
        return TestOutput{oracle::mpfrRoundDecimal(S, Type)};
      };
      TestResult R = testAgainst(Type.Name.data(), hexWidthOf(Type), Iter,
                                 Lib, Mpfr, NanAwareBitExact{Type});
      CHECK(R.Failed == 0);
      CHECK(R.Total > 0);
    }
  }
}

TEST_CASE("quantizeFloat vs strtof") {
  auto Iter = combined(TargetedInputs{interestingDecimals(SingleType)},
                       RandomDecimals{1234, 50000, -48, 40});
  auto Lib = [](const std::string &S) { return libraryRound(S, SingleType); };
  auto Native = [](const std::string &S) {
    float F = std::strtof(S.c_str(), nullptr);
    uint32_t U;
    std::memcpy(&U, &F, sizeof(U));
    return TestOutput{U};
  };
  TestResult R = testAgainst("strtof", hexWidthOf(SingleType), Iter, Lib,
                             Native, NanAwareBitExact{SingleType});
  CHECK(R.Failed == 0);
}

TEST_CASE("quantizeFloat vs strtod") {
  auto Iter = combined(TargetedInputs{interestingDecimals(DoubleType)},
                       RandomDecimals{5678, 50000, -330, 310});
  auto Lib = [](const std::string &S) { return libraryRound(S, DoubleType); };
  auto Native = [](const std::string &S) {
    double D = std::strtod(S.c_str(), nullptr);
    uint64_t U;
    std::memcpy(&U, &D, sizeof(U));
    return TestOutput{U};
  };
  TestResult R = testAgainst("strtod", hexWidthOf(DoubleType), Iter, Lib,
                             Native, NanAwareBitExact{DoubleType});
  CHECK(R.Failed == 0);
}

// ===================================================================
// Binary -> exact value
// ===================================================================

// Same value, including the sign of zero; any two NaNs match.
static bool sameMpfr(const MpfrFloat &A, const MpfrFloat &B) {
  if (A.isNan() || B.isNan())
    return A.isNan() && B.isNan();
  if (A.isZero() && B.isZero())
    return A.isNegative() == B.isNegative();
  return mpfr_equal_p(A.get(), B.get()) != 0;
}

static int countDecodeMismatches(const std::vector<uint64_t> &Patterns,
                                 const FloatTypeDescriptor &Type) {
  int Failed = 0;
  for (uint64_t Bits : Patterns) {
    MpfrFloat Lib = exactValueOf(decodeRawBits(Bits, Type), Type);
    MpfrFloat Ref = oracle::branchlessDecode(Bits, Type);
    // The closed formula has no special case for the all-ones exponent.
    if (((Bits >> Type.MantissaBits) & Type.exponentAllOnes()) ==
        Type.exponentAllOnes())
      continue;
    if (sameMpfr(Lib, Ref))
      continue;
    if (++Failed <= MaxReportedFailures) {
      std::fprintf(stderr, "  FAIL decode %s: 0x", Type.Name.data());
      printHex(stderr, Bits, hexWidthOf(Type));
      std::fprintf(stderr, "\n");
    }
  }
  return Failed;
}

TEST_CASE("exactValueOf vs closed-form decode") {
  SUBCASE("half, exhaustive") {
    std::vector<uint64_t> All;
    for (uint64_t Bits = 0; Bits <= 0xFFFF; ++Bits)
      All.push_back(Bits);
    CHECK(countDecodeMismatches(All, HalfType) == 0);
  }

  for (const FloatTypeDescriptor &Type : {SingleType, DoubleType}) {
    SUBCASE(std::string(Type.Name).c_str()) {
      std::vector<uint64_t> Patterns = interestingBitPatterns(Type);
      std::mt19937_64 Rng(99);
      for (int I = 0; I < 100000; ++I)
        Patterns.push_back(Rng() & Type.wordMask());
      CHECK(countDecodeMismatches(Patterns, Type) == 0);
    }
  }
}

TEST_CASE("exact decimal expansion re-rounds to the same pattern") {
  for (const FloatTypeDescriptor &Type : FloatCatalog) {
    std::vector<std::string> Texts;
    std::mt19937_64 Rng(3);
    for (int I = 0; I < 2000; ++I) {
      DecodedFloatFields F = decodeRawBits(Rng() & Type.wordMask(), Type);
      if (F.Class == FloatClass::NaN)
        continue;
      Texts.push_back(toDecimal(exactValueOf(F, Type)).toString());
    }
    auto Lib = [&](const std::string &S) { return libraryRound(S, Type); };
    auto Mpfr = [&](const std::string &S) {
      return TestOutput{oracle::mpfrRoundDecimal(S, Type)};
    };
    TestResult R = testAgainst(Type.Name.data(), hexWidthOf(Type),
                               TargetedInputs{Texts}, Lib, Mpfr, BitExact{});
    CHECK(R.Failed == 0);
  }
}

// ===================================================================
// ULP size
// ===================================================================

template <typename T>
static double nativeUlp(T X) {
  constexpr T Inf = std::numeric_limits<T>::infinity();
  T Up = std::nextafter(X, Inf);
  T Down = std::nextafter(X, -Inf);
  double Gap = std::numeric_limits<double>::infinity();
  if (std::isfinite(Up))
    Gap = std::min(Gap, static_cast<double>(Up) - static_cast<double>(X));
  if (std::isfinite(Down))
    Gap = std::min(Gap, static_cast<double>(X) - static_cast<double>(Down));
  return Gap;
}

TEST_CASE("ulpSize vs nextafter") {
  std::mt19937_64 Rng(11);
  int Failed = 0;
  for (int I = 0; I < 100000; ++I) {
    uint64_t Bits = Rng();
    double D;
    std::memcpy(&D, &Bits, sizeof(D));
    if (!std::isfinite(D))
      continue;
    std::optional<double> Ulp = ulpSize(D, DoubleType);
    if (!Ulp || *Ulp != nativeUlp(D))
      ++Failed;

    uint32_t Low = static_cast<uint32_t>(Bits);
    float F;
    std::memcpy(&F, &Low, sizeof(F));
    if (!std::isfinite(F))
      continue;
    std::optional<double> UlpF = ulpSize(static_cast<double>(F), SingleType);
    if (!UlpF || *UlpF != nativeUlp(F))
      ++Failed;
  }
  CHECK(Failed == 0);

  CHECK(*ulpSize(std::numeric_limits<double>::max(), DoubleType) ==
        nativeUlp(std::numeric_limits<double>::max()));
  CHECK(*ulpSize(0.0, DoubleType) == std::numeric_limits<double>::denorm_min());
  CHECK(*ulpSize(-0.0f, SingleType) ==
        static_cast<double>(std::numeric_limits<float>::denorm_min()));
}
