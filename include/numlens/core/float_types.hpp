#ifndef NUMLENS_CORE_FLOAT_TYPES_HPP
#define NUMLENS_CORE_FLOAT_TYPES_HPP

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

#include "numlens/core/format.hpp"
#include "numlens/core/status.hpp"

namespace numlens {

// Runtime view of a binary interchange format from the catalog.
struct FloatTypeDescriptor {
  std::string_view Name;
  int TotalBits = 0;
  int ExponentBits = 0;
  int MantissaBits = 0;

  // 2^(E-1) - 1
  constexpr int bias() const { return (1 << (ExponentBits - 1)) - 1; }
  constexpr int minExponent() const { return 1 - bias(); }
  constexpr int maxBiasedExponent() const { return (1 << ExponentBits) - 2; }

  constexpr uint64_t exponentAllOnes() const {
    return (uint64_t{1} << ExponentBits) - 1;
  }
  constexpr uint64_t mantissaMask() const {
    return (uint64_t{1} << MantissaBits) - 1;
  }
  constexpr uint64_t signBit() const {
    return uint64_t{1} << (ExponentBits + MantissaBits);
  }
  constexpr uint64_t wordMask() const {
    return TotalBits == 64 ? ~uint64_t{0} : (uint64_t{1} << TotalBits) - 1;
  }

  friend constexpr bool operator==(const FloatTypeDescriptor &,
                                   const FloatTypeDescriptor &) = default;
};

template <ValidLayout Layout>
constexpr FloatTypeDescriptor makeFloatType(std::string_view Name) {
  return {Name, Layout::total_bits, Layout::exp_bits, Layout::mant_bits};
}

inline constexpr FloatTypeDescriptor HalfType = makeFloatType<fp16_layout>("half");
inline constexpr FloatTypeDescriptor SingleType = makeFloatType<fp32_layout>("single");
inline constexpr FloatTypeDescriptor DoubleType = makeFloatType<fp64_layout>("double");

inline constexpr std::array<FloatTypeDescriptor, 3> FloatCatalog = {
    {HalfType, SingleType, DoubleType}};

static_assert(HalfType.bias() == 15);
static_assert(SingleType.bias() == 127);
static_assert(DoubleType.bias() == 1023);

inline Result<FloatTypeDescriptor> findFloatType(std::string_view Name) {
  for (const auto &T : FloatCatalog)
    if (T.Name == Name)
      return Result<FloatTypeDescriptor>::success(T);
  return Result<FloatTypeDescriptor>::failure(
      ErrorKind::UnsupportedWidth,
      "Unsupported float format: '" + std::string(Name) + "'");
}

} // namespace numlens

#endif // NUMLENS_CORE_FLOAT_TYPES_HPP
