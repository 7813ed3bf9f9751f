#ifndef NUMLENS_CORE_INTEGER_TYPES_HPP
#define NUMLENS_CORE_INTEGER_TYPES_HPP

#include <array>
#include <string>
#include <string_view>

#include "numlens/core/abi.hpp"
#include "numlens/core/big_int.hpp"
#include "numlens/core/status.hpp"

namespace numlens {

struct IntegerTypeDescriptor {
  std::string_view Name;
  int Bits = 0;
  bool Signed = false;

  BigInt modulus() const { return BigInt::pow2(Bits); }

  BigInt minValue() const {
    return Signed ? -BigInt::pow2(Bits - 1) : BigInt(0);
  }

  BigInt maxValue() const {
    return (Signed ? BigInt::pow2(Bits - 1) : BigInt::pow2(Bits)) - BigInt(1);
  }

  friend constexpr bool operator==(const IntegerTypeDescriptor &,
                                   const IntegerTypeDescriptor &) = default;
};

inline constexpr int IntegerCatalogSize = 16;

// Fixed-width <cstdint> types followed by the C native types, whose
// widths come from the ABI table.
template <AbiPolicy Abi = abi::Default>
constexpr std::array<IntegerTypeDescriptor, IntegerCatalogSize>
makeIntegerCatalog() {
  return {{
      {"uint8_t", 8, false},
      {"int8_t", 8, true},
      {"uint16_t", 16, false},
      {"int16_t", 16, true},
      {"uint32_t", 32, false},
      {"int32_t", 32, true},
      {"uint64_t", 64, false},
      {"int64_t", 64, true},
      {"short", Abi::short_bits, true},
      {"unsigned short", Abi::short_bits, false},
      {"int", Abi::int_bits, true},
      {"unsigned int", Abi::int_bits, false},
      {"long", Abi::long_bits, true},
      {"unsigned long", Abi::long_bits, false},
      {"long long", Abi::long_long_bits, true},
      {"unsigned long long", Abi::long_long_bits, false},
  }};
}

inline constexpr auto IntegerCatalog = makeIntegerCatalog();

inline Result<IntegerTypeDescriptor> findIntegerType(std::string_view Name) {
  for (const auto &T : IntegerCatalog)
    if (T.Name == Name)
      return Result<IntegerTypeDescriptor>::success(T);
  return Result<IntegerTypeDescriptor>::failure(
      ErrorKind::UnsupportedWidth,
      "Unsupported integer type: '" + std::string(Name) + "'");
}

} // namespace numlens

#endif // NUMLENS_CORE_INTEGER_TYPES_HPP
