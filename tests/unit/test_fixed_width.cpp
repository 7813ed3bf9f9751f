// Two's-complement wraparound, overflow flags and bit strings.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "numlens/numlens.hpp"

using namespace numlens;

static IntegerTypeDescriptor typeNamed(std::string_view Name) {
  Result<IntegerTypeDescriptor> R = findIntegerType(Name);
  REQUIRE_MESSAGE(R.ok(), R.Message);
  return R.Value;
}

TEST_CASE("int8 overflow wraps to the negative range") {
  WrapResult W = wrapInteger(BigInt(130), typeNamed("int8_t"));
  CHECK(W.Wrapped == BigInt(-126));
  CHECK(W.Overflow);
  CHECK_FALSE(W.Underflow);
  CHECK(integerBits(BigInt(-126).floorMod(BigInt(256)), 8) == "10000010");
  CHECK(integerBits(W.Wrapped, 8) == "10000010");
}

TEST_CASE("uint8 underflow wraps to the top") {
  WrapResult W = wrapInteger(BigInt(-1), typeNamed("uint8_t"));
  CHECK(W.Wrapped == BigInt(255));
  CHECK_FALSE(W.Overflow);
  CHECK(W.Underflow);
  CHECK(integerBits(W.Wrapped, 8) == "11111111");
}

TEST_CASE("values inside the range are untouched") {
  for (long V : {-128L, -1L, 0L, 1L, 127L}) {
    WrapResult W = wrapInteger(BigInt(V), typeNamed("int8_t"));
    CHECK(W.Wrapped == BigInt(V));
    CHECK_FALSE(W.Overflow);
    CHECK_FALSE(W.Underflow);
  }
  WrapResult Top = wrapInteger(BigInt::pow2(64) - BigInt(1), typeNamed("uint64_t"));
  CHECK(Top.Wrapped == BigInt::pow2(64) - BigInt(1));
  CHECK_FALSE(Top.Overflow);
}

TEST_CASE("range boundaries") {
  IntegerTypeDescriptor I16 = typeNamed("int16_t");
  CHECK(wrapInteger(BigInt(32768), I16).Wrapped == BigInt(-32768));
  CHECK(wrapInteger(BigInt(32768), I16).Overflow);
  CHECK(wrapInteger(BigInt(-32769), I16).Wrapped == BigInt(32767));
  CHECK(wrapInteger(BigInt(-32769), I16).Underflow);

  IntegerTypeDescriptor U16 = typeNamed("unsigned short");
  CHECK(wrapInteger(BigInt(65536), U16).Wrapped.isZero());
  CHECK(wrapInteger(BigInt(65536), U16).Overflow);
}

TEST_CASE("far outside the range still wraps modulo 2^n") {
  IntegerTypeDescriptor I32 = typeNamed("int");
  BigInt Huge = BigInt::pow2(100) + BigInt(5);
  WrapResult W = wrapInteger(Huge, I32);
  CHECK(W.Wrapped == BigInt(5));
  CHECK(W.Overflow);

  WrapResult N = wrapInteger(-Huge, I32);
  CHECK(N.Wrapped == BigInt(-5));
  CHECK(N.Underflow);
}

TEST_CASE("integerBits is two's complement, zero padded") {
  CHECK(integerBits(BigInt(0), 8) == "00000000");
  CHECK(integerBits(BigInt(5), 8) == "00000101");
  CHECK(integerBits(BigInt(-1), 16) == std::string(16, '1'));
  CHECK(integerBits(BigInt(-2), 4) == "1110");
  CHECK(integerBits(BigInt(256 + 3), 8) == "00000011");
  CHECK(integerBits(-BigInt::pow2(63), 64) == "1" + std::string(63, '0'));
}

TEST_CASE("signed and unsigned views of a bit string") {
  CHECK(unsignedView("10000010") == BigInt(130));
  CHECK(signedView("10000010") == BigInt(-126));
  CHECK(signedView("01111111") == BigInt(127));
  CHECK(unsignedView("11111111") == BigInt(255));
  CHECK(signedView("11111111") == BigInt(-1));
  CHECK(signedView(std::string(64, '1')) == BigInt(-1));
}

TEST_CASE("catalog lookup") {
  CHECK(typeNamed("long long").Bits == 64);
  Result<IntegerTypeDescriptor> Missing = findIntegerType("int128_t");
  CHECK(Missing.Error == ErrorKind::UnsupportedWidth);
  CHECK(Missing.Message == "Unsupported integer type: 'int128_t'");
}
