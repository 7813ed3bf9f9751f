#ifndef NUMLENS_CORE_TEXT_HPP
#define NUMLENS_CORE_TEXT_HPP

// Small text helpers shared by the integer, decimal and bit-pattern codecs.

#include <cctype>
#include <cstdint>
#include <string>
#include <string_view>

namespace numlens {

// Strip surrounding whitespace and drop the readability separators
// ('_' and ' ') anywhere inside.
inline std::string cleanInput(std::string_view Text) {
  size_t Begin = 0;
  size_t End = Text.size();
  while (Begin < End && std::isspace(static_cast<unsigned char>(Text[Begin])))
    ++Begin;
  while (End > Begin && std::isspace(static_cast<unsigned char>(Text[End - 1])))
    --End;

  std::string Out;
  Out.reserve(End - Begin);
  for (size_t I = Begin; I < End; ++I) {
    char C = Text[I];
    if (C == '_' || C == ' ')
      continue;
    Out.push_back(C);
  }
  return Out;
}

inline bool isBareSign(std::string_view Cleaned) {
  return Cleaned.empty() || Cleaned == "+" || Cleaned == "-";
}

// "1234567", 3 -> "1_234_567". Empty input renders as "0".
inline std::string groupFromRight(std::string_view Digits, int GroupSize) {
  if (Digits.empty())
    return "0";
  std::string Out;
  Out.reserve(Digits.size() + Digits.size() / GroupSize);
  size_t Lead = Digits.size() % GroupSize;
  if (Lead == 0)
    Lead = GroupSize;
  Out.append(Digits.substr(0, Lead));
  for (size_t I = Lead; I < Digits.size(); I += GroupSize) {
    Out.push_back('_');
    Out.append(Digits.substr(I, GroupSize));
  }
  return Out;
}

inline bool isBitText(std::string_view Text) {
  for (char C : Text)
    if (C != '0' && C != '1')
      return false;
  return true;
}

// Keep only 0/1, then truncate or zero-pad on the right to Count bits.
inline std::string sanitizeBits(std::string_view Text, size_t Count) {
  std::string Out;
  for (char C : Text) {
    if (Out.size() == Count)
      break;
    if (C == '0' || C == '1')
      Out.push_back(C);
  }
  Out.append(Count - Out.size(), '0');
  return Out;
}

// Zero-padded binary rendering of the low Width bits of Raw (Width <= 64).
inline std::string bitsToText(uint64_t Raw, int Width) {
  std::string Out(Width, '0');
  for (int I = 0; I < Width; ++I)
    if ((Raw >> I) & 1)
      Out[Width - 1 - I] = '1';
  return Out;
}

inline uint64_t textToBits(std::string_view BitText) {
  uint64_t Raw = 0;
  for (char C : BitText)
    Raw = (Raw << 1) | static_cast<uint64_t>(C == '1');
  return Raw;
}

} // namespace numlens

#endif // NUMLENS_CORE_TEXT_HPP
