// Copyright (c) 2018 Matthew J. Smith and Noisefield contributors
// License: MIT (http://opensource.org/licenses/MIT)

#ifndef NFD_CORE_TEXT_PROCESSING_HPP_INCLUDED
#define NFD_CORE_TEXT_PROCESSING_HPP_INCLUDED

#include <nfd/core/Global.hpp>

#include <cstddef>
#include <cstdio>
#include <string>
#include <vector>

namespace nfd {
namespace core {

// Decimal digits in groups of three, e.g. -1,234,567
inline std::string FormatNumber(long long N) {

  unsigned long long Magnitude = N < 0 ? 0ull - (unsigned long long)(N) : (unsigned long long)(N);
  std::string Digits = std::to_string(Magnitude);

  std::string Grouped;
  if (N < 0) Grouped += '-';

  std::size_t NumDigits = Digits.length();
  for (std::size_t iDigit = 0; iDigit < NumDigits; ++iDigit) {
    if (iDigit > 0 && (NumDigits - iDigit) % 3 == 0) Grouped += ',';
    Grouped += Digits[iDigit];
  }

  return Grouped;

}

// Number followed by a label, e.g. "1 cell" or "2,500 cells"
template <typename IntegerType> std::string FormatNumber(IntegerType N, const std::string
  &PluralLabel, const std::string &SingularLabel) {
  return FormatNumber((long long)(N)) + " " + (N == 1 ? SingularLabel : PluralLabel);
}

namespace text_processing_internal {
template <typename T> const T &PrintfArg(const T &Arg) { return Arg; }
inline const char *PrintfArg(const std::string &Arg) { return Arg.c_str(); }
}

// printf into a std::string; std::string arguments may be passed directly for %s
template <typename... Ts> std::string StringPrint(const std::string &Format, const Ts &... Args) {

  int Length = std::snprintf(nullptr, 0, Format.c_str(),
    text_processing_internal::PrintfArg(Args)...);
  if (Length <= 0) return {};

  std::vector<char> Chars(std::size_t(Length)+1);
  std::snprintf(Chars.data(), Chars.size(), Format.c_str(),
    text_processing_internal::PrintfArg(Args)...);

  return std::string(Chars.data(), std::size_t(Length));

}

}}

#endif
