// Copyright (c) 2020 Matthew J. Smith and Noisefield contributors
// License: MIT (http://opensource.org/licenses/MIT)

#ifndef NFD_CORE_FIELD_OPS_HPP_INCLUDED
#define NFD_CORE_FIELD_OPS_HPP_INCLUDED

#include <nfd/core/Debug.hpp>
#include <nfd/core/Field.hpp>
#include <nfd/core/Global.hpp>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>
#include <string>

namespace nfd {
namespace core {

namespace print_field_internal {
inline std::string FormatValue(float Value, int Width) {
  char Format[16];
  std::snprintf(Format, sizeof(Format), "%%%i.%ie", Width, std::max(Width-7, 0));
  char Chars[64];
  std::snprintf(Chars, sizeof(Chars), Format, double(Value));
  return Chars;
}
}

// Prints cells with BeginX <= X < EndX and BeginY <= Y < EndY, one row per line starting at
// BeginY
inline void PrintField(const field &Field, int BeginX, int BeginY, int EndX, int EndY, int
  Width=10) {

  NFD_DEBUG_ASSERT(BeginX >= 0 && BeginY >= 0 && EndX <= Field.Width() && EndY <= Field.Height(),
    "Invalid print range.");

  for (int j = BeginY; j < EndY; ++j) {
    for (int i = BeginX; i < EndX; ++i) {
      std::printf(" %s ", print_field_internal::FormatValue(Field(i,j), Width).c_str());
    }
    std::printf("\n"); std::fflush(stdout);
  }
  std::printf("\n"); std::fflush(stdout);

}

inline void PrintField(const field &Field, int Width=10) {
  PrintField(Field, 0, 0, Field.Width(), Field.Height(), Width);
}

namespace field_reduce_internal {
template <typename CompareType> float Reduce(const field &Field, CompareType Compare) {
  float Result = std::numeric_limits<float>::quiet_NaN();
  for (float Value : Field) {
    if (std::isnan(Value)) continue;
    if (std::isnan(Result) || Compare(Value, Result)) Result = Value;
  }
  return Result;
}
}

// NaN cells are skipped; the result is NaN only when every cell is NaN
inline float FieldMin(const field &Field) {
  return field_reduce_internal::Reduce(Field, [](float Left, float Right) -> bool {
    return Left < Right;
  });
}

inline float FieldMax(const field &Field) {
  return field_reduce_internal::Reduce(Field, [](float Left, float Right) -> bool {
    return Left > Right;
  });
}

}}

#endif
