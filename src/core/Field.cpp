// Copyright (c) 2019 Matthew J. Smith and Noisefield contributors
// License: MIT (http://opensource.org/licenses/MIT)

#include "nfd/core/Field.hpp"

#include "nfd/core/Error.hpp"
#include "nfd/core/Global.hpp"
#include "nfd/core/TextProcessing.hpp"

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace nfd {

namespace {

// Shortest digits that read back as Value; plain notation for decimal exponents in [-3,7) and
// d.dddE<n> otherwise, always with at least one fractional digit (e.g. 1.0, 0.25, 1.0E7)
std::string FormatCellValue(float Value) {

  if (std::isnan(Value)) return "NaN";
  if (std::isinf(Value)) return Value > 0.f ? "Infinity" : "-Infinity";
  if (Value == 0.f) return std::signbit(Value) ? "-0.0" : "0.0";

  char Chars[32];
  for (int Precision = 0; Precision < 9; ++Precision) {
    std::snprintf(Chars, sizeof(Chars), "%.*e", Precision, double(Value));
    if (std::strtof(Chars, nullptr) == Value) break;
  }

  bool Negative = Chars[0] == '-';
  const char *ExponentChars = std::strchr(Chars, 'e');
  int Exponent = std::atoi(ExponentChars+1);

  std::string Digits;
  for (const char *Char = Chars + (Negative ? 1 : 0); Char != ExponentChars; ++Char) {
    if (*Char != '.') Digits += *Char;
  }
  while (Digits.length() > 1 && Digits.back() == '0') Digits.pop_back();

  std::string String = Negative ? "-" : "";

  if (Exponent >= 0 && Exponent < 7) {
    std::size_t NumIntegerDigits = std::size_t(Exponent)+1;
    if (Digits.length() > NumIntegerDigits) {
      String += Digits.substr(0, NumIntegerDigits) + "." + Digits.substr(NumIntegerDigits);
    } else {
      String += Digits + std::string(NumIntegerDigits - Digits.length(), '0') + ".0";
    }
  } else if (Exponent < 0 && Exponent >= -3) {
    String += "0." + std::string(std::size_t(-Exponent-1), '0') + Digits;
  } else {
    String += Digits.substr(0, 1) + "." + (Digits.length() > 1 ? Digits.substr(1) : "0") + "E" +
      std::to_string(Exponent);
  }

  return String;

}

long long CheckedCellCount(int Width, int Height, long long NumValues) {

  long long NumCells = (long long)(Width)*(long long)(Height);

  if (Width <= 0 || Height <= 0 || NumCells > std::numeric_limits<field::index_type>::max()) {
    throw construction_error(Width, Height, NumValues);
  }

  return NumCells;

}

long long CheckedCellCount(int Width, int Height) {

  long long NumCells = (long long)(Width)*(long long)(Height);

  return CheckedCellCount(Width, Height, NumCells);

}

// Validate before moving so the caller still owns the buffer if construction fails
std::vector<field::value_type> &&AdoptValues(std::vector<field::value_type> &Values, int Width,
  int Height) {

  long long NumValues = (long long)(Values.size());

  if (CheckedCellCount(Width, Height, NumValues) != NumValues) {
    throw construction_error(Width, Height, NumValues);
  }

  return std::move(Values);

}

// Bit pattern of a cell value; every NaN maps to the same pattern
std::uint32_t CellBits(field::value_type Value) {

  if (std::isnan(Value)) return 0x7fc00000u;

  std::uint32_t Bits;
  std::memcpy(&Bits, &Value, sizeof(Bits));

  return Bits;

}

}

field::field(int Size):
  field(value_type(0), Size, Size)
{}

field::field(int Width, int Height):
  field(value_type(0), Width, Height)
{}

field::field(value_type Value, int Width, int Height):
  Width_(Width),
  Height_(Height),
  Values_(std::size_t(CheckedCellCount(Width, Height)), Value)
{}

field::field(std::vector<value_type> &&Values, int Width, int Height):
  Width_(Width),
  Height_(Height),
  Values_(AdoptValues(Values, Width, Height))
{}

field::field(field &&Other) noexcept:
  Width_(Other.Width_),
  Height_(Other.Height_),
  Values_(std::move(Other.Values_))
{
  Other.Width_ = 0;
  Other.Height_ = 0;
  Other.Values_.clear();
}

field &field::operator=(field &&Other) noexcept {

  if (&Other == this) return *this;

  Width_ = Other.Width_;
  Height_ = Other.Height_;
  Values_ = std::move(Other.Values_);

  Other.Width_ = 0;
  Other.Height_ = 0;
  Other.Values_.clear();

  return *this;

}

field &field::Set(value_type Value) {

  for (auto &Cell : Values_) {
    Cell = Value;
  }

  return *this;

}

field &field::Add(value_type Value) {

  for (auto &Cell : Values_) {
    Cell += Value;
  }

  return *this;

}

field &field::Subtract(value_type Value) {

  for (auto &Cell : Values_) {
    Cell -= Value;
  }

  return *this;

}

field &field::Multiply(value_type Value) {

  for (auto &Cell : Values_) {
    Cell *= Value;
  }

  return *this;

}

field &field::Divide(value_type Value) {

  for (auto &Cell : Values_) {
    Cell /= Value;
  }

  return *this;

}

field &field::Modulo(value_type Mod) {

  for (auto &Cell : Values_) {
    Cell = std::fmod(Cell, Mod);
  }

  return *this;

}

field &field::Negate() {

  for (auto &Cell : Values_) {
    Cell = -Cell;
  }

  return *this;

}

void field::CheckDimensions_(const field &Other) const {

  if (Other.Width_ != Width_ || Other.Height_ != Height_) {
    throw dimension_mismatch_error(Width_, Height_, Other.Width_, Other.Height_);
  }

}

field &field::Set(const field &Other) {

  CheckDimensions_(Other);

  // Self-assignment is a no-op
  if (&Other != this) {
    Values_ = Other.Values_;
  }

  return *this;

}

field &field::Add(const field &Other) {

  CheckDimensions_(Other);

  index_type NumCells = Count();
  for (index_type iCell = 0; iCell < NumCells; ++iCell) {
    Values_[iCell] += Other.Values_[iCell];
  }

  return *this;

}

field &field::Subtract(const field &Other) {

  CheckDimensions_(Other);

  index_type NumCells = Count();
  for (index_type iCell = 0; iCell < NumCells; ++iCell) {
    Values_[iCell] -= Other.Values_[iCell];
  }

  return *this;

}

field &field::Multiply(const field &Other) {

  CheckDimensions_(Other);

  index_type NumCells = Count();
  for (index_type iCell = 0; iCell < NumCells; ++iCell) {
    Values_[iCell] *= Other.Values_[iCell];
  }

  return *this;

}

field &field::Divide(const field &Other) {

  CheckDimensions_(Other);

  index_type NumCells = Count();
  for (index_type iCell = 0; iCell < NumCells; ++iCell) {
    Values_[iCell] /= Other.Values_[iCell];
  }

  return *this;

}

bool field::operator==(const field &Other) const {

  if (&Other == this) return true;

  // Equal widths and equal cell counts imply equal heights
  if (Other.Width_ != Width_ || Other.Values_.size() != Values_.size()) return false;

  index_type NumCells = Count();
  for (index_type iCell = 0; iCell < NumCells; ++iCell) {
    if (CellBits(Values_[iCell]) != CellBits(Other.Values_[iCell])) return false;
  }

  return true;

}

std::size_t field::Hash() const {

  std::uint32_t HashValue = 1;

  for (auto &Cell : Values_) {
    HashValue = 31u*HashValue + CellBits(Cell);
  }

  return std::size_t(HashValue);

}

std::string field::ToString() const {

  std::string String;

  ForEach([&String](const field &Field, int X, int Y, value_type Value) -> bool {
    String += core::StringPrint("[%i,%i|%s]", X, Y, FormatCellValue(Value));
    String += X == Field.Width() - 1 ? '\n' : ' ';
    return VISIT_CONTINUE;
  });

  return String;

}

std::ostream &operator<<(std::ostream &Stream, const field &Field) {

  return Stream << Field.ToString();

}

}
