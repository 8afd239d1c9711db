// Copyright (c) 2019 Matthew J. Smith and Noisefield contributors
// License: MIT (http://opensource.org/licenses/MIT)

#ifndef NFD_CORE_FIELD_HPP_INCLUDED
#define NFD_CORE_FIELD_HPP_INCLUDED

#include <nfd/core/Debug.hpp>
#include <nfd/core/Error.hpp>
#include <nfd/core/Global.hpp>
#include <nfd/core/TypeTraits.hpp>

#include <cmath>
#include <cstddef>
#include <functional>
#include <iosfwd>
#include <string>
#include <utility>
#include <vector>

namespace nfd {

class field;

// Type-erased visitor; return VISIT_STOP to end iteration
using field_visitor = std::function<bool(const field &, int, int, float)>;

// Dense 2D grid of scalar values stored in a single row-major array
//
// Cell (X,Y) lives at linear index X + Y*Width(). Dimensions are fixed at construction. A field
// that has been moved from has zero size and may only be assigned to or destroyed.
class field {

public:

  using value_type = float;
  using index_type = int;
  using iterator = value_type *;
  using const_iterator = const value_type *;

  // Square field, all cells zero
  explicit field(int Size);

  // All cells zero
  field(int Width, int Height);

  // All cells set to Value
  field(value_type Value, int Width, int Height);

  // Takes ownership of Values, which must hold exactly Width*Height values in row-major order;
  // throws construction_error (leaving Values untouched) otherwise
  field(std::vector<value_type> &&Values, int Width, int Height);

  field(const field &Other) = default;
  field(field &&Other) noexcept;

  field &operator=(const field &Other) = default;
  field &operator=(field &&Other) noexcept;

  int Width() const { return Width_; }
  int Height() const { return Height_; }

  index_type Count() const { return index_type(Values_.size()); }

  NFD_FORCE_INLINE index_type ToIndex(int X, int Y) const { return X + Y*Width_; }
  NFD_FORCE_INLINE int ToX(index_type Index) const { return Index % Width_; }
  NFD_FORCE_INLINE int ToY(index_type Index) const { return Index / Width_; }

  bool IsValid(int X, int Y) const {
    return X >= 0 && X < Width_ && Y >= 0 && Y < Height_;
  }

  NFD_FORCE_INLINE const value_type &operator()(int X, int Y) const;
  NFD_FORCE_INLINE value_type &operator()(int X, int Y);

  NFD_FORCE_INLINE const value_type &operator[](index_type Index) const;
  NFD_FORCE_INLINE value_type &operator[](index_type Index);

  const value_type *Data() const { return Values_.data(); }
  value_type *Data() { return Values_.data(); }

  // Per-cell operations; (X,Y) must be valid. Each returns the cell's new value.
  value_type Get(int X, int Y) const;
  value_type Set(int X, int Y, value_type Value);
  value_type Add(int X, int Y, value_type Value);
  value_type Subtract(int X, int Y, value_type Value);
  value_type Multiply(int X, int Y, value_type Value);
  value_type Divide(int X, int Y, value_type Value);
  value_type Modulo(int X, int Y, value_type Mod);

  field &Set(value_type Value);
  field &Add(value_type Value);
  field &Subtract(value_type Value);
  field &Multiply(value_type Value);
  field &Divide(value_type Value);
  field &Modulo(value_type Mod);
  field &Negate();

  // Cellwise operations with a field of the same size; throw dimension_mismatch_error without
  // modifying any cell if the sizes differ
  field &Set(const field &Other);
  field &Add(const field &Other);
  field &Subtract(const field &Other);
  field &Multiply(const field &Other);
  field &Divide(const field &Other);

  // Visits cells in increasing linear index order, calling Visitor(Field, X, Y, Value) until it
  // returns VISIT_STOP
  template <typename F, NFD_FUNCDECL_REQUIRES(core::IsCallableAs<F &&, bool(field &, int, int,
    float)>())> void ForEach(F &&Visitor);
  template <typename F, NFD_FUNCDECL_REQUIRES(core::IsCallableAs<F &&, bool(const field &, int, int,
    float)>())> void ForEach(F &&Visitor) const;

  // Starts at (FromX,FromY) and continues to the end of the field
  template <typename F, NFD_FUNCDECL_REQUIRES(core::IsCallableAs<F &&, bool(field &, int, int,
    float)>())> void ForEach(F &&Visitor, int FromX, int FromY);
  template <typename F, NFD_FUNCDECL_REQUIRES(core::IsCallableAs<F &&, bool(const field &, int, int,
    float)>())> void ForEach(F &&Visitor, int FromX, int FromY) const;

  // Covers linear indices [ToIndex(FromX,FromY), ToIndex(ToX,ToY)); reversed bounds visit nothing
  template <typename F, NFD_FUNCDECL_REQUIRES(core::IsCallableAs<F &&, bool(field &, int, int,
    float)>())> void ForEach(F &&Visitor, int FromX, int FromY, int ToX, int ToY);
  template <typename F, NFD_FUNCDECL_REQUIRES(core::IsCallableAs<F &&, bool(const field &, int, int,
    float)>())> void ForEach(F &&Visitor, int FromX, int FromY, int ToX, int ToY) const;

  // O(Count()); cells compare by bit pattern with all NaNs treated as equal
  bool operator==(const field &Other) const;
  bool operator!=(const field &Other) const { return !(*this == Other); }

  // O(Count()); consistent with operator==
  std::size_t Hash() const;

  field Copy() const { return field(*this); }

  // One "[X,Y|Value]" entry per cell, one line per row
  std::string ToString() const;

  const_iterator Begin() const { return Values_.data(); }
  iterator Begin() { return Values_.data(); }
  const_iterator End() const { return Values_.data() + Values_.size(); }
  iterator End() { return Values_.data() + Values_.size(); }

  // Google Test doesn't use free begin/end functions and instead expects container to have
  // lowercase begin/end methods
  const_iterator begin() const { return Begin(); }
  iterator begin() { return Begin(); }
  const_iterator end() const { return End(); }
  iterator end() { return End(); }

private:

  int Width_;
  int Height_;
  std::vector<value_type> Values_;

  template <typename FieldType, typename F> static void Iterate_(FieldType &Field, F &&Visitor,
    index_type BeginIndex, index_type EndIndex);

  void CheckDimensions_(const field &Other) const;

  friend class core::test_helper<field>;

};

std::ostream &operator<<(std::ostream &Stream, const field &Field);

}

namespace std {
template <> struct hash<nfd::field> {
  std::size_t operator()(const nfd::field &Field) const { return Field.Hash(); }
};
}

#include <nfd/core/Field.inl>

#endif
