// Copyright (c) 2019 Matthew J. Smith and Noisefield contributors
// License: MIT (http://opensource.org/licenses/MIT)

namespace nfd {

NFD_FORCE_INLINE const field::value_type &field::operator()(int X, int Y) const {

  NFD_DEBUG_ASSERT(IsValid(X, Y), "Cell (%i,%i) is out of bounds for field of size %ix%i.", X, Y,
    Width_, Height_);

  return Values_[ToIndex(X, Y)];

}

NFD_FORCE_INLINE field::value_type &field::operator()(int X, int Y) {

  NFD_DEBUG_ASSERT(IsValid(X, Y), "Cell (%i,%i) is out of bounds for field of size %ix%i.", X, Y,
    Width_, Height_);

  return Values_[ToIndex(X, Y)];

}

NFD_FORCE_INLINE const field::value_type &field::operator[](index_type Index) const {

  NFD_DEBUG_ASSERT(Index >= 0 && Index < Count(), "Index %i is out of bounds for field with %i "
    "cells.", Index, Count());

  return Values_[Index];

}

NFD_FORCE_INLINE field::value_type &field::operator[](index_type Index) {

  NFD_DEBUG_ASSERT(Index >= 0 && Index < Count(), "Index %i is out of bounds for field with %i "
    "cells.", Index, Count());

  return Values_[Index];

}

inline field::value_type field::Get(int X, int Y) const {
  return (*this)(X, Y);
}

inline field::value_type field::Set(int X, int Y, value_type Value) {
  return (*this)(X, Y) = Value;
}

inline field::value_type field::Add(int X, int Y, value_type Value) {
  return (*this)(X, Y) += Value;
}

inline field::value_type field::Subtract(int X, int Y, value_type Value) {
  return (*this)(X, Y) -= Value;
}

inline field::value_type field::Multiply(int X, int Y, value_type Value) {
  return (*this)(X, Y) *= Value;
}

inline field::value_type field::Divide(int X, int Y, value_type Value) {
  return (*this)(X, Y) /= Value;
}

inline field::value_type field::Modulo(int X, int Y, value_type Mod) {
  value_type &Cell = (*this)(X, Y);
  Cell = std::fmod(Cell, Mod);
  return Cell;
}

template <typename FieldType, typename F> void field::Iterate_(FieldType &Field, F &&Visitor,
  index_type BeginIndex, index_type EndIndex) {

  if (BeginIndex >= EndIndex) return;

  NFD_DEBUG_ASSERT(BeginIndex >= 0 && EndIndex <= Field.Count(), "Iteration range [%i,%i) is out "
    "of bounds for field with %i cells.", BeginIndex, EndIndex, Field.Count());

  for (index_type iCell = BeginIndex; iCell < EndIndex; ++iCell) {
    if (Visitor(Field, Field.ToX(iCell), Field.ToY(iCell), Field.Values_[iCell])) {
      break;
    }
  }

}

template <typename F, NFD_FUNCDEF_REQUIRES(core::IsCallableAs<F &&, bool(field &, int, int,
  float)>())> void field::ForEach(F &&Visitor) {
  Iterate_(*this, std::forward<F>(Visitor), 0, Count());
}

template <typename F, NFD_FUNCDEF_REQUIRES(core::IsCallableAs<F &&, bool(const field &, int, int,
  float)>())> void field::ForEach(F &&Visitor) const {
  Iterate_(*this, std::forward<F>(Visitor), 0, Count());
}

template <typename F, NFD_FUNCDEF_REQUIRES(core::IsCallableAs<F &&, bool(field &, int, int,
  float)>())> void field::ForEach(F &&Visitor, int FromX, int FromY) {
  Iterate_(*this, std::forward<F>(Visitor), ToIndex(FromX, FromY), Count());
}

template <typename F, NFD_FUNCDEF_REQUIRES(core::IsCallableAs<F &&, bool(const field &, int, int,
  float)>())> void field::ForEach(F &&Visitor, int FromX, int FromY) const {
  Iterate_(*this, std::forward<F>(Visitor), ToIndex(FromX, FromY), Count());
}

template <typename F, NFD_FUNCDEF_REQUIRES(core::IsCallableAs<F &&, bool(field &, int, int,
  float)>())> void field::ForEach(F &&Visitor, int FromX, int FromY, int ToX, int
  ToY) {
  Iterate_(*this, std::forward<F>(Visitor), ToIndex(FromX, FromY), ToIndex(ToX, ToY));
}

template <typename F, NFD_FUNCDEF_REQUIRES(core::IsCallableAs<F &&, bool(const field &, int, int,
  float)>())> void field::ForEach(F &&Visitor, int FromX, int FromY, int ToX, int
  ToY) const {
  Iterate_(*this, std::forward<F>(Visitor), ToIndex(FromX, FromY), ToIndex(ToX, ToY));
}

}
