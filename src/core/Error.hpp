// Copyright (c) 2019 Matthew J. Smith and Noisefield contributors
// License: MIT (http://opensource.org/licenses/MIT)

#ifndef NFD_CORE_ERROR_HPP_INCLUDED
#define NFD_CORE_ERROR_HPP_INCLUDED

#include <nfd/core/Error.h>
#include <nfd/core/Global.hpp>

#include <stdexcept>
#include <string>
#include <type_traits>

namespace nfd {

enum class error_code : typename std::underlying_type<nfd_error>::type {
  NONE = NFD_ERROR_NONE,
  CONSTRUCTION = NFD_ERROR_CONSTRUCTION,
  DIMENSION_MISMATCH = NFD_ERROR_DIMENSION_MISMATCH
};

inline bool ValidErrorCode(error_code Code) {
  return nfdValidError(nfd_error(Code));
}

class error : public std::runtime_error {
public:
  error(error_code Code, const std::string &ErrorString):
    runtime_error(ErrorString),
    Code_(Code)
  {}
  virtual ~error() noexcept {}
  error_code Code() const { return Code_; }
protected:
  error_code Code_;
};

class field_error : public error {
public:
  field_error(error_code ErrorCode, const std::string &ErrorString):
    error(ErrorCode, ErrorString)
  {}
};

// Storage or dimensions passed to a field constructor cannot describe a valid field
class construction_error : public field_error {
public:
  construction_error(int Width, int Height, long long NumValues);
  int Width() const { return Width_; }
  int Height() const { return Height_; }
  long long ValueCount() const { return NumValues_; }
private:
  int Width_;
  int Height_;
  long long NumValues_;
};

// Pairwise field operation applied to fields of different sizes
class dimension_mismatch_error : public field_error {
public:
  dimension_mismatch_error(int Width, int Height, int OtherWidth, int OtherHeight);
  int Width() const { return Width_; }
  int Height() const { return Height_; }
  int OtherWidth() const { return OtherWidth_; }
  int OtherHeight() const { return OtherHeight_; }
private:
  int Width_;
  int Height_;
  int OtherWidth_;
  int OtherHeight_;
};

}

#endif
