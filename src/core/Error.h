// Copyright (c) 2019 Matthew J. Smith and Noisefield contributors
// License: MIT (http://opensource.org/licenses/MIT)

#ifndef NFD_CORE_ERROR_H_INCLUDED
#define NFD_CORE_ERROR_H_INCLUDED

#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef enum {
  NFD_ERROR_NONE = 0,
  NFD_ERROR_CONSTRUCTION,
  NFD_ERROR_DIMENSION_MISMATCH
} nfd_error;

static inline bool nfdValidError(nfd_error Error) {

  switch (Error) {
  case NFD_ERROR_NONE:
  case NFD_ERROR_CONSTRUCTION:
  case NFD_ERROR_DIMENSION_MISMATCH:
    return true;
  default:
    return false;
  }

}

#ifdef __cplusplus
}
#endif

#endif
