// Copyright (c) 2019 Matthew J. Smith and Noisefield contributors
// License: MIT (http://opensource.org/licenses/MIT)

#ifndef NFD_CORE_GLOBAL_HPP_INCLUDED
#define NFD_CORE_GLOBAL_HPP_INCLUDED

#include <nfd/core/Config.h>

#define NFD_FORCE_INLINE __attribute__((always_inline)) inline

namespace nfd {

namespace core {
// Specialized in tests that need to inspect private state
template <typename T> class test_helper;
}

// What a visitor returns to keep going or to end the iteration
constexpr bool VISIT_STOP = true;
constexpr bool VISIT_CONTINUE = false;

}

#endif
