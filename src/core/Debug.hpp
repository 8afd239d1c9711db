// Copyright (c) 2019 Matthew J. Smith and Noisefield contributors
// License: MIT (http://opensource.org/licenses/MIT)

#ifndef NFD_CORE_DEBUG_HPP_INCLUDED
#define NFD_CORE_DEBUG_HPP_INCLUDED

#include <nfd/core/Global.hpp>
#include <nfd/core/TextProcessing.hpp>

#include <string>

namespace nfd {
namespace core {

// Writes "DEBUG ERROR (line L of file 'F'): Message" to stderr and exits with status 1
[[noreturn]] void DebugFail(const char *File, int Line, const std::string &Message);

}}

// Checked only when NFD_DEBUG is on; remaining arguments are a StringPrint format and its values
#if NFD_DEBUG
#define NFD_DEBUG_ASSERT(Condition, ...) \
  do { \
    if (!(Condition)) { \
      ::nfd::core::DebugFail(__FILE__, __LINE__, ::nfd::core::StringPrint(__VA_ARGS__)); \
    } \
  } while (false)
#else
#define NFD_DEBUG_ASSERT(...) do {} while (false)
#endif

#endif
