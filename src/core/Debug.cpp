// Copyright (c) 2019 Matthew J. Smith and Noisefield contributors
// License: MIT (http://opensource.org/licenses/MIT)

#include "nfd/core/Debug.hpp"

#include <cstdio>
#include <cstdlib>
#include <string>

namespace nfd {
namespace core {

void DebugFail(const char *File, int Line, const std::string &Message) {

  std::fprintf(stderr, "DEBUG ERROR (line %i of file '%s'): %s\n", Line, File, Message.c_str());
  std::fflush(stderr);

  std::exit(1);

}

}}
