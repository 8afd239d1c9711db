// Copyright (c) 2020 Matthew J. Smith and Noisefield contributors
// License: MIT (http://opensource.org/licenses/MIT)

#include "Heightmap.hpp"

#include <noisefield.hpp>

#include <cstdio>
#include <exception>

int main(int argc, char **argv) {

  try {
    examples::heightmap_options Options = examples::ParseHeightmapOptions(argc, argv);
    if (!Options.Help) {
      nfd::core::logger Logger(2);
      examples::GenerateHeightmap(Options, Logger);
    }
  } catch (const std::exception &Exception) {
    std::fprintf(stderr, "Encountered error:\n%s\n", Exception.what()); std::fflush(stderr);
    return 1;
  }

  return 0;

}
