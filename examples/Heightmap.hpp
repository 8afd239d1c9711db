// Copyright (c) 2020 Matthew J. Smith and Noisefield contributors
// License: MIT (http://opensource.org/licenses/MIT)

#ifndef NFD_EXAMPLES_HEIGHTMAP_HPP_INCLUDED
#define NFD_EXAMPLES_HEIGHTMAP_HPP_INCLUDED

#include <noisefield.hpp>

#include <string>
#include <vector>

namespace examples {

struct heightmap_options {
  int Width = 64;
  int Height = 64;
  int NumOctaves = 5;
  int Seed = 1;
  bool Print = false;
  bool Help = false;
};

// Throws support::command_args_error on malformed input; writes the help text if requested
heightmap_options ParseHeightmapOptions(const std::vector<std::string> &Args);
heightmap_options ParseHeightmapOptions(int argc, char **argv);

// Smoothly interpolated lattice noise in [-1,1]
float ValueNoise(float X, float Y, int Seed);

// Fractal value noise normalized to [0,1]; a flat result is set to 0 with a warning
nfd::field GenerateHeightmap(const heightmap_options &Options, nfd::core::logger &Logger);

}

#endif
