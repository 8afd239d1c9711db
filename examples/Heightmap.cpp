// Copyright (c) 2020 Matthew J. Smith and Noisefield contributors
// License: MIT (http://opensource.org/licenses/MIT)

#include "Heightmap.hpp"

#include "support/CommandArgs.hpp"

#include <noisefield.hpp>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <string>
#include <vector>

using nfd::field;
using nfd::core::logger;
using support::command_args;
using support::command_args_parser;

namespace examples {

heightmap_options ParseHeightmapOptions(const std::vector<std::string> &Args) {

  command_args_parser CommandArgsParser("Heightmap [<options> ...]", "Generates a heightmap from "
    "fractal value noise and normalizes it to [0,1].");
  CommandArgsParser.AddIntOption("width", 'x', "Number of columns [ Default: 64 ]");
  CommandArgsParser.AddIntOption("height", 'y', "Number of rows [ Default: 64 ]");
  CommandArgsParser.AddIntOption("octaves", 'o', "Number of noise octaves [ Default: 5 ]");
  CommandArgsParser.AddIntOption("seed", 's', "Noise seed [ Default: 1 ]");
  CommandArgsParser.AddFlag("print", 'p', "Print the normalized heightmap");

  command_args CommandArgs = CommandArgsParser.Parse(Args);

  heightmap_options Options;
  Options.Width = CommandArgs.GetOptionValue<int>("width", Options.Width);
  Options.Height = CommandArgs.GetOptionValue<int>("height", Options.Height);
  Options.NumOctaves = CommandArgs.GetOptionValue<int>("octaves", Options.NumOctaves);
  Options.Seed = CommandArgs.GetOptionValue<int>("seed", Options.Seed);
  Options.Print = CommandArgs.GetOptionValue<bool>("print", Options.Print);
  Options.Help = CommandArgs.Help();

  return Options;

}

heightmap_options ParseHeightmapOptions(int argc, char **argv) {

  return ParseHeightmapOptions(std::vector<std::string>(argv, argv+argc));

}

namespace {

std::uint32_t HashLattice(int X, int Y, int Seed) {

  std::uint32_t Hash = std::uint32_t(Seed)*0x9e3779b9u;
  Hash ^= std::uint32_t(X)*0x85ebca6bu;
  Hash = (Hash << 13) | (Hash >> 19);
  Hash ^= std::uint32_t(Y)*0xc2b2ae35u;
  Hash ^= Hash >> 16;
  Hash *= 0x7feb352du;
  Hash ^= Hash >> 15;
  Hash *= 0x846ca68bu;
  Hash ^= Hash >> 16;

  return Hash;

}

// Lattice value in [-1,1]
float LatticeValue(int X, int Y, int Seed) {

  return float(HashLattice(X, Y, Seed) & 0xffffffu)/float(0x7fffff) - 1.f;

}

float Fade(float T) {

  return T*T*(3.f - 2.f*T);

}

float Lerp(float A, float B, float T) {

  return A + T*(B - A);

}

}

float ValueNoise(float X, float Y, int Seed) {

  float XFloor = std::floor(X);
  float YFloor = std::floor(Y);

  int I = int(XFloor);
  int J = int(YFloor);

  float U = Fade(X - XFloor);
  float V = Fade(Y - YFloor);

  float Lower = Lerp(LatticeValue(I, J, Seed), LatticeValue(I+1, J, Seed), U);
  float Upper = Lerp(LatticeValue(I, J+1, Seed), LatticeValue(I+1, J+1, Seed), U);

  return Lerp(Lower, Upper, V);

}

field GenerateHeightmap(const heightmap_options &Options, logger &Logger) {

  int Width = Options.Width;
  int Height = Options.Height;
  int Seed = Options.Seed;

  int NumOctaves = Options.NumOctaves;
  if (NumOctaves < 1) {
    Logger.LogWarning("Octave count %i is less than 1; using 1 octave.", NumOctaves);
    NumOctaves = 1;
  }

  Logger.LogStatus("Generating %ix%i heightmap with %i octaves...", Width, Height, NumOctaves);

  field Heightmap(Width, Height);

  // Lowest octave spans roughly four lattice cells across the longer side
  float BaseFrequency = 4.f/float(std::max(Width, Height));

  auto OctaveScope = Logger.BeginStatusScope();

  for (int j = 0; j < Height; ++j) {
    for (int i = 0; i < Width; ++i) {
      Heightmap.Set(i, j, 0.5f*ValueNoise(BaseFrequency*float(i), BaseFrequency*float(j), Seed));
    }
  }

  Logger.LogStatus("Octave 1 done.");

  float Frequency = BaseFrequency;
  float Amplitude = 0.5f;

  for (int iOctave = 1; iOctave < NumOctaves; ++iOctave) {
    Frequency *= 2.f;
    Amplitude *= 0.5f;
    int OctaveSeed = Seed + iOctave;
    Heightmap.ForEach([=](field &Field, int X, int Y, float) -> bool {
      Field.Add(X, Y, Amplitude*ValueNoise(Frequency*float(X), Frequency*float(Y), OctaveSeed));
      return nfd::VISIT_CONTINUE;
    });
    Logger.LogStatus("Octave %i done.", iOctave+1);
  }

  OctaveScope.End();

  float MinValue = nfd::core::FieldMin(Heightmap);
  float MaxValue = nfd::core::FieldMax(Heightmap);

  Logger.LogStatus("Raw value range is [%g,%g].", MinValue, MaxValue);

  Heightmap.Subtract(MinValue);
  if (MaxValue > MinValue) {
    Heightmap.Divide(MaxValue - MinValue);
  } else {
    Logger.LogWarning("Heightmap is flat; setting all cells to 0.");
    Heightmap.Set(0.f);
  }

  Logger.LogStatus("Normalized %s.", nfd::core::FormatNumber(Heightmap.Count(), "cells", "cell"));

  if (Options.Print) {
    nfd::core::PrintField(Heightmap);
  }

  Logger.LogStatus("Hash of normalized heightmap: %zu", Heightmap.Hash());

  return Heightmap;

}

}
