// Copyright (c) 2020 Matthew J. Smith and Noisefield contributors
// License: MIT (http://opensource.org/licenses/MIT)

#include "Heightmap.hpp"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "support/CommandArgs.hpp"

#include <noisefield.hpp>

#include <string>
#include <vector>

using examples::heightmap_options;
using examples::ParseHeightmapOptions;
using examples::GenerateHeightmap;
using nfd::core::logger;
using testing::Each;
using testing::AllOf;
using testing::Ge;
using testing::Le;
using testing::HasSubstr;

class ExampleTests : public testing::Test {
protected:
  static heightmap_options SmallOptions(int Seed) {
    heightmap_options Options;
    Options.Width = 16;
    Options.Height = 8;
    Options.NumOctaves = 3;
    Options.Seed = Seed;
    return Options;
  }
};

TEST_F(ExampleTests, HeightmapOptions) {

  heightmap_options Options = ParseHeightmapOptions({"Heightmap"});
  EXPECT_EQ(Options.Width, 64);
  EXPECT_EQ(Options.Height, 64);
  EXPECT_EQ(Options.NumOctaves, 5);
  EXPECT_EQ(Options.Seed, 1);
  EXPECT_FALSE(Options.Print);
  EXPECT_FALSE(Options.Help);

  Options = ParseHeightmapOptions({"Heightmap", "--width=8", "-y", "4", "-o2", "--seed=9", "-p"});
  EXPECT_EQ(Options.Width, 8);
  EXPECT_EQ(Options.Height, 4);
  EXPECT_EQ(Options.NumOctaves, 2);
  EXPECT_EQ(Options.Seed, 9);
  EXPECT_TRUE(Options.Print);

  EXPECT_THROW(ParseHeightmapOptions({"Heightmap", "--width=wide"}), support::command_args_error);
  EXPECT_THROW(ParseHeightmapOptions({"Heightmap", "--depth=3"}), support::command_args_error);

}

TEST_F(ExampleTests, HeightmapHelp) {

  testing::internal::CaptureStdout();
  heightmap_options Options = ParseHeightmapOptions({"Heightmap", "--help"});
  std::string Output = testing::internal::GetCapturedStdout();

  EXPECT_TRUE(Options.Help);
  EXPECT_THAT(Output, HasSubstr("Usage: Heightmap [<options> ...]\n"));
  EXPECT_THAT(Output, HasSubstr("--octaves <int>"));
  EXPECT_THAT(Output, HasSubstr("--print"));

}

TEST_F(ExampleTests, ValueNoiseRange) {

  for (int j = 0; j < 20; ++j) {
    for (int i = 0; i < 20; ++i) {
      float Value = examples::ValueNoise(0.37f*float(i), 0.29f*float(j), 5);
      EXPECT_GE(Value, -1.f);
      EXPECT_LE(Value, 1.f);
    }
  }

  EXPECT_EQ(examples::ValueNoise(1.5f, 2.5f, 3), examples::ValueNoise(1.5f, 2.5f, 3));

}

TEST_F(ExampleTests, HeightmapNormalized) {

  logger Logger(0);

  nfd::field Heightmap = GenerateHeightmap(SmallOptions(7), Logger);

  EXPECT_EQ(Heightmap.Width(), 16);
  EXPECT_EQ(Heightmap.Height(), 8);
  EXPECT_EQ(nfd::core::FieldMin(Heightmap), 0.f);
  EXPECT_EQ(nfd::core::FieldMax(Heightmap), 1.f);
  EXPECT_THAT(Heightmap, Each(AllOf(Ge(0.f), Le(1.f))));
  EXPECT_EQ(Logger.WarningCount(), 0);

}

TEST_F(ExampleTests, HeightmapDeterministic) {

  logger Logger(0);

  nfd::field First = GenerateHeightmap(SmallOptions(7), Logger);
  nfd::field Second = GenerateHeightmap(SmallOptions(7), Logger);
  nfd::field Other = GenerateHeightmap(SmallOptions(8), Logger);

  EXPECT_EQ(First, Second);
  EXPECT_EQ(First.Hash(), Second.Hash());
  EXPECT_NE(First, Other);

}

TEST_F(ExampleTests, HeightmapStatus) {

  logger Logger(2);

  heightmap_options Options = SmallOptions(7);
  Options.Print = true;

  testing::internal::CaptureStdout();
  GenerateHeightmap(Options, Logger);
  std::string Output = testing::internal::GetCapturedStdout();

  EXPECT_THAT(Output, HasSubstr("nfd :: Generating 16x8 heightmap with 3 octaves...\n"));
  EXPECT_THAT(Output, HasSubstr("nfd :: * Octave 3 done.\n"));
  EXPECT_THAT(Output, HasSubstr("nfd :: Normalized 128 cells.\n"));
  EXPECT_THAT(Output, HasSubstr("nfd :: Hash of normalized heightmap: "));
  EXPECT_EQ(Logger.StatusDepth(), 0);

}

TEST_F(ExampleTests, HeightmapFlat) {

  logger Logger(0);

  heightmap_options Options;
  Options.Width = 1;
  Options.Height = 1;

  testing::internal::CaptureStderr();
  nfd::field Heightmap = GenerateHeightmap(Options, Logger);
  EXPECT_EQ(testing::internal::GetCapturedStderr(),
    "nfd :: WARNING: Heightmap is flat; setting all cells to 0.\n");

  EXPECT_EQ(Logger.WarningCount(), 1);
  EXPECT_THAT(Heightmap, Each(0.f));

}

TEST_F(ExampleTests, HeightmapOctaveClamp) {

  logger Logger(0);

  heightmap_options Options = SmallOptions(7);
  Options.NumOctaves = 0;

  testing::internal::CaptureStderr();
  nfd::field Heightmap = GenerateHeightmap(Options, Logger);
  EXPECT_THAT(testing::internal::GetCapturedStderr(),
    HasSubstr("Octave count 0 is less than 1; using 1 octave."));

  Options.NumOctaves = 1;
  EXPECT_EQ(Heightmap, GenerateHeightmap(Options, Logger));

}
