// Copyright (c) 2019 Matthew J. Smith and Noisefield contributors
// License: MIT (http://opensource.org/licenses/MIT)

#include <nfd/core/Field.hpp>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include <nfd/core/Global.hpp>

#include <functional>
#include <tuple>
#include <vector>

using testing::ElementsAre;
using testing::ElementsAreArray;

class FieldIterationTests : public testing::Test {};

namespace {

struct visit {
  int X;
  int Y;
  float Value;
  friend bool operator==(const visit &Left, const visit &Right) {
    return Left.X == Right.X && Left.Y == Right.Y && Left.Value == Right.Value;
  }
};

nfd::field MakeSequentialField(int Width, int Height) {
  nfd::field Field(Width, Height);
  for (int iCell = 0; iCell < Field.Count(); ++iCell) {
    Field[iCell] = float(iCell);
  }
  return Field;
}

}

TEST_F(FieldIterationTests, All) {

  nfd::field Field = MakeSequentialField(3, 2);

  std::vector<visit> Visits;
  Field.ForEach([&](nfd::field &VisitedField, int X, int Y, float Value) -> bool {
    EXPECT_EQ(&VisitedField, &Field);
    Visits.push_back({X, Y, Value});
    return nfd::VISIT_CONTINUE;
  });

  std::vector<visit> ExpectedVisits = {
    {0, 0, 0.f}, {1, 0, 1.f}, {2, 0, 2.f},
    {0, 1, 3.f}, {1, 1, 4.f}, {2, 1, 5.f}
  };
  EXPECT_THAT(Visits, ElementsAreArray(ExpectedVisits));

}

TEST_F(FieldIterationTests, EarlyExit) {

  nfd::field Field = MakeSequentialField(5, 4);

  for (int StopIndex = 0; StopIndex < Field.Count(); ++StopIndex) {
    int NumCalls = 0;
    Field.ForEach([&](nfd::field &, int X, int Y, float) -> bool {
      ++NumCalls;
      return Field.ToIndex(X, Y) == StopIndex ? nfd::VISIT_STOP : nfd::VISIT_CONTINUE;
    });
    EXPECT_EQ(NumCalls, StopIndex+1);
  }

  // Stopping on the first cell of a large field
  nfd::field LargeField(1000, 1000);
  int NumCalls = 0;
  LargeField.ForEach([&](nfd::field &, int, int, float) -> bool {
    ++NumCalls;
    return nfd::VISIT_STOP;
  });
  EXPECT_EQ(NumCalls, 1);

}

TEST_F(FieldIterationTests, From) {

  nfd::field Field = MakeSequentialField(3, 2);

  std::vector<int> Indices;
  Field.ForEach([&](nfd::field &VisitedField, int X, int Y, float) -> bool {
    Indices.push_back(VisitedField.ToIndex(X, Y));
    return nfd::VISIT_CONTINUE;
  }, 2, 0);
  EXPECT_THAT(Indices, ElementsAre(2, 3, 4, 5));

  Indices.clear();
  Field.ForEach([&](nfd::field &VisitedField, int X, int Y, float) -> bool {
    Indices.push_back(VisitedField.ToIndex(X, Y));
    return nfd::VISIT_CONTINUE;
  }, 0, 0);
  EXPECT_THAT(Indices, ElementsAre(0, 1, 2, 3, 4, 5));

  Indices.clear();
  Field.ForEach([&](nfd::field &VisitedField, int X, int Y, float) -> bool {
    Indices.push_back(VisitedField.ToIndex(X, Y));
    return Indices.size() == 2 ? nfd::VISIT_STOP : nfd::VISIT_CONTINUE;
  }, 1, 1);
  EXPECT_THAT(Indices, ElementsAre(4, 5));

}

TEST_F(FieldIterationTests, Range) {

  nfd::field Field = MakeSequentialField(3, 2);

  std::vector<visit> Visits;
  Field.ForEach([&](nfd::field &, int X, int Y, float Value) -> bool {
    Visits.push_back({X, Y, Value});
    return nfd::VISIT_CONTINUE;
  }, 1, 0, 2, 1);

  // Linear indices [1,5)
  std::vector<visit> ExpectedVisits = {
    {1, 0, 1.f}, {2, 0, 2.f}, {0, 1, 3.f}, {1, 1, 4.f}
  };
  EXPECT_THAT(Visits, ElementsAreArray(ExpectedVisits));

  // Range covering the whole field
  int NumCalls = 0;
  Field.ForEach([&](nfd::field &, int, int, float) -> bool {
    ++NumCalls;
    return nfd::VISIT_CONTINUE;
  }, 0, 0, 0, 2);
  EXPECT_EQ(NumCalls, 6);

  // Early exit inside a range
  NumCalls = 0;
  Field.ForEach([&](nfd::field &, int, int, float Value) -> bool {
    ++NumCalls;
    return Value == 2.f ? nfd::VISIT_STOP : nfd::VISIT_CONTINUE;
  }, 1, 0, 2, 1);
  EXPECT_EQ(NumCalls, 2);

}

TEST_F(FieldIterationTests, EmptyAndReversedRange) {

  nfd::field Field = MakeSequentialField(3, 2);

  int NumCalls = 0;
  auto CountCalls = [&](nfd::field &, int, int, float) -> bool {
    ++NumCalls;
    return nfd::VISIT_CONTINUE;
  };

  Field.ForEach(CountCalls, 1, 1, 1, 1);
  EXPECT_EQ(NumCalls, 0);

  Field.ForEach(CountCalls, 2, 1, 1, 0);
  EXPECT_EQ(NumCalls, 0);

  // From past the end of the field
  Field.ForEach(CountCalls, 0, 2);
  EXPECT_EQ(NumCalls, 0);

}

TEST_F(FieldIterationTests, Mutate) {

  nfd::field Field(3, 2);

  Field.ForEach([](nfd::field &VisitedField, int X, int Y, float) -> bool {
    VisitedField.Set(X, Y, float(10*Y + X));
    return nfd::VISIT_CONTINUE;
  });
  EXPECT_THAT(Field, ElementsAre(0.f, 1.f, 2.f, 10.f, 11.f, 12.f));

  // Cells after the stop are untouched
  Field.ForEach([](nfd::field &VisitedField, int X, int Y, float Value) -> bool {
    VisitedField.Set(X, Y, -Value);
    return X == 1 && Y == 0 ? nfd::VISIT_STOP : nfd::VISIT_CONTINUE;
  });
  EXPECT_THAT(Field, ElementsAre(-0.f, -1.f, 2.f, 10.f, 11.f, 12.f));

}

TEST_F(FieldIterationTests, Const) {

  const nfd::field Field = MakeSequentialField(2, 2);

  float Sum = 0.f;
  Field.ForEach([&](const nfd::field &, int, int, float Value) -> bool {
    Sum += Value;
    return nfd::VISIT_CONTINUE;
  });
  EXPECT_EQ(Sum, 6.f);

  std::vector<int> Indices;
  Field.ForEach([&](const nfd::field &VisitedField, int X, int Y, float) -> bool {
    Indices.push_back(VisitedField.ToIndex(X, Y));
    return nfd::VISIT_CONTINUE;
  }, 1, 0, 1, 1);
  EXPECT_THAT(Indices, ElementsAre(1, 2));

  Indices.clear();
  Field.ForEach([&](const nfd::field &VisitedField, int X, int Y, float) -> bool {
    Indices.push_back(VisitedField.ToIndex(X, Y));
    return nfd::VISIT_CONTINUE;
  }, 0, 1);
  EXPECT_THAT(Indices, ElementsAre(2, 3));

}

TEST_F(FieldIterationTests, TypeErasedVisitor) {

  nfd::field Field = MakeSequentialField(4, 1);

  int NumCalls = 0;
  nfd::field_visitor Visitor = [&](const nfd::field &, int, int, float Value) -> bool {
    ++NumCalls;
    return Value >= 2.f;
  };

  Field.ForEach(Visitor);
  EXPECT_EQ(NumCalls, 3);

  const nfd::field &FieldRef = Field;
  NumCalls = 0;
  FieldRef.ForEach(Visitor, 1, 0);
  EXPECT_EQ(NumCalls, 2);

}

TEST_F(FieldIterationTests, VisitResultConstants) {

  EXPECT_TRUE(nfd::VISIT_STOP);
  EXPECT_FALSE(nfd::VISIT_CONTINUE);

}

#if NFD_DEBUG
TEST_F(FieldIterationTests, OutOfRangeDeathTest) {

  nfd::field Field(3, 2);

  auto Visitor = [](nfd::field &, int, int, float) -> bool { return nfd::VISIT_CONTINUE; };

  EXPECT_DEATH(Field.ForEach(Visitor, 0, 0, 0, 3), "out of bounds");
  EXPECT_DEATH(Field.ForEach(Visitor, -1, 0, 2, 0), "out of bounds");

}
#endif
