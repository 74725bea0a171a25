// Licensed to the Apache Software Foundation (ASF) under one
// or more contributor license agreements.  See the NOTICE file
// distributed with this work for additional information
// regarding copyright ownership.  The ASF licenses this file
// to you under the Apache License, Version 2.0 (the
// "License"); you may not use this file except in compliance
// with the License.  You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing,
// software distributed under the License is distributed on an
// "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
// KIND, either express or implied.  See the License for the
// specific language governing permissions and limitations
// under the License.

#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "dremel/level_builder.h"
#include "dremel/nested.h"
#include "dremel/properties.h"
#include "dremel/testing/gtest_util.h"
#include "dremel/testing/nested_builder.h"
#include "dremel/testing/random.h"

namespace dremel {

namespace {

// [[0, 1], [], [2, 0, 3], [4, 5, 6], [], [7, 8, 9], [], [10]]
const std::vector<int32_t> kEightRows = {0, 2, 2, 5, 8, 8, 11, 11, 12};
const std::vector<bool> kEightRowsValidity = {true,  false, true,  true,
                                              true,  true,  false, true};
const std::vector<int16_t> kEightRowsRep = {0, 1, 0, 0, 1, 1, 0, 1, 1, 0, 0, 1, 1, 0, 0};

// Struct validity with slot 3 null
const std::vector<bool> kTwelveOneNull = {true, true, true, false, true, true,
                                          true, true, true, true,  true, true};

Status ComputeWith(LevelAlgorithm algorithm, const NestedPath& path,
                   std::vector<int16_t>* def_levels, std::vector<int16_t>* rep_levels) {
  switch (algorithm) {
    case LevelAlgorithm::kStreaming:
      return ComputeLevels(path, def_levels, rep_levels);
    case LevelAlgorithm::kRecursive:
      return ComputeLevelsRecursive(path, def_levels, rep_levels);
  }
  return Status::NotImplemented("unknown level algorithm");
}

}  // namespace

class TestLevelBuilder : public ::testing::TestWithParam<LevelAlgorithm> {
 protected:
  void CheckLevels(const NestedPath& path, const std::vector<int16_t>& expected_def,
                   const std::vector<int16_t>& expected_rep) {
    ASSERT_EQ(expected_def.size(), expected_rep.size());
    ASSERT_EQ(NumValues(path), static_cast<int64_t>(expected_def.size()));

    std::vector<int16_t> def_levels;
    std::vector<int16_t> rep_levels;
    ASSERT_OK(ComputeWith(GetParam(), path, &def_levels, &rep_levels));
    ASSERT_EQ(def_levels, expected_def);
    ASSERT_EQ(rep_levels, expected_rep);
  }
};

TEST_P(TestLevelBuilder, StructOptional) {
  NestedPathBuilder builder;
  builder.Struct(true, 10).Primitive(
      true, 10, {true, false, true, true, false, true, false, false, true, true});
  CheckLevels(builder.path(), {2, 1, 2, 2, 1, 2, 1, 1, 2, 2},
              std::vector<int16_t>(10, 0));
}

TEST_P(TestLevelBuilder, StructWithoutNulls) {
  {
    NestedPathBuilder builder;
    builder.Struct(true, 10).Primitive(true, 10);
    CheckLevels(builder.path(), std::vector<int16_t>(10, 2), std::vector<int16_t>(10, 0));
  }
  {
    NestedPathBuilder builder;
    builder.Struct(false, 10).Primitive(true, 10);
    CheckLevels(builder.path(), std::vector<int16_t>(10, 1), std::vector<int16_t>(10, 0));
  }
}

TEST_P(TestLevelBuilder, NestedStructs) {
  NestedPathBuilder builder;
  builder.Struct(true, 3, {true, false, true})
      .Struct(true, 3, {true, true, false})
      .Primitive(true, 3, {false, true, true});
  CheckLevels(builder.path(), {2, 0, 1}, {0, 0, 0});
}

TEST_P(TestLevelBuilder, ListWithoutNulls) {
  NestedPathBuilder builder;
  builder.List(true, {0, 2}).Primitive(true, 2);
  CheckLevels(builder.path(), {3, 3}, {0, 1});
}

TEST_P(TestLevelBuilder, RequiredList) {
  NestedPathBuilder builder;
  builder.List(false, kEightRows).Primitive(false, 12);
  CheckLevels(builder.path(), {1, 1, 0, 1, 1, 1, 1, 1, 1, 0, 1, 1, 1, 0, 1},
              kEightRowsRep);
}

TEST_P(TestLevelBuilder, OptionalList) {
  // [[0, 1], None, [2, None, 3], [4, 5, 6], [], [7, 8, 9], None, [10]]
  NestedPathBuilder builder;
  builder.List(true, kEightRows, kEightRowsValidity)
      .Primitive(true, 12, {true, true, true, false, true, true, true, true, true, true,
                            true, true});
  CheckLevels(builder.path(), {3, 3, 0, 3, 2, 3, 3, 3, 3, 1, 3, 3, 3, 0, 3},
              kEightRowsRep);
}

TEST_P(TestLevelBuilder, TwoLevelRequired) {
  // [[[1, 2, 3], [4, 5, 6, 7]], [[8], [9, 10]]]
  NestedPathBuilder builder;
  builder.List(false, {0, 2, 4}).List(false, {0, 3, 7, 8, 10}).Primitive(false, 10);
  CheckLevels(builder.path(), std::vector<int16_t>(10, 2), {0, 2, 2, 1, 2, 2, 2, 0, 1, 2});
}

TEST_P(TestLevelBuilder, TwoLevelWithEmptyOuterRow) {
  NestedPathBuilder builder;
  builder.List(false, {0, 2, 2, 4}).List(false, {0, 3, 7, 8, 10}).Primitive(false, 10);
  CheckLevels(builder.path(), {2, 2, 2, 2, 2, 2, 2, 0, 2, 2, 2},
              {0, 2, 2, 1, 2, 2, 2, 0, 0, 1, 2});
}

TEST_P(TestLevelBuilder, TwoLevelOptionalRequiredRequired) {
  // [[[1, 2, 3], [4, 5, 6, 7]], None, [], [[8], [], [9, 10]]]
  NestedPathBuilder builder;
  builder.List(true, {0, 2, 2, 2, 5}, {true, false, true, true})
      .List(false, {0, 3, 7, 8, 8, 10})
      .Primitive(false, 10);
  CheckLevels(builder.path(), {3, 3, 3, 3, 3, 3, 3, 0, 1, 3, 2, 3, 3},
              {0, 2, 2, 1, 2, 2, 2, 0, 0, 0, 1, 1, 2});
}

TEST_P(TestLevelBuilder, TwoLevelOptionalOptionalRequired) {
  // [[[1, 2, 3], [4, 5, 6, 7]], None, [[8], [], None]]
  NestedPathBuilder builder;
  builder.List(true, {0, 2, 2, 5}, {true, false, true})
      .List(true, {0, 3, 7, 8, 8, 8}, {true, true, true, true, false})
      .Primitive(false, 8);
  CheckLevels(builder.path(), {4, 4, 4, 4, 4, 4, 4, 0, 4, 3, 2},
              {0, 2, 2, 1, 2, 2, 2, 0, 0, 1, 1});
}

TEST_P(TestLevelBuilder, TwoLevelAllOptional) {
  // [[[1, 2, 3], [4, None, 6, 7]], None, [[8], None]]
  NestedPathBuilder builder;
  builder.List(true, {0, 2, 2, 4}, {true, false, true})
      .List(true, {0, 3, 7, 8, 8}, {true, true, true, false})
      .Primitive(true, 8, {true, true, true, true, false, true, true, true});
  CheckLevels(builder.path(), {5, 5, 5, 5, 4, 5, 5, 0, 5, 2},
              {0, 2, 2, 1, 2, 2, 2, 0, 0, 1});
}

TEST_P(TestLevelBuilder, TwoLevelMixedRuns) {
  NestedPathBuilder builder;
  builder.List(false, {0, 1, 1, 3, 5, 5, 8, 8, 9})
      .List(false, {0, 2, 4, 5, 7, 8, 9, 10, 11, 12})
      .Primitive(false, 12);
  CheckLevels(builder.path(), {2, 2, 0, 2, 2, 2, 2, 2, 2, 0, 2, 2, 2, 0, 2},
              {0, 2, 0, 0, 2, 1, 0, 2, 1, 0, 0, 1, 1, 0, 0});
}

TEST_P(TestLevelBuilder, ListOfStructs) {
  {
    NestedPathBuilder builder;
    builder.List(true, {0, 1, 2}).Struct(true, 2).Primitive(true, 2);
    CheckLevels(builder.path(), {4, 4}, {0, 0});
  }
  {
    // [{"a": "a"}, {"a": "b"}], None, [{"a": "b"}, None, {"a": "b"}],
    // [{"a": None}, {"a": None}, {"a": None}], [], [{"a": "d"}, ...], None, [{"a": "e"}]
    NestedPathBuilder builder;
    builder.List(true, kEightRows, kEightRowsValidity)
        .Struct(true, 12, kTwelveOneNull)
        .Primitive(true, 12, {true, true, true, false, true, false, false, false, true,
                              true, true, true});
    CheckLevels(builder.path(), {4, 4, 0, 4, 2, 4, 3, 3, 3, 1, 4, 4, 4, 0, 4},
                kEightRowsRep);
  }
  {
    NestedPathBuilder builder;
    builder.List(true, {0, 1, 1}, {true, false}).Struct(true, 1).Primitive(true, 1);
    CheckLevels(builder.path(), {4, 0}, {0, 0});
  }
}

TEST_P(TestLevelBuilder, StructOfLists) {
  {
    NestedPathBuilder builder;
    builder.Struct(true, 8)
        .List(true, kEightRows, kEightRowsValidity)
        .Primitive(true, 12, kTwelveOneNull);
    CheckLevels(builder.path(), {4, 4, 1, 4, 3, 4, 4, 4, 4, 2, 4, 4, 4, 1, 4},
                kEightRowsRep);
  }
  {
    NestedPathBuilder builder;
    builder.Struct(true, 3).List(true, {0, 1, 1, 1}, {true, true, false}).Primitive(true, 1);
    CheckLevels(builder.path(), {4, 2, 1}, {0, 0, 0});
  }
  {
    // {"f1": ["a", "b", None, "c"]}
    NestedPathBuilder builder;
    builder.Struct(true, 1).List(true, {0, 4}).Primitive(true, 4);
    CheckLevels(builder.path(), {4, 4, 4, 4}, {0, 1, 1, 1});
  }
}

TEST_P(TestLevelBuilder, ListStructList) {
  {
    NestedPathBuilder builder;
    builder.List(true, {0, 2, 3})
        .Struct(true, 3)
        .List(true, {0, 3, 6, 7})
        .Primitive(true, 7);
    CheckLevels(builder.path(), std::vector<int16_t>(7, 6), {0, 2, 2, 1, 2, 2, 0});
  }
  {
    // [[{"a": ["b"]}, None]]
    NestedPathBuilder builder;
    builder.List(true, {0, 2}, {true})
        .Struct(true, 2, {true, false})
        .List(true, {0, 1, 1}, {true, false})
        .Primitive(true, 1, {true});
    CheckLevels(builder.path(), {6, 2}, {0, 1});
  }
  {
    // [{"a": ["a"]}, {"a": ["b"]}], None, [{"a": ["b"]}, None, {"a": ["b"]}],
    // [{"a": None}, {"a": None}, {"a": None}], [],
    // [{"a": ["d"]}, {"a": [None]}, {"a": ["c", "d"]}], None, [{"a": []}]
    NestedPathBuilder builder;
    builder.List(true, kEightRows, kEightRowsValidity)
        .Struct(true, 12, kTwelveOneNull)
        .List(true, {0, 1, 2, 3, 3, 4, 4, 4, 4, 5, 6, 8, 8},
              {true, true, true, false, true, false, false, false, true, true, true, true})
        .Primitive(true, 8, {true, true, true, true, true, false, true, true});
    CheckLevels(builder.path(), {6, 6, 0, 6, 2, 6, 3, 3, 3, 1, 6, 5, 6, 6, 0, 4},
                {0, 1, 0, 0, 1, 1, 0, 1, 1, 0, 0, 1, 1, 2, 0, 0});
  }
  {
    // Same shape without nulls, the inner lists of rows 3 and 7 are empty
    NestedPathBuilder builder;
    builder.List(true, kEightRows)
        .Struct(true, 12)
        .List(true, {0, 1, 2, 3, 3, 4, 4, 4, 4, 5, 6, 8, 8})
        .Primitive(true, 8);
    CheckLevels(builder.path(), {6, 6, 1, 6, 4, 6, 4, 4, 4, 1, 6, 6, 6, 6, 1, 4},
                {0, 1, 0, 0, 1, 1, 0, 1, 1, 0, 0, 1, 1, 2, 0, 0});
  }
  {
    NestedPathBuilder builder;
    builder.List(true, {0, 1}).Struct(true, 1).List(true, {0, 0}).Primitive(true, 0);
    CheckLevels(builder.path(), {4}, {0});
  }
  {
    NestedPathBuilder builder;
    builder.List(true, {0, 1, 1}).Struct(true, 1).List(true, {0, 0}).Primitive(true, 0);
    CheckLevels(builder.path(), {4, 1}, {0, 0});
  }
}

TEST_P(TestLevelBuilder, FixedSizeLists) {
  {
    NestedPathBuilder builder;
    builder.FixedSizeList(false, 2, 3).Primitive(true, 6,
                                                 {true, false, true, true, false, true});
    CheckLevels(builder.path(), {2, 1, 2, 2, 1, 2}, {0, 1, 0, 1, 0, 1});
  }
  {
    NestedPathBuilder builder;
    builder.FixedSizeList(true, 1, 4, {true, false, true, true})
        .Primitive(true, 4, {true, true, true, false});
    CheckLevels(builder.path(), {3, 0, 3, 2}, {0, 0, 0, 0});
  }
  {
    // Zero width: every slot is an empty run
    NestedPathBuilder builder;
    builder.FixedSizeList(true, 0, 3, {true, false, true}).Primitive(false, 0);
    CheckLevels(builder.path(), {1, 0, 1}, {0, 0, 0});
  }
  {
    NestedPathBuilder builder;
    builder.List(true, {0, 2, 2, 3}, {true, false, true})
        .FixedSizeList(true, 2, 3)
        .Primitive(true, 6, {true, true, false, true, true, true});
    CheckLevels(builder.path(), {5, 5, 4, 5, 0, 5, 5}, {0, 2, 1, 2, 0, 0, 2});
  }
  {
    NestedPathBuilder builder;
    builder.FixedSizeList(false, 2, 2)
        .List(true, {0, 2, 2, 3, 3}, {true, true, true, false})
        .Primitive(false, 3);
    CheckLevels(builder.path(), {3, 3, 2, 3, 1}, {0, 2, 1, 0, 1});
  }
}

TEST_P(TestLevelBuilder, LargeList) {
  NestedPathBuilder builder;
  builder.LargeList(true, {0, 3, 3, 4}, {true, true, false})
      .Primitive(true, 4, {true, false, true, true});
  CheckLevels(builder.path(), {3, 2, 3, 1, 0}, {0, 1, 1, 0, 0});
}

TEST_P(TestLevelBuilder, NullSlotsOverChildren) {
  {
    // Positions beneath a null fixed-size list report the null's level
    NestedPathBuilder builder;
    builder.FixedSizeList(true, 2, 3, {true, false, true})
        .Primitive(true, 6, {true, true, true, false, false, true});
    CheckLevels(builder.path(), {3, 3, 0, 0, 2, 3}, {0, 1, 0, 1, 0, 1});
  }
  {
    NestedPathBuilder builder;
    builder.Struct(true, 2, {true, false}).List(true, {0, 1, 3}).Primitive(true, 3);
    CheckLevels(builder.path(), {4, 0, 0}, {0, 0, 1});
  }
  {
    NestedPathBuilder builder;
    builder.List(true, {0, 2, 3}, {false, true}).Primitive(true, 3);
    CheckLevels(builder.path(), {0, 0, 3}, {0, 1, 0});
  }
  {
    NestedPathBuilder builder;
    builder.List(true, {0, 2}, {false}).List(false, {0, 0, 0}).Primitive(false, 0);
    CheckLevels(builder.path(), {0, 0}, {0, 1});
  }
}

TEST_P(TestLevelBuilder, PrimitiveOnly) {
  {
    NestedPathBuilder builder;
    builder.Primitive(true, 4, {true, false, false, true});
    CheckLevels(builder.path(), {1, 0, 0, 1}, {0, 0, 0, 0});
  }
  {
    NestedPathBuilder builder;
    builder.Primitive(false, 3);
    CheckLevels(builder.path(), {0, 0, 0}, {0, 0, 0});
  }
}

TEST_P(TestLevelBuilder, ZeroLengthRoot) {
  {
    NestedPathBuilder builder;
    builder.List(true, {0}).Struct(true, 0).Primitive(true, 0);
    CheckLevels(builder.path(), {}, {});
  }
  {
    NestedPathBuilder builder;
    builder.Primitive(true, 0);
    CheckLevels(builder.path(), {}, {});
  }
}

TEST_P(TestLevelBuilder, InvalidPathClearsOutput) {
  NestedPathBuilder builder;
  builder.List(false, {0, 2, 1}).Primitive(false, 1);
  std::vector<int16_t> def_levels = {9, 9};
  std::vector<int16_t> rep_levels = {9};
  ASSERT_RAISES(Invalid, ComputeWith(GetParam(), builder.path(), &def_levels, &rep_levels));
  ASSERT_TRUE(def_levels.empty());
  ASSERT_TRUE(rep_levels.empty());
}

TEST_P(TestLevelBuilder, RandomPathsMatchInvariants) {
  random::NestedPathGenerator generator(/*seed=*/0x5EED);
  for (int depth = 1; depth <= 7; ++depth) {
    for (int trial = 0; trial < 20; ++trial) {
      auto owned = generator.Generate(depth, /*length=*/trial * 3, /*null_probability=*/0.25);
      const NestedPath& path = owned->path;
      ASSERT_OK(ValidateNestedPath(path));

      std::vector<int16_t> def_levels;
      std::vector<int16_t> rep_levels;
      ASSERT_OK(ComputeWith(GetParam(), path, &def_levels, &rep_levels));
      ASSERT_EQ(static_cast<int64_t>(def_levels.size()), NumValues(path));
      ASSERT_EQ(def_levels.size(), rep_levels.size());

      const int16_t max_def = MaxDefinitionLevel(path);
      const int16_t max_rep = MaxRepetitionLevel(path);
      int64_t rows = 0;
      for (size_t i = 0; i < def_levels.size(); ++i) {
        ASSERT_GE(def_levels[i], 0);
        ASSERT_LE(def_levels[i], max_def);
        ASSERT_GE(rep_levels[i], 0);
        ASSERT_LE(rep_levels[i], max_rep);
        rows += rep_levels[i] == 0;
      }
      // Every top-level slot starts exactly one record
      ASSERT_EQ(rows, path[0].length()) << "depth " << depth << " trial " << trial;
      if (!rep_levels.empty()) {
        ASSERT_EQ(rep_levels[0], 0);
      }
    }
  }
}

INSTANTIATE_TEST_SUITE_P(
    LevelAlgorithms, TestLevelBuilder,
    ::testing::Values(LevelAlgorithm::kStreaming, LevelAlgorithm::kRecursive),
    [](const ::testing::TestParamInfo<LevelAlgorithm>& info) {
      return std::string(LevelAlgorithmToString(info.param));
    });

TEST(TestLevelAlgorithms, StreamingMatchesRecursive) {
  random::NestedPathGenerator generator(/*seed=*/42);
  for (int trial = 0; trial < 500; ++trial) {
    const int depth = 1 + trial % 6;
    const double null_probability = (trial % 5) * 0.2;
    auto owned = generator.Generate(depth, /*length=*/1 + trial % 17, null_probability,
                                    /*empty_probability=*/0.2, /*max_run_length=*/5);

    std::vector<int16_t> streaming_def, streaming_rep;
    std::vector<int16_t> recursive_def, recursive_rep;
    ASSERT_OK(ComputeLevels(owned->path, &streaming_def, &streaming_rep));
    ASSERT_OK(ComputeLevelsRecursive(owned->path, &recursive_def, &recursive_rep));
    ASSERT_EQ(streaming_def, recursive_def) << "trial " << trial;
    ASSERT_EQ(streaming_rep, recursive_rep) << "trial " << trial;
  }
}

TEST(TestNestedLevelIterator, RemainingCountsDown) {
  NestedPathBuilder builder;
  builder.List(true, kEightRows, kEightRowsValidity)
      .Primitive(true, 12, {true, true, true, false, true, true, true, true, true, true,
                            true, true});
  ASSERT_OK_AND_ASSIGN(auto it, NestedLevelIterator::Make(builder.path()));
  ASSERT_EQ(it.max_definition_level(), 3);
  ASSERT_EQ(it.max_repetition_level(), 1);
  ASSERT_EQ(it.remaining(), 15);

  const std::vector<int16_t> expected_def = {3, 3, 0, 3, 2, 3, 3, 3, 3, 1, 3, 3, 3, 0, 3};
  int16_t def = -1;
  int16_t rep = -1;
  for (int64_t i = 0; i < 15; ++i) {
    ASSERT_TRUE(it.Next(&def, &rep));
    ASSERT_EQ(def, expected_def[i]);
    ASSERT_EQ(rep, kEightRowsRep[i]);
    ASSERT_EQ(it.remaining(), 14 - i);
  }
  ASSERT_FALSE(it.Next(&def, &rep));
  ASSERT_FALSE(it.Next(&def, &rep));
  ASSERT_EQ(it.remaining(), 0);
}

TEST(TestNestedLevelIterator, IndependentCopies) {
  NestedPathBuilder builder;
  builder.List(false, kEightRows).Primitive(false, 12);
  ASSERT_OK_AND_ASSIGN(auto first, NestedLevelIterator::Make(builder.path()));
  int16_t def = 0;
  int16_t rep = 0;
  ASSERT_TRUE(first.Next(&def, &rep));
  ASSERT_TRUE(first.Next(&def, &rep));

  NestedLevelIterator second = first;
  ASSERT_TRUE(first.Next(&def, &rep));
  ASSERT_EQ(first.remaining(), 12);
  ASSERT_EQ(second.remaining(), 13);
  ASSERT_TRUE(second.Next(&def, &rep));
  ASSERT_EQ(def, 0);
  ASSERT_EQ(rep, 0);
}

TEST(TestNestedLevelIterator, InvalidPath) {
  NestedPathBuilder builder;
  builder.List(false, {0, 2, 1}).Primitive(false, 1);
  ASSERT_RAISES(Invalid, NestedLevelIterator::Make(builder.path()));
}

TEST(TestNestedLevelIterator, ConcurrentColumns) {
  constexpr int kNumColumns = 8;
  random::NestedPathGenerator generator(/*seed=*/7);
  std::vector<std::unique_ptr<random::OwnedNestedPath>> columns;
  std::vector<std::vector<int16_t>> expected_def(kNumColumns), expected_rep(kNumColumns);
  for (int i = 0; i < kNumColumns; ++i) {
    columns.push_back(generator.Generate(/*depth=*/2 + i % 4, /*length=*/2000,
                                         /*null_probability=*/0.1));
    ASSERT_OK(ComputeLevelsRecursive(columns[i]->path, &expected_def[i], &expected_rep[i]));
  }

  std::vector<std::vector<int16_t>> actual_def(kNumColumns), actual_rep(kNumColumns);
  std::vector<Status> statuses(kNumColumns);
  std::vector<std::thread> threads;
  for (int i = 0; i < kNumColumns; ++i) {
    threads.emplace_back([&, i] {
      statuses[i] = ComputeLevels(columns[i]->path, &actual_def[i], &actual_rep[i]);
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  for (int i = 0; i < kNumColumns; ++i) {
    ASSERT_OK(statuses[i]);
    ASSERT_EQ(actual_def[i], expected_def[i]) << "column " << i;
    ASSERT_EQ(actual_rep[i], expected_rep[i]) << "column " << i;
  }
}

}  // namespace dremel
