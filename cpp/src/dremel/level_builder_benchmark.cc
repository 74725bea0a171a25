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
#include <vector>

#include "benchmark/benchmark.h"
#include "dremel/level_builder.h"
#include "dremel/nested.h"
#include "dremel/testing/random.h"
#include "dremel/util/logging.h"

namespace dremel {

constexpr int64_t kNumRows = 4096;
constexpr uint32_t kSeed = 0xD2E3;

static void BenchmarkLevels(::benchmark::State& state, bool recursive) {
  const int depth = static_cast<int>(state.range(0));
  const double null_probability = static_cast<double>(state.range(1)) / 100;
  random::NestedPathGenerator generator(kSeed);
  auto owned = generator.Generate(depth, kNumRows, null_probability);
  const int64_t num_values = NumValues(owned->path);

  std::vector<int16_t> def_levels;
  std::vector<int16_t> rep_levels;
  for (auto _ : state) {
    Status st = recursive ? ComputeLevelsRecursive(owned->path, &def_levels, &rep_levels)
                          : ComputeLevels(owned->path, &def_levels, &rep_levels);
    DREMEL_CHECK_OK(st);
    ::benchmark::DoNotOptimize(def_levels.data());
    ::benchmark::DoNotOptimize(rep_levels.data());
  }
  state.SetItemsProcessed(state.iterations() * num_values);
}

static void BM_ComputeLevelsStreaming(::benchmark::State& state) {
  BenchmarkLevels(state, /*recursive=*/false);
}

static void BM_ComputeLevelsRecursive(::benchmark::State& state) {
  BenchmarkLevels(state, /*recursive=*/true);
}

static void LevelArgs(::benchmark::internal::Benchmark* bench) {
  bench->ArgNames({"depth", "null_percent"});
  for (int depth : {2, 4, 6}) {
    for (int null_percent : {0, 10, 50}) {
      bench->Args({depth, null_percent});
    }
  }
}

static void BM_NestedLevelIteratorNext(::benchmark::State& state) {
  random::NestedPathGenerator generator(kSeed);
  auto owned = generator.Generate(/*depth=*/4, kNumRows, /*null_probability=*/0.1);

  int64_t produced = 0;
  for (auto _ : state) {
    auto maybe_it = NestedLevelIterator::Make(owned->path);
    DREMEL_CHECK_OK(maybe_it.status());
    NestedLevelIterator it = maybe_it.MoveValueUnsafe();
    int16_t def = 0;
    int16_t rep = 0;
    while (it.Next(&def, &rep)) {
      ::benchmark::DoNotOptimize(def);
      ::benchmark::DoNotOptimize(rep);
      ++produced;
    }
  }
  state.SetItemsProcessed(produced);
}

BENCHMARK(BM_ComputeLevelsStreaming)->Apply(LevelArgs);
BENCHMARK(BM_ComputeLevelsRecursive)->Apply(LevelArgs);
BENCHMARK(BM_NestedLevelIteratorNext);

}  // namespace dremel
