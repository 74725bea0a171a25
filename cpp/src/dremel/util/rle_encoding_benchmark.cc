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

#include <algorithm>
#include <cstdint>
#include <random>
#include <vector>

#include "benchmark/benchmark.h"
#include "dremel/io/memory.h"
#include "dremel/util/logging.h"
#include "dremel/util/rle_encoding.h"

namespace dremel {
namespace util {

constexpr int64_t kNumValues = 1 << 16;

// Values drawn from [0, 2^bit_width) in runs whose mean length is `mean_run`.
static std::vector<uint32_t> MakeRuns(int bit_width, int mean_run) {
  std::default_random_engine rng(42);
  std::uniform_int_distribution<uint32_t> value_dist(
      0, bit_width == 32 ? 0xFFFFFFFFU : (1U << bit_width) - 1);
  std::geometric_distribution<int> run_dist(1.0 / mean_run);
  std::vector<uint32_t> values;
  values.reserve(kNumValues);
  while (static_cast<int64_t>(values.size()) < kNumValues) {
    const uint32_t value = value_dist(rng);
    const int64_t run = std::min<int64_t>(run_dist(rng) + 1,
                                          kNumValues - static_cast<int64_t>(values.size()));
    values.insert(values.end(), static_cast<size_t>(run), value);
  }
  return values;
}

static void BM_EncodeRleBitPacked(::benchmark::State& state) {
  const int bit_width = static_cast<int>(state.range(0));
  const int mean_run = static_cast<int>(state.range(1));
  const std::vector<uint32_t> values = MakeRuns(bit_width, mean_run);

  io::BufferOutputStream sink(kNumValues * 4);
  int64_t encoded_bytes = 0;
  for (auto _ : state) {
    DREMEL_CHECK_OK(sink.Reset(kNumValues * 4));
    DREMEL_CHECK_OK(EncodeRleBitPacked(values.data(), kNumValues, bit_width, &sink));
    auto maybe_position = sink.Tell();
    DREMEL_CHECK_OK(maybe_position.status());
    encoded_bytes = *maybe_position;
  }
  state.SetItemsProcessed(state.iterations() * kNumValues);
  state.counters["encoded_bytes"] = static_cast<double>(encoded_bytes);
}

static void BM_EncodeBitmapRle(::benchmark::State& state) {
  const double null_probability = static_cast<double>(state.range(0)) / 100;
  std::default_random_engine rng(7);
  std::bernoulli_distribution is_valid(1.0 - null_probability);
  std::vector<uint8_t> bitmap(kNumValues / 8, 0);
  for (int64_t i = 0; i < kNumValues; ++i) {
    if (is_valid(rng)) {
      bitmap[i / 8] |= static_cast<uint8_t>(1 << (i % 8));
    }
  }

  io::BufferOutputStream sink(kNumValues / 4);
  for (auto _ : state) {
    DREMEL_CHECK_OK(sink.Reset(kNumValues / 4));
    DREMEL_CHECK_OK(EncodeBitmapRle(bitmap.data(), 0, kNumValues, &sink));
  }
  state.SetItemsProcessed(state.iterations() * kNumValues);
}

BENCHMARK(BM_EncodeRleBitPacked)
    ->ArgNames({"bit_width", "mean_run"})
    ->ArgsProduct({{1, 3, 8, 16}, {1, 4, 64}});
BENCHMARK(BM_EncodeBitmapRle)->ArgName("null_percent")->Arg(0)->Arg(5)->Arg(50);

}  // namespace util
}  // namespace dremel
