// Copyright 2026 The OuterEar Authors. All Rights Reserved.
//
// This file is part of an implementation of the outer ear transmission
// ("a0") compensation used by psychoacoustic loudness and fluctuation
// strength models.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "a0.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>
#include <vector>

#include "bark.h"
#include "fir_design.h"
#include "interpolation.h"
#include "outerear_util.h"

A0AnalysisGrid BuildA0AnalysisGrid(FPType sample_rate_hz, int transform_length,
                                   const A0Params& params) {
  OUTEREAR_ASSERT(sample_rate_hz > 0);
  OUTEREAR_ASSERT(transform_length > 0);
  const FPType df = sample_rate_hz / transform_length;
  const FPType first_bin = std::round(params.low_frequency_hz / df) + 1;
  const FPType last_bin = std::round(params.high_frequency_hz / df) + 1;

  A0AnalysisGrid grid;
  const FPType num_bins = std::max<FPType>(last_bin - first_bin + 1, 0);
  OUTEREAR_ASSERT(num_bins <= std::numeric_limits<int>::max());
  grid.bins.resize(static_cast<int>(num_bins));
  grid.frequencies_hz.resize(grid.bins.size());
  for (int i = 0; i < grid.bins.size(); ++i) {
    grid.bins[i] = static_cast<int>(first_bin) + i;
    grid.frequencies_hz[i] = (grid.bins[i] - 1) * df;
  }
  return grid;
}

ArrayX InterpolateA0Gain(const A0Table& table, const ArrayX& barks) {
  ArrayX gain = FromDb(Interp1(table.barks(), table.gains_db(), barks));
  ZeroNaNs(&gain);
  return gain;
}

bool CreateA0Fir(const ArrayX& frequencies_hz, const ArrayX& a0,
                 int transform_length, FPType sample_rate_hz, int order,
                 ArrayX* b, int* num_ignored) {
  OUTEREAR_ASSERT(frequencies_hz.size() == a0.size() &&
                  "Each frequency needs exactly one gain.");
  const FPType nyquist_hz = sample_rate_hz / 2;

  // Breakpoints strictly inside (0, nyquist); DC and Nyquist are added below.
  std::vector<int> inner;
  for (int i = 0; i < frequencies_hz.size(); ++i) {
    if (frequencies_hz[i] > 0 && frequencies_hz[i] < nyquist_hz) {
      inner.push_back(i);
    }
  }
  const int num_inner = inner.size();
  ArrayX f(num_inner + 2);
  ArrayX m(num_inner + 2);
  f[0] = 0;
  f[num_inner + 1] = 1;
  if (num_inner == 0) {
    m.setOnes();
  } else {
    for (int i = 0; i < num_inner; ++i) {
      f[i + 1] = frequencies_hz[inner[i]] / nyquist_hz;
      m[i + 1] = a0[inner[i]];
    }
    m[0] = m[1];
    m[num_inner + 1] = m[num_inner];
  }

  if (!Fir2((order > 0) ? order : transform_length, f, m, b)) {
    return false;
  }
  if (num_ignored != nullptr) {
    *num_ignored = frequencies_hz.size() - num_inner;
  }
  return true;
}

bool CalculateA0(FPType sample_rate_hz, int transform_length,
                 const A0Params& params, A0Output* output) {
  if (!(sample_rate_hz > 0) || !std::isfinite(sample_rate_hz)) {
    std::fprintf(stderr, "Invalid argument: sample rate must be positive, "
                 "got %g Hz.\n", sample_rate_hz);
    return false;
  }
  if (transform_length <= 0) {
    std::fprintf(stderr, "Invalid argument: transform length must be "
                 "positive, got %d.\n", transform_length);
    return false;
  }
  if (!(params.low_frequency_hz >= 0) || !(params.high_frequency_hz >= 0) ||
      !std::isfinite(params.low_frequency_hz) ||
      !std::isfinite(params.high_frequency_hz)) {
    std::fprintf(stderr, "Invalid argument: analysis band [%g, %g] Hz must "
                 "be finite and not negative.\n", params.low_frequency_hz,
                 params.high_frequency_hz);
    return false;
  }
  // Bin indices are ints. This also catches df underflowing to zero.
  const FPType df = sample_rate_hz / transform_length;
  const FPType last_bin = std::round(params.high_frequency_hz / df) + 1;
  if (!(last_bin <= std::numeric_limits<int>::max())) {
    std::fprintf(stderr, "Invalid argument: resolution %g Hz is too coarse "
                 "for an analysis band up to %g Hz.\n", df,
                 params.high_frequency_hz);
    return false;
  }

  const A0AnalysisGrid grid =
      BuildA0AnalysisGrid(sample_rate_hz, transform_length, params);
  const ArrayX barks =
      GetBark(transform_length, grid.bins, grid.frequencies_hz);
  const ArrayX a0 = InterpolateA0Gain(GetA0Table(params.a0_type), barks);

  ArrayX gain_spectrum = ArrayX::Zero(transform_length);
  for (int i = 0; i < grid.bins.size(); ++i) {
    if (grid.bins[i] <= transform_length) {
      gain_spectrum[grid.bins[i] - 1] = a0[i];
    }
  }

  ArrayX b;
  int num_ignored = 0;
  if (!CreateA0Fir(grid.frequencies_hz, a0, transform_length, sample_rate_hz,
                   params.fir_order, &b, &num_ignored)) {
    return false;
  }

  output->b = b;
  output->frequencies_hz = grid.frequencies_hz;
  output->a0 = a0;
  output->gain_spectrum = gain_spectrum;
  output->num_ignored_breakpoints = num_ignored;
  return true;
}

bool CalculateA0(FPType sample_rate_hz, int transform_length,
                 A0Output* output) {
  return CalculateA0(sample_rate_hz, transform_length, A0Params(), output);
}

bool CalculateA0(FPType sample_rate_hz, int transform_length,
                 const std::string& a0_type, A0Output* output) {
  A0Params params;
  if (!ParseA0Type(a0_type, &params.a0_type)) {
    return false;
  }
  return CalculateA0(sample_rate_hz, transform_length, params, output);
}
