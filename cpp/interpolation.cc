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

#include "interpolation.h"

#include <algorithm>
#include <limits>

ArrayX Interp1(const ArrayX& x, const ArrayX& y, const ArrayX& xq) {
  OUTEREAR_ASSERT(x.size() == y.size() && "x and y must have the same size.");
  OUTEREAR_ASSERT(x.size() >= 2 && "At least two samples are needed.");
  const int num_samples = x.size();
  const FPType* x_begin = x.data();
  const FPType* x_end = x.data() + num_samples;

  ArrayX yq(xq.size());
  for (int i = 0; i < xq.size(); ++i) {
    const FPType query = xq[i];
    // Written so that NaN queries also fail the test.
    if (!(query >= x[0] && query <= x[num_samples - 1])) {
      yq[i] = std::numeric_limits<FPType>::quiet_NaN();
      continue;
    }
    // First sample strictly greater than the query, so that
    // x[upper - 1] <= query < x[upper].
    const int upper = std::upper_bound(x_begin, x_end, query) - x_begin;
    if (upper == num_samples) {
      yq[i] = y[num_samples - 1];
      continue;
    }
    const int lower = upper - 1;
    const FPType t = (query - x[lower]) / (x[upper] - x[lower]);
    yq[i] = y[lower] + t * (y[upper] - y[lower]);
  }
  return yq;
}
