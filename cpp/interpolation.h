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

#ifndef OUTEREAR_INTERPOLATION_H_
#define OUTEREAR_INTERPOLATION_H_

#include "common.h"

// Piecewise-linear interpolation of the function sampled at (x, y) at the
// query points `xq`. `x` must be sorted in non-decreasing order and have the
// same size as `y`, with at least two samples.
//
// A query equal to a sample point returns that sample's value exactly.
// Queries outside [x(0), x(end)], and NaN queries, are not extrapolated;
// they evaluate to NaN.
ArrayX Interp1(const ArrayX& x, const ArrayX& y, const ArrayX& xq);

#endif  // OUTEREAR_INTERPOLATION_H_
