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

// Shared decibel helpers.

#ifndef OUTEREAR_OUTEREAR_UTIL_H_
#define OUTEREAR_OUTEREAR_UTIL_H_

#include <cmath>

#include "common.h"

// Converts amplitude decibels to linear gain, 10^(dB / 20). NaN stays NaN.
inline ArrayX FromDb(const ArrayX& gain_db) {
  return gain_db.unaryExpr(
      [](FPType db) { return std::pow(FPType(10), db / 20); });
}

// Converts linear gain to amplitude decibels, 20 log10(|gain|). A zero gain
// maps to -inf.
inline ArrayX ToDb(const ArrayX& gain) {
  return 20 * gain.abs().log10();
}

// Replaces each NaN in `input_output` with zero.
inline void ZeroNaNs(ArrayX* input_output) {
  ArrayX& values = *input_output;
  values = values.isNaN().select(ArrayX::Zero(values.size()), values);
}

#endif  // OUTEREAR_OUTEREAR_UTIL_H_
