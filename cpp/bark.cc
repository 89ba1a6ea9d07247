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

#include "bark.h"

#include <cmath>

FPType HzToBark(FPType frequency_hz) {
  const FPType ratio = frequency_hz / 7500;
  return 13 * std::atan(0.00076 * frequency_hz) +
         3.5 * std::atan(ratio * ratio);
}

ArrayX HzToBark(const ArrayX& frequencies_hz) {
  return 13 * (0.00076 * frequencies_hz).atan() +
         3.5 * (frequencies_hz / 7500).square().atan();
}

ArrayX GetBark(int transform_length, const ArrayXi& bins,
               const ArrayX& frequencies_hz) {
  OUTEREAR_ASSERT(bins.size() == frequencies_hz.size() &&
                  "Each bin needs exactly one frequency.");
  OUTEREAR_ASSERT(transform_length > 0);
  if (bins.size() > 0) {
    OUTEREAR_ASSERT(bins.minCoeff() >= 1 && "Bins are 1-based.");
  }
  return HzToBark(frequencies_hz);
}
