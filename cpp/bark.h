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

// Mapping of linear frequency onto the Bark (critical band rate) scale.

#ifndef OUTEREAR_BARK_H_
#define OUTEREAR_BARK_H_

#include "common.h"

// Computes the critical band rate in Bark of a frequency in Hertz.
// Ref: Zwicker and Terhardt: J. Acoust. Soc. Am. 68 (1980), 1523-1525
//
//   z = 13 atan(0.76 f / 1000) + 3.5 atan((f / 7500)^2)
FPType HzToBark(FPType frequency_hz);

// Element-wise version of the above.
ArrayX HzToBark(const ArrayX& frequencies_hz);

// Returns the Bark value of each analysis bin of a length
// `transform_length` spectrum. `bins` holds 1-based bin indices and
// `frequencies_hz` the linear frequency of each of them, so both must have
// the same size. The result has the same size and order as `bins`.
ArrayX GetBark(int transform_length, const ArrayXi& bins,
               const ArrayX& frequencies_hz);

#endif  // OUTEREAR_BARK_H_
