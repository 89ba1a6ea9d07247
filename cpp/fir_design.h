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

// Frequency sampling design of linear-phase FIR filters.

#ifndef OUTEREAR_FIR_DESIGN_H_
#define OUTEREAR_FIR_DESIGN_H_

#include "common.h"

// Designs a linear-phase FIR filter of order `order` (`order + 1` taps) whose
// magnitude response follows the piecewise-linear curve through the
// breakpoints (f, m).
//
// `f` holds frequencies normalized to the Nyquist frequency. It must start at
// 0, end at 1 and be non-decreasing. A repeated frequency marks a jump in
// the response. `m` holds the linear magnitude at each breakpoint.
//
// The desired response is sampled on a uniform grid of npt + 1 points from
// DC to Nyquist, where npt is 512 for filters shorter than 1024 taps and
// the next power of two of the number of taps otherwise. Jumps are
// smoothed over npt / 25 grid points. The impulse response is truncated to
// `order + 1` taps and tapered with a Hamming window.
//
// Odd-order symmetric filters have a zero at Nyquist. If m(end) is nonzero
// the order is increased by one.
//
// Returns false, leaving `b` unchanged, if the breakpoints are invalid or a
// jump is too abrupt for the interpolation grid.
bool Fir2(int order, const ArrayX& f, const ArrayX& m, ArrayX* b);

// Magnitude of the frequency response of the FIR filter `b` at each of
// `frequencies_hz`, for a sample rate of `sample_rate_hz`.
ArrayX FirMagnitudeResponse(const ArrayX& b, const ArrayX& frequencies_hz,
                            FPType sample_rate_hz);

#endif  // OUTEREAR_FIR_DESIGN_H_
