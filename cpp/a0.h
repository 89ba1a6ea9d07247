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

// This header declares the main interface for computing the a0 outer ear
// transmission compensation and its FIR filter.
//
// The a0 curve is tabulated as gain in dB over critical band rate. It is
// evaluated on the linear frequency bins of a length-N spectrum between
// 20 Hz and 20 kHz, converted to linear gain, and handed to a frequency
// sampling FIR design so that it can be applied in the time domain.
//
// Note that the Fastl (2007) curves do not include the band-pass effect of
// the middle ear. Only kSqat1 approximates it.

#ifndef OUTEREAR_A0_H_
#define OUTEREAR_A0_H_

#include <string>

#include "a0_tables.h"
#include "common.h"

// An A0Params structure stores the options of CalculateA0.
struct A0Params {
  A0Params()
      : a0_type(kFastl2007FreeField),
        low_frequency_hz(20),
        high_frequency_hz(20000),
        fir_order(0) {}

  A0Type a0_type;
  // Band of the analysis grid. Bins outside of it have zero gain.
  FPType low_frequency_hz;
  FPType high_frequency_hz;
  // Order of the FIR filter. Zero selects the transform length.
  int fir_order;
};

// Bins of a length-N spectrum covering the analysis band.
struct A0AnalysisGrid {
  // 1-based bin indices round(low / df) + 1 ... round(high / df) + 1, where
  // df = fs / N. Empty if the resolution is too coarse to resolve the band.
  ArrayXi bins;
  // (bins - 1) * df, strictly increasing.
  ArrayX frequencies_hz;
};

// Result of CalculateA0.
struct A0Output {
  // FIR filter taps.
  ArrayX b;
  // Frequencies of the analysis grid in Hz.
  ArrayX frequencies_hz;
  // Linear a0 gain at each of frequencies_hz.
  ArrayX a0;
  // Linear a0 gain of all N bins, zero outside of the analysis grid. Grid
  // bins beyond N, which only exist when fs / 2 is below the top of the
  // analysis band, are left out.
  ArrayX gain_spectrum;
  // Number of grid frequencies at or above fs / 2 that the filter design
  // could not use.
  int num_ignored_breakpoints;

  A0Output() : num_ignored_breakpoints(0) {}
};

// Builds the analysis grid of a length `transform_length` spectrum sampled at
// `sample_rate_hz`. The band must map to bins an int can index, which
// CalculateA0 checks before calling this.
A0AnalysisGrid BuildA0AnalysisGrid(FPType sample_rate_hz, int transform_length,
                                   const A0Params& params);

// Evaluates `table` at the given critical band rates and converts the result
// to linear gain. Rates outside of the table's range get zero gain.
ArrayX InterpolateA0Gain(const A0Table& table, const ArrayX& barks);

// Designs the FIR filter realizing linear gains `a0` at `frequencies_hz`.
// The curve is extended to DC with a0(0) and to Nyquist with a0(end), and
// frequencies outside of (0, fs / 2) are ignored. If no frequency is left
// the design request is a flat, unit gain response. `order` is the filter
// order, or zero to use `transform_length`. If `num_ignored` is not null it
// receives the number of ignored frequencies.
//
// Returns false, leaving `b` unchanged, if the filter design fails.
bool CreateA0Fir(const ArrayX& frequencies_hz, const ArrayX& a0,
                 int transform_length, FPType sample_rate_hz, int order,
                 ArrayX* b, int* num_ignored = nullptr);

// Computes the a0 curve for a length `transform_length` spectrum at sample
// rate `sample_rate_hz` and designs the corresponding FIR filter.
//
// Returns false and prints the reason to stderr, leaving `output` unchanged,
// if sample_rate_hz <= 0 or transform_length <= 0, if the analysis band is
// negative, infinite or has more bins than an int can index, or if the
// filter design fails.
bool CalculateA0(FPType sample_rate_hz, int transform_length,
                 const A0Params& params, A0Output* output);

// Same as above with the default A0Params, i.e. the free-field curve.
bool CalculateA0(FPType sample_rate_hz, int transform_length,
                 A0Output* output);

// Same as above, selecting the curve by its case-insensitive name: one of
// "fastl2007ff", "fastl2007df", "fluctuationstrength_osses2016" or "sqat1".
// Unknown names are rejected.
bool CalculateA0(FPType sample_rate_hz, int transform_length,
                 const std::string& a0_type, A0Output* output);

#endif  // OUTEREAR_A0_H_
