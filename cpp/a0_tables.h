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

// Tabulated a0 transmission curves, gain in dB as a function of critical
// band rate in Bark.

#ifndef OUTEREAR_A0_TABLES_H_
#define OUTEREAR_A0_TABLES_H_

#include <string>

#include "common.h"

enum A0Type {
  // Free-field outer ear transmission, Fastl and Zwicker (2007),
  // "Psychoacoustics: Facts and Models", Fig. 8.18, page 226. This is the
  // same curve used by the Daniel and Weber (1997) roughness model.
  kFastl2007FreeField,
  // Diffuse-field counterpart of the above, from the same figure.
  kFastl2007DiffuseField,
  // Fastl's free-field curve with the ear canal resonance removed, i.e.
  // roughly a low-pass filter. Osses et al. (2016) fluctuation strength.
  kFluctuationStrengthOsses2016,
  // The curve of the first fluctuation strength release, kept for backwards
  // compatibility. Unlike the others it approximates the strong low-frequency
  // attenuation of the middle ear.
  kSqat1,
};

constexpr int kNumA0Types = 4;

// One calibration point of an a0 curve.
struct A0TableRow {
  FPType bark;
  FPType gain_db;
};

// Read-only view of a compiled-in a0 curve. Rows are sorted by
// non-decreasing Bark value, and the first and last rows bound the range
// over which the curve is defined.
struct A0Table {
  const A0TableRow* rows;
  int num_rows;

  FPType min_bark() const { return rows[0].bark; }
  FPType max_bark() const { return rows[num_rows - 1].bark; }

  // Copies the columns into Eigen arrays, e.g. for interpolation.
  ArrayX barks() const;
  ArrayX gains_db() const;
};

// Returns the calibration table of the given curve.
A0Table GetA0Table(A0Type type);

// Canonical lower-case name of the curve, e.g. "fastl2007ff".
const char* A0TypeName(A0Type type);

// Parses one of "fastl2007ff", "fastl2007df", "fluctuationstrength_osses2016"
// or "sqat1", ignoring case. Returns false and leaves `type` unchanged if the
// name is not recognized.
bool ParseA0Type(const std::string& name, A0Type* type);

#endif  // OUTEREAR_A0_TABLES_H_
