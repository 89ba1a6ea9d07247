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

#ifndef OUTEREAR_COMMON_H_
#define OUTEREAR_COMMON_H_

#include <cassert>

// The Eigen library is used for all floating point arrays.
// For more information, see: http://eigen.tuxfamily.org
#include <Eigen/Core>

// This typedef is used to enable easy switching in precision level
// for the Eigen containers used throughout this library. The calibration
// tables are published with two decimals in dB, and the FIR design sums
// thousands of terms, so double is the default here.
typedef double FPType;
typedef Eigen::Array<FPType, Eigen::Dynamic, 1> ArrayX;
typedef Eigen::Array<int, Eigen::Dynamic, 1> ArrayXi;

// This abstraction makes it easy to redefine all assertions used in
// this library if the basic assert macro is insufficient.
#define OUTEREAR_ASSERT(expression) assert(expression);

#endif  // OUTEREAR_COMMON_H_
