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

#include "a0_tables.h"

#include <cctype>
#include <cstdio>

namespace {

// {Bark, dB}. The -999 dB rows stand for minus infinity.
constexpr A0TableRow kFastl2007FreeFieldRows[] = {
    {0, 0},         {10, 0},         {11, 0.25},     {12, 1.18},
    {13, 2.27},     {14, 3.70},      {15, 5.21},     {16, 6.30},
    {16.5, 6.55},   {17, 6.47},      {18, 4.87},     {18.5, 3.53},
    {19, 1.85},     {19.5, -0.08},   {20, -1.76},    {20.5, -3.28},
    {21, -4.20},    {21.5, -5.13},   {22, -7.06},    {22.5, -10.08},
    {23, -14.03},   {23.5, -19.83},  {24, -33},      {25, -70},
    {26, -999},
};

constexpr A0TableRow kFastl2007DiffuseFieldRows[] = {
    {0, 0},         {5, 0},          {6, 0.59},      {7, 1.51},
    {8, 2.35},      {9, 2.52},       {10, 2.18},     {11, 1.43},
    {12, 0.92},     {13, 1.01},      {14, 1.85},     {15, 3.03},
    {16, 4.54},     {17, 5.71},      {18, 4.87},     {19, 3.19},
    {19.5, 2.18},   {20, 1.43},      {20.5, 0.76},   {21, 0.17},
    {21.5, -1.18},  {22, -3.28},     {22.5, -6.55},  {23, -10.76},
    {23.5, -18.24}, {24, -33},       {25, -70},      {26, -999},
};

constexpr A0TableRow kFluctuationStrengthOsses2016Rows[] = {
    {0, 0},         {10, 0},         {19, 0},        {20, -1.43},
    {21, -2.59},    {21.5, -3.57},   {22, -5.19},    {22.5, -7.41},
    {23, -11.3},    {23.5, -20},     {24, -40},      {25, -130},
    {26, -999},
};

// Includes the approximate middle ear attenuation below 8.5 Bark.
constexpr A0TableRow kSqat1Rows[] = {
    {0, -999},      {0.5, -34.7},    {1, -23},       {1.5, -17},
    {2, -12.8},     {2.5, -10.1},    {3, -8},        {3.5, -6.4},
    {4, -5.1},      {4.5, -4.2},     {5, -3.5},      {5.5, -2.9},
    {6, -2.4},      {6.5, -1.9},     {7, -1.5},      {7.5, -1.1},
    {8, -0.8},      {8.5, 0},        {10, 0},        {12, 1.15},
    {13, 2.31},     {14, 3.85},      {15, 5.62},     {16, 6.92},
    {16.5, 7.38},   {17, 6.92},      {18, 4.23},     {18.5, 2.31},
    {19, 0},        {20, -1.43},     {21, -2.59},    {21.5, -3.57},
    {22, -5.19},    {22.5, -7.41},   {23, -11.3},    {23.5, -20},
    {24, -40},      {25, -130},      {26, -999},
};

template <int N>
A0Table MakeTable(const A0TableRow (&rows)[N]) {
  return A0Table{rows, N};
}

// Case-insensitive string equality.
bool EqualsIgnoreCase(const std::string& a, const char* b) {
  std::string::size_type i = 0;
  for (; i < a.size() && b[i] != '\0'; ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) !=
        std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return i == a.size() && b[i] == '\0';
}

}  // namespace

ArrayX A0Table::barks() const {
  ArrayX result(num_rows);
  for (int i = 0; i < num_rows; ++i) {
    result[i] = rows[i].bark;
  }
  return result;
}

ArrayX A0Table::gains_db() const {
  ArrayX result(num_rows);
  for (int i = 0; i < num_rows; ++i) {
    result[i] = rows[i].gain_db;
  }
  return result;
}

A0Table GetA0Table(A0Type type) {
  switch (type) {
    case kFastl2007FreeField:
      return MakeTable(kFastl2007FreeFieldRows);
    case kFastl2007DiffuseField:
      return MakeTable(kFastl2007DiffuseFieldRows);
    case kFluctuationStrengthOsses2016:
      return MakeTable(kFluctuationStrengthOsses2016Rows);
    case kSqat1:
      return MakeTable(kSqat1Rows);
  }
  OUTEREAR_ASSERT(false && "Unhandled A0Type.");
  return MakeTable(kFastl2007FreeFieldRows);
}

const char* A0TypeName(A0Type type) {
  switch (type) {
    case kFastl2007FreeField:
      return "fastl2007ff";
    case kFastl2007DiffuseField:
      return "fastl2007df";
    case kFluctuationStrengthOsses2016:
      return "fluctuationstrength_osses2016";
    case kSqat1:
      return "sqat1";
  }
  return "unknown";
}

bool ParseA0Type(const std::string& name, A0Type* type) {
  for (int i = 0; i < kNumA0Types; ++i) {
    const A0Type candidate = static_cast<A0Type>(i);
    if (EqualsIgnoreCase(name, A0TypeName(candidate))) {
      *type = candidate;
      return true;
    }
  }
  std::fprintf(stderr,
               "Invalid argument: unknown a0 type \"%s\". Expected one of "
               "fastl2007ff, fastl2007df, fluctuationstrength_osses2016, "
               "sqat1.\n",
               name.c_str());
  return false;
}
