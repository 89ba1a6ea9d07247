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

// Command line front end of CalculateA0. Prints the FIR filter taps, the
// analysis frequencies and the a0 gains as three whitespace-separated rows.

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>

#include "a0.h"
#include "a0_tables.h"
#include "common.h"
#include "response_plot.h"

namespace {

const char kHelp[] =
    "Usage: calculate_a0 <fs> <N> [a0_type] [--plot=<file.png>] "
    "[--order=<n>]\n"
    "\n"
    "Compensation of the outer ear transmission effects, called the a0\n"
    "compensation factor, and the FIR filter that applies it.\n"
    "\n"
    "  fs       Sampling frequency in Hz.\n"
    "  N        Transform length, defining the frequency resolution\n"
    "           df = fs / N.\n"
    "  a0_type  One of the following, case-insensitive:\n"
    "             fastl2007ff (default)  Free-field curve of Fastl and\n"
    "                 Zwicker (2007), Fig. 8.18, page 226.\n"
    "             fastl2007df  Diffuse-field curve from the same figure.\n"
    "             fluctuationstrength_osses2016  The free-field curve with\n"
    "                 the ear canal resonance removed, roughly a low-pass\n"
    "                 filter, as used by Osses et al. (2016).\n"
    "             sqat1  Legacy curve of earlier fluctuation strength models,\n"
    "                 including an approximate middle ear attenuation.\n"
    "           The Fastl (2007) curves do not include the band-pass effect\n"
    "           of the middle ear.\n"
    "  --plot   Also save a plot of the target curve and the realized\n"
    "           filter response. The extension selects the format, e.g.\n"
    "           png, svg or pdf. Requires gnuplot.\n"
    "  --order  FIR filter order. Defaults to N.\n"
    "\n"
    "Output: three rows, the filter taps B, the analysis frequencies in Hz\n"
    "between 20 Hz and 20 kHz, and the linear a0 gain at each frequency.\n"
    "\n"
    "Example: calculate_a0 44100 4096 fluctuationstrength_osses2016\n";

// Returns true if string `s` starts with `prefix`.
bool StartsWith(const char* s, const char* prefix) {
  return std::strncmp(s, prefix, std::strlen(prefix)) == 0;
}

bool ParseDouble(const char* text, const char* name, double* value) {
  char* end;
  errno = 0;
  const double parsed = std::strtod(text, &end);
  if (end == text || *end != '\0' || errno == ERANGE) {
    std::fprintf(stderr, "Invalid argument: %s \"%s\" is not a number.\n",
                 name, text);
    return false;
  }
  *value = parsed;
  return true;
}

bool ParseInt(const char* text, const char* name, int* value) {
  char* end;
  errno = 0;
  const long parsed = std::strtol(text, &end, 10);
  if (end == text || *end != '\0' || errno == ERANGE ||
      parsed != static_cast<int>(parsed)) {
    std::fprintf(stderr, "Invalid argument: %s \"%s\" is not an integer.\n",
                 name, text);
    return false;
  }
  *value = static_cast<int>(parsed);
  return true;
}

void PrintRow(const ArrayX& row) {
  const int kPrecision = 9;
  const Eigen::IOFormat ioformat(kPrecision, Eigen::DontAlignCols, " ", " ");
  if (row.size() > 0) {
    std::cout << row.transpose().format(ioformat);
  }
  std::cout << '\n';
}

}  // namespace

int main(int argc, char** argv) {
  if (argc == 1) {
    std::fputs(kHelp, stdout);
    return EXIT_SUCCESS;
  }

  std::string plot_filename;
  A0Params params;
  const char* positional[3] = {nullptr, nullptr, nullptr};
  int num_positional = 0;
  for (int i = 1; i < argc; ++i) {
    if (StartsWith(argv[i], "--plot=")) {
      plot_filename = std::strchr(argv[i], '=') + 1;
    } else if (StartsWith(argv[i], "--order=")) {
      if (!ParseInt(std::strchr(argv[i], '=') + 1, "order",
                    &params.fir_order)) {
        return EXIT_FAILURE;
      }
      if (params.fir_order <= 0) {
        std::fprintf(stderr, "Invalid argument: order must be positive.\n");
        return EXIT_FAILURE;
      }
    } else if (std::strcmp(argv[i], "--help") == 0) {
      std::fputs(kHelp, stdout);
      return EXIT_SUCCESS;
    } else if (num_positional < 3) {
      positional[num_positional++] = argv[i];
    } else {
      std::fprintf(stderr, "Invalid argument: unexpected \"%s\".\n", argv[i]);
      return EXIT_FAILURE;
    }
  }
  if (num_positional < 2) {
    std::fprintf(stderr, "Invalid argument: both fs and N are required.\n\n");
    std::fputs(kHelp, stderr);
    return EXIT_FAILURE;
  }

  double sample_rate_hz;
  int transform_length;
  if (!ParseDouble(positional[0], "fs", &sample_rate_hz) ||
      !ParseInt(positional[1], "N", &transform_length)) {
    return EXIT_FAILURE;
  }
  if (num_positional == 3 && !ParseA0Type(positional[2], &params.a0_type)) {
    return EXIT_FAILURE;
  }

  A0Output output;
  if (!CalculateA0(sample_rate_hz, transform_length, params, &output)) {
    return EXIT_FAILURE;
  }

  if (output.num_ignored_breakpoints > 0) {
    std::fprintf(stderr, "Ignored %d a0 breakpoints at or above fs / 2 = %g Hz "
                 "in the filter design.\n", output.num_ignored_breakpoints,
                 sample_rate_hz / 2);
  }

  PrintRow(output.b);
  PrintRow(output.frequencies_hz);
  PrintRow(output.a0);

  if (!plot_filename.empty()) {
    if (!WriteA0ResponsePlot(plot_filename, output, sample_rate_hz,
                             A0PlotParams())) {
      return EXIT_FAILURE;
    }
    std::fprintf(stderr, "Wrote %s\n", plot_filename.c_str());
  }
  return EXIT_SUCCESS;
}
