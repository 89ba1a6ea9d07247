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

// Diagnostic plot comparing the target a0 curve with the magnitude response
// of the designed FIR filter, drawn with Matplot++.

#ifndef OUTEREAR_RESPONSE_PLOT_H_
#define OUTEREAR_RESPONSE_PLOT_H_

#include <string>

#include "matplot/matplot.h"
#include "a0.h"
#include "common.h"

struct A0PlotParams {
  A0PlotParams()
      : width(800),
        height(480),
        min_db(-93),
        max_db(13),
        target_line_spec("b-"),
        target_line_width(3),
        response_line_spec("r-"),
        response_line_width(1) {}

  // Figure size in pixels.
  int width;
  int height;
  // Vertical axis limits in dB. Gains below min_db, including zero gain,
  // are drawn at min_db.
  FPType min_db;
  FPType max_db;
  // MATLAB style line specs and widths of the two curves. The response is
  // drawn on top of the target.
  std::string target_line_spec;
  float target_line_width;
  std::string response_line_spec;
  float response_line_width;
};

// The two curves of the plot, in dB over output.frequencies_hz.
struct A0ResponseCurves {
  ArrayX frequencies_hz;
  ArrayX target_db;
  ArrayX response_db;
};

// Evaluates the target curve output.a0 and the magnitude response of
// output.b in dB, with values below params.min_db raised to it.
A0ResponseCurves ComputeA0ResponseCurves(const A0Output& output,
                                         FPType sample_rate_hz,
                                         const A0PlotParams& params);

// Plots both curves over linear frequency from 0 to sample_rate_hz / 2 into
// a new figure in quiet mode. Nothing is plotted for an empty grid.
matplot::figure_handle RenderA0ResponsePlot(const A0Output& output,
                                            FPType sample_rate_hz,
                                            const A0PlotParams& params);

// Renders the plot as above and saves it to `filename`, in the format given
// by its extension. Returns false and prints the reason to stderr if there
// is nothing to plot or saving fails.
bool WriteA0ResponsePlot(const std::string& filename, const A0Output& output,
                         FPType sample_rate_hz, const A0PlotParams& params);

#endif  // OUTEREAR_RESPONSE_PLOT_H_
