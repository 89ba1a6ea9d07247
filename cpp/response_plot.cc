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

#include "response_plot.h"

#include <cstdio>
#include <vector>

#include "fir_design.h"
#include "outerear_util.h"

namespace {

// -inf and NaN compare false and end up at min_db as well.
ArrayX ClampBelow(const ArrayX& values_db, FPType min_db) {
  return (values_db >= min_db).select(values_db, min_db);
}

std::vector<double> ToVector(const ArrayX& values) {
  return std::vector<double>(values.data(), values.data() + values.size());
}

}  // namespace

A0ResponseCurves ComputeA0ResponseCurves(const A0Output& output,
                                         FPType sample_rate_hz,
                                         const A0PlotParams& params) {
  OUTEREAR_ASSERT(output.frequencies_hz.size() == output.a0.size());
  A0ResponseCurves curves;
  curves.frequencies_hz = output.frequencies_hz;
  curves.target_db = ClampBelow(ToDb(output.a0), params.min_db);
  curves.response_db = ClampBelow(
      ToDb(FirMagnitudeResponse(output.b, output.frequencies_hz,
                                sample_rate_hz)),
      params.min_db);
  return curves;
}

matplot::figure_handle RenderA0ResponsePlot(const A0Output& output,
                                            FPType sample_rate_hz,
                                            const A0PlotParams& params) {
  OUTEREAR_ASSERT(sample_rate_hz > 0);
  OUTEREAR_ASSERT(params.max_db > params.min_db);
  matplot::figure_handle figure = matplot::figure(true);
  figure->size(params.width, params.height);
  matplot::axes_handle axes = figure->current_axes();

  if (output.frequencies_hz.size() > 0) {
    const A0ResponseCurves curves =
        ComputeA0ResponseCurves(output, sample_rate_hz, params);
    const std::vector<double> frequencies_hz = ToVector(curves.frequencies_hz);
    axes->hold(matplot::on);
    axes->plot(frequencies_hz, ToVector(curves.target_db),
               params.target_line_spec)
        ->line_width(params.target_line_width);
    axes->plot(frequencies_hz, ToVector(curves.response_db),
               params.response_line_spec)
        ->line_width(params.response_line_width);
    axes->hold(matplot::off);
    axes->legend({"a0 target", "FIR response"});
  }

  axes->xlim({0, sample_rate_hz / 2});
  axes->ylim({params.min_db, params.max_db});
  axes->grid(matplot::on);
  axes->xlabel("Frequency (Hz)");
  axes->ylabel("Gain (dB)");
  axes->title("Outer ear transmission (a0)");
  return figure;
}

bool WriteA0ResponsePlot(const std::string& filename, const A0Output& output,
                         FPType sample_rate_hz, const A0PlotParams& params) {
  if (output.frequencies_hz.size() == 0 || output.b.size() == 0) {
    std::fprintf(stderr, "Nothing to plot to \"%s\": empty a0 output.\n",
                 filename.c_str());
    return false;
  }
  matplot::figure_handle figure =
      RenderA0ResponsePlot(output, sample_rate_hz, params);
  if (!figure->save(filename)) {
    std::fprintf(stderr, "Failed to write \"%s\".\n", filename.c_str());
    return false;
  }
  return true;
}
