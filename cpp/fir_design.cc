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

#include "fir_design.h"

#include <cmath>
#include <complex>
#include <cstdio>
#include <vector>

#include <unsupported/Eigen/FFT>

namespace {

typedef std::complex<FPType> Complex;

constexpr FPType kPi = 3.141592653589793238462643383279502884;

int NextPowerOfTwo(int n) {
  int power = 1;
  while (power < n) {
    power <<= 1;
  }
  return power;
}

// Symmetric Hamming window, 0.54 - 0.46 cos(2 pi k / (length - 1)).
ArrayX HammingWindow(int length) {
  if (length == 1) {
    return ArrayX::Ones(1);
  }
  return 0.54 - 0.46 * ArrayX::LinSpaced(length, 0, 2 * kPi).cos();
}

bool CheckBreakpoints(const ArrayX& f, const ArrayX& m) {
  if (f.size() != m.size()) {
    std::fprintf(stderr,
                 "Invalid argument: %d frequencies but %d magnitudes.\n",
                 static_cast<int>(f.size()), static_cast<int>(m.size()));
    return false;
  }
  if (f.size() < 2) {
    std::fprintf(stderr, "Invalid argument: at least two breakpoints are "
                 "needed.\n");
    return false;
  }
  if (f[0] != 0 || f[f.size() - 1] != 1) {
    std::fprintf(stderr, "Invalid argument: frequencies must start at 0 and "
                 "end at 1, got %g and %g.\n", f[0], f[f.size() - 1]);
    return false;
  }
  for (int i = 1; i < f.size(); ++i) {
    if (!(f[i] >= f[i - 1])) {
      std::fprintf(stderr, "Invalid argument: frequencies must be "
                   "non-decreasing (f[%d] = %g after %g).\n", i, f[i],
                   f[i - 1]);
      return false;
    }
  }
  if (!m.allFinite()) {
    std::fprintf(stderr, "Invalid argument: magnitudes must be finite.\n");
    return false;
  }
  return true;
}

}  // namespace

bool Fir2(int order, const ArrayX& f, const ArrayX& m, ArrayX* b) {
  if (order < 1) {
    std::fprintf(stderr, "Invalid argument: filter order must be positive, "
                 "got %d.\n", order);
    return false;
  }
  if (!CheckBreakpoints(f, m)) {
    return false;
  }
  if (order % 2 == 1 && m[m.size() - 1] != 0) {
    std::fprintf(stderr, "Odd order symmetric FIR filters must have zero "
                 "gain at Nyquist. Increasing the order to %d.\n", order + 1);
    ++order;
  }

  const int num_taps = order + 1;
  const int grid_size = (num_taps < 1024) ? 512 : NextPowerOfTwo(num_taps);
  const int lap = grid_size / 25;
  // Number of grid points from DC to Nyquist inclusive.
  const int npt = grid_size + 1;

  // Sample the piecewise-linear response. The indices nb and ne are 1-based
  // positions on the grid, as in the classic formulation.
  ArrayX desired = ArrayX::Zero(npt);
  desired[0] = m[0];
  int nb = 1;
  for (int i = 0; i + 1 < f.size(); ++i) {
    int ne;
    if (f[i + 1] == f[i]) {
      nb = static_cast<int>(std::ceil(nb - lap / 2.0));
      ne = nb + lap;
    } else {
      ne = static_cast<int>(f[i + 1] * npt);
    }
    if (nb < 1 || ne > npt) {
      std::fprintf(stderr, "Filter design failed: the jump at normalized "
                   "frequency %g is too abrupt for %d grid points.\n",
                   f[i + 1], npt);
      return false;
    }
    for (int j = nb; j <= ne; ++j) {
      const FPType inc = (nb == ne) ? 0 : FPType(j - nb) / (ne - nb);
      desired[j - 1] = inc * m[i + 1] + (1 - inc) * m[i];
    }
    nb = ne + 1;
  }

  // Delay by half the filter length for linear phase, then mirror into a
  // Hermitian spectrum so that the impulse response is real.
  const FPType delay = 0.5 * (num_taps - 1);
  const int fft_size = 2 * grid_size;
  std::vector<Complex> spectrum(fft_size);
  for (int k = 0; k < npt; ++k) {
    const FPType phase = -delay * kPi * k / (npt - 1);
    spectrum[k] = desired[k] * Complex(std::cos(phase), std::sin(phase));
  }
  for (int k = 1; k < npt - 1; ++k) {
    spectrum[fft_size - k] = std::conj(spectrum[k]);
  }

  Eigen::FFT<FPType> fft;
  std::vector<Complex> impulse;
  fft.inv(impulse, spectrum);

  const ArrayX window = HammingWindow(num_taps);
  ArrayX taps(num_taps);
  for (int n = 0; n < num_taps; ++n) {
    taps[n] = impulse[n].real() * window[n];
  }
  *b = taps;
  return true;
}

ArrayX FirMagnitudeResponse(const ArrayX& b, const ArrayX& frequencies_hz,
                            FPType sample_rate_hz) {
  OUTEREAR_ASSERT(sample_rate_hz > 0);
  const ArrayX n = ArrayX::LinSpaced(b.size(), 0, b.size() - 1);
  ArrayX magnitude(frequencies_hz.size());
  for (int i = 0; i < frequencies_hz.size(); ++i) {
    const FPType omega = 2 * kPi * frequencies_hz[i] / sample_rate_hz;
    const FPType real = (b * (omega * n).cos()).sum();
    const FPType imag = -(b * (omega * n).sin()).sum();
    magnitude[i] = std::hypot(real, imag);
  }
  return magnitude;
}
