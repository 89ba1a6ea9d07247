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

#include "gtest/gtest.h"
#include "common.h"
#include "test_util.h"

namespace {

void ExpectSymmetric(const ArrayX& b) {
  for (int n = 0; n < b.size() / 2; ++n) {
    EXPECT_NEAR(b[n], b[b.size() - 1 - n], 1e-12) << "n = " << n;
  }
}

TEST(Fir2Test, AllPassIsCenteredImpulse) {
  ArrayX b;
  ASSERT_TRUE(Fir2(100, MakeArray({0, 1}), MakeArray({1, 1}), &b));
  ASSERT_EQ(101, b.size());
  EXPECT_NEAR(1, b[50], 1e-12);
  EXPECT_NEAR(1, b.sum(), 1e-12);
  ExpectSymmetric(b);
}

TEST(Fir2Test, NumberOfTapsAndSymmetry) {
  const int kOrders[] = {2, 30, 1022, 1023, 1024, 4096};
  for (int order : kOrders) {
    SCOPED_TRACE(testing::Message() << "order: " << order);
    ArrayX b;
    // Zero gain at Nyquist keeps odd orders as they are.
    ASSERT_TRUE(Fir2(order, MakeArray({0, 0.3, 0.6, 1}),
                     MakeArray({0.5, 1, 0.2, 0}), &b));
    ASSERT_EQ(order + 1, b.size());
    ExpectSymmetric(b);
  }
}

TEST(Fir2Test, OddOrderWithGainAtNyquistIsIncreased) {
  ArrayX b;
  ASSERT_TRUE(Fir2(31, MakeArray({0, 1}), MakeArray({1, 1}), &b));
  EXPECT_EQ(33, b.size());
  ExpectSymmetric(b);
}

TEST(Fir2Test, LowPassWithJump) {
  ArrayX b;
  ASSERT_TRUE(Fir2(100, MakeArray({0, 0.5, 0.5, 1}), MakeArray({1, 1, 0, 0}),
                   &b));
  // Normalized frequencies are relative to Nyquist, so use fs = 2.
  const ArrayX response =
      FirMagnitudeResponse(b, MakeArray({0, 0.1, 0.9, 1}), 2);
  EXPECT_NEAR(1, response[0], 1e-3);
  EXPECT_NEAR(1, response[1], 1e-3);
  EXPECT_LT(response[2], 1e-3);
  EXPECT_LT(response[3], 1e-3);
}

TEST(Fir2Test, RejectsInvalidBreakpoints) {
  const ArrayX kUnchanged = MakeArray({42});
  ArrayX b = kUnchanged;
  // Order.
  EXPECT_FALSE(Fir2(0, MakeArray({0, 1}), MakeArray({1, 1}), &b));
  // Size mismatch.
  EXPECT_FALSE(Fir2(10, MakeArray({0, 0.5, 1}), MakeArray({1, 1}), &b));
  // Too few breakpoints.
  EXPECT_FALSE(Fir2(10, MakeArray({0}), MakeArray({1}), &b));
  // Not starting at 0 or not ending at 1.
  EXPECT_FALSE(Fir2(10, MakeArray({0.1, 1}), MakeArray({1, 1}), &b));
  EXPECT_FALSE(Fir2(10, MakeArray({0, 0.9}), MakeArray({1, 1}), &b));
  // Decreasing.
  EXPECT_FALSE(Fir2(10, MakeArray({0, 0.6, 0.4, 1}), MakeArray({1, 1, 1, 1}),
                    &b));
  // Jump at Nyquist, too abrupt for the grid.
  EXPECT_FALSE(Fir2(10, MakeArray({0, 1, 1}), MakeArray({1, 1, 0}), &b));
  AssertArrayNear(kUnchanged, b, 0);
}

TEST(FirMagnitudeResponseTest, TwoTapAverage) {
  const ArrayX response = FirMagnitudeResponse(
      MakeArray({0.5, 0.5}), MakeArray({0, 4000, 8000}), 16000);
  EXPECT_NEAR(1, response[0], kTestPrecision);
  EXPECT_NEAR(std::sqrt(0.5), response[1], kTestPrecision);
  EXPECT_NEAR(0, response[2], kTestPrecision);
}

TEST(FirMagnitudeResponseTest, UnitImpulse) {
  const ArrayX response = FirMagnitudeResponse(
      MakeArray({1}), ArrayX::LinSpaced(10, 0, 22050), 44100);
  AssertArrayNear(ArrayX::Ones(10), response, kTestPrecision);
}

}  // namespace
