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

#include "interpolation.h"

#include <cmath>
#include <limits>

#include "gtest/gtest.h"
#include "common.h"
#include "outerear_util.h"
#include "test_util.h"

namespace {

class Interp1Test : public testing::Test {
 protected:
  Interp1Test()
      : x_(MakeArray({0, 10, 11, 16.5, 26})),
        y_(MakeArray({0, 0, 0.25, 6.55, -999})) {}

  ArrayX x_;
  ArrayX y_;
};

TEST_F(Interp1Test, ExactAtSamplePoints) {
  const ArrayX yq = Interp1(x_, y_, x_);
  for (int i = 0; i < x_.size(); ++i) {
    EXPECT_EQ(y_[i], yq[i]);
  }
}

TEST_F(Interp1Test, LinearBetweenSamplePoints) {
  const ArrayX yq = Interp1(x_, y_, MakeArray({5, 10.5, 13.75, 21.25}));
  EXPECT_NEAR(0, yq[0], kTestPrecision);
  EXPECT_NEAR(0.125, yq[1], kTestPrecision);
  EXPECT_NEAR(3.4, yq[2], kTestPrecision);
  EXPECT_NEAR((6.55 - 999) / 2, yq[3], kTestPrecision);
}

TEST_F(Interp1Test, NaNOutsideOfRange) {
  const FPType nan = std::numeric_limits<FPType>::quiet_NaN();
  const ArrayX yq =
      Interp1(x_, y_, MakeArray({-1e-9, 26.0000001, -5, 100, nan}));
  for (int i = 0; i < yq.size(); ++i) {
    EXPECT_TRUE(std::isnan(yq[i])) << "yq[" << i << "] = " << yq[i];
  }
}

TEST_F(Interp1Test, EmptyQuery) {
  EXPECT_EQ(0, Interp1(x_, y_, ArrayX()).size());
}

TEST(DecibelTest, FromDb) {
  const ArrayX gain = FromDb(MakeArray({0, 20, -20, 6.55}));
  EXPECT_EQ(1, gain[0]);
  EXPECT_NEAR(10, gain[1], kTestPrecision);
  EXPECT_NEAR(0.1, gain[2], kTestPrecision);
  EXPECT_NEAR(std::pow(10.0, 6.55 / 20), gain[3], kTestPrecision);
  AssertArrayNear(MakeArray({0, 20, -20, 6.55}), ToDb(gain), kTestPrecision);
}

TEST(DecibelTest, ZeroNaNs) {
  const FPType nan = std::numeric_limits<FPType>::quiet_NaN();
  ArrayX values = FromDb(MakeArray({nan, 0, nan}));
  ZeroNaNs(&values);
  EXPECT_EQ(0.0, values[0]);
  EXPECT_EQ(1.0, values[1]);
  EXPECT_EQ(0.0, values[2]);
}

}  // namespace
