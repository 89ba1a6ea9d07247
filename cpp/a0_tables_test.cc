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

#include <string>

#include "gtest/gtest.h"
#include "common.h"

namespace {

TEST(A0TablesTest, ParseIgnoresCase) {
  A0Type type = kSqat1;
  ASSERT_TRUE(ParseA0Type("fastl2007ff", &type));
  EXPECT_EQ(kFastl2007FreeField, type);
  ASSERT_TRUE(ParseA0Type("FASTL2007DF", &type));
  EXPECT_EQ(kFastl2007DiffuseField, type);
  ASSERT_TRUE(ParseA0Type("FluctuationStrength_Osses2016", &type));
  EXPECT_EQ(kFluctuationStrengthOsses2016, type);
  ASSERT_TRUE(ParseA0Type("SQAT1", &type));
  EXPECT_EQ(kSqat1, type);
}

TEST(A0TablesTest, ParseRejectsUnknownNames) {
  A0Type type = kFastl2007DiffuseField;
  EXPECT_FALSE(ParseA0Type("bogus", &type));
  EXPECT_FALSE(ParseA0Type("", &type));
  EXPECT_FALSE(ParseA0Type("fastl2007", &type));
  EXPECT_FALSE(ParseA0Type("fastl2007ff ", &type));
  EXPECT_FALSE(ParseA0Type("sqat12", &type));
  // Unchanged on failure.
  EXPECT_EQ(kFastl2007DiffuseField, type);
}

TEST(A0TablesTest, NamesRoundTrip) {
  for (int i = 0; i < kNumA0Types; ++i) {
    const A0Type type = static_cast<A0Type>(i);
    A0Type parsed = (type == kSqat1) ? kFastl2007FreeField : kSqat1;
    ASSERT_TRUE(ParseA0Type(A0TypeName(type), &parsed));
    EXPECT_EQ(type, parsed);
  }
}

TEST(A0TablesTest, TableSizes) {
  EXPECT_EQ(25, GetA0Table(kFastl2007FreeField).num_rows);
  EXPECT_EQ(28, GetA0Table(kFastl2007DiffuseField).num_rows);
  EXPECT_EQ(13, GetA0Table(kFluctuationStrengthOsses2016).num_rows);
  EXPECT_EQ(39, GetA0Table(kSqat1).num_rows);
}

TEST(A0TablesTest, RowsAreSortedAndSpanZeroTo26Bark) {
  for (int i = 0; i < kNumA0Types; ++i) {
    const A0Table table = GetA0Table(static_cast<A0Type>(i));
    SCOPED_TRACE(A0TypeName(static_cast<A0Type>(i)));
    EXPECT_EQ(0, table.min_bark());
    EXPECT_EQ(26, table.max_bark());
    for (int row = 1; row < table.num_rows; ++row) {
      EXPECT_GE(table.rows[row].bark, table.rows[row - 1].bark);
    }
    const ArrayX barks = table.barks();
    const ArrayX gains_db = table.gains_db();
    ASSERT_EQ(table.num_rows, barks.size());
    ASSERT_EQ(table.num_rows, gains_db.size());
    for (int row = 0; row < table.num_rows; ++row) {
      EXPECT_EQ(table.rows[row].bark, barks[row]);
      EXPECT_EQ(table.rows[row].gain_db, gains_db[row]);
    }
  }
}

TEST(A0TablesTest, MinusInfinityRows) {
  EXPECT_EQ(-999, GetA0Table(kFastl2007FreeField).rows[24].gain_db);
  EXPECT_EQ(-999, GetA0Table(kFastl2007DiffuseField).rows[27].gain_db);
  EXPECT_EQ(-999, GetA0Table(kFluctuationStrengthOsses2016).rows[12].gain_db);
  const A0Table sqat1 = GetA0Table(kSqat1);
  EXPECT_EQ(-999, sqat1.rows[0].gain_db);
  EXPECT_EQ(-999, sqat1.rows[38].gain_db);
}

TEST(A0TablesTest, CalibrationPoints) {
  const A0Table free_field = GetA0Table(kFastl2007FreeField);
  EXPECT_EQ(16.5, free_field.rows[8].bark);
  EXPECT_EQ(6.55, free_field.rows[8].gain_db);
  EXPECT_EQ(19.5, free_field.rows[13].bark);
  EXPECT_EQ(-0.08, free_field.rows[13].gain_db);

  const A0Table diffuse_field = GetA0Table(kFastl2007DiffuseField);
  EXPECT_EQ(9, diffuse_field.rows[5].bark);
  EXPECT_EQ(2.52, diffuse_field.rows[5].gain_db);
  EXPECT_EQ(23.5, diffuse_field.rows[24].bark);
  EXPECT_EQ(-18.24, diffuse_field.rows[24].gain_db);

  const A0Table osses2016 = GetA0Table(kFluctuationStrengthOsses2016);
  EXPECT_EQ(19, osses2016.rows[2].bark);
  EXPECT_EQ(0, osses2016.rows[2].gain_db);
  EXPECT_EQ(25, osses2016.rows[11].bark);
  EXPECT_EQ(-130, osses2016.rows[11].gain_db);

  const A0Table sqat1 = GetA0Table(kSqat1);
  EXPECT_EQ(0.5, sqat1.rows[1].bark);
  EXPECT_EQ(-34.7, sqat1.rows[1].gain_db);
  EXPECT_EQ(16.5, sqat1.rows[24].bark);
  EXPECT_EQ(7.38, sqat1.rows[24].gain_db);
}

}  // namespace
