// Copyright 2024 The Batch Sanitizer Authors.
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
#include "batch_sanitizer/lib/core/host_array.h"

#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "batch_sanitizer/lib/core/dtype.h"
#include "batch_sanitizer/lib/core/test_utils.h"

namespace batch_sanitizer {
namespace {

using ::testing::ElementsAre;
using testing_utils::Arange;

TEST(ShapeTest, StripLeadingUnitDims) {
  EXPECT_THAT(StripLeadingUnitDims({1, 3}), ElementsAre(3));
  EXPECT_THAT(StripLeadingUnitDims({1, 1, 2, 1}), ElementsAre(2, 1));
  EXPECT_TRUE(StripLeadingUnitDims({1}).empty());
  EXPECT_THAT(StripLeadingUnitDims({3, 1}), ElementsAre(3, 1));
}

TEST(ShapeTest, ToString) {
  EXPECT_EQ(ShapeToString({}), "()");
  EXPECT_EQ(ShapeToString({5}), "(5,)");
  EXPECT_EQ(ShapeToString({2, 3}), "(2, 3)");
  EXPECT_EQ(NumElements({}), 1);
  EXPECT_EQ(NumElements({2, 0, 3}), 0);
}

TEST(HostArrayTest, FromValuesKeepsElementType) {
  HostArray ints = HostArray::FromVector<int32_t>({1, 2, 3});
  EXPECT_EQ(ints.element_type(), ElementType::kInt32);
  EXPECT_THAT(ints.shape(), ElementsAre(3));
  EXPECT_THAT(ints.values(), ElementsAre(1.0, 2.0, 3.0));

  HostArray doubles = HostArray::FromValues<double>({0.5, 1.5}, {2, 1});
  EXPECT_EQ(doubles.element_type(), ElementType::kFloat64);
  EXPECT_EQ(doubles.rank(), 2);

  HostArray scalar = HostArray::Scalar(4.0);
  EXPECT_EQ(scalar.rank(), 0);
  EXPECT_EQ(scalar.size(), 1);
  EXPECT_EQ(scalar.flat(0), 4.0);
}

TEST(HostArrayTest, TransposeIsNotContiguous) {
  HostArray array = Arange({2, 3});
  EXPECT_TRUE(array.IsContiguous());

  HostArray transposed = array.Transpose();
  EXPECT_THAT(transposed.shape(), ElementsAre(3, 2));
  EXPECT_FALSE(transposed.IsContiguous());
  // [[0, 3], [1, 4], [2, 5]]
  EXPECT_EQ(transposed.flat(1), 3.0);
  EXPECT_EQ(transposed.flat(2), 1.0);

  HostArray copy = transposed.AsContiguous();
  EXPECT_TRUE(copy.IsContiguous());
  EXPECT_THAT(copy.values(), ElementsAre(0, 3, 1, 4, 2, 5));
}

TEST(HostArrayTest, UnitDimensionsDoNotBreakContiguity) {
  // Transposing a (1, 3) row gives a (3, 1) column with the same layout.
  EXPECT_TRUE(Arange({1, 3}).Transpose().IsContiguous());
  EXPECT_TRUE(Arange({4}).Transpose().IsContiguous());
}

TEST(HostArrayTest, SliceAndReshape) {
  HostArray array = Arange({3, 2});
  HostArray row = array.Slice(1);
  EXPECT_THAT(row.shape(), ElementsAre(2));
  EXPECT_THAT(row.values(), ElementsAre(2, 3));

  HostArray column = array.Transpose().Slice(1);
  EXPECT_FALSE(column.IsContiguous());
  EXPECT_THAT(column.AsContiguous().values(), ElementsAre(1, 3, 5));

  HostArray reshaped = array.Reshape({6});
  EXPECT_THAT(reshaped.shape(), ElementsAre(6));
  EXPECT_THAT(array.Transpose().Reshape({6}).values(),
              ElementsAre(0, 2, 4, 1, 3, 5));
}

TEST(HostArrayTest, MakeCsrMatrixDropsZeros) {
  CsrMatrix matrix = MakeCsrMatrix(2, 3, {1, 0, 2, 0, 0, 3});
  EXPECT_EQ(matrix.rows(), 2);
  EXPECT_EQ(matrix.cols(), 3);
  EXPECT_EQ(matrix.nonZeros(), 3);
  EXPECT_EQ(matrix.coeff(0, 2), 2.0);
  EXPECT_EQ(matrix.coeff(1, 2), 3.0);
}

}  // namespace
}  // namespace batch_sanitizer
