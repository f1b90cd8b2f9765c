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
#include "batch_sanitizer/lib/core/value.h"

#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "absl/status/statusor.h"  // from @com_google_absl
#include "batch_sanitizer/lib/core/dtype.h"
#include "batch_sanitizer/lib/core/errors.h"
#include "batch_sanitizer/lib/core/host_array.h"
#include "batch_sanitizer/lib/core/test_utils.h"

namespace batch_sanitizer {
namespace {

using ::testing::ElementsAre;

MatrixXi Mask(std::initializer_list<std::initializer_list<int>> rows) {
  MatrixXi mask(rows);
  return mask;
}

TEST(ValueTest, DenseValue) {
  // Two sequences of (2,) samples, lengths 2 and 1.
  MatrixXf data(2, 4);
  data << 1, 2, 3, 4,  //
      5, 6, 0, 0;
  Value value = Value::CreateDense<float>(data, {2}, Mask({{2, 1}, {1, 0}}),
                                          {{2, 2}, {1, 2}});
  EXPECT_EQ(value.storage_format(), StorageFormat::kDense);
  EXPECT_FALSE(value.is_sparse());
  EXPECT_EQ(value.dtype(), DataType::kFloat);
  EXPECT_THAT(value.shape(), ElementsAre(2, 2, 2));
  EXPECT_THAT(value.SequenceLengths(), ElementsAre(2, 1));
  EXPECT_EQ(value.dense_data<float>()(1, 1), 6.0f);

  absl::StatusOr<std::vector<HostArray>> arrays = value.ToNdArrays();
  ASSERT_TRUE(arrays.ok()) << arrays.status();
  ASSERT_EQ(arrays->size(), 2);
  EXPECT_THAT((*arrays)[0].shape(), ElementsAre(2, 2));
  EXPECT_THAT((*arrays)[0].values(), ElementsAre(1, 2, 3, 4));
  EXPECT_THAT((*arrays)[1].shape(), ElementsAre(1, 2));
  EXPECT_THAT((*arrays)[1].values(), ElementsAre(5, 6));
  EXPECT_EQ((*arrays)[1].element_type(), ElementType::kFloat32);

  absl::StatusOr<std::vector<CsrMatrix>> csr = value.ToCsr();
  EXPECT_TRUE(IsTypeMismatch(csr.status())) << csr.status();
}

TEST(ValueTest, SparseValue) {
  std::vector<CsrMatrix> sequences = {
      testing_utils::Csr({{1, 0, 2}, {0, 3, 0}}),
      testing_utils::CsrRow({0, 0, 4})};
  Value value = Value::CreateSparse<double>(sequences, {3},
                                            Mask({{2, 1}, {1, 0}}));
  EXPECT_TRUE(value.is_sparse());
  EXPECT_EQ(value.dtype(), DataType::kDouble);
  EXPECT_THAT(value.shape(), ElementsAre(2, 2, 3));

  absl::StatusOr<std::vector<CsrMatrix>> csr = value.ToCsr();
  ASSERT_TRUE(csr.ok()) << csr.status();
  ASSERT_EQ(csr->size(), 2);
  EXPECT_EQ((*csr)[0].rows(), 2);
  EXPECT_EQ((*csr)[0].coeff(1, 1), 3.0);
  EXPECT_EQ((*csr)[1].rows(), 1);
  EXPECT_EQ((*csr)[1].coeff(0, 2), 4.0);

  absl::StatusOr<std::vector<HostArray>> arrays = value.ToNdArrays();
  EXPECT_TRUE(IsTypeMismatch(arrays.status())) << arrays.status();
}

TEST(ValueTest, SparseFloatIsExportedAsDouble) {
  std::vector<CsrMatrixX<float>> sequences = {
      testing_utils::CsrRow({0, 1.5}).cast<float>()};
  Value value = Value::CreateSparse<float>(sequences, {2}, Mask({{1}}));
  EXPECT_EQ(value.dtype(), DataType::kFloat);

  absl::StatusOr<std::vector<CsrMatrix>> csr = value.ToCsr();
  ASSERT_TRUE(csr.ok()) << csr.status();
  EXPECT_EQ((*csr)[0].coeff(0, 1), 1.5);
}

}  // namespace
}  // namespace batch_sanitizer
