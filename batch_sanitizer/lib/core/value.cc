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

#include <cstdint>
#include <ostream>
#include <variant>
#include <vector>

#include "absl/log/check.h"  // from @com_google_absl
#include "absl/status/statusor.h"  // from @com_google_absl
#include "batch_sanitizer/lib/core/dtype.h"
#include "batch_sanitizer/lib/core/errors.h"
#include "batch_sanitizer/lib/core/host_array.h"

namespace batch_sanitizer {

std::ostream& operator<<(std::ostream& os, StorageFormat format) {
  switch (format) {
    case StorageFormat::kDense:
      return os << "dense";
    case StorageFormat::kSparseCsr:
      return os << "sparse_csr";
  }
  return os << "unknown";
}

StorageFormat Value::storage_format() const {
  return std::holds_alternative<MatrixXf>(storage_) ||
                 std::holds_alternative<MatrixXd>(storage_)
             ? StorageFormat::kDense
             : StorageFormat::kSparseCsr;
}

DataType Value::dtype() const {
  return std::holds_alternative<MatrixXd>(storage_) ||
                 std::holds_alternative<std::vector<CsrMatrixX<double>>>(
                     storage_)
             ? DataType::kDouble
             : DataType::kFloat;
}

Shape Value::shape() const {
  Shape shape = {num_sequences(), max_sequence_length()};
  shape.insert(shape.end(), sample_shape_.begin(), sample_shape_.end());
  return shape;
}

std::vector<int64_t> Value::SequenceLengths() const {
  std::vector<int64_t> lengths;
  lengths.reserve(num_sequences());
  for (int64_t i = 0; i < num_sequences(); ++i) {
    int64_t length = 0;
    while (length < max_sequence_length() &&
           mask_(i, length) != kMaskInvalid) {
      ++length;
    }
    lengths.push_back(length);
  }
  return lengths;
}

template <typename T>
std::vector<HostArray> Value::DenseToNdArrays(const MatrixX<T>& data) const {
  const int64_t sample_size = NumElements(sample_shape_);
  const std::vector<int64_t> lengths = SequenceLengths();
  const ElementType element_type = ToElementType(dtype());

  std::vector<HostArray> arrays;
  arrays.reserve(num_sequences());
  for (int64_t i = 0; i < num_sequences(); ++i) {
    const int64_t count = lengths[i] * sample_size;
    std::vector<double> values(data.row(i).data(), data.row(i).data() + count);
    const Shape& shape = sequence_shapes_[i];
    CHECK_EQ(NumElements(shape), count)
        << "Sequence " << i << " of length " << lengths[i]
        << " does not match its packed shape " << ShapeToString(shape);
    arrays.emplace_back(element_type, shape, std::move(values));
  }
  return arrays;
}

absl::StatusOr<std::vector<HostArray>> Value::ToNdArrays() const {
  if (const auto* data = std::get_if<MatrixXf>(&storage_)) {
    return DenseToNdArrays(*data);
  }
  if (const auto* data = std::get_if<MatrixXd>(&storage_)) {
    return DenseToNdArrays(*data);
  }
  return TypeMismatchError(
      "ToNdArrays() requires dense storage, but the value is stored as ",
      "sparse CSR; use ToCsr() instead.");
}

absl::StatusOr<HostArray> Value::ToStackedNdArray() const {
  absl::StatusOr<std::vector<HostArray>> arrays = ToNdArrays();
  if (!arrays.ok()) {
    return arrays.status();
  }
  if (arrays->empty()) {
    return HostArray(ToElementType(dtype()), {0}, {});
  }
  const Shape& first = arrays->front().shape();
  std::vector<double> values;
  values.reserve(arrays->size() * NumElements(first));
  for (int i = 0; i < static_cast<int>(arrays->size()); ++i) {
    const HostArray& array = (*arrays)[i];
    if (array.shape() != first) {
      return ShapeMismatchError("Cannot stack sequence ", i, " of shape ",
                                ShapeToString(array.shape()),
                                " onto sequences of shape ",
                                ShapeToString(first), ".");
    }
    values.insert(values.end(), array.values().begin(), array.values().end());
  }
  Shape shape = {static_cast<int64_t>(arrays->size())};
  shape.insert(shape.end(), first.begin(), first.end());
  return HostArray(arrays->front().element_type(), std::move(shape),
                   std::move(values));
}

absl::StatusOr<std::vector<CsrMatrix>> Value::ToCsr() const {
  std::vector<CsrMatrix> matrices;
  if (const auto* data =
          std::get_if<std::vector<CsrMatrixX<float>>>(&storage_)) {
    matrices.reserve(data->size());
    for (const CsrMatrixX<float>& sequence : *data) {
      matrices.emplace_back(sequence.cast<double>());
    }
    return matrices;
  }
  if (const auto* data =
          std::get_if<std::vector<CsrMatrixX<double>>>(&storage_)) {
    return *data;
  }
  return TypeMismatchError(
      "ToCsr() requires sparse storage, but the value is stored dense; use ",
      "ToNdArrays() instead.");
}

}  // namespace batch_sanitizer
