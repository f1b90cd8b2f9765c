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

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/log/check.h"  // from @com_google_absl
#include "absl/strings/str_cat.h"  // from @com_google_absl
#include "absl/strings/str_join.h"  // from @com_google_absl
#include "absl/types/span.h"  // from @com_google_absl
#include "Eigen/SparseCore"  // from @eigen_archive

namespace batch_sanitizer {

namespace {

Shape RowMajorStrides(absl::Span<const int64_t> shape) {
  Shape strides(shape.size());
  int64_t stride = 1;
  for (int i = static_cast<int>(shape.size()) - 1; i >= 0; --i) {
    strides[i] = stride;
    stride *= shape[i];
  }
  return strides;
}

}  // namespace

int64_t NumElements(absl::Span<const int64_t> shape) {
  int64_t count = 1;
  for (int64_t dim : shape) {
    count *= dim;
  }
  return count;
}

std::string ShapeToString(absl::Span<const int64_t> shape) {
  if (shape.size() == 1) {
    return absl::StrCat("(", shape[0], ",)");
  }
  return absl::StrCat("(", absl::StrJoin(shape, ", "), ")");
}

Shape StripLeadingUnitDims(absl::Span<const int64_t> shape) {
  size_t first = 0;
  while (first < shape.size() && shape[first] == 1) {
    ++first;
  }
  return Shape(shape.begin() + first, shape.end());
}

CsrMatrix MakeCsrMatrix(int64_t rows, int64_t cols,
                        absl::Span<const double> dense_values) {
  CHECK_EQ(rows * cols, static_cast<int64_t>(dense_values.size()));
  std::vector<Eigen::Triplet<double>> triplets;
  for (int64_t r = 0; r < rows; ++r) {
    for (int64_t c = 0; c < cols; ++c) {
      const double v = dense_values[r * cols + c];
      if (v != 0.0) {
        triplets.emplace_back(r, c, v);
      }
    }
  }
  CsrMatrix matrix(rows, cols);
  matrix.setFromTriplets(triplets.begin(), triplets.end());
  matrix.makeCompressed();
  return matrix;
}

HostArray::HostArray(ElementType type, Shape shape, std::vector<double> values)
    : type_(type),
      shape_(std::move(shape)),
      strides_(RowMajorStrides(shape_)),
      offset_(0),
      buffer_(std::make_shared<const std::vector<double>>(std::move(values))) {
  CHECK_EQ(NumElements(shape_), static_cast<int64_t>(buffer_->size()))
      << "Value count does not match shape " << ShapeToString(shape_);
}

bool HostArray::IsContiguous() const {
  // Strides of unit dimensions are irrelevant, as in numpy.
  int64_t expected = 1;
  for (int i = rank() - 1; i >= 0; --i) {
    if (shape_[i] != 1 && strides_[i] != expected) {
      return false;
    }
    expected *= shape_[i];
  }
  return true;
}

double HostArray::flat(int64_t index) const {
  DCHECK_GE(index, 0);
  DCHECK_LT(index, size());
  int64_t position = offset_;
  for (int i = rank() - 1; i >= 0; --i) {
    position += (index % shape_[i]) * strides_[i];
    index /= shape_[i];
  }
  return (*buffer_)[position];
}

HostArray HostArray::Transpose() const {
  return HostArray(type_, Shape(shape_.rbegin(), shape_.rend()),
                   Shape(strides_.rbegin(), strides_.rend()), offset_,
                   buffer_);
}

HostArray HostArray::Slice(int64_t index) const {
  CHECK_GT(rank(), 0) << "Cannot slice a scalar.";
  CHECK(index >= 0 && index < shape_[0])
      << "Index " << index << " out of range for shape "
      << ShapeToString(shape_);
  return HostArray(type_, Shape(shape_.begin() + 1, shape_.end()),
                   Shape(strides_.begin() + 1, strides_.end()),
                   offset_ + index * strides_[0], buffer_);
}

HostArray HostArray::Reshape(Shape shape) const {
  CHECK_EQ(NumElements(shape), size())
      << "Cannot reshape " << ShapeToString(shape_) << " to "
      << ShapeToString(shape);
  const HostArray contiguous = AsContiguous();
  Shape strides = RowMajorStrides(shape);
  return HostArray(type_, std::move(shape), std::move(strides),
                   contiguous.offset_, contiguous.buffer_);
}

HostArray HostArray::AsContiguous() const {
  if (IsContiguous()) {
    return *this;
  }
  std::vector<double> values;
  values.reserve(size());
  for (int64_t i = 0; i < size(); ++i) {
    values.push_back(flat(i));
  }
  return HostArray(type_, shape_, std::move(values));
}

}  // namespace batch_sanitizer
