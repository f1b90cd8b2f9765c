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
#ifndef BATCH_SANITIZER_LIB_CORE_HOST_ARRAY_H_
#define BATCH_SANITIZER_LIB_CORE_HOST_ARRAY_H_

#include <cstdint>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "absl/log/check.h"  // from @com_google_absl
#include "absl/types/span.h"  // from @com_google_absl
#include "Eigen/Core"  // from @eigen_archive
#include "Eigen/SparseCore"  // from @eigen_archive
#include "batch_sanitizer/lib/core/dtype.h"

namespace batch_sanitizer {

using Shape = std::vector<int64_t>;

// numpy uses row major order, while eigen defaults to column major.
template <typename T>
using MatrixX =
    Eigen::Matrix<T, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

using MatrixXi = MatrixX<int>;
using MatrixXf = MatrixX<float>;
using MatrixXd = MatrixX<double>;

// A row-major Eigen sparse matrix is exactly the CSR layout: `outerIndexPtr()`
// holds the row pointers, `innerIndexPtr()` the column indices.
template <typename T>
using CsrMatrixX = Eigen::SparseMatrix<T, Eigen::RowMajor, int>;

// Host-side CSR matrix. A 1-D literal such as [5, 0, 1] is a (1, n) matrix.
using CsrMatrix = CsrMatrixX<double>;

int64_t NumElements(absl::Span<const int64_t> shape);

// Formats a shape the way numpy prints it, e.g. "(2, 3)", "(5,)" or "()".
std::string ShapeToString(absl::Span<const int64_t> shape);

// Drops leading unit dimensions: (1, 1, 3) -> (3), (2, 1) -> (2, 1).
Shape StripLeadingUnitDims(absl::Span<const int64_t> shape);

// Builds a CSR matrix from its dense row-major form.
CsrMatrix MakeCsrMatrix(int64_t rows, int64_t cols,
                        absl::Span<const double> dense_values);

// Read-only n-d array owned by the caller of the sanitizer.
//
// Values are kept in a shared double buffer, which represents every supported
// element type exactly; `element_type()` remembers what the caller passed in.
// Strides are counted in elements and allow non-contiguous views (e.g. the
// result of `Transpose()`), which the packers reject.
class HostArray {
 public:
  HostArray() : HostArray(ElementType::kFloat64, {}, {0.0}) {}

  template <typename T>
  static HostArray FromValues(const std::vector<T>& values, Shape shape) {
    static_assert(std::is_same_v<T, int32_t> || std::is_same_v<T, float> ||
                      std::is_same_v<T, double>,
                  "Unsupported host element type.");
    ElementType type = std::is_same_v<T, int32_t> ? ElementType::kInt32
                       : std::is_same_v<T, float> ? ElementType::kFloat32
                                                  : ElementType::kFloat64;
    return HostArray(type, std::move(shape),
                     std::vector<double>(values.begin(), values.end()));
  }

  // 1-D array, the equivalent of np.asarray([v0, v1, ...]).
  template <typename T>
  static HostArray FromVector(const std::vector<T>& values) {
    return FromValues(values, {static_cast<int64_t>(values.size())});
  }

  static HostArray Scalar(double value,
                          ElementType type = ElementType::kFloat64) {
    return HostArray(type, {}, {value});
  }

  // Creates an array of the given element type from double values. Values are
  // expected to be representable in `type`.
  HostArray(ElementType type, Shape shape, std::vector<double> values);

  ElementType element_type() const { return type_; }
  const Shape& shape() const { return shape_; }
  const Shape& strides() const { return strides_; }
  int rank() const { return shape_.size(); }
  int64_t size() const { return NumElements(shape_); }

  // True if elements are laid out in row-major order without gaps.
  bool IsContiguous() const;

  // Element at the given row-major logical position, honoring strides.
  double flat(int64_t index) const;

  // Direct access to the contiguous values. Requires `IsContiguous()`.
  absl::Span<const double> values() const {
    CHECK(IsContiguous()) << "values() requires a contiguous array.";
    return absl::MakeConstSpan(*buffer_).subspan(offset_, size());
  }

  // View with the axes reversed, sharing the buffer (numpy's `a.T`).
  HostArray Transpose() const;

  // View of element `index` along axis 0.
  HostArray Slice(int64_t index) const;

  // Same values, new shape. The element count must not change.
  HostArray Reshape(Shape shape) const;

  // Returns a contiguous copy (or this array if already contiguous).
  HostArray AsContiguous() const;

 private:
  HostArray(ElementType type, Shape shape, Shape strides, int64_t offset,
            std::shared_ptr<const std::vector<double>> buffer)
      : type_(type),
        shape_(std::move(shape)),
        strides_(std::move(strides)),
        offset_(offset),
        buffer_(std::move(buffer)) {}

  ElementType type_;
  Shape shape_;
  Shape strides_;
  int64_t offset_;
  std::shared_ptr<const std::vector<double>> buffer_;
};

}  // namespace batch_sanitizer

#endif  // BATCH_SANITIZER_LIB_CORE_HOST_ARRAY_H_
