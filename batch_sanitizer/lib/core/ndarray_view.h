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
#ifndef BATCH_SANITIZER_LIB_CORE_NDARRAY_VIEW_H_
#define BATCH_SANITIZER_LIB_CORE_NDARRAY_VIEW_H_

#include <type_traits>
#include <utility>
#include <variant>

#include "absl/log/check.h"  // from @com_google_absl
#include "Eigen/Core"  // from @eigen_archive
#include "batch_sanitizer/lib/core/dtype.h"
#include "batch_sanitizer/lib/core/host_array.h"

namespace batch_sanitizer {

template <typename T>
using RowVectorX = Eigen::Matrix<T, 1, Eigen::Dynamic, Eigen::RowMajor>;

using RowVectorXf = RowVectorX<float>;
using RowVectorXd = RowVectorX<double>;

// Engine-side dense array holding a single input (no batch or sequence axes),
// e.g. the initial value of a parameter or a constant.
class NdArrayView {
 public:
  template <typename T>
  NdArrayView(Shape shape, RowVectorX<T> values)
      : shape_(std::move(shape)), values_(std::move(values)) {
    static_assert(std::is_same_v<T, float> || std::is_same_v<T, double>);
    CHECK_EQ(NumElements(shape_), values_size());
  }

  const Shape& shape() const { return shape_; }
  DataType dtype() const {
    return std::holds_alternative<RowVectorXd>(values_) ? DataType::kDouble
                                                        : DataType::kFloat;
  }

  template <typename T>
  const RowVectorX<T>& values() const {
    const auto* values = std::get_if<RowVectorX<T>>(&values_);
    CHECK(values != nullptr) << "NdArrayView holds " << dtype() << " values.";
    return *values;
  }

  HostArray ToHostArray() const;

 private:
  int64_t values_size() const {
    return std::visit([](const auto& v) -> int64_t { return v.size(); },
                      values_);
  }

  Shape shape_;
  std::variant<RowVectorXf, RowVectorXd> values_;
};

// Converts a single host array (or scalar) to the engine representation in
// `dtype`. kUnknown keeps the precision implied by the array's element type.
NdArrayView SanitizeInput(const HostArray& data,
                          DataType dtype = DataType::kUnknown);

}  // namespace batch_sanitizer

#endif  // BATCH_SANITIZER_LIB_CORE_NDARRAY_VIEW_H_
