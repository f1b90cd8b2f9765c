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
#ifndef BATCH_SANITIZER_LIB_CORE_VARIABLE_H_
#define BATCH_SANITIZER_LIB_CORE_VARIABLE_H_

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/strings/string_view.h"  // from @com_google_absl
#include "absl/types/span.h"  // from @com_google_absl
#include "batch_sanitizer/lib/core/axis.h"
#include "batch_sanitizer/lib/core/dtype.h"
#include "batch_sanitizer/lib/core/host_array.h"

namespace batch_sanitizer {

enum class VariableKind {
  kInput = 0,
  kParameter = 1,
  kConstant = 2,
  kPlaceholder = 3,
};

// Declared operand of the engine. Only the declaration is modeled here: the
// sample shape data is checked against, the dtype, whether the engine expects
// sparse storage, and for parameters and constants their initial value.
class Variable {
 public:
  Variable(VariableKind kind, Shape shape, DataType dtype, bool is_sparse,
           std::vector<Axis> dynamic_axes, std::string name,
           std::optional<HostArray> value = std::nullopt)
      : kind_(kind),
        shape_(std::move(shape)),
        dtype_(dtype),
        is_sparse_(is_sparse),
        dynamic_axes_(std::move(dynamic_axes)),
        name_(std::move(name)),
        value_(std::move(value)) {}

  VariableKind kind() const { return kind_; }
  // Shape of a single sample, without dynamic axes.
  const Shape& shape() const { return shape_; }
  DataType dtype() const { return dtype_; }
  bool is_sparse() const { return is_sparse_; }
  const std::vector<Axis>& dynamic_axes() const { return dynamic_axes_; }
  const std::string& name() const { return name_; }
  const std::optional<HostArray>& value() const { return value_; }

  bool HasConcreteDataType() const { return dtype_ != DataType::kUnknown; }

 private:
  VariableKind kind_;
  Shape shape_;
  DataType dtype_;
  bool is_sparse_;
  std::vector<Axis> dynamic_axes_;
  std::string name_;
  std::optional<HostArray> value_;
};

Variable InputVariable(Shape shape, bool is_sparse = false,
                       DataType dtype = DataType::kFloat,
                       absl::string_view name = "");

// Dtype and shape are taken from the initial value.
Variable Parameter(const HostArray& init, absl::string_view name = "");

Variable Constant(double value, DataType dtype = DataType::kFloat,
                  absl::string_view name = "");

// Placeholders carry a shape but no dtype until they are bound.
Variable PlaceholderVariable(Shape shape, absl::string_view name = "");

// Resolves the dtype of an operation over `variables` and `data`.
//
// The first variable with a concrete dtype wins, regardless of data. Otherwise
// data decides: any float64 array yields kDouble, any other data kFloat.
// Returns kUnknown when neither variables nor data determine the type.
DataType GetDataType(absl::Span<const Variable* const> variables,
                     absl::Span<const HostArray> data = {});

}  // namespace batch_sanitizer

#endif  // BATCH_SANITIZER_LIB_CORE_VARIABLE_H_
