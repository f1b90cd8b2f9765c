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
#include "batch_sanitizer/lib/core/variable.h"

#include <string>
#include <utility>

#include "absl/log/log.h"  // from @com_google_absl
#include "absl/strings/string_view.h"  // from @com_google_absl
#include "absl/types/span.h"  // from @com_google_absl
#include "batch_sanitizer/lib/core/axis.h"
#include "batch_sanitizer/lib/core/dtype.h"
#include "batch_sanitizer/lib/core/host_array.h"

namespace batch_sanitizer {

Variable InputVariable(Shape shape, bool is_sparse, DataType dtype,
                       absl::string_view name) {
  return Variable(VariableKind::kInput, std::move(shape), dtype, is_sparse,
                  DefaultInputVariableDynamicAxes(), std::string(name));
}

Variable Parameter(const HostArray& init, absl::string_view name) {
  return Variable(VariableKind::kParameter, init.shape(),
                  SanitizeDataType(init.element_type()), /*is_sparse=*/false,
                  /*dynamic_axes=*/{}, std::string(name), init);
}

Variable Constant(double value, DataType dtype, absl::string_view name) {
  return Variable(VariableKind::kConstant, /*shape=*/{}, dtype,
                  /*is_sparse=*/false, /*dynamic_axes=*/{}, std::string(name),
                  HostArray::Scalar(value, ToElementType(dtype)));
}

Variable PlaceholderVariable(Shape shape, absl::string_view name) {
  return Variable(VariableKind::kPlaceholder, std::move(shape),
                  DataType::kUnknown, /*is_sparse=*/false,
                  /*dynamic_axes=*/{}, std::string(name));
}

DataType GetDataType(absl::Span<const Variable* const> variables,
                     absl::Span<const HostArray> data) {
  // Variables are checked before data: a declared type is never overridden by
  // whatever precision the caller happened to feed.
  for (const Variable* variable : variables) {
    if (variable != nullptr && variable->HasConcreteDataType()) {
      return variable->dtype();
    }
  }
  if (data.empty()) {
    VLOG(2) << "No concrete dtype among " << variables.size()
            << " variables and no data.";
    return DataType::kUnknown;
  }
  for (const HostArray& array : data) {
    if (array.element_type() == ElementType::kFloat64) {
      return DataType::kDouble;
    }
  }
  return DataType::kFloat;
}

}  // namespace batch_sanitizer
