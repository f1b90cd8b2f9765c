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
#include "batch_sanitizer/lib/core/dtype.h"

#include "absl/log/log.h"  // from @com_google_absl
#include "absl/status/statusor.h"  // from @com_google_absl
#include "absl/strings/string_view.h"  // from @com_google_absl
#include "batch_sanitizer/lib/core/errors.h"

namespace batch_sanitizer {

absl::string_view ElementTypeName(ElementType type) {
  switch (type) {
    case ElementType::kInt32:
      return "int32";
    case ElementType::kFloat32:
      return "float32";
    case ElementType::kFloat64:
      return "float64";
  }
  LOG(FATAL) << "Unknown element type: " << static_cast<int>(type);
}

absl::string_view DataTypeName(DataType type) {
  switch (type) {
    case DataType::kUnknown:
      return "unknown";
    case DataType::kFloat:
      return "float";
    case DataType::kDouble:
      return "double";
  }
  LOG(FATAL) << "Unknown data type: " << static_cast<int>(type);
}

absl::StatusOr<DataType> SanitizeDataType(absl::string_view name) {
  if (name == "float" || name == "float32" || name == "int" ||
      name == "int32" || name == "int64") {
    return DataType::kFloat;
  } else if (name == "float64" || name == "double") {
    return DataType::kDouble;
  }
  return UnsupportedInputError("Unsupported dtype name: '", name, "'.");
}

DataType SanitizeDataType(ElementType type) {
  return type == ElementType::kFloat64 ? DataType::kDouble : DataType::kFloat;
}

ElementType ToElementType(DataType type) {
  // kUnknown only shows up before resolution; exported values are always
  // typed.
  return type == DataType::kDouble ? ElementType::kFloat64
                                   : ElementType::kFloat32;
}

}  // namespace batch_sanitizer
