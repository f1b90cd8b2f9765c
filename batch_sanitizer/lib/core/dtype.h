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
#ifndef BATCH_SANITIZER_LIB_CORE_DTYPE_H_
#define BATCH_SANITIZER_LIB_CORE_DTYPE_H_

#include <ostream>

#include "absl/status/statusor.h"  // from @com_google_absl
#include "absl/strings/string_view.h"  // from @com_google_absl

namespace batch_sanitizer {

// Element type of a host-side array, as handed over by the caller.
enum class ElementType {
  kInt32 = 0,
  kFloat32 = 1,
  kFloat64 = 2,
};

// Numeric type of an engine value. The engine only computes in single or
// double precision; `kUnknown` is the sentinel returned by the resolver when
// neither variables nor data pin the type down.
enum class DataType {
  kUnknown = 0,
  kFloat = 1,
  kDouble = 2,
};

absl::string_view ElementTypeName(ElementType type);
absl::string_view DataTypeName(DataType type);

// Maps a dtype name to the engine type:
//   "float", "float32", "int", "int32", "int64" -> kFloat
//   "float64", "double"                         -> kDouble
absl::StatusOr<DataType> SanitizeDataType(absl::string_view name);

// Integer and single precision host data are computed in kFloat.
DataType SanitizeDataType(ElementType type);

// Host element type produced when exporting an engine value.
ElementType ToElementType(DataType type);

inline std::ostream& operator<<(std::ostream& os, DataType type) {
  return os << DataTypeName(type);
}

inline std::ostream& operator<<(std::ostream& os, ElementType type) {
  return os << ElementTypeName(type);
}

}  // namespace batch_sanitizer

#endif  // BATCH_SANITIZER_LIB_CORE_DTYPE_H_
