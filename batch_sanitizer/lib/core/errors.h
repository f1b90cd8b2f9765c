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
#ifndef BATCH_SANITIZER_LIB_CORE_ERRORS_H_
#define BATCH_SANITIZER_LIB_CORE_ERRORS_H_

#include <utility>

#include "absl/status/status.h"  // from @com_google_absl
#include "absl/strings/str_cat.h"  // from @com_google_absl

namespace batch_sanitizer {

// Every failure surfaced by the sanitizer belongs to one of three classes, each
// mapped to a single status code so callers (and the Python layer) can tell
// them apart without parsing messages:
//
//   ShapeMismatch    -> kInvalidArgument
//   TypeMismatch     -> kFailedPrecondition
//   UnsupportedInput -> kUnimplemented

template <typename... Args>
absl::Status ShapeMismatchError(Args&&... args) {
  return absl::InvalidArgumentError(absl::StrCat(std::forward<Args>(args)...));
}

template <typename... Args>
absl::Status TypeMismatchError(Args&&... args) {
  return absl::FailedPreconditionError(
      absl::StrCat(std::forward<Args>(args)...));
}

template <typename... Args>
absl::Status UnsupportedInputError(Args&&... args) {
  return absl::UnimplementedError(absl::StrCat(std::forward<Args>(args)...));
}

inline bool IsShapeMismatch(const absl::Status& status) {
  return absl::IsInvalidArgument(status);
}

inline bool IsTypeMismatch(const absl::Status& status) {
  return absl::IsFailedPrecondition(status);
}

inline bool IsUnsupportedInput(const absl::Status& status) {
  return absl::IsUnimplemented(status);
}

}  // namespace batch_sanitizer

#endif  // BATCH_SANITIZER_LIB_CORE_ERRORS_H_
