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
#include "batch_sanitizer/lib/core/sequence_data.h"

#include <string>

#include "absl/strings/str_cat.h"  // from @com_google_absl
#include "absl/strings/str_format.h"  // from @com_google_absl

namespace batch_sanitizer {

std::string SequenceData::DebugString() const {
  switch (kind_) {
    case Kind::kArray:
      return absl::StrCat("array", ShapeToString(array_.shape()),
                          array_.IsContiguous() ? "" : " (non-contiguous)");
    case Kind::kList:
      return absl::StrFormat("list[%d]", items_.size());
    case Kind::kCsr:
      return absl::StrFormat("csr(%d, %d)", csr_.rows(), csr_.cols());
    case Kind::kScalars:
      return absl::StrFormat("scalars[%d]", scalars_.size());
  }
  return "unknown";
}

}  // namespace batch_sanitizer
