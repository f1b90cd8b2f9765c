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
#include "batch_sanitizer/lib/core/axis.h"

#include <vector>

#include "absl/types/span.h"  // from @com_google_absl

namespace batch_sanitizer {

Axis Axis::DefaultBatchAxis() { return Axis("defaultBatchAxis"); }

Axis Axis::DefaultDynamicAxis() { return Axis("defaultDynamicAxis"); }

std::vector<Axis> DefaultInputVariableDynamicAxes() {
  return {Axis::DefaultBatchAxis(), Axis::DefaultDynamicAxis()};
}

std::vector<Axis> SanitizeDynamicAxes(absl::Span<const Axis> axes) {
  return std::vector<Axis>(axes.rbegin(), axes.rend());
}

std::vector<Axis> SanitizeDynamicAxes(const Axis& axis) { return {axis}; }

}  // namespace batch_sanitizer
