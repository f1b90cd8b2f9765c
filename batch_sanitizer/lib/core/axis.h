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
#ifndef BATCH_SANITIZER_LIB_CORE_AXIS_H_
#define BATCH_SANITIZER_LIB_CORE_AXIS_H_

#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "absl/types/span.h"  // from @com_google_absl

namespace batch_sanitizer {

// A named dynamic axis of a variable. The batch axis indexes sequences, the
// default dynamic axis indexes samples within a sequence.
class Axis {
 public:
  explicit Axis(std::string name) : name_(std::move(name)) {}

  static Axis DefaultBatchAxis();
  static Axis DefaultDynamicAxis();

  const std::string& name() const { return name_; }

  bool operator==(const Axis& other) const = default;

  friend std::ostream& operator<<(std::ostream& os, const Axis& axis) {
    return os << "Axis(" << axis.name_ << ")";
  }

 private:
  std::string name_;
};

// {batch axis, default dynamic axis}, outermost first.
std::vector<Axis> DefaultInputVariableDynamicAxes();

// The engine lists dynamic axes innermost first, the host API outermost
// first; this flips between the two.
std::vector<Axis> SanitizeDynamicAxes(absl::Span<const Axis> axes);
std::vector<Axis> SanitizeDynamicAxes(const Axis& axis);

}  // namespace batch_sanitizer

#endif  // BATCH_SANITIZER_LIB_CORE_AXIS_H_
