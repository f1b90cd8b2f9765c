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
#ifndef BATCH_SANITIZER_LIB_CORE_SEQUENCE_DATA_H_
#define BATCH_SANITIZER_LIB_CORE_SEQUENCE_DATA_H_

#include <string>
#include <utility>
#include <vector>

#include "absl/log/check.h"  // from @com_google_absl
#include "batch_sanitizer/lib/core/host_array.h"

namespace batch_sanitizer {

// One element of a batch as the caller hands it over. The container kind is
// inspected exactly once, when the batch is sanitized.
//
// Examples (numpy notation):
//   Array(np.asarray([5, 6, 7]))          -> kArray
//   List({Array(a1)})                     -> kList, [a1]
//   Csr(csr_matrix([[1, 0, 2], [2, 3, 0]])) -> kCsr
//   Scalars({5, 6, 7})                    -> kScalars, a plain [5, 6, 7]
class SequenceData {
 public:
  enum class Kind {
    kArray = 0,
    kList = 1,
    kCsr = 2,
    kScalars = 3,
  };

  static SequenceData Array(HostArray array) {
    SequenceData data(Kind::kArray);
    data.array_ = std::move(array);
    return data;
  }

  static SequenceData List(std::vector<SequenceData> items) {
    SequenceData data(Kind::kList);
    data.items_ = std::move(items);
    return data;
  }

  static SequenceData Csr(CsrMatrix matrix) {
    SequenceData data(Kind::kCsr);
    data.csr_ = std::move(matrix);
    return data;
  }

  static SequenceData Scalars(std::vector<double> values) {
    SequenceData data(Kind::kScalars);
    data.scalars_ = std::move(values);
    return data;
  }

  Kind kind() const { return kind_; }

  const HostArray& array() const {
    CHECK(kind_ == Kind::kArray);
    return array_;
  }

  const std::vector<SequenceData>& items() const {
    CHECK(kind_ == Kind::kList);
    return items_;
  }

  const CsrMatrix& csr() const {
    CHECK(kind_ == Kind::kCsr);
    return csr_;
  }

  const std::vector<double>& scalars() const {
    CHECK(kind_ == Kind::kScalars);
    return scalars_;
  }

  // Short description used in error messages, e.g. "array(3,)".
  std::string DebugString() const;

 private:
  explicit SequenceData(Kind kind) : kind_(kind) {}

  Kind kind_;
  HostArray array_;
  std::vector<SequenceData> items_;
  CsrMatrix csr_;
  std::vector<double> scalars_;
};

}  // namespace batch_sanitizer

#endif  // BATCH_SANITIZER_LIB_CORE_SEQUENCE_DATA_H_
