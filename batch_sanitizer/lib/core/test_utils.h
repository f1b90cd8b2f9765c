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
#ifndef BATCH_SANITIZER_LIB_CORE_TEST_UTILS_H_
#define BATCH_SANITIZER_LIB_CORE_TEST_UTILS_H_

#include <cstdint>
#include <utility>
#include <vector>

#include "batch_sanitizer/lib/core/dtype.h"
#include "batch_sanitizer/lib/core/host_array.h"
#include "batch_sanitizer/lib/core/sequence_data.h"

namespace batch_sanitizer {
namespace testing_utils {

// float32 array of the given shape filled with 0, 1, 2, ...
inline HostArray Arange(Shape shape,
                        ElementType type = ElementType::kFloat32) {
  std::vector<double> values(NumElements(shape));
  for (size_t i = 0; i < values.size(); ++i) {
    values[i] = i;
  }
  return HostArray(type, std::move(shape), std::move(values));
}

inline HostArray Array(std::vector<double> values, Shape shape,
                       ElementType type = ElementType::kFloat32) {
  return HostArray(type, std::move(shape), std::move(values));
}

// Row vector (1, n) in CSR format.
inline CsrMatrix CsrRow(const std::vector<double>& values) {
  return MakeCsrMatrix(1, values.size(), values);
}

inline CsrMatrix Csr(const std::vector<std::vector<double>>& rows) {
  const int64_t num_cols = rows.empty() ? 0 : rows[0].size();
  std::vector<double> values;
  for (const std::vector<double>& row : rows) {
    values.insert(values.end(), row.begin(), row.end());
  }
  return MakeCsrMatrix(rows.size(), num_cols, values);
}

inline SequenceData ArraySequence(HostArray array) {
  return SequenceData::Array(std::move(array));
}

// A list whose items are the given arrays, one sample each.
inline SequenceData SampleList(std::vector<HostArray> samples) {
  std::vector<SequenceData> items;
  items.reserve(samples.size());
  for (HostArray& sample : samples) {
    items.push_back(SequenceData::Array(std::move(sample)));
  }
  return SequenceData::List(std::move(items));
}

}  // namespace testing_utils
}  // namespace batch_sanitizer

#endif  // BATCH_SANITIZER_LIB_CORE_TEST_UTILS_H_
