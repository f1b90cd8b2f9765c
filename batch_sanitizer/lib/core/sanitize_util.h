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
#ifndef BATCH_SANITIZER_LIB_CORE_SANITIZE_UTIL_H_
#define BATCH_SANITIZER_LIB_CORE_SANITIZE_UTIL_H_

#include <cstdint>
#include <optional>
#include <vector>

#include "absl/status/status.h"  // from @com_google_absl
#include "absl/status/statusor.h"  // from @com_google_absl
#include "absl/types/span.h"  // from @com_google_absl
#include "batch_sanitizer/lib/core/host_array.h"
#include "batch_sanitizer/lib/core/sequence_data.h"

namespace batch_sanitizer {

// How a dense host array relates to the declared sample shape.
enum class ArrayLayout {
  // The array is one bare sample (no sequence axis).
  kSingleSample = 0,
  // Axis 0 of the array is the sequence axis.
  kSequence = 1,
};

// Classifies `array_shape` against `sample_shape`. Leading unit dimensions are
// not significant on either side:
//   sample (5,):  (5,) -> kSingleSample,  (2, 5) -> kSequence
//   sample (1,):  (1,) -> kSingleSample,  (3,)   -> kSequence of 3
//   sample (1, 3): (2, 3) -> kSequence of 2
// Anything else is a shape mismatch.
absl::StatusOr<ArrayLayout> ClassifyArrayShape(
    absl::Span<const int64_t> array_shape,
    absl::Span<const int64_t> sample_shape);

// A sequence after validation: `length` samples flattened to rows of
// NumElements(sample_shape) values. Exactly one of `dense` and `sparse` is set.
struct SanitizedSequence {
  int64_t length = 0;
  // Shape the caller passed in, restored when the value is unpacked.
  Shape host_shape;
  // Contiguous (length, sample_size) array.
  std::optional<HostArray> dense;
  // (length, sample_size) CSR matrix.
  std::optional<CsrMatrix> sparse;
};

// Validates sequence `index` of a batch against `sample_shape`.
//
// Plain scalar lists are accepted only for scalar samples (`sample_shape` is
// empty) and only if `allow_scalar_sequences`; for any other declared shape
// they are ambiguous and rejected as unsupported input.
absl::StatusOr<SanitizedSequence> SanitizeSequence(
    const SequenceData& data, absl::Span<const int64_t> sample_shape,
    int index, bool allow_scalar_sequences = true);

absl::Status ValidateSeqStarts(const std::vector<bool>& seq_starts,
                               int64_t batch_size);

// Builds the (N, T) mask: row i holds lengths[i] entries of kMaskValid followed
// by kMaskInvalid padding. If `seq_starts` is given and seq_starts[i] is set,
// entry (i, 0) becomes kMaskSequenceBegin.
MatrixXi BuildMask(absl::Span<const int64_t> lengths, int64_t max_length,
                   const std::vector<bool>* seq_starts = nullptr);

}  // namespace batch_sanitizer

#endif  // BATCH_SANITIZER_LIB_CORE_SANITIZE_UTIL_H_
