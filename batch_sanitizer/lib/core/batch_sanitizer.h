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
#ifndef BATCH_SANITIZER_LIB_CORE_BATCH_SANITIZER_H_
#define BATCH_SANITIZER_LIB_CORE_BATCH_SANITIZER_H_

#include <cstdint>
#include <optional>
#include <vector>

#include "absl/status/statusor.h"  // from @com_google_absl
#include "absl/types/span.h"  // from @com_google_absl
#include "batch_sanitizer/lib/core/dtype.h"
#include "batch_sanitizer/lib/core/host_array.h"
#include "batch_sanitizer/lib/core/sequence_data.h"
#include "batch_sanitizer/lib/core/value.h"
#include "batch_sanitizer/lib/core/variable.h"

namespace batch_sanitizer {

struct SanitizeBatchOptions {
  // One flag per sequence. A set flag marks the sequence as the beginning of a
  // new stream (mask entry kMaskSequenceBegin at step 0); a cleared flag marks
  // a continuation. Without flags the mask only holds 0 and 1.
  std::optional<std::vector<bool>> seq_starts = std::nullopt;

  // Packing dtype. kUnknown resolves it from the variable and the data.
  DataType dtype = DataType::kUnknown;

  // Whether a plain list of numbers may be a sequence of scalar samples.
  bool allow_scalar_sequences = true;
};

struct OneHotOptions {
  DataType dtype = DataType::kFloat;
};

// Packs a batch of variable-length sequences into a Value for `variable`.
//
// Storage follows the variable: sparse variables produce CSR storage (dense
// input is compressed), dense variables produce a zero-padded dense matrix
// (CSR input is densified). Every sequence yields one mask row.
//
// Errors:
//   InvalidArgument: a sequence does not match the variable's sample shape,
//     an array is not contiguous, or `seq_starts` has the wrong size.
//   Unimplemented: the batch is empty, or contains an ambiguous plain list.
//   FailedPrecondition: no dtype can be resolved.
absl::StatusOr<Value> SanitizeBatch(const Variable& variable,
                                    absl::Span<const SequenceData> batch,
                                    const SanitizeBatchOptions& options = {});

// A bare CSR matrix is a batch of one sequence whose rows are the samples.
absl::StatusOr<Value> SanitizeBatch(const Variable& variable,
                                    const CsrMatrix& sequence,
                                    const SanitizeBatchOptions& options = {});

// Encodes each sequence of class indices as a (length, num_classes) CSR matrix
// with a single 1 per row. The result has sample shape (num_classes,).
absl::StatusOr<Value> OneHot(absl::Span<const std::vector<int64_t>> batch,
                             int64_t num_classes,
                             const OneHotOptions& options = {});

}  // namespace batch_sanitizer

#endif  // BATCH_SANITIZER_LIB_CORE_BATCH_SANITIZER_H_
