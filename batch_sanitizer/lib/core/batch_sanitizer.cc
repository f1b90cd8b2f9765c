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
#include "batch_sanitizer/lib/core/batch_sanitizer.h"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <utility>
#include <vector>

#include "absl/log/log.h"  // from @com_google_absl
#include "absl/status/status.h"  // from @com_google_absl
#include "absl/status/statusor.h"  // from @com_google_absl
#include "absl/strings/str_format.h"  // from @com_google_absl
#include "absl/types/span.h"  // from @com_google_absl
#include "Eigen/SparseCore"  // from @eigen_archive
#include "batch_sanitizer/lib/core/dtype.h"
#include "batch_sanitizer/lib/core/errors.h"
#include "batch_sanitizer/lib/core/host_array.h"
#include "batch_sanitizer/lib/core/sanitize_util.h"
#include "batch_sanitizer/lib/core/sequence_data.h"
#include "batch_sanitizer/lib/core/value.h"
#include "batch_sanitizer/lib/core/variable.h"

namespace batch_sanitizer {

namespace {

// Host arrays that take part in dtype resolution. Plain numbers count as
// float64, CSR data does not count.
void CollectHostArrays(const SequenceData& data,
                       std::vector<HostArray>& arrays) {
  switch (data.kind()) {
    case SequenceData::Kind::kArray:
      arrays.push_back(data.array());
      break;
    case SequenceData::Kind::kScalars:
      arrays.push_back(HostArray::FromVector(data.scalars()));
      break;
    case SequenceData::Kind::kList:
      for (const SequenceData& item : data.items()) {
        CollectHostArrays(item, arrays);
      }
      break;
    case SequenceData::Kind::kCsr:
      break;
  }
}

absl::StatusOr<DataType> ResolveDataType(const Variable& variable,
                                         absl::Span<const SequenceData> batch,
                                         DataType requested) {
  std::vector<HostArray> arrays;
  for (const SequenceData& sequence : batch) {
    CollectHostArrays(sequence, arrays);
  }
  const Variable* variables[] = {&variable};
  const DataType dtype = requested != DataType::kUnknown
                             ? requested
                             : GetDataType(variables, arrays);
  if (dtype == DataType::kUnknown) {
    return TypeMismatchError("Cannot resolve a dtype for variable '",
                             variable.name(),
                             "': it has no concrete dtype and the batch has no "
                             "dense data; pass an explicit dtype.");
  }
  const bool narrowing =
      dtype == DataType::kFloat &&
      std::any_of(arrays.begin(), arrays.end(), [](const HostArray& array) {
        return array.element_type() == ElementType::kFloat64;
      });
  LOG_IF_EVERY_N(WARNING, narrowing, 100)
      << "Packing float64 data for variable '" << variable.name()
      << "' as float; precision may be lost.";
  return dtype;
}

template <typename T>
Value PackDense(absl::Span<const SanitizedSequence> sequences,
                const Shape& sample_shape, int64_t max_length,
                MatrixXi mask) {
  const int64_t sample_size = NumElements(sample_shape);
  MatrixX<T> data =
      MatrixX<T>::Zero(sequences.size(), max_length * sample_size);
  std::vector<Shape> sequence_shapes;
  sequence_shapes.reserve(sequences.size());
  for (int i = 0; i < static_cast<int>(sequences.size()); ++i) {
    const SanitizedSequence& sequence = sequences[i];
    if (sequence.dense.has_value()) {
      const absl::Span<const double> values = sequence.dense->values();
      for (int64_t j = 0; j < static_cast<int64_t>(values.size()); ++j) {
        data(i, j) = static_cast<T>(values[j]);
      }
      sequence_shapes.push_back(sequence.host_shape);
    } else {
      const CsrMatrix& csr = *sequence.sparse;
      for (int row = 0; row < csr.outerSize(); ++row) {
        for (CsrMatrix::InnerIterator it(csr, row); it; ++it) {
          data(i, row * sample_size + it.col()) = static_cast<T>(it.value());
        }
      }
      // Densified CSR comes back as (length, *sample_shape).
      Shape shape = {sequence.length};
      shape.insert(shape.end(), sample_shape.begin(), sample_shape.end());
      sequence_shapes.push_back(std::move(shape));
    }
  }
  return Value::CreateDense<T>(std::move(data), sample_shape, std::move(mask),
                               std::move(sequence_shapes));
}

template <typename T>
Value PackSparse(absl::Span<const SanitizedSequence> sequences,
                 const Shape& sample_shape, MatrixXi mask) {
  const int64_t sample_size = NumElements(sample_shape);
  std::vector<CsrMatrixX<T>> data;
  data.reserve(sequences.size());
  for (const SanitizedSequence& sequence : sequences) {
    if (sequence.sparse.has_value()) {
      data.emplace_back(sequence.sparse->template cast<T>());
      continue;
    }
    data.emplace_back(MakeCsrMatrix(sequence.length, sample_size,
                                    sequence.dense->values())
                          .template cast<T>());
  }
  return Value::CreateSparse<T>(std::move(data), sample_shape,
                                std::move(mask));
}

}  // namespace

absl::StatusOr<Value> SanitizeBatch(const Variable& variable,
                                    absl::Span<const SequenceData> batch,
                                    const SanitizeBatchOptions& options) {
  if (batch.empty()) {
    return UnsupportedInputError(
        "Cannot sanitize an empty batch for variable '", variable.name(), "'.");
  }
  if (options.seq_starts.has_value()) {
    if (absl::Status status =
            ValidateSeqStarts(*options.seq_starts, batch.size());
        !status.ok()) {
      return status;
    }
  }
  absl::StatusOr<DataType> dtype =
      ResolveDataType(variable, batch, options.dtype);
  if (!dtype.ok()) {
    return dtype.status();
  }

  std::vector<SanitizedSequence> sequences;
  sequences.reserve(batch.size());
  std::vector<int64_t> lengths;
  lengths.reserve(batch.size());
  for (int i = 0; i < static_cast<int>(batch.size()); ++i) {
    absl::StatusOr<SanitizedSequence> sequence = SanitizeSequence(
        batch[i], variable.shape(), i, options.allow_scalar_sequences);
    if (!sequence.ok()) {
      return sequence.status();
    }
    lengths.push_back(sequence->length);
    sequences.push_back(*std::move(sequence));
  }
  const int64_t max_length = *std::max_element(lengths.begin(), lengths.end());
  const std::vector<bool>* seq_starts =
      options.seq_starts.has_value() ? &*options.seq_starts : nullptr;
  MatrixXi mask = BuildMask(lengths, max_length, seq_starts);

  VLOG(2) << absl::StrFormat(
      "Packing %d sequences (max length %d) for variable '%s' of shape %s as "
      "%s %s.",
      sequences.size(), max_length, variable.name(),
      ShapeToString(variable.shape()),
      variable.is_sparse() ? "sparse" : "dense", DataTypeName(*dtype));

  if (variable.is_sparse()) {
    // Sparse samples are reported without leading unit dimensions.
    const Shape sample_shape = StripLeadingUnitDims(variable.shape());
    if (*dtype == DataType::kDouble) {
      return PackSparse<double>(sequences, sample_shape, std::move(mask));
    }
    return PackSparse<float>(sequences, sample_shape, std::move(mask));
  }
  if (*dtype == DataType::kDouble) {
    return PackDense<double>(sequences, variable.shape(), max_length,
                             std::move(mask));
  }
  return PackDense<float>(sequences, variable.shape(), max_length,
                          std::move(mask));
}

absl::StatusOr<Value> SanitizeBatch(const Variable& variable,
                                    const CsrMatrix& sequence,
                                    const SanitizeBatchOptions& options) {
  const SequenceData batch[] = {SequenceData::Csr(sequence)};
  return SanitizeBatch(variable, batch, options);
}

absl::StatusOr<Value> OneHot(absl::Span<const std::vector<int64_t>> batch,
                             int64_t num_classes,
                             const OneHotOptions& options) {
  if (batch.empty()) {
    return UnsupportedInputError("Cannot one-hot encode an empty batch.");
  }
  // CSR column indices are stored as int.
  if (num_classes <= 0 || num_classes > std::numeric_limits<int>::max()) {
    return ShapeMismatchError("num_classes must be in [1, ",
                              std::numeric_limits<int>::max(), "], got ",
                              num_classes, ".");
  }

  std::vector<int64_t> lengths;
  lengths.reserve(batch.size());
  std::vector<CsrMatrix> sequences;
  sequences.reserve(batch.size());
  for (int i = 0; i < static_cast<int>(batch.size()); ++i) {
    const std::vector<int64_t>& indices = batch[i];
    const int64_t length = indices.size();
    std::vector<Eigen::Triplet<double, int>> triplets;
    triplets.reserve(length);
    for (int64_t row = 0; row < length; ++row) {
      const int64_t index = indices[row];
      if (index < 0 || index >= num_classes) {
        return ShapeMismatchError("Sequence ", i, ", step ", row,
                                  ": class index ", index,
                                  " is out of range [0, ", num_classes, ").");
      }
      triplets.emplace_back(row, index, 1.0);
    }
    CsrMatrix matrix(length, num_classes);
    matrix.setFromTriplets(triplets.begin(), triplets.end());
    matrix.makeCompressed();
    sequences.push_back(std::move(matrix));
    lengths.push_back(length);
  }
  const int64_t max_length = *std::max_element(lengths.begin(), lengths.end());
  MatrixXi mask = BuildMask(lengths, max_length);

  VLOG(2) << absl::StrFormat("One-hot encoding %d sequences over %d classes.",
                             sequences.size(), num_classes);

  const Shape sample_shape = {num_classes};
  if (options.dtype == DataType::kDouble) {
    return Value::CreateSparse<double>(std::move(sequences), sample_shape,
                                       std::move(mask));
  }
  std::vector<CsrMatrixX<float>> float_sequences;
  float_sequences.reserve(sequences.size());
  for (const CsrMatrix& sequence : sequences) {
    float_sequences.emplace_back(sequence.cast<float>());
  }
  return Value::CreateSparse<float>(std::move(float_sequences), sample_shape,
                                    std::move(mask));
}

}  // namespace batch_sanitizer
