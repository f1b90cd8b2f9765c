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
#include "batch_sanitizer/lib/core/sanitize_util.h"

#include <cstdint>
#include <utility>
#include <vector>

#include "absl/log/check.h"  // from @com_google_absl
#include "absl/log/log.h"  // from @com_google_absl
#include "absl/status/status.h"  // from @com_google_absl
#include "absl/status/statusor.h"  // from @com_google_absl
#include "absl/types/span.h"  // from @com_google_absl
#include "Eigen/SparseCore"  // from @eigen_archive
#include "batch_sanitizer/lib/core/dtype.h"
#include "batch_sanitizer/lib/core/errors.h"
#include "batch_sanitizer/lib/core/host_array.h"
#include "batch_sanitizer/lib/core/sequence_data.h"
#include "batch_sanitizer/lib/core/value.h"

namespace batch_sanitizer {

namespace {

absl::Status CheckContiguous(const HostArray& array, int index) {
  if (!array.IsContiguous()) {
    return ShapeMismatchError(
        "Sequence ", index, ": array of shape ", ShapeToString(array.shape()),
        " is not C-contiguous (e.g. a transposed view); pass a contiguous "
        "copy.");
  }
  return absl::OkStatus();
}

absl::Status CheckCsrColumns(const CsrMatrix& matrix, int64_t sample_size,
                             int index) {
  if (matrix.cols() != sample_size) {
    return ShapeMismatchError("Sequence ", index, ": CSR matrix has ",
                              matrix.cols(), " columns, expected ",
                              sample_size, " (one flattened sample per row).");
  }
  return absl::OkStatus();
}

// Appends the rows of `matrix` to `triplets`, starting at `row_offset`.
void AppendCsrRows(const CsrMatrix& matrix, int64_t row_offset,
                   std::vector<Eigen::Triplet<double, int>>& triplets) {
  for (int row = 0; row < matrix.outerSize(); ++row) {
    for (CsrMatrix::InnerIterator it(matrix, row); it; ++it) {
      triplets.emplace_back(row_offset + row, it.col(), it.value());
    }
  }
}

absl::StatusOr<SanitizedSequence> SanitizeArray(
    const HostArray& array, absl::Span<const int64_t> sample_shape,
    int index) {
  if (absl::Status status = CheckContiguous(array, index); !status.ok()) {
    return status;
  }
  absl::StatusOr<ArrayLayout> layout =
      ClassifyArrayShape(array.shape(), sample_shape);
  if (!layout.ok()) {
    return ShapeMismatchError("Sequence ", index, ": ",
                              layout.status().message());
  }
  const int64_t length =
      *layout == ArrayLayout::kSingleSample ? 1 : array.shape()[0];
  SanitizedSequence sequence;
  sequence.length = length;
  sequence.host_shape = array.shape();
  sequence.dense = array.Reshape({length, NumElements(sample_shape)});
  return sequence;
}

absl::StatusOr<SanitizedSequence> SanitizeCsr(
    const CsrMatrix& matrix, absl::Span<const int64_t> sample_shape,
    int index) {
  if (absl::Status status =
          CheckCsrColumns(matrix, NumElements(sample_shape), index);
      !status.ok()) {
    return status;
  }
  SanitizedSequence sequence;
  sequence.length = matrix.rows();
  sequence.host_shape = {matrix.rows(), matrix.cols()};
  sequence.sparse = matrix;
  return sequence;
}

absl::StatusOr<SanitizedSequence> SanitizeScalars(
    const std::vector<double>& scalars, absl::Span<const int64_t> sample_shape,
    int index, bool allow_scalar_sequences) {
  if (!allow_scalar_sequences || !sample_shape.empty()) {
    return UnsupportedInputError(
        "Sequence ", index, ": a plain list of ", scalars.size(),
        " numbers is ambiguous for sample shape ", ShapeToString(sample_shape),
        "; pass a host array instead.");
  }
  const int64_t length = scalars.size();
  SanitizedSequence sequence;
  sequence.length = length;
  sequence.host_shape = {length};
  sequence.dense = HostArray(ElementType::kFloat64, {length, 1}, scalars);
  return sequence;
}

// Every item of a list is one sample, except CSR items whose rows are stacked.
absl::StatusOr<SanitizedSequence> SanitizeList(
    const std::vector<SequenceData>& items,
    absl::Span<const int64_t> sample_shape, int index) {
  const int64_t sample_size = NumElements(sample_shape);
  const Shape stripped = StripLeadingUnitDims(sample_shape);

  bool has_csr = false;
  int64_t length = 0;
  const Shape* item_shape = nullptr;
  Shape scalar_item_shape;
  for (const SequenceData& item : items) {
    switch (item.kind()) {
      case SequenceData::Kind::kArray: {
        const HostArray& array = item.array();
        if (absl::Status status = CheckContiguous(array, index); !status.ok()) {
          return status;
        }
        if (StripLeadingUnitDims(array.shape()) != stripped) {
          return ShapeMismatchError(
              "Sequence ", index, ": list item of shape ",
              ShapeToString(array.shape()), " is not a sample of shape ",
              ShapeToString(sample_shape), ".");
        }
        if (item_shape != nullptr && *item_shape != array.shape()) {
          return ShapeMismatchError(
              "Sequence ", index, ": samples of shape ",
              ShapeToString(*item_shape), " and ",
              ShapeToString(array.shape()), " in the same sequence.");
        }
        item_shape = &array.shape();
        ++length;
        break;
      }
      case SequenceData::Kind::kCsr: {
        if (absl::Status status =
                CheckCsrColumns(item.csr(), sample_size, index);
            !status.ok()) {
          return status;
        }
        has_csr = true;
        length += item.csr().rows();
        break;
      }
      case SequenceData::Kind::kScalars: {
        const int64_t count = item.scalars().size();
        if (count != sample_size || stripped.size() > 1) {
          return ShapeMismatchError(
              "Sequence ", index, ": list item of ", count,
              " numbers is not a sample of shape ",
              ShapeToString(sample_shape), ".");
        }
        scalar_item_shape = {count};
        if (item_shape != nullptr && *item_shape != scalar_item_shape) {
          return ShapeMismatchError(
              "Sequence ", index, ": samples of shape ",
              ShapeToString(*item_shape), " and ",
              ShapeToString(scalar_item_shape), " in the same sequence.");
        }
        item_shape = &scalar_item_shape;
        ++length;
        break;
      }
      case SequenceData::Kind::kList:
        return UnsupportedInputError("Sequence ", index,
                                     ": lists nested more than one level deep "
                                     "are not supported.");
    }
  }

  SanitizedSequence sequence;
  sequence.length = length;
  if (has_csr) {
    std::vector<Eigen::Triplet<double, int>> triplets;
    int64_t row = 0;
    for (const SequenceData& item : items) {
      if (item.kind() == SequenceData::Kind::kCsr) {
        AppendCsrRows(item.csr(), row, triplets);
        row += item.csr().rows();
        continue;
      }
      const HostArray array = item.kind() == SequenceData::Kind::kArray
                                  ? item.array()
                                  : HostArray::FromVector(item.scalars());
      const absl::Span<const double> values = array.values();
      for (int64_t col = 0; col < sample_size; ++col) {
        if (values[col] != 0.0) {
          triplets.emplace_back(row, col, values[col]);
        }
      }
      ++row;
    }
    CsrMatrix matrix(length, sample_size);
    matrix.setFromTriplets(triplets.begin(), triplets.end());
    matrix.makeCompressed();
    sequence.host_shape = {length, sample_size};
    sequence.sparse = std::move(matrix);
    return sequence;
  }

  std::vector<double> values;
  values.reserve(length * sample_size);
  ElementType element_type = ElementType::kFloat64;
  for (const SequenceData& item : items) {
    if (item.kind() == SequenceData::Kind::kArray) {
      const absl::Span<const double> item_values = item.array().values();
      values.insert(values.end(), item_values.begin(), item_values.end());
      element_type = item.array().element_type();
    } else {
      values.insert(values.end(), item.scalars().begin(),
                    item.scalars().end());
    }
  }
  sequence.host_shape = {length};
  if (item_shape != nullptr) {
    sequence.host_shape.insert(sequence.host_shape.end(), item_shape->begin(),
                               item_shape->end());
  } else {
    sequence.host_shape.insert(sequence.host_shape.end(), sample_shape.begin(),
                               sample_shape.end());
  }
  sequence.dense =
      HostArray(element_type, {length, sample_size}, std::move(values));
  return sequence;
}

}  // namespace

absl::StatusOr<ArrayLayout> ClassifyArrayShape(
    absl::Span<const int64_t> array_shape,
    absl::Span<const int64_t> sample_shape) {
  const Shape stripped_sample = StripLeadingUnitDims(sample_shape);
  if (StripLeadingUnitDims(array_shape) == stripped_sample) {
    return ArrayLayout::kSingleSample;
  }
  if (!array_shape.empty() &&
      StripLeadingUnitDims(array_shape.subspan(1)) == stripped_sample) {
    return ArrayLayout::kSequence;
  }
  return ShapeMismatchError("array of shape ", ShapeToString(array_shape),
                            " is neither a sample of shape ",
                            ShapeToString(sample_shape),
                            " nor a sequence of such samples.");
}

absl::StatusOr<SanitizedSequence> SanitizeSequence(
    const SequenceData& data, absl::Span<const int64_t> sample_shape,
    int index, bool allow_scalar_sequences) {
  switch (data.kind()) {
    case SequenceData::Kind::kArray:
      return SanitizeArray(data.array(), sample_shape, index);
    case SequenceData::Kind::kCsr:
      return SanitizeCsr(data.csr(), sample_shape, index);
    case SequenceData::Kind::kScalars:
      return SanitizeScalars(data.scalars(), sample_shape, index,
                             allow_scalar_sequences);
    case SequenceData::Kind::kList:
      return SanitizeList(data.items(), sample_shape, index);
  }
  LOG(FATAL) << "Unhandled sequence kind: " << data.DebugString();
}

absl::Status ValidateSeqStarts(const std::vector<bool>& seq_starts,
                               int64_t batch_size) {
  if (static_cast<int64_t>(seq_starts.size()) != batch_size) {
    return ShapeMismatchError("seq_starts has ", seq_starts.size(),
                              " entries but the batch has ", batch_size,
                              " sequences.");
  }
  return absl::OkStatus();
}

MatrixXi BuildMask(absl::Span<const int64_t> lengths, int64_t max_length,
                   const std::vector<bool>* seq_starts) {
  if (seq_starts != nullptr) {
    CHECK_EQ(seq_starts->size(), lengths.size());
  }
  MatrixXi mask = MatrixXi::Constant(lengths.size(), max_length, kMaskInvalid);
  for (int i = 0; i < static_cast<int>(lengths.size()); ++i) {
    DCHECK_LE(lengths[i], max_length);
    mask.row(i).head(lengths[i]).setConstant(kMaskValid);
    if (seq_starts != nullptr && (*seq_starts)[i] && lengths[i] > 0) {
      mask(i, 0) = kMaskSequenceBegin;
    }
  }
  return mask;
}

}  // namespace batch_sanitizer
