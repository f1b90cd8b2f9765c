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
#ifndef BATCH_SANITIZER_LIB_CORE_VALUE_H_
#define BATCH_SANITIZER_LIB_CORE_VALUE_H_

#include <cstdint>
#include <ostream>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "absl/log/check.h"  // from @com_google_absl
#include "absl/status/statusor.h"  // from @com_google_absl
#include "batch_sanitizer/lib/core/dtype.h"
#include "batch_sanitizer/lib/core/host_array.h"

namespace batch_sanitizer {

enum class StorageFormat {
  kDense = 0,
  kSparseCsr = 1,
};

std::ostream& operator<<(std::ostream& os, StorageFormat format);

// Mask entries, per sequence and time step.
inline constexpr int kMaskInvalid = 0;
inline constexpr int kMaskValid = 1;
inline constexpr int kMaskSequenceBegin = 2;

// A packed batch of sequences, as consumed and produced by the engine.
//
// The storage is decided once, when the batch is packed:
//   - Dense: a zero-padded (N, T * sample_size) row-major matrix, where row i
//     holds sequence i flattened as (T, *sample_shape).
//   - Sparse: one CSR matrix per sequence of shape (length_i, sample_size). No
//     padding is materialized.
// Both carry the (N, T) mask; its row i has length_i leading non-zero entries.
class Value {
 public:
  template <typename T>
  static Value CreateDense(MatrixX<T> data, Shape sample_shape, MatrixXi mask,
                           std::vector<Shape> sequence_shapes) {
    static_assert(std::is_same_v<T, float> || std::is_same_v<T, double>);
    CHECK_EQ(data.rows(), mask.rows());
    CHECK_EQ(data.cols(), mask.cols() * NumElements(sample_shape));
    CHECK_EQ(static_cast<int64_t>(sequence_shapes.size()), mask.rows());
    return Value(std::move(data), std::move(sample_shape), std::move(mask),
                 std::move(sequence_shapes));
  }

  template <typename T>
  static Value CreateSparse(std::vector<CsrMatrixX<T>> sequences,
                            Shape sample_shape, MatrixXi mask) {
    static_assert(std::is_same_v<T, float> || std::is_same_v<T, double>);
    CHECK_EQ(static_cast<int64_t>(sequences.size()), mask.rows());
    for (const CsrMatrixX<T>& sequence : sequences) {
      CHECK_EQ(sequence.cols(), NumElements(sample_shape));
      CHECK_LE(sequence.rows(), mask.cols());
    }
    return Value(std::move(sequences), std::move(sample_shape), std::move(mask),
                 /*sequence_shapes=*/{});
  }

  StorageFormat storage_format() const;
  bool is_sparse() const {
    return storage_format() == StorageFormat::kSparseCsr;
  }
  DataType dtype() const;

  int64_t num_sequences() const { return mask_.rows(); }
  int64_t max_sequence_length() const { return mask_.cols(); }
  const Shape& sample_shape() const { return sample_shape_; }
  // (N, T, *sample_shape).
  Shape shape() const;
  const MatrixXi& mask() const { return mask_; }

  // Number of valid steps per sequence, read from the mask.
  std::vector<int64_t> SequenceLengths() const;

  template <typename T>
  const MatrixX<T>& dense_data() const {
    const MatrixX<T>* data = std::get_if<MatrixX<T>>(&storage_);
    CHECK(data != nullptr) << "Value does not hold dense " << dtype()
                           << " storage.";
    return *data;
  }

  template <typename T>
  const std::vector<CsrMatrixX<T>>& sparse_data() const {
    const auto* data = std::get_if<std::vector<CsrMatrixX<T>>>(&storage_);
    CHECK(data != nullptr) << "Value does not hold sparse " << dtype()
                           << " storage.";
    return *data;
  }

  // Dense storage only: one array per sequence, padding removed and reshaped
  // to the shape the sequence was packed from.
  absl::StatusOr<std::vector<HostArray>> ToNdArrays() const;

  // Dense storage only: the unpacked sequences stacked into one
  // (N, *sequence_shape) array. Fails if the sequences differ in shape.
  absl::StatusOr<HostArray> ToStackedNdArray() const;

  // Sparse storage only: one (length_i, sample_size) matrix per sequence.
  absl::StatusOr<std::vector<CsrMatrix>> ToCsr() const;

 private:
  using Storage =
      std::variant<MatrixXf, MatrixXd, std::vector<CsrMatrixX<float>>,
                   std::vector<CsrMatrixX<double>>>;

  template <typename S>
  Value(S storage, Shape sample_shape, MatrixXi mask,
        std::vector<Shape> sequence_shapes)
      : storage_(std::move(storage)),
        sample_shape_(std::move(sample_shape)),
        mask_(std::move(mask)),
        sequence_shapes_(std::move(sequence_shapes)) {}

  template <typename T>
  std::vector<HostArray> DenseToNdArrays(const MatrixX<T>& data) const;

  Storage storage_;
  Shape sample_shape_;
  MatrixXi mask_;
  // Host shape of every sequence at packing time; dense storage only.
  std::vector<Shape> sequence_shapes_;
};

}  // namespace batch_sanitizer

#endif  // BATCH_SANITIZER_LIB_CORE_VALUE_H_
