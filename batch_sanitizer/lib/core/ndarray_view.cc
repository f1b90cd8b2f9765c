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
#include "batch_sanitizer/lib/core/ndarray_view.h"

#include <vector>

#include "absl/log/log.h"  // from @com_google_absl
#include "absl/types/span.h"  // from @com_google_absl
#include "batch_sanitizer/lib/core/dtype.h"
#include "batch_sanitizer/lib/core/host_array.h"

namespace batch_sanitizer {

namespace {

template <typename T>
RowVectorX<T> CopyValues(const HostArray& array) {
  const HostArray contiguous = array.AsContiguous();
  const absl::Span<const double> values = contiguous.values();
  RowVectorX<T> out(values.size());
  for (size_t i = 0; i < values.size(); ++i) {
    out[i] = static_cast<T>(values[i]);
  }
  return out;
}

}  // namespace

HostArray NdArrayView::ToHostArray() const {
  return std::visit(
      [this](const auto& v) {
        return HostArray(ToElementType(dtype()), shape_,
                         std::vector<double>(v.data(), v.data() + v.size()));
      },
      values_);
}

NdArrayView SanitizeInput(const HostArray& data, DataType dtype) {
  if (dtype == DataType::kUnknown) {
    dtype = SanitizeDataType(data.element_type());
  }
  if (dtype == DataType::kDouble) {
    return NdArrayView(data.shape(), CopyValues<double>(data));
  }
  LOG_IF_EVERY_N(WARNING, data.element_type() == ElementType::kFloat64, 100)
      << "Narrowing float64 input of shape " << ShapeToString(data.shape())
      << " to float; precision may be lost.";
  return NdArrayView(data.shape(), CopyValues<float>(data));
}

}  // namespace batch_sanitizer
