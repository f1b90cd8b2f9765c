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
#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/statusor.h"  // from @com_google_absl
#include "absl/strings/str_cat.h"  // from @com_google_absl
#include "absl/types/span.h"  // from @com_google_absl
#include "batch_sanitizer/lib/core/axis.h"
#include "batch_sanitizer/lib/core/batch_sanitizer.h"
#include "batch_sanitizer/lib/core/dtype.h"
#include "batch_sanitizer/lib/core/errors.h"
#include "batch_sanitizer/lib/core/host_array.h"
#include "batch_sanitizer/lib/core/ndarray_view.h"
#include "batch_sanitizer/lib/core/sequence_data.h"
#include "batch_sanitizer/lib/core/value.h"
#include "batch_sanitizer/lib/core/variable.h"
#include "pybind11/cast.h"  // from @pybind11
#include "pybind11/eigen.h"  // from @pybind11
#include "pybind11/numpy.h"  // from @pybind11
#include "pybind11/pybind11.h"  // from @pybind11
#include "pybind11/pytypes.h"  // from @pybind11
#include "pybind11/stl.h"  // from @pybind11

namespace batch_sanitizer {

namespace py = ::pybind11;

namespace {

// All sanitizer errors surface as ValueError in Python.
template <typename T>
T ValueOrThrow(absl::StatusOr<T> value) {
  if (!value.ok()) {
    throw py::value_error(std::string(value.status().message()));
  }
  return *std::move(value);
}

// Integer and boolean data (of any width) is computed like int32.
ElementType GetElementType(const py::dtype& dtype) {
  if (dtype.kind() == 'f' && dtype.itemsize() == 8) {
    return ElementType::kFloat64;
  }
  if (dtype.kind() == 'i' || dtype.kind() == 'u' || dtype.kind() == 'b') {
    return ElementType::kInt32;
  }
  if (dtype.kind() == 'f') {
    return ElementType::kFloat32;
  }
  throw py::value_error(absl::StrCat("Unsupported dtype: ",
                                     std::string(py::str(dtype))));
}

HostArray ToHostArray(const py::array& array) {
  if (!(array.flags() & py::array::c_style)) {
    throw py::value_error(
        absl::StrCat("array of ", array.ndim(),
                     " dimensions is not C-contiguous (e.g. a transposed "
                     "view); pass a contiguous copy."));
  }
  const auto values =
      py::array_t<double, py::array::c_style | py::array::forcecast>::ensure(
          array);
  Shape shape(array.shape(), array.shape() + array.ndim());
  return HostArray(GetElementType(array.dtype()), std::move(shape),
                   std::vector<double>(values.data(),
                                       values.data() + values.size()));
}

bool IsScipySparse(const py::handle& obj) {
  return py::hasattr(obj, "tocsr") && py::hasattr(obj, "nnz");
}

bool IsNumber(const py::handle& obj) {
  return py::isinstance<py::int_>(obj) || py::isinstance<py::float_>(obj);
}

SequenceData ToSequenceData(const py::handle& obj) {
  if (IsScipySparse(obj)) {
    return SequenceData::Csr(obj.attr("tocsr")().cast<CsrMatrix>());
  }
  if (py::isinstance<py::array>(obj)) {
    return SequenceData::Array(
        ToHostArray(py::reinterpret_borrow<py::array>(obj)));
  }
  if (py::isinstance<py::list>(obj) || py::isinstance<py::tuple>(obj)) {
    const py::sequence items = py::reinterpret_borrow<py::sequence>(obj);
    bool all_numbers = items.size() > 0;
    for (const py::handle item : items) {
      all_numbers = all_numbers && IsNumber(item);
    }
    if (all_numbers) {
      return SequenceData::Scalars(items.cast<std::vector<double>>());
    }
    std::vector<SequenceData> converted;
    converted.reserve(items.size());
    for (const py::handle item : items) {
      converted.push_back(ToSequenceData(item));
    }
    return SequenceData::List(std::move(converted));
  }
  if (IsNumber(obj)) {
    return SequenceData::Array(HostArray::Scalar(obj.cast<double>()));
  }
  throw py::type_error(absl::StrCat(
      "Unsupported batch item of type ",
      std::string(py::str(obj.get_type().attr("__name__")))));
}

// Accepts dtype names ("float", "float64", ...) and anything numpy accepts as
// a dtype (`int`, `float`, `np.float32`, ...).
DataType GetDataType(const py::object& dtype) {
  if (dtype.is_none()) {
    return DataType::kUnknown;
  }
  if (py::isinstance<py::str>(dtype)) {
    return ValueOrThrow(SanitizeDataType(dtype.cast<std::string>()));
  }
  return SanitizeDataType(GetElementType(py::dtype::from_args(dtype)));
}

py::array ToNumpy(const HostArray& array) {
  const absl::Span<const double> values = array.values();
  py::array_t<double> out(array.shape());
  std::copy(values.begin(), values.end(), out.mutable_data());
  return out.attr("astype")(std::string(ElementTypeName(array.element_type())));
}

// Numbers, nested lists and arrays, as numpy would read them.
HostArray ToHostArrayLike(const py::handle& obj) {
  if (IsNumber(obj)) {
    return HostArray::Scalar(obj.cast<double>());
  }
  return ToHostArray(
      py::array(py::module_::import("numpy").attr("asarray")(obj)));
}

// Equal-shaped sequences come back as one stacked array, others as a list.
py::object ToNdArrayOrList(const Value& value) {
  absl::StatusOr<HostArray> stacked = value.ToStackedNdArray();
  if (stacked.ok()) {
    return ToNumpy(*stacked);
  }
  if (!IsShapeMismatch(stacked.status())) {
    throw py::value_error(std::string(stacked.status().message()));
  }
  py::list arrays;
  for (const HostArray& array : ValueOrThrow(value.ToNdArrays())) {
    arrays.append(ToNumpy(array));
  }
  return arrays;
}

std::string PyGetDataType(const py::args& args) {
  std::vector<const Variable*> variables;
  std::vector<HostArray> data;
  for (const py::handle arg : args) {
    if (py::isinstance<Variable>(arg)) {
      variables.push_back(&arg.cast<const Variable&>());
    } else {
      data.push_back(ToHostArrayLike(arg));
    }
  }
  return std::string(DataTypeName(GetDataType(variables, data)));
}

Value PySanitizeBatch(const Variable& variable, const py::object& batch,
                      std::optional<std::vector<bool>> seq_starts,
                      const py::object& dtype) {
  const SanitizeBatchOptions options = {.seq_starts = std::move(seq_starts),
                                        .dtype = GetDataType(dtype)};
  // A bare matrix or array is a batch of one sequence.
  if (IsScipySparse(batch) || py::isinstance<py::array>(batch)) {
    const SequenceData sequence[] = {ToSequenceData(batch)};
    return ValueOrThrow(SanitizeBatch(variable, sequence, options));
  }
  if (!py::isinstance<py::list>(batch) && !py::isinstance<py::tuple>(batch)) {
    throw py::type_error("batch must be a list of sequences.");
  }
  std::vector<SequenceData> sequences;
  for (const py::handle item : batch) {
    sequences.push_back(ToSequenceData(item));
  }
  return ValueOrThrow(SanitizeBatch(variable, sequences, options));
}

}  // namespace

PYBIND11_MODULE(pybind_batch_sanitizer, m) {
  py::class_<Variable>(m, "Variable")
      .def_property_readonly("shape", &Variable::shape)
      .def_property_readonly("is_sparse", &Variable::is_sparse)
      .def_property_readonly("name", &Variable::name)
      .def_property_readonly("dtype", [](const Variable& v) {
        return std::string(DataTypeName(v.dtype()));
      });
  m.def(
      "input_variable",
      [](Shape shape, bool is_sparse, const py::object& dtype,
         const std::string& name) {
        const DataType data_type = GetDataType(dtype);
        return InputVariable(
            std::move(shape), is_sparse,
            data_type == DataType::kUnknown ? DataType::kFloat : data_type,
            name);
      },
      py::arg("shape"), py::arg("is_sparse") = false,
      py::arg("dtype") = py::none(), py::arg("name") = "");

  py::class_<Value>(m, "Value")
      .def_property_readonly("shape", &Value::shape)
      .def_property_readonly("mask", &Value::mask)
      .def_property_readonly("is_sparse", &Value::is_sparse)
      .def("to_ndarray", &ToNdArrayOrList)
      .def("to_csr", [](const Value& value) {
        return ValueOrThrow(value.ToCsr());
      });

  m.def("sanitize_batch", &PySanitizeBatch, py::arg("var"), py::arg("batch"),
        py::arg("seq_starts") = py::none(), py::arg("dtype") = py::none());
  m.def(
      "one_hot",
      [](const std::vector<std::vector<int64_t>>& batch, int64_t num_classes,
         const py::object& dtype) {
        const DataType data_type = GetDataType(dtype);
        return ValueOrThrow(OneHot(
            batch, num_classes,
            {.dtype = data_type == DataType::kDouble ? DataType::kDouble
                                                     : DataType::kFloat}));
      },
      py::arg("batch"), py::arg("num_classes"), py::arg("dtype") = py::none());
  m.def(
      "sanitize_input",
      [](const py::object& data, const py::object& dtype) {
        return ToNumpy(
            SanitizeInput(ToHostArrayLike(data), GetDataType(dtype))
                .ToHostArray());
      },
      py::arg("data"), py::arg("dtype") = py::none());
  m.def("get_data_type", &PyGetDataType);

  py::class_<Axis>(m, "Axis")
      .def(py::init<std::string>(), py::arg("name"))
      .def_property_readonly("name", &Axis::name)
      .def_static("default_batch_axis", &Axis::DefaultBatchAxis)
      .def_static("default_dynamic_axis", &Axis::DefaultDynamicAxis)
      .def("__eq__", [](const Axis& a, const Axis& b) { return a == b; })
      .def("__repr__", [](const Axis& axis) {
        return absl::StrCat("Axis(", axis.name(), ")");
      });
  m.def("default_input_variable_dynamic_axes",
        &DefaultInputVariableDynamicAxes);
  m.def(
      "sanitize_dynamic_axes",
      [](const py::object& axes) {
        if (py::isinstance<Axis>(axes)) {
          return SanitizeDynamicAxes(axes.cast<const Axis&>());
        }
        return SanitizeDynamicAxes(axes.cast<std::vector<Axis>>());
      },
      py::arg("axes"));
  m.def(
      "sanitize_dtype",
      [](const py::object& dtype) {
        return std::string(DataTypeName(GetDataType(dtype)));
      },
      py::arg("dtype"));
}

}  // namespace batch_sanitizer
