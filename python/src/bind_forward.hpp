#pragma once
#include <pybind11/pybind11.h>
#include <nlohmann/json.hpp>
namespace py = pybind11;

void bind_enums_and_structs(py::module_& m);
void bind_exceptions(py::module_& m);
void bind_monitors(py::module_& m);
void bind_budget(py::module_& m);
void bind_errors(py::module_& m);
void bind_middleware(py::module_& m);
void bind_core(py::module_& m);

// JSON values cross the boundary through Python's json module.
// Both require the GIL.
py::object to_python(const nlohmann::json& value);
nlohmann::json from_python(const py::handle& obj);

// Maps ValidationError / OperationCancelledError raised in Python back to
// the native exceptions the governor classifies. Call from a catch block.
[[noreturn]] void rethrow_as_native(py::error_already_set& e);
