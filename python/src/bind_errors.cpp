#include "bind_forward.hpp"
#include <toolgov/toolgov.hpp>
#include <pybind11/stl.h>
#include <pybind11/functional.h>

using namespace toolgov;

// ---------------------------------------------------------------------------
// bind_errors  --  ErrorCatalog, AlternativeToolCatalog, parameter validation
// ---------------------------------------------------------------------------
void bind_errors(py::module_& m) {

    // ===================================================================
    // ErrorCatalog
    // ===================================================================
    py::class_<ErrorCatalog, std::shared_ptr<ErrorCatalog>>(m, "ErrorCatalog")
        .def(py::init<>())
        // Message builders
        .def("validation_failed",       &ErrorCatalog::validation_failed,
             py::arg("param_name"), py::arg("requirement"))
        .def("tool_execution_failed",   &ErrorCatalog::tool_execution_failed,
             py::arg("tool_name"), py::arg("details"))
        .def("parameter_required",      &ErrorCatalog::parameter_required,
             py::arg("param_name"))
        .def("range_validation_failed", &ErrorCatalog::range_validation_failed,
             py::arg("param_name"), py::arg("min"), py::arg("max"))
        .def("must_be_positive",        &ErrorCatalog::must_be_positive,
             py::arg("param_name"))
        .def("cannot_be_empty",         &ErrorCatalog::cannot_be_empty,
             py::arg("param_name"))
        .def("budget_exceeded",         &ErrorCatalog::budget_exceeded,
             py::arg("tool_name"), py::arg("estimate"), py::arg("max_tokens"))
        .def("tool_released",           &ErrorCatalog::tool_released,
             py::arg("tool_name"))
        // Recovery
        .def("recovery_info",     &ErrorCatalog::recovery_info,
             py::arg("code"), py::arg("context") = "")
        .def("suggested_actions", &ErrorCatalog::suggested_actions,
             py::arg("code"), py::arg("tool_name"))
        .def("classify_failure",  &ErrorCatalog::classify_failure,
             py::arg("details"))
        // Domain codes
        .def("register_code", &ErrorCatalog::register_code,
             py::arg("code"), py::arg("recovery_steps"))
        .def("has_code",      &ErrorCatalog::has_code, py::arg("code"))
        .def("lookup",        &ErrorCatalog::lookup,
             py::arg("code"), py::arg("message"), py::arg("tool_name") = "");

    // ===================================================================
    // AlternativeToolCatalog
    // ===================================================================
    py::class_<AlternativeToolCatalog, ErrorCatalog, std::shared_ptr<AlternativeToolCatalog>>(
            m, "AlternativeToolCatalog")
        .def(py::init<ToolNameProvider, ErrorRecoveryOptions, std::shared_ptr<Monitor>>(),
             py::arg("tool_names"),
             py::arg("options") = ErrorRecoveryOptions{},
             py::arg("monitor") = nullptr)
        .def("type_verification_error", &AlternativeToolCatalog::type_verification_error,
             py::arg("type_name"), py::arg("suggestion"))
        .def("file_not_found_error",    &AlternativeToolCatalog::file_not_found_error,
             py::arg("file_path"))
        .def("workspace_not_indexed_error", &AlternativeToolCatalog::workspace_not_indexed_error)
        .def("options", &AlternativeToolCatalog::options);

    // ===================================================================
    // Parameter validation
    // ===================================================================
    py::class_<ParameterRule>(m, "ParameterRule")
        .def(py::init<>())
        .def_readwrite("name",       &ParameterRule::name)
        .def_readwrite("required",   &ParameterRule::required)
        .def_readwrite("type",       &ParameterRule::type)
        .def_readwrite("minimum",    &ParameterRule::minimum)
        .def_readwrite("maximum",    &ParameterRule::maximum)
        .def_readwrite("min_length", &ParameterRule::min_length)
        .def_readwrite("max_length", &ParameterRule::max_length)
        .def_readwrite("pattern",    &ParameterRule::pattern);

    py::class_<ParameterSchema>(m, "ParameterSchema")
        .def(py::init<>())
        .def("add",      &ParameterSchema::add,
             py::arg("rule"), py::return_value_policy::reference_internal)
        .def("required", &ParameterSchema::required,
             py::arg("name"), py::arg("type") = ValueType::Any,
             py::return_value_policy::reference_internal)
        .def("optional", &ParameterSchema::optional,
             py::arg("name"), py::arg("type") = ValueType::Any,
             py::return_value_policy::reference_internal)
        .def("range",    &ParameterSchema::range,
             py::arg("name"), py::arg("minimum"), py::arg("maximum"),
             py::arg("is_required") = false,
             py::return_value_policy::reference_internal)
        .def("length",   &ParameterSchema::length,
             py::arg("name"), py::arg("min_length"), py::arg("max_length"),
             py::arg("is_required") = false,
             py::return_value_policy::reference_internal)
        .def("pattern",  &ParameterSchema::pattern,
             py::arg("name"), py::arg("regex"), py::arg("is_required") = false,
             py::return_value_policy::reference_internal)
        .def("rules",    &ParameterSchema::rules)
        .def("has_required_fields", &ParameterSchema::has_required_fields)
        .def("empty",    &ParameterSchema::empty);

    py::class_<ValidationViolation>(m, "ValidationViolation")
        .def(py::init<>())
        .def_readwrite("parameter",        &ValidationViolation::parameter)
        .def_readwrite("message",          &ValidationViolation::message)
        .def_readwrite("missing_required", &ValidationViolation::missing_required);

    py::class_<ValidationReport>(m, "ValidationReport")
        .def(py::init<>())
        .def("is_valid",   &ValidationReport::is_valid)
        .def("violations", &ValidationReport::violations)
        .def("code",       &ValidationReport::code)
        .def("message",    &ValidationReport::message)
        .def("throw_if_invalid", &ValidationReport::throw_if_invalid);

    py::class_<Validator>(m, "Validator")
        .def_static("validate",
            [](py::object params, const ParameterSchema& schema, const ErrorCatalog* catalog) {
                return Validator::validate(from_python(params), schema,
                                           catalog ? *catalog : default_error_catalog());
            },
            py::arg("params"), py::arg("schema"), py::arg("catalog") = nullptr);
}
