#include "bind_forward.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>

#include <toolgov/toolgov.hpp>

using namespace toolgov;

namespace {

// Borrowed from the module; the module outlives every call into it
PyObject* g_validation_error = nullptr;
PyObject* g_cancelled_error = nullptr;

} // namespace

// ---------------------------------------------------------------------------
// Module entry point
// ---------------------------------------------------------------------------
PYBIND11_MODULE(_toolgov, m) {
    m.doc() = "ToolGov: execution governor for strongly-typed agent tools";

    bind_enums_and_structs(m);
    bind_exceptions(m);
    bind_monitors(m);
    bind_budget(m);
    bind_errors(m);
    bind_middleware(m);
    bind_core(m);
}

// ---------------------------------------------------------------------------
// JSON bridge
// ---------------------------------------------------------------------------
py::object to_python(const nlohmann::json& value) {
    if (value.is_null()) {
        return py::none();
    }
    return py::module_::import("json").attr("loads")(value.dump());
}

nlohmann::json from_python(const py::handle& obj) {
    if (obj.is_none()) {
        return nullptr;
    }
    auto text = py::module_::import("json").attr("dumps")(obj).cast<std::string>();
    return nlohmann::json::parse(text);
}

void rethrow_as_native(py::error_already_set& e) {
    if (g_cancelled_error && e.matches(g_cancelled_error)) {
        throw OperationCancelledException(py::str(e.value()).cast<std::string>());
    }
    if (g_validation_error && e.matches(g_validation_error)) {
        throw ValidationException(py::str(e.value()).cast<std::string>());
    }
    throw;
}

// ---------------------------------------------------------------------------
// Enums & structs
// ---------------------------------------------------------------------------
void bind_enums_and_structs(py::module_& m) {

    // ---- Enums ------------------------------------------------------------

    py::enum_<ToolCategory>(m, "ToolCategory")
        .value("General",       ToolCategory::General)
        .value("Query",         ToolCategory::Query)
        .value("Analysis",      ToolCategory::Analysis)
        .value("Generation",    ToolCategory::Generation)
        .value("Refactoring",   ToolCategory::Refactoring)
        .value("Validation",    ToolCategory::Validation)
        .value("Documentation", ToolCategory::Documentation)
        .value("Configuration", ToolCategory::Configuration)
        .value("Diagnostics",   ToolCategory::Diagnostics)
        .value("Testing",       ToolCategory::Testing)
        .value("Deployment",    ToolCategory::Deployment)
        .value("Security",      ToolCategory::Security)
        .value("Resources",     ToolCategory::Resources)
        .value("Integration",   ToolCategory::Integration)
        .value("Monitoring",    ToolCategory::Monitoring)
        .value("Utility",       ToolCategory::Utility)
        .export_values();

    py::enum_<BudgetStrategy>(m, "BudgetStrategy")
        .value("Warn",     BudgetStrategy::Warn)
        .value("Throw",    BudgetStrategy::Throw)
        .value("Truncate", BudgetStrategy::Truncate)
        .value("Ignore",   BudgetStrategy::Ignore)
        .export_values();

    py::enum_<BudgetDecision>(m, "BudgetDecision")
        .value("Proceed",               BudgetDecision::Proceed)
        .value("ProceedWarn",           BudgetDecision::ProceedWarn)
        .value("ProceedTruncateSignal", BudgetDecision::ProceedTruncateSignal)
        .value("Abort",                 BudgetDecision::Abort)
        .export_values();

    py::enum_<InvocationStatus>(m, "InvocationStatus")
        .value("Succeeded", InvocationStatus::Succeeded)
        .value("Failed",    InvocationStatus::Failed)
        .value("Cancelled", InvocationStatus::Cancelled)
        .export_values();

    py::enum_<LogLevel>(m, "LogLevel")
        .value("Debug",   LogLevel::Debug)
        .value("Info",    LogLevel::Info)
        .value("Warning", LogLevel::Warning)
        .value("Error",   LogLevel::Error)
        .export_values();

    py::enum_<ValueType>(m, "ValueType")
        .value("Any",     ValueType::Any)
        .value("String",  ValueType::String)
        .value("Number",  ValueType::Number)
        .value("Integer", ValueType::Integer)
        .value("Boolean", ValueType::Boolean)
        .value("Array",   ValueType::Array)
        .value("Object",  ValueType::Object)
        .export_values();

    py::enum_<EventType>(m, "EventType")
        .value("InvocationStarted",         EventType::InvocationStarted)
        .value("InvocationSucceeded",       EventType::InvocationSucceeded)
        .value("InvocationFailed",          EventType::InvocationFailed)
        .value("InvocationCancelled",       EventType::InvocationCancelled)
        .value("ValidationFailed",          EventType::ValidationFailed)
        .value("BudgetApproachingLimit",    EventType::BudgetApproachingLimit)
        .value("BudgetExceededWarning",     EventType::BudgetExceededWarning)
        .value("BudgetTruncationSignalled", EventType::BudgetTruncationSignalled)
        .value("BudgetExceededAbort",       EventType::BudgetExceededAbort)
        .value("EstimateAccuracy",          EventType::EstimateAccuracy)
        .value("MiddlewareRegistered",      EventType::MiddlewareRegistered)
        .value("MiddlewareHookFailed",      EventType::MiddlewareHookFailed)
        .value("MiddlewareActivity",        EventType::MiddlewareActivity)
        .value("ToolRegistered",            EventType::ToolRegistered)
        .value("ToolUnregistered",          EventType::ToolUnregistered)
        .value("ToolReleased",              EventType::ToolReleased)
        .value("ToolReleaseFailed",         EventType::ToolReleaseFailed)
        .value("ToolLeaked",                EventType::ToolLeaked)
        .value("ErrorCatalogFailure",       EventType::ErrorCatalogFailure)
        .export_values();

    py::enum_<ConsoleMonitor::Verbosity>(m, "Verbosity")
        .value("Quiet",   ConsoleMonitor::Verbosity::Quiet)
        .value("Normal",  ConsoleMonitor::Verbosity::Normal)
        .value("Verbose", ConsoleMonitor::Verbosity::Verbose)
        .value("Debug",   ConsoleMonitor::Verbosity::Debug)
        .export_values();

    // ---- Configuration ----------------------------------------------------

    py::class_<BudgetConfiguration>(m, "BudgetConfiguration")
        .def(py::init<>())
        .def_readwrite("max_tokens",            &BudgetConfiguration::max_tokens)
        .def_readwrite("warning_threshold",     &BudgetConfiguration::warning_threshold)
        .def_readwrite("strategy",              &BudgetConfiguration::strategy)
        .def_readwrite("estimation_multiplier", &BudgetConfiguration::estimation_multiplier)
        .def("validate", &BudgetConfiguration::validate);

    py::class_<ErrorRecoveryOptions>(m, "ErrorRecoveryOptions")
        .def(py::init<>())
        .def_readwrite("enable_recovery_guidance",  &ErrorRecoveryOptions::enable_recovery_guidance)
        .def_readwrite("suggest_alternative_tools", &ErrorRecoveryOptions::suggest_alternative_tools);

    py::class_<GovernorConfig>(m, "GovernorConfig")
        .def(py::init<>())
        .def_readwrite("default_budget",          &GovernorConfig::default_budget)
        .def_readwrite("emit_accuracy_telemetry", &GovernorConfig::emit_accuracy_telemetry);

    // ---- Error records -----------------------------------------------------

    py::class_<SuggestedAction>(m, "SuggestedAction")
        .def(py::init<>())
        .def_readwrite("tool",        &SuggestedAction::tool)
        .def_readwrite("description", &SuggestedAction::description)
        .def_property("parameters",
            [](const SuggestedAction& a) { return to_python(a.parameters); },
            [](SuggestedAction& a, py::object value) { a.parameters = from_python(value); });

    py::class_<RecoveryInfo>(m, "RecoveryInfo")
        .def(py::init<>())
        .def_readwrite("steps",             &RecoveryInfo::steps)
        .def_readwrite("suggested_actions", &RecoveryInfo::suggested_actions);

    py::class_<ErrorRecord>(m, "ErrorRecord")
        .def(py::init<>())
        .def_readwrite("code",     &ErrorRecord::code)
        .def_readwrite("message",  &ErrorRecord::message)
        .def_readwrite("recovery", &ErrorRecord::recovery)
        .def("to_dict", [](const ErrorRecord& r) { return to_python(r.to_json()); })
        .def("__repr__", [](const ErrorRecord& r) {
            return "<ErrorRecord code='" + r.code + "' message='" + r.message + "'>";
        });

    // ---- Monitoring --------------------------------------------------------

    py::class_<MonitorEvent>(m, "MonitorEvent")
        .def(py::init<>())
        .def_readwrite("type",             &MonitorEvent::type)
        .def_readwrite("level",            &MonitorEvent::level)
        .def_readwrite("timestamp",        &MonitorEvent::timestamp)
        .def_readwrite("message",          &MonitorEvent::message)
        .def_readwrite("tool_name",        &MonitorEvent::tool_name)
        .def_readwrite("elapsed_ms",       &MonitorEvent::elapsed_ms)
        .def_readwrite("estimated_tokens", &MonitorEvent::estimated_tokens)
        .def_readwrite("actual_tokens",    &MonitorEvent::actual_tokens)
        .def_readwrite("error_code",       &MonitorEvent::error_code)
        .def_readwrite("accuracy",         &MonitorEvent::accuracy);

    // MetricsMonitor::Metrics (bound as module-level "Metrics")
    py::class_<MetricsMonitor::Metrics>(m, "Metrics")
        .def(py::init<>())
        .def_readwrite("invocations",               &MetricsMonitor::Metrics::invocations)
        .def_readwrite("succeeded",                 &MetricsMonitor::Metrics::succeeded)
        .def_readwrite("failed",                    &MetricsMonitor::Metrics::failed)
        .def_readwrite("cancelled",                 &MetricsMonitor::Metrics::cancelled)
        .def_readwrite("validation_failures",       &MetricsMonitor::Metrics::validation_failures)
        .def_readwrite("budget_warnings",           &MetricsMonitor::Metrics::budget_warnings)
        .def_readwrite("budget_aborts",             &MetricsMonitor::Metrics::budget_aborts)
        .def_readwrite("truncation_signals",        &MetricsMonitor::Metrics::truncation_signals)
        .def_readwrite("hook_failures",             &MetricsMonitor::Metrics::hook_failures)
        .def_readwrite("warnings_logged",           &MetricsMonitor::Metrics::warnings_logged)
        .def_readwrite("average_elapsed_ms",        &MetricsMonitor::Metrics::average_elapsed_ms)
        .def_readwrite("average_estimate_accuracy", &MetricsMonitor::Metrics::average_estimate_accuracy);

    // ---- Error code constants ---------------------------------------------

    m.attr("VALIDATION_ERROR")        = error_codes::ValidationError;
    m.attr("PARAMETER_REQUIRED")      = error_codes::ParameterRequired;
    m.attr("TOOL_ERROR")              = error_codes::ToolError;
    m.attr("TIMEOUT")                 = error_codes::Timeout;
    m.attr("RESOURCE_LIMIT_EXCEEDED") = error_codes::ResourceLimitExceeded;
    m.attr("TOOL_RELEASED")           = error_codes::ToolReleased;
    m.attr("TOOL_NOT_FOUND")          = error_codes::ToolNotFound;
}

// ---------------------------------------------------------------------------
// Exceptions
// ---------------------------------------------------------------------------
void bind_exceptions(py::module_& m) {
    // Base exception -> RuntimeError
    static auto py_ToolGovError =
        py::register_exception<ToolGovException>(m, "ToolGovError", PyExc_RuntimeError);

    static auto py_ToolExecutionError =
        py::register_exception<ToolExecutionError>(m, "ToolExecutionError", py_ToolGovError.ptr());
    static auto py_ToolReleasedError =
        py::register_exception<ToolReleasedError>(m, "ToolReleasedError", py_ToolExecutionError.ptr());

    static auto py_OperationCancelledError =
        py::register_exception<OperationCancelledException>(m, "OperationCancelledError", py_ToolGovError.ptr());
    static auto py_ToolError =
        py::register_exception<ToolError>(m, "ToolError", py_ToolGovError.ptr());
    static auto py_ValidationError =
        py::register_exception<ValidationException>(m, "ValidationError", py_ToolGovError.ptr());
    static auto py_ToolNotFoundError =
        py::register_exception<ToolNotFoundException>(m, "ToolNotFoundError", py_ToolGovError.ptr());
    static auto py_ToolAlreadyRegisteredError =
        py::register_exception<ToolAlreadyRegisteredException>(m, "ToolAlreadyRegisteredError", py_ToolGovError.ptr());

    g_validation_error = py_ValidationError.ptr();
    g_cancelled_error = py_OperationCancelledError.ptr();
}
