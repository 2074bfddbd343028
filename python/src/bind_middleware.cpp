#include "bind_forward.hpp"
#include <toolgov/toolgov.hpp>
#include <pybind11/stl.h>

using namespace toolgov;

// Trampoline for Python subclasses of SimpleMiddleware. Hooks that are not
// overridden keep the no-op behaviour.
class PySimpleMiddleware : public SimpleMiddleware {
public:
    using SimpleMiddleware::SimpleMiddleware;

    void before_execution(const std::string& tool_name,
                          const nlohmann::json& params) override {
        py::gil_scoped_acquire acquire;
        py::function override = py::get_override(
            static_cast<const SimpleMiddleware*>(this), "before_execution");
        if (!override) {
            return;
        }
        try {
            override(tool_name, to_python(params));
        } catch (py::error_already_set& e) {
            rethrow_as_native(e);
        }
    }

    void after_execution(const std::string& tool_name, const nlohmann::json& params,
                         const nlohmann::json& result, double elapsed_ms) override {
        py::gil_scoped_acquire acquire;
        py::function override = py::get_override(
            static_cast<const SimpleMiddleware*>(this), "after_execution");
        if (override) {
            override(tool_name, to_python(params), to_python(result), elapsed_ms);
        }
    }

    // Python sees (tool_name, params, message, code, elapsed_ms); code is
    // None for cancellation
    void on_error(const std::string& tool_name, const nlohmann::json& params,
                  const std::exception& error, double elapsed_ms) override {
        py::gil_scoped_acquire acquire;
        py::function override = py::get_override(
            static_cast<const SimpleMiddleware*>(this), "on_error");
        if (!override) {
            return;
        }
        py::object code = py::none();
        if (auto* failure = dynamic_cast<const ToolExecutionError*>(&error)) {
            code = py::str(failure->code());
        }
        override(tool_name, to_python(params), std::string(error.what()), code, elapsed_ms);
    }
};

// ---------------------------------------------------------------------------
// bind_middleware  --  Middleware, SimpleMiddleware, registry, built-ins
// ---------------------------------------------------------------------------
void bind_middleware(py::module_& m) {

    // Abstract base, not constructible from Python
    py::class_<Middleware, std::shared_ptr<Middleware>>(m, "Middleware")
        .def("order",      &Middleware::order)
        .def("is_enabled", &Middleware::is_enabled);

    py::class_<SimpleMiddleware, Middleware, PySimpleMiddleware,
               std::shared_ptr<SimpleMiddleware>>(m, "SimpleMiddleware")
        .def(py::init<MiddlewareOrder, bool>(),
             py::arg("order") = 0, py::arg("enabled") = true)
        .def("set_order",   &SimpleMiddleware::set_order,   py::arg("order"))
        .def("set_enabled", &SimpleMiddleware::set_enabled, py::arg("enabled"));

    py::class_<MiddlewareRegistry, std::shared_ptr<MiddlewareRegistry>>(m, "MiddlewareRegistry")
        .def(py::init<>())
        .def("add", &MiddlewareRegistry::add, py::arg("middleware"), py::keep_alive<1, 2>())
        .def("snapshot", &MiddlewareRegistry::snapshot)
        .def("size", &MiddlewareRegistry::size)
        .def("__len__", &MiddlewareRegistry::size)
        .def("set_monitor", &MiddlewareRegistry::set_monitor, py::arg("monitor"));

    // ---- Built-in middleware ----------------------------------------------

    py::class_<LoggingMiddleware, SimpleMiddleware, std::shared_ptr<LoggingMiddleware>>(
            m, "LoggingMiddleware")
        .def(py::init<std::shared_ptr<Monitor>, MiddlewareOrder>(),
             py::arg("monitor"), py::arg("order") = LoggingMiddleware::kDefaultOrder);

    py::class_<TokenCountingMiddleware::Totals>(m, "TokenTotals")
        .def(py::init<>())
        .def_readwrite("input_tokens",  &TokenCountingMiddleware::Totals::input_tokens)
        .def_readwrite("output_tokens", &TokenCountingMiddleware::Totals::output_tokens)
        .def_readwrite("completed",     &TokenCountingMiddleware::Totals::completed)
        .def_readwrite("failed",        &TokenCountingMiddleware::Totals::failed);

    py::class_<TokenCountingMiddleware, SimpleMiddleware,
               std::shared_ptr<TokenCountingMiddleware>>(m, "TokenCountingMiddleware")
        .def(py::init<std::shared_ptr<Monitor>, MiddlewareOrder>(),
             py::arg("monitor") = nullptr,
             py::arg("order") = TokenCountingMiddleware::kDefaultOrder)
        .def("totals", &TokenCountingMiddleware::totals)
        .def("reset",  &TokenCountingMiddleware::reset);

    // ---- Type verification ------------------------------------------------

    py::class_<VerifiedTypeStore, std::shared_ptr<VerifiedTypeStore>>(m, "VerifiedTypeStore")
        .def(py::init<>())
        .def("mark_verified", &VerifiedTypeStore::mark_verified, py::arg("type_name"))
        .def("forget",        &VerifiedTypeStore::forget,        py::arg("type_name"))
        .def("is_verified",   &VerifiedTypeStore::is_verified,   py::arg("type_name"))
        .def("clear",         &VerifiedTypeStore::clear)
        .def("__len__",       &VerifiedTypeStore::size);

    py::enum_<TypeVerificationMode>(m, "TypeVerificationMode")
        .value("Warning", TypeVerificationMode::Warning)
        .value("Strict",  TypeVerificationMode::Strict);

    py::class_<TypeVerificationOptions>(m, "TypeVerificationOptions")
        .def(py::init<>())
        .def_readwrite("mode",              &TypeVerificationOptions::mode)
        .def_readwrite("edit_tools",        &TypeVerificationOptions::edit_tools)
        .def_readwrite("whitelisted_types", &TypeVerificationOptions::whitelisted_types);

    py::class_<TypeVerificationMiddleware, SimpleMiddleware,
               std::shared_ptr<TypeVerificationMiddleware>>(m, "TypeVerificationMiddleware")
        .def(py::init<std::shared_ptr<VerifiedTypeStore>, TypeVerificationOptions,
                      std::shared_ptr<Monitor>, MiddlewareOrder>(),
             py::arg("store"),
             py::arg("options") = TypeVerificationOptions{},
             py::arg("monitor") = nullptr,
             py::arg("order") = TypeVerificationMiddleware::kDefaultOrder)
        .def("is_edit_tool",     &TypeVerificationMiddleware::is_edit_tool, py::arg("tool_name"))
        .def("is_whitelisted",   &TypeVerificationMiddleware::is_whitelisted, py::arg("type_name"))
        .def("unverified_types", &TypeVerificationMiddleware::unverified_types, py::arg("code"))
        .def("store",            &TypeVerificationMiddleware::store)
        .def_static("extract_code",
                    [](const py::handle& params) {
                        return TypeVerificationMiddleware::extract_code(from_python(params));
                    },
                    py::arg("params"))
        .def_static("extract_type_names", &TypeVerificationMiddleware::extract_type_names,
                    py::arg("code"));
}
