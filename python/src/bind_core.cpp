#include "bind_forward.hpp"
#include <toolgov/toolgov.hpp>
#include <pybind11/stl.h>
#include <pybind11/functional.h>

#include <future>

using namespace toolgov;

// ---------------------------------------------------------------------------
// Trampoline class to allow Python subclassing of Tool
// ---------------------------------------------------------------------------
class PyTool : public Tool {
public:
    using Tool::Tool;

    // Optional in Python; raising ValidationError rejects the call
    void validate(const nlohmann::json& params) const override {
        py::gil_scoped_acquire acquire;
        py::function override = py::get_override(static_cast<const Tool*>(this), "validate");
        if (!override) {
            return;
        }
        try {
            override(to_python(params));
        } catch (py::error_already_set& e) {
            rethrow_as_native(e);
        }
    }

    nlohmann::json execute(const nlohmann::json& params,
                           const CancellationToken& token) override {
        py::gil_scoped_acquire acquire;
        py::function override = py::get_override(static_cast<const Tool*>(this), "execute");
        if (!override) {
            throw ToolGovException("Tool '" + name() + "' does not implement execute()");
        }
        try {
            return from_python(override(to_python(params), token));
        } catch (py::error_already_set& e) {
            rethrow_as_native(e);
        }
    }

    ShapeDescriptor result_shape() const override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE(ShapeDescriptor, Tool, result_shape, );
    }

    ParameterSchema& mutable_schema() noexcept { return schema(); }
};

// ---------------------------------------------------------------------------
// Wrapper for std::future<nlohmann::json>
// ---------------------------------------------------------------------------
struct FutureInvocation {
    std::future<nlohmann::json> fut;

    py::object result() {
        nlohmann::json value;
        {
            py::gil_scoped_release release;
            value = fut.get();
        }
        return to_python(value);
    }

    bool ready() const {
        return fut.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }
};

// ---------------------------------------------------------------------------
// bind_core  --  cancellation, Tool, InvocationResult, ExecutionGovernor,
//                ToolRegistry
// ---------------------------------------------------------------------------
void bind_core(py::module_& m) {

    // ===================================================================
    // Cancellation
    // ===================================================================
    py::class_<CancellationToken>(m, "CancellationToken")
        .def(py::init<>())
        .def("is_cancellation_requested", &CancellationToken::is_cancellation_requested)
        .def("can_be_cancelled",          &CancellationToken::can_be_cancelled)
        .def("throw_if_cancellation_requested",
             &CancellationToken::throw_if_cancellation_requested)
        .def_static("none", &CancellationToken::none);

    py::class_<CancellationSource>(m, "CancellationSource")
        .def(py::init<>())
        .def("token",  &CancellationSource::token)
        .def("cancel", &CancellationSource::cancel)
        .def("is_cancellation_requested", &CancellationSource::is_cancellation_requested);

    // ===================================================================
    // Tool
    // ===================================================================
    py::class_<Tool, PyTool, std::shared_ptr<Tool>>(m, "Tool")
        .def(py::init<std::string, std::string, ToolCategory>(),
             py::arg("name"), py::arg("description"),
             py::arg("category") = ToolCategory::General)
        // Getters
        .def("name",        &Tool::name)
        .def("description", &Tool::description)
        .def("category",    &Tool::category)
        .def("result_shape", &Tool::result_shape)
        // Structural validation
        .def("schema", [](Tool& self) -> ParameterSchema& {
                // Native tools keep their schema behind their own constructors
                auto* py_tool = dynamic_cast<PyTool*>(&self);
                if (!py_tool) {
                    throw py::type_error("schema() is only available on tools defined in "
                                         "Python; '" + self.name() + "' is a native tool");
                }
                return py_tool->mutable_schema();
             },
             py::return_value_policy::reference_internal)
        .def("validates_structure",     &Tool::validates_structure)
        .def("set_validates_structure", &Tool::set_validates_structure, py::arg("enabled"))
        // Per-tool configuration
        .def("set_budget", &Tool::set_budget, py::arg("budget"))
        .def("budget",     &Tool::budget)
        .def("add_middleware", &Tool::add_middleware,
             py::arg("middleware"), py::keep_alive<1, 2>())
        .def("middleware", &Tool::middleware)
        .def("set_error_catalog", [](Tool& self, std::shared_ptr<ErrorCatalog> catalog) {
                self.set_error_catalog(std::move(catalog));
             },
             py::arg("catalog"))
        .def("__repr__", [](const Tool& t) {
            return "<Tool name='" + t.name() + "' category=" + to_string(t.category()) + ">";
        });

    // ===================================================================
    // InvocationResult
    // ===================================================================
    py::class_<InvocationResult>(m, "InvocationResult")
        .def_readonly("status",              &InvocationResult::status)
        .def_readonly("tool_name",           &InvocationResult::tool_name)
        .def_readonly("error",               &InvocationResult::error)
        .def_readonly("cancellation_reason", &InvocationResult::cancellation_reason)
        .def_readonly("estimated_tokens",    &InvocationResult::estimated_tokens)
        .def_readonly("actual_tokens",       &InvocationResult::actual_tokens)
        .def_readonly("budget_decision",     &InvocationResult::budget_decision)
        .def_readonly("truncation_requested", &InvocationResult::truncation_requested)
        .def_readonly("elapsed_ms",          &InvocationResult::elapsed_ms)
        .def_property_readonly("value", [](const InvocationResult& r) {
            return to_python(r.value);
        })
        .def("succeeded", &InvocationResult::succeeded)
        .def("failed",    &InvocationResult::failed)
        .def("cancelled", &InvocationResult::cancelled)
        .def("value_or_throw", [](InvocationResult& r) {
            return to_python(r.value_or_throw());
        })
        .def("__repr__", [](const InvocationResult& r) {
            return "<InvocationResult tool='" + r.tool_name
                 + "' status=" + to_string(r.status) + ">";
        });

    py::class_<FutureInvocation>(m, "FutureInvocation")
        .def("result", &FutureInvocation::result)
        .def("ready",  &FutureInvocation::ready);

    // ===================================================================
    // ExecutionGovernor
    // ===================================================================
    py::class_<ExecutionGovernor, std::shared_ptr<ExecutionGovernor>>(m, "ExecutionGovernor")
        .def(py::init<GovernorConfig>(), py::arg("config") = GovernorConfig{})
        // Invocation
        .def("try_invoke",
            [](ExecutionGovernor& self, Tool& tool, py::object params,
               const CancellationToken& token) {
                auto raw = from_python(params);
                py::gil_scoped_release release;
                return self.try_invoke(tool, raw, token);
            },
            py::arg("tool"), py::arg("params") = py::none(),
            py::arg("token") = CancellationToken{})
        .def("invoke",
            [](ExecutionGovernor& self, Tool& tool, py::object params,
               const CancellationToken& token) {
                auto raw = from_python(params);
                nlohmann::json value;
                {
                    py::gil_scoped_release release;
                    value = self.invoke(tool, raw, token);
                }
                return to_python(value);
            },
            py::arg("tool"), py::arg("params") = py::none(),
            py::arg("token") = CancellationToken{})
        .def("invoke_async",
            [](ExecutionGovernor& self, std::shared_ptr<Tool> tool, py::object params,
               const CancellationToken& token) {
                auto raw = from_python(params);
                return FutureInvocation{self.invoke_async(std::move(tool), std::move(raw), token)};
            },
            py::arg("tool"), py::arg("params") = py::none(),
            py::arg("token") = CancellationToken{},
            py::keep_alive<0, 2>())
        // Wiring
        .def("set_middleware_registry", &ExecutionGovernor::set_middleware_registry,
             py::arg("registry"))
        .def("set_budget_registry",     &ExecutionGovernor::set_budget_registry,
             py::arg("registry"))
        .def("set_error_catalog", [](ExecutionGovernor& self, std::shared_ptr<ErrorCatalog> c) {
                self.set_error_catalog(std::move(c));
             },
             py::arg("catalog"))
        .def("set_monitor", &ExecutionGovernor::set_monitor, py::arg("monitor"))
        .def("middleware", &ExecutionGovernor::middleware,
             py::return_value_policy::reference_internal)
        .def("budgets", &ExecutionGovernor::budgets,
             py::return_value_policy::reference_internal)
        .def("error_catalog", &ExecutionGovernor::error_catalog,
             py::return_value_policy::reference_internal)
        .def("config", &ExecutionGovernor::config)
        .def("resolve_budget", &ExecutionGovernor::resolve_budget, py::arg("tool"));

    // ===================================================================
    // ToolRegistry
    // ===================================================================
    py::class_<ToolRegistry>(m, "ToolRegistry")
        .def(py::init<GovernorConfig, ErrorRecoveryOptions, std::shared_ptr<Monitor>>(),
             py::arg("config") = GovernorConfig{},
             py::arg("recovery") = ErrorRecoveryOptions{},
             py::arg("monitor") = nullptr)
        // Registration
        .def("register_tool", &ToolRegistry::register_tool,
             py::arg("tool"), py::keep_alive<1, 2>())
        .def("unregister_tool", &ToolRegistry::unregister_tool, py::arg("name"),
             py::call_guard<py::gil_scoped_release>())
        .def("find", &ToolRegistry::find, py::arg("name"))
        .def("get",  &ToolRegistry::get,  py::arg("name"))
        .def("tool_names", &ToolRegistry::tool_names)
        .def("size",       &ToolRegistry::size)
        .def("__len__",    &ToolRegistry::size)
        // Invocation
        .def("invoke",
            [](ToolRegistry& self, const std::string& name, py::object params,
               const CancellationToken& token) {
                auto raw = from_python(params);
                py::gil_scoped_release release;
                return self.invoke(name, raw, token);
            },
            py::arg("name"), py::arg("params") = py::none(),
            py::arg("token") = CancellationToken{})
        // Configuration
        .def("add_middleware", &ToolRegistry::add_middleware,
             py::arg("middleware"), py::keep_alive<1, 2>())
        .def("middleware", &ToolRegistry::middleware,
             py::return_value_policy::reference_internal)
        .def("budgets", &ToolRegistry::budgets,
             py::return_value_policy::reference_internal)
        .def("governor", &ToolRegistry::governor,
             py::return_value_policy::reference_internal)
        .def("error_catalog", &ToolRegistry::error_catalog,
             py::return_value_policy::reference_internal)
        // Shutdown
        .def("release_all", &ToolRegistry::release_all,
             py::call_guard<py::gil_scoped_release>());
}
