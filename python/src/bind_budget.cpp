#include "bind_forward.hpp"
#include <toolgov/toolgov.hpp>
#include <pybind11/stl.h>

using namespace toolgov;

// ---------------------------------------------------------------------------
// bind_budget  --  ShapeDescriptor, CostEstimator, BudgetPolicy, BudgetRegistry
// ---------------------------------------------------------------------------
void bind_budget(py::module_& m) {

    // ===================================================================
    // ShapeDescriptor
    // ===================================================================
    py::class_<ShapeDescriptor> shape(m, "ShapeDescriptor");

    py::enum_<ShapeDescriptor::Kind>(shape, "Kind")
        .value("Primitive",  ShapeDescriptor::Kind::Primitive)
        .value("Text",       ShapeDescriptor::Kind::Text)
        .value("Date",       ShapeDescriptor::Kind::Date)
        .value("Collection", ShapeDescriptor::Kind::Collection)
        .value("Object",     ShapeDescriptor::Kind::Object)
        .value("Response",   ShapeDescriptor::Kind::Response)
        .value("Opaque",     ShapeDescriptor::Kind::Opaque)
        .export_values();

    shape
        .def_readonly("kind",           &ShapeDescriptor::kind)
        .def_readonly("name",           &ShapeDescriptor::name)
        .def_readonly("property_count", &ShapeDescriptor::property_count)
        .def_readonly("method_count",   &ShapeDescriptor::method_count)
        .def_property_readonly("item", [](const ShapeDescriptor& s) -> std::optional<ShapeDescriptor> {
            if (!s.item) {
                return std::nullopt;
            }
            return *s.item;
        })
        .def_static("primitive", &ShapeDescriptor::primitive, py::arg("name") = "number")
        .def_static("text", &ShapeDescriptor::text)
        .def_static("date", &ShapeDescriptor::date)
        .def_static("collection_of", &ShapeDescriptor::collection_of, py::arg("item"))
        .def_static("object", &ShapeDescriptor::object,
                    py::arg("name"), py::arg("properties"), py::arg("methods") = 0)
        .def_static("response",
                    py::overload_cast<std::string>(&ShapeDescriptor::response),
                    py::arg("name"))
        .def_static("response",
                    py::overload_cast<std::string, ShapeDescriptor>(&ShapeDescriptor::response),
                    py::arg("name"), py::arg("item"))
        .def_static("opaque", &ShapeDescriptor::opaque, py::arg("name") = "")
        .def("looks_like_response", &ShapeDescriptor::looks_like_response)
        .def("__repr__", [](const ShapeDescriptor& s) {
            return "<ShapeDescriptor name='" + s.name + "'>";
        });

    // ===================================================================
    // CostEstimator
    // ===================================================================
    py::class_<TextAnalysis>(m, "TextAnalysis")
        .def(py::init<>())
        .def_readwrite("characters",       &TextAnalysis::characters)
        .def_readwrite("words",            &TextAnalysis::words)
        .def_readwrite("structural_chars", &TextAnalysis::structural_chars)
        .def_readwrite("numeric_runs",     &TextAnalysis::numeric_runs)
        .def_readwrite("structured",       &TextAnalysis::structured);

    py::class_<EstimateBreakdown>(m, "EstimateBreakdown")
        .def(py::init<>())
        .def_readwrite("base",       &EstimateBreakdown::base)
        .def_readwrite("text",       &EstimateBreakdown::text)
        .def_readwrite("shape",      &EstimateBreakdown::shape)
        .def_readwrite("multiplier", &EstimateBreakdown::multiplier)
        .def_readwrite("total",      &EstimateBreakdown::total);

    py::class_<CostEstimator>(m, "CostEstimator")
        .def_static("analyze_text", [](const std::string& text) {
            return CostEstimator::analyze_text(text);
        }, py::arg("text"))
        .def_static("estimate_text", [](const std::string& text) {
            return CostEstimator::estimate_text(text);
        }, py::arg("text"))
        .def_static("estimate_value", [](py::object value) {
            return CostEstimator::estimate_value(from_python(value));
        }, py::arg("value"))
        .def_static("base_estimate", &CostEstimator::base_estimate, py::arg("category"))
        .def_static("expected_item_count", &CostEstimator::expected_item_count,
                    py::arg("category"))
        .def_static("estimate_shape", &CostEstimator::estimate_shape,
                    py::arg("shape"), py::arg("category"))
        .def_static("estimate_breakdown",
            [](py::object params, const ShapeDescriptor& shape, ToolCategory category,
               double multiplier) {
                return CostEstimator::estimate_breakdown(from_python(params), shape,
                                                         category, multiplier);
            },
            py::arg("params"), py::arg("result_shape"), py::arg("category"),
            py::arg("multiplier") = 1.0)
        .def_static("estimate",
            [](py::object params, const ShapeDescriptor& shape, ToolCategory category,
               double multiplier) {
                return CostEstimator::estimate(from_python(params), shape, category, multiplier);
            },
            py::arg("params"), py::arg("result_shape"), py::arg("category"),
            py::arg("multiplier") = 1.0)
        .def_static("accuracy", &CostEstimator::accuracy,
                    py::arg("estimate"), py::arg("actual"));

    // ===================================================================
    // BudgetPolicy / BudgetRegistry
    // ===================================================================
    py::class_<BudgetVerdict>(m, "BudgetVerdict")
        .def(py::init<>())
        .def_readwrite("decision",          &BudgetVerdict::decision)
        .def_readwrite("approaching_limit", &BudgetVerdict::approaching_limit)
        .def_readwrite("estimate",          &BudgetVerdict::estimate)
        .def_readwrite("max_tokens",        &BudgetVerdict::max_tokens);

    py::class_<BudgetPolicy>(m, "BudgetPolicy")
        .def_static("evaluate", &BudgetPolicy::evaluate,
                    py::arg("estimate"), py::arg("config"));

    py::class_<BudgetRegistry, std::shared_ptr<BudgetRegistry>>(m, "BudgetRegistry")
        .def(py::init<BudgetConfiguration>(),
             py::arg("default_budget") = BudgetConfiguration{})
        .def("set_tool_budget",     &BudgetRegistry::set_tool_budget,
             py::arg("tool_name"), py::arg("config"))
        .def("set_category_budget", &BudgetRegistry::set_category_budget,
             py::arg("category"), py::arg("config"))
        .def("set_default_budget",  &BudgetRegistry::set_default_budget,
             py::arg("config"))
        .def("clear_tool_budget",   &BudgetRegistry::clear_tool_budget,
             py::arg("tool_name"))
        .def("resolve",             &BudgetRegistry::resolve,
             py::arg("tool_name"), py::arg("category"));
}
