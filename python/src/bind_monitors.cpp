#include "bind_forward.hpp"
#include <toolgov/toolgov.hpp>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>

#include <optional>
#include <stdexcept>
#include <string>

using namespace toolgov;

// Python monitors run on whichever thread raised the event. A Python
// exception is converted while the GIL is still held so the native side
// only ever sees std::runtime_error, which notify() reports and drops.
class PyMonitor : public Monitor {
public:
    using Monitor::Monitor;

    void on_event(const MonitorEvent& event) override {
        py::gil_scoped_acquire acquire;
        try {
            PYBIND11_OVERRIDE_PURE(void, Monitor, on_event, event);
        } catch (const py::error_already_set& e) {
            throw std::runtime_error(std::string("Python monitor raised: ") + e.what());
        }
    }
};

void bind_monitors(py::module_& m) {
    py::class_<Monitor, PyMonitor, std::shared_ptr<Monitor>>(m, "Monitor",
        "Receives governor, registry and middleware events. Subclass and\n"
        "override on_event; an exception raised there is logged to stderr\n"
        "and never fails the invocation that produced the event.")
        .def(py::init<>())
        .def("on_event", &Monitor::on_event, py::arg("event"),
             "Called once per MonitorEvent, possibly from a worker thread.");

    m.def("make_event",
          [](EventType type, LogLevel level, std::string message,
             std::optional<std::string> tool_name) {
              return make_event(type, level, std::move(message), std::move(tool_name));
          },
          py::arg("type"), py::arg("level"), py::arg("message") = std::string(),
          py::arg("tool_name") = py::none(),
          "Builds a MonitorEvent stamped with the current time.");

    m.def("notify",
          [](const std::shared_ptr<Monitor>& monitor, const MonitorEvent& event) {
              py::gil_scoped_release release;
              notify(monitor.get(), event);
          },
          py::arg("monitor"), py::arg("event"),
          "Delivers an event the way the governor does: a monitor that fails\n"
          "is reported on stderr instead of raising. None is accepted.");

    py::class_<ConsoleMonitor, Monitor, std::shared_ptr<ConsoleMonitor>>(m, "ConsoleMonitor",
        "Writes one '[ToolGov] LEVEL EventType ...' line per event to stdout.\n"
        "Events below the verbosity's minimum level are skipped.")
        .def(py::init<ConsoleMonitor::Verbosity>(),
             py::arg("verbosity") = ConsoleMonitor::Verbosity::Normal)
        .def("on_event", &ConsoleMonitor::on_event, py::arg("event"),
             py::call_guard<py::gil_scoped_release>());

    py::class_<MetricsMonitor, Monitor, std::shared_ptr<MetricsMonitor>>(m, "MetricsMonitor",
        "Aggregates invocation outcomes, budget decisions, hook failures and\n"
        "estimate accuracy into a Metrics snapshot.")
        .def(py::init<>())
        .def("get_metrics", &MetricsMonitor::get_metrics,
             "Returns a copy of the current counters.")
        .def("reset_metrics", &MetricsMonitor::reset_metrics)
        .def("set_failure_alert_threshold",
            [](MetricsMonitor& self, std::uint64_t failures, py::function cb) {
                MetricsMonitor::AlertCallback cpp_cb =
                    [cb = py::object(cb)](const std::string& msg) {
                        py::gil_scoped_acquire acquire;
                        cb(msg);
                    };
                self.set_failure_alert_threshold(failures, std::move(cpp_cb));
            },
            py::arg("failures"), py::arg("callback"),
            "Calls callback(message) once when the failure count reaches\n"
            "`failures`. Zero disables the alert.");

    py::class_<CompositeMonitor, Monitor, std::shared_ptr<CompositeMonitor>>(m, "CompositeMonitor",
        "Forwards each event to every attached monitor in insertion order.\n"
        "A failing child does not stop delivery to the rest.")
        .def(py::init<>())
        .def("add_monitor", &CompositeMonitor::add_monitor, py::arg("monitor"),
             "Attach before the composite is shared with a governor.");
}
