// 03_scoped_resources.cpp
//
// Scoped-resource tools and cooperative cancellation.
//
// Scenario:
//   - "report" holds a (simulated) database session. After one failed
//     query it releases itself, and later calls fail fast with
//     TOOL_RELEASED.
//   - "export" runs a long job on a worker thread and is cancelled by
//     the caller half way through.
//   - Shutting the registry down releases whatever is still held, in
//     reverse registration order.

#include <toolgov/toolgov.hpp>

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

using namespace toolgov;
using namespace std::chrono_literals;

namespace {

struct ReportParams {
    std::string table;
};

void from_json(const nlohmann::json& j, ReportParams& p) {
    j.at("table").get_to(p.table);
}

class ReportTool : public ScopedResourceTool<ReportParams, std::string> {
public:
    ReportTool()
        : ScopedResourceTool("report", "Summarises a table over a database session",
                             ToolCategory::Analysis, /*release_on_failure=*/true) {
        schema().required("table", ValueType::String);
        std::cout << "[report] session opened\n";
    }

protected:
    std::string run(const ReportParams& p, const CancellationToken&) override {
        if (p.table == "missing") {
            throw std::runtime_error("relation \"missing\" does not exist");
        }
        return "42 rows in " + p.table;
    }

    void release_managed() override { std::cout << "[report] session closed\n"; }
    void release_unmanaged() override { std::cout << "[report] socket released\n"; }
};

class ExportTool : public ScopedResourceTool<nlohmann::json, std::string> {
public:
    ExportTool() : ScopedResourceTool("export", "Streams a large export", ToolCategory::Resources) {}

protected:
    std::string run(const nlohmann::json&, const CancellationToken& token) override {
        for (int chunk = 0; chunk < 100; ++chunk) {
            token.throw_if_cancellation_requested();
            std::this_thread::sleep_for(10ms);
        }
        return "export complete";
    }

    void release_managed() override { std::cout << "[export] temp files removed\n"; }
};

void describe(const InvocationResult& result) {
    std::cout << "  -> " << to_string(result.status);
    if (result.succeeded()) {
        std::cout << ": " << result.value.dump();
    } else if (result.error) {
        std::cout << " [" << result.error->code << "] " << result.error->message;
    }
    std::cout << "\n";
}

} // namespace

int main() {
    std::cout << "=== ToolGov: Scoped Resources Example ===\n\n";

    auto console = std::make_shared<ConsoleMonitor>(ConsoleMonitor::Verbosity::Verbose);
    ToolRegistry registry(GovernorConfig{}, ErrorRecoveryOptions{}, console);

    auto report = std::make_shared<ReportTool>();
    auto exporter = std::make_shared<ExportTool>();
    registry.register_tool(report);
    registry.register_tool(exporter);

    // ----------------------------------------------------------------
    // 1. Release on failure.
    // ----------------------------------------------------------------
    std::cout << "--- report(users) ---\n";
    describe(registry.invoke("report", {{"table", "users"}}));

    std::cout << "--- report(missing) ---\n";
    describe(registry.invoke("report", {{"table", "missing"}}));
    std::cout << "  released: " << (report->is_released() ? "yes" : "no") << "\n";

    std::cout << "--- report(users) after release ---\n";
    describe(registry.invoke("report", {{"table", "users"}}));
    std::cout << "\n";

    // ----------------------------------------------------------------
    // 2. Cooperative cancellation from another thread.
    // ----------------------------------------------------------------
    std::cout << "--- export, cancelled after 200ms ---\n";
    CancellationSource source;
    auto future = registry.governor().invoke_async(exporter, nlohmann::json::object(),
                                                   source.token());
    std::this_thread::sleep_for(200ms);
    source.cancel();

    try {
        future.get();
    } catch (const OperationCancelledException& e) {
        std::cout << "  -> cancelled: " << e.what() << "\n";
    }
    std::cout << "  export still usable: " << (exporter->is_released() ? "no" : "yes") << "\n\n";

    // ----------------------------------------------------------------
    // 3. Deterministic shutdown.
    // ----------------------------------------------------------------
    std::cout << "--- release_all ---\n";
    registry.release_all();

    std::cout << "\n=== Done ===\n";
    return 0;
}
