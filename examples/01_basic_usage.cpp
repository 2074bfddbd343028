// 01_basic_usage.cpp
//
// Minimal ToolGov example: two tools behind one registry.
//
// Scenario:
//   - "echo" repeats a required string parameter.
//   - "divide" divides two numbers and fails on a zero divisor.
//   - A logging middleware and a token counter wrap every call.
//   - Each failure comes back as a structured ErrorRecord with recovery
//     steps, never as a raw exception.

#include <toolgov/toolgov.hpp>

#include <iostream>
#include <stdexcept>
#include <string>

using namespace toolgov;

namespace {

struct EchoParams {
    std::string text;
};

void from_json(const nlohmann::json& j, EchoParams& p) {
    j.at("text").get_to(p.text);
}

struct DivideParams {
    double a = 0;
    double b = 0;
};

void from_json(const nlohmann::json& j, DivideParams& p) {
    j.at("a").get_to(p.a);
    j.at("b").get_to(p.b);
}

class EchoTool : public TypedTool<EchoParams, std::string> {
public:
    EchoTool() : TypedTool("echo", "Echoes the given text", ToolCategory::Utility) {
        schema().length("text", 1, 200, true);
    }

protected:
    std::string run(const EchoParams& p, const CancellationToken&) override {
        return "You said: " + p.text;
    }
};

class DivideTool : public TypedTool<DivideParams, double> {
public:
    DivideTool() : TypedTool("divide", "Divides a by b", ToolCategory::Utility) {
        schema().required("a", ValueType::Number).required("b", ValueType::Number);
    }

protected:
    double run(const DivideParams& p, const CancellationToken&) override {
        if (p.b == 0) {
            throw std::domain_error("Division by zero");
        }
        return p.a / p.b;
    }
};

void print_result(const InvocationResult& result) {
    std::cout << "Status: " << to_string(result.status)
              << " (estimate " << result.estimated_tokens << " tokens, "
              << result.elapsed_ms << " ms)\n";

    if (result.succeeded()) {
        std::cout << "Value:  " << result.value.dump() << "\n\n";
        return;
    }
    if (result.error) {
        std::cout << result.error->to_json().dump(2) << "\n\n";
    }
}

} // namespace

int main() {
    std::cout << "=== ToolGov: Basic Usage Example ===\n\n";

    // ----------------------------------------------------------------
    // 1. Create the registry and attach a console monitor.
    // ----------------------------------------------------------------
    auto console = std::make_shared<ConsoleMonitor>(ConsoleMonitor::Verbosity::Verbose);
    ToolRegistry registry(GovernorConfig{}, ErrorRecoveryOptions{}, console);

    // ----------------------------------------------------------------
    // 2. Global middleware: logging first, token counting last.
    // ----------------------------------------------------------------
    auto counter = std::make_shared<TokenCountingMiddleware>();
    registry.add_middleware(std::make_shared<LoggingMiddleware>(console));
    registry.add_middleware(counter);

    // ----------------------------------------------------------------
    // 3. Register the tools.
    // ----------------------------------------------------------------
    registry.register_tool(std::make_shared<EchoTool>());
    registry.register_tool(std::make_shared<DivideTool>());

    std::cout << "Registered " << registry.size() << " tools.\n\n";

    // ----------------------------------------------------------------
    // 4. Successful calls.
    // ----------------------------------------------------------------
    std::cout << "--- echo(\"hello\") ---\n";
    print_result(registry.invoke("echo", {{"text", "hello"}}));

    std::cout << "--- divide(10, 4) ---\n";
    print_result(registry.invoke("divide", {{"a", 10}, {"b", 4}}));

    // ----------------------------------------------------------------
    // 5. Failures become ErrorRecords.
    // ----------------------------------------------------------------
    std::cout << "--- echo() without text ---\n";
    print_result(registry.invoke("echo", nlohmann::json::object()));

    std::cout << "--- divide(1, 0) ---\n";
    print_result(registry.invoke("divide", {{"a", 1}, {"b", 0}}));

    std::cout << "--- unknown tool ---\n";
    print_result(registry.invoke("translate", {{"text", "bonjour"}}));

    // ----------------------------------------------------------------
    // 6. Throwing entry point.
    // ----------------------------------------------------------------
    try {
        registry.governor().invoke(*registry.get("divide"), {{"a", 1}, {"b", 0}});
    } catch (const ToolExecutionError& e) {
        std::cout << "Caught ToolExecutionError [" << e.code() << "]: " << e.what() << "\n\n";
    }

    // ----------------------------------------------------------------
    // 7. Token totals seen by the counting middleware.
    // ----------------------------------------------------------------
    auto totals = counter->totals();
    std::cout << "=== Token Totals ===\n";
    std::cout << "  input:     " << totals.input_tokens << "\n";
    std::cout << "  output:    " << totals.output_tokens << "\n";
    std::cout << "  completed: " << totals.completed << "\n";
    std::cout << "  failed:    " << totals.failed << "\n";

    std::cout << "\n=== Done ===\n";
    return 0;
}
