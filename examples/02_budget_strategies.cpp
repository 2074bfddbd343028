// 02_budget_strategies.cpp
//
// One search tool, four budget strategies.
//
// The tool returns a list of strings in the Query category, so its
// pre-execution estimate is dominated by the declared result shape. The
// same oversized request is sent under each strategy:
//   - Warn:     proceeds, logs a warning.
//   - Truncate: proceeds, asks the response builder to shrink the payload.
//   - Throw:    aborted before the body runs (RESOURCE_LIMIT_EXCEEDED).
//   - Ignore:   proceeds silently.

#include <toolgov/toolgov.hpp>

#include <iostream>
#include <string>
#include <vector>

using namespace toolgov;

namespace {

struct SearchParams {
    std::string query;
    int limit = 10;
};

void from_json(const nlohmann::json& j, SearchParams& p) {
    j.at("query").get_to(p.query);
    if (j.contains("limit")) {
        j.at("limit").get_to(p.limit);
    }
}

class SearchTool : public TypedTool<SearchParams, std::vector<std::string>> {
public:
    SearchTool() : TypedTool("search", "Searches the symbol index", ToolCategory::Query) {
        schema()
            .required("query", ValueType::String)
            .range("limit", 1, 100);
    }

protected:
    std::vector<std::string> run(const SearchParams& p, const CancellationToken& token) override {
        std::vector<std::string> hits;
        for (int i = 0; i < p.limit; ++i) {
            token.throw_if_cancellation_requested();
            hits.push_back(p.query + "_match_" + std::to_string(i));
        }
        return hits;
    }
};

BudgetConfiguration small_budget(BudgetStrategy strategy) {
    BudgetConfiguration budget;
    budget.max_tokens = 1000;
    budget.warning_threshold = 800;
    budget.strategy = strategy;
    budget.estimation_multiplier = 1.2;
    return budget;
}

} // namespace

int main() {
    std::cout << "=== ToolGov: Budget Strategies Example ===\n\n";

    auto metrics = std::make_shared<MetricsMonitor>();
    auto console = std::make_shared<ConsoleMonitor>(ConsoleMonitor::Verbosity::Normal);
    auto monitors = std::make_shared<CompositeMonitor>();
    monitors->add_monitor(metrics);
    monitors->add_monitor(console);

    ToolRegistry registry(GovernorConfig{}, ErrorRecoveryOptions{}, monitors);
    auto search = std::make_shared<SearchTool>();
    registry.register_tool(search);

    // The estimate alone, without invoking anything
    nlohmann::json params = {{"query", "ResourceManager"}, {"limit", 25}};
    auto breakdown = CostEstimator::estimate_breakdown(
        params, search->result_shape(), search->category(), 1.2);
    std::cout << "Estimate for search: base " << breakdown.base
              << " + text " << breakdown.text
              << " + shape " << breakdown.shape
              << " x " << breakdown.multiplier
              << " = " << breakdown.total << " tokens\n\n";

    const BudgetStrategy strategies[] = {
        BudgetStrategy::Warn,
        BudgetStrategy::Truncate,
        BudgetStrategy::Throw,
        BudgetStrategy::Ignore,
    };

    for (auto strategy : strategies) {
        // Registry budgets apply per tool name
        registry.budgets().set_tool_budget("search", small_budget(strategy));

        std::cout << "--- strategy " << to_string(strategy) << " ---\n";
        auto result = registry.invoke("search", params);
        std::cout << "Status:    " << to_string(result.status) << "\n";
        std::cout << "Decision:  " << to_string(result.budget_decision) << "\n";
        std::cout << "Truncate:  " << (result.truncation_requested ? "yes" : "no") << "\n";
        if (result.succeeded()) {
            std::cout << "Hits:      " << result.value.size() << "\n";
        } else if (result.error) {
            std::cout << "Error:     [" << result.error->code << "] "
                      << result.error->message << "\n";
        }
        std::cout << "\n";
    }

    // A tool-level override wins over the registry table
    search->set_budget(BudgetConfiguration{});
    auto relaxed = registry.invoke("search", params);
    std::cout << "With the tool's own default budget: " << to_string(relaxed.status)
              << " (" << to_string(relaxed.budget_decision) << ")\n\n";

    auto m = metrics->get_metrics();
    std::cout << "=== Metrics ===\n";
    std::cout << "  invocations:        " << m.invocations << "\n";
    std::cout << "  succeeded:          " << m.succeeded << "\n";
    std::cout << "  failed:             " << m.failed << "\n";
    std::cout << "  budget warnings:    " << m.budget_warnings << "\n";
    std::cout << "  budget aborts:      " << m.budget_aborts << "\n";
    std::cout << "  truncation signals: " << m.truncation_signals << "\n";
    std::cout << "  mean accuracy:      " << m.average_estimate_accuracy << "\n";

    std::cout << "\n=== Done ===\n";
    return 0;
}
