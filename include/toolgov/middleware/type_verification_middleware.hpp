#pragma once

#include "toolgov/middleware.hpp"
#include "toolgov/monitor.hpp"

#include <cstddef>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace toolgov {

// Type names an agent has confirmed exist (through a definition lookup or a
// symbol search). Shared between the tools that confirm names and the
// middleware that checks edits against them.
class VerifiedTypeStore {
public:
    void mark_verified(const std::string& type_name);
    void forget(const std::string& type_name);
    bool is_verified(const std::string& type_name) const;

    void clear();
    std::size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_set<std::string> verified_;
};

enum class TypeVerificationMode {
    Warning,  // report unverified names and let the edit through
    Strict,   // reject the edit before validation
};

struct TypeVerificationOptions {
    TypeVerificationMode mode{TypeVerificationMode::Strict};

    // Tool names treated as code edits, compared case-insensitively
    std::vector<std::string> edit_tools{"Edit", "Write", "MultiEdit", "NotebookEdit"};

    // Added to the built-in language and standard-library names
    std::vector<std::string> whitelisted_types;
};

// Pre-execution policy for code-editing tools. Pulls the code an edit would
// write out of the raw parameters, extracts the type names it references and
// rejects names that are neither verified nor whitelisted. Runs ahead of
// most middleware so other hooks never see a rejected edit.
class TypeVerificationMiddleware : public SimpleMiddleware {
public:
    static constexpr MiddlewareOrder kDefaultOrder = 5;

    // Lines longer than this are not scanned
    static constexpr std::size_t kMaxScannedLineLength = 4096;

    explicit TypeVerificationMiddleware(std::shared_ptr<VerifiedTypeStore> store,
                                        TypeVerificationOptions options = TypeVerificationOptions{},
                                        std::shared_ptr<Monitor> monitor = nullptr,
                                        MiddlewareOrder order = kDefaultOrder);

    // Throws ToolError(TYPE_VERIFICATION_ERROR) in strict mode
    void before_execution(const std::string& tool_name,
                          const nlohmann::json& params) override;

    bool is_edit_tool(const std::string& tool_name) const;
    bool is_whitelisted(const std::string& type_name) const;

    // Referenced names that are neither whitelisted nor verified, in order
    // of first appearance
    std::vector<std::string> unverified_types(const std::string& code) const;

    const TypeVerificationOptions& options() const noexcept { return options_; }
    const std::shared_ptr<VerifiedTypeStore>& store() const noexcept { return store_; }

    // new_string, content, new_source and every edits[].new_string, joined
    // by newlines. Non-object params yield an empty string.
    static std::string extract_code(const nlohmann::json& params);

    // Capitalised identifiers used as types, minus names the code itself
    // declares. Deduplicated, in order of first appearance.
    static std::vector<std::string> extract_type_names(const std::string& code);

private:
    std::shared_ptr<VerifiedTypeStore> store_;
    TypeVerificationOptions options_;
    std::shared_ptr<Monitor> monitor_;

    std::unordered_set<std::string> edit_tools_;   // lower-cased
    std::unordered_set<std::string> whitelist_;    // lower-cased
};

} // namespace toolgov
