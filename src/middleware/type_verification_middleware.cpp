#include "toolgov/middleware/type_verification_middleware.hpp"

#include "toolgov/error_record.hpp"
#include "toolgov/exceptions.hpp"

#include <algorithm>
#include <cctype>
#include <mutex>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace toolgov {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Primitive, framework and TypeScript names an edit may use freely
const char* const kBuiltinTypes[] = {
    // C# keywords and BCL
    "string", "int", "bool", "double", "float", "decimal", "long", "short", "byte",
    "char", "object", "void", "var", "dynamic", "uint", "ulong", "ushort", "sbyte",
    "String", "Int32", "Int64", "Boolean", "Double", "DateTime", "DateTimeOffset",
    "TimeSpan", "Guid", "Exception", "ArgumentException", "ArgumentNullException",
    "InvalidOperationException", "NotImplementedException", "List", "Dictionary",
    "HashSet", "IEnumerable", "IList", "IDictionary", "ICollection", "Task",
    "ValueTask", "CancellationToken", "Func", "Action", "Console", "Math", "Nullable",
    "Type", "Attribute", "StringBuilder",
    // TypeScript and JavaScript
    "number", "boolean", "undefined", "null", "any", "unknown", "never",
    "Array", "Date", "RegExp", "Error", "Promise", "Map", "Set", "JSON", "Object",
    "Number", "Symbol", "Partial", "Record", "Pick", "Omit", "Readonly", "Required",
};

const std::vector<std::regex>& reference_patterns() {
    static const std::vector<std::regex> patterns = [] {
        const char* sources[] = {
            R"(\bnew\s+([A-Z]\w*))",                 // construction
            R"(\b([A-Z]\w*)\??\s+\w+\s*[=;])",       // declaration, nullable or not
            R"(:\s*([A-Z]\w*))",                     // annotation or base list
            R"(<\s*([A-Z]\w*)\s*[>,])",              // first generic argument
            R"(,\s*([A-Z]\w*)\s*>)",                 // last generic argument
            R"(\b([A-Z]\w*)\.\w+)",                  // static member access
            R"(\btypeof\s*\(\s*([A-Z]\w*)\s*\))",
            R"(\b(?:is|as)\s+([A-Z]\w*))",
            R"(\(\s*([A-Z]\w*)\s+\w+\s*[,)])",       // first parameter
            R"(,\s*([A-Z]\w*)\s+\w+\s*[,)])",        // later parameters
        };
        std::vector<std::regex> compiled;
        for (const char* source : sources) {
            compiled.emplace_back(source, std::regex::ECMAScript | std::regex::optimize);
        }
        return compiled;
    }();
    return patterns;
}

const std::regex& declaration_pattern() {
    static const std::regex pattern(
        R"(\b(?:class|struct|interface|enum|record|type)\s+([A-Z]\w*))",
        std::regex::ECMAScript | std::regex::optimize);
    return pattern;
}

void collect(const std::string& line, const std::regex& pattern,
             std::vector<std::string>& out) {
    for (std::sregex_iterator it(line.begin(), line.end(), pattern), end; it != end; ++it) {
        out.push_back((*it)[1].str());
    }
}

void append_string(const nlohmann::json& params, const char* key,
                   std::vector<std::string>& parts) {
    auto it = params.find(key);
    if (it != params.end() && it->is_string()) {
        parts.push_back(it->get<std::string>());
    }
}

} // anonymous namespace

// ========== VerifiedTypeStore ==========

void VerifiedTypeStore::mark_verified(const std::string& type_name) {
    std::unique_lock lock(mutex_);
    verified_.insert(type_name);
}

void VerifiedTypeStore::forget(const std::string& type_name) {
    std::unique_lock lock(mutex_);
    verified_.erase(type_name);
}

bool VerifiedTypeStore::is_verified(const std::string& type_name) const {
    std::shared_lock lock(mutex_);
    return verified_.count(type_name) != 0;
}

void VerifiedTypeStore::clear() {
    std::unique_lock lock(mutex_);
    verified_.clear();
}

std::size_t VerifiedTypeStore::size() const {
    std::shared_lock lock(mutex_);
    return verified_.size();
}

// ========== TypeVerificationMiddleware ==========

TypeVerificationMiddleware::TypeVerificationMiddleware(std::shared_ptr<VerifiedTypeStore> store,
                                                       TypeVerificationOptions options,
                                                       std::shared_ptr<Monitor> monitor,
                                                       MiddlewareOrder order)
    : SimpleMiddleware(order)
    , store_(std::move(store))
    , options_(std::move(options))
    , monitor_(std::move(monitor)) {
    if (!store_) {
        throw std::invalid_argument("TypeVerificationMiddleware: null type store");
    }
    for (const auto& tool : options_.edit_tools) {
        edit_tools_.insert(lower(tool));
    }
    for (const char* name : kBuiltinTypes) {
        whitelist_.insert(lower(name));
    }
    for (const auto& name : options_.whitelisted_types) {
        whitelist_.insert(lower(name));
    }
}

void TypeVerificationMiddleware::before_execution(const std::string& tool_name,
                                                  const nlohmann::json& params) {
    if (!is_edit_tool(tool_name)) return;

    const std::string code = extract_code(params);
    if (code.empty()) return;

    const auto missing = unverified_types(code);
    if (missing.empty()) return;

    std::ostringstream message;
    message << "Unverified types detected: ";
    for (std::size_t i = 0; i < missing.size(); ++i) {
        if (i > 0) message << ", ";
        message << missing[i];
    }
    message << ". Confirm each type exists before editing.";

    if (options_.mode == TypeVerificationMode::Strict) {
        throw ToolError(error_codes::TypeVerification, message.str());
    }

    auto event = make_event(EventType::MiddlewareActivity, LogLevel::Warning,
                            message.str(), tool_name);
    event.error_code = error_codes::TypeVerification;
    notify(monitor_.get(), event);
}

bool TypeVerificationMiddleware::is_edit_tool(const std::string& tool_name) const {
    return edit_tools_.count(lower(tool_name)) != 0;
}

bool TypeVerificationMiddleware::is_whitelisted(const std::string& type_name) const {
    return whitelist_.count(lower(type_name)) != 0;
}

std::vector<std::string> TypeVerificationMiddleware::unverified_types(
    const std::string& code) const {
    std::vector<std::string> missing;
    for (const auto& name : extract_type_names(code)) {
        if (!is_whitelisted(name) && !store_->is_verified(name)) {
            missing.push_back(name);
        }
    }
    return missing;
}

std::string TypeVerificationMiddleware::extract_code(const nlohmann::json& params) {
    if (!params.is_object()) return {};

    std::vector<std::string> parts;
    append_string(params, "new_string", parts);
    append_string(params, "content", parts);
    append_string(params, "new_source", parts);

    auto edits = params.find("edits");
    if (edits != params.end() && edits->is_array()) {
        for (const auto& edit : *edits) {
            if (edit.is_object()) append_string(edit, "new_string", parts);
        }
    }

    std::string code;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) code += '\n';
        code += parts[i];
    }
    return code;
}

std::vector<std::string> TypeVerificationMiddleware::extract_type_names(
    const std::string& code) {
    std::vector<std::string> referenced;
    std::vector<std::string> declared;

    std::istringstream lines(code);
    std::string line;
    while (std::getline(lines, line)) {
        if (line.size() > kMaxScannedLineLength) continue;
        for (const auto& pattern : reference_patterns()) {
            collect(line, pattern, referenced);
        }
        collect(line, declaration_pattern(), declared);
    }

    std::vector<std::string> names;
    std::unordered_set<std::string> seen(declared.begin(), declared.end());
    for (auto& name : referenced) {
        if (seen.insert(name).second) {
            names.push_back(std::move(name));
        }
    }
    return names;
}

} // namespace toolgov
