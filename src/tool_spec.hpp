#pragma once
#include "protocol.hpp"
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace todochat {

enum class ParamType { string, integer, boolean, datetime };

struct ParamSpec {
    std::string name;
    ParamType type = ParamType::string;
    bool required = false;
    std::string description;
    std::vector<std::string> allowed;   // enum values, strings only
    std::string default_value;          // applied when absent, strings only
};

struct ToolSpec {
    std::string name;
    std::string description;
    std::vector<ParamSpec> params;

    const ParamSpec* param(const std::string& pname) const;

    // JSON schema of the arguments object
    nlohmann::json parameters_schema() const;

    // {"name", "description", "parameters"}; the capabilities frame lists these
    nlohmann::json to_json() const;
};

// The fixed tool surface, in a stable order
const std::vector<ToolSpec>& tool_specs();

const ToolSpec* find_tool_spec(const std::string& name);

// Function-calling declarations handed to the model
nlohmann::json tools_spec_for_model();

// Checks a call against the table. On success returns nullopt and fills
// *normalized with coerced arguments (defaults applied, dates normalized).
std::optional<ToolError> validate_tool_call(const std::string& name,
                                            const nlohmann::json& arguments,
                                            nlohmann::json* normalized);

// YYYY-MM-DD[(T| )HH:MM[:SS[.fff]]][Z] -> YYYY-MM-DDTHH:MM:SS.
// A date without time gets 10:00:00.
std::optional<std::string> normalize_due_date(const std::string& text);

} // namespace todochat
