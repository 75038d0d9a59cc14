#pragma once

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "scriptbox/validation/rule_set.hpp"

namespace scriptbox::validation {

/// An import statement naming a module (or a symbol of a module) that the
/// rule set forbids.
struct DisallowedImport {
    std::string module;
    std::optional<std::string> symbol;
};

/// A dangerous-operation pattern matched somewhere in the source.
struct DisallowedPattern {
    std::string description;
};

/// Reported when the matcher hits its complexity bound on the source.
inline constexpr const char* kUninspectable = "source too complex to inspect";

using Violation = std::variant<DisallowedImport, DisallowedPattern>;

/// Human-readable one-liner for logs.
auto describe(const Violation& violation) -> std::string;

/// Returns true when the source defines the `main` entry function.
auto has_entry_point(std::string_view source) -> bool;

/// Lexical safety filter over untrusted source.
///
/// All import statements are checked first, then the whole text is matched
/// against the dangerous patterns in rule-set order; the first violation
/// found is returned. This is a fast-reject heuristic, not an isolation
/// boundary: names assembled at runtime, comma-separated import lists
/// beyond the first module and parenthesised from-imports are not seen.
auto validate(const RuleSet& rules, std::string_view source)
    -> std::expected<void, Violation>;

} // namespace scriptbox::validation
