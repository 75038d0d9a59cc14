#pragma once

#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

#include <boost/regex.hpp>

#include "scriptbox/core/config.hpp"
#include "scriptbox/core/error.hpp"

namespace scriptbox::validation {

/// ECMAScript grammar with `^`, `$` and `.` kept to their single-line meaning.
/// Boost.Regex matches iteratively, so long runs in untrusted source cannot
/// exhaust the stack.
inline constexpr boost::regex::flag_type kPatternSyntax =
    boost::regex::ECMAScript | boost::regex::no_mod_m | boost::regex::no_mod_s;

/// A dangerous-operation pattern together with the human-readable
/// description reported when it matches.
struct CompiledPattern {
    std::string description;
    std::string source;
    boost::regex regex;
};

/// Immutable validator configuration. Built once at startup and shared
/// read-only between concurrent requests; no member is mutated after
/// construction.
class RuleSet {
public:
    RuleSet(std::unordered_set<std::string> allowed_modules,
            std::unordered_set<std::string> dangerous_names,
            std::vector<CompiledPattern> dangerous_patterns);

    /// The built-in rule tables.
    [[nodiscard]] static auto defaults() -> RuleSet;

    /// Defaults with every list present in `config` substituted.
    /// Fails with InvalidConfig when a pattern does not compile.
    [[nodiscard]] static auto from_config(const RulesConfig& config) -> Result<RuleSet>;

    [[nodiscard]] auto is_allowed_module(std::string_view module) const -> bool;
    [[nodiscard]] auto is_dangerous_name(std::string_view name) const -> bool;

    [[nodiscard]] auto allowed_modules() const noexcept
        -> const std::unordered_set<std::string>& { return allowed_modules_; }
    [[nodiscard]] auto dangerous_names() const noexcept
        -> const std::unordered_set<std::string>& { return dangerous_names_; }
    [[nodiscard]] auto dangerous_patterns() const noexcept
        -> const std::vector<CompiledPattern>& { return dangerous_patterns_; }

private:
    std::unordered_set<std::string> allowed_modules_;
    std::unordered_set<std::string> dangerous_names_;
    std::vector<CompiledPattern> dangerous_patterns_;
};

using RuleSetPtr = std::shared_ptr<const RuleSet>;

/// Built-in tables, exposed for the `config` command and for tests.
auto default_allowed_modules() -> std::vector<std::string>;
auto default_dangerous_names() -> std::vector<std::string>;
auto default_dangerous_patterns() -> std::vector<PatternRule>;

/// Compiles one pattern rule (ECMAScript grammar).
auto compile_pattern(const PatternRule& rule) -> Result<CompiledPattern>;

} // namespace scriptbox::validation
