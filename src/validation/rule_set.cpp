#include "scriptbox/validation/rule_set.hpp"

#include "scriptbox/core/logger.hpp"

namespace scriptbox::validation {

auto default_allowed_modules() -> std::vector<std::string> {
    return {
        "os", "pandas", "numpy", "json", "sys", "math", "random",
        "datetime", "collections", "itertools", "functools", "time",
    };
}

auto default_dangerous_names() -> std::vector<std::string> {
    return {"system", "popen", "spawn", "fork", "kill", "exec", "eval"};
}

auto default_dangerous_patterns() -> std::vector<PatternRule> {
    return {
        // Dynamic evaluation and import
        {R"(__import__\s*\()", "dynamic import call"},
        {R"(eval\s*\()", "eval call"},
        {R"(exec\s*\()", "exec call"},
        // Process spawning
        {R"(os\.system\s*\()", "os.system call"},
        {R"(subprocess\s*\.)", "subprocess access"},
        // Raw file access
        {R"(open\s*\()", "file open call"},
        {R"(file\s*\()", "file constructor call"},
        // Reflective introspection
        {R"(\.__dict__)", "__dict__ access"},
        {R"(\.__class__)", "__class__ access"},
        {R"(\.__bases__)", "__bases__ access"},
        {R"(\.__subclasses__)", "__subclasses__ access"},
        {R"(\.__globals__)", "__globals__ access"},
        {R"(\.__builtins__)", "__builtins__ access"},
        // Socket-level networking
        {R"(\.connect\s*\()", "socket connect"},
        {R"(\.bind\s*\()", "socket bind"},
        {R"(\.listen\s*\()", "socket listen"},
        {R"(\.accept\s*\()", "socket accept"},
        {R"(\.send\s*\()", "socket send"},
        {R"(\.recv\s*\()", "socket recv"},
        {R"(\.sendto\s*\()", "socket sendto"},
        {R"(\.recvfrom\s*\()", "socket recvfrom"},
        {R"(\.getaddrinfo\s*\()", "address resolution (getaddrinfo)"},
        {R"(\.gethostbyname\s*\()", "address resolution (gethostbyname)"},
        {R"(\.gethostbyaddr\s*\()", "address resolution (gethostbyaddr)"},
        {R"(\.getservbyname\s*\()", "service lookup (getservbyname)"},
        {R"(\.getservbyport\s*\()", "service lookup (getservbyport)"},
        {R"(\.socket\s*\()", "socket construction"},
    };
}

auto compile_pattern(const PatternRule& rule) -> Result<CompiledPattern> {
    try {
        return CompiledPattern{
            rule.description.empty() ? rule.pattern : rule.description,
            rule.pattern,
            boost::regex(rule.pattern, kPatternSyntax),
        };
    } catch (const boost::regex_error& e) {
        return std::unexpected(make_error(
            ErrorCode::InvalidConfig,
            "Invalid dangerous pattern '" + rule.pattern + "'", e.what()));
    }
}

RuleSet::RuleSet(std::unordered_set<std::string> allowed_modules,
                 std::unordered_set<std::string> dangerous_names,
                 std::vector<CompiledPattern> dangerous_patterns)
    : allowed_modules_(std::move(allowed_modules))
    , dangerous_names_(std::move(dangerous_names))
    , dangerous_patterns_(std::move(dangerous_patterns)) {}

auto RuleSet::defaults() -> RuleSet {
    // The built-in patterns are known to compile.
    auto rules = from_config(RulesConfig{});
    return std::move(*rules);
}

auto RuleSet::from_config(const RulesConfig& config) -> Result<RuleSet> {
    auto modules = config.allowed_modules.value_or(default_allowed_modules());
    auto names = config.dangerous_names.value_or(default_dangerous_names());
    auto pattern_rules = config.dangerous_patterns.value_or(default_dangerous_patterns());

    std::vector<CompiledPattern> patterns;
    patterns.reserve(pattern_rules.size());
    for (const auto& rule : pattern_rules) {
        auto compiled = compile_pattern(rule);
        if (!compiled) {
            return std::unexpected(compiled.error());
        }
        patterns.push_back(std::move(*compiled));
    }

    LOG_DEBUG("Rule set: {} allowed modules, {} dangerous names, {} patterns",
              modules.size(), names.size(), patterns.size());

    return RuleSet(
        std::unordered_set<std::string>(modules.begin(), modules.end()),
        std::unordered_set<std::string>(names.begin(), names.end()),
        std::move(patterns));
}

auto RuleSet::is_allowed_module(std::string_view module) const -> bool {
    return allowed_modules_.contains(std::string(module));
}

auto RuleSet::is_dangerous_name(std::string_view name) const -> bool {
    return dangerous_names_.contains(std::string(name));
}

} // namespace scriptbox::validation
