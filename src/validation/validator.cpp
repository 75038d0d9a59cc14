#include "scriptbox/validation/validator.hpp"

#include "scriptbox/core/logger.hpp"

#include <array>
#include <stdexcept>

#include <boost/regex.hpp>

namespace scriptbox::validation {

namespace {

/// One lexical import shape. `symbol_group` is 0 for shapes that do not
/// capture an imported symbol.
struct ImportShape {
    boost::regex regex;
    int symbol_group;
};

auto import_shapes() -> const std::array<ImportShape, 4>& {
    static const std::array<ImportShape, 4> shapes = {{
        // import module
        {boost::regex(R"((?:^|\n)[^\S\n]*import\s+(\w+))", kPatternSyntax), 0},
        // from module[.sub] import name
        {boost::regex(R"((?:^|\n)[^\S\n]*from\s+(\w+)(?:\.\w+)*\s+import\s+(\w+))", kPatternSyntax), 2},
        // import module as alias
        {boost::regex(R"((?:^|\n)[^\S\n]*import\s+(\w+)\s+as\s+\w+)", kPatternSyntax), 0},
        // from module[.sub] import name as alias
        {boost::regex(R"((?:^|\n)[^\S\n]*from\s+(\w+)(?:\.\w+)*\s+import\s+\w+\s+as\s+\w+)", kPatternSyntax), 0},
    }};
    return shapes;
}

auto check_imports(const RuleSet& rules, const std::string& source)
    -> std::optional<Violation> {
    const auto& shapes = import_shapes();

    for (const auto& shape : shapes) {
        for (boost::sregex_iterator it(source.begin(), source.end(), shape.regex), end;
             it != end; ++it) {
            auto module = (*it)[1].str();
            if (!rules.is_allowed_module(module) || rules.is_dangerous_name(module)) {
                return DisallowedImport{std::move(module), std::nullopt};
            }
        }
    }

    // A dangerous symbol pulled directly out of an otherwise allowed module.
    for (const auto& shape : shapes) {
        if (shape.symbol_group == 0) continue;
        for (boost::sregex_iterator it(source.begin(), source.end(), shape.regex), end;
             it != end; ++it) {
            auto symbol = (*it)[shape.symbol_group].str();
            if (rules.is_dangerous_name(symbol)) {
                return DisallowedImport{(*it)[1].str(), std::move(symbol)};
            }
        }
    }

    return std::nullopt;
}

auto check_patterns(const RuleSet& rules, const std::string& source)
    -> std::optional<Violation> {
    for (const auto& pattern : rules.dangerous_patterns()) {
        if (boost::regex_search(source, pattern.regex)) {
            return DisallowedPattern{pattern.description};
        }
    }
    return std::nullopt;
}

} // anonymous namespace

auto describe(const Violation& violation) -> std::string {
    if (const auto* imp = std::get_if<DisallowedImport>(&violation)) {
        if (imp->symbol) {
            return "disallowed import of '" + *imp->symbol + "' from '" + imp->module + "'";
        }
        return "disallowed import of module '" + imp->module + "'";
    }
    return "disallowed operation: " + std::get<DisallowedPattern>(violation).description;
}

auto has_entry_point(std::string_view source) -> bool {
    return source.find("def main") != std::string_view::npos;
}

auto validate(const RuleSet& rules, std::string_view source)
    -> std::expected<void, Violation> {
    const std::string text(source);

    try {
        if (auto violation = check_imports(rules, text)) {
            LOG_DEBUG("Validator: {}", describe(*violation));
            return std::unexpected(std::move(*violation));
        }
        if (auto violation = check_patterns(rules, text)) {
            LOG_DEBUG("Validator: {}", describe(*violation));
            return std::unexpected(std::move(*violation));
        }
    } catch (const std::runtime_error& e) {
        // Boost.Regex gives up on pathological input instead of recursing.
        LOG_WARN("Validator: source of {} bytes not inspectable: {}", text.size(), e.what());
        return std::unexpected(DisallowedPattern{kUninspectable});
    }
    return {};
}

} // namespace scriptbox::validation
