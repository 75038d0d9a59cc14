#include "scriptbox/exec/decoder.hpp"

#include "scriptbox/core/utils.hpp"
#include "scriptbox/exec/wrapper.hpp"

namespace scriptbox::exec {

namespace {

/// Offset of the first sentinel that occupies a whole line, or npos.
auto find_sentinel_line(std::string_view text) -> std::size_t {
    std::size_t pos = 0;
    while ((pos = text.find(kSentinel, pos)) != std::string_view::npos) {
        bool line_start = pos == 0 || text[pos - 1] == '\n';
        auto after = pos + kSentinel.size();
        bool line_end = after == text.size() || text[after] == '\n' ||
                        (text[after] == '\r' && after + 1 < text.size() &&
                         text[after + 1] == '\n');
        if (line_start && line_end) return pos;
        pos += 1;
    }
    return std::string_view::npos;
}

} // anonymous namespace

auto to_string(DecodeFailureKind kind) -> std::string_view {
    switch (kind) {
        case DecodeFailureKind::LaunchOrRuntimeError: return "launch_or_runtime_error";
        case DecodeFailureKind::SerializationError: return "serialization_error";
        case DecodeFailureKind::ResultTypeOrSerializationError:
            return "result_type_or_serialization_error";
    }
    return "unknown";
}

auto decode(std::string_view stdout_bytes) -> DecodedResult {
    auto pos = find_sentinel_line(stdout_bytes);
    if (pos == std::string_view::npos) {
        return DecodeFailure{DecodeFailureKind::LaunchOrRuntimeError,
                             std::string(stdout_bytes),
                             "result sentinel not found in output"};
    }

    std::string user_output(stdout_bytes.substr(0, pos));

    auto rest = stdout_bytes.substr(pos + kSentinel.size());
    auto encoded = utils::trim_right(rest);
    if (!encoded.empty() && encoded.front() == '\r') encoded.remove_prefix(1);
    if (!encoded.empty() && encoded.front() == '\n') encoded.remove_prefix(1);

    auto value = json::parse(encoded, nullptr, /*allow_exceptions=*/false);
    if (value.is_discarded()) {
        return DecodeFailure{DecodeFailureKind::SerializationError,
                             std::move(user_output),
                             "result line is not valid JSON"};
    }

    if (!value.is_object()) {
        return DecodeFailure{DecodeFailureKind::ResultTypeOrSerializationError,
                             std::move(user_output),
                             std::string("result is a JSON ") + value.type_name() +
                                 ", expected an object"};
    }
    if (value.contains("error")) {
        const auto& error = value.at("error");
        auto detail = error.is_string() ? error.get<std::string>() : error.dump();
        return DecodeFailure{DecodeFailureKind::ResultTypeOrSerializationError,
                             std::move(user_output), std::move(detail), true};
    }

    return DecodeSuccess{std::move(user_output), std::move(value)};
}

} // namespace scriptbox::exec
