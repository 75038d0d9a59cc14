#pragma once

#include <string>
#include <string_view>
#include <variant>

#include "scriptbox/core/types.hpp"

namespace scriptbox::exec {

enum class DecodeFailureKind {
    /// The sentinel never appeared: the script crashed or never reached
    /// its entry function.
    LaunchOrRuntimeError,
    /// The line after the sentinel is not valid JSON.
    SerializationError,
    /// The value is not a JSON object, or is the epilogue's error object.
    ResultTypeOrSerializationError,
};

auto to_string(DecodeFailureKind kind) -> std::string_view;

struct DecodeSuccess {
    std::string stdout_text;
    json value;
};

struct DecodeFailure {
    DecodeFailureKind kind = DecodeFailureKind::LaunchOrRuntimeError;
    std::string stdout_text;
    std::string detail;
    /// True when the epilogue itself reported that encoding failed.
    bool guest_reported = false;
};

using DecodedResult = std::variant<DecodeSuccess, DecodeFailure>;

/// Recovers the entry function's output and return value from the raw
/// stdout of a wrapped script. Everything before the first whole-line
/// sentinel is user output, returned verbatim; the rest must be exactly
/// one JSON object.
auto decode(std::string_view stdout_bytes) -> DecodedResult;

} // namespace scriptbox::exec
