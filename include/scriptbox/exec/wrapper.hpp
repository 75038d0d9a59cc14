#pragma once

#include <string>
#include <string_view>

namespace scriptbox::exec {

/// Line printed by the epilogue between the entry function's own output
/// and the encoded return value.
inline constexpr std::string_view kSentinel = "--------------------------------";

/// Appends the execution epilogue to validated source. When the payload
/// runs as the program entry point the epilogue calls `main()` once, prints
/// the sentinel line, then exactly one line holding either the JSON
/// encoding of the return value or `{"error": "..."}` if encoding failed.
auto wrap_script(std::string_view source) -> std::string;

} // namespace scriptbox::exec
