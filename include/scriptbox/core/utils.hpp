#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace scriptbox::utils {

auto generate_id(std::size_t length = 16) -> std::string;
auto generate_uuid() -> std::string;
auto trim(std::string_view s) -> std::string;
auto trim_right(std::string_view s) -> std::string_view;
auto split(std::string_view s, char delim) -> std::vector<std::string>;

} // namespace scriptbox::utils
