#pragma once

#include <chrono>

#include <nlohmann/json.hpp>

namespace scriptbox {

using json = nlohmann::json;
using Clock = std::chrono::steady_clock;

} // namespace scriptbox
