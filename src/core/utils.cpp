#include "scriptbox/core/utils.hpp"

#include <random>

#include <uuid.h>

namespace scriptbox::utils {

auto generate_id(std::size_t length) -> std::string {
    static constexpr std::string_view chars =
        "abcdefghijklmnopqrstuvwxyz0123456789";
    static thread_local std::mt19937 rng(std::random_device{}());
    std::uniform_int_distribution<size_t> dist(0, chars.size() - 1);

    std::string result;
    result.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        result += chars[dist(rng)];
    }
    return result;
}

auto generate_uuid() -> std::string {
    static thread_local std::mt19937 rng(std::random_device{}());
    auto gen = uuids::uuid_random_generator(rng);
    return uuids::to_string(gen());
}

auto trim(std::string_view s) -> std::string {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) return "";
    auto end = s.find_last_not_of(" \t\n\r");
    return std::string(s.substr(start, end - start + 1));
}

auto trim_right(std::string_view s) -> std::string_view {
    auto end = s.find_last_not_of(" \t\n\r\f\v");
    if (end == std::string_view::npos) return {};
    return s.substr(0, end + 1);
}

auto split(std::string_view s, char delim) -> std::vector<std::string> {
    std::vector<std::string> parts;
    size_t pos = 0;
    while (pos < s.size()) {
        auto next = s.find(delim, pos);
        if (next == std::string_view::npos) {
            parts.emplace_back(s.substr(pos));
            break;
        }
        parts.emplace_back(s.substr(pos, next - pos));
        pos = next + 1;
    }
    return parts;
}

} // namespace scriptbox::utils
