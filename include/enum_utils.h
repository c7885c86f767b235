#pragma once

#include <cctype>
#include <iostream>
#include <magic_enum/magic_enum.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Enum <-> string conversion for config files and reports, backed by magic_enum.
// Enumerators are PascalCase in code and snake_case in TOML ("DormandPrince" <-> "dormand_prince").

namespace enum_utils {

inline std::string toSnakeCase(std::string_view pascal) {
    std::string result;
    result.reserve(pascal.size() + 4);

    for (size_t i = 0; i < pascal.size(); ++i) {
        char c = pascal[i];
        bool const upper = std::isupper(static_cast<unsigned char>(c));
        // "Rk4" -> "rk4", "StepSizeUnderflow" -> "step_size_underflow"
        if (upper && i > 0) {
            result += '_';
        }
        result += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

inline std::string toPascalCase(std::string_view snake) {
    std::string result;
    result.reserve(snake.size());

    bool capitalize_next = true;
    for (char c : snake) {
        if (c == '_') {
            capitalize_next = true;
        } else if (capitalize_next) {
            result += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            capitalize_next = false;
        } else {
            result += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }
    return result;
}

template <typename E>
std::string toString(E value) {
    return toSnakeCase(magic_enum::enum_name(value));
}

// Accepts snake_case or any-case PascalCase
template <typename E>
std::optional<E> fromString(std::string_view str) {
    auto direct = magic_enum::enum_cast<E>(str, magic_enum::case_insensitive);
    if (direct.has_value()) {
        return direct;
    }
    return magic_enum::enum_cast<E>(toPascalCase(str));
}

template <typename E>
std::vector<std::string> names() {
    std::vector<std::string> result;
    result.reserve(magic_enum::enum_count<E>());
    for (auto value : magic_enum::enum_values<E>()) {
        result.push_back(toString(value));
    }
    return result;
}

// Parse with a warning and fallback, for lenient config loading
template <typename E>
E parseOr(std::string_view str, E fallback, std::string_view what) {
    if (auto parsed = fromString<E>(str)) {
        return *parsed;
    }
    std::cerr << "Unknown " << what << ": " << str << ", using " << toString(fallback) << "\n";
    return fallback;
}

} // namespace enum_utils
