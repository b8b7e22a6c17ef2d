#include "utils/number_parse.hpp"

#include <limits>
#include <stdexcept>

std::optional<std::uint64_t> parseUnsigned(std::string_view raw) {
    if (raw.empty()) {
        return std::nullopt;
    }

    constexpr std::uint64_t kMax = std::numeric_limits<std::uint64_t>::max();
    std::uint64_t value = 0;
    for (const char c : raw) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        const auto digit = static_cast<std::uint64_t>(c - '0');
        if (value > (kMax - digit) / 10) {
            return std::nullopt;
        }
        value = value * 10 + digit;
    }
    return value;
}

std::uint64_t requireUnsigned(const std::string& raw, const std::string& field) {
    const auto value = parseUnsigned(raw);
    if (!value) {
        throw std::invalid_argument("Valeur invalide pour " + field + ": " + raw);
    }
    return *value;
}
