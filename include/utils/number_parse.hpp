#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// Decimal digits only: no sign, no whitespace, no overflow.
[[nodiscard]] std::optional<std::uint64_t> parseUnsigned(std::string_view raw);

// Same rules; throws std::invalid_argument naming the field.
[[nodiscard]] std::uint64_t requireUnsigned(const std::string& raw, const std::string& field);
