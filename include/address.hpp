#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace address {
inline constexpr std::size_t kHexDigits = 40;
inline constexpr const char* kZeroAddress = "0x0000000000000000000000000000000000000000";

[[nodiscard]] bool isWellFormed(const std::string& value);
[[nodiscard]] bool isZero(const std::string& value);
[[nodiscard]] std::string normalize(const std::string& value);

// Same deployer and nonce always yield the same address.
[[nodiscard]] std::string deriveContractAddress(const std::string& deployer, std::uint64_t nonce);
} // namespace address
