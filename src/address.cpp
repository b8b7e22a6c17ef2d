#include "address.hpp"

#include <cctype>
#include <functional>
#include <iomanip>
#include <sstream>

namespace address {
namespace {
bool hasHexPrefix(const std::string& value) {
    return value.size() >= 2 && value[0] == '0' && (value[1] == 'x' || value[1] == 'X');
}

std::string toHex(std::size_t value) {
    std::ostringstream out;
    out << std::hex << std::setw(16) << std::setfill('0') << value;
    return out.str();
}
} // namespace

bool isWellFormed(const std::string& value) {
    if (value.size() != kHexDigits + 2 || !hasHexPrefix(value)) {
        return false;
    }

    for (std::size_t i = 2; i < value.size(); ++i) {
        if (!std::isxdigit(static_cast<unsigned char>(value[i]))) {
            return false;
        }
    }
    return true;
}

bool isZero(const std::string& value) {
    if (value.empty()) {
        return true;
    }

    return normalize(value) == kZeroAddress;
}

std::string normalize(const std::string& value) {
    if (!isWellFormed(value)) {
        return value;
    }

    std::string out = value;
    for (auto& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

std::string deriveContractAddress(const std::string& deployer, std::uint64_t nonce) {
    const std::hash<std::string> hasher;
    const std::string seed = normalize(deployer) + '|' + std::to_string(nonce);
    std::string digits = toHex(hasher(seed)) + toHex(hasher(seed + "a")) + toHex(hasher(seed + "b"));
    digits.resize(kHexDigits);

    std::string out = "0x" + digits;
    if (isZero(out)) {
        out.back() = '1';
    }
    return out;
}
} // namespace address
