#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace host {

using CodeLookup = std::function<bool(const std::string&)>;

// Addresses known to hold deployed code.
class ContractCodeIndex {
public:
    [[nodiscard]] bool registerCode(const std::string& contractAddress);
    [[nodiscard]] bool hasCode(const std::string& contractAddress) const;

    // Derives a fresh address for the deployer, registers it and returns it.
    std::string deployNext(const std::string& deployer);

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::vector<std::string> listAddresses() const;

    // The returned lookup refers to this index and must not outlive it.
    [[nodiscard]] CodeLookup lookup() const;

private:
    std::unordered_set<std::string> addresses_;
    std::unordered_map<std::string, std::uint64_t> deployNonces_;
};

} // namespace host
