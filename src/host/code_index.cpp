#include "host/code_index.hpp"

#include "address.hpp"

#include <algorithm>

namespace host {

bool ContractCodeIndex::registerCode(const std::string& contractAddress) {
    if (!address::isWellFormed(contractAddress) || address::isZero(contractAddress)) {
        return false;
    }

    return addresses_.insert(address::normalize(contractAddress)).second;
}

bool ContractCodeIndex::hasCode(const std::string& contractAddress) const {
    return addresses_.find(address::normalize(contractAddress)) != addresses_.end();
}

std::string ContractCodeIndex::deployNext(const std::string& deployer) {
    auto& nonce = deployNonces_[address::normalize(deployer)];
    std::string deployed = address::deriveContractAddress(deployer, nonce++);
    while (!registerCode(deployed)) {
        deployed = address::deriveContractAddress(deployer, nonce++);
    }
    return deployed;
}

std::size_t ContractCodeIndex::size() const {
    return addresses_.size();
}

std::vector<std::string> ContractCodeIndex::listAddresses() const {
    std::vector<std::string> values(addresses_.begin(), addresses_.end());
    std::sort(values.begin(), values.end());
    return values;
}

CodeLookup ContractCodeIndex::lookup() const {
    return [this](const std::string& contractAddress) { return hasCode(contractAddress); };
}

} // namespace host
