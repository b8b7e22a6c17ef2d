#pragma once

#include "contract_registry.hpp"

#include <string>
#include <vector>

struct RegistrySnapshot {
    std::uint64_t loopLimit = 0;
    std::size_t activeContracts = 0;
    std::size_t adminCount = 0;
    std::size_t managerCount = 0;
    std::uint64_t lastEventSequence = 0;
};

class RegistrySnapshotBuilder {
public:
    static RegistrySnapshot fromRegistry(const ContractRegistry& registry);
    static std::string toPrettyString(const RegistrySnapshot& snapshot);
    static std::vector<std::string> toLines(const RegistrySnapshot& snapshot);
};
