#pragma once

#include "contract_registry.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// One deployed registry together with the simulated host it lives in.
struct DeploymentRecord {
    std::string instanceAddress;
    std::string deployer;
    std::string network;
    std::vector<std::string> codeAddresses;
    RegistryState registry;
};

class RegistryStoreCodec {
public:
    static std::string encodeEntry(const std::string& contractAddress, const ContractEntry& entry);
    static std::optional<std::pair<std::string, ContractEntry>> decodeEntry(const std::string& payload);

    static std::string encodeState(const RegistryState& state);
    static std::optional<RegistryState> decodeState(const std::string& payload);

    static std::string encodeRecord(const DeploymentRecord& record);
    static std::optional<DeploymentRecord> decodeRecord(const std::string& payload);
};

class RegistryStore {
public:
    static void save(const std::string& path, const DeploymentRecord& record);
    static DeploymentRecord load(const std::string& path);
    [[nodiscard]] static bool exists(const std::string& path);
};
