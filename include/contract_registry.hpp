#pragma once

#include "access/role_table.hpp"
#include "events/event_log.hpp"
#include "host/code_index.hpp"
#include "registry_errors.hpp"
#include "registry_params.hpp"
#include "utils/logger.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

struct ContractEntry {
    std::string description;
    bool exists = false;

    bool operator==(const ContractEntry& other) const {
        return exists == other.exists && description == other.description;
    }
    bool operator!=(const ContractEntry& other) const {
        return !(*this == other);
    }
};

// Everything needed to rebuild a registry, active entries only.
struct RegistryState {
    std::uint64_t loopLimit = 0;
    std::vector<std::pair<std::string, ContractEntry>> entries;
    std::vector<std::string> admins;
    std::vector<std::string> managers;
};

class ContractRegistry {
    class RestoreTag {
        friend class ContractRegistry;
        explicit RestoreTag() = default;
    };

public:
    static constexpr std::uint64_t kDefaultLoopLimit = registry_params::kDefaultLoopLimit;

    // The deployer receives both roles, then the initial set goes through the batch-add path.
    ContractRegistry(const std::string& deployer,
                     host::CodeLookup codeLookup,
                     const std::vector<std::string>& initialAddresses,
                     const std::vector<std::string>& initialDescriptions,
                     std::uint64_t loopLimit = kDefaultLoopLimit,
                     Logger* logger = nullptr,
                     std::size_t eventLogCapacity = registry_params::kEventLogCapacity);

    // Empty registry without roles; only reachable through restore().
    ContractRegistry(RestoreTag, host::CodeLookup codeLookup, Logger* logger, std::size_t eventLogCapacity);

    ContractRegistry(const ContractRegistry&) = delete;
    ContractRegistry& operator=(const ContractRegistry&) = delete;

    // No authorization check and no events: the state was validated when it was written.
    static std::unique_ptr<ContractRegistry> restore(const RegistryState& state,
                                                     host::CodeLookup codeLookup,
                                                     Logger* logger = nullptr);

    void addContract(const std::string& caller, const std::string& contractAddress, const std::string& description);
    void addContractsInBatch(const std::string& caller,
                             const std::vector<std::string>& contractAddresses,
                             const std::vector<std::string>& descriptions);

    void updateContractDescription(const std::string& caller,
                                   const std::string& contractAddress,
                                   const std::string& newDescription);
    void updateContractsDescriptionsInBatch(const std::string& caller,
                                            const std::vector<std::string>& contractAddresses,
                                            const std::vector<std::string>& newDescriptions);

    void removeContract(const std::string& caller, const std::string& contractAddress);
    void removeContractsInBatch(const std::string& caller, const std::vector<std::string>& contractAddresses);

    void setLoopLimit(const std::string& caller, std::uint64_t newLimit);
    void grantManagerRole(const std::string& caller, const std::string& account);

    [[nodiscard]] ContractEntry contractDetails(const std::string& contractAddress) const;
    [[nodiscard]] std::uint64_t loopLimit() const;
    [[nodiscard]] bool hasRole(access::Role role, const std::string& account) const;
    [[nodiscard]] std::size_t activeContractCount() const;

    [[nodiscard]] RegistryState exportState() const;
    // Listeners run after the registry lock is released and may read the registry.
    [[nodiscard]] const events::EventLog& events() const;
    [[nodiscard]] events::EventLog& events();

private:
    // Writes of one call, applied to entries_ only once every item passed.
    struct StagedWrites {
        std::unordered_map<std::string, ContractEntry> overlay;
        std::vector<events::RegistryEvent> events;
    };

    using Stager = std::function<void(StagedWrites&)>;

    // Checks the role, stages the call and commits under the lock, then notifies listeners.
    void execute(const char* operation, access::Role role, const std::string& caller, const Stager& stage);

    [[nodiscard]] ContractEntry stagedEntry(const StagedWrites& staged, const std::string& key) const;
    void stageAdd(StagedWrites& staged, const std::string& contractAddress, const std::string& description) const;
    void stageUpdate(StagedWrites& staged,
                     const std::string& contractAddress,
                     const std::string& newDescription) const;
    void stageRemove(StagedWrites& staged, const std::string& contractAddress) const;
    void stageAddBatch(StagedWrites& staged,
                       const std::vector<std::string>& contractAddresses,
                       const std::vector<std::string>& descriptions) const;
    [[nodiscard]] std::vector<events::RegistryEvent> commit(StagedWrites staged);

    void requireRole(access::Role role, const std::string& caller) const;
    void requireMatchingLengths(std::size_t addressCount, std::size_t descriptionCount) const;
    void requireWithinLoopLimit(std::size_t count) const;

    void logInfo(const std::string& message) const;
    void logRejection(const char* operation, const RegistryError& error) const;

    host::CodeLookup codeLookup_;
    Logger* logger_ = nullptr;
    std::unordered_map<std::string, ContractEntry> entries_;
    std::uint64_t loopLimit_ = 0;
    access::RoleTable roles_;
    events::EventLog events_;
    mutable std::mutex mutex_;
};
