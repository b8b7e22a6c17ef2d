#include "contract_registry.hpp"

#include "address.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace {
std::string describe(const events::RegistryEvent& event) {
    std::ostringstream out;
    out << events::toString(event.kind);
    switch (event.kind) {
    case events::EventKind::ContractAdded:
    case events::EventKind::ContractDescriptionUpdated:
    case events::EventKind::ContractRemoved:
        out << ' ' << event.contractAddress;
        break;
    case events::EventKind::LoopLimitUpdated:
        out << ' ' << event.oldLimit << " -> " << event.newLimit;
        break;
    case events::EventKind::RoleGranted:
        out << ' ' << access::toString(event.role) << " to " << event.account;
        break;
    }
    return out.str();
}
} // namespace

ContractRegistry::ContractRegistry(const std::string& deployer,
                                   host::CodeLookup codeLookup,
                                   const std::vector<std::string>& initialAddresses,
                                   const std::vector<std::string>& initialDescriptions,
                                   std::uint64_t loopLimit,
                                   Logger* logger,
                                   std::size_t eventLogCapacity)
    : ContractRegistry(RestoreTag{}, std::move(codeLookup), logger, eventLogCapacity) {
    if (address::isZero(deployer)) {
        throw std::invalid_argument("Le deployeur ne peut pas etre l'adresse zero.");
    }

    const std::string sender = address::normalize(deployer);
    StagedWrites staged;
    if (roles_.grant(access::Role::Admin, sender)) {
        staged.events.push_back(events::RegistryEvent::roleGranted(access::Role::Admin, sender, sender));
    }
    if (roles_.grant(access::Role::Manager, sender)) {
        staged.events.push_back(events::RegistryEvent::roleGranted(access::Role::Manager, sender, sender));
    }

    loopLimit_ = loopLimit;
    staged.events.push_back(events::RegistryEvent::loopLimitUpdated(0, loopLimit));

    try {
        stageAddBatch(staged, initialAddresses, initialDescriptions);
    } catch (const RegistryError& error) {
        logRejection("constructor", error);
        throw;
    }
    events_.notify(commit(std::move(staged)));
}

ContractRegistry::ContractRegistry(RestoreTag, host::CodeLookup codeLookup, Logger* logger, std::size_t eventLogCapacity)
    : codeLookup_(std::move(codeLookup)), logger_(logger), events_(eventLogCapacity, logger) {
    if (!codeLookup_) {
        throw std::invalid_argument("Une fonction de recherche de code est requise.");
    }
}

std::unique_ptr<ContractRegistry> ContractRegistry::restore(const RegistryState& state,
                                                            host::CodeLookup codeLookup,
                                                            Logger* logger) {
    auto registry = std::make_unique<ContractRegistry>(
        RestoreTag{}, std::move(codeLookup), logger, registry_params::kEventLogCapacity);

    registry->loopLimit_ = state.loopLimit;
    for (const auto& item : state.entries) {
        if (!item.second.exists) {
            continue;
        }
        if (address::isZero(item.first)) {
            throw std::invalid_argument("Etat du registre invalide: entree a l'adresse zero.");
        }
        if (!registry->entries_.emplace(address::normalize(item.first), item.second).second) {
            throw std::invalid_argument("Etat du registre invalide: entree en double " + item.first + ".");
        }
    }
    for (const auto& account : state.admins) {
        if (!registry->roles_.grant(access::Role::Admin, account)) {
            throw std::invalid_argument("Etat du registre invalide: administrateur en double " + account + ".");
        }
    }
    for (const auto& account : state.managers) {
        if (!registry->roles_.grant(access::Role::Manager, account)) {
            throw std::invalid_argument("Etat du registre invalide: manager en double " + account + ".");
        }
    }

    registry->logInfo("restored " + std::to_string(registry->entries_.size()) + " contract(s), loop_limit=" +
                      std::to_string(registry->loopLimit_));
    return registry;
}

void ContractRegistry::addContract(const std::string& caller,
                                   const std::string& contractAddress,
                                   const std::string& description) {
    execute("addContract", access::Role::Manager, caller, [&](StagedWrites& staged) {
        stageAdd(staged, contractAddress, description);
    });
}

void ContractRegistry::addContractsInBatch(const std::string& caller,
                                           const std::vector<std::string>& contractAddresses,
                                           const std::vector<std::string>& descriptions) {
    execute("addContractsInBatch", access::Role::Manager, caller, [&](StagedWrites& staged) {
        stageAddBatch(staged, contractAddresses, descriptions);
    });
}

void ContractRegistry::updateContractDescription(const std::string& caller,
                                                 const std::string& contractAddress,
                                                 const std::string& newDescription) {
    execute("updateContractDescription", access::Role::Manager, caller, [&](StagedWrites& staged) {
        stageUpdate(staged, contractAddress, newDescription);
    });
}

void ContractRegistry::updateContractsDescriptionsInBatch(const std::string& caller,
                                                          const std::vector<std::string>& contractAddresses,
                                                          const std::vector<std::string>& newDescriptions) {
    execute("updateContractsDescriptionsInBatch", access::Role::Manager, caller, [&](StagedWrites& staged) {
        requireMatchingLengths(contractAddresses.size(), newDescriptions.size());
        requireWithinLoopLimit(contractAddresses.size());
        for (std::size_t i = 0; i < contractAddresses.size(); ++i) {
            stageUpdate(staged, contractAddresses[i], newDescriptions[i]);
        }
    });
}

void ContractRegistry::removeContract(const std::string& caller, const std::string& contractAddress) {
    execute("removeContract", access::Role::Manager, caller, [&](StagedWrites& staged) {
        stageRemove(staged, contractAddress);
    });
}

void ContractRegistry::removeContractsInBatch(const std::string& caller,
                                              const std::vector<std::string>& contractAddresses) {
    execute("removeContractsInBatch", access::Role::Manager, caller, [&](StagedWrites& staged) {
        requireWithinLoopLimit(contractAddresses.size());
        for (const auto& contractAddress : contractAddresses) {
            stageRemove(staged, contractAddress);
        }
    });
}

void ContractRegistry::setLoopLimit(const std::string& caller, std::uint64_t newLimit) {
    execute("setLoopLimit", access::Role::Admin, caller, [&](StagedWrites& staged) {
        staged.events.push_back(events::RegistryEvent::loopLimitUpdated(loopLimit_, newLimit));
        loopLimit_ = newLimit;
    });
}

void ContractRegistry::grantManagerRole(const std::string& caller, const std::string& account) {
    execute("grantManagerRole", access::Role::Admin, caller, [&](StagedWrites& staged) {
        if (roles_.grant(access::Role::Manager, account)) {
            staged.events.push_back(events::RegistryEvent::roleGranted(
                access::Role::Manager, address::normalize(account), address::normalize(caller)));
        }
    });
}

ContractEntry ContractRegistry::contractDetails(const std::string& contractAddress) const {
    std::lock_guard<std::mutex> guard(mutex_);
    const auto it = entries_.find(address::normalize(contractAddress));
    if (it == entries_.end()) {
        return ContractEntry{};
    }
    return it->second;
}

std::uint64_t ContractRegistry::loopLimit() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return loopLimit_;
}

bool ContractRegistry::hasRole(access::Role role, const std::string& account) const {
    std::lock_guard<std::mutex> guard(mutex_);
    return roles_.hasRole(role, account);
}

std::size_t ContractRegistry::activeContractCount() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return entries_.size();
}

RegistryState ContractRegistry::exportState() const {
    std::lock_guard<std::mutex> guard(mutex_);
    RegistryState state;
    state.loopLimit = loopLimit_;
    state.entries.assign(entries_.begin(), entries_.end());
    std::sort(state.entries.begin(), state.entries.end(),
              [](const auto& lhs, const auto& rhs) { return lhs.first < rhs.first; });
    state.admins = roles_.members(access::Role::Admin);
    state.managers = roles_.members(access::Role::Manager);
    return state;
}

const events::EventLog& ContractRegistry::events() const {
    return events_;
}

events::EventLog& ContractRegistry::events() {
    return events_;
}

void ContractRegistry::execute(const char* operation,
                               access::Role role,
                               const std::string& caller,
                               const Stager& stage) {
    std::vector<events::RegistryEvent> recorded;
    {
        std::lock_guard<std::mutex> guard(mutex_);
        try {
            requireRole(role, caller);
            StagedWrites staged;
            stage(staged);
            recorded = commit(std::move(staged));
        } catch (const RegistryError& error) {
            logRejection(operation, error);
            throw;
        }
    }
    events_.notify(recorded);
}

ContractEntry ContractRegistry::stagedEntry(const StagedWrites& staged, const std::string& key) const {
    const auto pending = staged.overlay.find(key);
    if (pending != staged.overlay.end()) {
        return pending->second;
    }

    const auto stored = entries_.find(key);
    if (stored != entries_.end()) {
        return stored->second;
    }
    return ContractEntry{};
}

void ContractRegistry::stageAdd(StagedWrites& staged,
                                const std::string& contractAddress,
                                const std::string& description) const {
    if (address::isZero(contractAddress)) {
        throw RegistryError(RegistryErrorCode::ZeroAddressNotAllowed, "Adresse zero non autorisee.", contractAddress);
    }
    if (!codeLookup_(contractAddress)) {
        throw RegistryError(RegistryErrorCode::NonContractAddress,
                            "L'adresse " + contractAddress + " ne contient pas de code deploye.",
                            contractAddress);
    }

    const std::string key = address::normalize(contractAddress);
    if (stagedEntry(staged, key).exists) {
        throw RegistryError(RegistryErrorCode::ContractAlreadyExists,
                            "Le contrat " + contractAddress + " est deja enregistre.",
                            contractAddress);
    }

    staged.overlay[key] = ContractEntry{description, true};
    staged.events.push_back(events::RegistryEvent::contractAdded(key, description));
}

void ContractRegistry::stageUpdate(StagedWrites& staged,
                                   const std::string& contractAddress,
                                   const std::string& newDescription) const {
    const std::string key = address::normalize(contractAddress);
    const ContractEntry current = stagedEntry(staged, key);
    if (!current.exists) {
        throw RegistryError(RegistryErrorCode::NotFound,
                            "Le contrat " + contractAddress + " n'existe pas dans le registre.",
                            contractAddress);
    }

    staged.overlay[key] = ContractEntry{newDescription, true};
    staged.events.push_back(events::RegistryEvent::descriptionUpdated(key, current.description, newDescription));
}

void ContractRegistry::stageRemove(StagedWrites& staged, const std::string& contractAddress) const {
    const std::string key = address::normalize(contractAddress);
    if (!stagedEntry(staged, key).exists) {
        throw RegistryError(RegistryErrorCode::NotFound,
                            "Le contrat " + contractAddress + " n'existe pas dans le registre.",
                            contractAddress);
    }

    staged.overlay[key] = ContractEntry{};
    staged.events.push_back(events::RegistryEvent::contractRemoved(key));
}

void ContractRegistry::stageAddBatch(StagedWrites& staged,
                                     const std::vector<std::string>& contractAddresses,
                                     const std::vector<std::string>& descriptions) const {
    requireMatchingLengths(contractAddresses.size(), descriptions.size());
    requireWithinLoopLimit(contractAddresses.size());

    for (std::size_t i = 0; i < contractAddresses.size(); ++i) {
        stageAdd(staged, contractAddresses[i], descriptions[i]);
    }
}

std::vector<events::RegistryEvent> ContractRegistry::commit(StagedWrites staged) {
    for (auto& item : staged.overlay) {
        if (item.second.exists) {
            entries_[item.first] = std::move(item.second);
        } else {
            entries_.erase(item.first);
        }
    }

    for (const auto& event : staged.events) {
        logInfo(describe(event));
    }
    return events_.record(std::move(staged.events));
}

void ContractRegistry::requireRole(access::Role role, const std::string& caller) const {
    if (!roles_.hasRole(role, caller)) {
        throw RegistryError(RegistryErrorCode::Unauthorized,
                            "Le compte " + caller + " n'a pas le role " + access::toString(role) + ".",
                            caller,
                            access::toString(role));
    }
}

void ContractRegistry::requireMatchingLengths(std::size_t addressCount, std::size_t descriptionCount) const {
    if (addressCount != descriptionCount) {
        throw RegistryError(RegistryErrorCode::ArrayLengthMismatch,
                            "Tailles de tableaux differentes (" + std::to_string(addressCount) + " adresses, " +
                                std::to_string(descriptionCount) + " descriptions).");
    }
}

void ContractRegistry::requireWithinLoopLimit(std::size_t count) const {
    if (static_cast<std::uint64_t>(count) > loopLimit_) {
        throw RegistryError(RegistryErrorCode::LoopLimitExceeded,
                            "Lot de " + std::to_string(count) + " elements au-dela de la limite de boucle " +
                                std::to_string(loopLimit_) + ".");
    }
}

void ContractRegistry::logInfo(const std::string& message) const {
    if (logger_ != nullptr) {
        logger_->info("registry", message);
    }
}

void ContractRegistry::logRejection(const char* operation, const RegistryError& error) const {
    if (logger_ != nullptr) {
        logger_->warning("registry", std::string(operation) + " rejected (" + toString(error.code()) +
                                         "): " + error.what());
    }
}
