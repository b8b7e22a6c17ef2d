#include "storage/registry_snapshot.hpp"

#include <sstream>

RegistrySnapshot RegistrySnapshotBuilder::fromRegistry(const ContractRegistry& registry) {
    const RegistryState state = registry.exportState();

    RegistrySnapshot snapshot;
    snapshot.loopLimit = state.loopLimit;
    snapshot.activeContracts = state.entries.size();
    snapshot.adminCount = state.admins.size();
    snapshot.managerCount = state.managers.size();
    snapshot.lastEventSequence = registry.events().lastSequence();
    return snapshot;
}

std::string RegistrySnapshotBuilder::toPrettyString(const RegistrySnapshot& snapshot) {
    std::ostringstream out;
    const auto lines = toLines(snapshot);
    for (std::size_t i = 0; i < lines.size(); ++i) {
        out << lines[i];
        if (i + 1 < lines.size()) {
            out << '\n';
        }
    }

    return out.str();
}

std::vector<std::string> RegistrySnapshotBuilder::toLines(const RegistrySnapshot& snapshot) {
    return {
        "loop_limit=" + std::to_string(snapshot.loopLimit),
        "active_contracts=" + std::to_string(snapshot.activeContracts),
        "admins=" + std::to_string(snapshot.adminCount),
        "managers=" + std::to_string(snapshot.managerCount),
        "last_event=" + (snapshot.lastEventSequence == 0 ? std::string{"<none>"}
                                                         : std::to_string(snapshot.lastEventSequence)),
    };
}
