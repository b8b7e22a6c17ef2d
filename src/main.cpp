#include "contract_registry.hpp"
#include "host/code_index.hpp"
#include "storage/registry_snapshot.hpp"
#include "utils/logger.hpp"

#include <iostream>

namespace {
constexpr const char* kDeployer = "0xf39fd6e51aad88f6f4ce6ab8827279cfffb92266";
constexpr const char* kOutsider = "0x70997970c51812dc3a010c7d01b50e0d17dc79c8";

void printDetails(const ContractRegistry& registry, const std::string& contractAddress) {
    const ContractEntry entry = registry.contractDetails(contractAddress);
    std::cout << "  " << contractAddress << " exists=" << std::boolalpha << entry.exists << " description=\""
              << entry.description << "\"\n";
}
} // namespace

int main() {
    try {
        Logger logger{registry_params::kLoggerCapacity};
        host::ContractCodeIndex codeIndex;
        const std::string first = codeIndex.deployNext(kDeployer);
        const std::string second = codeIndex.deployNext(kDeployer);

        ContractRegistry registry{kDeployer, codeIndex.lookup(), {}, {}, 10, &logger};
        const std::size_t subscription = registry.events().subscribe(
            [](const events::RegistryEvent& event) { std::cout << "event " << events::format(event) << "\n"; });

        registry.addContractsInBatch(kDeployer, {first, second}, {"a", "b"});
        std::cout << "Apres ajout en lot:\n";
        printDetails(registry, first);
        printDetails(registry, second);

        registry.updateContractDescription(kDeployer, first, "a (v2)");

        try {
            registry.addContract(kOutsider, first, "intrus");
        } catch (const RegistryError& ex) {
            std::cout << "Appel refuse: " << toString(ex.code()) << "\n";
        }

        registry.removeContractsInBatch(kDeployer, {first, second});
        std::cout << "Apres suppression en lot:\n";
        printDetails(registry, first);
        printDetails(registry, second);

        if (!registry.events().unsubscribe(subscription)) {
            std::cerr << "Abonnement introuvable.\n";
        }

        std::cout << RegistrySnapshotBuilder::toPrettyString(RegistrySnapshotBuilder::fromRegistry(registry)) << "\n";
        for (const auto& entry : logger.entries()) {
            std::cout << Logger::format(entry) << "\n";
        }
        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "Erreur: " << ex.what() << "\n";
        return 1;
    }
}
