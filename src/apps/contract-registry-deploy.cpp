#include "address.hpp"
#include "config/deploy_manifest.hpp"
#include "contract_registry.hpp"
#include "host/code_index.hpp"
#include "registry_params.hpp"
#include "storage/registry_store.hpp"
#include "utils/logger.hpp"
#include "utils/number_parse.hpp"

#include <exception>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
void printUsage() {
    std::cout << "Usage:\n"
              << "  contract-registry-deploy [--deployer <address>] [--manifest <file>]\n"
              << "                           [--loop-limit <n>] [--network <id>] [--state <file>]\n"
              << "                           [--log-level <debug|info|warning|error>] [--force]\n";
}

struct DeployConfig {
    std::string deployer = registry_params::kDefaultDeployer;
    std::optional<std::string> manifestPath;
    std::optional<std::uint64_t> loopLimit;
    std::string network = registry_params::kDefaultNetwork;
    std::string statePath = registry_params::kDefaultStateFile;
    LogLevel logLevel = LogLevel::Info;
    bool force = false;
};

bool parseDeployArgs(const std::vector<std::string>& args, DeployConfig& options, std::string& error) {
    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];
        if (arg == "--force") {
            options.force = true;
            continue;
        }
        if (i + 1 >= args.size()) {
            error = "Missing value for " + arg;
            return false;
        }
        if (arg == "--deployer") {
            options.deployer = args[++i];
            continue;
        }
        if (arg == "--manifest") {
            options.manifestPath = args[++i];
            continue;
        }
        if (arg == "--loop-limit") {
            options.loopLimit = requireUnsigned(args[++i], "loop-limit");
            continue;
        }
        if (arg == "--network") {
            options.network = args[++i];
            continue;
        }
        if (arg == "--state") {
            options.statePath = args[++i];
            continue;
        }
        if (arg == "--log-level") {
            const auto level = Logger::parseLevel(args[++i]);
            if (!level) {
                error = "Unknown log level: " + args[i];
                return false;
            }
            options.logLevel = *level;
            continue;
        }
        error = "Unknown deploy argument: " + arg;
        return false;
    }
    return true;
}
} // namespace

int main(int argc, char* argv[]) {
    try {
        const std::vector<std::string> args(argv + 1, argv + argc);
        if (!args.empty() && (args.front() == "--help" || args.front() == "-h")) {
            printUsage();
            return 0;
        }

        DeployConfig options;
        std::string error;
        if (!parseDeployArgs(args, options, error)) {
            std::cerr << "Erreur deploy: " << error << "\n";
            printUsage();
            return 1;
        }
        if (!address::isWellFormed(options.deployer) || address::isZero(options.deployer)) {
            throw std::invalid_argument("Adresse de deployeur invalide: " + options.deployer);
        }
        if (!options.force && RegistryStore::exists(options.statePath)) {
            throw std::runtime_error("Un registre est deja deploye dans " + options.statePath +
                                     " (utiliser --force pour le remplacer).");
        }

        registry_params::RegistryParams params = registry_params::defaultRegistryParams();
        Logger logger{params.loggerCapacity};
        logger.setMinLevel(options.logLevel);
        logger.setSink([](const LogEntry& entry) { std::cerr << Logger::format(entry) << "\n"; });

        config::DeployManifest manifest;
        if (options.manifestPath) {
            manifest = config::loadDeployManifest(*options.manifestPath);
        }

        host::ContractCodeIndex codeIndex;
        for (const auto& codeAddress : manifest.codeAddresses) {
            if (!codeIndex.registerCode(codeAddress)) {
                throw std::invalid_argument("Adresse de code invalide ou en double dans le manifeste: " + codeAddress);
            }
        }

        params.loopLimit = options.loopLimit.value_or(manifest.loopLimit.value_or(params.loopLimit));

        std::cout << "contract registry is deploying........\n";
        const std::string instanceAddress = codeIndex.deployNext(options.deployer);
        ContractRegistry registry{options.deployer,
                                  codeIndex.lookup(),
                                  manifest.contractAddresses,
                                  manifest.descriptions,
                                  params.loopLimit,
                                  &logger,
                                  params.eventLogCapacity};

        DeploymentRecord record;
        record.instanceAddress = instanceAddress;
        record.deployer = address::normalize(options.deployer);
        record.network = options.network;
        record.codeAddresses = codeIndex.listAddresses();
        record.registry = registry.exportState();
        RegistryStore::save(options.statePath, record);

        std::cout << "contract registry deployed at address: " << instanceAddress << "\n"
                  << "  network=" << options.network << "\n"
                  << "  loop_limit=" << registry.loopLimit() << "\n"
                  << "  initial_contracts=" << registry.activeContractCount() << "\n"
                  << "  state=" << options.statePath << "\n";
        return 0;
    } catch (const RegistryError& ex) {
        std::cerr << "Erreur: " << toString(ex.code()) << ": " << ex.what() << "\n";
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Erreur: " << ex.what() << "\n";
        return 1;
    }
}
