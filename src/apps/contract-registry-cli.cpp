#include "access/role_table.hpp"
#include "contract_registry.hpp"
#include "host/code_index.hpp"
#include "registry_params.hpp"
#include "rpc/registry_handlers.hpp"
#include "rpc/rpc_context.hpp"
#include "rpc/rpc_dispatcher.hpp"
#include "rpc/rpc_server.hpp"
#include "storage/registry_snapshot.hpp"
#include "storage/registry_store.hpp"
#include "utils/logger.hpp"
#include "utils/number_parse.hpp"

#include <cstddef>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
void printUsage() {
    std::cout << "Usage:\n"
              << "  contract-registry-cli [--state <file>] [--from <account>] [--log-level <level>] <command>\n"
              << "Commands:\n"
              << "  add <address> <description>\n"
              << "  add-batch <address ...> -- <description ...>\n"
              << "  update <address> <new_description>\n"
              << "  update-batch <address ...> -- <new_description ...>\n"
              << "  remove <address>\n"
              << "  remove-batch <address ...>\n"
              << "  set-loop-limit <limit>\n"
              << "  grant-manager <account>\n"
              << "  details <address>\n"
              << "  loop-limit\n"
              << "  has-role <ADMIN|MANAGER> <account>\n"
              << "  summary\n"
              << "  deploy-mock [count]\n"
              << "  code-list\n"
              << "  rpc <method> [params]\n";
}

struct CliOptions {
    std::string statePath = registry_params::kDefaultStateFile;
    std::optional<std::string> caller;
    LogLevel logLevel = LogLevel::Warning;
    std::string command;
    std::vector<std::string> args;
};

bool parseCliArgs(const std::vector<std::string>& argv, CliOptions& options, std::string& error) {
    std::size_t i = 0;
    for (; i < argv.size(); ++i) {
        const auto& arg = argv[i];
        if (arg.rfind("--", 0) != 0) {
            break;
        }
        if (i + 1 >= argv.size()) {
            error = "Missing value for " + arg;
            return false;
        }
        if (arg == "--state") {
            options.statePath = argv[++i];
            continue;
        }
        if (arg == "--from") {
            options.caller = argv[++i];
            continue;
        }
        if (arg == "--log-level") {
            const auto level = Logger::parseLevel(argv[++i]);
            if (!level) {
                error = "Unknown log level: " + argv[i];
                return false;
            }
            options.logLevel = *level;
            continue;
        }
        error = "Unknown option: " + arg;
        return false;
    }

    if (i >= argv.size()) {
        error = "Missing command";
        return false;
    }
    options.command = argv[i];
    options.args.assign(argv.begin() + static_cast<std::ptrdiff_t>(i) + 1, argv.end());
    return true;
}

enum class CommandOutcome {
    Ok,
    InvalidArgs,
    Failed,
    Unknown
};

struct Session {
    DeploymentRecord record;
    host::ContractCodeIndex codeIndex;
    std::unique_ptr<ContractRegistry> registry;
    std::string caller;
    bool dirty = false;
};

CommandOutcome runRpc(Session& session, const std::vector<std::string>& args, Logger& logger, std::ostream& out) {
    rpc::RpcDispatcher dispatcher;
    if (!rpc::registerRegistryHandlers(dispatcher, *session.registry)) {
        throw std::logic_error("Enregistrement des handlers RPC impossible.");
    }
    rpc::RpcContext context = rpc::buildDefaultContext();
    context.instanceAddress = session.record.instanceAddress;
    context.network = session.record.network;
    const rpc::RpcServer server(context, std::move(dispatcher), &logger);

    const auto request = rpc::RpcServer::parseRequest(1, session.caller, args);
    if (!request) {
        return CommandOutcome::InvalidArgs;
    }
    const rpc::RpcResponse response = server.handle(*request);
    out << rpc::RpcServer::formatResponse(response) << "\n";
    if (response.hasError()) {
        return CommandOutcome::Failed;
    }
    session.dirty = request->method.rfind("registry.", 0) == 0;
    return CommandOutcome::Ok;
}

CommandOutcome runCommand(const std::string& command,
                          const std::vector<std::string>& args,
                          Session& session,
                          Logger& logger,
                          std::ostream& out,
                          std::string& error) {
    ContractRegistry& registry = *session.registry;

    if (command == "add") {
        if (args.size() != 2) {
            error = "Parametres invalides pour add";
            return CommandOutcome::InvalidArgs;
        }
        registry.addContract(session.caller, args[0], args[1]);
        session.dirty = true;
        return CommandOutcome::Ok;
    }

    if (command == "add-batch") {
        const auto paired = rpc::splitPairedParams(args);
        registry.addContractsInBatch(session.caller, paired.addresses, paired.descriptions);
        session.dirty = true;
        return CommandOutcome::Ok;
    }

    if (command == "update") {
        if (args.size() != 2) {
            error = "Parametres invalides pour update";
            return CommandOutcome::InvalidArgs;
        }
        registry.updateContractDescription(session.caller, args[0], args[1]);
        session.dirty = true;
        return CommandOutcome::Ok;
    }

    if (command == "update-batch") {
        const auto paired = rpc::splitPairedParams(args);
        registry.updateContractsDescriptionsInBatch(session.caller, paired.addresses, paired.descriptions);
        session.dirty = true;
        return CommandOutcome::Ok;
    }

    if (command == "remove") {
        if (args.size() != 1) {
            error = "Parametres invalides pour remove";
            return CommandOutcome::InvalidArgs;
        }
        registry.removeContract(session.caller, args[0]);
        session.dirty = true;
        return CommandOutcome::Ok;
    }

    if (command == "remove-batch") {
        registry.removeContractsInBatch(session.caller, args);
        session.dirty = true;
        return CommandOutcome::Ok;
    }

    if (command == "set-loop-limit") {
        if (args.size() != 1) {
            error = "Parametres invalides pour set-loop-limit";
            return CommandOutcome::InvalidArgs;
        }
        registry.setLoopLimit(session.caller, requireUnsigned(args[0], "limit"));
        session.dirty = true;
        return CommandOutcome::Ok;
    }

    if (command == "grant-manager") {
        if (args.size() != 1) {
            error = "Parametres invalides pour grant-manager";
            return CommandOutcome::InvalidArgs;
        }
        registry.grantManagerRole(session.caller, args[0]);
        session.dirty = true;
        return CommandOutcome::Ok;
    }

    if (command == "details") {
        if (args.size() != 1) {
            error = "Parametres invalides pour details";
            return CommandOutcome::InvalidArgs;
        }
        const ContractEntry entry = registry.contractDetails(args[0]);
        out << "contract_details\n"
            << "  address=" << args[0] << "\n"
            << "  exists=" << std::boolalpha << entry.exists << "\n"
            << "  description=" << entry.description << "\n";
        return CommandOutcome::Ok;
    }

    if (command == "loop-limit") {
        if (!args.empty()) {
            error = "Parametres invalides pour loop-limit";
            return CommandOutcome::InvalidArgs;
        }
        out << "loop_limit=" << registry.loopLimit() << "\n";
        return CommandOutcome::Ok;
    }

    if (command == "has-role") {
        if (args.size() != 2) {
            error = "Parametres invalides pour has-role";
            return CommandOutcome::InvalidArgs;
        }
        const auto role = access::roleFromString(args[0]);
        if (!role) {
            error = "Role inconnu: " + args[0];
            return CommandOutcome::InvalidArgs;
        }
        out << "has_role=" << std::boolalpha << registry.hasRole(*role, args[1]) << "\n";
        return CommandOutcome::Ok;
    }

    if (command == "summary") {
        if (!args.empty()) {
            error = "Parametres invalides pour summary";
            return CommandOutcome::InvalidArgs;
        }
        out << "instance=" << session.record.instanceAddress << "\n"
            << "network=" << session.record.network << "\n"
            << "deployer=" << session.record.deployer << "\n"
            << RegistrySnapshotBuilder::toPrettyString(RegistrySnapshotBuilder::fromRegistry(registry)) << "\n";
        return CommandOutcome::Ok;
    }

    if (command == "deploy-mock") {
        if (args.size() > 1) {
            error = "Parametres invalides pour deploy-mock";
            return CommandOutcome::InvalidArgs;
        }
        const std::uint64_t count = args.empty() ? 1 : requireUnsigned(args[0], "count");
        for (std::uint64_t i = 0; i < count; ++i) {
            out << "mock contract deployed at address: " << session.codeIndex.deployNext(session.caller) << "\n";
        }
        session.dirty = true;
        return CommandOutcome::Ok;
    }

    if (command == "code-list") {
        if (!args.empty()) {
            error = "Parametres invalides pour code-list";
            return CommandOutcome::InvalidArgs;
        }
        const auto addresses = session.codeIndex.listAddresses();
        out << "code_addresses=" << addresses.size() << "\n";
        for (const auto& codeAddress : addresses) {
            out << "  " << codeAddress << "\n";
        }
        return CommandOutcome::Ok;
    }

    if (command == "rpc") {
        if (args.empty()) {
            error = "Parametres invalides pour rpc";
            return CommandOutcome::InvalidArgs;
        }
        return runRpc(session, args, logger, out);
    }

    return CommandOutcome::Unknown;
}
} // namespace

int main(int argc, char* argv[]) {
    try {
        const std::vector<std::string> argvList(argv + 1, argv + argc);
        CliOptions options;
        std::string error;
        if (!parseCliArgs(argvList, options, error)) {
            std::cerr << "Erreur: " << error << "\n";
            printUsage();
            return 1;
        }

        Logger logger{registry_params::kLoggerCapacity};
        logger.setMinLevel(options.logLevel);
        logger.setSink([](const LogEntry& entry) { std::cerr << Logger::format(entry) << "\n"; });

        Session session;
        session.record = RegistryStore::load(options.statePath);
        for (const auto& codeAddress : session.record.codeAddresses) {
            if (!session.codeIndex.registerCode(codeAddress)) {
                throw std::runtime_error("Fichier d'etat invalide: adresse de code " + codeAddress + ".");
            }
        }
        session.registry = ContractRegistry::restore(session.record.registry, session.codeIndex.lookup(), &logger);
        session.caller = options.caller.value_or(session.record.deployer);

        const CommandOutcome outcome = runCommand(options.command, options.args, session, logger, std::cout, error);
        if (outcome == CommandOutcome::Unknown) {
            std::cerr << "Commande inconnue: " << options.command << "\n";
            printUsage();
            return 1;
        }
        if (outcome == CommandOutcome::InvalidArgs) {
            std::cerr << "Erreur: " << error << "\n";
            printUsage();
            return 1;
        }

        for (const auto& event : session.registry->events().entries()) {
            std::cout << "event " << events::format(event) << "\n";
        }

        if (outcome == CommandOutcome::Failed) {
            return 1;
        }

        if (session.dirty) {
            session.record.codeAddresses = session.codeIndex.listAddresses();
            session.record.registry = session.registry->exportState();
            RegistryStore::save(options.statePath, session.record);
        }
        return 0;
    } catch (const RegistryError& ex) {
        std::cerr << "Erreur: " << toString(ex.code()) << ": " << ex.what() << "\n";
        if (!ex.subject().empty()) {
            std::cerr << "  subject=" << ex.subject() << "\n";
        }
        if (!ex.missingRole().empty()) {
            std::cerr << "  missing_role=" << ex.missingRole() << "\n";
        }
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Erreur: " << ex.what() << "\n";
        return 1;
    }
}
