#include "access/role_table.hpp"
#include "address.hpp"
#include "config/deploy_manifest.hpp"
#include "contract_registry.hpp"
#include "events/event_log.hpp"
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

#include <cstdio>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
const std::string kDeployer = "0xf39fd6e51aad88f6f4ce6ab8827279cfffb92266";
const std::string kUser1 = "0x70997970c51812dc3a010c7d01b50e0d17dc79c8";

void assertTrue(bool condition, const std::string& message) {
    if (!condition) {
        throw std::runtime_error(message);
    }
}

void testLoggerRingBufferBehavior() {
    Logger logger{2};
    logger.info("registry", "startup");
    logger.warning("rpc", "call rejected");
    logger.error("storage", "state file unreadable");

    const auto entries = logger.entries();
    assertTrue(entries.size() == 2, "Le logger doit respecter la taille maximale.");
    assertTrue(entries.front().component == "rpc", "Le logger doit evincer les plus anciennes entrees.");
}

void testLoggerLevelSinkAndParsing() {
    Logger logger{10};
    std::vector<std::string> forwarded;
    logger.setSink([&forwarded](const LogEntry& entry) { forwarded.push_back(Logger::format(entry)); });
    logger.setMinLevel(LogLevel::Warning);
    logger.info("registry", "ignored");
    logger.warning("registry", "kept");

    assertTrue(logger.minLevel() == LogLevel::Warning, "Le niveau minimal doit etre conserve.");
    assertTrue(logger.size() == 1, "Le niveau minimal doit filtrer les entrees.");
    assertTrue(forwarded.size() == 1 && forwarded[0].find("[WARNING] [registry] kept") != std::string::npos,
               "Le sink doit recevoir l'entree formatee.");
    assertTrue(logger.entriesFor("registry").size() == 1 && logger.entriesFor("rpc").empty(),
               "Le filtrage par composant doit fonctionner.");

    logger.clear();
    assertTrue(logger.empty(), "clear doit vider le logger.");
    logger.setMaxEntries(0);
    assertTrue(logger.maxEntries() == 1, "La capacite doit rester au moins 1.");
    assertTrue(Logger::parseLevel("WARN") == LogLevel::Warning, "warn doit etre reconnu.");
    assertTrue(!Logger::parseLevel("verbose"), "Un niveau inconnu doit etre rejete.");
}

void testUnsignedParsing() {
    assertTrue(parseUnsigned("0") == std::uint64_t{0} && parseUnsigned("100") == std::uint64_t{100},
               "Les entiers decimaux doivent etre lus.");
    assertTrue(parseUnsigned("18446744073709551615") == std::uint64_t{18446744073709551615ULL},
               "La valeur maximale doit etre acceptee.");
    assertTrue(!parseUnsigned("18446744073709551616"), "Un depassement doit etre rejete.");
    assertTrue(!parseUnsigned("") && !parseUnsigned("-1") && !parseUnsigned("+1") && !parseUnsigned(" 1") &&
                   !parseUnsigned("12a"),
               "Signe, espace et caractere non numerique doivent etre rejetes.");

    bool threw = false;
    try {
        static_cast<void>(requireUnsigned("abc", "limit"));
    } catch (const std::invalid_argument& ex) {
        threw = std::string(ex.what()).find("limit") != std::string::npos;
    }
    assertTrue(threw, "requireUnsigned doit nommer le champ invalide.");
}

void testAddressHelpers() {
    const std::string mixed = "0xF39Fd6e51aad88F6F4ce6aB8827279cffFb92266";
    assertTrue(address::isWellFormed(mixed), "Une adresse hexadecimale de 40 chiffres est valide.");
    assertTrue(address::normalize(mixed) == kDeployer, "La normalisation doit passer en minuscules.");
    assertTrue(!address::isWellFormed("0x1234"), "Une adresse trop courte est invalide.");
    assertTrue(!address::isWellFormed("0xg39fd6e51aad88f6f4ce6ab8827279cfffb92266"), "Un chiffre non hexa est invalide.");
    assertTrue(address::isZero(address::kZeroAddress) && address::isZero(""), "Zero et vide sont l'adresse nulle.");
    assertTrue(!address::isZero(kDeployer), "Une adresse normale n'est pas nulle.");

    const std::string first = address::deriveContractAddress(kDeployer, 0);
    assertTrue(address::isWellFormed(first), "L'adresse derivee doit etre bien formee.");
    assertTrue(first == address::deriveContractAddress(kDeployer, 0), "La derivation doit etre deterministe.");
    assertTrue(first != address::deriveContractAddress(kDeployer, 1), "Le nonce doit changer l'adresse.");
}

void testRoleTable() {
    access::RoleTable roles;
    assertTrue(roles.grant(access::Role::Manager, kUser1), "Un premier octroi doit etre nouveau.");
    assertTrue(!roles.grant(access::Role::Manager, kUser1), "Un second octroi doit etre idempotent.");
    assertTrue(roles.hasRole(access::Role::Manager, "0x70997970C51812dc3A010C7d01b50e0d17dc79C8"),
               "La recherche de role doit ignorer la casse.");
    assertTrue(!roles.hasRole(access::Role::Admin, kUser1), "Les roles sont independants.");
    assertTrue(roles.memberCount(access::Role::Manager) == 1, "Un seul manager attendu.");
    assertTrue(access::roleFromString("manager") == access::Role::Manager, "Le role doit etre reconnu sans casse.");
    assertTrue(!access::roleFromString("owner"), "Un role inconnu doit etre rejete.");
    assertTrue(access::toString(access::Role::Admin) == "ADMIN", "Le nom du role admin doit etre ADMIN.");
}

void testCodeIndex() {
    host::ContractCodeIndex index;
    const std::string first = index.deployNext(kDeployer);
    const std::string second = index.deployNext(kDeployer);
    assertTrue(first != second, "Chaque deploiement doit produire une nouvelle adresse.");
    assertTrue(index.hasCode(first) && index.hasCode(second), "Les adresses deployees doivent avoir du code.");
    assertTrue(!index.hasCode(kUser1), "Un compte externe n'a pas de code.");
    assertTrue(!index.registerCode(first), "Un doublon doit etre refuse.");
    assertTrue(!index.registerCode(address::kZeroAddress), "L'adresse zero ne peut pas avoir de code.");
    assertTrue(!index.registerCode("not-an-address"), "Une adresse mal formee doit etre refusee.");

    const auto lookup = index.lookup();
    assertTrue(lookup(first) && !lookup(kUser1), "La fonction de recherche doit refleter l'index.");
    assertTrue(index.size() == 2 && index.listAddresses().size() == 2, "L'index doit lister deux adresses.");
}

void testEventLogRingAndSequence() {
    events::EventLog log{2};
    log.publish({events::RegistryEvent::loopLimitUpdated(0, 5),
                 events::RegistryEvent::contractAdded("0xa", "a"),
                 events::RegistryEvent::contractRemoved("0xa")});

    const auto entries = log.entries();
    assertTrue(entries.size() == 2, "Le journal d'evenements doit respecter sa capacite.");
    assertTrue(entries.front().sequence == 2 && entries.back().sequence == 3, "Les sequences doivent se suivre.");
    assertTrue(log.lastSequence() == 3, "La derniere sequence doit etre 3.");
    assertTrue(log.entriesSince(2).size() == 1, "entriesSince doit exclure la sequence donnee.");
    assertTrue(events::format(entries.back()).find("ContractRemoved") != std::string::npos,
               "Le format doit nommer l'evenement.");
}

void testDeployManifestParsing() {
    const auto manifest = config::parseDeployManifest(
        "# initial set\n"
        "loop_limit=25\n"
        "code=0x5fbdb2315678afecb367f032d93f642f64180aa3\n"
        "contract=0x5fbdb2315678afecb367f032d93f642f64180aa3|token vault | v1\n"
        "\n");
    assertTrue(manifest.loopLimit == std::uint64_t{25}, "La limite du manifeste doit etre lue.");
    assertTrue(manifest.codeAddresses.size() == 1, "Une adresse de code attendue.");
    assertTrue(manifest.contractAddresses.size() == 1 && manifest.descriptions[0] == "token vault | v1",
               "La description doit garder tout apres le premier separateur.");

    bool threw = false;
    try {
        static_cast<void>(config::parseDeployManifest("loop_limit=-1\n"));
    } catch (const std::invalid_argument& ex) {
        threw = std::string(ex.what()).find("ligne 1") != std::string::npos;
    }
    assertTrue(threw, "Une limite negative doit etre rejetee avec le numero de ligne.");

    threw = false;
    try {
        static_cast<void>(config::parseDeployManifest("owner=0x1\n"));
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assertTrue(threw, "Une cle inconnue doit etre rejetee.");
}

DeploymentRecord makeRecord(host::ContractCodeIndex& codeIndex) {
    const std::string instance = codeIndex.deployNext(kDeployer);
    const std::string contract = codeIndex.deployNext(kDeployer);
    ContractRegistry registry{kDeployer, codeIndex.lookup(), {contract}, {"vault: main|1"}, 3};
    registry.grantManagerRole(kDeployer, kUser1);

    DeploymentRecord record;
    record.instanceAddress = instance;
    record.deployer = kDeployer;
    record.network = registry_params::kDefaultNetwork;
    record.codeAddresses = codeIndex.listAddresses();
    record.registry = registry.exportState();
    return record;
}

void testRegistryStoreCodec() {
    host::ContractCodeIndex codeIndex;
    const DeploymentRecord record = makeRecord(codeIndex);

    const std::string payload = RegistryStoreCodec::encodeRecord(record);
    const auto decoded = RegistryStoreCodec::decodeRecord(payload);
    assertTrue(decoded.has_value(), "L'enregistrement doit etre decodable.");
    assertTrue(decoded->instanceAddress == record.instanceAddress && decoded->codeAddresses == record.codeAddresses,
               "Les champs de deploiement doivent etre conserves.");
    assertTrue(decoded->registry.loopLimit == 3 && decoded->registry.entries.size() == 1 &&
                   decoded->registry.entries[0].second.description == "vault: main|1",
               "L'etat du registre doit etre conserve, separateurs compris.");
    assertTrue(decoded->registry.managers.size() == 2, "Les managers doivent etre conserves.");

    assertTrue(!RegistryStoreCodec::decodeRecord(payload + "x"), "Des donnees en trop doivent etre rejetees.");
    assertTrue(!RegistryStoreCodec::decodeRecord(payload.substr(0, payload.size() - 1)),
               "Un enregistrement tronque doit etre rejete.");
    assertTrue(!RegistryStoreCodec::decodeRecord("4:XXXX1:1"), "Un mauvais magic doit etre rejete.");
    assertTrue(!RegistryStoreCodec::decodeEntry("2:0x1:d1:2"), "Un drapeau d'existence invalide doit etre rejete.");
}

void testRegistryStoreFileRoundTrip() {
    host::ContractCodeIndex codeIndex;
    const DeploymentRecord record = makeRecord(codeIndex);
    const std::string path = "platform_modules_tests_registry.dat";

    RegistryStore::save(path, record);
    assertTrue(RegistryStore::exists(path), "Le fichier d'etat doit exister apres sauvegarde.");
    const DeploymentRecord loaded = RegistryStore::load(path);
    std::remove(path.c_str());

    auto registry = ContractRegistry::restore(loaded.registry, codeIndex.lookup());
    assertTrue(registry->hasRole(access::Role::Manager, kUser1), "Les roles doivent survivre au fichier.");
    assertTrue(registry->activeContractCount() == 1, "Les entrees doivent survivre au fichier.");

    bool threw = false;
    try {
        static_cast<void>(RegistryStore::load("missing_registry_state.dat"));
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assertTrue(threw, "Un fichier absent doit lever une erreur.");
}

void testRegistrySnapshot() {
    host::ContractCodeIndex codeIndex;
    const std::string contract = codeIndex.deployNext(kDeployer);
    ContractRegistry registry{kDeployer, codeIndex.lookup(), {contract}, {"main"}, 4};

    const RegistrySnapshot snapshot = RegistrySnapshotBuilder::fromRegistry(registry);
    assertTrue(snapshot.activeContracts == 1 && snapshot.loopLimit == 4, "Le snapshot doit refleter le registre.");
    assertTrue(snapshot.adminCount == 1 && snapshot.managerCount == 1, "Le snapshot doit compter les roles.");
    assertTrue(snapshot.lastEventSequence == 4, "Le snapshot doit reporter la derniere sequence.");

    const std::string pretty = RegistrySnapshotBuilder::toPrettyString(snapshot);
    assertTrue(pretty.find("active_contracts=1") != std::string::npos, "Le rendu doit inclure le nombre de contrats.");
}

void testRpcRegistryHandlers() {
    host::ContractCodeIndex codeIndex;
    const std::string first = codeIndex.deployNext(kDeployer);
    const std::string second = codeIndex.deployNext(kDeployer);
    ContractRegistry registry{kDeployer, codeIndex.lookup(), {}, {}, 10};

    rpc::RpcDispatcher dispatcher;
    assertTrue(rpc::registerRegistryHandlers(dispatcher, registry), "Les handlers doivent s'enregistrer.");
    assertTrue(!rpc::registerRegistryHandlers(dispatcher, registry), "Un second enregistrement doit echouer.");
    assertTrue(!dispatcher.registerHandler("rpc.version", [](const rpc::RpcRequest& request, const rpc::RpcContext&) {
                   return rpc::RpcResponse::success(request.id, "override");
               }),
               "Un built-in ne doit pas etre remplace.");
    assertTrue(dispatcher.hasHandler("registry.addBatch"), "registry.addBatch doit etre installe.");
    const rpc::RpcServer server(rpc::buildDefaultContext(), dispatcher);
    assertTrue(server.context().instanceName == "contract-registry", "Le contexte par defaut doit nommer l'instance.");

    auto call = [&server](const std::string& caller, const std::vector<std::string>& words) {
        const auto request = rpc::RpcServer::parseRequest(1, caller, words);
        if (!request) {
            throw std::runtime_error("Requete RPC invalide.");
        }
        return server.handle(*request);
    };

    auto response = call(kDeployer, {"registry.addBatch", first, second, "--", "a", "b"});
    assertTrue(!response.hasError() && response.result == "status=ok count=2", "L'ajout en lot RPC doit reussir.");

    response = call(kDeployer, {"registry.details", first});
    assertTrue(response.result.find("exists=true") != std::string::npos, "details doit voir l'entree active.");

    response = call(kUser1, {"registry.remove", first});
    assertTrue(response.hasError() && response.error->code == rpc::RpcErrorCode::Unauthorized,
               "Un appel non autorise doit renvoyer Unauthorized.");
    assertTrue(response.error->message.rfind("unauthorized:", 0) == 0, "Le message doit commencer par la raison.");

    response = call(kDeployer, {"registry.updateBatch", first, second, "--", "only-one"});
    assertTrue(response.hasError() && response.error->code == rpc::RpcErrorCode::ArrayLengthMismatch,
               "Une taille differente doit renvoyer ArrayLengthMismatch.");

    response = call(kDeployer, {"registry.setLoopLimit", "abc"});
    assertTrue(response.hasError() && response.error->code == rpc::RpcErrorCode::InvalidParams,
               "Une limite non numerique doit renvoyer InvalidParams.");

    response = call(kDeployer, {"registry.setLoopLimit", "1"});
    assertTrue(!response.hasError() && registry.loopLimit() == 1, "setLoopLimit doit passer par le registre.");

    response = call(kDeployer, {"registry.removeBatch", first, second});
    assertTrue(response.hasError() && response.error->code == rpc::RpcErrorCode::LoopLimitExceeded,
               "La limite de boucle doit s'appliquer via RPC.");

    response = call(kDeployer, {"registry.grantManager", kUser1});
    assertTrue(!response.hasError(), "grantManager doit reussir pour l'administrateur.");
    response = call(kDeployer, {"registry.hasRole", "manager", kUser1});
    assertTrue(response.result == "has_role=true", "hasRole doit refleter l'octroi.");

    response = call(kDeployer, {"registry.loopLimit"});
    assertTrue(response.result == "loop_limit=1", "loopLimit doit renvoyer la limite courante.");

    response = call(kDeployer, {"rpc.context"});
    assertTrue(response.result.find("network=localhost") != std::string::npos, "rpc.context doit exposer le reseau.");

    response = call(kDeployer, {"registry.unknown"});
    assertTrue(response.hasError() && response.error->code == rpc::RpcErrorCode::MethodNotFound,
               "Une methode inconnue doit renvoyer MethodNotFound.");

    const std::string formatted = rpc::RpcServer::formatResponse(
        rpc::RpcResponse::failure(3, rpc::RpcErrorCode::NotFound, "not_found: absent"));
    assertTrue(formatted.find("error=-32014 reason=not_found") != std::string::npos,
               "La reponse formatee doit porter le code et la raison.");
}

void testDispatcherHandlerLifecycle() {
    rpc::RpcDispatcher dispatcher;
    const bool registered =
        dispatcher.registerHandler("registry.custom", [](const rpc::RpcRequest& request, const rpc::RpcContext&) {
            return rpc::RpcResponse::success(request.id, "custom");
        });
    assertTrue(registered && dispatcher.hasHandler("registry.custom"), "Le handler doit etre enregistre.");

    const auto methods = dispatcher.listMethods();
    assertTrue(methods.size() == 4, "La liste doit contenir les built-ins et le handler.");
    assertTrue(methods.front() == "registry.custom", "La liste doit etre triee.");

    rpc::RpcRequest request;
    request.id = 7;
    request.method = "rpc.listMethods";
    const auto listed = dispatcher.dispatch(request, rpc::buildDefaultContext());
    assertTrue(listed.result == "methods=registry.custom, rpc.context, rpc.listMethods, rpc.version",
               "rpc.listMethods doit lister les methodes triees.");

    request.method = "rpc.ping";
    assertTrue(dispatcher.dispatch(request, rpc::buildDefaultContext()).error->code ==
                   rpc::RpcErrorCode::MethodNotFound,
               "Seuls les built-ins du registre doivent repondre.");

    assertTrue(dispatcher.unregisterHandler("registry.custom"), "Le handler doit etre retire.");
    assertTrue(!dispatcher.unregisterHandler("registry.custom"), "Un second retrait doit echouer.");
    assertTrue(!dispatcher.hasHandler("registry.custom"), "Le handler ne doit plus etre present.");
}

void testRegistryErrorCarriesSubjectAndRole() {
    host::ContractCodeIndex codeIndex;
    ContractRegistry registry{kDeployer, codeIndex.lookup(), {}, {}, 10};

    bool checked = false;
    try {
        registry.setLoopLimit(kUser1, 5);
    } catch (const RegistryError& error) {
        checked = error.code() == RegistryErrorCode::Unauthorized && error.subject() == kUser1 &&
                  error.missingRole() == "ADMIN";
    }
    assertTrue(checked, "L'erreur doit nommer le compte et le role manquant.");

    checked = false;
    try {
        registry.removeContract(kDeployer, kUser1);
    } catch (const RegistryError& error) {
        checked = error.code() == RegistryErrorCode::NotFound && error.subject() == kUser1 &&
                  error.missingRole().empty();
    }
    assertTrue(checked, "NotFound doit porter l'adresse concernee.");
}

void testSplitPairedParams() {
    const auto paired = rpc::splitPairedParams({"a1", "a2", "--", "d1", "--"});
    assertTrue(paired.addresses.size() == 2 && paired.descriptions.size() == 2,
               "Seul le premier separateur doit couper les listes.");
    assertTrue(paired.descriptions[1] == "--", "Un separateur ulterieur est une description.");
    assertTrue(rpc::splitPairedParams({"a1"}).descriptions.empty(), "Sans separateur, aucune description.");
}
} // namespace

int main() {
    try {
        testLoggerRingBufferBehavior();
        testLoggerLevelSinkAndParsing();
        testUnsignedParsing();
        testAddressHelpers();
        testRoleTable();
        testCodeIndex();
        testEventLogRingAndSequence();
        testDeployManifestParsing();
        testRegistryStoreCodec();
        testRegistryStoreFileRoundTrip();
        testRegistrySnapshot();
        testRpcRegistryHandlers();
        testDispatcherHandlerLifecycle();
        testRegistryErrorCarriesSubjectAndRole();
        testSplitPairedParams();
        std::cout << "Tous les tests des modules plateforme sont passes.\n";
        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "Echec test: " << ex.what() << '\n';
        return 1;
    }
}
