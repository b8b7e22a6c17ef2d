#include "rpc/registry_handlers.hpp"

#include "access/role_table.hpp"
#include "utils/number_parse.hpp"

#include <functional>
#include <sstream>

namespace rpc {
namespace {
RpcResponse invalidParams(const RpcRequest& request, const std::string& usage) {
    return RpcResponse::failure(request.id, RpcErrorCode::InvalidParams, "usage: " + request.method + " " + usage);
}

// Registry failures become error responses carrying the decodable reason.
RpcResponse runGuarded(const RpcRequest& request, const std::function<std::string()>& action) {
    try {
        return RpcResponse::success(request.id, action());
    } catch (const RegistryError& error) {
        return RpcResponse::failure(
            request.id, fromRegistryError(error.code()), toString(error.code()) + ": " + error.what());
    }
}

std::string countResult(std::size_t count) {
    return "status=ok count=" + std::to_string(count);
}
} // namespace

PairedParams splitPairedParams(const std::vector<std::string>& params) {
    PairedParams paired;
    bool afterSeparator = false;
    for (const auto& param : params) {
        if (!afterSeparator && param == kListSeparator) {
            afterSeparator = true;
            continue;
        }
        if (afterSeparator) {
            paired.descriptions.push_back(param);
        } else {
            paired.addresses.push_back(param);
        }
    }
    return paired;
}

bool registerRegistryHandlers(RpcDispatcher& dispatcher, ContractRegistry& registry) {
    bool ok = true;

    ok = dispatcher.registerHandler("registry.add", [&registry](const RpcRequest& request, const RpcContext&) {
        if (request.params.size() != 2) {
            return invalidParams(request, "<address> <description>");
        }
        return runGuarded(request, [&] {
            registry.addContract(request.caller, request.params[0], request.params[1]);
            return countResult(1);
        });
    }) && ok;

    ok = dispatcher.registerHandler("registry.addBatch", [&registry](const RpcRequest& request, const RpcContext&) {
        const PairedParams paired = splitPairedParams(request.params);
        return runGuarded(request, [&] {
            registry.addContractsInBatch(request.caller, paired.addresses, paired.descriptions);
            return countResult(paired.addresses.size());
        });
    }) && ok;

    ok = dispatcher.registerHandler("registry.update", [&registry](const RpcRequest& request, const RpcContext&) {
        if (request.params.size() != 2) {
            return invalidParams(request, "<address> <new_description>");
        }
        return runGuarded(request, [&] {
            registry.updateContractDescription(request.caller, request.params[0], request.params[1]);
            return countResult(1);
        });
    }) && ok;

    ok = dispatcher.registerHandler("registry.updateBatch", [&registry](const RpcRequest& request, const RpcContext&) {
        const PairedParams paired = splitPairedParams(request.params);
        return runGuarded(request, [&] {
            registry.updateContractsDescriptionsInBatch(request.caller, paired.addresses, paired.descriptions);
            return countResult(paired.addresses.size());
        });
    }) && ok;

    ok = dispatcher.registerHandler("registry.remove", [&registry](const RpcRequest& request, const RpcContext&) {
        if (request.params.size() != 1) {
            return invalidParams(request, "<address>");
        }
        return runGuarded(request, [&] {
            registry.removeContract(request.caller, request.params[0]);
            return countResult(1);
        });
    }) && ok;

    ok = dispatcher.registerHandler("registry.removeBatch", [&registry](const RpcRequest& request, const RpcContext&) {
        return runGuarded(request, [&] {
            registry.removeContractsInBatch(request.caller, request.params);
            return countResult(request.params.size());
        });
    }) && ok;

    ok = dispatcher.registerHandler("registry.setLoopLimit", [&registry](const RpcRequest& request, const RpcContext&) {
        const auto limit = request.params.size() == 1 ? parseUnsigned(request.params[0]) : std::nullopt;
        if (!limit) {
            return invalidParams(request, "<limit>");
        }
        return runGuarded(request, [&] {
            registry.setLoopLimit(request.caller, *limit);
            return "loop_limit=" + std::to_string(*limit);
        });
    }) && ok;

    ok = dispatcher.registerHandler("registry.grantManager", [&registry](const RpcRequest& request, const RpcContext&) {
        if (request.params.size() != 1) {
            return invalidParams(request, "<account>");
        }
        return runGuarded(request, [&] {
            registry.grantManagerRole(request.caller, request.params[0]);
            return std::string("status=ok role=MANAGER account=") + request.params[0];
        });
    }) && ok;

    ok = dispatcher.registerHandler("registry.details", [&registry](const RpcRequest& request, const RpcContext&) {
        if (request.params.size() != 1) {
            return invalidParams(request, "<address>");
        }
        const ContractEntry entry = registry.contractDetails(request.params[0]);
        std::ostringstream out;
        out << "address=" << request.params[0] << " exists=" << std::boolalpha << entry.exists
            << " description=" << entry.description;
        return RpcResponse::success(request.id, out.str());
    }) && ok;

    ok = dispatcher.registerHandler("registry.loopLimit", [&registry](const RpcRequest& request, const RpcContext&) {
        if (!request.params.empty()) {
            return invalidParams(request, "");
        }
        return RpcResponse::success(request.id, "loop_limit=" + std::to_string(registry.loopLimit()));
    }) && ok;

    ok = dispatcher.registerHandler("registry.hasRole", [&registry](const RpcRequest& request, const RpcContext&) {
        if (request.params.size() != 2) {
            return invalidParams(request, "<ADMIN|MANAGER> <account>");
        }
        const auto role = access::roleFromString(request.params[0]);
        if (!role) {
            return invalidParams(request, "<ADMIN|MANAGER> <account>");
        }
        std::ostringstream out;
        out << "has_role=" << std::boolalpha << registry.hasRole(*role, request.params[1]);
        return RpcResponse::success(request.id, out.str());
    }) && ok;

    return ok;
}

} // namespace rpc
