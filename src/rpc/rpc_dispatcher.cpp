#include "rpc/rpc_dispatcher.hpp"

#include <algorithm>
#include <array>
#include <sstream>
#include <string_view>

namespace rpc {
namespace {
constexpr const char* kRpcVersion = "1.0.0";

RpcResponse describeContext(const RpcRequest& request, const RpcContext& context) {
    std::ostringstream out;
    out << "instance_name=" << context.instanceName << " instance_address=" << context.instanceAddress
        << " network=" << context.network;
    return RpcResponse::success(request.id, out.str());
}

RpcResponse describeVersion(const RpcRequest& request, const RpcContext& context) {
    return RpcResponse::success(request.id, std::string("version=") + kRpcVersion + " instance_name=" +
                                                context.instanceName);
}

// rpc.listMethods needs the dispatcher itself and is answered in dispatch().
constexpr std::string_view kListMethods = "rpc.listMethods";

struct Builtin {
    std::string_view method;
    RpcResponse (*answer)(const RpcRequest&, const RpcContext&);
};

constexpr std::array<Builtin, 2> kBuiltins = {{
    {"rpc.context", &describeContext},
    {"rpc.version", &describeVersion},
}};

const Builtin* findBuiltin(std::string_view method) {
    const auto it = std::find_if(kBuiltins.begin(), kBuiltins.end(),
                                 [method](const Builtin& builtin) { return builtin.method == method; });
    return it == kBuiltins.end() ? nullptr : &*it;
}

bool isBuiltin(std::string_view method) {
    return method == kListMethods || findBuiltin(method) != nullptr;
}
} // namespace

bool RpcDispatcher::registerHandler(const std::string& method, RpcHandler handler) {
    if (method.empty() || !handler || isBuiltin(method)) {
        return false;
    }
    return handlers_.emplace(method, std::move(handler)).second;
}

bool RpcDispatcher::unregisterHandler(const std::string& method) {
    return handlers_.erase(method) > 0;
}

bool RpcDispatcher::hasHandler(const std::string& method) const {
    return handlers_.count(method) > 0;
}

RpcResponse RpcDispatcher::dispatch(const RpcRequest& request, const RpcContext& context) const {
    if (!request.isValid()) {
        return RpcResponse::failure(request.id, RpcErrorCode::InvalidRequest, "Invalid RPC request");
    }

    if (request.method == kListMethods) {
        std::ostringstream out;
        out << "methods=";
        const auto methods = listMethods();
        for (std::size_t i = 0; i < methods.size(); ++i) {
            out << (i == 0 ? "" : ", ") << methods[i];
        }
        return RpcResponse::success(request.id, out.str());
    }

    if (const Builtin* builtin = findBuiltin(request.method)) {
        return builtin->answer(request, context);
    }

    const auto handler = handlers_.find(request.method);
    if (handler == handlers_.end()) {
        return RpcResponse::failure(request.id, RpcErrorCode::MethodNotFound, "RPC method not found");
    }
    return handler->second(request, context);
}

std::vector<std::string> RpcDispatcher::listMethods() const {
    std::vector<std::string> methods{std::string(kListMethods)};
    for (const auto& builtin : kBuiltins) {
        methods.emplace_back(builtin.method);
    }
    for (const auto& entry : handlers_) {
        methods.push_back(entry.first);
    }
    std::sort(methods.begin(), methods.end());
    return methods;
}

} // namespace rpc
