#pragma once

#include "rpc/rpc_context.hpp"
#include "rpc/rpc_dispatcher.hpp"
#include "rpc/rpc_types.hpp"
#include "utils/logger.hpp"

#include <optional>
#include <string>
#include <vector>

namespace rpc {

class RpcServer {
public:
    RpcServer(RpcContext context, RpcDispatcher dispatcher, Logger* logger = nullptr);

    [[nodiscard]] const RpcContext& context() const;
    [[nodiscard]] RpcResponse handle(const RpcRequest& request) const;

    // Request from command-line words: <method> [params...].
    [[nodiscard]] static std::optional<RpcRequest> parseRequest(int id,
                                                                const std::string& caller,
                                                                const std::vector<std::string>& words);
    [[nodiscard]] static std::string formatResponse(const RpcResponse& response);

private:
    RpcContext context_;
    RpcDispatcher dispatcher_;
    Logger* logger_ = nullptr;
};

} // namespace rpc
