#include "rpc/rpc_server.hpp"

#include <sstream>

namespace rpc {

RpcServer::RpcServer(RpcContext context, RpcDispatcher dispatcher, Logger* logger)
    : context_(std::move(context)), dispatcher_(std::move(dispatcher)), logger_(logger) {}

const RpcContext& RpcServer::context() const {
    return context_;
}

RpcResponse RpcServer::handle(const RpcRequest& request) const {
    RpcResponse response = dispatcher_.dispatch(request, context_);
    if (logger_ != nullptr) {
        if (response.hasError()) {
            logger_->warning("rpc", request.method + " failed: " + toString(response.error->code));
        } else {
            logger_->debug("rpc", request.method + " ok");
        }
    }
    return response;
}

std::optional<RpcRequest> RpcServer::parseRequest(int id,
                                                  const std::string& caller,
                                                  const std::vector<std::string>& words) {
    if (words.empty() || words.front().empty()) {
        return std::nullopt;
    }

    RpcRequest request;
    request.id = id;
    request.method = words.front();
    request.caller = caller;
    request.params.assign(words.begin() + 1, words.end());
    return request;
}

std::string RpcServer::formatResponse(const RpcResponse& response) {
    std::ostringstream out;
    out << "id=" << response.id;
    if (response.hasError()) {
        out << " error=" << static_cast<int>(response.error->code) << " reason=" << toString(response.error->code)
            << " message=" << response.error->message;
    } else {
        out << " result=" << response.result;
    }
    return out.str();
}

} // namespace rpc
