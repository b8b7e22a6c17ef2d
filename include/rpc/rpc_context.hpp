#pragma once

#include <string>

namespace rpc {
struct RpcContext {
    std::string instanceName;
    std::string instanceAddress;
    std::string network;
};

[[nodiscard]] RpcContext buildDefaultContext();
} // namespace rpc
