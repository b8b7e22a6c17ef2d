#include "rpc/rpc_context.hpp"

#include "registry_params.hpp"

namespace rpc {
RpcContext buildDefaultContext() {
    return RpcContext{"contract-registry", "", registry_params::kDefaultNetwork};
}
} // namespace rpc
