#pragma once

#include "contract_registry.hpp"
#include "rpc/rpc_dispatcher.hpp"

#include <string>
#include <vector>

namespace rpc {

inline constexpr const char* kListSeparator = "--";

struct PairedParams {
    std::vector<std::string> addresses;
    std::vector<std::string> descriptions;
};

// "a1 a2 -- d1 d2"; without a separator every param is an address.
[[nodiscard]] PairedParams splitPairedParams(const std::vector<std::string>& params);

// The registry must outlive the dispatcher.
[[nodiscard]] bool registerRegistryHandlers(RpcDispatcher& dispatcher, ContractRegistry& registry);

} // namespace rpc
