#pragma once

#include "registry_errors.hpp"

#include <optional>
#include <string>
#include <vector>

namespace rpc {

enum class RpcErrorCode {
    InvalidRequest = -32600,
    MethodNotFound = -32601,
    InvalidParams = -32602,
    InternalError = -32603,
    Unauthorized = -32010,
    ZeroAddressNotAllowed = -32011,
    NonContractAddress = -32012,
    ContractAlreadyExists = -32013,
    NotFound = -32014,
    ArrayLengthMismatch = -32015,
    LoopLimitExceeded = -32016
};

struct RpcError {
    RpcErrorCode code;
    std::string message;
};

struct RpcRequest {
    int id = 0;
    std::string method;
    // Account the call is made as; read-only methods ignore it.
    std::string caller;
    std::vector<std::string> params;

    [[nodiscard]] bool isValid() const;
};

struct RpcResponse {
    int id = 0;
    std::string result;
    std::optional<RpcError> error;

    [[nodiscard]] bool hasError() const;

    static RpcResponse success(int id, std::string result);
    static RpcResponse failure(int id, RpcErrorCode code, std::string message);
};

[[nodiscard]] std::string toString(RpcErrorCode code);
[[nodiscard]] RpcErrorCode fromRegistryError(RegistryErrorCode code);

} // namespace rpc
