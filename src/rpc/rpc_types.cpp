#include "rpc/rpc_types.hpp"

namespace rpc {

bool RpcRequest::isValid() const {
    return id >= 0 && !method.empty();
}

bool RpcResponse::hasError() const {
    return error.has_value();
}

RpcResponse RpcResponse::success(int id, std::string result) {
    RpcResponse response;
    response.id = id;
    response.result = std::move(result);
    response.error.reset();
    return response;
}

RpcResponse RpcResponse::failure(int id, RpcErrorCode code, std::string message) {
    RpcResponse response;
    response.id = id;
    response.result.clear();
    response.error = RpcError{code, std::move(message)};
    return response;
}

std::string toString(RpcErrorCode code) {
    switch (code) {
    case RpcErrorCode::InvalidRequest:
        return "invalid_request";
    case RpcErrorCode::MethodNotFound:
        return "method_not_found";
    case RpcErrorCode::InvalidParams:
        return "invalid_params";
    case RpcErrorCode::InternalError:
        return "internal_error";
    case RpcErrorCode::Unauthorized:
        return toString(RegistryErrorCode::Unauthorized);
    case RpcErrorCode::ZeroAddressNotAllowed:
        return toString(RegistryErrorCode::ZeroAddressNotAllowed);
    case RpcErrorCode::NonContractAddress:
        return toString(RegistryErrorCode::NonContractAddress);
    case RpcErrorCode::ContractAlreadyExists:
        return toString(RegistryErrorCode::ContractAlreadyExists);
    case RpcErrorCode::NotFound:
        return toString(RegistryErrorCode::NotFound);
    case RpcErrorCode::ArrayLengthMismatch:
        return toString(RegistryErrorCode::ArrayLengthMismatch);
    case RpcErrorCode::LoopLimitExceeded:
        return toString(RegistryErrorCode::LoopLimitExceeded);
    }

    return "unknown_error";
}

RpcErrorCode fromRegistryError(RegistryErrorCode code) {
    switch (code) {
    case RegistryErrorCode::Unauthorized:
        return RpcErrorCode::Unauthorized;
    case RegistryErrorCode::ZeroAddressNotAllowed:
        return RpcErrorCode::ZeroAddressNotAllowed;
    case RegistryErrorCode::NonContractAddress:
        return RpcErrorCode::NonContractAddress;
    case RegistryErrorCode::ContractAlreadyExists:
        return RpcErrorCode::ContractAlreadyExists;
    case RegistryErrorCode::NotFound:
        return RpcErrorCode::NotFound;
    case RegistryErrorCode::ArrayLengthMismatch:
        return RpcErrorCode::ArrayLengthMismatch;
    case RegistryErrorCode::LoopLimitExceeded:
        return RpcErrorCode::LoopLimitExceeded;
    }

    return RpcErrorCode::InternalError;
}

} // namespace rpc
