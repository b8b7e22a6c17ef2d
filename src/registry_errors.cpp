#include "registry_errors.hpp"

#include <utility>

RegistryError::RegistryError(RegistryErrorCode code, const std::string& message, std::string subject,
                             std::string missingRole)
    : std::runtime_error(message), code_(code), subject_(std::move(subject)), missingRole_(std::move(missingRole)) {}

RegistryErrorCode RegistryError::code() const {
    return code_;
}

const std::string& RegistryError::subject() const {
    return subject_;
}

const std::string& RegistryError::missingRole() const {
    return missingRole_;
}

std::string toString(RegistryErrorCode code) {
    switch (code) {
    case RegistryErrorCode::Unauthorized:
        return "unauthorized";
    case RegistryErrorCode::ZeroAddressNotAllowed:
        return "zero_address_not_allowed";
    case RegistryErrorCode::NonContractAddress:
        return "non_contract_address";
    case RegistryErrorCode::ContractAlreadyExists:
        return "contract_already_exists";
    case RegistryErrorCode::NotFound:
        return "not_found";
    case RegistryErrorCode::ArrayLengthMismatch:
        return "array_length_mismatch";
    case RegistryErrorCode::LoopLimitExceeded:
        return "loop_limit_exceeded";
    }

    return "unknown_error";
}
