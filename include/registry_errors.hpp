#pragma once

#include <stdexcept>
#include <string>

enum class RegistryErrorCode {
    Unauthorized,
    ZeroAddressNotAllowed,
    NonContractAddress,
    ContractAlreadyExists,
    NotFound,
    ArrayLengthMismatch,
    LoopLimitExceeded
};

class RegistryError : public std::runtime_error {
public:
    RegistryError(RegistryErrorCode code, const std::string& message, std::string subject = {},
                  std::string missingRole = {});

    [[nodiscard]] RegistryErrorCode code() const;
    // Offending address, or the caller account for Unauthorized.
    [[nodiscard]] const std::string& subject() const;
    [[nodiscard]] const std::string& missingRole() const;

private:
    RegistryErrorCode code_;
    std::string subject_;
    std::string missingRole_;
};

[[nodiscard]] std::string toString(RegistryErrorCode code);
