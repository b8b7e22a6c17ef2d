#pragma once

#include <cstddef>
#include <cstdint>

namespace registry_params {
inline constexpr std::uint64_t kDefaultLoopLimit = 100;
inline constexpr std::size_t kEventLogCapacity = 1'000;
inline constexpr std::size_t kLoggerCapacity = 500;
inline constexpr const char* kDefaultStateFile = "registry.dat";
inline constexpr const char* kDefaultNetwork = "localhost";
inline constexpr const char* kDefaultDeployer = "0xf39fd6e51aad88f6f4ce6ab8827279cfffb92266";

struct RegistryParams {
    std::uint64_t loopLimit = kDefaultLoopLimit;
    std::size_t eventLogCapacity = kEventLogCapacity;
    std::size_t loggerCapacity = kLoggerCapacity;
};

[[nodiscard]] RegistryParams defaultRegistryParams();
} // namespace registry_params
