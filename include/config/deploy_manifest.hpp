#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace config {

// Text manifest read by the deployment tool:
//   # comment
//   loop_limit=100
//   code=0x...                  address holding code in the simulated host
//   contract=0x...|description  initial data set, kept in file order
struct DeployManifest {
    std::optional<std::uint64_t> loopLimit;
    std::vector<std::string> codeAddresses;
    std::vector<std::string> contractAddresses;
    std::vector<std::string> descriptions;
};

[[nodiscard]] DeployManifest parseDeployManifest(const std::string& text);
[[nodiscard]] DeployManifest loadDeployManifest(const std::string& path);

} // namespace config
