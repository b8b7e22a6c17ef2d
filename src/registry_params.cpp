#include "registry_params.hpp"

namespace registry_params {
RegistryParams defaultRegistryParams() {
    return RegistryParams{};
}
} // namespace registry_params
