#include "config/deploy_manifest.hpp"

#include "utils/number_parse.hpp"

#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace config {
namespace {
std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(" \t\r");
    return value.substr(first, last - first + 1);
}

[[noreturn]] void failLine(std::size_t lineNumber, const std::string& reason) {
    throw std::invalid_argument("Manifeste invalide (ligne " + std::to_string(lineNumber) + "): " + reason);
}

std::uint64_t parseLimit(const std::string& raw, std::size_t lineNumber) {
    const auto value = parseUnsigned(raw);
    if (!value) {
        failLine(lineNumber, "loop_limit doit etre un entier positif ou nul");
    }
    return *value;
}
} // namespace

DeployManifest parseDeployManifest(const std::string& text) {
    DeployManifest manifest;
    std::istringstream in(text);
    std::string line;
    std::size_t lineNumber = 0;

    while (std::getline(in, line)) {
        ++lineNumber;
        const std::string content = trim(line);
        if (content.empty() || content[0] == '#') {
            continue;
        }

        const auto separator = content.find('=');
        if (separator == std::string::npos) {
            failLine(lineNumber, "cle=valeur attendu");
        }
        const std::string key = trim(content.substr(0, separator));
        const std::string value = trim(content.substr(separator + 1));

        if (key == "loop_limit") {
            if (manifest.loopLimit) {
                failLine(lineNumber, "loop_limit defini deux fois");
            }
            manifest.loopLimit = parseLimit(value, lineNumber);
            continue;
        }

        if (key == "code") {
            if (value.empty()) {
                failLine(lineNumber, "adresse de code manquante");
            }
            manifest.codeAddresses.push_back(value);
            continue;
        }

        if (key == "contract") {
            const auto pipe = value.find('|');
            if (pipe == std::string::npos) {
                failLine(lineNumber, "contract=<adresse>|<description> attendu");
            }
            const std::string contractAddress = trim(value.substr(0, pipe));
            if (contractAddress.empty()) {
                failLine(lineNumber, "adresse de contrat manquante");
            }
            manifest.contractAddresses.push_back(contractAddress);
            manifest.descriptions.push_back(value.substr(pipe + 1));
            continue;
        }

        failLine(lineNumber, "cle inconnue " + key);
    }

    return manifest;
}

DeployManifest loadDeployManifest(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("Impossible d'ouvrir le manifeste " + path + ".");
    }
    const std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return parseDeployManifest(text);
}

} // namespace config
