#include "storage/registry_store.hpp"

#include "utils/number_parse.hpp"

#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string_view>

namespace {
constexpr const char* kMagic = "CRG1";
constexpr std::uint64_t kFormatVersion = 1;

void require(bool condition, const std::string& message) {
    if (!condition) {
        throw std::runtime_error(message);
    }
}

void appendField(std::string& out, const std::string& field) {
    out += std::to_string(field.size());
    out += ':';
    out += field;
}

bool readField(std::string_view payload, std::size_t& offset, std::string& out) {
    const std::size_t separator = payload.find(':', offset);
    if (separator == std::string_view::npos) {
        return false;
    }
    if (separator == offset) {
        return false;
    }

    const auto parsedLength = parseUnsigned(payload.substr(offset, separator - offset));
    if (!parsedLength || *parsedLength > payload.size()) {
        return false;
    }
    const auto length = static_cast<std::size_t>(*parsedLength);

    const std::size_t start = separator + 1;
    if (start + length > payload.size()) {
        return false;
    }

    out.assign(payload.substr(start, length));
    offset = start + length;
    return true;
}

std::string encodeNumber(std::uint64_t value) {
    return std::to_string(value);
}

std::optional<std::uint64_t> readNumber(std::string_view payload, std::size_t& offset) {
    std::string field;
    if (!readField(payload, offset, field)) {
        return std::nullopt;
    }
    return parseUnsigned(field);
}

void appendList(std::string& out, const std::vector<std::string>& values) {
    appendField(out, encodeNumber(values.size()));
    for (const auto& value : values) {
        appendField(out, value);
    }
}

bool readList(std::string_view payload, std::size_t& offset, std::vector<std::string>& out) {
    const auto count = readNumber(payload, offset);
    if (!count) {
        return false;
    }

    out.clear();
    for (std::uint64_t i = 0; i < *count; ++i) {
        std::string value;
        if (!readField(payload, offset, value)) {
            return false;
        }
        out.push_back(std::move(value));
    }
    return true;
}
} // namespace

std::string RegistryStoreCodec::encodeEntry(const std::string& contractAddress, const ContractEntry& entry) {
    std::string out;
    appendField(out, contractAddress);
    appendField(out, entry.description);
    appendField(out, entry.exists ? "1" : "0");
    return out;
}

std::optional<std::pair<std::string, ContractEntry>> RegistryStoreCodec::decodeEntry(const std::string& payload) {
    std::size_t offset = 0;
    std::string contractAddress;
    ContractEntry entry;
    std::string flag;

    if (!readField(payload, offset, contractAddress) || contractAddress.empty()) {
        return std::nullopt;
    }
    if (!readField(payload, offset, entry.description)) {
        return std::nullopt;
    }
    if (!readField(payload, offset, flag) || (flag != "0" && flag != "1")) {
        return std::nullopt;
    }
    entry.exists = flag == "1";

    if (offset != payload.size()) {
        return std::nullopt;
    }

    return std::make_pair(std::move(contractAddress), std::move(entry));
}

std::string RegistryStoreCodec::encodeState(const RegistryState& state) {
    std::string out;
    appendField(out, encodeNumber(state.loopLimit));

    appendField(out, encodeNumber(state.entries.size()));
    for (const auto& item : state.entries) {
        appendField(out, encodeEntry(item.first, item.second));
    }

    appendList(out, state.admins);
    appendList(out, state.managers);
    return out;
}

std::optional<RegistryState> RegistryStoreCodec::decodeState(const std::string& payload) {
    std::size_t offset = 0;
    std::string_view view(payload);
    RegistryState state;

    const auto loopLimit = readNumber(view, offset);
    if (!loopLimit) {
        return std::nullopt;
    }
    state.loopLimit = *loopLimit;

    const auto entryCount = readNumber(view, offset);
    if (!entryCount) {
        return std::nullopt;
    }
    for (std::uint64_t i = 0; i < *entryCount; ++i) {
        std::string field;
        if (!readField(view, offset, field)) {
            return std::nullopt;
        }
        auto entry = decodeEntry(field);
        if (!entry) {
            return std::nullopt;
        }
        state.entries.push_back(std::move(*entry));
    }

    if (!readList(view, offset, state.admins) || !readList(view, offset, state.managers)) {
        return std::nullopt;
    }

    if (offset != payload.size()) {
        return std::nullopt;
    }

    return state;
}

std::string RegistryStoreCodec::encodeRecord(const DeploymentRecord& record) {
    std::string out;
    appendField(out, kMagic);
    appendField(out, encodeNumber(kFormatVersion));
    appendField(out, record.instanceAddress);
    appendField(out, record.deployer);
    appendField(out, record.network);
    appendList(out, record.codeAddresses);
    appendField(out, encodeState(record.registry));
    return out;
}

std::optional<DeploymentRecord> RegistryStoreCodec::decodeRecord(const std::string& payload) {
    std::size_t offset = 0;
    std::string_view view(payload);
    std::string field;
    DeploymentRecord record;

    if (!readField(view, offset, field) || field != kMagic) {
        return std::nullopt;
    }
    const auto version = readNumber(view, offset);
    if (!version || *version != kFormatVersion) {
        return std::nullopt;
    }

    if (!readField(view, offset, record.instanceAddress) || !readField(view, offset, record.deployer) ||
        !readField(view, offset, record.network)) {
        return std::nullopt;
    }

    if (!readList(view, offset, record.codeAddresses)) {
        return std::nullopt;
    }

    if (!readField(view, offset, field)) {
        return std::nullopt;
    }
    auto state = decodeState(field);
    if (!state) {
        return std::nullopt;
    }
    record.registry = std::move(*state);

    if (offset != payload.size()) {
        return std::nullopt;
    }

    return record;
}

void RegistryStore::save(const std::string& path, const DeploymentRecord& record) {
    const std::string payload = RegistryStoreCodec::encodeRecord(record);
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    require(out.is_open(), "Impossible d'ecrire le fichier d'etat " + path + ".");
    out.write(payload.data(), static_cast<std::streamsize>(payload.size()));
    require(static_cast<bool>(out), "Ecriture incomplete du fichier d'etat " + path + ".");
}

DeploymentRecord RegistryStore::load(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    require(in.is_open(), "Impossible d'ouvrir le fichier d'etat " + path + ".");
    const std::string payload((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    auto record = RegistryStoreCodec::decodeRecord(payload);
    require(record.has_value(), "Fichier d'etat invalide: " + path + ".");
    return std::move(*record);
}

bool RegistryStore::exists(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return in.is_open();
}
