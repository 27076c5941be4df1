// Copyright 2025 The Witgen Authors
// SPDX-License-Identifier: Apache-2.0

#include "json.hpp"

#include <cctype>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

#include <magic_enum.hpp>

#include <witgen/core/common/util.hpp>
#include <witgen/core/types/address.hpp>
#include <witgen/core/types/evmc_bytes32.hpp>

namespace witgen::witness {

namespace {

    // Wire names are the enumerator names in lower camel case: kStorageWrite -> "storageWrite"
    std::string kind_name(ModificationKind kind) {
        std::string name{magic_enum::enum_name(kind).substr(1)};
        name[0] = static_cast<char>(std::tolower(static_cast<unsigned char>(name[0])));
        return name;
    }

    ModificationKind kind_from_name(std::string_view name) {
        for (const ModificationKind kind : magic_enum::enum_values<ModificationKind>()) {
            if (kind_name(kind) == name) {
                return kind;
            }
        }
        throw std::invalid_argument{"unknown modification kind: " + std::string{name}};
    }

    Bytes bytes_from_json(const nlohmann::json& json) {
        const auto hex{json.get<std::string>()};
        auto bytes{from_hex(hex)};
        if (!bytes) {
            throw std::invalid_argument{"invalid hex string: " + abridge(hex, 32)};
        }
        return std::move(*bytes);
    }

    evmc::bytes32 bytes32_from_json(const nlohmann::json& json) {
        const Bytes bytes{bytes_from_json(json)};
        if (bytes.size() > kHashLength) {
            throw std::invalid_argument{"hex string longer than 32 bytes"};
        }
        return to_bytes32(bytes);
    }

    ProofChain chain_from_json(const nlohmann::json& json) {
        ProofChain chain;
        for (const auto& node : json) {
            chain.push_back(bytes_from_json(node));
        }
        return chain;
    }

    nlohmann::json chain_to_json(const ProofChain& chain) {
        nlohmann::json json = nlohmann::json::array();
        for (const auto& node : chain) {
            json.push_back(to_hex(node, /*with_prefix=*/true));
        }
        return json;
    }

}  // namespace

void to_json(nlohmann::json& json, const WitnessRow& row) {
    json = nlohmann::json::array();
    for (const auto b : row.bytes()) {
        json.push_back(b);
    }
}

void to_json(nlohmann::json& json, const WitnessMatrix& matrix) {
    json = nlohmann::json::array();
    for (const auto& row : matrix) {
        json.push_back(row);
    }
}

void to_json(nlohmann::json& json, const Modification& modification) {
    if (modification.kind) {
        json["kind"] = kind_name(*modification.kind);
    }
    json["address"] = address_to_hex(modification.address);
    if (modification.key) {
        json["key"] = to_hex(*modification.key, /*with_prefix=*/true);
    }
    if (modification.value) {
        json["value"] = to_hex(*modification.value, /*with_prefix=*/true);
    }
    if (modification.nonce) {
        json["nonce"] = *modification.nonce;
    }
    if (modification.balance) {
        json["balance"] = "0x" + intx::hex(*modification.balance);
    }
}

void from_json(const nlohmann::json& json, Modification& modification) {
    if (json.count("kind") != 0) {
        modification.kind = kind_from_name(json.at("kind").get<std::string>());
    }
    const auto address{hex_to_address(json.at("address").get<std::string>())};
    if (!address) {
        throw std::invalid_argument{"invalid address"};
    }
    modification.address = *address;
    if (json.count("key") != 0) {
        modification.key = bytes32_from_json(json.at("key"));
    }
    if (json.count("value") != 0) {
        modification.value = bytes32_from_json(json.at("value"));
    }
    if (json.count("nonce") != 0) {
        const auto& nonce{json.at("nonce")};
        if (nonce.is_string()) {
            const auto value{intx::from_string<intx::uint256>(nonce.get<std::string>())};
            if (value > intx::uint256{std::numeric_limits<uint64_t>::max()}) {
                throw std::invalid_argument{"nonce exceeds 64 bits"};
            }
            modification.nonce = static_cast<uint64_t>(value);
        } else {
            modification.nonce = nonce.get<uint64_t>();
        }
    }
    if (json.count("balance") != 0) {
        const auto& balance{json.at("balance")};
        if (balance.is_string()) {
            modification.balance = intx::from_string<intx::uint256>(balance.get<std::string>());
        } else {
            modification.balance = intx::uint256{balance.get<uint64_t>()};
        }
    }
}

void to_json(nlohmann::json& json, const ProofPair& pair) {
    json["before"] = chain_to_json(pair.before);
    json["after"] = chain_to_json(pair.after);
}

void from_json(const nlohmann::json& json, ProofPair& pair) {
    pair.before = chain_from_json(json.at("before"));
    pair.after = chain_from_json(json.at("after"));
}

void to_json(nlohmann::json& json, const WitnessInput& input) {
    json["modification"] = input.modification;
    json["accountProof"] = input.account_proof;
    if (input.storage_proof) {
        json["storageProof"] = *input.storage_proof;
    }
}

void from_json(const nlohmann::json& json, WitnessInput& input) {
    input.modification = json.at("modification").get<Modification>();
    input.account_proof = json.at("accountProof").get<ProofPair>();
    if (json.count("storageProof") != 0) {
        input.storage_proof = json.at("storageProof").get<ProofPair>();
    }
}

std::vector<WitnessInput> inputs_from_json(const nlohmann::json& json) {
    if (json.count("modifications") == 0) {
        return {json.get<WitnessInput>()};
    }
    const auto& modifications{json.at("modifications")};
    if (!modifications.is_array()) {
        throw std::invalid_argument{"modifications is not an array"};
    }
    return modifications.get<std::vector<WitnessInput>>();
}

}  // namespace witgen::witness
