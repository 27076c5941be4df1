// Copyright 2025 The Witgen Authors
// SPDX-License-Identifier: Apache-2.0

#include "builder.hpp"

#include <string>

#include <magic_enum.hpp>

#include <witgen/core/common/empty_hashes.hpp>
#include <witgen/core/common/util.hpp>
#include <witgen/core/rlp/encode.hpp>
#include <witgen/core/trie/node.hpp>
#include <witgen/infra/common/log.hpp>
#include <witgen/witness/account_bridge.hpp>
#include <witgen/witness/branch_encoder.hpp>
#include <witgen/witness/short_node_encoder.hpp>
#include <witgen/witness/verifier.hpp>

namespace witgen::witness {

namespace {

    uint8_t foreign_flag(const Terminal& terminal) {
        return terminal.kind == TerminalKind::kForeignLeaf ? kFlagForeignLeaf : uint8_t{0};
    }

    WitnessResult encode_storage_leaf_rows(const AlignedPath& path, WitnessMatrix& matrix) {
        for (const Side side : {Side::kBefore, Side::kAfter}) {
            const Terminal& own{path.terminal(side)};
            const Terminal& other{path.terminal(other_side(side))};
            if (own.is_leaf()) {
                const auto rows{encode_leaf(own.node, side, foreign_flag(own))};
                if (!rows) {
                    return tl::unexpected{rows.error()};
                }
                matrix.append(*rows);
            } else if (other.is_leaf()) {
                const auto flags{static_cast<uint8_t>(placeholder_flag(side) | foreign_flag(other))};
                const auto rows{encode_leaf(other.node, side, flags)};
                if (!rows) {
                    return tl::unexpected{rows.error()};
                }
                matrix.append(*rows);
            } else {
                matrix.append(empty_leaf_rows(side, placeholder_flag(side)));
            }
        }
        return {};
    }

    WitnessResult encode_account_leaf_rows(const AlignedPath& path, ByteView key, WitnessMatrix& matrix) {
        for (const Side side : {Side::kBefore, Side::kAfter}) {
            const Terminal& own{path.terminal(side)};
            const Bytes placeholder{own.is_leaf() ? Bytes{} : empty_account_leaf(key, own.position)};
            const auto rows{own.is_leaf() ? encode_account_leaf(own.node, side, foreign_flag(own))
                                          : encode_account_leaf(placeholder, side, placeholder_flag(side))};
            if (!rows) {
                return tl::unexpected{rows.error()};
            }
            matrix.append(*rows);
        }
        return {};
    }

    // The account a side holds, if the proof reaches its leaf
    tl::expected<std::optional<Account>, WitnessError> target_account(const AlignedPath& path, Side side) {
        const Terminal& terminal{path.terminal(side)};
        if (terminal.kind != TerminalKind::kTargetLeaf) {
            return std::nullopt;
        }
        const auto account{leaf_account(terminal.node)};
        if (!account) {
            return tl::unexpected{account.error()};
        }
        return *account;
    }

    WitnessResult check_storage_write(const Modification& modification, const AlignedPath& storage) {
        const Terminal& after{storage.terminal(Side::kAfter)};
        const ByteView value{zeroless_view(modification.value->bytes)};
        if (value.empty()) {
            if (after.kind == TerminalKind::kTargetLeaf) {
                return tl::unexpected{WitnessError::kModificationMismatch};
            }
            return {};
        }
        if (after.kind != TerminalKind::kTargetLeaf) {
            return tl::unexpected{WitnessError::kModificationMismatch};
        }
        const auto node{trie::decode_node(after.node)};
        if (!node) {
            return malformed(node.error());
        }
        Bytes expected;
        rlp::encode(expected, value);
        if (std::get<trie::LeafNode>(*node).value != ByteView{expected}) {
            return tl::unexpected{WitnessError::kModificationMismatch};
        }
        return {};
    }

    WitnessResult check_account_write(const Modification& modification, const std::optional<Account>& before,
                                      const std::optional<Account>& after) {
        if (!after) {
            return tl::unexpected{WitnessError::kModificationMismatch};
        }
        Account expected{before.value_or(Account{})};
        if (modification.nonce) {
            expected.nonce = *modification.nonce;
        }
        if (modification.balance) {
            expected.balance = *modification.balance;
        }
        if (*after != expected) {
            return tl::unexpected{WitnessError::kModificationMismatch};
        }
        return {};
    }

    WitnessResult check_modification(const WitnessInput& input, const AlignedPath& account,
                                     const AlignedPath* storage) {
        const auto before{target_account(account, Side::kBefore)};
        if (!before) {
            return tl::unexpected{before.error()};
        }
        const auto after{target_account(account, Side::kAfter)};
        if (!after) {
            return tl::unexpected{after.error()};
        }

        const Modification& modification{input.modification};
        switch (*modification.kind) {
            case ModificationKind::kStorageWrite:
                return check_storage_write(modification, *storage);
            case ModificationKind::kNonceWrite:
            case ModificationKind::kBalanceWrite:
                return check_account_write(modification, *before, *after);
            case ModificationKind::kCreateAccount:
                if (before->has_value() || !after->has_value()) {
                    return tl::unexpected{WitnessError::kModificationMismatch};
                }
                return {};
            case ModificationKind::kDeleteAccount:
                if (!before->has_value() || after->has_value()) {
                    return tl::unexpected{WitnessError::kModificationMismatch};
                }
                return {};
            case ModificationKind::kNonExistentAccountProbe:
                if (input.account_proof.before != input.account_proof.after) {
                    return tl::unexpected{WitnessError::kModificationMismatch};
                }
                return verify_exclusion(view_of(input.account_proof.before), modification.account_path());
        }
        return tl::unexpected{WitnessError::kUnsupportedModificationKind};
    }

    evmc::bytes32 state_root(const ProofChain& account_proof) {
        return account_proof.empty() ? kEmptyRoot : trie::node_hash(account_proof.front());
    }

    WitnessResult verify_chains(const ProofPair& pair, ByteView key) {
        if (WitnessResult res{verify_hash_chain(view_of(pair.before), key)}; !res) {
            return res;
        }
        return verify_hash_chain(view_of(pair.after), key);
    }

}  // namespace

WitnessInput collect_input(const ProofSource& before, const ProofSource& after, const Modification& modification) {
    WitnessInput input{.modification = modification};
    input.account_proof.before = before.account_proof(modification.address);
    input.account_proof.after = after.account_proof(modification.address);
    if (modification.is_storage_write() && modification.key) {
        input.storage_proof = ProofPair{
            .before = before.storage_proof(modification.address, *modification.key),
            .after = after.storage_proof(modification.address, *modification.key),
        };
    }
    return input;
}

WitnessResult encode_path_blocks(const AlignedPath& path, ByteView key, WitnessMatrix& matrix) {
    for (const auto& step : path.steps()) {
        const auto position{static_cast<uint8_t>(step.position)};
        if (step.kind == StepKind::kBranch) {
            const auto block{encode_branch_pair(step.before, step.after, key[step.position], step.flags)};
            if (!block) {
                return tl::unexpected{block.error()};
            }
            matrix.append(*block);
        } else {
            const auto block{encode_extension_pair(step.before, step.after, position, step.flags)};
            if (!block) {
                return tl::unexpected{block.error()};
            }
            matrix.append(*block);
        }
    }

    const Terminal& before{path.terminal(Side::kBefore)};
    const Terminal& after{path.terminal(Side::kAfter)};
    const bool before_ext{before.kind == TerminalKind::kMismatchedExtension};
    const bool after_ext{after.kind == TerminalKind::kMismatchedExtension};
    if (before_ext || after_ext) {
        const uint8_t flags{static_cast<uint8_t>((before_ext ? 0 : kFlagBeforePlaceholder) |
                                                 (after_ext ? 0 : kFlagAfterPlaceholder))};
        const auto position{static_cast<uint8_t>(before_ext ? before.position : after.position)};
        const auto block{encode_extension_pair(before_ext ? before.node : after.node,
                                               after_ext ? after.node : before.node, position, flags)};
        if (!block) {
            return tl::unexpected{block.error()};
        }
        matrix.append(*block);
    }
    return {};
}

WitnessResult encode_drifted_row(const AlignedPath& path, WitnessMatrix& matrix) {
    const auto& drifted{path.drifted()};
    if (!drifted) {
        return {};
    }
    const auto row{encode_drifted(drifted->moved, drifted->is_leaf, drifted->slot, placeholder_flag(drifted->side))};
    if (!row) {
        return tl::unexpected{row.error()};
    }
    matrix.append(*row);
    return {};
}

tl::expected<WitnessMatrix, WitnessError> generate_witness(const WitnessInput& input) {
    const Modification& modification{input.modification};
    if (WitnessResult res{modification.validate()}; !res) {
        return tl::unexpected{res.error()};
    }
    if (input.storage_proof.has_value() != modification.is_storage_write()) {
        return tl::unexpected{WitnessError::kUnsupportedModificationKind};
    }

    WitnessMatrix matrix;

    const Bytes account_key{modification.account_path()};
    if (WitnessResult res{verify_chains(input.account_proof, account_key)}; !res) {
        return tl::unexpected{res.error()};
    }
    const auto account_path{align(input.account_proof.before, input.account_proof.after, account_key)};
    if (!account_path) {
        return tl::unexpected{account_path.error()};
    }
    if (WitnessResult res{encode_path_blocks(*account_path, account_key, matrix)}; !res) {
        return tl::unexpected{res.error()};
    }
    if (WitnessResult res{encode_account_leaf_rows(*account_path, account_key, matrix)}; !res) {
        return tl::unexpected{res.error()};
    }
    if (WitnessResult res{encode_drifted_row(*account_path, matrix)}; !res) {
        return tl::unexpected{res.error()};
    }

    std::optional<AlignedPath> storage_path;
    if (input.storage_proof) {
        const auto before_account{target_account(*account_path, Side::kBefore)};
        if (!before_account) {
            return tl::unexpected{before_account.error()};
        }
        const auto after_account{target_account(*account_path, Side::kAfter)};
        if (!after_account) {
            return tl::unexpected{after_account.error()};
        }
        const auto bridge{encode_storage_bridge(before_account->value_or(Account{}),
                                                after_account->value_or(Account{}), input.storage_proof->before,
                                                input.storage_proof->after)};
        if (!bridge) {
            return tl::unexpected{bridge.error()};
        }
        matrix.append(*bridge);

        const Bytes storage_key{modification.storage_path()};
        if (WitnessResult res{verify_chains(*input.storage_proof, storage_key)}; !res) {
            return tl::unexpected{res.error()};
        }
        auto aligned{align(input.storage_proof->before, input.storage_proof->after, storage_key)};
        if (!aligned) {
            return tl::unexpected{aligned.error()};
        }
        storage_path = std::move(*aligned);
        if (WitnessResult res{encode_path_blocks(*storage_path, storage_key, matrix)}; !res) {
            return tl::unexpected{res.error()};
        }
        if (WitnessResult res{encode_storage_leaf_rows(*storage_path, matrix)}; !res) {
            return tl::unexpected{res.error()};
        }
        if (WitnessResult res{encode_drifted_row(*storage_path, matrix)}; !res) {
            return tl::unexpected{res.error()};
        }
    }

    if (WitnessResult res{check_modification(input, *account_path, storage_path ? &*storage_path : nullptr)};
        !res) {
        return tl::unexpected{res.error()};
    }

    WITGEN_DEBUG_M("Witness generated", {"kind", std::string{magic_enum::enum_name(*modification.kind)},
                                         "rows", std::to_string(matrix.size()),
                                         "account", std::string{magic_enum::enum_name(account_path->state())}});
    return matrix;
}

tl::expected<WitnessMatrix, WitnessError> generate_witness(std::span<const WitnessInput> inputs) {
    WitnessMatrix matrix;
    for (size_t i{0}; i < inputs.size(); ++i) {
        if (i > 0 && state_root(inputs[i].account_proof.before) != state_root(inputs[i - 1].account_proof.after)) {
            WITGEN_DEBUG_M("Modification does not follow the previous one", {"index", std::to_string(i)});
            return tl::unexpected{WitnessError::kBrokenHashChain};
        }
        const auto rows{generate_witness(inputs[i])};
        if (!rows) {
            return tl::unexpected{rows.error()};
        }
        matrix.append(*rows);
    }
    return matrix;
}

}  // namespace witgen::witness
