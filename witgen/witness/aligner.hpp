// Copyright 2025 The Witgen Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <optional>
#include <vector>

#include <witgen/core/common/bytes.hpp>
#include <witgen/witness/errors.hpp>
#include <witgen/witness/proof.hpp>
#include <witgen/witness/row.hpp>

namespace witgen::witness {

enum class AlignmentState {
    kInSync,
    kBeforeExhausted,  // Before chain stopped while the after chain goes on (branch or extension added)
    kAfterExhausted,   // After chain stopped while the before chain goes on (branch or extension removed)
};

enum class StepKind {
    kBranch,
    kExtension,
};

//! \brief A pair of nodes at the same key position
//! \remarks A placeholder side holds the counterpart's bytes
struct AlignedStep {
    StepKind kind{StepKind::kBranch};
    ByteView before;
    ByteView after;
    uint8_t flags{0};     // Placeholder bits
    size_t position{0};   // Key nibble position the node sits at
};

enum class TerminalKind {
    kNone,                 // Chain ends at a nil slot or is empty
    kTargetLeaf,           // Leaf holding the key
    kForeignLeaf,          // Leaf holding another key
    kMismatchedExtension,  // Extension leading away from the key
};

struct Terminal {
    TerminalKind kind{TerminalKind::kNone};
    ByteView node;
    size_t position{0};

    bool is_leaf() const noexcept { return kind == TerminalKind::kTargetLeaf || kind == TerminalKind::kForeignLeaf; }
};

//! \brief A leaf or an extension that an added branch pushed down, or a removed one pulled up
struct DriftedNode {
    Side side{Side::kBefore};  // Side holding the node at its old depth
    Bytes moved;               // The node rebuilt with its new partial path, empty when an extension dissolved
    bool is_leaf{true};
    uint8_t slot{0};           // Nibble of the node in its new parent branch
};

class AlignedPath {
  public:
    AlignmentState state() const noexcept { return state_; }
    const std::vector<AlignedStep>& steps() const noexcept { return steps_; }
    const Terminal& terminal(Side side) const noexcept { return terminals_[side == Side::kBefore ? 0 : 1]; }
    const std::optional<DriftedNode>& drifted() const noexcept { return drifted_; }

    //! \brief Nodes of one side, depth by depth, placeholders and a missing terminal filled with the counterpart
    //! \details Both sides have the same length
    ChainView chain(Side side) const;

  private:
    friend tl::expected<AlignedPath, WitnessError> align(const ProofChain&, const ProofChain&, ByteView);

    AlignmentState state_{AlignmentState::kInSync};
    std::vector<AlignedStep> steps_;
    std::array<Terminal, 2> terminals_;
    std::optional<DriftedNode> drifted_;
};

//! \brief Walks the before and after proofs of one key top-down, pairing nodes at equal key positions
//! \details A node continues along the key when it is a branch or an extension whose path matches the key.
//! Where only one chain continues, the other gets a placeholder mirroring the continuing node.
//! \param key expanded key nibbles
//! \remarks The returned path refers to the bytes of both chains
tl::expected<AlignedPath, WitnessError> align(const ProofChain& before, const ProofChain& after, ByteView key);

}  // namespace witgen::witness
