// Copyright 2025 The Witgen Authors
// SPDX-License-Identifier: Apache-2.0

#include "proof.hpp"

namespace witgen::witness {

ChainView view_of(const ProofChain& chain) {
    ChainView view;
    view.reserve(chain.size());
    for (const auto& node : chain) {
        view.emplace_back(node);
    }
    return view;
}

}  // namespace witgen::witness
