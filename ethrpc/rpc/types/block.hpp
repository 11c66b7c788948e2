// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <iostream>
#include <memory>
#include <string>

#include <ethrpc/core/types/block.hpp>

namespace ethrpc::rpc {

struct Block {
    std::shared_ptr<const BlockWithHash> block_with_hash{nullptr};
    bool full_tx{false};

    //! Length of the block RLP encoding in bytes
    uint64_t get_block_size() const;

    std::string to_string() const;
};

std::ostream& operator<<(std::ostream& out, const Block& b);

//! Ommer header presented as a block with no transactions
struct Uncle {
    BlockHeader header;
};

}  // namespace ethrpc::rpc
