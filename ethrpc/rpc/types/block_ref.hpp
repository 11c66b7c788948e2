// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <iostream>
#include <string>
#include <string_view>
#include <variant>

#include <evmc/evmc.hpp>

#include <ethrpc/core/common/base.hpp>

namespace ethrpc::rpc {

inline constexpr std::string_view kEarliestBlockId{"earliest"};
inline constexpr std::string_view kLatestBlockId{"latest"};
inline constexpr std::string_view kPendingBlockId{"pending"};

enum class BlockTag {
    kEarliest,
    kLatest,
    kPending,
};

std::string_view to_string(BlockTag tag);

//! Client-supplied block identifier: an exact height, a block hash or a symbolic tag
class BlockRef {
  public:
    //! \brief Parses a string identifier: tag, hex quantity, decimal number or 32-byte hash
    //! \throws InvalidParamsError if the string is none of those
    explicit BlockRef(const std::string& block_ref) { parse(block_ref); }
    explicit BlockRef(BlockNum block_num) noexcept : value_{block_num} {}
    explicit BlockRef(const evmc::bytes32& block_hash, bool require_canonical = false) noexcept
        : value_{block_hash}, require_canonical_{require_canonical} {}
    explicit BlockRef(BlockTag tag) noexcept : value_{tag} {}

    static BlockRef latest() { return BlockRef{BlockTag::kLatest}; }

    bool is_number() const {
        return std::holds_alternative<BlockNum>(value_);
    }

    BlockNum number() const {
        return is_number() ? *std::get_if<BlockNum>(&value_) : 0;
    }

    bool is_hash() const {
        return std::holds_alternative<evmc::bytes32>(value_);
    }

    evmc::bytes32 hash() const {
        return is_hash() ? *std::get_if<evmc::bytes32>(&value_) : evmc::bytes32{0};
    }

    bool is_tag() const {
        return std::holds_alternative<BlockTag>(value_);
    }

    BlockTag tag() const {
        return is_tag() ? *std::get_if<BlockTag>(&value_) : BlockTag::kLatest;
    }

    bool is_pending() const { return is_tag() && tag() == BlockTag::kPending; }

    //! \brief EIP-1898 requireCanonical flag as sent by the client
    //! \details Informational only: BlockReader resolves every hash against the canonical chain, whatever the flag
    bool require_canonical() const { return require_canonical_; }

    std::string to_string() const;

    friend bool operator==(const BlockRef&, const BlockRef&) = default;

  private:
    void parse(const std::string& block_ref);

    std::variant<BlockNum, evmc::bytes32, BlockTag> value_;
    bool require_canonical_{false};
};

std::ostream& operator<<(std::ostream& out, const BlockRef& block_ref);

//! Concrete block a call is bound to after resolution
struct ResolvedBlock {
    BlockNum block_num{0};
    evmc::bytes32 block_hash;
    bool pending{false};

    friend bool operator==(const ResolvedBlock&, const ResolvedBlock&) = default;
};

std::ostream& operator<<(std::ostream& out, const ResolvedBlock& resolved_block);

}  // namespace ethrpc::rpc
