// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <vector>

#include <evmc/evmc.hpp>

#include <ethrpc/core/common/base.hpp>
#include <ethrpc/core/types/block.hpp>
#include <ethrpc/core/types/receipt.hpp>
#include <ethrpc/core/types/transaction.hpp>
#include <ethrpc/devnet/block_builder.hpp>
#include <ethrpc/devnet/genesis.hpp>
#include <ethrpc/devnet/state.hpp>
#include <ethrpc/rpc/storage/chain_storage.hpp>
#include <ethrpc/rpc/types/block_ref.hpp>

namespace ethrpc::devnet {

//! One block of the chain together with its receipts and post-state
struct ChainEntry {
    std::shared_ptr<const BlockWithHash> block;
    std::vector<Receipt> receipts;
    std::shared_ptr<const WorldState> state;
};

//! Published version of the chain: never modified, replaced as a whole on every change
struct ChainData {
    std::vector<std::shared_ptr<const ChainEntry>> entries;
    std::map<evmc::bytes32, BlockNum> block_nums;
    std::map<evmc::bytes32, rpc::TransactionLocation> tx_locations;
    BlockNum lowest_block_num{0};
    std::shared_ptr<const ChainEntry> pending;
};

//! MemoryChain is the devnet node store: canonical chain, per-block state and pooled transactions.
//! Readers take immutable ChainData versions, so a snapshot does not observe blocks appended after it was taken.
class MemoryChain {
  public:
    explicit MemoryChain(const GenesisSpec& genesis);

    MemoryChain(const MemoryChain&) = delete;
    MemoryChain& operator=(const MemoryChain&) = delete;

    std::shared_ptr<const ChainData> data() const;

    std::shared_ptr<const ChainEntry> head() const;

    //! \brief Get the block a call has been resolved to, the pending block included
    //! \throws rpc::ResolutionError if the block has been pruned or is no longer part of the chain
    std::shared_ptr<const ChainEntry> entry_at(const rpc::ResolvedBlock& block) const;

    //! \brief Append a block on top of the head, with one receipt per transaction
    //! \details Parent hash, number, gas used, logs bloom and receipt blooms are derived here. Unset timestamp,
    //! gas limit, difficulty and base fee are inherited from the head. Without \p post_state the head state is kept.
    std::shared_ptr<const BlockWithHash> append_block(Block block,
                                                      std::vector<Receipt> receipts,
                                                      std::optional<WorldState> post_state = std::nullopt);

    //! \brief Append a sealed block as it is
    //! \return nullptr if the block is not a child of the current head
    std::shared_ptr<const BlockWithHash> insert_sealed_block(BuiltBlock built);

    //! \brief Publish the speculative next block, std::nullopt clears it
    //! \return false if \p built is not a child of the current head
    bool set_pending_block(std::optional<BuiltBlock> built);

    //! \brief Stop serving block data, receipts and state below \p lowest_block_num
    void prune(BlockNum lowest_block_num);

    //! \brief Add a transaction to the pooled set
    //! \return false if a transaction with the same hash is already pooled
    bool add_pooled_transaction(const Transaction& txn, const evmc::bytes32& tx_hash);

    bool is_pooled(const evmc::bytes32& tx_hash) const;

    //! Pooled transactions in arrival order
    std::vector<Transaction> pooled_transactions() const;

    //! Nonce following the highest pooled transaction of \p sender, std::nullopt if none is pooled
    std::optional<uint64_t> pooled_nonce(const evmc::address& sender) const;

  private:
    std::shared_ptr<const BlockWithHash> push(BlockWithHash block_with_hash, std::vector<Receipt> receipts, WorldState post_state);
    void drop_included_transactions(const WorldState& state);

    mutable std::mutex mutex_;
    std::shared_ptr<const ChainData> data_;
    std::vector<Transaction> pooled_;
    std::set<evmc::bytes32> pooled_hashes_;
};

//! Per-call snapshot over one ChainData version
class MemorySnapshot : public rpc::ChainSnapshot {
  public:
    explicit MemorySnapshot(std::shared_ptr<const ChainData> data) : data_{std::move(data)} {}

    BlockNum head_block_num() const override;
    BlockNum lowest_block_num() const override { return data_->lowest_block_num; }

    Task<std::optional<evmc::bytes32>> read_canonical_hash(BlockNum block_num) const override;
    Task<std::optional<BlockNum>> read_block_num(const evmc::bytes32& block_hash) const override;
    Task<std::shared_ptr<const BlockWithHash>> read_block(BlockNum block_num, const evmc::bytes32& block_hash) const override;
    Task<std::shared_ptr<const BlockWithHash>> read_pending_block() const override;
    Task<std::optional<rpc::TransactionLocation>> read_transaction_location(const evmc::bytes32& tx_hash) const override;
    Task<std::optional<std::vector<Receipt>>> read_receipts(BlockNum block_num, const evmc::bytes32& block_hash) const override;

  private:
    const ChainEntry* retained_entry(BlockNum block_num, const evmc::bytes32& block_hash) const;

    std::shared_ptr<const ChainData> data_;
};

class MemoryChainHistory : public rpc::ChainHistory {
  public:
    explicit MemoryChainHistory(std::shared_ptr<MemoryChain> chain) : chain_{std::move(chain)} {}

    Task<std::shared_ptr<rpc::ChainSnapshot>> open_snapshot() override;

  private:
    std::shared_ptr<MemoryChain> chain_;
};

class MemoryChainState : public rpc::ChainState {
  public:
    explicit MemoryChainState(std::shared_ptr<MemoryChain> chain) : chain_{std::move(chain)} {}

    Task<std::optional<Account>> read_account(const evmc::address& address, const rpc::ResolvedBlock& block) const override;

    Task<std::optional<Bytes>> read_code(const evmc::address& address, const rpc::ResolvedBlock& block) const override;

    Task<std::optional<evmc::bytes32>> read_storage(const evmc::address& address,
                                                    const evmc::bytes32& location,
                                                    const rpc::ResolvedBlock& block) const override;

  private:
    const AccountState* find_account(const ChainEntry& entry, const evmc::address& address) const;

    std::shared_ptr<MemoryChain> chain_;
};

}  // namespace ethrpc::devnet
