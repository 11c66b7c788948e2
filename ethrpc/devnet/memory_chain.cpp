// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "memory_chain.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include <ethrpc/core/types/address.hpp>
#include <ethrpc/core/types/bloom.hpp>
#include <ethrpc/infra/common/log.hpp>
#include <ethrpc/rpc/types/error.hpp>

namespace ethrpc::devnet {

MemoryChain::MemoryChain(const GenesisSpec& genesis) {
    auto data = std::make_shared<ChainData>();
    auto genesis_block = std::make_shared<const BlockWithHash>(make_genesis_block(genesis));
    data->block_nums.emplace(genesis_block->hash, 0);
    data->entries.push_back(std::make_shared<const ChainEntry>(ChainEntry{
        .block = std::move(genesis_block),
        .receipts = {},
        .state = std::make_shared<const WorldState>(genesis.alloc),
    }));
    data_ = std::move(data);
}

std::shared_ptr<const ChainData> MemoryChain::data() const {
    std::scoped_lock lock{mutex_};
    return data_;
}

std::shared_ptr<const ChainEntry> MemoryChain::head() const {
    return data()->entries.back();
}

static std::shared_ptr<const ChainEntry> find_entry(const ChainData& chain_data, const rpc::ResolvedBlock& block) {
    if (block.pending) {
        if (chain_data.pending && chain_data.pending->block->hash == block.block_hash) {
            return chain_data.pending;
        }
        return nullptr;
    }
    if (block.block_num < chain_data.lowest_block_num || block.block_num >= chain_data.entries.size()) {
        return nullptr;
    }
    const auto& entry = chain_data.entries[block.block_num];
    return entry->block->hash == block.block_hash ? entry : nullptr;
}

std::shared_ptr<const ChainEntry> MemoryChain::entry_at(const rpc::ResolvedBlock& block) const {
    const auto chain_data = data();
    auto entry = find_entry(*chain_data, block);
    if (entry) {
        return entry;
    }
    std::stringstream what;
    if (!block.pending && block.block_num < chain_data->lowest_block_num) {
        what << "state pruned at " << block << ", lowest available is " << chain_data->lowest_block_num;
        throw rpc::ResolutionError{rpc::ResolutionError::Reason::kPrunedOrUnavailable, what.str()};
    }
    what << "state no longer available at " << block;
    throw rpc::ResolutionError{rpc::ResolutionError::Reason::kReorgedDuringCall, what.str()};
}

std::shared_ptr<const BlockWithHash> MemoryChain::append_block(Block block,
                                                               std::vector<Receipt> receipts,
                                                               std::optional<WorldState> post_state) {
    if (receipts.size() != block.transactions.size()) {
        throw std::invalid_argument{"receipt count " + std::to_string(receipts.size()) +
                                    " does not match transaction count " + std::to_string(block.transactions.size())};
    }
    std::scoped_lock lock{mutex_};
    const auto& parent = *data_->entries.back();
    const auto& parent_header = parent.block->block.header;

    auto& header = block.header;
    header.parent_hash = parent.block->hash;
    header.number = parent_header.number + 1;
    if (header.timestamp <= parent_header.timestamp) {
        header.timestamp = parent_header.timestamp + 1;
    }
    if (header.gas_limit == 0) {
        header.gas_limit = parent_header.gas_limit;
    }
    if (header.difficulty == 0) {
        header.difficulty = parent_header.difficulty;
    }
    if (!header.base_fee_per_gas) {
        header.base_fee_per_gas = parent_header.base_fee_per_gas;
    }
    header.logs_bloom = Bloom{};
    for (size_t i{0}; i < receipts.size(); ++i) {
        receipts[i].type = block.transactions[i].type;
        receipts[i].bloom = logs_bloom(receipts[i].logs);
        join(header.logs_bloom, receipts[i].bloom);
    }
    header.gas_used = receipts.empty() ? 0 : receipts.back().cumulative_gas_used;

    BlockWithHash block_with_hash{.block = std::move(block), .hash = header.hash()};
    WorldState state{post_state ? std::move(*post_state) : *parent.state};
    return push(std::move(block_with_hash), std::move(receipts), std::move(state));
}

std::shared_ptr<const BlockWithHash> MemoryChain::insert_sealed_block(BuiltBlock built) {
    std::scoped_lock lock{mutex_};
    const auto& head = *data_->entries.back()->block;
    if (built.block.header.parent_hash != head.hash || built.block.header.number != head.block.header.number + 1) {
        ETHRPC_DEBUG << "insert_sealed_block stale block: " << built.block.header.number << " head: " << head.block.header.number;
        return nullptr;
    }
    for (auto& receipt : built.receipts) {
        receipt.bloom = logs_bloom(receipt.logs);
        join(built.block.header.logs_bloom, receipt.bloom);
    }
    const auto hash{built.block.header.hash()};
    return push(BlockWithHash{.block = std::move(built.block), .hash = hash}, std::move(built.receipts), std::move(built.post_state));
}

std::shared_ptr<const BlockWithHash> MemoryChain::push(BlockWithHash block_with_hash, std::vector<Receipt> receipts, WorldState post_state) {
    auto data = std::make_shared<ChainData>(*data_);
    auto block = std::make_shared<const BlockWithHash>(std::move(block_with_hash));
    const BlockNum block_num{block->block.header.number};

    data->block_nums.emplace(block->hash, block_num);
    const auto& transactions = block->block.transactions;
    for (uint64_t i{0}; i < transactions.size(); ++i) {
        data->tx_locations.insert_or_assign(transactions[i].hash(), rpc::TransactionLocation{
                                                                        .block_num = block_num,
                                                                        .block_hash = block->hash,
                                                                        .transaction_index = i,
                                                                    });
    }
    auto state = std::make_shared<const WorldState>(std::move(post_state));
    data->entries.push_back(std::make_shared<const ChainEntry>(ChainEntry{
        .block = block,
        .receipts = std::move(receipts),
        .state = state,
    }));
    // The pending block is built on the previous head
    data->pending.reset();
    data_ = std::move(data);

    drop_included_transactions(*state);
    ETHRPC_DEBUG << "MemoryChain new head: " << block_num << " hash: " << to_hex(block->hash, true)
                 << " txs: " << transactions.size();
    return block;
}

bool MemoryChain::set_pending_block(std::optional<BuiltBlock> built) {
    std::scoped_lock lock{mutex_};
    if (built && built->block.header.parent_hash != data_->entries.back()->block->hash) {
        return false;
    }
    auto data = std::make_shared<ChainData>(*data_);
    if (built) {
        for (auto& receipt : built->receipts) {
            receipt.bloom = logs_bloom(receipt.logs);
            join(built->block.header.logs_bloom, receipt.bloom);
        }
        const auto hash{built->block.header.hash()};
        data->pending = std::make_shared<const ChainEntry>(ChainEntry{
            .block = std::make_shared<const BlockWithHash>(BlockWithHash{.block = std::move(built->block), .hash = hash}),
            .receipts = std::move(built->receipts),
            .state = std::make_shared<const WorldState>(std::move(built->post_state)),
        });
    } else {
        data->pending.reset();
    }
    data_ = std::move(data);
    return true;
}

void MemoryChain::prune(BlockNum lowest_block_num) {
    std::scoped_lock lock{mutex_};
    auto data = std::make_shared<ChainData>(*data_);
    data->lowest_block_num = std::min<BlockNum>(lowest_block_num, data->entries.size() - 1);
    data_ = std::move(data);
}

bool MemoryChain::add_pooled_transaction(const Transaction& txn, const evmc::bytes32& tx_hash) {
    std::scoped_lock lock{mutex_};
    if (!pooled_hashes_.insert(tx_hash).second) {
        return false;
    }
    pooled_.push_back(txn);
    return true;
}

bool MemoryChain::is_pooled(const evmc::bytes32& tx_hash) const {
    std::scoped_lock lock{mutex_};
    return pooled_hashes_.contains(tx_hash);
}

std::vector<Transaction> MemoryChain::pooled_transactions() const {
    std::scoped_lock lock{mutex_};
    return pooled_;
}

std::optional<uint64_t> MemoryChain::pooled_nonce(const evmc::address& sender) const {
    std::scoped_lock lock{mutex_};
    std::optional<uint64_t> next_nonce;
    for (const auto& txn : pooled_) {
        if (txn.sender() == sender && (!next_nonce || txn.nonce >= *next_nonce)) {
            next_nonce = txn.nonce + 1;
        }
    }
    return next_nonce;
}

void MemoryChain::drop_included_transactions(const WorldState& state) {
    std::erase_if(pooled_, [&](const Transaction& txn) {
        const auto sender{txn.sender()};
        const auto it{sender ? state.find(*sender) : state.end()};
        const bool included{it != state.end() && txn.nonce < it->second.account.nonce};
        if (included) {
            pooled_hashes_.erase(txn.hash());
        }
        return included;
    });
}

BlockNum MemorySnapshot::head_block_num() const {
    return data_->entries.size() - 1;
}

const ChainEntry* MemorySnapshot::retained_entry(BlockNum block_num, const evmc::bytes32& block_hash) const {
    if (block_num < data_->lowest_block_num || block_num >= data_->entries.size()) {
        return nullptr;
    }
    const auto& entry = data_->entries[block_num];
    return entry->block->hash == block_hash ? entry.get() : nullptr;
}

Task<std::optional<evmc::bytes32>> MemorySnapshot::read_canonical_hash(BlockNum block_num) const {
    if (block_num >= data_->entries.size()) {
        co_return std::nullopt;
    }
    co_return data_->entries[block_num]->block->hash;
}

Task<std::optional<BlockNum>> MemorySnapshot::read_block_num(const evmc::bytes32& block_hash) const {
    const auto it{data_->block_nums.find(block_hash)};
    if (it == data_->block_nums.end()) {
        co_return std::nullopt;
    }
    co_return it->second;
}

Task<std::shared_ptr<const BlockWithHash>> MemorySnapshot::read_block(BlockNum block_num, const evmc::bytes32& block_hash) const {
    const auto* entry = retained_entry(block_num, block_hash);
    co_return entry ? entry->block : nullptr;
}

Task<std::shared_ptr<const BlockWithHash>> MemorySnapshot::read_pending_block() const {
    co_return data_->pending ? data_->pending->block : nullptr;
}

Task<std::optional<rpc::TransactionLocation>> MemorySnapshot::read_transaction_location(const evmc::bytes32& tx_hash) const {
    const auto it{data_->tx_locations.find(tx_hash)};
    if (it == data_->tx_locations.end()) {
        co_return std::nullopt;
    }
    co_return it->second;
}

Task<std::optional<std::vector<Receipt>>> MemorySnapshot::read_receipts(BlockNum block_num, const evmc::bytes32& block_hash) const {
    const auto* entry = retained_entry(block_num, block_hash);
    if (!entry) {
        co_return std::nullopt;
    }
    co_return entry->receipts;
}

Task<std::shared_ptr<rpc::ChainSnapshot>> MemoryChainHistory::open_snapshot() {
    co_return std::make_shared<MemorySnapshot>(chain_->data());
}

const AccountState* MemoryChainState::find_account(const ChainEntry& entry, const evmc::address& address) const {
    const auto it{entry.state->find(address)};
    return it != entry.state->end() ? &it->second : nullptr;
}

Task<std::optional<Account>> MemoryChainState::read_account(const evmc::address& address, const rpc::ResolvedBlock& block) const {
    const auto entry = chain_->entry_at(block);
    const auto* account_state = find_account(*entry, address);
    if (!account_state) {
        co_return std::nullopt;
    }
    co_return account_state->account;
}

Task<std::optional<Bytes>> MemoryChainState::read_code(const evmc::address& address, const rpc::ResolvedBlock& block) const {
    const auto entry = chain_->entry_at(block);
    const auto* account_state = find_account(*entry, address);
    if (!account_state || account_state->code.empty()) {
        co_return std::nullopt;
    }
    co_return account_state->code;
}

Task<std::optional<evmc::bytes32>> MemoryChainState::read_storage(const evmc::address& address,
                                                                  const evmc::bytes32& location,
                                                                  const rpc::ResolvedBlock& block) const {
    const auto entry = chain_->entry_at(block);
    const auto* account_state = find_account(*entry, address);
    if (!account_state) {
        co_return std::nullopt;
    }
    const auto it{account_state->storage.find(location)};
    if (it == account_state->storage.end()) {
        co_return std::nullopt;
    }
    co_return it->second;
}

}  // namespace ethrpc::devnet
