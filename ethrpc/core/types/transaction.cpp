// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "transaction.hpp"

#include <algorithm>
#include <bit>

#include <ethrpc/core/common/util.hpp>
#include <ethrpc/core/crypto/ecdsa.hpp>
#include <ethrpc/core/rlp/encode.hpp>
#include <ethrpc/core/types/address.hpp>

namespace ethrpc {

intx::uint256 UnsignedTransaction::effective_gas_price(const intx::uint256& base_fee_per_gas) const {
    if (type != TransactionType::kDynamicFee) {
        return max_fee_per_gas;
    }
    const intx::uint256 priority_fee{max_fee_per_gas >= base_fee_per_gas ? max_fee_per_gas - base_fee_per_gas : 0};
    return base_fee_per_gas + std::min(max_priority_fee_per_gas, priority_fee);
}

// https://eips.ethereum.org/EIPS/eip-155
intx::uint256 Transaction::v() const {
    if (type != TransactionType::kLegacy) {
        return odd_y_parity ? 1 : 0;
    }
    if (chain_id) {
        return *chain_id * 2 + 35 + (odd_y_parity ? 1 : 0);
    }
    return odd_y_parity ? 28 : 27;
}

// https://eips.ethereum.org/EIPS/eip-155
bool Transaction::set_v(const intx::uint256& v) {
    if (v == 27 || v == 28) {
        odd_y_parity = v == 28;
        chain_id = std::nullopt;
    } else if (v >= 35) {
        const intx::uint256 w{v - 35};
        odd_y_parity = (w & 1) != 0;
        chain_id = w >> 1;
    } else {
        return false;
    }
    sender_.reset();
    return true;
}

std::optional<evmc::address> Transaction::sender() const {
    if (!sender_) {
        const ecdsa::RecoverableSignature signature{.r = r, .s = s, .odd_y_parity = odd_y_parity};
        sender_ = ecdsa::recover_address(signing_hash(), signature);
    }
    return sender_;
}

evmc::bytes32 Transaction::hash() const {
    Bytes rlp;
    rlp::encode(rlp, *this);
    return std::bit_cast<evmc_bytes32>(keccak256(rlp));
}

evmc::bytes32 UnsignedTransaction::signing_hash() const {
    Bytes rlp;
    encode_for_signing(rlp);
    return std::bit_cast<evmc_bytes32>(keccak256(rlp));
}

namespace rlp {

    static void encode_to(Bytes& to, const std::optional<evmc::address>& address) {
        if (address) {
            encode(to, *address);
        } else {
            to.push_back(kEmptyStringCode);
        }
    }

    static void encode_access_list(Bytes& to, const std::vector<AccessListEntry>& access_list) {
        Bytes payload;
        for (const AccessListEntry& entry : access_list) {
            Bytes entry_payload;
            encode(entry_payload, entry.account);
            encode(entry_payload, entry.storage_keys);
            encode_list(payload, entry_payload);
        }
        encode_list(to, payload);
    }

    // Fields shared by the signed and the signing payloads, up to and including the access list
    static void encode_unsigned_fields(Bytes& to, const UnsignedTransaction& txn) {
        if (txn.type != TransactionType::kLegacy) {
            encode(to, txn.chain_id.value_or(0));
        }
        encode(to, txn.nonce);
        if (txn.type == TransactionType::kDynamicFee) {
            encode(to, txn.max_priority_fee_per_gas);
        }
        encode(to, txn.max_fee_per_gas);
        encode(to, txn.gas_limit);
        encode_to(to, txn.to);
        encode(to, txn.value);
        encode(to, ByteView{txn.data});
        if (txn.type != TransactionType::kLegacy) {
            encode_access_list(to, txn.access_list);
        }
    }

    static void wrap_list(Bytes& to, TransactionType type, const Bytes& payload) {
        if (type != TransactionType::kLegacy) {
            to.push_back(static_cast<uint8_t>(type));
        }
        encode_list(to, payload);
    }

    void encode(Bytes& to, const Transaction& txn) {
        Bytes payload;
        encode_unsigned_fields(payload, txn);
        if (txn.type == TransactionType::kLegacy) {
            encode(payload, txn.v());
        } else {
            encode(payload, txn.odd_y_parity);
        }
        encode(payload, txn.r);
        encode(payload, txn.s);
        wrap_list(to, txn.type, payload);
    }

    static DecodingResult decode_to(ByteView& from, std::optional<evmc::address>& to) noexcept {
        const auto h{decode_header(from)};
        if (!h) {
            return tl::unexpected{h.error()};
        }
        if (h->list) {
            return tl::unexpected{DecodingError::kUnexpectedList};
        }
        if (h->payload_length == 0) {
            to = std::nullopt;
            return {};
        }
        if (h->payload_length != kAddressLength) {
            return tl::unexpected{DecodingError::kUnexpectedLength};
        }
        to = bytes_to_address(from.substr(0, kAddressLength));
        from.remove_prefix(kAddressLength);
        return {};
    }

    static DecodingResult decode_access_list(ByteView& from, std::vector<AccessListEntry>& to) noexcept {
        const auto h{decode_header(from)};
        if (!h) {
            return tl::unexpected{h.error()};
        }
        if (!h->list) {
            return tl::unexpected{DecodingError::kUnexpectedString};
        }
        ByteView payload{from.substr(0, h->payload_length)};
        from.remove_prefix(h->payload_length);
        to.clear();
        while (!payload.empty()) {
            const auto entry_header{decode_header(payload)};
            if (!entry_header) {
                return tl::unexpected{entry_header.error()};
            }
            if (!entry_header->list) {
                return tl::unexpected{DecodingError::kUnexpectedString};
            }
            ByteView entry_payload{payload.substr(0, entry_header->payload_length)};
            payload.remove_prefix(entry_header->payload_length);
            AccessListEntry& entry{to.emplace_back()};
            if (DecodingResult res{decode(entry_payload, entry.account, Leftover::kAllow)}; !res) {
                return res;
            }
            if (DecodingResult res{decode(entry_payload, entry.storage_keys, Leftover::kProhibit)}; !res) {
                return res;
            }
        }
        return {};
    }

    static DecodingResult decode_fields(ByteView& payload, Transaction& txn) noexcept {
        if (txn.type != TransactionType::kLegacy) {
            intx::uint256 chain_id;
            if (DecodingResult res{decode(payload, chain_id, Leftover::kAllow)}; !res) {
                return res;
            }
            txn.chain_id = chain_id;
        }
        if (DecodingResult res{decode(payload, txn.nonce, Leftover::kAllow)}; !res) {
            return res;
        }
        if (txn.type == TransactionType::kDynamicFee) {
            if (DecodingResult res{decode(payload, txn.max_priority_fee_per_gas, Leftover::kAllow)}; !res) {
                return res;
            }
        }
        if (DecodingResult res{decode(payload, txn.max_fee_per_gas, Leftover::kAllow)}; !res) {
            return res;
        }
        if (txn.type != TransactionType::kDynamicFee) {
            txn.max_priority_fee_per_gas = txn.max_fee_per_gas;
        }
        if (DecodingResult res{decode(payload, txn.gas_limit, Leftover::kAllow)}; !res) {
            return res;
        }
        if (DecodingResult res{decode_to(payload, txn.to)}; !res) {
            return res;
        }
        if (DecodingResult res{decode(payload, txn.value, Leftover::kAllow)}; !res) {
            return res;
        }
        if (DecodingResult res{decode(payload, txn.data, Leftover::kAllow)}; !res) {
            return res;
        }
        if (txn.type != TransactionType::kLegacy) {
            if (DecodingResult res{decode_access_list(payload, txn.access_list)}; !res) {
                return res;
            }
            if (DecodingResult res{decode(payload, txn.odd_y_parity, Leftover::kAllow)}; !res) {
                return res;
            }
        } else {
            intx::uint256 v;
            if (DecodingResult res{decode(payload, v, Leftover::kAllow)}; !res) {
                return res;
            }
            if (!txn.set_v(v)) {
                return tl::unexpected{DecodingError::kInvalidVInSignature};
            }
        }
        if (DecodingResult res{decode(payload, txn.r, Leftover::kAllow)}; !res) {
            return res;
        }
        if (DecodingResult res{decode(payload, txn.s, Leftover::kProhibit)}; !res) {
            return res;
        }
        return {};
    }

    DecodingResult decode_transaction(ByteView& from, Transaction& to, Leftover mode) noexcept {
        if (from.empty()) {
            return tl::unexpected{DecodingError::kInputTooShort};
        }
        to = Transaction{};
        if (from[0] < kEmptyListCode) {
            if (from[0] >= kEmptyStringCode) {
                return tl::unexpected{DecodingError::kUnexpectedEip2718Serialization};
            }
            switch (from[0]) {
                case static_cast<uint8_t>(TransactionType::kAccessList):
                case static_cast<uint8_t>(TransactionType::kDynamicFee):
                    to.type = static_cast<TransactionType>(from[0]);
                    break;
                default:
                    return tl::unexpected{DecodingError::kUnsupportedTransactionType};
            }
            from.remove_prefix(1);
        }

        const auto h{decode_header(from)};
        if (!h) {
            return tl::unexpected{h.error()};
        }
        if (!h->list) {
            return tl::unexpected{DecodingError::kUnexpectedString};
        }
        ByteView payload{from.substr(0, h->payload_length)};
        if (DecodingResult res{decode_fields(payload, to)}; !res) {
            return res;
        }
        from.remove_prefix(h->payload_length);
        if (mode != Leftover::kAllow && !from.empty()) {
            return tl::unexpected{DecodingError::kInputTooLong};
        }
        return {};
    }

    DecodingResult validate_transaction_envelope(ByteView raw) noexcept {
        if (raw.empty()) {
            return tl::unexpected{DecodingError::kInputTooShort};
        }
        if (raw[0] >= kEmptyStringCode && raw[0] < kEmptyListCode) {
            return tl::unexpected{DecodingError::kUnexpectedString};
        }
        if (raw[0] < kEmptyStringCode) {
            // EIP-2718 reserves type 0x00 and the values above 0x7f
            if (raw[0] == 0x00) {
                return tl::unexpected{DecodingError::kUnexpectedEip2718Serialization};
            }
            raw.remove_prefix(1);
        }
        const auto h{decode_header(raw)};
        if (!h) {
            return tl::unexpected{h.error()};
        }
        if (!h->list) {
            return tl::unexpected{DecodingError::kUnexpectedString};
        }
        if (raw.size() != h->payload_length) {
            return tl::unexpected{DecodingError::kInputTooLong};
        }
        return {};
    }

}  // namespace rlp

void UnsignedTransaction::encode_for_signing(Bytes& into) const {
    Bytes payload;
    rlp::encode_unsigned_fields(payload, *this);
    if (type == TransactionType::kLegacy && chain_id) {
        rlp::encode(payload, *chain_id);
        rlp::encode(payload, uint64_t{0});
        rlp::encode(payload, uint64_t{0});
    }
    rlp::wrap_list(into, type, payload);
}

}  // namespace ethrpc
