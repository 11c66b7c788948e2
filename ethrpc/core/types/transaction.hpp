// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <ethrpc/core/common/base.hpp>
#include <ethrpc/core/common/bytes.hpp>
#include <ethrpc/core/common/decoding_result.hpp>
#include <ethrpc/core/rlp/decode.hpp>

namespace ethrpc {

// EIP-2930: Optional access lists
struct AccessListEntry {
    evmc::address account{};
    std::vector<evmc::bytes32> storage_keys{};

    friend bool operator==(const AccessListEntry&, const AccessListEntry&) = default;
};

// EIP-2718 transaction type
// https://github.com/ethereum/eth1.0-specs/tree/master/lists/signature-types
enum class TransactionType : uint8_t {
    kLegacy = 0,
    kAccessList = 1,  // EIP-2930
    kDynamicFee = 2,  // EIP-1559
};

struct UnsignedTransaction {
    TransactionType type{TransactionType::kLegacy};

    std::optional<intx::uint256> chain_id{std::nullopt};  // nullopt means a pre-EIP-155 transaction

    uint64_t nonce{0};
    intx::uint256 max_priority_fee_per_gas{0};  // EIP-1559
    intx::uint256 max_fee_per_gas{0};           // gas price for legacy and access list transactions
    uint64_t gas_limit{0};
    std::optional<evmc::address> to{std::nullopt};
    intx::uint256 value{0};
    Bytes data{};

    std::vector<AccessListEntry> access_list{};  // EIP-2930

    intx::uint256 effective_gas_price(const intx::uint256& base_fee_per_gas) const;  // EIP-1559

    void encode_for_signing(Bytes& into) const;

    //! \brief Hash of the signing payload
    evmc::bytes32 signing_hash() const;

    friend bool operator==(const UnsignedTransaction&, const UnsignedTransaction&) = default;
};

class Transaction : public UnsignedTransaction {
  public:
    bool odd_y_parity{false};
    intx::uint256 r{0}, s{0};  // signature

    intx::uint256 v() const;  // EIP-155

    //! \brief Returns false if v is not acceptable (v != 27 && v != 28 && v < 35, see EIP-155)
    bool set_v(const intx::uint256& v);

    //! \brief Sender recovered from the signature.
    //! \see Yellow Paper, Appendix F "Signing Transactions",
    //! EIP-2: Homestead Hard-fork Changes and
    //! EIP-155: Simple replay attack protection.
    //! If recovery fails std::nullopt is returned.
    std::optional<evmc::address> sender() const;

    void set_sender(const evmc::address& sender) { sender_ = sender; }

    evmc::bytes32 hash() const;

  private:
    mutable std::optional<evmc::address> sender_{std::nullopt};
};

namespace rlp {

    // Serialized typed transactions are prepended with 1 byte containing the type, as per EIP-2718
    void encode(Bytes& to, const Transaction& txn);

    DecodingResult decode_transaction(ByteView& from, Transaction& to, Leftover mode = Leftover::kProhibit) noexcept;

    //! \brief Checks the EIP-2718 envelope of a raw signed transaction without decoding its fields
    //! \details Accepts either a legacy RLP list or a type byte in [0x01, 0x7f] followed by an RLP list,
    //! in both cases with no trailing bytes
    DecodingResult validate_transaction_envelope(ByteView raw) noexcept;

}  // namespace rlp

}  // namespace ethrpc
