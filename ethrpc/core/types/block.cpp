// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "block.hpp"

#include <bit>
#include <limits>

#include <ethrpc/core/common/util.hpp>
#include <ethrpc/core/rlp/encode.hpp>

namespace ethrpc {

evmc::bytes32 BlockHeader::hash(bool for_sealing) const {
    Bytes rlp;
    rlp::encode(rlp, *this, for_sealing);
    return std::bit_cast<evmc_bytes32>(keccak256(rlp));
}

ethash::hash256 BlockHeader::boundary() const {
    // 2^256 / difficulty, saturated for difficulty 0 and 1
    if (difficulty <= 1) {
        return intx::be::store<ethash::hash256>(std::numeric_limits<intx::uint256>::max());
    }
    const auto quotient{(intx::uint512{1} << 256) / intx::uint512{difficulty}};
    return intx::be::store<ethash::hash256>(static_cast<intx::uint256>(quotient));
}

namespace rlp {

    void encode(Bytes& to, const BlockHeader& header, bool for_sealing) {
        Bytes payload;
        payload.reserve(kBloomByteLength + 8 * kHashLength);
        encode(payload, header.parent_hash);
        encode(payload, header.ommers_hash);
        encode(payload, header.beneficiary);
        encode(payload, header.state_root);
        encode(payload, header.transactions_root);
        encode(payload, header.receipts_root);
        encode(payload, ByteView{header.logs_bloom});
        encode(payload, header.difficulty);
        encode(payload, header.number);
        encode(payload, header.gas_limit);
        encode(payload, header.gas_used);
        encode(payload, header.timestamp);
        encode(payload, ByteView{header.extra_data});
        // The sealing hash covers everything but the proof of work
        if (!for_sealing) {
            encode(payload, header.prev_randao);
            encode(payload, ByteView{header.nonce});
        }
        if (header.base_fee_per_gas) {
            encode(payload, *header.base_fee_per_gas);
        }
        encode_list(to, payload);
    }

}  // namespace rlp

}  // namespace ethrpc
