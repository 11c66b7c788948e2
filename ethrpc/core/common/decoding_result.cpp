// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "decoding_result.hpp"

namespace ethrpc {

const char* to_string(DecodingError error) noexcept {
    switch (error) {
        case DecodingError::kOverflow:
            return "rlp: uint overflow";
        case DecodingError::kLeadingZero:
            return "rlp: leading zero";
        case DecodingError::kInputTooShort:
            return "rlp: value size exceeds available input length";
        case DecodingError::kInputTooLong:
            return "rlp: input contains more than one value";
        case DecodingError::kNonCanonicalSize:
            return "rlp: non-canonical size information";
        case DecodingError::kUnexpectedLength:
            return "rlp: unexpected length";
        case DecodingError::kUnexpectedString:
            return "rlp: expected list, got string";
        case DecodingError::kUnexpectedList:
            return "rlp: expected string, got list";
        case DecodingError::kUnexpectedListElements:
            return "rlp: unexpected list elements";
        case DecodingError::kInvalidVInSignature:
            return "invalid v in signature";
        case DecodingError::kUnsupportedTransactionType:
            return "transaction type not supported";
        case DecodingError::kUnexpectedEip2718Serialization:
            return "unexpected EIP-2718 serialization";
    }
    return "rlp: unknown decoding error";
}

}  // namespace ethrpc
