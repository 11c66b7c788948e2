// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "decode.hpp"

namespace ethrpc::rlp {

namespace {

    constexpr uint8_t kShortStringBase{0x80};
    constexpr uint8_t kLongStringBase{0xB7};
    constexpr uint8_t kShortListBase{0xC0};
    constexpr uint8_t kLongListBase{0xF7};

    //! Long-form payloads carry their big-endian length in the next \p length_bytes bytes
    tl::expected<size_t, DecodingError> read_long_length(ByteView& from, size_t length_bytes) noexcept {
        if (from.size() < length_bytes) {
            return tl::unexpected{DecodingError::kInputTooShort};
        }
        uint64_t length{0};
        if (DecodingResult res{endian::from_big_compact(from.substr(0, length_bytes), length)}; !res) {
            return tl::unexpected{res.error()};
        }
        from.remove_prefix(length_bytes);
        // Payloads shorter than 56 bytes must use the short form
        if (length < 56) {
            return tl::unexpected{DecodingError::kNonCanonicalSize};
        }
        return static_cast<size_t>(length);
    }

}  // namespace

tl::expected<Header, DecodingError> decode_header(ByteView& from) noexcept {
    if (from.empty()) {
        return tl::unexpected{DecodingError::kInputTooShort};
    }

    const uint8_t prefix{from[0]};
    Header header{.list = prefix >= kShortListBase};

    if (prefix < kShortStringBase) {
        // Single byte encoding itself: nothing to consume
        header.payload_length = 1;
    } else {
        from.remove_prefix(1);
        if (prefix <= kLongStringBase) {
            header.payload_length = prefix - kShortStringBase;
            if (header.payload_length == 1 && !from.empty() && from[0] < kShortStringBase) {
                return tl::unexpected{DecodingError::kNonCanonicalSize};
            }
        } else if (prefix < kShortListBase) {
            const auto length{read_long_length(from, prefix - kLongStringBase)};
            if (!length) {
                return tl::unexpected{length.error()};
            }
            header.payload_length = *length;
        } else if (prefix <= kLongListBase) {
            header.payload_length = prefix - kShortListBase;
        } else {
            const auto length{read_long_length(from, prefix - kLongListBase)};
            if (!length) {
                return tl::unexpected{length.error()};
            }
            header.payload_length = *length;
        }
    }

    if (from.size() < header.payload_length) {
        return tl::unexpected{DecodingError::kInputTooShort};
    }
    return header;
}

DecodingResult decode(ByteView& from, Bytes& to, Leftover mode) noexcept {
    const auto header{decode_header(from)};
    if (!header) {
        return tl::unexpected{header.error()};
    }
    if (header->list) {
        return tl::unexpected{DecodingError::kUnexpectedList};
    }
    to = from.substr(0, header->payload_length);
    from.remove_prefix(header->payload_length);
    if (mode == Leftover::kProhibit && !from.empty()) {
        return tl::unexpected{DecodingError::kInputTooLong};
    }
    return {};
}

DecodingResult decode(ByteView& from, bool& to, Leftover mode) noexcept {
    uint8_t flag{0};
    if (DecodingResult res{decode(from, flag, mode)}; !res) {
        return res;
    }
    if (flag > 1) {
        return tl::unexpected{DecodingError::kOverflow};
    }
    to = flag == 1;
    return {};
}

}  // namespace ethrpc::rlp
