#pragma once

#include "common/Errors.hpp"
#include "common/Types.hpp"
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <limits>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace phoenix::constants {
    // Account layout, all sizes in bytes
    constexpr size_t MARKET_HEADER_SIZE = 576;
    constexpr size_t MARKET_PADDING_SIZE = 8 * 32;
    constexpr size_t MARKET_SCALARS_SIZE = 6 * 8;

    constexpr size_t TREE_HEADER_SIZE = 16;
    constexpr size_t ALLOCATOR_SIZE_FIELD = 8;
    constexpr size_t TREE_PREFIX_SIZE = TREE_HEADER_SIZE + ALLOCATOR_SIZE_FIELD + 4 + 4;
    constexpr size_t NODE_REGISTERS_SIZE = 4 * 4;

    constexpr size_t PUBKEY_SIZE = 32;
    constexpr size_t ORDER_ID_SIZE = 16;
    constexpr size_t RESTING_ORDER_SIZE = 32;
    constexpr size_t TRADER_STATE_SIZE = 96;
    constexpr size_t CLOCK_SIZE = 40;

    constexpr size_t DEFAULT_L2_LADDER_DEPTH = 10;
    constexpr size_t DEFAULT_L3_BOOK_DEPTH = 20;
    constexpr uint64_t DEFAULT_MATCH_LIMIT = 2048;
    constexpr double DEFAULT_SLIPPAGE = 0.005;

    // Largest power of ten that fits in a u64
    constexpr uint32_t MAX_DECIMALS = 19;
}

namespace phoenix::utils {

    // Function: ByteReader
    // Description: Sequential little-endian reader over an immutable buffer.
    //              Every read is bounds checked and throws SizeMismatch on overrun.
    class ByteReader {
    public:
        explicit ByteReader(std::span<const uint8_t> data, size_t offset = 0)
            : data_(data), offset_(offset) {}

        uint64_t u64() { return read<uint64_t>(); }
        uint32_t u32() { return read<uint32_t>(); }
        int64_t i64() { return read<int64_t>(); }
        int32_t i32() { return read<int32_t>(); }

        Pubkey pubkey() {
            require(constants::PUBKEY_SIZE);
            Pubkey key;
            std::memcpy(key.bytes.data(), data_.data() + offset_, constants::PUBKEY_SIZE);
            offset_ += constants::PUBKEY_SIZE;
            return key;
        }

        void skip(size_t n) {
            require(n);
            offset_ += n;
        }

        size_t offset() const { return offset_; }
        size_t remaining() const { return data_.size() - offset_; }

    private:
        template<typename T>
        T read() {
            require(sizeof(T));
            // Little-endian host assumed, as on every supported target
            T value;
            std::memcpy(&value, data_.data() + offset_, sizeof(T));
            offset_ += sizeof(T);
            return value;
        }

        void require(size_t n) const {
            if (n > data_.size() - offset_) {
                throw DecodeError(ErrorKind::SizeMismatch,
                    "read of " + std::to_string(n) + " bytes at offset " + std::to_string(offset_) +
                    " exceeds buffer of " + std::to_string(data_.size()));
            }
        }

        std::span<const uint8_t> data_;
        size_t offset_;
    };

    inline uint64_t pow10(uint32_t exponent) {
        uint64_t result = 1;
        for (uint32_t i = 0; i < exponent; ++i) result *= 10;
        return result;
    }

    inline uint64_t now_ns() {
        return std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }

    inline constexpr std::string_view BASE58_ALPHABET =
        "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

    // Function: to_base58
    // Description: Encodes a public key in the Bitcoin base58 alphabet.
    inline std::string to_base58(const Pubkey& key) {
        const auto& in = key.bytes;
        size_t zeros = 0;
        while (zeros < in.size() && in[zeros] == 0) ++zeros;

        // log(256) / log(58) ~= 1.38
        std::vector<uint8_t> digits((in.size() - zeros) * 138 / 100 + 1, 0);
        size_t length = 0;
        for (size_t i = zeros; i < in.size(); ++i) {
            uint32_t carry = in[i];
            size_t j = 0;
            for (auto it = digits.rbegin(); (carry != 0 || j < length) && it != digits.rend(); ++it, ++j) {
                carry += 256u * (*it);
                *it = static_cast<uint8_t>(carry % 58);
                carry /= 58;
            }
            length = j;
        }

        auto it = digits.begin() + static_cast<std::ptrdiff_t>(digits.size() - length);
        while (it != digits.end() && *it == 0) ++it;

        std::string out(zeros, '1');
        out.reserve(zeros + static_cast<size_t>(digits.end() - it));
        for (; it != digits.end(); ++it) out += BASE58_ALPHABET[*it];
        return out;
    }

    // Function: from_base58
    // Description: Decodes a base58 string into a 32-byte key.
    // Outputs: false if the text has a foreign character or does not decode to exactly 32 bytes.
    inline bool from_base58(std::string_view text, Pubkey& out) {
        size_t zeros = 0;
        while (zeros < text.size() && text[zeros] == '1') ++zeros;

        // log(58) / log(256) ~= 0.733
        std::vector<uint8_t> bytes(text.size() * 733 / 1000 + 1, 0);
        size_t length = 0;
        for (size_t i = zeros; i < text.size(); ++i) {
            size_t digit = BASE58_ALPHABET.find(text[i]);
            if (digit == std::string_view::npos) return false;

            uint32_t carry = static_cast<uint32_t>(digit);
            size_t j = 0;
            for (auto it = bytes.rbegin(); (carry != 0 || j < length) && it != bytes.rend(); ++it, ++j) {
                carry += 58u * (*it);
                *it = static_cast<uint8_t>(carry % 256);
                carry /= 256;
            }
            length = j;
        }

        auto it = bytes.begin() + static_cast<std::ptrdiff_t>(bytes.size() - length);
        while (it != bytes.end() && *it == 0) ++it;

        size_t significant = static_cast<size_t>(bytes.end() - it);
        if (zeros + significant != constants::PUBKEY_SIZE) return false;

        out.bytes.fill(0);
        std::copy(it, bytes.end(), out.bytes.begin() + static_cast<std::ptrdiff_t>(zeros));
        return true;
    }

}
