#pragma once

#include "common/Types.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <unordered_map>
#include <utility>
#include <vector>

namespace phoenix {

    using OrderEntry = std::pair<OrderId, RestingOrder>;

    /**
     * @struct MarketSnapshot
     * @brief Fully decoded, sorted view of one market account.
     *
     * Built in one pass by decode_market() and never mutated afterwards.
     * Refreshing a market means building a new snapshot and swapping the
     * shared pointer that consumers hold.
     */
    struct MarketSnapshot {
        MarketHeader header{};

        uint64_t base_lots_per_base_unit = 0;
        uint64_t quote_lots_per_base_unit_per_tick = 0;
        uint64_t sequence_number = 0;
        uint64_t taker_fee_bps = 0;
        uint64_t collected_quote_lot_fees = 0;
        uint64_t unclaimed_quote_lot_fees = 0;

        // True only when decode_market() compared the header against an expected discriminant
        bool schema_verified = false;

        // Bids: price descending. Asks: price ascending. Ties by sequence number ascending.
        std::vector<OrderEntry> bids;
        std::vector<OrderEntry> asks;

        std::unordered_map<Pubkey, TraderState, PubkeyHash> traders;
        std::unordered_map<Pubkey, uint64_t, PubkeyHash> trader_pubkey_to_index;
        std::unordered_map<uint64_t, Pubkey> trader_index_to_pubkey;

        /**
         * @brief Resolves a resting order's trader index to the maker's key.
         * @return std::nullopt when the index has no live trader entry. That is a
         *         data-integrity signal, not a default maker.
         */
        std::optional<Pubkey> maker_for(uint64_t trader_index) const;

        /**
         * @brief Trader indices referenced by resting orders without a live trader.
         * Sorted ascending, without duplicates. Empty for a consistent account.
         */
        std::vector<uint64_t> unresolved_makers() const;
    };

    // Function: reconstruct_sequence_number
    // Description: Turns the stored sequence word into the displayable arrival counter.
    //              The word is a two's complement i64; bids store it bit-inverted so that
    //              ascending key order is best-price-first. Negative values map to -v - 1.
    // Inputs: raw - OrderId::order_sequence_number as stored.
    // Outputs: Non-negative sequence number.
    uint64_t reconstruct_sequence_number(uint64_t raw);

    inline uint64_t reconstruct_sequence_number(const OrderId& id) {
        return reconstruct_sequence_number(id.order_sequence_number);
    }

    // Byte width of a tree sub-buffer holding `capacity` nodes
    size_t arena_tree_size(uint64_t capacity, size_t key_size, size_t value_size);

    // Function: decode_market_header
    // Description: Decodes the fixed 576-byte header field by field.
    MarketHeader decode_market_header(std::span<const uint8_t> data);

    // Function: decode_market
    // Description: Header, padding, six scalars, then bids / asks / traders trees.
    // Inputs: data - whole market account.
    //         expected_discriminant - when set, the header must carry this schema tag.
    //                                 Without it the header version is NOT checked: any
    //                                 account with a plausible layout decodes, and the
    //                                 snapshot reports schema_verified == false.
    // Outputs: Sorted snapshot. Throws DecodeError on truncation (SizeMismatch),
    //          schema mismatch (VersionMismatch) and corrupt content (Corruption).
    MarketSnapshot decode_market(std::span<const uint8_t> data,
                                 std::optional<uint64_t> expected_discriminant = std::nullopt);

}
