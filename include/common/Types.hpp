#pragma once

#include <cstdint>
#include <cstddef>
#include <cstring>
#include <array>
#include <functional>

namespace phoenix {

    // Function: Pubkey
    // Description: 32-byte account identifier (mints, vaults, traders).
    struct Pubkey {
        std::array<uint8_t, 32> bytes{};

        bool operator==(const Pubkey& other) const { return bytes == other.bytes; }
        bool operator!=(const Pubkey& other) const { return bytes != other.bytes; }
        bool operator<(const Pubkey& other) const { return bytes < other.bytes; }
    };

    struct PubkeyHash {
        size_t operator()(const Pubkey& key) const {
            // Keys are uniformly distributed already, the first word is enough
            uint64_t word;
            std::memcpy(&word, key.bytes.data(), sizeof(word));
            return std::hash<uint64_t>{}(word);
        }
    };

    enum class Side : uint8_t {
        Bid,
        Ask
    };

    // Function: OrderId
    // Description: Key of the bid and ask trees. The sequence number is stored
    //              as a two's complement u64 with bits inverted for bids.
    struct OrderId {
        uint64_t price_in_ticks;
        uint64_t order_sequence_number;
    };

    // Function: RestingOrder
    // Description: Value of the bid and ask trees.
    //              trader_index is the 1-indexed arena address in the trader tree.
    //              0 in either expiry field means "never expires".
    struct RestingOrder {
        uint64_t trader_index;
        uint64_t num_base_lots;
        uint64_t last_valid_slot;
        uint64_t last_valid_unix_timestamp_in_seconds;
    };

    struct TraderState {
        uint64_t quote_lots_locked;
        uint64_t quote_lots_free;
        uint64_t base_lots_locked;
        uint64_t base_lots_free;
    };

    struct TokenParams {
        uint32_t decimals;
        uint32_t vault_bump;
        Pubkey mint_key;
        Pubkey vault_key;
    };

    // Function: MarketHeader
    // Description: Fixed 576-byte account header. Decoded field by field, never
    //              memcpy'd, so host struct padding does not matter.
    struct MarketHeader {
        uint64_t discriminant;
        uint64_t status;
        uint64_t bids_size;
        uint64_t asks_size;
        uint64_t num_seats;
        TokenParams base_params;
        uint64_t base_lot_size;
        TokenParams quote_params;
        uint64_t quote_lot_size;
        uint64_t tick_size_in_quote_atoms_per_base_unit;
        Pubkey authority;
        Pubkey fee_recipient;
        uint64_t market_sequence_number;
        Pubkey successor;
        uint32_t raw_base_units_per_base_unit;
    };

    // Solana clock sysvar
    struct Clock {
        uint64_t slot;
        int64_t epoch_start_timestamp;
        uint64_t epoch;
        uint64_t leader_schedule_epoch;
        int64_t unix_timestamp;
    };

}
