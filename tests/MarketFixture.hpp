#pragma once

// Builds synthetic market and clock accounts byte for byte, in the on-chain layout.

#include "common/Types.hpp"
#include "common/Utils.hpp"
#include "market/MarketSnapshot.hpp"
#include <cstdint>
#include <cstring>
#include <map>
#include <vector>

namespace phoenix::fixture {

    class ByteWriter {
    public:
        void u8(uint8_t v) { bytes_.push_back(v); }
        void u64(uint64_t v) { put(&v, sizeof(v)); }
        void u128(uint64_t low, uint64_t high) { u64(low); u64(high); }
        void u32(uint32_t v) { put(&v, sizeof(v)); }
        void i64(int64_t v) { put(&v, sizeof(v)); }
        void i32(int32_t v) { put(&v, sizeof(v)); }
        void pubkey(const Pubkey& key) { put(key.bytes.data(), key.bytes.size()); }
        void zeros(size_t n) { bytes_.insert(bytes_.end(), n, 0); }
        void raw(const std::vector<uint8_t>& data) { bytes_.insert(bytes_.end(), data.begin(), data.end()); }

        std::vector<uint8_t>& bytes() { return bytes_; }

    private:
        void put(const void* data, size_t n) {
            const auto* p = static_cast<const uint8_t*>(data);
            bytes_.insert(bytes_.end(), p, p + n);
        }

        std::vector<uint8_t> bytes_;
    };

    inline Pubkey key_of(uint8_t tag) {
        Pubkey key;
        key.bytes.fill(tag);
        return key;
    }

    // Stored sequence words: bids keep the bitwise complement
    inline uint64_t bid_sequence(uint64_t seq) { return ~seq; }
    inline uint64_t ask_sequence(uint64_t seq) { return seq; }

    // Function: TreeWriter
    // Description: Lays out an arena tree. Slots are allocated in call order from
    //              address 1; free slots are chained in order and end at the bump index.
    class TreeWriter {
    public:
        TreeWriter(uint64_t capacity, size_t key_size, size_t value_size)
            : capacity_(capacity), key_size_(key_size), value_size_(value_size) {}

        uint32_t add(const std::vector<uint8_t>& key, const std::vector<uint8_t>& value) {
            slots_.push_back({key, value, false});
            return static_cast<uint32_t>(slots_.size());
        }

        uint32_t add_free() {
            slots_.push_back({std::vector<uint8_t>(key_size_, 0), std::vector<uint8_t>(value_size_, 0), true});
            return static_cast<uint32_t>(slots_.size());
        }

        // Corruption hooks
        void override_free_head(int32_t head) { head_override_ = head; has_head_override_ = true; }
        void override_next(uint32_t address, int32_t next) { next_override_[address] = next; }
        void override_bump(int32_t bump) { bump_override_ = bump; has_bump_override_ = true; }

        std::vector<uint8_t> bytes() const {
            const int32_t bump = has_bump_override_ ? bump_override_ : static_cast<int32_t>(slots_.size()) + 1;

            std::vector<uint32_t> free;
            for (size_t i = 0; i < slots_.size(); ++i) {
                if (slots_[i].free) free.push_back(static_cast<uint32_t>(i + 1));
            }
            std::map<uint32_t, int32_t> next;
            for (size_t i = 0; i < free.size(); ++i) {
                next[free[i]] = i + 1 < free.size() ? static_cast<int32_t>(free[i + 1]) : bump;
            }
            for (const auto& [address, value] : next_override_) next[address] = value;

            int32_t head = free.empty() ? bump : static_cast<int32_t>(free.front());
            if (has_head_override_) head = head_override_;

            ByteWriter w;
            w.zeros(constants::TREE_HEADER_SIZE);
            w.u64(0);
            w.i32(bump);
            w.i32(head);
            for (size_t i = 0; i < slots_.size(); ++i) {
                const uint32_t address = static_cast<uint32_t>(i + 1);
                auto it = next.find(address);
                w.i32(it == next.end() ? 0 : it->second);
                w.zeros(12);
                w.raw(slots_[i].key);
                w.raw(slots_[i].value);
            }

            std::vector<uint8_t> out = std::move(w.bytes());
            out.resize(arena_tree_size(capacity_, key_size_, value_size_), 0);
            return out;
        }

    private:
        struct Slot {
            std::vector<uint8_t> key;
            std::vector<uint8_t> value;
            bool free;
        };

        uint64_t capacity_;
        size_t key_size_;
        size_t value_size_;
        std::vector<Slot> slots_;
        std::map<uint32_t, int32_t> next_override_;
        int32_t head_override_ = 0;
        bool has_head_override_ = false;
        int32_t bump_override_ = 0;
        bool has_bump_override_ = false;
    };

    struct FixtureOrder {
        uint64_t price_in_ticks;
        uint64_t sequence;        // displayable sequence number
        uint64_t trader_index;
        uint64_t num_base_lots;
        uint64_t last_valid_slot = 0;
        uint64_t last_valid_unix_timestamp_in_seconds = 0;
    };

    struct FixtureTrader {
        Pubkey key;
        TraderState state{};
    };

    // Function: FixtureMarket
    // Description: Every field that ends up in the account. Defaults give a unit
    //              scale where one tick is one quote unit and one lot is one base unit.
    struct FixtureMarket {
        uint64_t discriminant = 0;
        uint64_t status = 1;
        uint64_t bids_size = 8;
        uint64_t asks_size = 8;
        uint64_t num_seats = 4;
        TokenParams base_params{0, 0, key_of(0xB1), key_of(0xB2)};
        uint64_t base_lot_size = 1;
        TokenParams quote_params{0, 0, key_of(0xC1), key_of(0xC2)};
        uint64_t quote_lot_size = 1;
        uint64_t tick_size_in_quote_atoms_per_base_unit = 1;
        Pubkey authority = key_of(0xA1);
        Pubkey fee_recipient = key_of(0xA2);
        uint64_t market_sequence_number = 7;
        Pubkey successor = key_of(0xA3);
        uint32_t raw_base_units_per_base_unit = 1;

        uint64_t base_lots_per_base_unit = 1;
        uint64_t quote_lots_per_base_unit_per_tick = 1;
        uint64_t sequence_number = 42;
        uint64_t taker_fee_bps = 0;
        uint64_t collected_quote_lot_fees = 0;
        uint64_t unclaimed_quote_lot_fees = 0;

        std::vector<FixtureOrder> bids;
        std::vector<FixtureOrder> asks;
        std::vector<FixtureTrader> traders;
        size_t free_bid_slots = 0;  // freed slots interleaved ahead of the live bids
    };

    inline std::vector<uint8_t> order_key(uint64_t price, uint64_t raw_sequence) {
        ByteWriter w;
        w.u64(price);
        w.u64(raw_sequence);
        return std::move(w.bytes());
    }

    inline std::vector<uint8_t> order_value(const FixtureOrder& order) {
        ByteWriter w;
        w.u64(order.trader_index);
        w.u64(order.num_base_lots);
        w.u64(order.last_valid_slot);
        w.u64(order.last_valid_unix_timestamp_in_seconds);
        return std::move(w.bytes());
    }

    inline TreeWriter order_tree(uint64_t capacity, const std::vector<FixtureOrder>& orders, bool bids,
                                 size_t free_slots = 0) {
        TreeWriter tree(capacity, constants::ORDER_ID_SIZE, constants::RESTING_ORDER_SIZE);
        for (size_t i = 0; i < free_slots; ++i) tree.add_free();
        for (const auto& order : orders) {
            const uint64_t raw = bids ? bid_sequence(order.sequence) : ask_sequence(order.sequence);
            tree.add(order_key(order.price_in_ticks, raw), order_value(order));
        }
        return tree;
    }

    inline TreeWriter trader_tree(uint64_t capacity, const std::vector<FixtureTrader>& traders) {
        TreeWriter tree(capacity, constants::PUBKEY_SIZE, constants::TRADER_STATE_SIZE);
        for (const auto& trader : traders) {
            ByteWriter key;
            key.pubkey(trader.key);
            ByteWriter value;
            value.u64(trader.state.quote_lots_locked);
            value.u64(trader.state.quote_lots_free);
            value.u64(trader.state.base_lots_locked);
            value.u64(trader.state.base_lots_free);
            value.zeros(constants::TRADER_STATE_SIZE - 32);
            tree.add(key.bytes(), value.bytes());
        }
        return tree;
    }

    inline void write_token_params(ByteWriter& w, const TokenParams& params) {
        w.u32(params.decimals);
        w.u32(params.vault_bump);
        w.pubkey(params.mint_key);
        w.pubkey(params.vault_key);
    }

    inline std::vector<uint8_t> encode_header(const FixtureMarket& m) {
        ByteWriter w;
        w.u64(m.discriminant);
        w.u64(m.status);
        w.u64(m.bids_size);
        w.u64(m.asks_size);
        w.u64(m.num_seats);
        write_token_params(w, m.base_params);
        w.u64(m.base_lot_size);
        write_token_params(w, m.quote_params);
        w.u64(m.quote_lot_size);
        w.u64(m.tick_size_in_quote_atoms_per_base_unit);
        w.pubkey(m.authority);
        w.pubkey(m.fee_recipient);
        w.u64(m.market_sequence_number);
        w.pubkey(m.successor);
        w.u32(m.raw_base_units_per_base_unit);
        w.zeros(4 + 8 * 32);
        return std::move(w.bytes());
    }

    // Function: encode_market
    // Description: Header, padding, scalars, then the three trees with the given ones
    //              substituted when supplied (for corruption cases).
    inline std::vector<uint8_t> encode_market(const FixtureMarket& m, const TreeWriter* bids_override = nullptr,
                                              const TreeWriter* asks_override = nullptr) {
        ByteWriter w;
        w.raw(encode_header(m));
        w.zeros(constants::MARKET_PADDING_SIZE);
        w.u64(m.base_lots_per_base_unit);
        w.u64(m.quote_lots_per_base_unit_per_tick);
        w.u64(m.sequence_number);
        w.u64(m.taker_fee_bps);
        w.u64(m.collected_quote_lot_fees);
        w.u64(m.unclaimed_quote_lot_fees);

        w.raw(bids_override ? bids_override->bytes() : order_tree(m.bids_size, m.bids, true, m.free_bid_slots).bytes());
        w.raw(asks_override ? asks_override->bytes() : order_tree(m.asks_size, m.asks, false).bytes());
        w.raw(trader_tree(m.num_seats, m.traders).bytes());
        return std::move(w.bytes());
    }

    inline std::vector<uint8_t> encode_clock(uint64_t slot, int64_t unix_timestamp) {
        ByteWriter w;
        w.u64(slot);
        w.i64(unix_timestamp - 1000);
        w.u64(500);
        w.u64(501);
        w.i64(unix_timestamp);
        return std::move(w.bytes());
    }

}
