#include "market/MarketSnapshot.hpp"
#include "market/ArenaTree.hpp"
#include "common/Errors.hpp"
#include "common/Utils.hpp"
#include <algorithm>
#include <limits>
#include <string>

namespace phoenix {

    namespace {

        TokenParams read_token_params(utils::ByteReader& reader) {
            TokenParams params;
            params.decimals = reader.u32();
            params.vault_bump = reader.u32();
            params.mint_key = reader.pubkey();
            params.vault_key = reader.pubkey();
            return params;
        }

        void require_nonzero(uint64_t value, const char* field) {
            if (value == 0) {
                throw DecodeError(ErrorKind::Corruption, std::string(field) + " is zero");
            }
        }

        // Every divisor the unit conversions use must be usable before a snapshot escapes
        void validate_scales(const MarketSnapshot& snapshot) {
            const MarketHeader& h = snapshot.header;
            require_nonzero(h.base_lot_size, "base_lot_size");
            require_nonzero(h.quote_lot_size, "quote_lot_size");
            require_nonzero(h.raw_base_units_per_base_unit, "raw_base_units_per_base_unit");
            require_nonzero(snapshot.base_lots_per_base_unit, "base_lots_per_base_unit");
            require_nonzero(snapshot.quote_lots_per_base_unit_per_tick, "quote_lots_per_base_unit_per_tick");

            if (h.base_params.decimals > constants::MAX_DECIMALS ||
                h.quote_params.decimals > constants::MAX_DECIMALS) {
                throw DecodeError(ErrorKind::Corruption,
                    "token decimals " + std::to_string(h.base_params.decimals) + "/" +
                    std::to_string(h.quote_params.decimals) + " out of range");
            }
        }

        std::vector<OrderEntry> decode_orders(std::span<const uint8_t> tree_bytes) {
            ArenaTree tree = decode_arena_tree(tree_bytes, constants::ORDER_ID_SIZE,
                                               constants::RESTING_ORDER_SIZE);
            std::vector<ArenaNode> live = tree.live();

            std::vector<OrderEntry> orders;
            orders.reserve(live.size());
            for (const auto& node : live) {
                utils::ByteReader key(node.key);
                utils::ByteReader value(node.value);

                OrderId id;
                id.price_in_ticks = key.u64();
                id.order_sequence_number = key.u64();

                RestingOrder order;
                order.trader_index = value.u64();
                order.num_base_lots = value.u64();
                order.last_valid_slot = value.u64();
                order.last_valid_unix_timestamp_in_seconds = value.u64();

                if (order.num_base_lots == 0) {
                    throw DecodeError(ErrorKind::Corruption,
                        "live order at arena address " + std::to_string(node.address) + " has zero size");
                }
                orders.emplace_back(id, order);
            }
            return orders;
        }

        void decode_traders(std::span<const uint8_t> tree_bytes, MarketSnapshot& snapshot) {
            ArenaTree tree = decode_arena_tree(tree_bytes, constants::PUBKEY_SIZE,
                                               constants::TRADER_STATE_SIZE);
            for (const auto& node : tree.live()) {
                Pubkey trader = utils::ByteReader(node.key).pubkey();

                utils::ByteReader value(node.value);
                TraderState state;
                state.quote_lots_locked = value.u64();
                state.quote_lots_free = value.u64();
                state.base_lots_locked = value.u64();
                state.base_lots_free = value.u64();

                snapshot.traders[trader] = state;
                snapshot.trader_pubkey_to_index[trader] = node.address;
                snapshot.trader_index_to_pubkey[node.address] = trader;
            }
        }

    }

    std::optional<Pubkey> MarketSnapshot::maker_for(uint64_t trader_index) const {
        auto it = trader_index_to_pubkey.find(trader_index);
        if (it == trader_index_to_pubkey.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::vector<uint64_t> MarketSnapshot::unresolved_makers() const {
        std::vector<uint64_t> missing;
        for (const auto* side : {&bids, &asks}) {
            for (const auto& [id, order] : *side) {
                if (trader_index_to_pubkey.count(order.trader_index) == 0) {
                    missing.push_back(order.trader_index);
                }
            }
        }
        std::sort(missing.begin(), missing.end());
        missing.erase(std::unique(missing.begin(), missing.end()), missing.end());
        return missing;
    }

    uint64_t reconstruct_sequence_number(uint64_t raw) {
        const int64_t value = static_cast<int64_t>(raw);
        if (value < 0) {
            // ~v == -v - 1, and stays defined for INT64_MIN
            return static_cast<uint64_t>(~value);
        }
        return static_cast<uint64_t>(value);
    }

    size_t arena_tree_size(uint64_t capacity, size_t key_size, size_t value_size) {
        const size_t node_size = constants::NODE_REGISTERS_SIZE + key_size + value_size;
        if (capacity > (std::numeric_limits<size_t>::max() - constants::TREE_PREFIX_SIZE) / node_size) {
            throw DecodeError(ErrorKind::SizeMismatch,
                "tree capacity " + std::to_string(capacity) + " overflows the address space");
        }
        return constants::TREE_PREFIX_SIZE + static_cast<size_t>(capacity) * node_size;
    }

    MarketHeader decode_market_header(std::span<const uint8_t> data) {
        if (data.size() < constants::MARKET_HEADER_SIZE) {
            throw DecodeError(ErrorKind::SizeMismatch,
                "market header needs " + std::to_string(constants::MARKET_HEADER_SIZE) +
                " bytes, got " + std::to_string(data.size()));
        }

        utils::ByteReader reader(data);
        MarketHeader header{};
        header.discriminant = reader.u64();
        header.status = reader.u64();
        header.bids_size = reader.u64();
        header.asks_size = reader.u64();
        header.num_seats = reader.u64();
        header.base_params = read_token_params(reader);
        header.base_lot_size = reader.u64();
        header.quote_params = read_token_params(reader);
        header.quote_lot_size = reader.u64();
        header.tick_size_in_quote_atoms_per_base_unit = reader.u64();
        header.authority = reader.pubkey();
        header.fee_recipient = reader.pubkey();
        header.market_sequence_number = reader.u64();
        header.successor = reader.pubkey();
        header.raw_base_units_per_base_unit = reader.u32();
        reader.skip(4);      // _padding1
        reader.skip(8 * 32); // _padding2
        return header;
    }

    MarketSnapshot decode_market(std::span<const uint8_t> data,
                                 std::optional<uint64_t> expected_discriminant) {
        MarketSnapshot snapshot;

        // 1. Header and schema check
        snapshot.header = decode_market_header(data);
        if (expected_discriminant && snapshot.header.discriminant != *expected_discriminant) {
            throw DecodeError(ErrorKind::VersionMismatch,
                "header discriminant " + std::to_string(snapshot.header.discriminant) +
                " != expected " + std::to_string(*expected_discriminant));
        }
        snapshot.schema_verified = expected_discriminant.has_value();

        // 2. Market scalars after the padding block
        utils::ByteReader reader(data, constants::MARKET_HEADER_SIZE);
        reader.skip(constants::MARKET_PADDING_SIZE);
        snapshot.base_lots_per_base_unit = reader.u64();
        snapshot.quote_lots_per_base_unit_per_tick = reader.u64();
        snapshot.sequence_number = reader.u64();
        snapshot.taker_fee_bps = reader.u64();
        snapshot.collected_quote_lot_fees = reader.u64();
        snapshot.unclaimed_quote_lot_fees = reader.u64();

        validate_scales(snapshot);

        // 3. Sub-buffer extents from the header capacities
        const MarketHeader& h = snapshot.header;
        const size_t bids_len = arena_tree_size(h.bids_size, constants::ORDER_ID_SIZE, constants::RESTING_ORDER_SIZE);
        const size_t asks_len = arena_tree_size(h.asks_size, constants::ORDER_ID_SIZE, constants::RESTING_ORDER_SIZE);
        const size_t traders_len = arena_tree_size(h.num_seats, constants::PUBKEY_SIZE, constants::TRADER_STATE_SIZE);

        const size_t bids_offset = reader.offset();
        const size_t available = data.size() - bids_offset;
        if (bids_len > available || asks_len > available - bids_len ||
            traders_len > available - bids_len - asks_len) {
            throw DecodeError(ErrorKind::SizeMismatch,
                "trees need " + std::to_string(bids_len) + "+" + std::to_string(asks_len) + "+" +
                std::to_string(traders_len) + " bytes, " + std::to_string(available) + " available");
        }

        const auto bids_bytes = data.subspan(bids_offset, bids_len);
        const auto asks_bytes = data.subspan(bids_offset + bids_len, asks_len);
        const auto traders_bytes = data.subspan(bids_offset + bids_len + asks_len, traders_len);

        // 4. Trees
        snapshot.bids = decode_orders(bids_bytes);
        snapshot.asks = decode_orders(asks_bytes);
        decode_traders(traders_bytes, snapshot);

        // 5. Price-time order
        std::sort(snapshot.bids.begin(), snapshot.bids.end(), [](const OrderEntry& a, const OrderEntry& b) {
            if (a.first.price_in_ticks != b.first.price_in_ticks) {
                return a.first.price_in_ticks > b.first.price_in_ticks;
            }
            return reconstruct_sequence_number(a.first) < reconstruct_sequence_number(b.first);
        });
        std::sort(snapshot.asks.begin(), snapshot.asks.end(), [](const OrderEntry& a, const OrderEntry& b) {
            if (a.first.price_in_ticks != b.first.price_in_ticks) {
                return a.first.price_in_ticks < b.first.price_in_ticks;
            }
            return reconstruct_sequence_number(a.first) < reconstruct_sequence_number(b.first);
        });

        return snapshot;
    }

}
