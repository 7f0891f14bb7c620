#include "market/L3Book.hpp"
#include "market/Ladder.hpp"
#include "market/UnitConverter.hpp"

namespace phoenix {

    namespace {

        std::vector<L3Order> collect_side(const MarketSnapshot& snapshot, const std::vector<OrderEntry>& orders,
                                          Side side, uint64_t slot, uint64_t unix_timestamp, size_t limit) {
            std::vector<L3Order> out;
            for (const auto& [id, order] : orders) {
                if (out.size() == limit) break;
                if (is_expired(order, slot, unix_timestamp)) continue;

                out.push_back({
                    id.price_in_ticks,
                    order.num_base_lots,
                    side,
                    snapshot.maker_for(order.trader_index),
                    reconstruct_sequence_number(id)
                });
            }
            return out;
        }

        std::vector<L3UiOrder> convert_side(const UnitConverter& converter, const std::vector<L3Order>& orders) {
            std::vector<L3UiOrder> out;
            out.reserve(orders.size());
            for (const auto& order : orders) {
                out.push_back({
                    converter.ticks_to_float_price(order.price_in_ticks),
                    converter.base_lots_to_raw_base_units(order.size_in_base_lots),
                    order.side,
                    order.maker,
                    order.order_sequence_number
                });
            }
            return out;
        }

    }

    L3Book get_l3_book(const MarketSnapshot& snapshot, uint64_t slot, uint64_t unix_timestamp,
                       size_t orders_per_side) {
        L3Book book;
        book.bids = collect_side(snapshot, snapshot.bids, Side::Bid, slot, unix_timestamp, orders_per_side);
        book.asks = collect_side(snapshot, snapshot.asks, Side::Ask, slot, unix_timestamp, orders_per_side);
        return book;
    }

    L3UiBook get_l3_ui_book(const MarketSnapshot& snapshot, uint64_t slot, uint64_t unix_timestamp,
                            size_t orders_per_side) {
        const L3Book book = get_l3_book(snapshot, slot, unix_timestamp, orders_per_side);
        const UnitConverter converter(MarketScale::from_snapshot(snapshot));

        L3UiBook ui;
        ui.bids = convert_side(converter, book.bids);
        ui.asks = convert_side(converter, book.asks);
        return ui;
    }

}
