#include "market/Ladder.hpp"
#include "market/UnitConverter.hpp"

namespace phoenix {

    namespace {

        // Orders arrive already in book order, so equal prices are adjacent
        std::vector<LadderLevel> aggregate_side(const std::vector<OrderEntry>& orders, uint64_t slot,
                                                uint64_t unix_timestamp, size_t levels) {
            std::vector<LadderLevel> side;
            for (const auto& [id, order] : orders) {
                if (is_expired(order, slot, unix_timestamp)) continue;

                if (!side.empty() && side.back().price_in_ticks == id.price_in_ticks) {
                    side.back().size_in_base_lots += order.num_base_lots;
                    continue;
                }
                if (side.size() == levels) break;
                side.push_back({id.price_in_ticks, order.num_base_lots});
            }
            return side;
        }

        std::vector<UiLadderLevel> convert_side(const UnitConverter& converter,
                                                const std::vector<LadderLevel>& levels) {
            std::vector<UiLadderLevel> out;
            out.reserve(levels.size());
            for (const auto& level : levels) {
                out.push_back({
                    converter.ticks_to_float_price(level.price_in_ticks),
                    converter.base_lots_to_raw_base_units(level.size_in_base_lots)
                });
            }
            return out;
        }

    }

    Ladder get_ladder(const MarketSnapshot& snapshot, uint64_t slot, uint64_t unix_timestamp, size_t levels) {
        Ladder ladder;
        ladder.bids = aggregate_side(snapshot.bids, slot, unix_timestamp, levels);
        ladder.asks = aggregate_side(snapshot.asks, slot, unix_timestamp, levels);
        return ladder;
    }

    UiLadder to_ui_ladder(const MarketSnapshot& snapshot, const Ladder& ladder) {
        const UnitConverter converter(MarketScale::from_snapshot(snapshot));
        UiLadder ui;
        ui.bids = convert_side(converter, ladder.bids);
        ui.asks = convert_side(converter, ladder.asks);
        return ui;
    }

    UiLadder get_ui_ladder(const MarketSnapshot& snapshot, uint64_t slot, uint64_t unix_timestamp, size_t levels) {
        return to_ui_ladder(snapshot, get_ladder(snapshot, slot, unix_timestamp, levels));
    }

}
