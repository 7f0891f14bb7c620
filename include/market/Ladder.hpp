#pragma once

#include "common/Utils.hpp"
#include "market/MarketSnapshot.hpp"
#include <cstdint>
#include <limits>
#include <vector>

namespace phoenix {

    // Depth value meaning "the whole side"
    constexpr size_t kUnlimitedDepth = std::numeric_limits<size_t>::max();

    struct LadderLevel {
        uint64_t price_in_ticks;
        uint64_t size_in_base_lots;
    };

    // Bids best (highest) first, asks best (lowest) first
    struct Ladder {
        std::vector<LadderLevel> bids;
        std::vector<LadderLevel> asks;
    };

    // Display units: price in quote units per raw base unit, size in raw base units
    struct UiLadderLevel {
        double price;
        double quantity;
    };

    struct UiLadder {
        std::vector<UiLadderLevel> bids;
        std::vector<UiLadderLevel> asks;
    };

    // Function: is_expired
    // Description: An order is live through its last valid slot / second inclusive.
    //              A zero limit never expires.
    inline bool is_expired(const RestingOrder& order, uint64_t slot, uint64_t unix_timestamp) {
        if (order.last_valid_slot != 0 && order.last_valid_slot < slot) return true;
        if (order.last_valid_unix_timestamp_in_seconds != 0 &&
            order.last_valid_unix_timestamp_in_seconds < unix_timestamp) return true;
        return false;
    }

    // Function: get_ladder
    // Description: Aggregates live orders by price, per side, in book order.
    // Inputs: snapshot - decoded market.
    //         slot / unix_timestamp - current clock, used for expiry.
    //         levels - max distinct prices per side; kUnlimitedDepth for all, 0 for none.
    // Outputs: Ladder in ticks and base lots.
    Ladder get_ladder(const MarketSnapshot& snapshot, uint64_t slot, uint64_t unix_timestamp,
                      size_t levels = constants::DEFAULT_L2_LADDER_DEPTH);

    // Function: get_ui_ladder
    // Description: get_ladder() with every level converted to display units.
    //              Floating point, not fit for settlement.
    UiLadder get_ui_ladder(const MarketSnapshot& snapshot, uint64_t slot, uint64_t unix_timestamp,
                           size_t levels = constants::DEFAULT_L2_LADDER_DEPTH);

    UiLadder to_ui_ladder(const MarketSnapshot& snapshot, const Ladder& ladder);

}
