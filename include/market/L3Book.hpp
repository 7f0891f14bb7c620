#pragma once

#include "common/Types.hpp"
#include "common/Utils.hpp"
#include "market/MarketSnapshot.hpp"
#include <cstdint>
#include <optional>
#include <vector>

namespace phoenix {

    struct L3Order {
        uint64_t price_in_ticks;
        uint64_t size_in_base_lots;
        Side side;
        std::optional<Pubkey> maker;  // empty when the trader index is unresolved
        uint64_t order_sequence_number;
    };

    struct L3Book {
        std::vector<L3Order> bids;
        std::vector<L3Order> asks;
    };

    struct L3UiOrder {
        double price;
        double size;
        Side side;
        std::optional<Pubkey> maker;
        uint64_t order_sequence_number;
    };

    struct L3UiBook {
        std::vector<L3UiOrder> bids;
        std::vector<L3UiOrder> asks;
    };

    // Function: get_l3_book
    // Description: One entry per live order, same expiry rule as the ladder, no aggregation.
    // Inputs: orders_per_side - max entries per side; kUnlimitedDepth for all.
    L3Book get_l3_book(const MarketSnapshot& snapshot, uint64_t slot, uint64_t unix_timestamp,
                       size_t orders_per_side = constants::DEFAULT_L3_BOOK_DEPTH);

    L3UiBook get_l3_ui_book(const MarketSnapshot& snapshot, uint64_t slot, uint64_t unix_timestamp,
                            size_t orders_per_side = constants::DEFAULT_L3_BOOK_DEPTH);

}
