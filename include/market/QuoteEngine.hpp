#pragma once

#include "common/Types.hpp"
#include "common/Utils.hpp"
#include "market/Ladder.hpp"
#include "market/MarketSnapshot.hpp"
#include <cstdint>
#include <optional>

namespace phoenix {

    // Function: expected_out_amount
    // Description: Estimates what a market order receives by walking the opposite side.
    //              Side::Bid spends quote units against the asks and returns base units.
    //              Side::Ask sells base units into the bids and returns quote units.
    //              The input is reduced by the taker fee first. When the book runs out
    //              the amount fillable so far is returned with no further signal.
    // Inputs: ladder - display-unit ladder, best level first.
    //         taker_fee_bps - fee in basis points.
    //         side - side of the incoming order.
    //         in_amount - units of the token being sold.
    // Outputs: Units of the token being bought.
    double expected_out_amount(const UiLadder& ladder, uint64_t taker_fee_bps, Side side, double in_amount);

    struct SwapEstimate {
        double out_amount = 0.0;
        double unfilled_in_amount = 0.0;   // post-fee input left when the book ran out
        bool liquidity_exhausted = false;
    };

    // Same walk as expected_out_amount(), reporting whether the visible book covered the input.
    SwapEstimate estimate_swap(const UiLadder& ladder, uint64_t taker_fee_bps, Side side, double in_amount);

    struct SimulationSummaryInLots {
        uint64_t base_lots_filled = 0;
        uint64_t quote_lots_filled = 0;
    };

    /**
     * @class LadderSimulator
     * @brief Lot-exact market order simulation over a tick/lot ladder.
     *
     * Quantities are scaled by base_lots_per_base_unit while walking so every
     * step stays in integers; results are floored back to lots. Intermediate
     * products are 128-bit and saturate to u64 on the way out.
     */
    class LadderSimulator {
    public:
        LadderSimulator(Ladder ladder, uint64_t tick_size_in_quote_lots_per_base_unit,
                        uint64_t base_lots_per_base_unit);

        // Whole book, optionally dropping orders expired at the given slot / timestamp
        static LadderSimulator from_snapshot(const MarketSnapshot& snapshot,
                                             std::optional<uint64_t> slot = std::nullopt,
                                             std::optional<uint64_t> unix_timestamp = std::nullopt);

        // Buy base with quote lots, walking the asks
        SimulationSummaryInLots sell_quote(uint64_t num_quote_lots) const;
        // Sell base lots into the bids
        SimulationSummaryInLots sell_base(uint64_t num_base_lots) const;
        // Side::Bid sells quote, Side::Ask sells base
        SimulationSummaryInLots simulate_market_sell(Side side, uint64_t size_in_lots) const;

        const Ladder& ladder() const { return ladder_; }

    private:
        Ladder ladder_;
        uint64_t tick_size_in_quote_lots_per_base_unit_;
        uint64_t base_lots_per_base_unit_;
    };

    struct SwapOrderLimits {
        Side side;
        uint64_t num_base_lots = 0;
        uint64_t num_quote_lots = 0;
        uint64_t min_base_lots_to_fill = 0;
        uint64_t min_quote_lots_to_fill = 0;
        uint64_t match_limit = constants::DEFAULT_MATCH_LIMIT;
        std::optional<uint64_t> last_valid_slot;
        std::optional<uint64_t> last_valid_unix_timestamp_in_seconds;
        double expected_out_amount = 0.0;
    };

    // Function: swap_order_limits
    // Description: Sizes an immediate-or-cancel swap from a display-unit input amount.
    //              Side::Ask sells base: num_base_lots is floored, min_quote_lots_to_fill is
    //              the expected quote out reduced by slippage, rounded up. Side::Bid mirrors it.
    // Inputs: slippage - tolerated fraction, 0.005 for 0.5 %.
    //         slot, unix_timestamp - clock used to drop expired orders from the estimate.
    //         match_limit - cap on resting orders the swap may cross.
    // Outputs: Limits with no time-in-force set.
    SwapOrderLimits swap_order_limits(const MarketSnapshot& snapshot, Side side, double in_amount,
                                      double slippage, uint64_t slot, uint64_t unix_timestamp,
                                      uint64_t match_limit = constants::DEFAULT_MATCH_LIMIT);

    // Same sizing, with the order rejected after the given slot and/or unix timestamp
    SwapOrderLimits swap_order_limits_with_time_in_force(const MarketSnapshot& snapshot, Side side,
                                                         double in_amount, double slippage, uint64_t slot,
                                                         uint64_t unix_timestamp,
                                                         std::optional<uint64_t> last_valid_slot,
                                                         std::optional<uint64_t> last_valid_unix_timestamp_in_seconds,
                                                         uint64_t match_limit = constants::DEFAULT_MATCH_LIMIT);

}
