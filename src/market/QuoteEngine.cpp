#include "market/QuoteEngine.hpp"
#include "market/UnitConverter.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace phoenix {

    namespace {

        using u128 = unsigned __int128;

        uint64_t saturate(u128 value) {
            if (value > std::numeric_limits<uint64_t>::max()) return std::numeric_limits<uint64_t>::max();
            return static_cast<uint64_t>(value);
        }

        constexpr u128 U128_MAX = ~static_cast<u128>(0);

        // a * b * c, pinned at the 128-bit maximum instead of wrapping
        u128 saturating_product(uint64_t a, uint64_t b, uint64_t c) {
            const u128 ab = static_cast<u128>(a) * b;
            if (c != 0 && ab > U128_MAX / c) return U128_MAX;
            return ab * c;
        }

        u128 saturating_add(u128 a, u128 b) {
            return a > U128_MAX - b ? U128_MAX : a + b;
        }

        uint64_t ceil_to_u64(double value) {
            if (!std::isfinite(value) || value <= 0.0) return 0;
            const double rounded = std::ceil(value);
            if (rounded >= 18446744073709551615.0) return std::numeric_limits<uint64_t>::max();
            return static_cast<uint64_t>(rounded);
        }

        uint64_t floor_to_u64(double value) {
            if (!std::isfinite(value) || value <= 0.0) return 0;
            const double rounded = std::floor(value);
            if (rounded >= 18446744073709551615.0) return std::numeric_limits<uint64_t>::max();
            return static_cast<uint64_t>(rounded);
        }

    }

    SwapEstimate estimate_swap(const UiLadder& ladder, uint64_t taker_fee_bps, Side side, double in_amount) {
        double remaining = in_amount * (1.0 - static_cast<double>(taker_fee_bps) / 10000.0);
        double received = 0.0;

        if (side == Side::Bid) {
            for (const auto& level : ladder.asks) {
                const double quote_available = level.quantity * level.price;
                if (quote_available > remaining) {
                    received += remaining / level.price;
                    remaining = 0.0;
                    break;
                }
                received += level.quantity;
                remaining -= quote_available;
            }
        } else {
            for (const auto& level : ladder.bids) {
                if (level.quantity > remaining) {
                    received += remaining * level.price;
                    remaining = 0.0;
                    break;
                }
                received += level.quantity * level.price;
                remaining -= level.quantity;
            }
        }

        SwapEstimate estimate;
        estimate.out_amount = received;
        estimate.unfilled_in_amount = remaining > 0.0 ? remaining : 0.0;
        estimate.liquidity_exhausted = remaining > 0.0;
        return estimate;
    }

    double expected_out_amount(const UiLadder& ladder, uint64_t taker_fee_bps, Side side, double in_amount) {
        return estimate_swap(ladder, taker_fee_bps, side, in_amount).out_amount;
    }

    LadderSimulator::LadderSimulator(Ladder ladder, uint64_t tick_size_in_quote_lots_per_base_unit,
                                     uint64_t base_lots_per_base_unit)
        : ladder_(std::move(ladder)),
          tick_size_in_quote_lots_per_base_unit_(tick_size_in_quote_lots_per_base_unit),
          base_lots_per_base_unit_(base_lots_per_base_unit) {
        if (base_lots_per_base_unit_ == 0) {
            throw DecodeError(ErrorKind::Corruption, "base_lots_per_base_unit is zero");
        }
    }

    LadderSimulator LadderSimulator::from_snapshot(const MarketSnapshot& snapshot, std::optional<uint64_t> slot,
                                                   std::optional<uint64_t> unix_timestamp) {
        // Slot / timestamp 0 disables the matching check in is_expired()
        Ladder ladder = get_ladder(snapshot, slot.value_or(0), unix_timestamp.value_or(0), kUnlimitedDepth);
        return LadderSimulator(std::move(ladder), snapshot.quote_lots_per_base_unit_per_tick,
                               snapshot.base_lots_per_base_unit);
    }

    SimulationSummaryInLots LadderSimulator::sell_quote(uint64_t num_quote_lots) const {
        const u128 adjusted = static_cast<u128>(num_quote_lots) * base_lots_per_base_unit_;
        u128 remaining = adjusted;
        u128 base_lots = 0;

        for (const auto& ask : ladder_.asks) {
            if (remaining == 0) break;

            const u128 lot_price = static_cast<u128>(ask.price_in_ticks) * tick_size_in_quote_lots_per_base_unit_;
            if (lot_price == 0) continue;

            u128 to_buy = remaining / lot_price;
            if (to_buy > ask.size_in_base_lots) to_buy = ask.size_in_base_lots;
            base_lots += to_buy;
            remaining -= to_buy * lot_price;
        }

        SimulationSummaryInLots summary;
        summary.base_lots_filled = saturate(base_lots);
        summary.quote_lots_filled = saturate((adjusted - remaining) / base_lots_per_base_unit_);
        return summary;
    }

    SimulationSummaryInLots LadderSimulator::sell_base(uint64_t num_base_lots) const {
        uint64_t remaining = num_base_lots;
        u128 adjusted_quote_lots = 0;

        for (const auto& bid : ladder_.bids) {
            if (remaining == 0) break;

            const uint64_t fill = std::min(remaining, bid.size_in_base_lots);
            adjusted_quote_lots = saturating_add(
                adjusted_quote_lots,
                saturating_product(fill, bid.price_in_ticks, tick_size_in_quote_lots_per_base_unit_));
            remaining -= fill;
        }

        SimulationSummaryInLots summary;
        summary.base_lots_filled = num_base_lots - remaining;
        summary.quote_lots_filled = saturate(adjusted_quote_lots / base_lots_per_base_unit_);
        return summary;
    }

    SimulationSummaryInLots LadderSimulator::simulate_market_sell(Side side, uint64_t size_in_lots) const {
        return side == Side::Bid ? sell_quote(size_in_lots) : sell_base(size_in_lots);
    }

    SwapOrderLimits swap_order_limits(const MarketSnapshot& snapshot, Side side, double in_amount,
                                      double slippage, uint64_t slot, uint64_t unix_timestamp,
                                      uint64_t match_limit) {
        const UiLadder ladder = get_ui_ladder(snapshot, slot, unix_timestamp, kUnlimitedDepth);
        const double expected_out = expected_out_amount(ladder, snapshot.taker_fee_bps, side, in_amount);

        const double base_mul = static_cast<double>(utils::pow10(snapshot.header.base_params.decimals));
        const double quote_mul = static_cast<double>(utils::pow10(snapshot.header.quote_params.decimals));
        const double base_lot_size = static_cast<double>(snapshot.header.base_lot_size);
        const double quote_lot_size = static_cast<double>(snapshot.header.quote_lot_size);
        const double keep = 1.0 - slippage;

        SwapOrderLimits limits;
        limits.side = side;
        limits.expected_out_amount = expected_out;
        limits.match_limit = match_limit;
        if (side == Side::Ask) {
            limits.num_base_lots = floor_to_u64(in_amount * base_mul / base_lot_size);
            limits.min_quote_lots_to_fill = ceil_to_u64(expected_out * quote_mul / quote_lot_size * keep);
        } else {
            limits.num_quote_lots = floor_to_u64(in_amount * quote_mul / quote_lot_size);
            limits.min_base_lots_to_fill = ceil_to_u64(expected_out * base_mul / base_lot_size * keep);
        }
        return limits;
    }

    SwapOrderLimits swap_order_limits_with_time_in_force(const MarketSnapshot& snapshot, Side side,
                                                         double in_amount, double slippage, uint64_t slot,
                                                         uint64_t unix_timestamp,
                                                         std::optional<uint64_t> last_valid_slot,
                                                         std::optional<uint64_t> last_valid_unix_timestamp_in_seconds,
                                                         uint64_t match_limit) {
        SwapOrderLimits limits = swap_order_limits(snapshot, side, in_amount, slippage, slot, unix_timestamp,
                                                   match_limit);
        limits.last_valid_slot = last_valid_slot;
        limits.last_valid_unix_timestamp_in_seconds = last_valid_unix_timestamp_in_seconds;
        return limits;
    }

}
