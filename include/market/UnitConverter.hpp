#pragma once

#include <cstdint>

namespace phoenix {

    struct MarketSnapshot;

    // Function: MarketScale
    // Description: Per-market scale constants, copied out of a validated snapshot.
    //              All divisors are non-zero when built through from_snapshot().
    struct MarketScale {
        uint32_t base_decimals = 0;
        uint32_t quote_decimals = 0;
        uint64_t base_lot_size = 1;                       // base atoms per base lot
        uint64_t quote_lot_size = 1;                      // quote atoms per quote lot
        uint64_t tick_size_in_quote_atoms_per_base_unit = 1;
        uint64_t quote_lots_per_base_unit_per_tick = 1;
        uint64_t base_lots_per_base_unit = 1;
        uint64_t raw_base_units_per_base_unit = 1;

        static MarketScale from_snapshot(const MarketSnapshot& snapshot);
    };

    /**
     * @class UnitConverter
     * @brief Stateless conversions between atoms, lots, ticks and human units.
     *
     * Integer-to-integer conversions never go through floating point.
     * Rounding per call: "nearest" is half away from zero, "floor" / "ceil"
     * are stated on the function. Human-unit results are doubles for display.
     * Negative or non-finite human inputs convert to 0.
     */
    class UnitConverter {
    public:
        explicit UnitConverter(const MarketScale& scale) : scale_(scale) {}

        const MarketScale& scale() const { return scale_; }

        // Price in quote units per raw base unit -> ticks (nearest)
        uint64_t float_price_to_ticks(double price) const;
        // Ticks -> price in quote units per raw base unit
        double ticks_to_float_price(uint64_t price_in_ticks) const;

        // Raw base units -> base lots (floor)
        uint64_t raw_base_units_to_base_lots(double raw_base_units) const;
        // Raw base units -> base lots (ceil)
        uint64_t raw_base_units_to_base_lots_rounded_up(double raw_base_units) const;
        double base_lots_to_raw_base_units(uint64_t base_lots) const;
        // Raw base units <-> base units. Plain floating-point scaling, no rounding.
        double raw_base_units_to_base_units(double raw_base_units) const;
        double base_units_to_raw_base_units(double base_units) const;

        // Base atoms -> base lots (nearest, integer)
        uint64_t base_atoms_to_base_lots(uint64_t base_atoms) const;
        uint64_t base_lots_to_base_atoms(uint64_t base_lots) const;
        double base_atoms_to_base_units(uint64_t base_atoms) const;
        // Base units -> base atoms (nearest)
        uint64_t base_units_to_base_atoms(double base_units) const;

        // Quote units -> quote lots (nearest)
        uint64_t quote_units_to_quote_lots(double quote_units) const;
        // Quote atoms -> quote lots (nearest, integer)
        uint64_t quote_atoms_to_quote_lots(uint64_t quote_atoms) const;
        uint64_t quote_lots_to_quote_atoms(uint64_t quote_lots) const;
        double quote_atoms_to_quote_units(uint64_t quote_atoms) const;
        double quote_lots_to_quote_units(uint64_t quote_lots) const;

        // Quote atoms owed for base_lots at price_in_ticks (nearest, 128-bit intermediate).
        // base_lots * ticks * tick_size_in_quote_atoms_per_base_unit / base_lots_per_base_unit
        uint64_t order_to_quote_atoms(uint64_t base_lots, uint64_t price_in_ticks) const;

    private:
        MarketScale scale_;
    };

}
