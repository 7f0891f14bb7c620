#include "market/UnitConverter.hpp"
#include "market/MarketSnapshot.hpp"
#include "MarketFixture.hpp"
#include <cmath>
#include <iostream>
#include <limits>
#include <string>

using namespace phoenix;

static int failures = 0;

static void check(bool ok, const std::string& name) {
    std::cout << (ok ? "[PASS] " : "[FAIL] ") << name << std::endl;
    if (!ok) ++failures;
}

static bool near(double a, double b) { return std::fabs(a - b) < 1e-9; }

// SOL/USDC style market: 1 lot = 0.001 SOL, 1 tick = 0.001 USDC
static MarketScale sol_usdc() {
    MarketScale scale;
    scale.base_decimals = 9;
    scale.quote_decimals = 6;
    scale.base_lot_size = 1000000;
    scale.quote_lot_size = 1;
    scale.tick_size_in_quote_atoms_per_base_unit = 1000;
    scale.quote_lots_per_base_unit_per_tick = 1000;
    scale.base_lots_per_base_unit = 1000;
    scale.raw_base_units_per_base_unit = 1;
    return scale;
}

int main() {
    std::cout << "Running UnitConverter Unit Test..." << std::endl;

    const UnitConverter c(sol_usdc());
    constexpr uint64_t MAX = std::numeric_limits<uint64_t>::max();

    // Prices
    check(c.float_price_to_ticks(22.719) == 22719, "float_price_to_ticks rounds to nearest tick");
    check(c.float_price_to_ticks(22.7194) == 22719 && c.float_price_to_ticks(22.7196) == 22720,
          "Sub-tick prices round to the closer tick");
    check(near(c.ticks_to_float_price(22719), 22.719), "ticks_to_float_price");
    check(c.float_price_to_ticks(-1.0) == 0 && c.float_price_to_ticks(NAN) == 0, "Negative or NaN price maps to 0");

    // Base quantities
    check(c.raw_base_units_to_base_lots(1.5) == 1500, "raw_base_units_to_base_lots");
    check(c.raw_base_units_to_base_lots(1.0005) == 1000, "raw_base_units_to_base_lots floors");
    check(c.raw_base_units_to_base_lots_rounded_up(1.0005) == 1001, "raw_base_units_to_base_lots_rounded_up ceils");
    check(near(c.base_lots_to_raw_base_units(1500), 1.5), "base_lots_to_raw_base_units");
    check(c.base_atoms_to_base_lots(1500000) == 2 && c.base_atoms_to_base_lots(1499999) == 1,
          "base_atoms_to_base_lots rounds half up");
    check(c.base_lots_to_base_atoms(3) == 3000000, "base_lots_to_base_atoms");
    check(c.base_lots_to_base_atoms(MAX) == MAX, "base_lots_to_base_atoms saturates");
    check(near(c.base_atoms_to_base_units(1500000000), 1.5), "base_atoms_to_base_units");
    check(c.base_units_to_base_atoms(2.5) == 2500000000ull, "base_units_to_base_atoms");

    // Quote quantities
    check(c.quote_units_to_quote_lots(22.719) == 22719000, "quote_units_to_quote_lots");
    check(c.quote_lots_to_quote_atoms(22719000) == 22719000, "quote_lots_to_quote_atoms");
    check(near(c.quote_atoms_to_quote_units(22719000), 22.719), "quote_atoms_to_quote_units");
    check(near(c.quote_lots_to_quote_units(22719000), 22.719), "quote_lots_to_quote_units");
    {
        MarketScale coarse = sol_usdc();
        coarse.quote_lot_size = 10;
        const UnitConverter q(coarse);
        check(q.quote_atoms_to_quote_lots(15) == 2 && q.quote_atoms_to_quote_lots(14) == 1,
              "quote_atoms_to_quote_lots rounds half up");
        check(q.quote_units_to_quote_lots(0.000016) == 2, "quote_units_to_quote_lots uses the lot size");
    }

    // Order value
    check(c.order_to_quote_atoms(1000, 22719) == 22719000, "One SOL at 22.719 is 22719000 quote atoms");
    {
        MarketScale odd = sol_usdc();
        odd.tick_size_in_quote_atoms_per_base_unit = 3;
        odd.base_lots_per_base_unit = 2;
        check(UnitConverter(odd).order_to_quote_atoms(1, 1) == 2, "order_to_quote_atoms rounds 1.5 up");
        odd.tick_size_in_quote_atoms_per_base_unit = 1;
        odd.base_lots_per_base_unit = 3;
        check(UnitConverter(odd).order_to_quote_atoms(1, 1) == 0, "order_to_quote_atoms rounds 0.33 down");
    }
    check(c.order_to_quote_atoms(1ull << 40, 1ull << 20) == (1ull << 60),
          "Wide products stay exact through 128-bit arithmetic");
    check(c.order_to_quote_atoms(MAX, MAX) == MAX, "order_to_quote_atoms saturates");
    {
        // 2^63 * 2^63 * 1000 does not fit 128 bits
        MarketScale wide;
        wide.tick_size_in_quote_atoms_per_base_unit = 1000;
        wide.base_lots_per_base_unit = 1;
        const uint64_t half = 1ull << 63;
        check(UnitConverter(wide).order_to_quote_atoms(half, half) == MAX,
              "order_to_quote_atoms saturates when the triple product exceeds 128 bits");
    }

    // Scale taken from a decoded market
    {
        fixture::FixtureMarket m;
        m.base_params.decimals = 9;
        m.quote_params.decimals = 6;
        m.base_lot_size = 1000000;
        m.tick_size_in_quote_atoms_per_base_unit = 1000;
        m.base_lots_per_base_unit = 1000;
        m.quote_lots_per_base_unit_per_tick = 1000;
        m.raw_base_units_per_base_unit = 1000;
        const MarketSnapshot s = decode_market(fixture::encode_market(m));
        const MarketScale scale = MarketScale::from_snapshot(s);
        check(scale.base_decimals == 9 && scale.quote_decimals == 6 && scale.base_lot_size == 1000000 &&
              scale.base_lots_per_base_unit == 1000 && scale.raw_base_units_per_base_unit == 1000,
              "MarketScale::from_snapshot copies header constants");
        const UnitConverter raw(scale);
        check(near(raw.ticks_to_float_price(22719), 0.022719), "Raw base units divide the display price");
        check(near(raw.base_lots_to_raw_base_units(1), 1.0), "One lot is one raw base unit at 1000 per unit");
        check(near(raw.raw_base_units_to_base_units(2500.0), 2.5), "raw_base_units_to_base_units divides");
        check(near(raw.base_units_to_raw_base_units(0.0015), 1.5), "base_units_to_raw_base_units multiplies");
        check(near(raw.raw_base_units_to_base_units(1.0), 0.001), "Fractional base units are not rounded");
    }

    if (failures) {
        std::cout << failures << " check(s) failed." << std::endl;
        return 1;
    }
    std::cout << "All UnitConverter tests passed." << std::endl;
    return 0;
}
