#include "market/UnitConverter.hpp"
#include "market/MarketSnapshot.hpp"
#include "common/Utils.hpp"
#include <cmath>
#include <limits>

namespace phoenix {

    namespace {

        constexpr double U64_LIMIT = 18446744073709551615.0;

        // Clamp a rounded double into u64 range
        uint64_t to_u64(double value) {
            if (!std::isfinite(value) || value <= 0.0) return 0;
            if (value >= U64_LIMIT) return std::numeric_limits<uint64_t>::max();
            return static_cast<uint64_t>(value);
        }

        uint64_t nearest(double value) { return to_u64(std::round(value)); }

        // a / b rounded half up, without forming a + b / 2
        uint64_t div_nearest(uint64_t a, uint64_t b) {
            uint64_t quotient = a / b;
            uint64_t remainder = a % b;
            return remainder >= b - remainder ? quotient + 1 : quotient;
        }

        uint64_t saturating_mul(uint64_t a, uint64_t b) {
            unsigned __int128 product = static_cast<unsigned __int128>(a) * b;
            if (product > std::numeric_limits<uint64_t>::max()) {
                return std::numeric_limits<uint64_t>::max();
            }
            return static_cast<uint64_t>(product);
        }

        // Three-way product; past 2^128 the quotient cannot fit u64 anyway
        unsigned __int128 saturating_mul3(uint64_t a, uint64_t b, uint64_t c) {
            constexpr unsigned __int128 max128 = ~static_cast<unsigned __int128>(0);
            const unsigned __int128 ab = static_cast<unsigned __int128>(a) * b;
            if (c != 0 && ab > max128 / c) return max128;
            return ab * c;
        }

    }

    MarketScale MarketScale::from_snapshot(const MarketSnapshot& snapshot) {
        MarketScale scale;
        scale.base_decimals = snapshot.header.base_params.decimals;
        scale.quote_decimals = snapshot.header.quote_params.decimals;
        scale.base_lot_size = snapshot.header.base_lot_size;
        scale.quote_lot_size = snapshot.header.quote_lot_size;
        scale.tick_size_in_quote_atoms_per_base_unit = snapshot.header.tick_size_in_quote_atoms_per_base_unit;
        scale.quote_lots_per_base_unit_per_tick = snapshot.quote_lots_per_base_unit_per_tick;
        scale.base_lots_per_base_unit = snapshot.base_lots_per_base_unit;
        scale.raw_base_units_per_base_unit = snapshot.header.raw_base_units_per_base_unit;
        return scale;
    }

    uint64_t UnitConverter::float_price_to_ticks(double price) const {
        const double quote_atoms_per_unit = static_cast<double>(utils::pow10(scale_.quote_decimals));
        const double quote_atoms_per_tick = static_cast<double>(scale_.quote_lots_per_base_unit_per_tick) *
                                            static_cast<double>(scale_.quote_lot_size);
        return nearest(price * quote_atoms_per_unit * static_cast<double>(scale_.raw_base_units_per_base_unit) /
                       quote_atoms_per_tick);
    }

    double UnitConverter::ticks_to_float_price(uint64_t price_in_ticks) const {
        return static_cast<double>(price_in_ticks) *
               static_cast<double>(scale_.quote_lots_per_base_unit_per_tick) *
               static_cast<double>(scale_.quote_lot_size) /
               (static_cast<double>(utils::pow10(scale_.quote_decimals)) *
                static_cast<double>(scale_.raw_base_units_per_base_unit));
    }

    uint64_t UnitConverter::raw_base_units_to_base_lots(double raw_base_units) const {
        const double base_units = raw_base_units / static_cast<double>(scale_.raw_base_units_per_base_unit);
        return to_u64(std::floor(base_units * static_cast<double>(scale_.base_lots_per_base_unit)));
    }

    uint64_t UnitConverter::raw_base_units_to_base_lots_rounded_up(double raw_base_units) const {
        const double base_units = raw_base_units / static_cast<double>(scale_.raw_base_units_per_base_unit);
        return to_u64(std::ceil(base_units * static_cast<double>(scale_.base_lots_per_base_unit)));
    }

    double UnitConverter::base_lots_to_raw_base_units(uint64_t base_lots) const {
        return static_cast<double>(base_lots) / static_cast<double>(scale_.base_lots_per_base_unit) *
               static_cast<double>(scale_.raw_base_units_per_base_unit);
    }

    double UnitConverter::raw_base_units_to_base_units(double raw_base_units) const {
        return raw_base_units / static_cast<double>(scale_.raw_base_units_per_base_unit);
    }

    double UnitConverter::base_units_to_raw_base_units(double base_units) const {
        return base_units * static_cast<double>(scale_.raw_base_units_per_base_unit);
    }

    uint64_t UnitConverter::base_atoms_to_base_lots(uint64_t base_atoms) const {
        return div_nearest(base_atoms, scale_.base_lot_size);
    }

    uint64_t UnitConverter::base_lots_to_base_atoms(uint64_t base_lots) const {
        return saturating_mul(base_lots, scale_.base_lot_size);
    }

    double UnitConverter::base_atoms_to_base_units(uint64_t base_atoms) const {
        return static_cast<double>(base_atoms) / static_cast<double>(utils::pow10(scale_.base_decimals));
    }

    uint64_t UnitConverter::base_units_to_base_atoms(double base_units) const {
        return nearest(base_units * static_cast<double>(utils::pow10(scale_.base_decimals)));
    }

    uint64_t UnitConverter::quote_units_to_quote_lots(double quote_units) const {
        return nearest(quote_units * static_cast<double>(utils::pow10(scale_.quote_decimals)) /
                       static_cast<double>(scale_.quote_lot_size));
    }

    uint64_t UnitConverter::quote_atoms_to_quote_lots(uint64_t quote_atoms) const {
        return div_nearest(quote_atoms, scale_.quote_lot_size);
    }

    uint64_t UnitConverter::quote_lots_to_quote_atoms(uint64_t quote_lots) const {
        return saturating_mul(quote_lots, scale_.quote_lot_size);
    }

    double UnitConverter::quote_atoms_to_quote_units(uint64_t quote_atoms) const {
        return static_cast<double>(quote_atoms) / static_cast<double>(utils::pow10(scale_.quote_decimals));
    }

    double UnitConverter::quote_lots_to_quote_units(uint64_t quote_lots) const {
        return static_cast<double>(quote_lots) * static_cast<double>(scale_.quote_lot_size) /
               static_cast<double>(utils::pow10(scale_.quote_decimals));
    }

    uint64_t UnitConverter::order_to_quote_atoms(uint64_t base_lots, uint64_t price_in_ticks) const {
        const unsigned __int128 numerator =
            saturating_mul3(base_lots, price_in_ticks, scale_.tick_size_in_quote_atoms_per_base_unit);
        const unsigned __int128 divisor = scale_.base_lots_per_base_unit;
        const unsigned __int128 quotient = numerator / divisor;
        const unsigned __int128 remainder = numerator % divisor;
        if (quotient > std::numeric_limits<uint64_t>::max()) {
            return std::numeric_limits<uint64_t>::max();
        }
        const unsigned __int128 rounded = remainder >= divisor - remainder ? quotient + 1 : quotient;

        if (rounded > std::numeric_limits<uint64_t>::max()) {
            return std::numeric_limits<uint64_t>::max();
        }
        return static_cast<uint64_t>(rounded);
    }

}
