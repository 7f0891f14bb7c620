#pragma once

#include "client/Config.hpp"
#include "common/Types.hpp"
#include "common/Utils.hpp"
#include "market/L3Book.hpp"
#include "market/Ladder.hpp"
#include "market/MarketSnapshot.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <vector>

namespace phoenix {

    /**
     * @class MarketRegistry
     * @brief Holds the latest decoded snapshot per market plus the cluster clock.
     *
     * The registry never fetches. Callers hand it raw account bytes in the order
     * they requested them: one buffer per market, then the clock account.
     * Snapshots are immutable and shared; replacing one swaps a pointer under the
     * lock, so a reader holds either the old snapshot or the new one.
     */
    class MarketRegistry {
    public:
        explicit MarketRegistry(ClusterConfig cluster);

        /**
         * @brief Decodes every market concurrently, then installs them all with the clock.
         * @param addresses Market addresses, in request order.
         * @param accounts Buffers for each address followed by the clock buffer.
         * @throws DecodeError(DataUnavailable) when buffers are missing or empty, or the
         *         first decode failure. Nothing is installed when anything throws.
         */
        void load(const std::vector<Pubkey>& addresses, const std::vector<std::vector<uint8_t>>& accounts);

        // Rebuilds a single market and updates the clock. Previous snapshot stays on failure.
        void refresh(const Pubkey& address, std::span<const uint8_t> market_data,
                     std::span<const uint8_t> clock_data);

        void update_clock(std::span<const uint8_t> clock_data);

        // nullptr when the market was never loaded
        std::shared_ptr<const MarketSnapshot> get(const Pubkey& address) const;
        Clock clock() const;
        std::vector<Pubkey> markets() const;
        // Base and quote tokens of loaded markets found in the config, one entry per mint
        std::vector<TokenConfig> tokens() const;

        const ClusterConfig& cluster() const { return cluster_; }

        // Views evaluated against the registry clock. Unknown markets throw DataUnavailable.
        Ladder ladder(const Pubkey& address, size_t levels = constants::DEFAULT_L2_LADDER_DEPTH) const;
        UiLadder ui_ladder(const Pubkey& address, size_t levels = constants::DEFAULT_L2_LADDER_DEPTH) const;
        L3Book l3_book(const Pubkey& address, size_t orders_per_side = constants::DEFAULT_L3_BOOK_DEPTH) const;
        L3UiBook l3_ui_book(const Pubkey& address, size_t orders_per_side = constants::DEFAULT_L3_BOOK_DEPTH) const;
        double expected_out_amount(const Pubkey& address, Side side, double in_amount) const;

    private:
        std::shared_ptr<const MarketSnapshot> decode(const Pubkey& address, std::span<const uint8_t> data) const;
        std::shared_ptr<const MarketSnapshot> require(const Pubkey& address) const;

        ClusterConfig cluster_;
        std::optional<uint64_t> expected_discriminant_;

        mutable std::mutex mutex_;
        std::map<Pubkey, std::shared_ptr<const MarketSnapshot>> snapshots_;
        Clock clock_{};
    };

}
