#include "client/MarketRegistry.hpp"
#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "market/Clock.hpp"
#include "market/Discriminant.hpp"
#include "market/QuoteEngine.hpp"
#include <exception>
#include <set>
#include <thread>
#include <utility>

namespace phoenix {

    namespace {

        // Pre-epoch clocks disable timestamp expiry rather than wrapping
        uint64_t unix_seconds(const Clock& clock) {
            return clock.unix_timestamp < 0 ? 0 : static_cast<uint64_t>(clock.unix_timestamp);
        }

    }

    MarketRegistry::MarketRegistry(ClusterConfig cluster)
        : cluster_(std::move(cluster)) {
        if (cluster_.program_id) {
            expected_discriminant_ = market_header_discriminant(*cluster_.program_id);
        } else {
            LOG_WARN("No programId configured, market header schema is not checked");
        }
    }

    std::shared_ptr<const MarketSnapshot> MarketRegistry::decode(const Pubkey& address,
                                                                 std::span<const uint8_t> data) const {
        if (data.empty()) {
            throw DecodeError(ErrorKind::DataUnavailable, "empty account for market " + utils::to_base58(address));
        }
        auto snapshot = std::make_shared<const MarketSnapshot>(decode_market(data, expected_discriminant_));

        const auto unresolved = snapshot->unresolved_makers();
        if (!unresolved.empty()) {
            LOG_WARN("Market %s: %zu resting trader indices without a trader entry",
                     utils::to_base58(address).c_str(), unresolved.size());
        }
        return snapshot;
    }

    void MarketRegistry::load(const std::vector<Pubkey>& addresses,
                              const std::vector<std::vector<uint8_t>>& accounts) {
        if (accounts.size() < addresses.size() + 1) {
            LOG_ERROR("Requested %zu accounts, received %zu", addresses.size() + 1, accounts.size());
            throw DecodeError(ErrorKind::DataUnavailable,
                "expected " + std::to_string(addresses.size() + 1) + " accounts, got " +
                std::to_string(accounts.size()));
        }
        if (accounts[addresses.size()].empty()) {
            throw DecodeError(ErrorKind::DataUnavailable, "empty clock account");
        }
        const Clock clock = decode_clock(accounts[addresses.size()]);

        // Fan out one decode per market, fan in before installing anything
        std::vector<std::shared_ptr<const MarketSnapshot>> decoded(addresses.size());
        std::vector<std::exception_ptr> errors(addresses.size());
        // Joined on destruction, including when a later spawn throws
        std::vector<std::jthread> workers;
        workers.reserve(addresses.size());
        for (size_t i = 0; i < addresses.size(); ++i) {
            workers.emplace_back([&, i]() {
                try {
                    decoded[i] = decode(addresses[i], accounts[i]);
                } catch (...) {
                    errors[i] = std::current_exception();
                }
            });
        }
        for (auto& worker : workers) worker.join();

        for (size_t i = 0; i < errors.size(); ++i) {
            if (errors[i]) {
                LOG_ERROR("Failed to decode market %s, nothing installed", utils::to_base58(addresses[i]).c_str());
                std::rethrow_exception(errors[i]);
            }
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (size_t i = 0; i < addresses.size(); ++i) {
                snapshots_[addresses[i]] = std::move(decoded[i]);
            }
            clock_ = clock;
        }
        LOG_INFO("Loaded %zu markets at slot %llu", addresses.size(), static_cast<unsigned long long>(clock.slot));
    }

    void MarketRegistry::refresh(const Pubkey& address, std::span<const uint8_t> market_data,
                                 std::span<const uint8_t> clock_data) {
        if (clock_data.empty()) {
            throw DecodeError(ErrorKind::DataUnavailable, "empty clock account");
        }
        const Clock clock = decode_clock(clock_data);

        std::shared_ptr<const MarketSnapshot> snapshot;
        try {
            snapshot = decode(address, market_data);
        } catch (const DecodeError& e) {
            LOG_ERROR("Refresh of %s failed: %s", utils::to_base58(address).c_str(), e.what());
            throw;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        snapshots_[address] = std::move(snapshot);
        clock_ = clock;
    }

    void MarketRegistry::update_clock(std::span<const uint8_t> clock_data) {
        const Clock clock = decode_clock(clock_data);
        std::lock_guard<std::mutex> lock(mutex_);
        clock_ = clock;
    }

    std::shared_ptr<const MarketSnapshot> MarketRegistry::get(const Pubkey& address) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = snapshots_.find(address);
        return it == snapshots_.end() ? nullptr : it->second;
    }

    Clock MarketRegistry::clock() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return clock_;
    }

    std::vector<Pubkey> MarketRegistry::markets() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Pubkey> out;
        out.reserve(snapshots_.size());
        for (const auto& [address, snapshot] : snapshots_) out.push_back(address);
        return out;
    }

    std::vector<TokenConfig> MarketRegistry::tokens() const {
        std::vector<std::pair<Pubkey, std::shared_ptr<const MarketSnapshot>>> loaded;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            loaded.assign(snapshots_.begin(), snapshots_.end());
        }

        std::vector<TokenConfig> out;
        std::set<Pubkey> seen;
        for (const auto& [address, snapshot] : loaded) {
            for (const Pubkey& mint : {snapshot->header.base_params.mint_key, snapshot->header.quote_params.mint_key}) {
                if (!seen.insert(mint).second) continue;
                const TokenConfig* token = cluster_.find_token(mint);
                if (!token) {
                    LOG_WARN("Mint %s of market %s missing from token config",
                             utils::to_base58(mint).c_str(), utils::to_base58(address).c_str());
                    continue;
                }
                out.push_back(*token);
            }
        }
        return out;
    }

    std::shared_ptr<const MarketSnapshot> MarketRegistry::require(const Pubkey& address) const {
        auto snapshot = get(address);
        if (!snapshot) {
            throw DecodeError(ErrorKind::DataUnavailable, "market " + utils::to_base58(address) + " not loaded");
        }
        return snapshot;
    }

    Ladder MarketRegistry::ladder(const Pubkey& address, size_t levels) const {
        auto snapshot = require(address);
        const Clock now = clock();
        return get_ladder(*snapshot, now.slot, unix_seconds(now), levels);
    }

    UiLadder MarketRegistry::ui_ladder(const Pubkey& address, size_t levels) const {
        auto snapshot = require(address);
        const Clock now = clock();
        return get_ui_ladder(*snapshot, now.slot, unix_seconds(now), levels);
    }

    L3Book MarketRegistry::l3_book(const Pubkey& address, size_t orders_per_side) const {
        auto snapshot = require(address);
        const Clock now = clock();
        return get_l3_book(*snapshot, now.slot, unix_seconds(now), orders_per_side);
    }

    L3UiBook MarketRegistry::l3_ui_book(const Pubkey& address, size_t orders_per_side) const {
        auto snapshot = require(address);
        const Clock now = clock();
        return get_l3_ui_book(*snapshot, now.slot, unix_seconds(now), orders_per_side);
    }

    double MarketRegistry::expected_out_amount(const Pubkey& address, Side side, double in_amount) const {
        auto snapshot = require(address);
        const Clock now = clock();
        const UiLadder ladder = get_ui_ladder(*snapshot, now.slot, unix_seconds(now),
                                              kUnlimitedDepth);
        return phoenix::expected_out_amount(ladder, snapshot->taker_fee_bps, side, in_amount);
    }

}
