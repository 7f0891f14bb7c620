#include "market/PacketDecoder.hpp"
#include "common/Errors.hpp"
#include "MarketFixture.hpp"
#include <iostream>
#include <string>

using namespace phoenix;
using namespace phoenix::fixture;

static int failures = 0;

static void check(bool ok, const std::string& name) {
    std::cout << (ok ? "[PASS] " : "[FAIL] ") << name << std::endl;
    if (!ok) ++failures;
}

template<typename Fn>
static bool throws_kind(ErrorKind expected, Fn&& fn) {
    try {
        fn();
    } catch (const DecodeError& e) {
        return e.kind() == expected;
    }
    return false;
}

static void option_u64(ByteWriter& w, std::optional<uint64_t> v) {
    w.u8(v ? 1 : 0);
    if (v) w.u64(*v);
}

static void expiries(ByteWriter& w, bool current, std::optional<uint64_t> slot, std::optional<uint64_t> ts) {
    if (!current) return;
    option_u64(w, slot);
    option_u64(w, ts);
}

static std::vector<uint8_t> post_only(bool current, std::optional<uint64_t> slot = std::nullopt,
                                      std::optional<uint64_t> ts = std::nullopt) {
    ByteWriter w;
    w.u8(0);
    w.u8(1);               // ask
    w.u64(22719);
    w.u64(1500);
    w.u128(77, 1);
    w.u8(1);               // reject_post_only
    w.u8(0);               // use_only_deposited_funds
    expiries(w, current, slot, ts);
    return std::move(w.bytes());
}

static std::vector<uint8_t> limit(bool current, std::optional<uint64_t> match_limit,
                                  std::optional<uint64_t> slot = std::nullopt,
                                  std::optional<uint64_t> ts = std::nullopt) {
    ByteWriter w;
    w.u8(1);
    w.u8(0);               // bid
    w.u64(100);
    w.u64(25);
    w.u8(1);               // cancel provide
    option_u64(w, match_limit);
    w.u128(9, 0);
    w.u8(1);
    expiries(w, current, slot, ts);
    return std::move(w.bytes());
}

static std::vector<uint8_t> ioc(bool current, std::optional<uint64_t> price,
                                std::optional<uint64_t> slot = std::nullopt,
                                std::optional<uint64_t> ts = std::nullopt) {
    ByteWriter w;
    w.u8(2);
    w.u8(1);               // ask
    option_u64(w, price);
    w.u64(50);
    w.u64(0);
    w.u64(0);
    w.u64(250);
    w.u8(2);               // decrement take
    option_u64(w, 2048);
    w.u128(3, 0);
    w.u8(0);
    expiries(w, current, slot, ts);
    return std::move(w.bytes());
}

int main() {
    std::cout << "Running PacketDecoder Unit Test..." << std::endl;

    // Post-only
    {
        const auto bytes = post_only(true, 500, 1700000000);
        const PostOnlyPacket p = decode_post_only_packet(bytes);
        check(p.side == Side::Ask && p.price_in_ticks == 22719 && p.num_base_lots == 1500,
              "Post-only price and size");
        check(p.client_order_id == ((static_cast<ClientOrderId>(1) << 64) | 77), "128-bit client order id");
        check(p.reject_post_only && !p.use_only_deposited_funds, "Post-only flags");
        check(p.last_valid_slot == std::optional<uint64_t>(500) &&
              p.last_valid_unix_timestamp_in_seconds == std::optional<uint64_t>(1700000000),
              "Post-only expiries decoded");

        const auto bare = post_only(true);
        const PostOnlyPacket none = decode_post_only_packet(bare);
        check(!none.last_valid_slot && !none.last_valid_unix_timestamp_in_seconds, "Absent expiries stay unset");

        const auto old = post_only(false);
        const PostOnlyPacket legacy = decode_post_only_packet(old);
        check(legacy.price_in_ticks == 22719 && legacy.reject_post_only && !legacy.last_valid_slot,
              "Deprecated post-only layout accepted without expiries");
    }

    // Limit
    {
        const auto bytes = limit(true, std::nullopt, 42, std::nullopt);
        const LimitPacket p = decode_limit_packet(bytes);
        check(p.side == Side::Bid && p.price_in_ticks == 100 && p.num_base_lots == 25, "Limit price and size");
        check(p.self_trade_behavior == SelfTradeBehavior::CancelProvide, "Limit self-trade behavior");
        check(!p.match_limit && p.client_order_id == 9 && p.use_only_deposited_funds, "Limit optional fields");
        check(p.last_valid_slot == std::optional<uint64_t>(42) && !p.last_valid_unix_timestamp_in_seconds,
              "Limit slot-only expiry");

        const auto old = limit(false, 16);
        const LimitPacket legacy = decode_limit_packet(old);
        check(legacy.match_limit == std::optional<uint64_t>(16) && !legacy.last_valid_slot,
              "Deprecated limit layout accepted");
    }

    // Immediate or cancel
    {
        const auto market = ioc(true, std::nullopt, std::nullopt, 1700000100);
        const ImmediateOrCancelPacket p = decode_ioc_packet(market);
        check(!p.price_in_ticks && p.num_base_lots == 50 && p.min_quote_lots_to_fill == 250,
              "Market IOC without a price");
        check(p.self_trade_behavior == SelfTradeBehavior::DecrementTake &&
              p.match_limit == std::optional<uint64_t>(2048), "IOC self-trade behavior and match limit");
        check(p.last_valid_unix_timestamp_in_seconds == std::optional<uint64_t>(1700000100) && !p.last_valid_slot,
              "IOC timestamp expiry");

        const auto old = ioc(false, 300);
        const ImmediateOrCancelPacket legacy = decode_ioc_packet(old);
        check(legacy.price_in_ticks == std::optional<uint64_t>(300) && !legacy.last_valid_slot &&
              !legacy.last_valid_unix_timestamp_in_seconds, "Deprecated IOC layout accepted");
    }

    // Packet kind
    {
        const auto p = post_only(true);
        const auto l = limit(true, std::nullopt);
        const auto i = ioc(true, 1);
        check(order_packet_kind(p) == OrderPacketKind::PostOnly && order_packet_kind(l) == OrderPacketKind::Limit &&
              order_packet_kind(i) == OrderPacketKind::ImmediateOrCancel, "Packet kind from tag byte");
        const std::vector<uint8_t> unknown = {7};
        check(!order_packet_kind(unknown) && !order_packet_kind({}), "Unknown or empty packet has no kind");
    }

    // Malformed input
    {
        const auto p = post_only(true);
        check(throws_kind(ErrorKind::Corruption, [&] { decode_limit_packet(p); }),
              "Post-only bytes rejected by the limit decoder");
        check(throws_kind(ErrorKind::SizeMismatch, [&] { decode_ioc_packet({}); }), "Empty packet rejected");

        auto trailing = post_only(true);
        trailing.push_back(0xFF);
        check(throws_kind(ErrorKind::Corruption, [&] { decode_post_only_packet(trailing); }),
              "Trailing byte matches neither layout");

        auto truncated = limit(false, std::nullopt);
        truncated.pop_back();
        check(throws_kind(ErrorKind::Corruption, [&] { decode_limit_packet(truncated); }),
              "Truncated limit packet rejected");

        auto bad_bool = post_only(false);
        bad_bool[34] = 2;   // reject_post_only
        check(throws_kind(ErrorKind::Corruption, [&] { decode_post_only_packet(bad_bool); }),
              "Boolean outside 0/1 rejected");

        auto bad_side = ioc(true, 1);
        bad_side[1] = 2;
        check(throws_kind(ErrorKind::Corruption, [&] { decode_ioc_packet(bad_side); }), "Unknown side rejected");

        auto bad_behavior = limit(true, std::nullopt);
        bad_behavior[18] = 3;
        check(throws_kind(ErrorKind::Corruption, [&] { decode_limit_packet(bad_behavior); }),
              "Unknown self-trade behavior rejected");
    }

    if (failures) {
        std::cout << failures << " check(s) failed." << std::endl;
        return 1;
    }
    std::cout << "All PacketDecoder tests passed." << std::endl;
    return 0;
}
