#pragma once

#include "common/Types.hpp"
#include <cstdint>
#include <optional>
#include <span>

namespace phoenix {

    // Leading byte of a serialized order packet
    enum class OrderPacketKind : uint8_t {
        PostOnly = 0,
        Limit = 1,
        ImmediateOrCancel = 2
    };

    enum class SelfTradeBehavior : uint8_t {
        Abort = 0,
        CancelProvide = 1,
        DecrementTake = 2
    };

    using ClientOrderId = unsigned __int128;

    struct PostOnlyPacket {
        Side side = Side::Bid;
        uint64_t price_in_ticks = 0;
        uint64_t num_base_lots = 0;
        ClientOrderId client_order_id = 0;
        bool reject_post_only = false;
        bool use_only_deposited_funds = false;
        std::optional<uint64_t> last_valid_slot;
        std::optional<uint64_t> last_valid_unix_timestamp_in_seconds;
    };

    struct LimitPacket {
        Side side = Side::Bid;
        uint64_t price_in_ticks = 0;
        uint64_t num_base_lots = 0;
        SelfTradeBehavior self_trade_behavior = SelfTradeBehavior::Abort;
        std::optional<uint64_t> match_limit;
        ClientOrderId client_order_id = 0;
        bool use_only_deposited_funds = false;
        std::optional<uint64_t> last_valid_slot;
        std::optional<uint64_t> last_valid_unix_timestamp_in_seconds;
    };

    struct ImmediateOrCancelPacket {
        Side side = Side::Bid;
        std::optional<uint64_t> price_in_ticks;   // nullopt for a market order
        uint64_t num_base_lots = 0;
        uint64_t num_quote_lots = 0;
        uint64_t min_base_lots_to_fill = 0;
        uint64_t min_quote_lots_to_fill = 0;
        SelfTradeBehavior self_trade_behavior = SelfTradeBehavior::Abort;
        std::optional<uint64_t> match_limit;
        ClientOrderId client_order_id = 0;
        bool use_only_deposited_funds = false;
        std::optional<uint64_t> last_valid_slot;
        std::optional<uint64_t> last_valid_unix_timestamp_in_seconds;
    };

    // Function: decode_post_only_packet / decode_limit_packet / decode_ioc_packet
    // Description: Decodes a Borsh-serialized order packet (tag byte, then fields).
    //              The current layout ends with two optional expiries; packets written
    //              before they existed are accepted through the deprecated layout, which
    //              leaves both expiries unset. A layout matches only if it consumes every byte.
    // Inputs: data - serialized packet including the tag byte.
    // Outputs: The packet. Throws DecodeError: SizeMismatch for an empty buffer,
    //          Corruption for another packet kind or bytes matching neither layout.
    PostOnlyPacket decode_post_only_packet(std::span<const uint8_t> data);
    LimitPacket decode_limit_packet(std::span<const uint8_t> data);
    ImmediateOrCancelPacket decode_ioc_packet(std::span<const uint8_t> data);

    // Tag byte of a packet, or nullopt when empty or unknown
    std::optional<OrderPacketKind> order_packet_kind(std::span<const uint8_t> data);

}
