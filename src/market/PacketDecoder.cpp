#include "market/PacketDecoder.hpp"
#include "common/Errors.hpp"
#include <cstring>
#include <string>

namespace phoenix {

    namespace {

        // Borsh cursor. A bad read latches failure instead of throwing so that
        // a layout that does not fit can fall through to the next one.
        class PacketReader {
        public:
            explicit PacketReader(std::span<const uint8_t> data) : data_(data) {}

            uint8_t u8() {
                if (!take(1)) return 0;
                return data_[offset_ - 1];
            }

            uint64_t u64() {
                if (!take(8)) return 0;
                uint64_t value;
                std::memcpy(&value, data_.data() + offset_ - 8, 8);
                return value;
            }

            ClientOrderId u128() {
                const uint64_t low = u64();
                const uint64_t high = u64();
                return (static_cast<ClientOrderId>(high) << 64) | low;
            }

            bool boolean() {
                const uint8_t v = u8();
                if (v > 1) ok_ = false;
                return v == 1;
            }

            std::optional<uint64_t> option_u64() {
                if (!boolean()) return std::nullopt;
                return u64();
            }

            Side side() {
                const uint8_t v = u8();
                if (v > 1) ok_ = false;
                return v == 1 ? Side::Ask : Side::Bid;
            }

            SelfTradeBehavior self_trade_behavior() {
                const uint8_t v = u8();
                if (v > 2) ok_ = false;
                return static_cast<SelfTradeBehavior>(v > 2 ? 0 : v);
            }

            // Every field read cleanly and nothing is left over
            bool complete() const { return ok_ && offset_ == data_.size(); }

        private:
            bool take(size_t n) {
                if (!ok_ || data_.size() - offset_ < n) {
                    ok_ = false;
                    return false;
                }
                offset_ += n;
                return true;
            }

            std::span<const uint8_t> data_;
            size_t offset_ = 0;
            bool ok_ = true;
        };

        void read_expiries(PacketReader& r, std::optional<uint64_t>& slot, std::optional<uint64_t>& timestamp) {
            slot = r.option_u64();
            timestamp = r.option_u64();
        }

        std::optional<PostOnlyPacket> parse_post_only(std::span<const uint8_t> body, bool with_expiries) {
            PacketReader r(body);
            PostOnlyPacket p;
            p.side = r.side();
            p.price_in_ticks = r.u64();
            p.num_base_lots = r.u64();
            p.client_order_id = r.u128();
            p.reject_post_only = r.boolean();
            p.use_only_deposited_funds = r.boolean();
            if (with_expiries) read_expiries(r, p.last_valid_slot, p.last_valid_unix_timestamp_in_seconds);
            if (!r.complete()) return std::nullopt;
            return p;
        }

        std::optional<LimitPacket> parse_limit(std::span<const uint8_t> body, bool with_expiries) {
            PacketReader r(body);
            LimitPacket p;
            p.side = r.side();
            p.price_in_ticks = r.u64();
            p.num_base_lots = r.u64();
            p.self_trade_behavior = r.self_trade_behavior();
            p.match_limit = r.option_u64();
            p.client_order_id = r.u128();
            p.use_only_deposited_funds = r.boolean();
            if (with_expiries) read_expiries(r, p.last_valid_slot, p.last_valid_unix_timestamp_in_seconds);
            if (!r.complete()) return std::nullopt;
            return p;
        }

        std::optional<ImmediateOrCancelPacket> parse_ioc(std::span<const uint8_t> body, bool with_expiries) {
            PacketReader r(body);
            ImmediateOrCancelPacket p;
            p.side = r.side();
            p.price_in_ticks = r.option_u64();
            p.num_base_lots = r.u64();
            p.num_quote_lots = r.u64();
            p.min_base_lots_to_fill = r.u64();
            p.min_quote_lots_to_fill = r.u64();
            p.self_trade_behavior = r.self_trade_behavior();
            p.match_limit = r.option_u64();
            p.client_order_id = r.u128();
            p.use_only_deposited_funds = r.boolean();
            if (with_expiries) read_expiries(r, p.last_valid_slot, p.last_valid_unix_timestamp_in_seconds);
            if (!r.complete()) return std::nullopt;
            return p;
        }

        // Tag check, then the current layout, then the deprecated one
        template<typename Packet, typename Parse>
        Packet decode_packet(std::span<const uint8_t> data, OrderPacketKind kind, const char* name, Parse parse) {
            if (data.empty()) {
                throw DecodeError(ErrorKind::SizeMismatch, std::string("empty ") + name + " packet");
            }
            if (data[0] != static_cast<uint8_t>(kind)) {
                throw DecodeError(ErrorKind::Corruption,
                    std::string("invalid ") + name + " packet: tag " + std::to_string(data[0]));
            }
            const auto body = data.subspan(1);
            if (auto packet = parse(body, true)) return *packet;
            if (auto packet = parse(body, false)) return *packet;
            throw DecodeError(ErrorKind::Corruption,
                std::string("invalid ") + name + " packet: " + std::to_string(data.size()) +
                " bytes match neither layout");
        }

    }

    PostOnlyPacket decode_post_only_packet(std::span<const uint8_t> data) {
        return decode_packet<PostOnlyPacket>(data, OrderPacketKind::PostOnly, "post-only", parse_post_only);
    }

    LimitPacket decode_limit_packet(std::span<const uint8_t> data) {
        return decode_packet<LimitPacket>(data, OrderPacketKind::Limit, "limit", parse_limit);
    }

    ImmediateOrCancelPacket decode_ioc_packet(std::span<const uint8_t> data) {
        return decode_packet<ImmediateOrCancelPacket>(data, OrderPacketKind::ImmediateOrCancel,
                                                      "immediate-or-cancel", parse_ioc);
    }

    std::optional<OrderPacketKind> order_packet_kind(std::span<const uint8_t> data) {
        if (data.empty() || data[0] > static_cast<uint8_t>(OrderPacketKind::ImmediateOrCancel)) {
            return std::nullopt;
        }
        return static_cast<OrderPacketKind>(data[0]);
    }

}
