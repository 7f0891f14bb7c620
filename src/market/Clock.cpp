#include "market/Clock.hpp"
#include "common/Errors.hpp"
#include "common/Utils.hpp"
#include <string>

namespace phoenix {

    Clock decode_clock(std::span<const uint8_t> data) {
        if (data.size() < constants::CLOCK_SIZE) {
            throw DecodeError(ErrorKind::SizeMismatch,
                "clock needs " + std::to_string(constants::CLOCK_SIZE) + " bytes, got " +
                std::to_string(data.size()));
        }

        utils::ByteReader reader(data);
        Clock clock;
        clock.slot = reader.u64();
        clock.epoch_start_timestamp = reader.i64();
        clock.epoch = reader.u64();
        clock.leader_schedule_epoch = reader.u64();
        clock.unix_timestamp = reader.i64();
        return clock;
    }

}
