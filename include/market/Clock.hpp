#pragma once

#include "common/Types.hpp"
#include <span>

namespace phoenix {

    // Function: decode_clock
    // Description: Decodes the 40-byte clock sysvar (slot, epoch start, epoch,
    //              leader schedule epoch, unix timestamp), little endian.
    //              Throws DecodeError(SizeMismatch) on a short buffer.
    Clock decode_clock(std::span<const uint8_t> data);

}
