#pragma once

#include "common/Types.hpp"
#include <cstdint>
#include <string_view>

namespace phoenix {

    inline constexpr std::string_view MARKET_HEADER_TYPE_NAME = "phoenix::program::accounts::MarketHeader";

    // Function: account_discriminant
    // Description: Schema tag stored in the first word of an account.
    //              First 8 bytes, little endian, of SHA-256(program_id || type_name).
    uint64_t account_discriminant(const Pubkey& program_id, std::string_view type_name);

    inline uint64_t market_header_discriminant(const Pubkey& program_id) {
        return account_discriminant(program_id, MARKET_HEADER_TYPE_NAME);
    }

}
