#include "common/Errors.hpp"
#include "common/Utils.hpp"
#include "market/Clock.hpp"
#include "market/Discriminant.hpp"
#include "market/Ladder.hpp"
#include "market/MarketSnapshot.hpp"
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

using namespace phoenix;

// Reads a whole file into memory
static bool read_file(const char* path, std::vector<uint8_t>& out) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return false;
    out.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    return true;
}

int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " <market_account.bin> <clock_account.bin> [levels] [program_id]" << std::endl;
        return 1;
    }

    std::vector<uint8_t> market_data;
    std::vector<uint8_t> clock_data;
    if (!read_file(argv[1], market_data)) {
        std::cerr << "Cannot open " << argv[1] << std::endl;
        return 1;
    }
    if (!read_file(argv[2], clock_data)) {
        std::cerr << "Cannot open " << argv[2] << std::endl;
        return 1;
    }

    size_t levels = constants::DEFAULT_L2_LADDER_DEPTH;
    if (argc >= 4) levels = std::strtoull(argv[3], nullptr, 10);

    std::optional<uint64_t> expected;
    if (argc >= 5) {
        Pubkey program_id;
        if (!utils::from_base58(argv[4], program_id)) {
            std::cerr << "Invalid program id " << argv[4] << std::endl;
            return 1;
        }
        expected = market_header_discriminant(program_id);
    } else {
        std::cerr << "Warning: no program id given, market schema not checked" << std::endl;
    }

    try {
        const Clock clock = decode_clock(clock_data);
        const MarketSnapshot snapshot = decode_market(market_data, expected);
        const uint64_t ts = clock.unix_timestamp < 0 ? 0 : static_cast<uint64_t>(clock.unix_timestamp);
        const UiLadder ladder = get_ui_ladder(snapshot, clock.slot, ts, levels);

        std::printf("slot %llu  seq %llu  taker fee %llu bps\n",
                    static_cast<unsigned long long>(clock.slot),
                    static_cast<unsigned long long>(snapshot.sequence_number),
                    static_cast<unsigned long long>(snapshot.taker_fee_bps));

        // Asks printed top-down so the spread sits in the middle
        for (auto it = ladder.asks.rbegin(); it != ladder.asks.rend(); ++it) {
            std::printf("%20s %14.6f %14.4f\n", "", it->price, it->quantity);
        }
        for (const auto& level : ladder.bids) {
            std::printf("%14.4f %14.6f\n", level.quantity, level.price);
        }
    } catch (const DecodeError& e) {
        std::cerr << "Decode failed: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
