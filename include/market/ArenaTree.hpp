#pragma once

#include <cstdint>
#include <span>
#include <unordered_set>
#include <utility>
#include <vector>

namespace phoenix {

    // Function: ArenaNode
    // Description: One scanned arena slot. address is the allocator's 1-indexed
    //              node address (slot index + 1), the value other accounts refer to.
    //              key and value alias the decoded buffer and live as long as it does.
    struct ArenaNode {
        uint32_t address;
        int32_t next_free; // register 0, only meaningful while the slot is free
        std::span<const uint8_t> key;
        std::span<const uint8_t> value;
    };

    // Function: ArenaTree
    // Description: Flat result of decoding a fixed-capacity red-black tree arena.
    //              No tree structure is rebuilt; callers only need the live entries.
    class ArenaTree {
    public:
        ArenaTree(std::vector<ArenaNode> nodes, std::unordered_set<uint32_t> free_addresses,
                  int32_t bump_index)
            : nodes_(std::move(nodes)), free_(std::move(free_addresses)), bump_index_(bump_index) {}

        // All scanned slots in arena order, free ones included
        const std::vector<ArenaNode>& nodes() const { return nodes_; }
        const std::unordered_set<uint32_t>& free_addresses() const { return free_; }
        int32_t bump_index() const { return bump_index_; }

        bool is_free(uint32_t address) const { return free_.count(address) != 0; }

        // Function: live
        // Description: Scanned slots that are not on the free list, in arena order.
        std::vector<ArenaNode> live() const;

    private:
        std::vector<ArenaNode> nodes_;
        std::unordered_set<uint32_t> free_;
        int32_t bump_index_;
    };

    // Function: decode_arena_tree
    // Description: Decodes the tree layout
    //                [16B tree header][8B allocator size][i32 bump index][i32 free list head]
    //                then per slot [4 x i32 registers][key][value]
    //              Scans bump_index - 1 slots, or as many whole slots as the buffer holds,
    //              then walks the free list from its head until the pointer reaches the
    //              bump index.
    // Inputs: data - tree sub-buffer. key_size / value_size - fixed widths in bytes.
    // Outputs: The decoded arena. Throws DecodeError(SizeMismatch) when the prefix is
    //          truncated and DecodeError(Corruption) when the free list leaves the
    //          scanned range or visits more nodes than were scanned (a cycle).
    ArenaTree decode_arena_tree(std::span<const uint8_t> data, size_t key_size, size_t value_size);

}
