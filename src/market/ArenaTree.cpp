#include "market/ArenaTree.hpp"
#include "common/Errors.hpp"
#include "common/Utils.hpp"
#include <algorithm>
#include <cstring>
#include <string>

namespace phoenix {

    std::vector<ArenaNode> ArenaTree::live() const {
        std::vector<ArenaNode> out;
        out.reserve(nodes_.size() - std::min(nodes_.size(), free_.size()));
        for (const auto& node : nodes_) {
            if (!is_free(node.address)) {
                out.push_back(node);
            }
        }
        return out;
    }

    ArenaTree decode_arena_tree(std::span<const uint8_t> data, size_t key_size, size_t value_size) {
        utils::ByteReader reader(data);

        // 1. Prefix: tree header and allocator size are opaque here
        reader.skip(constants::TREE_HEADER_SIZE);
        reader.skip(constants::ALLOCATOR_SIZE_FIELD);
        const int32_t bump_index = reader.i32();
        const int32_t free_list_head = reader.i32();

        // 2. Slot scan, bounded by the allocator high-water mark and by the buffer
        const size_t node_size = constants::NODE_REGISTERS_SIZE + key_size + value_size;
        size_t slot_count = bump_index > 1 ? static_cast<size_t>(bump_index) - 1 : 0;
        slot_count = std::min(slot_count, reader.remaining() / node_size);

        std::vector<ArenaNode> nodes;
        nodes.reserve(slot_count);

        size_t offset = reader.offset();
        for (size_t slot = 0; slot < slot_count; ++slot) {
            int32_t next_free;
            std::memcpy(&next_free, data.data() + offset, sizeof(next_free));

            const size_t key_offset = offset + constants::NODE_REGISTERS_SIZE;
            nodes.push_back({
                static_cast<uint32_t>(slot + 1),
                next_free,
                data.subspan(key_offset, key_size),
                data.subspan(key_offset + key_size, value_size)
            });
            offset += node_size;
        }

        // 3. Free list walk. Pointers are 1-indexed and the list ends at the bump index.
        std::unordered_set<uint32_t> free_addresses;
        int32_t pointer = free_list_head > 0 ? free_list_head : bump_index;
        size_t visits = 0;

        while (pointer < bump_index) {
            if (pointer < 1 || static_cast<size_t>(pointer) > nodes.size()) {
                throw DecodeError(ErrorKind::Corruption,
                    "free list pointer " + std::to_string(pointer) + " outside " +
                    std::to_string(nodes.size()) + " scanned nodes");
            }
            if (++visits > nodes.size()) {
                throw DecodeError(ErrorKind::Corruption,
                    "free list cycle detected after " + std::to_string(nodes.size()) + " visits");
            }

            const ArenaNode& node = nodes[static_cast<size_t>(pointer) - 1];
            free_addresses.insert(node.address);
            pointer = node.next_free;
        }

        return ArenaTree(std::move(nodes), std::move(free_addresses), bump_index);
    }

}
