#include "market/Discriminant.hpp"
#include <openssl/sha.h>
#include <cstring>
#include <vector>

namespace phoenix {

    uint64_t account_discriminant(const Pubkey& program_id, std::string_view type_name) {
        std::vector<unsigned char> preimage(program_id.bytes.begin(), program_id.bytes.end());
        preimage.insert(preimage.end(), type_name.begin(), type_name.end());

        unsigned char hash[SHA256_DIGEST_LENGTH];
        SHA256(preimage.data(), preimage.size(), hash);

        uint64_t discriminant;
        std::memcpy(&discriminant, hash, sizeof(discriminant));
        return discriminant;
    }

}
