#pragma once

#include "common/Types.hpp"
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace phoenix {

    struct TokenConfig {
        std::string name;
        std::string symbol;
        Pubkey mint;
        std::string logo_uri;
    };

    // Function: ClusterConfig
    // Description: Tokens and market addresses known on one cluster.
    //              program_id, when present, turns on the market header schema check.
    struct ClusterConfig {
        std::optional<Pubkey> program_id;
        std::vector<TokenConfig> tokens;
        std::vector<Pubkey> markets;

        const TokenConfig* find_token(const Pubkey& mint) const;
    };

    /**
     * @class ClientConfig
     * @brief Per-cluster token and market lists, read from a JSON document.
     *
     * Document shape:
     *   { "<cluster>": { "programId": "<base58>",
     *                    "tokens": [ {"name", "symbol", "mint", "logoUri"} ],
     *                    "markets": [ "<base58>", ... ] } }
     * "programId" is optional. Malformed documents throw ConfigError.
     */
    class ClientConfig {
    public:
        static constexpr const char* ENV_VAR = "PHOENIX_CONFIG";

        static ClientConfig parse(std::string_view json);
        static ClientConfig load(const std::string& path);
        // Loads the file named by $PHOENIX_CONFIG
        static ClientConfig from_env();

        const ClusterConfig& cluster(const std::string& name) const;
        bool has_cluster(const std::string& name) const { return clusters_.count(name) != 0; }
        std::vector<std::string> cluster_names() const;

    private:
        explicit ClientConfig(std::map<std::string, ClusterConfig> clusters) : clusters_(std::move(clusters)) {}

        std::map<std::string, ClusterConfig> clusters_;
    };

    // Function: cluster_from_endpoint
    // Description: "devnet" / "localhost" when the RPC url names them, "mainnet-beta" otherwise.
    std::string cluster_from_endpoint(std::string_view endpoint);

}
