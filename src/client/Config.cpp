#include "client/Config.hpp"
#include "common/Errors.hpp"
#include "common/Utils.hpp"
#include "simdjson.h"
#include <cstdlib>

namespace phoenix {

    namespace {

        std::string_view require_string(simdjson::dom::element object, const char* key, const std::string& where) {
            std::string_view value;
            if (object[key].get(value) != simdjson::SUCCESS) {
                throw ConfigError(where + ": missing string field '" + key + "'");
            }
            return value;
        }

        Pubkey require_pubkey(std::string_view text, const std::string& where) {
            Pubkey key;
            if (!utils::from_base58(text, key)) {
                throw ConfigError(where + ": invalid base58 key '" + std::string(text) + "'");
            }
            return key;
        }

        ClusterConfig parse_cluster(simdjson::dom::object body, const std::string& name) {
            ClusterConfig cluster;

            std::string_view program_id;
            auto program_field = body["programId"];
            if (program_field.error() == simdjson::SUCCESS) {
                if (program_field.get(program_id) != simdjson::SUCCESS) {
                    throw ConfigError(name + ": 'programId' must be a string");
                }
                cluster.program_id = require_pubkey(program_id, name + ".programId");
            }

            simdjson::dom::array tokens;
            if (body["tokens"].get(tokens) != simdjson::SUCCESS) {
                throw ConfigError(name + ": missing array 'tokens'");
            }
            for (simdjson::dom::element token : tokens) {
                const std::string where = name + ".tokens";
                TokenConfig config;
                config.name = std::string(require_string(token, "name", where));
                config.symbol = std::string(require_string(token, "symbol", where));
                config.mint = require_pubkey(require_string(token, "mint", where), where);
                std::string_view logo;
                if (token["logoUri"].get(logo) == simdjson::SUCCESS) config.logo_uri = std::string(logo);
                cluster.tokens.push_back(std::move(config));
            }

            simdjson::dom::array markets;
            if (body["markets"].get(markets) != simdjson::SUCCESS) {
                throw ConfigError(name + ": missing array 'markets'");
            }
            for (simdjson::dom::element market : markets) {
                std::string_view address;
                if (market.get(address) != simdjson::SUCCESS) {
                    throw ConfigError(name + ".markets: entries must be strings");
                }
                cluster.markets.push_back(require_pubkey(address, name + ".markets"));
            }
            return cluster;
        }

        std::map<std::string, ClusterConfig> parse_clusters(simdjson::dom::element doc) {
            simdjson::dom::object root;
            if (doc.get(root) != simdjson::SUCCESS) {
                throw ConfigError("config root must be an object");
            }

            std::map<std::string, ClusterConfig> clusters;
            for (auto field : root) {
                const std::string name(field.key);
                simdjson::dom::object body;
                if (field.value.get(body) != simdjson::SUCCESS) {
                    throw ConfigError(name + ": cluster entry must be an object");
                }
                clusters.emplace(name, parse_cluster(body, name));
            }
            return clusters;
        }

    }

    const TokenConfig* ClusterConfig::find_token(const Pubkey& mint) const {
        for (const auto& token : tokens) {
            if (token.mint == mint) return &token;
        }
        return nullptr;
    }

    ClientConfig ClientConfig::parse(std::string_view json) {
        simdjson::dom::parser parser;
        simdjson::dom::element doc;
        simdjson::padded_string padded(json);
        auto error = parser.parse(padded).get(doc);
        if (error) {
            throw ConfigError(std::string("config parse error: ") + simdjson::error_message(error));
        }
        return ClientConfig(parse_clusters(doc));
    }

    ClientConfig ClientConfig::load(const std::string& path) {
        simdjson::dom::parser parser;
        simdjson::dom::element doc;
        auto error = parser.load(path).get(doc);
        if (error) {
            throw ConfigError("failed to load " + path + ": " + simdjson::error_message(error));
        }
        return ClientConfig(parse_clusters(doc));
    }

    ClientConfig ClientConfig::from_env() {
        const char* path = std::getenv(ENV_VAR);
        if (!path || !*path) {
            throw ConfigError(std::string(ENV_VAR) + " is not set");
        }
        return load(path);
    }

    const ClusterConfig& ClientConfig::cluster(const std::string& name) const {
        auto it = clusters_.find(name);
        if (it == clusters_.end()) {
            throw ConfigError("unknown cluster '" + name + "'");
        }
        return it->second;
    }

    std::vector<std::string> ClientConfig::cluster_names() const {
        std::vector<std::string> names;
        names.reserve(clusters_.size());
        for (const auto& [name, cluster] : clusters_) names.push_back(name);
        return names;
    }

    std::string cluster_from_endpoint(std::string_view endpoint) {
        if (endpoint.find("devnet") != std::string_view::npos) return "devnet";
        if (endpoint.find("localhost") != std::string_view::npos ||
            endpoint.find("127.0.0.1") != std::string_view::npos) return "localhost";
        return "mainnet-beta";
    }

}
