#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace obscur::core::configuration {

/**
 * @brief Settings for one identity's MessageStore.
 *
 * The at-rest key is SHA-256 of `encryption_secret` when given, otherwise of
 * the identity public key. The public-key form only hides records from
 * someone who does not know that key; pass a secret for real protection.
 * `database_path` of ":memory:" keeps SQLite in RAM.
 */
struct StoreConfig {
    std::string identity_pubkey;
    std::optional<std::string> encryption_secret;
    std::string database_path = ":memory:";
    bool encrypt_at_rest = true;
    int max_retries = 5;
    std::chrono::milliseconds busy_timeout{5000};

    [[nodiscard]] static StoreConfig InMemory(std::string identity_pubkey) {
        StoreConfig config;
        config.identity_pubkey = std::move(identity_pubkey);
        return config;
    }

    [[nodiscard]] static StoreConfig OnDisk(std::string identity_pubkey, std::string database_path) {
        StoreConfig config;
        config.identity_pubkey = std::move(identity_pubkey);
        config.database_path = std::move(database_path);
        return config;
    }
};

}
