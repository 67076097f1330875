#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <chrono>
namespace obscur::core {
struct Constants {
    static constexpr size_t ED_25519_PUBLIC_KEY_SIZE = 32;
    static constexpr size_t ED_25519_SEED_SIZE = 32;
    static constexpr size_t ED_25519_SECRET_KEY_SIZE = 64;
    static constexpr size_t ED_25519_SIGNATURE_SIZE = 64;
    static constexpr size_t X_25519_KEY_SIZE = 32;
    static constexpr size_t SHA_256_SIZE = 32;
    static constexpr size_t AES_KEY_SIZE = 32;
    static constexpr size_t AES_GCM_NONCE_SIZE = 12;
    static constexpr size_t AES_GCM_TAG_SIZE = 16;
    static constexpr size_t HEX_KEY_LENGTH = 64;
    static constexpr size_t HEX_SIGNATURE_LENGTH = 128;
    static constexpr size_t INVITE_ID_SIZE = 16;
    static constexpr size_t OPENSSL_ERROR_BUFFER_SIZE = 256;
};
struct OpenSSLConstants {
    static constexpr int SUCCESS = 1;
    static constexpr unsigned long NO_ERROR = 0;
    static constexpr std::string_view ALGORITHM_HKDF = "HKDF";
    static constexpr std::string_view ALGORITHM_SHA256 = "SHA256";
    static constexpr std::string_view PARAM_DIGEST = "digest";
    static constexpr std::string_view PARAM_KEY = "key";
    static constexpr std::string_view PARAM_SALT = "salt";
    static constexpr std::string_view PARAM_INFO = "info";
    static constexpr std::string_view PARAM_MODE = "mode";
    static constexpr std::string_view UNKNOWN_ERROR_MESSAGE = "Unknown OpenSSL error";
};
struct SodiumConstants {
    static constexpr int SUCCESS = 0;
    static constexpr int FAILURE = -1;
};
struct Nip44Constants {
    static constexpr uint8_t VERSION = 2;
    static constexpr std::string_view SALT = "nip44-v2";
    static constexpr size_t NONCE_SIZE = 32;
    static constexpr size_t MAC_SIZE = 32;
    static constexpr size_t CHACHA_KEY_SIZE = 32;
    static constexpr size_t CHACHA_NONCE_SIZE = 12;
    static constexpr size_t HMAC_KEY_SIZE = 32;
    static constexpr size_t MESSAGE_KEYS_SIZE = CHACHA_KEY_SIZE + CHACHA_NONCE_SIZE + HMAC_KEY_SIZE;
    static constexpr size_t MIN_PLAINTEXT_SIZE = 1;
    static constexpr size_t MAX_PLAINTEXT_SIZE = 65535;
    static constexpr size_t MIN_PADDED_SIZE = 32;
    static constexpr size_t LENGTH_PREFIX_SIZE = 2;
};
struct EventKinds {
    static constexpr int CONTACT_LIST = 3;
    static constexpr int ENCRYPTED_DM = 4;
    static constexpr int SEAL = 13;
    static constexpr int CHAT_RUMOR = 14;
    static constexpr int GIFT_WRAP = 1059;
};
struct StorageConstants {
    static constexpr std::string_view ENCRYPTED_SENTINEL = "[ENCRYPTED]";
    static constexpr std::string_view MESSAGES_COLLECTION = "messages";
    static constexpr std::string_view QUEUE_COLLECTION = "queue";
    static constexpr std::string_view GROUP_PREFIX = "group:";
    static constexpr char CONVERSATION_SEPARATOR = ':';
};
struct BridgeConstants {
    static constexpr std::string_view NATIVE_SESSION_PREFIX = "native-session:";
    static constexpr std::chrono::milliseconds DEFAULT_BRIDGE_TIMEOUT{5000};
    static constexpr std::chrono::milliseconds DEFAULT_WORKER_TIMEOUT{10000};
};
struct LoggingConstants {
    static constexpr std::string_view LOGGER_NAME = "obscur";
    static constexpr std::string_view REDACTED = "[REDACTED]";
    static constexpr size_t MIN_SECRET_TOKEN_LENGTH = 32;
};
}
