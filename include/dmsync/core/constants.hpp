#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <chrono>
namespace dmsync {
struct Constants {
    static constexpr size_t ED_25519_PUBLIC_KEY_SIZE = 32;
    static constexpr size_t ED_25519_SECRET_KEY_SIZE = 64;
    static constexpr size_t ED_25519_SEED_SIZE = 32;
    static constexpr size_t ED_25519_SIGNATURE_SIZE = 64;
    static constexpr size_t X_25519_PUBLIC_KEY_SIZE = 32;
    static constexpr size_t X_25519_PRIVATE_KEY_SIZE = 32;
    static constexpr size_t X_25519_SHARED_SECRET_SIZE = 32;
    static constexpr size_t SHA_256_SIZE = 32;
    static constexpr size_t AES_KEY_SIZE = 32;
    static constexpr size_t AES_CBC_IV_SIZE = 16;
    static constexpr size_t AES_BLOCK_SIZE = 16;
    static constexpr size_t SMALL_BUFFER_THRESHOLD = 1024;
    static constexpr size_t OPENSSL_ERROR_BUFFER_SIZE = 256;
};
struct OpenSSLConstants {
    static constexpr int SUCCESS = 1;
    static constexpr unsigned long NO_ERROR = 0;
    static constexpr std::string_view ALGORITHM_HKDF = "HKDF";
    static constexpr std::string_view ALGORITHM_HMAC = "HMAC";
    static constexpr std::string_view ALGORITHM_SHA256 = "SHA256";
    static constexpr std::string_view PARAM_DIGEST = "digest";
    static constexpr std::string_view PARAM_KEY = "key";
    static constexpr std::string_view PARAM_SALT = "salt";
    static constexpr std::string_view PARAM_INFO = "info";
    static constexpr std::string_view PARAM_MODE = "mode";
    static constexpr std::string_view MODE_EXTRACT_ONLY = "EXTRACT_ONLY";
    static constexpr std::string_view MODE_EXPAND_ONLY = "EXPAND_ONLY";
    static constexpr std::string_view UNKNOWN_ERROR_MESSAGE = "Unknown OpenSSL error";
};
struct SodiumConstants {
    static constexpr int SUCCESS = 0;
    static constexpr int FAILURE = -1;
};
struct PrivatePayloadConstants {
    static constexpr uint8_t VERSION = 2;
    static constexpr std::string_view SALT = "nip44-v2";
    static constexpr size_t NONCE_SIZE = 32;
    static constexpr size_t CHACHA_KEY_SIZE = 32;
    static constexpr size_t CHACHA_NONCE_SIZE = 12;
    static constexpr size_t HMAC_KEY_SIZE = 32;
    static constexpr size_t MAC_SIZE = 32;
    static constexpr size_t MESSAGE_KEYS_SIZE = CHACHA_KEY_SIZE + CHACHA_NONCE_SIZE + HMAC_KEY_SIZE;
    static constexpr size_t MIN_PLAINTEXT_SIZE = 1;
    static constexpr size_t MAX_PLAINTEXT_SIZE = 65535;
    static constexpr size_t MIN_PADDED_SIZE = 32;
    static constexpr size_t LENGTH_PREFIX_SIZE = 2;
    static constexpr size_t MIN_PAYLOAD_B64_SIZE = 132;
    static constexpr size_t MAX_PAYLOAD_B64_SIZE = 87472;
    static constexpr size_t MIN_DECODED_SIZE = 99;
    static constexpr size_t MAX_DECODED_SIZE = 65603;
};
struct EventKind {
    static constexpr uint32_t LEGACY_DIRECT_MESSAGE = 4;
    static constexpr uint32_t SEAL = 13;
    static constexpr uint32_t PRIVATE_DIRECT_MESSAGE = 14;
    static constexpr uint32_t PRIVATE_FILE_MESSAGE = 15;
    static constexpr uint32_t GIFT_WRAP = 1059;
    static constexpr uint32_t BLOCKED_RELAYS = 10006;
    static constexpr uint32_t RELAY_LIST = 10002;
    static constexpr uint32_t DM_INBOX_RELAYS = 10050;
};
struct SyncConstants {
    /// Gift-wrap outer timestamps are randomised up to this far into the past.
    /// Fixed by the protocol, not a deployment tunable.
    static constexpr std::chrono::seconds GIFT_WRAP_FUZZ_WINDOW{2 * 24 * 60 * 60};
    static constexpr std::string_view CACHE_KEY_PREFIX = "dm-cache:";
    static constexpr std::string_view CONVERSATION_ID_PREFIX = "group:";
    static constexpr std::string_view OPTIMISTIC_ID_PREFIX = "optimistic-";
    static constexpr uint32_t CACHE_FORMAT_VERSION = 2;
};
struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "Libsodium not initialized";
    static constexpr std::string_view HANDLE_DISPOSED = "Handle disposed";
    static constexpr std::string_view DATA_EXCEEDS_BUFFER = "Data size exceeds buffer size";
    static constexpr std::string_view MISSING_RECIPIENT = "Missing recipient";
    static constexpr std::string_view UNABLE_TO_DECRYPT = "Unable to decrypt";
    static constexpr std::string_view MAY_NOT_BE_DELIVERED =
        "Message may not have been delivered to all recipients";
};
}
