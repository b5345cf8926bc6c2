#pragma once

#include "dmsync/core/result.hpp"
#include "dmsync/core/failures.hpp"
#include "dmsync/core/constants.hpp"

#include <sodium.h>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <utility>
#include <vector>

namespace dmsync::crypto {

/**
 * @brief Interop layer for the libsodium primitives used by the codecs
 *
 * Covers Ed25519 signing identities, their conversion to X25519 for key
 * agreement, the ChaCha20 stream cipher, randomness and memory hygiene.
 * Every operation that can fail returns a Result.
 */
class SodiumInterop {
public:
    // ========================================================================
    // Initialization
    // ========================================================================

    /**
     * @brief Initialize libsodium
     *
     * Thread-safe and idempotent. Must succeed before any other call.
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    // ========================================================================
    // Memory hygiene
    // ========================================================================

    /**
     * @brief Zero a buffer in a way the optimizer cannot elide
     */
    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    /**
     * @brief Constant-time comparison; buffers of different size compare unequal
     */
    static Result<bool, SodiumFailure> ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b);

    static void* AllocateSecure(size_t size) noexcept;
    static void FreeSecure(void* ptr) noexcept;

    // ========================================================================
    // Randomness
    // ========================================================================

    static std::vector<uint8_t> GetRandomBytes(size_t size);

    /**
     * @brief Uniform random integer in [0, upper_bound)
     */
    static uint32_t RandomUniform(uint32_t upper_bound);

    // ========================================================================
    // Ed25519 / X25519
    // ========================================================================

    /**
     * @brief Generate an Ed25519 key pair
     *
     * @return Ok((secret_key[64], public_key[32]))
     */
    static Result<std::pair<std::vector<uint8_t>, std::vector<uint8_t>>, DmFailure>
    GenerateEd25519KeyPair();

    /**
     * @brief Deterministic Ed25519 key pair from a 32-byte seed
     */
    static Result<std::pair<std::vector<uint8_t>, std::vector<uint8_t>>, DmFailure>
    Ed25519KeyPairFromSeed(std::span<const uint8_t> seed);

    static Result<std::vector<uint8_t>, DmFailure> SignDetached(
        std::span<const uint8_t> message,
        std::span<const uint8_t> secret_key);

    [[nodiscard]] static bool VerifyDetached(
        std::span<const uint8_t> signature,
        std::span<const uint8_t> message,
        std::span<const uint8_t> public_key);

    static Result<std::vector<uint8_t>, DmFailure> Ed25519PublicToX25519(
        std::span<const uint8_t> ed25519_public);

    static Result<std::vector<uint8_t>, DmFailure> Ed25519SecretToX25519(
        std::span<const uint8_t> ed25519_secret);

    /**
     * @brief X25519 key agreement
     *
     * Fails for low-order peer points (all-zero shared secret).
     */
    static Result<std::vector<uint8_t>, DmFailure> X25519SharedSecret(
        std::span<const uint8_t> x25519_private,
        std::span<const uint8_t> x25519_public);

    // ========================================================================
    // ChaCha20
    // ========================================================================

    /**
     * @brief ChaCha20 (IETF, 96-bit nonce) keystream XOR, counter starting at 0
     */
    static Result<std::vector<uint8_t>, DmFailure> ChaCha20Xor(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> input);

    static constexpr size_t MAX_BUFFER_SIZE = 1'000'000'000;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    SodiumInterop() = delete;
};

} // namespace dmsync::crypto
