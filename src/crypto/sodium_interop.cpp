#include "dmsync/crypto/sodium_interop.hpp"
#include "dmsync/core/format.hpp"

#include <algorithm>

namespace dmsync::crypto {

// ============================================================================
// Initialization
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::Initialize() {
    std::call_once(init_flag_, []() {
        initialized_.store(sodium_init() >= 0, std::memory_order_release);
    });

    if (!initialized_.load(std::memory_order_acquire)) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::SODIUM_INIT_FAILED)));
    }

    return Result<Unit, SodiumFailure>::Ok(unit);
}

bool SodiumInterop::IsInitialized() noexcept {
    return initialized_.load(std::memory_order_acquire);
}

// ============================================================================
// Memory hygiene
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::span<uint8_t> buffer) {
    if (!IsInitialized()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::NOT_INITIALIZED)));
    }

    if (buffer.empty()) {
        return Result<Unit, SodiumFailure>::Ok(unit);
    }

    if (buffer.size() > MAX_BUFFER_SIZE) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooLarge(compat::format(
                "Buffer size {} exceeds maximum {}", buffer.size(), MAX_BUFFER_SIZE)));
    }

    sodium_memzero(buffer.data(), buffer.size());
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<bool, SodiumFailure> SodiumInterop::ConstantTimeEquals(
    std::span<const uint8_t> a,
    std::span<const uint8_t> b) {

    if (a.size() != b.size()) {
        return Result<bool, SodiumFailure>::Ok(false);
    }

    if (a.empty()) {
        return Result<bool, SodiumFailure>::Ok(true);
    }

    return Result<bool, SodiumFailure>::Ok(
        sodium_memcmp(a.data(), b.data(), a.size()) == SodiumConstants::SUCCESS);
}

void* SodiumInterop::AllocateSecure(const size_t size) noexcept {
    if (!IsInitialized() || size == 0) {
        return nullptr;
    }
    return sodium_malloc(size);
}

void SodiumInterop::FreeSecure(void* ptr) noexcept {
    if (ptr != nullptr) {
        sodium_free(ptr);
    }
}

// ============================================================================
// Randomness
// ============================================================================

std::vector<uint8_t> SodiumInterop::GetRandomBytes(const size_t size) {
    std::vector<uint8_t> buffer(size);
    if (size > 0) {
        randombytes_buf(buffer.data(), size);
    }
    return buffer;
}

uint32_t SodiumInterop::RandomUniform(const uint32_t upper_bound) {
    if (upper_bound == 0) {
        return 0;
    }
    return randombytes_uniform(upper_bound);
}

// ============================================================================
// Ed25519 / X25519
// ============================================================================

Result<std::pair<std::vector<uint8_t>, std::vector<uint8_t>>, DmFailure>
SodiumInterop::GenerateEd25519KeyPair() {
    using KeyPairResult = Result<std::pair<std::vector<uint8_t>, std::vector<uint8_t>>, DmFailure>;

    std::vector<uint8_t> pk(Constants::ED_25519_PUBLIC_KEY_SIZE);
    std::vector<uint8_t> sk(Constants::ED_25519_SECRET_KEY_SIZE);

    if (crypto_sign_keypair(pk.data(), sk.data()) != SodiumConstants::SUCCESS) {
        { auto __wipe = SecureWipe(std::span<uint8_t>(sk)); (void)__wipe; }
        return KeyPairResult::Err(
            DmFailure::KeyGeneration("Failed to generate Ed25519 key pair"));
    }

    return KeyPairResult::Ok(std::make_pair(std::move(sk), std::move(pk)));
}

Result<std::pair<std::vector<uint8_t>, std::vector<uint8_t>>, DmFailure>
SodiumInterop::Ed25519KeyPairFromSeed(std::span<const uint8_t> seed) {
    using KeyPairResult = Result<std::pair<std::vector<uint8_t>, std::vector<uint8_t>>, DmFailure>;

    if (seed.size() != Constants::ED_25519_SEED_SIZE) {
        return KeyPairResult::Err(DmFailure::InvalidInput(compat::format(
            "Ed25519 seed must be {} bytes, got {}", Constants::ED_25519_SEED_SIZE, seed.size())));
    }

    std::vector<uint8_t> pk(Constants::ED_25519_PUBLIC_KEY_SIZE);
    std::vector<uint8_t> sk(Constants::ED_25519_SECRET_KEY_SIZE);

    if (crypto_sign_seed_keypair(pk.data(), sk.data(), seed.data()) != SodiumConstants::SUCCESS) {
        { auto __wipe = SecureWipe(std::span<uint8_t>(sk)); (void)__wipe; }
        return KeyPairResult::Err(
            DmFailure::KeyGeneration("Failed to derive Ed25519 key pair from seed"));
    }

    return KeyPairResult::Ok(std::make_pair(std::move(sk), std::move(pk)));
}

Result<std::vector<uint8_t>, DmFailure> SodiumInterop::SignDetached(
    std::span<const uint8_t> message,
    std::span<const uint8_t> secret_key) {

    if (secret_key.size() != Constants::ED_25519_SECRET_KEY_SIZE) {
        return Result<std::vector<uint8_t>, DmFailure>::Err(
            DmFailure::InvalidInput("Ed25519 secret key has wrong size"));
    }

    std::vector<uint8_t> signature(Constants::ED_25519_SIGNATURE_SIZE);
    if (crypto_sign_detached(signature.data(), nullptr,
                             message.data(), message.size(),
                             secret_key.data()) != SodiumConstants::SUCCESS) {
        return Result<std::vector<uint8_t>, DmFailure>::Err(
            DmFailure::Encode("Ed25519 signing failed"));
    }

    return Result<std::vector<uint8_t>, DmFailure>::Ok(std::move(signature));
}

bool SodiumInterop::VerifyDetached(
    std::span<const uint8_t> signature,
    std::span<const uint8_t> message,
    std::span<const uint8_t> public_key) {

    if (signature.size() != Constants::ED_25519_SIGNATURE_SIZE ||
        public_key.size() != Constants::ED_25519_PUBLIC_KEY_SIZE) {
        return false;
    }

    return crypto_sign_verify_detached(signature.data(), message.data(), message.size(),
                                       public_key.data()) == SodiumConstants::SUCCESS;
}

Result<std::vector<uint8_t>, DmFailure> SodiumInterop::Ed25519PublicToX25519(
    std::span<const uint8_t> ed25519_public) {

    if (ed25519_public.size() != Constants::ED_25519_PUBLIC_KEY_SIZE) {
        return Result<std::vector<uint8_t>, DmFailure>::Err(
            DmFailure::InvalidInput(compat::format(
                "Public key must be {} bytes, got {}",
                Constants::ED_25519_PUBLIC_KEY_SIZE, ed25519_public.size())));
    }

    std::vector<uint8_t> x25519_public(Constants::X_25519_PUBLIC_KEY_SIZE);
    if (crypto_sign_ed25519_pk_to_curve25519(x25519_public.data(), ed25519_public.data())
        != SodiumConstants::SUCCESS) {
        return Result<std::vector<uint8_t>, DmFailure>::Err(
            DmFailure::InvalidInput("Public key is not a valid Ed25519 point"));
    }

    return Result<std::vector<uint8_t>, DmFailure>::Ok(std::move(x25519_public));
}

Result<std::vector<uint8_t>, DmFailure> SodiumInterop::Ed25519SecretToX25519(
    std::span<const uint8_t> ed25519_secret) {

    if (ed25519_secret.size() != Constants::ED_25519_SECRET_KEY_SIZE) {
        return Result<std::vector<uint8_t>, DmFailure>::Err(
            DmFailure::InvalidInput("Ed25519 secret key has wrong size"));
    }

    std::vector<uint8_t> x25519_private(Constants::X_25519_PRIVATE_KEY_SIZE);
    if (crypto_sign_ed25519_sk_to_curve25519(x25519_private.data(), ed25519_secret.data())
        != SodiumConstants::SUCCESS) {
        return Result<std::vector<uint8_t>, DmFailure>::Err(
            DmFailure::DeriveKey("Failed to convert Ed25519 secret key"));
    }

    return Result<std::vector<uint8_t>, DmFailure>::Ok(std::move(x25519_private));
}

Result<std::vector<uint8_t>, DmFailure> SodiumInterop::X25519SharedSecret(
    std::span<const uint8_t> x25519_private,
    std::span<const uint8_t> x25519_public) {

    if (x25519_private.size() != Constants::X_25519_PRIVATE_KEY_SIZE ||
        x25519_public.size() != Constants::X_25519_PUBLIC_KEY_SIZE) {
        return Result<std::vector<uint8_t>, DmFailure>::Err(
            DmFailure::InvalidInput("X25519 key has wrong size"));
    }

    std::vector<uint8_t> shared(Constants::X_25519_SHARED_SECRET_SIZE);
    if (crypto_scalarmult(shared.data(), x25519_private.data(), x25519_public.data())
        != SodiumConstants::SUCCESS) {
        return Result<std::vector<uint8_t>, DmFailure>::Err(
            DmFailure::DeriveKey("X25519 key agreement produced a weak shared secret"));
    }

    return Result<std::vector<uint8_t>, DmFailure>::Ok(std::move(shared));
}

// ============================================================================
// ChaCha20
// ============================================================================

Result<std::vector<uint8_t>, DmFailure> SodiumInterop::ChaCha20Xor(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> input) {

    if (key.size() != crypto_stream_chacha20_ietf_KEYBYTES) {
        return Result<std::vector<uint8_t>, DmFailure>::Err(
            DmFailure::InvalidInput("ChaCha20 key has wrong size"));
    }
    if (nonce.size() != crypto_stream_chacha20_ietf_NONCEBYTES) {
        return Result<std::vector<uint8_t>, DmFailure>::Err(
            DmFailure::InvalidInput("ChaCha20 nonce has wrong size"));
    }

    std::vector<uint8_t> output(input.size());
    if (!input.empty() &&
        crypto_stream_chacha20_ietf_xor(output.data(), input.data(), input.size(),
                                        nonce.data(), key.data()) != SodiumConstants::SUCCESS) {
        return Result<std::vector<uint8_t>, DmFailure>::Err(
            DmFailure::Generic("ChaCha20 stream operation failed"));
    }

    return Result<std::vector<uint8_t>, DmFailure>::Ok(std::move(output));
}

} // namespace dmsync::crypto
