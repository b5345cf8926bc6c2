#include "dmsync/crypto/aes_cbc.hpp"
#include "dmsync/crypto/sodium_interop.hpp"
#include "dmsync/core/constants.hpp"
#include "dmsync/core/format.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>

#include <memory>
#include <string>

namespace dmsync::crypto {

using OpenSSL = OpenSSLConstants;

namespace {
    struct EVP_CIPHER_CTX_Deleter {
        void operator()(EVP_CIPHER_CTX* ctx) const {
            if (ctx) {
                EVP_CIPHER_CTX_free(ctx);
            }
        }
    };
    using EVP_CIPHER_CTX_ptr = std::unique_ptr<EVP_CIPHER_CTX, EVP_CIPHER_CTX_Deleter>;

    std::string GetOpenSSLError() {
        const unsigned long err = ERR_get_error();
        if (err == OpenSSL::NO_ERROR) {
            return std::string(OpenSSL::UNKNOWN_ERROR_MESSAGE);
        }
        char buffer[Constants::OPENSSL_ERROR_BUFFER_SIZE];
        ERR_error_string_n(err, buffer, sizeof(buffer));
        return std::string(buffer);
    }

    Result<Unit, DmFailure> CheckKeyAndIv(std::span<const uint8_t> key, std::span<const uint8_t> iv) {
        if (key.size() != Constants::AES_KEY_SIZE) {
            return Result<Unit, DmFailure>::Err(DmFailure::InvalidInput(compat::format(
                "AES-256-CBC key must be {} bytes, got {}", Constants::AES_KEY_SIZE, key.size())));
        }
        if (iv.size() != Constants::AES_CBC_IV_SIZE) {
            return Result<Unit, DmFailure>::Err(DmFailure::InvalidInput(compat::format(
                "AES-CBC IV must be {} bytes, got {}", Constants::AES_CBC_IV_SIZE, iv.size())));
        }
        return Result<Unit, DmFailure>::Ok(unit);
    }
}

Result<std::vector<uint8_t>, DmFailure> AesCbc::Encrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> iv,
    std::span<const uint8_t> plaintext) {

    DMSYNC_TRY(CheckKeyAndIv(key, iv));

    EVP_CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return Result<std::vector<uint8_t>, DmFailure>::Err(DmFailure::Generic(
            compat::format("Failed to create cipher context: {}", GetOpenSSLError())));
    }
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, key.data(), iv.data()) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, DmFailure>::Err(DmFailure::Generic(
            compat::format("Failed to initialize AES-256-CBC: {}", GetOpenSSLError())));
    }

    std::vector<uint8_t> output(plaintext.size() + Constants::AES_BLOCK_SIZE);
    int out_len = 0;
    if (EVP_EncryptUpdate(ctx.get(), output.data(), &out_len,
                          plaintext.data(), static_cast<int>(plaintext.size())) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, DmFailure>::Err(DmFailure::Encode(
            compat::format("Encryption failed: {}", GetOpenSSLError())));
    }
    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), output.data() + out_len, &final_len) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, DmFailure>::Err(DmFailure::Encode(
            compat::format("Encryption finalization failed: {}", GetOpenSSLError())));
    }

    output.resize(static_cast<size_t>(out_len + final_len));
    return Result<std::vector<uint8_t>, DmFailure>::Ok(std::move(output));
}

Result<std::vector<uint8_t>, DmFailure> AesCbc::Decrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> iv,
    std::span<const uint8_t> ciphertext) {

    DMSYNC_TRY(CheckKeyAndIv(key, iv));

    if (ciphertext.empty() || ciphertext.size() % Constants::AES_BLOCK_SIZE != 0) {
        return Result<std::vector<uint8_t>, DmFailure>::Err(DmFailure::DecryptionFailed(
            compat::format("Ciphertext length {} is not a positive multiple of the block size",
                           ciphertext.size())));
    }

    EVP_CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return Result<std::vector<uint8_t>, DmFailure>::Err(DmFailure::Generic(
            compat::format("Failed to create cipher context: {}", GetOpenSSLError())));
    }
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, key.data(), iv.data()) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, DmFailure>::Err(DmFailure::Generic(
            compat::format("Failed to initialize AES-256-CBC: {}", GetOpenSSLError())));
    }

    std::vector<uint8_t> output(ciphertext.size() + Constants::AES_BLOCK_SIZE);
    int out_len = 0;
    if (EVP_DecryptUpdate(ctx.get(), output.data(), &out_len,
                          ciphertext.data(), static_cast<int>(ciphertext.size())) != OpenSSL::SUCCESS) {
        SodiumInterop::SecureWipe(std::span<uint8_t>(output));
        return Result<std::vector<uint8_t>, DmFailure>::Err(DmFailure::DecryptionFailed(
            compat::format("Decryption failed: {}", GetOpenSSLError())));
    }
    int final_len = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), output.data() + out_len, &final_len) != OpenSSL::SUCCESS) {
        SodiumInterop::SecureWipe(std::span<uint8_t>(output));
        return Result<std::vector<uint8_t>, DmFailure>::Err(DmFailure::DecryptionFailed(
            compat::format("Bad padding: {}", GetOpenSSLError())));
    }

    output.resize(static_cast<size_t>(out_len + final_len));
    return Result<std::vector<uint8_t>, DmFailure>::Ok(std::move(output));
}

} // namespace dmsync::crypto
