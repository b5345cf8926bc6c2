#include "dmsync/crypto/hkdf.hpp"
#include "dmsync/crypto/sodium_interop.hpp"
#include "dmsync/core/constants.hpp"
#include "dmsync/core/format.hpp"

#include <openssl/core_names.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>

#include <memory>
#include <string>

namespace dmsync::crypto {

using OpenSSL = OpenSSLConstants;

namespace {
    struct EVP_KDF_Deleter {
        void operator()(EVP_KDF* kdf) const {
            if (kdf) {
                EVP_KDF_free(kdf);
            }
        }
    };
    struct EVP_KDF_CTX_Deleter {
        void operator()(EVP_KDF_CTX* ctx) const {
            if (ctx) {
                EVP_KDF_CTX_free(ctx);
            }
        }
    };
    using EVP_KDF_ptr = std::unique_ptr<EVP_KDF, EVP_KDF_Deleter>;
    using EVP_KDF_CTX_ptr = std::unique_ptr<EVP_KDF_CTX, EVP_KDF_CTX_Deleter>;

    std::string GetOpenSSLError() {
        const unsigned long err = ERR_get_error();
        if (err == OpenSSL::NO_ERROR) {
            return std::string(OpenSSL::UNKNOWN_ERROR_MESSAGE);
        }
        char buffer[Constants::OPENSSL_ERROR_BUFFER_SIZE];
        ERR_error_string_n(err, buffer, sizeof(buffer));
        return std::string(buffer);
    }

    Result<std::vector<uint8_t>, DmFailure> RunKdf(
        const std::string_view mode,
        std::span<const uint8_t> key,
        std::span<const uint8_t> salt,
        std::span<const uint8_t> info,
        const size_t output_size) {

        EVP_KDF_ptr kdf(EVP_KDF_fetch(nullptr, OpenSSL::ALGORITHM_HKDF.data(), nullptr));
        if (!kdf) {
            return Result<std::vector<uint8_t>, DmFailure>::Err(
                DmFailure::DeriveKey(compat::format(
                    "Failed to fetch HKDF algorithm: {}", GetOpenSSLError())));
        }

        EVP_KDF_CTX_ptr ctx(EVP_KDF_CTX_new(kdf.get()));
        if (!ctx) {
            return Result<std::vector<uint8_t>, DmFailure>::Err(
                DmFailure::DeriveKey(compat::format(
                    "Failed to create HKDF context: {}", GetOpenSSLError())));
        }

        OSSL_PARAM params[6];
        size_t idx = 0;
        params[idx++] = OSSL_PARAM_construct_utf8_string(
            OpenSSL::PARAM_DIGEST.data(), const_cast<char*>(OpenSSL::ALGORITHM_SHA256.data()), 0);
        params[idx++] = OSSL_PARAM_construct_utf8_string(
            OpenSSL::PARAM_MODE.data(), const_cast<char*>(mode.data()), 0);
        params[idx++] = OSSL_PARAM_construct_octet_string(
            OpenSSL::PARAM_KEY.data(), const_cast<uint8_t*>(key.data()), key.size());
        if (!salt.empty()) {
            params[idx++] = OSSL_PARAM_construct_octet_string(
                OpenSSL::PARAM_SALT.data(), const_cast<uint8_t*>(salt.data()), salt.size());
        }
        if (!info.empty()) {
            params[idx++] = OSSL_PARAM_construct_octet_string(
                OpenSSL::PARAM_INFO.data(), const_cast<uint8_t*>(info.data()), info.size());
        }
        params[idx] = OSSL_PARAM_construct_end();

        std::vector<uint8_t> output(output_size);
        if (EVP_KDF_derive(ctx.get(), output.data(), output.size(), params) != OpenSSL::SUCCESS) {
            SodiumInterop::SecureWipe(std::span<uint8_t>(output));
            return Result<std::vector<uint8_t>, DmFailure>::Err(
                DmFailure::DeriveKey(compat::format(
                    "HKDF {} failed: {}", mode, GetOpenSSLError())));
        }

        return Result<std::vector<uint8_t>, DmFailure>::Ok(std::move(output));
    }
}

Result<std::vector<uint8_t>, DmFailure> Hkdf::Extract(
    std::span<const uint8_t> ikm,
    std::span<const uint8_t> salt) {

    if (ikm.empty()) {
        return Result<std::vector<uint8_t>, DmFailure>::Err(
            DmFailure::InvalidInput("HKDF input key material cannot be empty"));
    }

    return RunKdf(OpenSSL::MODE_EXTRACT_ONLY, ikm, salt, {}, HASH_LEN);
}

Result<std::vector<uint8_t>, DmFailure> Hkdf::Expand(
    std::span<const uint8_t> prk,
    const size_t output_size,
    std::span<const uint8_t> info) {

    if (prk.size() != HASH_LEN) {
        return Result<std::vector<uint8_t>, DmFailure>::Err(
            DmFailure::InvalidInput(compat::format("PRK must be exactly {} bytes", HASH_LEN)));
    }
    if (output_size == 0 || output_size > MAX_OUTPUT_LEN) {
        return Result<std::vector<uint8_t>, DmFailure>::Err(
            DmFailure::InvalidInput(compat::format(
                "HKDF output size {} outside 1..{}", output_size, MAX_OUTPUT_LEN)));
    }

    return RunKdf(OpenSSL::MODE_EXPAND_ONLY, prk, {}, info, output_size);
}

Result<std::vector<uint8_t>, DmFailure> Hkdf::DeriveKey(
    std::span<const uint8_t> ikm,
    const size_t output_size,
    std::span<const uint8_t> salt,
    std::span<const uint8_t> info) {

    auto prk_result = Extract(ikm, salt);
    if (prk_result.IsErr()) {
        return prk_result;
    }
    auto prk = std::move(prk_result).Unwrap();
    auto okm = Expand(prk, output_size, info);
    SodiumInterop::SecureWipe(std::span<uint8_t>(prk));
    return okm;
}

} // namespace dmsync::crypto
