#include "dmsync/crypto/digest.hpp"
#include "dmsync/core/constants.hpp"
#include "dmsync/core/format.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/params.h>

#include <memory>
#include <string>

namespace dmsync::crypto {

using OpenSSL = OpenSSLConstants;

namespace {
    struct EVP_MD_CTX_Deleter {
        void operator()(EVP_MD_CTX* ctx) const {
            if (ctx) {
                EVP_MD_CTX_free(ctx);
            }
        }
    };
    struct EVP_MAC_Deleter {
        void operator()(EVP_MAC* mac) const {
            if (mac) {
                EVP_MAC_free(mac);
            }
        }
    };
    struct EVP_MAC_CTX_Deleter {
        void operator()(EVP_MAC_CTX* ctx) const {
            if (ctx) {
                EVP_MAC_CTX_free(ctx);
            }
        }
    };
    using EVP_MD_CTX_ptr = std::unique_ptr<EVP_MD_CTX, EVP_MD_CTX_Deleter>;
    using EVP_MAC_ptr = std::unique_ptr<EVP_MAC, EVP_MAC_Deleter>;
    using EVP_MAC_CTX_ptr = std::unique_ptr<EVP_MAC_CTX, EVP_MAC_CTX_Deleter>;

    std::string GetOpenSSLError() {
        const unsigned long err = ERR_get_error();
        if (err == OpenSSL::NO_ERROR) {
            return std::string(OpenSSL::UNKNOWN_ERROR_MESSAGE);
        }
        char buffer[Constants::OPENSSL_ERROR_BUFFER_SIZE];
        ERR_error_string_n(err, buffer, sizeof(buffer));
        return std::string(buffer);
    }
}

Result<std::vector<uint8_t>, DmFailure> Digest::Sha256(std::span<const uint8_t> data) {
    EVP_MD_CTX_ptr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        return Result<std::vector<uint8_t>, DmFailure>::Err(
            DmFailure::Generic(compat::format("Failed to create digest context: {}", GetOpenSSLError())));
    }

    std::vector<uint8_t> digest(Constants::SHA_256_SIZE);
    unsigned int digest_len = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != OpenSSL::SUCCESS ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != OpenSSL::SUCCESS ||
        EVP_DigestFinal_ex(ctx.get(), digest.data(), &digest_len) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, DmFailure>::Err(
            DmFailure::Generic(compat::format("SHA-256 failed: {}", GetOpenSSLError())));
    }

    digest.resize(digest_len);
    return Result<std::vector<uint8_t>, DmFailure>::Ok(std::move(digest));
}

Result<std::vector<uint8_t>, DmFailure> Digest::HmacSha256(
    std::span<const uint8_t> key,
    std::initializer_list<std::span<const uint8_t>> parts) {

    if (key.empty()) {
        return Result<std::vector<uint8_t>, DmFailure>::Err(
            DmFailure::InvalidInput("HMAC key cannot be empty"));
    }

    EVP_MAC_ptr mac(EVP_MAC_fetch(nullptr, OpenSSL::ALGORITHM_HMAC.data(), nullptr));
    if (!mac) {
        return Result<std::vector<uint8_t>, DmFailure>::Err(
            DmFailure::Generic(compat::format("Failed to fetch HMAC: {}", GetOpenSSLError())));
    }
    EVP_MAC_CTX_ptr ctx(EVP_MAC_CTX_new(mac.get()));
    if (!ctx) {
        return Result<std::vector<uint8_t>, DmFailure>::Err(
            DmFailure::Generic(compat::format("Failed to create HMAC context: {}", GetOpenSSLError())));
    }

    OSSL_PARAM params[2];
    params[0] = OSSL_PARAM_construct_utf8_string(
        OpenSSL::PARAM_DIGEST.data(), const_cast<char*>(OpenSSL::ALGORITHM_SHA256.data()), 0);
    params[1] = OSSL_PARAM_construct_end();

    if (EVP_MAC_init(ctx.get(), key.data(), key.size(), params) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, DmFailure>::Err(
            DmFailure::Generic(compat::format("HMAC init failed: {}", GetOpenSSLError())));
    }
    for (const auto& part : parts) {
        if (!part.empty() &&
            EVP_MAC_update(ctx.get(), part.data(), part.size()) != OpenSSL::SUCCESS) {
            return Result<std::vector<uint8_t>, DmFailure>::Err(
                DmFailure::Generic(compat::format("HMAC update failed: {}", GetOpenSSLError())));
        }
    }

    std::vector<uint8_t> tag(Constants::SHA_256_SIZE);
    size_t tag_len = 0;
    if (EVP_MAC_final(ctx.get(), tag.data(), &tag_len, tag.size()) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, DmFailure>::Err(
            DmFailure::Generic(compat::format("HMAC final failed: {}", GetOpenSSLError())));
    }

    tag.resize(tag_len);
    return Result<std::vector<uint8_t>, DmFailure>::Ok(std::move(tag));
}

} // namespace dmsync::crypto
