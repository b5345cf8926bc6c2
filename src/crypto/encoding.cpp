#include "dmsync/crypto/encoding.hpp"
#include "dmsync/core/format.hpp"

#include <openssl/evp.h>
#include <sodium.h>

#include <algorithm>

namespace dmsync::crypto {

namespace {
    bool IsBase64Char(const char c) noexcept {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
               (c >= '0' && c <= '9') || c == '+' || c == '/';
    }
}

std::string Encoding::Base64Encode(std::span<const uint8_t> data) {
    if (data.empty()) {
        return {};
    }
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    const int written = EVP_EncodeBlock(
        reinterpret_cast<unsigned char*>(out.data()), data.data(), static_cast<int>(data.size()));
    out.resize(static_cast<size_t>(std::max(written, 0)));
    return out;
}

Result<std::vector<uint8_t>, DmFailure> Encoding::Base64Decode(const std::string_view text) {
    if (text.empty()) {
        return Result<std::vector<uint8_t>, DmFailure>::Ok({});
    }
    if (text.size() % 4 != 0) {
        return Result<std::vector<uint8_t>, DmFailure>::Err(
            DmFailure::Decode(compat::format("Invalid base64 length {}", text.size())));
    }

    size_t padding = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '=') {
            if (i < text.size() - 2) {
                return Result<std::vector<uint8_t>, DmFailure>::Err(
                    DmFailure::Decode("Misplaced base64 padding"));
            }
            ++padding;
        } else if (padding > 0 || !IsBase64Char(c)) {
            return Result<std::vector<uint8_t>, DmFailure>::Err(
                DmFailure::Decode("Invalid base64 character"));
        }
    }

    std::vector<uint8_t> out(3 * (text.size() / 4));
    const int decoded = EVP_DecodeBlock(
        out.data(), reinterpret_cast<const unsigned char*>(text.data()), static_cast<int>(text.size()));
    if (decoded < 0 || static_cast<size_t>(decoded) < padding) {
        return Result<std::vector<uint8_t>, DmFailure>::Err(
            DmFailure::Decode("Base64 decoding failed"));
    }

    // EVP_DecodeBlock counts padding bytes as output
    out.resize(static_cast<size_t>(decoded) - padding);
    return Result<std::vector<uint8_t>, DmFailure>::Ok(std::move(out));
}

std::string Encoding::HexEncode(std::span<const uint8_t> data) {
    std::string out(data.size() * 2 + 1, '\0');
    sodium_bin2hex(out.data(), out.size(), data.data(), data.size());
    out.resize(data.size() * 2);
    return out;
}

Result<std::vector<uint8_t>, DmFailure> Encoding::HexDecode(const std::string_view text) {
    if (text.size() % 2 != 0) {
        return Result<std::vector<uint8_t>, DmFailure>::Err(
            DmFailure::Decode("Hex string has odd length"));
    }

    std::vector<uint8_t> out(text.size() / 2);
    size_t bin_len = 0;
    const char* end = nullptr;
    if (sodium_hex2bin(out.data(), out.size(), text.data(), text.size(),
                       nullptr, &bin_len, &end) != 0 ||
        bin_len != out.size() || end != text.data() + text.size()) {
        return Result<std::vector<uint8_t>, DmFailure>::Err(
            DmFailure::Decode("Invalid hex string"));
    }

    return Result<std::vector<uint8_t>, DmFailure>::Ok(std::move(out));
}

bool Encoding::IsHexKey(const std::string_view text) noexcept {
    return text.size() == 64 && std::all_of(text.begin(), text.end(), [](const char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    });
}

bool Encoding::IsValidUtf8(const std::string_view text) noexcept {
    size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<uint8_t>(text[i]);
        if (lead < 0x80) {
            ++i;
            continue;
        }

        size_t length = 0;
        uint8_t low = 0x80;
        uint8_t high = 0xBF;
        if (lead >= 0xC2 && lead <= 0xDF) {
            length = 2;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            length = 3;
            if (lead == 0xE0) {
                low = 0xA0;
            } else if (lead == 0xED) {
                high = 0x9F;
            }
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            length = 4;
            if (lead == 0xF0) {
                low = 0x90;
            } else if (lead == 0xF4) {
                high = 0x8F;
            }
        } else {
            return false;
        }
        if (text.size() - i < length) {
            return false;
        }

        const auto second = static_cast<uint8_t>(text[i + 1]);
        if (second < low || second > high) {
            return false;
        }
        for (size_t k = 2; k < length; ++k) {
            const auto next = static_cast<uint8_t>(text[i + k]);
            if (next < 0x80 || next > 0xBF) {
                return false;
            }
        }
        i += length;
    }
    return true;
}

} // namespace dmsync::crypto
