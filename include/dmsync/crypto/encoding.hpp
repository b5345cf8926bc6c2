#pragma once

#include "dmsync/core/result.hpp"
#include "dmsync/core/failures.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace dmsync::crypto {

/// Text encodings used on the wire: standard padded base64 and lowercase hex.
class Encoding {
public:
    [[nodiscard]] static std::string Base64Encode(std::span<const uint8_t> data);

    /// Strict decode: padded standard alphabet, length a multiple of 4.
    [[nodiscard]] static Result<std::vector<uint8_t>, DmFailure> Base64Decode(std::string_view text);

    [[nodiscard]] static std::string HexEncode(std::span<const uint8_t> data);

    /// Rejects odd lengths and non-hex characters.
    [[nodiscard]] static Result<std::vector<uint8_t>, DmFailure> HexDecode(std::string_view text);

    /// True for exactly 64 lowercase hex characters.
    [[nodiscard]] static bool IsHexKey(std::string_view text) noexcept;

    /// Well-formed UTF-8: shortest encodings only, no surrogates, at most U+10FFFF.
    [[nodiscard]] static bool IsValidUtf8(std::string_view text) noexcept;

private:
    Encoding() = delete;
};

} // namespace dmsync::crypto
