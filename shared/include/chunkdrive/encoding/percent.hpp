/**
 * ChunkDrive - Percent-encoding for query strings and extended header values.
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace chunkdrive::encoding
{

    // Decodes %XX escapes. Returns nullopt when an escape is truncated or not hex.
    std::optional<std::string> percent_decode(std::string_view input);

    // Strict UTF-8: rejects overlong forms, surrogates and code points above U+10FFFF.
    bool is_valid_utf8(std::string_view input) noexcept;

    // RFC 5987 value-chars: every byte outside attr-char becomes %XX.
    std::string percent_encode_attr(std::string_view input);

} // namespace chunkdrive::encoding
