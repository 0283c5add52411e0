#pragma once

#include <cstddef>
#include <span>
#include <string>

namespace chunkdrive::encoding
{

    std::string encode_base64(std::span<const std::byte> data);

} // namespace chunkdrive::encoding
