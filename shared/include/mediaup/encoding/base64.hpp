#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace mediaup::encoding
{

    std::string encode_base64(std::span<const std::byte> data);

    // std::nullopt on characters outside the alphabet; whitespace is skipped.
    std::optional<std::vector<std::byte>> decode_base64(std::string_view input);

} // namespace mediaup::encoding
