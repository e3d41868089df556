#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

namespace cloudpan::encoding
{

    std::string encode_base64(std::span<const std::byte> data);

    std::string encode_base64(std::string_view text);

} // namespace cloudpan::encoding
