#pragma once

#include <quarry/core/types.h>

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace quarry {

// Standard alphabet with padding, used for binary fields in JSON payloads
std::string base64Encode(std::span<const uint8_t> data);
Result<std::vector<uint8_t>> base64Decode(std::string_view encoded);

} // namespace quarry
