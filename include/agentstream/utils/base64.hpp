#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace agentstream::utils {

std::vector<std::uint8_t> decode_base64(std::string_view input);

struct DecodedDataUrl {
  std::string mime_type;
  std::vector<std::uint8_t> bytes;
};

std::optional<DecodedDataUrl> decode_data_url(std::string_view url);

std::string extension_for_mime(const std::string& mime_type);

}  // namespace agentstream::utils
