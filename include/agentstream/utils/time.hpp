#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace agentstream::utils {

std::optional<std::int64_t> parse_timestamp_ms(std::string_view text);

std::int64_t days_from_civil(std::int64_t year, unsigned month, unsigned day);

}  // namespace agentstream::utils
