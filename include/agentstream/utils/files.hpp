#pragma once

#include <string>
#include <string_view>

namespace agentstream::utils {

std::string safe_file_stem(std::string_view text);

}  // namespace agentstream::utils
