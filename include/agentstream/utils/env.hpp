#pragma once

#include <optional>
#include <string>

namespace agentstream::utils {

std::optional<std::string> read_env(const std::string& name);

std::string read_env_or(const std::string& name, const std::string& fallback);

std::optional<std::size_t> read_env_positive(const std::string& name);

}  // namespace agentstream::utils
