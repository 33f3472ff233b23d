#include "agentstream/utils/env.hpp"

#include "agentstream/error.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace agentstream::utils {
namespace {

std::string trim(std::string value) {
  auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
  auto begin = std::find_if_not(value.begin(), value.end(), is_space);
  auto end = std::find_if_not(value.rbegin(), value.rend(), is_space).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

}  // namespace

std::optional<std::string> read_env(const std::string& name) {
  const char* raw = std::getenv(name.c_str());
  if (!raw) {
    return std::nullopt;
  }
  std::string trimmed = trim(raw);
  if (trimmed.empty()) {
    return std::string();
  }
  return trimmed;
}

std::string read_env_or(const std::string& name, const std::string& fallback) {
  if (auto value = read_env(name)) {
    return *value;
  }
  return fallback;
}

std::optional<std::size_t> read_env_positive(const std::string& name) {
  auto value = read_env(name);
  if (!value || value->empty()) {
    return std::nullopt;
  }
  const bool all_digits =
      value->size() <= 18 &&
      std::all_of(value->begin(), value->end(), [](unsigned char ch) { return std::isdigit(ch) != 0; });
  if (!all_digits) {
    throw AgentStreamError(name + " must be a positive integer, got '" + *value + "'");
  }
  const auto parsed = static_cast<std::size_t>(std::stoull(*value));
  if (parsed == 0) {
    throw AgentStreamError(name + " must be a positive integer, got '" + *value + "'");
  }
  return parsed;
}

}  // namespace agentstream::utils
