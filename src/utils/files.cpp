#include "agentstream/utils/files.hpp"

#include <algorithm>

namespace agentstream::utils {
namespace {

constexpr std::size_t kMaxStemLength = 128;

bool is_safe(char ch) {
  return (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9') || ch == '_' || ch == '-';
}

}  // namespace

std::string safe_file_stem(std::string_view text) {
  std::string stem;
  stem.reserve(std::min(text.size(), kMaxStemLength));
  for (char ch : text.substr(0, kMaxStemLength)) {
    stem.push_back(is_safe(ch) ? ch : '_');
  }
  if (stem.empty()) {
    stem = "unnamed";
  }
  return stem;
}

}  // namespace agentstream::utils
