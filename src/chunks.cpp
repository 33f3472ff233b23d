#include "agentstream/chunks.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>

namespace agentstream {

void ChunkReassembler::apply_delta(const ChunkTarget& target,
                                   const std::string& encoding,
                                   int chunk_index,
                                   const std::string& data) {
  auto& accumulator = pending_[target];
  if (accumulator.encoding.empty()) {
    accumulator.encoding = encoding;
  }
  accumulator.parts[chunk_index] = data;
}

std::optional<AssembledChunk> ChunkReassembler::take_chunk(const ChunkTarget& target) {
  auto it = pending_.find(target);
  if (it == pending_.end()) {
    return std::nullopt;
  }

  AssembledChunk chunk;
  chunk.encoding = std::move(it->second.encoding);
  std::size_t total = 0;
  for (const auto& [index, part] : it->second.parts) {
    total += part.size();
  }
  chunk.data.reserve(total);
  for (const auto& [index, part] : it->second.parts) {
    chunk.data += part;
  }
  pending_.erase(it);
  return chunk;
}

std::string mime_from_image_format(const std::optional<std::string>& format) {
  if (!format || format->empty()) {
    return "image/png";
  }
  std::string normalized;
  normalized.reserve(format->size());
  std::transform(format->begin(), format->end(), std::back_inserter(normalized),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (normalized.find("png") != std::string::npos) return "image/png";
  if (normalized.find("jpg") != std::string::npos || normalized.find("jpeg") != std::string::npos) {
    return "image/jpeg";
  }
  if (normalized.find("webp") != std::string::npos) return "image/webp";
  return "image/" + normalized;
}

std::string as_data_url_or_raw_text(const AssembledChunk& chunk, const std::string& mime_type) {
  if (chunk.encoding == "base64") {
    return "data:" + mime_type + ";base64," + chunk.data;
  }
  return chunk.data;
}

}  // namespace agentstream
