#pragma once

#include <map>
#include <optional>
#include <string>
#include <tuple>

namespace agentstream {

struct ChunkTarget {
  std::string entity_kind;
  std::string entity_id;
  std::string field;
  std::optional<int> part_index;

  bool operator==(const ChunkTarget& other) const = default;
  bool operator<(const ChunkTarget& other) const {
    return std::tie(entity_kind, entity_id, field, part_index) <
           std::tie(other.entity_kind, other.entity_id, other.field, other.part_index);
  }
};

struct AssembledChunk {
  std::string encoding;
  std::string data;
};

class ChunkReassembler {
public:
  void apply_delta(const ChunkTarget& target, const std::string& encoding, int chunk_index, const std::string& data);

  std::optional<AssembledChunk> take_chunk(const ChunkTarget& target);

  [[nodiscard]] bool has_pending(const ChunkTarget& target) const { return pending_.count(target) != 0; }
  [[nodiscard]] std::size_t pending_count() const { return pending_.size(); }
  void clear() { pending_.clear(); }

private:
  struct Accumulator {
    std::string encoding;
    std::map<int, std::string> parts;
  };

  std::map<ChunkTarget, Accumulator> pending_;
};

std::string mime_from_image_format(const std::optional<std::string>& format);

std::string as_data_url_or_raw_text(const AssembledChunk& chunk, const std::string& mime_type);

}  // namespace agentstream
