#pragma once

#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "agentstream/chunks.hpp"

namespace agentstream {

struct ImageFrame {
  std::string id;
  std::string src;
  std::string status = "partial_image";
  int output_index = 0;
  std::optional<std::string> revised_prompt;
};

void to_json(nlohmann::json& j, const ImageFrame& frame);

struct ImageMeta {
  std::optional<std::string> format;
  std::optional<std::string> revised_prompt;
};

class ImageFrameAssembler {
public:
  void set_meta(const std::string& tool_id, ImageMeta meta);
  [[nodiscard]] const ImageMeta* meta(const std::string& tool_id) const;

  void store_part(const std::string& tool_id, int part_index, const AssembledChunk& chunk);

  [[nodiscard]] std::vector<ImageFrame> frames(const std::string& tool_id) const;
  [[nodiscard]] bool has_frames(const std::string& tool_id) const;

  // Moves everything kept under `from_id` to `to_id`, keeping `to_id`'s data when both exist.
  void rebind(const std::string& from_id, const std::string& to_id);

private:
  std::unordered_map<std::string, ImageMeta> meta_by_tool_;
  std::unordered_map<std::string, std::map<int, ImageFrame>> frames_by_tool_;
};

}  // namespace agentstream
