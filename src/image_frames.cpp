#include "agentstream/image_frames.hpp"

namespace agentstream {

void to_json(nlohmann::json& j, const ImageFrame& frame) {
  j = nlohmann::json{{"id", frame.id},
                     {"src", frame.src},
                     {"status", frame.status},
                     {"outputIndex", frame.output_index}};
  if (frame.revised_prompt) {
    j["revisedPrompt"] = *frame.revised_prompt;
  }
}

void ImageFrameAssembler::set_meta(const std::string& tool_id, ImageMeta meta) {
  meta_by_tool_[tool_id] = std::move(meta);
}

const ImageMeta* ImageFrameAssembler::meta(const std::string& tool_id) const {
  auto it = meta_by_tool_.find(tool_id);
  return it == meta_by_tool_.end() ? nullptr : &it->second;
}

void ImageFrameAssembler::store_part(const std::string& tool_id, int part_index, const AssembledChunk& chunk) {
  const ImageMeta* recorded = meta(tool_id);

  ImageFrame frame;
  frame.id = tool_id + ":" + std::to_string(part_index);
  frame.src = as_data_url_or_raw_text(chunk, mime_from_image_format(recorded ? recorded->format : std::nullopt));
  frame.output_index = part_index;
  if (recorded) {
    frame.revised_prompt = recorded->revised_prompt;
  }
  frames_by_tool_[tool_id][part_index] = std::move(frame);
}

std::vector<ImageFrame> ImageFrameAssembler::frames(const std::string& tool_id) const {
  std::vector<ImageFrame> ordered;
  auto it = frames_by_tool_.find(tool_id);
  if (it == frames_by_tool_.end()) {
    return ordered;
  }
  ordered.reserve(it->second.size());
  for (const auto& [index, frame] : it->second) {
    ordered.push_back(frame);
  }
  return ordered;
}

bool ImageFrameAssembler::has_frames(const std::string& tool_id) const {
  auto it = frames_by_tool_.find(tool_id);
  return it != frames_by_tool_.end() && !it->second.empty();
}

void ImageFrameAssembler::rebind(const std::string& from_id, const std::string& to_id) {
  if (from_id == to_id) {
    return;
  }
  if (auto it = meta_by_tool_.find(from_id); it != meta_by_tool_.end()) {
    meta_by_tool_.try_emplace(to_id, std::move(it->second));
    meta_by_tool_.erase(from_id);
  }
  if (auto it = frames_by_tool_.find(from_id); it != frames_by_tool_.end()) {
    frames_by_tool_.try_emplace(to_id, std::move(it->second));
    frames_by_tool_.erase(from_id);
  }
}

}  // namespace agentstream
