#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace agentstream {

struct SseFrame {
  std::string data;
  std::optional<std::string> event;
  std::optional<std::string> id;
  std::optional<long long> retry;
  std::vector<std::string> raw_lines;
  // Oversized frames the parser had discarded before this one, counted from the start of the stream.
  std::size_t dropped_before = 0;
};

std::vector<SseFrame> parse_sse_stream(const std::string& payload);

std::string encode_sse_frame(const SseFrame& frame);

class SSEParser {
public:
  static constexpr std::size_t kUnlimited = 0;

  explicit SSEParser(std::size_t max_frame_bytes = kUnlimited) : max_frame_bytes_(max_frame_bytes) {}

  std::vector<SseFrame> feed(const char* data, std::size_t size);
  std::vector<SseFrame> finalize();
  void reset();

  [[nodiscard]] const std::optional<std::string>& last_event_id() const { return last_event_id_; }
  [[nodiscard]] const std::optional<long long>& retry_ms() const { return retry_ms_; }
  [[nodiscard]] std::size_t dropped_frames() const { return dropped_frames_; }

private:
  std::vector<SseFrame> extract_frames();
  void process_line(const std::string& line, std::vector<SseFrame>& frames);
  void dispatch(std::vector<SseFrame>& frames);
  void discard_current();

  std::size_t max_frame_bytes_;
  std::string buffer_;
  std::size_t scan_offset_ = 0;
  bool discarding_line_ = false;
  bool discarding_frame_ = false;

  std::string data_;
  bool has_data_ = false;
  std::optional<std::string> event_;
  std::vector<std::string> raw_lines_;

  // Session scoped: survive frame dispatch.
  std::optional<std::string> last_event_id_;
  std::optional<long long> retry_ms_;
  std::size_t dropped_frames_ = 0;
};

class SSEEventStream {
public:
  using FrameHandler = std::function<bool(const SseFrame&)>;

  explicit SSEEventStream(FrameHandler handler = nullptr,
                          std::size_t max_frame_bytes = SSEParser::kUnlimited,
                          bool keep_history = true);

  void feed(const char* data, std::size_t size);
  void finalize();
  void stop();

  [[nodiscard]] bool stopped() const { return stopped_; }
  [[nodiscard]] const std::vector<SseFrame>& frames() const { return frames_; }
  [[nodiscard]] const SSEParser& parser() const { return parser_; }

private:
  void dispatch_frames(std::vector<SseFrame>&& frames);

  SSEParser parser_;
  FrameHandler handler_;
  std::vector<SseFrame> frames_;
  bool keep_history_;
  bool stopped_ = false;
};

}  // namespace agentstream
