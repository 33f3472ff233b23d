#include "agentstream/streaming.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace agentstream {
namespace {

void trim_carriage_return(std::string& line) {
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
}

std::optional<long long> parse_retry(const std::string& value) {
  if (value.empty() || value.size() > 18) {
    return std::nullopt;
  }
  if (!std::all_of(value.begin(), value.end(), [](unsigned char ch) { return std::isdigit(ch) != 0; })) {
    return std::nullopt;
  }
  return std::stoll(value);
}

void write_field(std::ostringstream& out, const char* field, const std::string& value) {
  std::size_t start = 0;
  while (true) {
    auto newline_pos = value.find('\n', start);
    out << field << ": " << value.substr(start, newline_pos == std::string::npos ? std::string::npos : newline_pos - start)
        << '\n';
    if (newline_pos == std::string::npos) {
      break;
    }
    start = newline_pos + 1;
  }
}

}  // namespace

std::vector<SseFrame> SSEParser::feed(const char* data, std::size_t size) {
  buffer_.append(data, size);
  return extract_frames();
}

std::vector<SseFrame> SSEParser::finalize() {
  std::vector<SseFrame> frames = extract_frames();
  if (!buffer_.empty() && !discarding_line_) {
    std::string line = std::move(buffer_);
    trim_carriage_return(line);
    process_line(line, frames);
  }
  buffer_.clear();
  scan_offset_ = 0;
  discarding_line_ = false;
  if (has_data_ && !discarding_frame_) {
    dispatch(frames);
  } else {
    discard_current();
  }
  return frames;
}

void SSEParser::reset() {
  buffer_.clear();
  scan_offset_ = 0;
  discarding_line_ = false;
  discard_current();
  last_event_id_.reset();
  retry_ms_.reset();
  dropped_frames_ = 0;
}

std::vector<SseFrame> SSEParser::extract_frames() {
  std::vector<SseFrame> frames;
  std::size_t start = 0;

  while (true) {
    auto newline_pos = buffer_.find('\n', std::max(start, scan_offset_));
    if (newline_pos == std::string::npos) {
      break;
    }
    scan_offset_ = 0;

    if (discarding_line_) {
      // Tail of a line that already blew the size limit.
      discarding_line_ = false;
      start = newline_pos + 1;
      continue;
    }

    std::string line = buffer_.substr(start, newline_pos - start);
    trim_carriage_return(line);
    start = newline_pos + 1;
    process_line(line, frames);
  }

  buffer_.erase(0, start);
  scan_offset_ = buffer_.size();

  if (max_frame_bytes_ != kUnlimited && buffer_.size() > max_frame_bytes_) {
    if (!discarding_line_) {
      discarding_line_ = true;
      if (!discarding_frame_) {
        ++dropped_frames_;
        discarding_frame_ = true;
      }
    }
    buffer_.clear();
    scan_offset_ = 0;
  }

  return frames;
}

void SSEParser::process_line(const std::string& line, std::vector<SseFrame>& frames) {
  if (line.empty()) {
    if (has_data_ && !discarding_frame_) {
      dispatch(frames);
    } else {
      discard_current();
    }
    return;
  }

  if (line.front() == ':') {
    return;
  }

  if (discarding_frame_) {
    return;
  }

  raw_lines_.push_back(line);

  auto colon_pos = line.find(':');
  std::string field = colon_pos == std::string::npos ? line : line.substr(0, colon_pos);
  std::string value = colon_pos == std::string::npos ? std::string() : line.substr(colon_pos + 1);
  if (!value.empty() && value.front() == ' ') {
    value.erase(value.begin());
  }

  if (field == "data") {
    if (has_data_) {
      data_.push_back('\n');
    }
    data_ += value;
    has_data_ = true;
    if (max_frame_bytes_ != kUnlimited && data_.size() > max_frame_bytes_) {
      ++dropped_frames_;
      discarding_frame_ = true;
      data_.clear();
      raw_lines_.clear();
    }
  } else if (field == "event") {
    event_ = value;
  } else if (field == "id") {
    if (value.find('\0') == std::string::npos) {
      last_event_id_ = value;
    }
  } else if (field == "retry") {
    if (auto retry = parse_retry(value)) {
      retry_ms_ = *retry;
    }
  }
}

void SSEParser::dispatch(std::vector<SseFrame>& frames) {
  SseFrame frame;
  frame.data = std::move(data_);
  frame.event = std::move(event_);
  frame.id = last_event_id_;
  frame.retry = retry_ms_;
  frame.raw_lines = std::move(raw_lines_);
  frame.dropped_before = dropped_frames_;
  frames.push_back(std::move(frame));
  discard_current();
}

void SSEParser::discard_current() {
  data_.clear();
  has_data_ = false;
  event_.reset();
  raw_lines_.clear();
  discarding_frame_ = false;
}

std::vector<SseFrame> parse_sse_stream(const std::string& payload) {
  SSEParser parser;
  auto frames = parser.feed(payload.data(), payload.size());
  auto remaining = parser.finalize();
  frames.insert(frames.end(), remaining.begin(), remaining.end());
  return frames;
}

std::string encode_sse_frame(const SseFrame& frame) {
  std::ostringstream out;
  if (frame.event) {
    out << "event: " << *frame.event << '\n';
  }
  if (frame.id) {
    out << "id: " << *frame.id << '\n';
  }
  if (frame.retry) {
    out << "retry: " << *frame.retry << '\n';
  }
  write_field(out, "data", frame.data);
  out << '\n';
  return out.str();
}

SSEEventStream::SSEEventStream(FrameHandler handler, std::size_t max_frame_bytes, bool keep_history)
    : parser_(max_frame_bytes), handler_(std::move(handler)), keep_history_(keep_history) {}

void SSEEventStream::feed(const char* data, std::size_t size) {
  if (stopped_) return;
  auto frames = parser_.feed(data, size);
  dispatch_frames(std::move(frames));
}

void SSEEventStream::finalize() {
  if (stopped_) return;
  auto frames = parser_.finalize();
  dispatch_frames(std::move(frames));
}

void SSEEventStream::stop() {
  stopped_ = true;
}

void SSEEventStream::dispatch_frames(std::vector<SseFrame>&& frames) {
  if (frames.empty()) return;
  for (auto& frame : frames) {
    if (stopped_) break;
    if (handler_) {
      const bool should_continue = handler_(frame);
      if (!should_continue) {
        stopped_ = true;
      }
    }
    if (keep_history_) {
      frames_.push_back(std::move(frame));
    }
  }
}

}  // namespace agentstream
