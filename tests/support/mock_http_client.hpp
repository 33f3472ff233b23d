#pragma once

#include "agentstream/error.hpp"
#include "agentstream/http_client.hpp"

#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace agentstream::testing {

// Replays queued responses, handing each body to `on_chunk` in the queued pieces.
class MockHttpClient final : public StreamingHttpClient {
public:
  struct QueuedStream {
    ResponseHead head;
    std::vector<std::string> chunks;
  };

  struct QueuedFailure {
    std::string message;
  };

  ResponseHead stream(const StreamingHttpRequest& request) override {
    std::lock_guard<std::mutex> lock(mutex_);
    last_request_ = request;
    if (queue_.empty()) {
      throw AgentStreamError("MockHttpClient queue underflow");
    }
    auto next = std::move(queue_.front());
    queue_.pop();

    if (auto* failure = std::get_if<QueuedFailure>(&next)) {
      throw StreamConnectionError(failure->message);
    }

    const auto& queued = std::get<QueuedStream>(next);
    if (request.on_head) {
      request.on_head(queued.head);
    }
    for (const auto& chunk : queued.chunks) {
      if (request.on_chunk) {
        request.on_chunk(chunk.data(), chunk.size());
      }
    }
    return queued.head;
  }

  void enqueue_stream(std::vector<std::string> chunks, long status_code = 200) {
    std::lock_guard<std::mutex> lock(mutex_);
    QueuedStream queued;
    queued.head.status_code = status_code;
    queued.head.headers["content-type"] = "text/event-stream";
    queued.chunks = std::move(chunks);
    queue_.push(std::move(queued));
  }

  void enqueue_error(std::string message) {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push(QueuedFailure{std::move(message)});
  }

  [[nodiscard]] const std::optional<StreamingHttpRequest>& last_request() const { return last_request_; }

private:
  std::queue<std::variant<QueuedStream, QueuedFailure>> queue_;
  std::optional<StreamingHttpRequest> last_request_;
  mutable std::mutex mutex_;
};

}  // namespace agentstream::testing
