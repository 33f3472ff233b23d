#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>

namespace agentstream {

using HeaderMap = std::map<std::string, std::string>;

struct ResponseHead {
  long status_code = 0;
  // Keys are lower-cased.
  HeaderMap headers;

  [[nodiscard]] bool ok() const { return status_code >= 200 && status_code < 300; }
};

struct StreamingHttpRequest {
  std::string method = "GET";
  std::string url;
  HeaderMap headers;
  std::string body;
  std::chrono::milliseconds timeout{0};
  std::chrono::milliseconds connect_timeout{0};
  std::function<void(const ResponseHead&)> on_head;
  std::function<void(const char*, std::size_t)> on_chunk;
};

class StreamingHttpClient {
public:
  virtual ~StreamingHttpClient() = default;

  // `on_head` runs once, before the first `on_chunk`. An exception thrown by either
  // callback stops the transfer and is rethrown from here.
  virtual ResponseHead stream(const StreamingHttpRequest& request) = 0;
};

std::unique_ptr<StreamingHttpClient> make_curl_streaming_client();

}  // namespace agentstream
