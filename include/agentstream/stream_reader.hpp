#pragma once

#include <chrono>
#include <string>

#include "agentstream/http_client.hpp"
#include "agentstream/session.hpp"

namespace agentstream {

struct StreamRequest {
  std::string url;
  std::string method = "GET";
  std::string body;
  HeaderMap headers;
  std::chrono::milliseconds timeout{0};
  std::chrono::milliseconds connect_timeout{0};
};

// Feeds a 2xx body into `session` and finishes it. Throws HttpError with the first
// bytes of the body for any other status, StreamAbortedError once the session is aborted.
void read_event_stream(StreamingHttpClient& client, const StreamRequest& request, StreamSession& session);

}  // namespace agentstream
