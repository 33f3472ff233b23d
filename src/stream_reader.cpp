#include "agentstream/stream_reader.hpp"

#include "agentstream/error.hpp"

#include <algorithm>

namespace agentstream {
namespace {

constexpr std::size_t kErrorBodyLimit = 4096;

void throw_if_aborted(const StreamSession& session, const char* when) {
  if (session.aborted()) {
    throw StreamAbortedError(std::string("event stream aborted ") + when);
  }
}

}  // namespace

void read_event_stream(StreamingHttpClient& client, const StreamRequest& request, StreamSession& session) {
  throw_if_aborted(session, "before it started");

  StreamingHttpRequest http_request;
  http_request.method = request.method;
  http_request.url = request.url;
  http_request.body = request.body;
  http_request.timeout = request.timeout;
  http_request.connect_timeout = request.connect_timeout;
  http_request.headers = request.headers;
  http_request.headers["Accept"] = "text/event-stream";
  http_request.headers["Cache-Control"] = "no-cache";
  if (!request.body.empty() && http_request.headers.count("Content-Type") == 0) {
    http_request.headers["Content-Type"] = "application/json";
  }
  if (const auto& last_id = session.last_event_id(); last_id && !last_id->empty()) {
    http_request.headers["Last-Event-ID"] = *last_id;
  }

  bool accepted = false;
  std::string error_body;
  http_request.on_head = [&](const ResponseHead& head) { accepted = head.ok(); };
  http_request.on_chunk = [&](const char* data, std::size_t size) {
    throw_if_aborted(session, "by consumer");
    if (!accepted) {
      error_body.append(data, std::min(size, kErrorBodyLimit - error_body.size()));
      return;
    }
    session.feed(data, size);
  };

  const ResponseHead head = client.stream(http_request);
  if (!head.ok()) {
    throw HttpError("event stream request failed with status " + std::to_string(head.status_code), head.status_code,
                    error_body, head.headers);
  }
  throw_if_aborted(session, "by consumer");
  session.finish();
}

}  // namespace agentstream
