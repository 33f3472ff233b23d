#include "agentstream/http_client.hpp"

#include "agentstream/error.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace agentstream {
namespace {

constexpr const char* kUserAgent = "agentstream/0.1";

std::string_view trim(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) text.remove_prefix(1);
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) text.remove_suffix(1);
  return text;
}

std::string lower(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
  return out;
}

struct EasyDeleter {
  void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct SlistDeleter {
  void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

void ensure_curl_initialized() {
  static std::once_flag once;
  std::call_once(once, [] {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
      throw StreamConnectionError("curl_global_init failed");
    }
    std::atexit([] { curl_global_cleanup(); });
  });
}

// One request/response exchange on its own easy handle.
class CurlTransfer {
public:
  explicit CurlTransfer(const StreamingHttpRequest& request) : request_(request), handle_(curl_easy_init()) {
    if (!handle_) {
      throw StreamConnectionError("curl_easy_init failed");
    }
  }

  ResponseHead run() {
    configure();
    const CURLcode result = curl_easy_perform(handle_.get());
    if (failure_) {
      std::rethrow_exception(failure_);
    }
    if (result != CURLE_OK) {
      throw StreamConnectionError(std::string("transfer to ") + request_.url + " failed: " + curl_easy_strerror(result));
    }
    // Bodiless responses never reach on_body.
    deliver_head();
    return head_;
  }

private:
  void configure() {
    CURL* curl = handle_.get();
    for (const auto& [name, value] : request_.headers) {
      const std::string line = name + ": " + value;
      curl_slist* appended = curl_slist_append(headers_.get(), line.c_str());
      if (!appended) {
        throw StreamConnectionError("curl_slist_append failed");
      }
      headers_.release();
      headers_.reset(appended);
    }

    curl_easy_setopt(curl, CURLOPT_URL, request_.url.c_str());
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request_.method.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers_.get());
    curl_easy_setopt(curl, CURLOPT_USERAGENT, kUserAgent);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request_.timeout.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(request_.connect_timeout.count()));
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, &CurlTransfer::on_header);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, this);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &CurlTransfer::on_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, this);
    if (!request_.body.empty()) {
      curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request_.body.data());
      curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request_.body.size()));
    }
  }

  static size_t on_header(char* buffer, size_t size, size_t count, void* userdata) {
    auto* self = static_cast<CurlTransfer*>(userdata);
    const size_t total = size * count;
    const std::string_view line = trim(std::string_view(buffer, total));

    if (line.rfind("HTTP/", 0) == 0) {
      // Status line of a new response (redirect or 100-continue): start over.
      self->head_.headers.clear();
      const auto space = line.find(' ');
      if (space != std::string_view::npos) {
        self->head_.status_code = std::strtol(std::string(line.substr(space + 1, 3)).c_str(), nullptr, 10);
      }
      return total;
    }

    const auto colon = line.find(':');
    if (colon != std::string_view::npos && colon > 0) {
      self->head_.headers[lower(trim(line.substr(0, colon)))] = std::string(trim(line.substr(colon + 1)));
    }
    return total;
  }

  static size_t on_body(char* data, size_t size, size_t count, void* userdata) {
    auto* self = static_cast<CurlTransfer*>(userdata);
    const size_t total = size * count;
    try {
      self->deliver_head();
      if (self->request_.on_chunk) {
        self->request_.on_chunk(data, total);
      }
    } catch (...) {
      self->failure_ = std::current_exception();
      return 0;
    }
    return total;
  }

  void deliver_head() {
    if (head_delivered_) {
      return;
    }
    head_delivered_ = true;
    long status = 0;
    if (curl_easy_getinfo(handle_.get(), CURLINFO_RESPONSE_CODE, &status) == CURLE_OK && status != 0) {
      head_.status_code = status;
    }
    if (request_.on_head) {
      request_.on_head(head_);
    }
  }

  const StreamingHttpRequest& request_;
  std::unique_ptr<CURL, EasyDeleter> handle_;
  std::unique_ptr<curl_slist, SlistDeleter> headers_;
  ResponseHead head_;
  bool head_delivered_ = false;
  std::exception_ptr failure_;
};

class CurlStreamingClient final : public StreamingHttpClient {
public:
  ResponseHead stream(const StreamingHttpRequest& request) override {
    CurlTransfer transfer(request);
    return transfer.run();
  }
};

}  // namespace

std::unique_ptr<StreamingHttpClient> make_curl_streaming_client() {
  ensure_curl_initialized();
  return std::make_unique<CurlStreamingClient>();
}

}  // namespace agentstream
