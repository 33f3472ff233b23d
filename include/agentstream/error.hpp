#pragma once

#include <map>
#include <stdexcept>
#include <string>
#include <utility>

namespace agentstream {

class AgentStreamError : public std::runtime_error {
public:
  explicit AgentStreamError(const std::string& message)
      : std::runtime_error(message) {}
};

class HttpError : public AgentStreamError {
public:
  HttpError(std::string message,
            long status_code,
            std::string body,
            std::map<std::string, std::string> headers)
      : AgentStreamError(std::move(message)),
        status_code_(status_code),
        body_(std::move(body)),
        headers_(std::move(headers)) {}

  long status_code() const { return status_code_; }
  const std::string& body() const { return body_; }
  const std::map<std::string, std::string>& headers() const { return headers_; }

private:
  long status_code_;
  std::string body_;
  std::map<std::string, std::string> headers_;
};

class StreamConnectionError : public AgentStreamError {
public:
  explicit StreamConnectionError(const std::string& message)
      : AgentStreamError(message) {}
};

class StreamAbortedError : public AgentStreamError {
public:
  explicit StreamAbortedError(const std::string& message)
      : AgentStreamError(message) {}
};

}  // namespace agentstream
