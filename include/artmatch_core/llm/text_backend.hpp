#pragma once

#include <chrono>
#include <exception>
#include <string>
#include <vector>

namespace artmatch_core {

// Facts about one candidate that a backend turns into a justification.
struct ReasoningInput {
  std::string artwork_title;
  std::string artwork_style;
  std::string room_style;
  std::vector<std::string> colors;
  float match_score = 0.0f;
};

struct GenerationRequest {
  ReasoningInput input;
  std::string prompt;
  int max_tokens = 150;
  float temperature = 0.7f;
  std::chrono::milliseconds timeout{20000};
};

class BackendError : public std::exception {
 public:
  explicit BackendError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

  // Short failure kind recorded in the attempt log, e.g. "timeout"
  virtual const char *kind() const noexcept {
    return "error";
  }

 private:
  std::string message_;
};

// Backend could not be reached or refused service (network, 429, 5xx).
class BackendUnavailable : public BackendError {
 public:
  using BackendError::BackendError;
  const char *kind() const noexcept override {
    return "unavailable";
  }
};

// Attempt exceeded its time budget.
class BackendTimeout : public BackendError {
 public:
  using BackendError::BackendError;
  const char *kind() const noexcept override {
    return "timeout";
  }
};

// Backend answered but the answer is unusable (4xx, safety block, empty text).
class BackendRejected : public BackendError {
 public:
  using BackendError::BackendError;
  const char *kind() const noexcept override {
    return "rejected";
  }
};

/**
 * @class TextBackend
 * @brief One way of producing justification text.
 *
 * Implementations report failure by throwing a BackendError subclass from
 * attempt(); the reasoning generator moves on to the next backend.
 */
class TextBackend {
 public:
  virtual ~TextBackend() = default;

  virtual std::string name() const = 0;

  // Cheap capability check (credentials and endpoint configured). No network I/O.
  virtual bool is_available() const = 0;

  virtual std::string attempt(const GenerationRequest &request) = 0;
};

}  // namespace artmatch_core
