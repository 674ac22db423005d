#pragma once

#include <exception>
#include <string>

namespace artmatch_core {

// Raised when the input buffer cannot be decoded or read as an image.
// Fatal for the whole recommendation request.
class UnprocessableImage : public std::exception {
 public:
  explicit UnprocessableImage(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Raised when an embedding disagrees with the configured width or is not
// unit length. This is a deployment defect, never padded or truncated away.
class DimensionMismatch : public std::exception {
 public:
  explicit DimensionMismatch(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Raised when a vision model file cannot be loaded. The feature extractor
// treats a missing model as a degraded signature, not a failed request.
class ModelLoadError : public std::exception {
 public:
  explicit ModelLoadError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

}  // namespace artmatch_core
