#pragma once

#include <chrono>
#include <string>

#include "artmatch_core/llm/text_backend.hpp"

namespace artmatch_core {

// Local Ollama server, reached through ollama-hpp's /api/generate.
class OllamaBackend : public TextBackend {
 public:
  static constexpr int CONNECT_TIMEOUT_SECONDS = 2;

  OllamaBackend(const std::string &base_url, const std::string &model);

  std::string name() const override { return "ollama"; }
  bool is_available() const override;
  std::string attempt(const GenerationRequest &request) override;

  // Read/write budget left after the connect timeout, rounded up to whole
  // seconds and never below one.
  static int io_timeout_seconds(std::chrono::milliseconds timeout);

 private:
  std::string base_url_;
  std::string model_;
};

}  // namespace artmatch_core
