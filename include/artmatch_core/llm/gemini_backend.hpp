#pragma once

#include <memory>
#include <string>

#include "artmatch_core/llm/http_transport.hpp"
#include "artmatch_core/llm/text_backend.hpp"

namespace artmatch_core {

// Google Gemini generateContent backend.
class GeminiBackend : public TextBackend {
 public:
  static constexpr const char *DEFAULT_BASE_URL =
      "https://generativelanguage.googleapis.com/v1beta";

  GeminiBackend(std::string base_url, std::string model, std::string api_key,
                std::shared_ptr<HttpTransport> transport);

  std::string name() const override { return "gemini"; }
  bool is_available() const override;
  std::string attempt(const GenerationRequest &request) override;

 private:
  std::string base_url_;
  std::string model_;
  std::string api_key_;
  std::shared_ptr<HttpTransport> transport_;
};

}  // namespace artmatch_core
