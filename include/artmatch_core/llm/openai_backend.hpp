#pragma once

#include <memory>
#include <string>

#include "artmatch_core/llm/http_transport.hpp"
#include "artmatch_core/llm/text_backend.hpp"

namespace artmatch_core {

/**
 * @class OpenAiCompatibleBackend
 * @brief Chat-completions backend for OpenAI and OpenAI-compatible hosts (Groq).
 *
 * Posts a single user message to `<base_url>/chat/completions` and returns the
 * first choice's content.
 */
class OpenAiCompatibleBackend : public TextBackend {
 public:
  static constexpr const char *OPENAI_BASE_URL = "https://api.openai.com/v1";
  static constexpr const char *GROQ_BASE_URL = "https://api.groq.com/openai/v1";

  OpenAiCompatibleBackend(std::string name, std::string base_url, std::string model,
                          std::string api_key, std::shared_ptr<HttpTransport> transport);

  std::string name() const override { return name_; }
  bool is_available() const override;
  std::string attempt(const GenerationRequest &request) override;

 private:
  std::string name_;
  std::string base_url_;
  std::string model_;
  std::string api_key_;
  std::shared_ptr<HttpTransport> transport_;
};

}  // namespace artmatch_core
