#include "artmatch_core/llm/backend_factory.hpp"

#include <stdexcept>

#include "artmatch_core/llm/gemini_backend.hpp"
#include "artmatch_core/llm/ollama_backend.hpp"
#include "artmatch_core/llm/openai_backend.hpp"

namespace artmatch_core {

namespace {

std::string or_default(const std::string &value, const std::string &fallback) {
  return value.empty() ? fallback : value;
}

}  // namespace

std::vector<std::shared_ptr<TextBackend>> make_text_backends(
    const ReasoningConfig &config, std::shared_ptr<HttpTransport> transport) {
  std::vector<std::shared_ptr<TextBackend>> backends;
  for (const auto &entry : config.backends) {
    if (!entry.enabled) {
      continue;
    }
    if (entry.type == "ollama") {
      backends.push_back(std::make_shared<OllamaBackend>(
          or_default(entry.base_url, "http://localhost:11434"), or_default(entry.model, "llava")));
    } else if (entry.type == "groq") {
      backends.push_back(std::make_shared<OpenAiCompatibleBackend>(
          "groq", or_default(entry.base_url, OpenAiCompatibleBackend::GROQ_BASE_URL),
          or_default(entry.model, "llama-3.2-90b-vision-preview"), entry.api_key, transport));
    } else if (entry.type == "openai") {
      backends.push_back(std::make_shared<OpenAiCompatibleBackend>(
          "openai", or_default(entry.base_url, OpenAiCompatibleBackend::OPENAI_BASE_URL),
          or_default(entry.model, "gpt-3.5-turbo"), entry.api_key, transport));
    } else if (entry.type == "gemini") {
      backends.push_back(std::make_shared<GeminiBackend>(
          or_default(entry.base_url, GeminiBackend::DEFAULT_BASE_URL),
          or_default(entry.model, "gemini-1.5-flash"), entry.api_key, transport));
    } else {
      throw std::invalid_argument("Unknown reasoning backend type: '" + entry.type + "'");
    }
  }
  return backends;
}

}  // namespace artmatch_core
