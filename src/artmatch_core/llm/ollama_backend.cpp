#include "artmatch_core/llm/ollama_backend.hpp"

#include <algorithm>

// cpp-httplib, bundled inside ollama.hpp, waits 300s to connect by default and
// exposes no per-client setter through ollama::Ollama.
#define CPPHTTPLIB_CONNECTION_TIMEOUT_SECOND 2
#include "ollama.hpp"

namespace artmatch_core {

static_assert(OllamaBackend::CONNECT_TIMEOUT_SECONDS == CPPHTTPLIB_CONNECTION_TIMEOUT_SECOND,
              "connect timeout must match the compiled-in httplib value");

OllamaBackend::OllamaBackend(const std::string &base_url, const std::string &model)
    : base_url_(base_url), model_(model) {}

int OllamaBackend::io_timeout_seconds(std::chrono::milliseconds timeout) {
  const int whole_seconds = static_cast<int>((timeout.count() + 999) / 1000);
  return std::max(1, whole_seconds - CONNECT_TIMEOUT_SECONDS);
}

bool OllamaBackend::is_available() const {
  return !base_url_.empty() && !model_.empty();
}

std::string OllamaBackend::attempt(const GenerationRequest &request) {
  // One client per attempt; the library's global client is not safe to share
  // across concurrent enrichment tasks with different timeouts.
  ollama::Ollama client(base_url_);
  const int timeout_seconds = io_timeout_seconds(request.timeout);
  client.setReadTimeout(timeout_seconds);
  client.setWriteTimeout(timeout_seconds);

  ollama::options options;
  options["num_predict"] = request.max_tokens;
  options["temperature"] = request.temperature;

  std::string text;
  try {
    ollama::response response = client.generate(model_, request.prompt, options);
    text = response.as_simple_string();
  } catch (const ollama::exception &e) {
    const std::string message = "Ollama generation failed: " + std::string(e.what());
    if (message.find("imeout") != std::string::npos || message.find("imed out") != std::string::npos) {
      throw BackendTimeout(message);
    }
    throw BackendUnavailable(message);
  }

  if (text.find_first_not_of(" \t\r\n") == std::string::npos) {
    throw BackendRejected("Ollama returned an empty response");
  }
  return text;
}

}  // namespace artmatch_core
