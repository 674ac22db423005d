#include "artmatch_core/llm/gemini_backend.hpp"

#include <nlohmann/json.hpp>

namespace artmatch_core {

GeminiBackend::GeminiBackend(std::string base_url, std::string model, std::string api_key,
                             std::shared_ptr<HttpTransport> transport)
    : base_url_(std::move(base_url)),
      model_(std::move(model)),
      api_key_(std::move(api_key)),
      transport_(std::move(transport)) {
  while (!base_url_.empty() && base_url_.back() == '/') {
    base_url_.pop_back();
  }
}

bool GeminiBackend::is_available() const {
  return transport_ != nullptr && !api_key_.empty() && !base_url_.empty() && !model_.empty();
}

std::string GeminiBackend::attempt(const GenerationRequest &request) {
  nlohmann::json payload = {
      {"contents", nlohmann::json::array({{{"parts", nlohmann::json::array({{{"text", request.prompt}}})}}})},
      {"generationConfig",
       {{"maxOutputTokens", request.max_tokens}, {"temperature", request.temperature}}}};

  HttpResponse response = transport_->post_json(
      base_url_ + "/models/" + model_ + ":generateContent", {{"x-goog-api-key", api_key_}},
      payload.dump(), request.timeout);
  throw_for_status("gemini", response);

  auto body = nlohmann::json::parse(response.body, nullptr, false);
  if (body.is_discarded() || !body.is_object()) {
    throw BackendRejected("gemini returned a malformed response body");
  }
  if (!body.contains("candidates") || !body["candidates"].is_array() ||
      body["candidates"].empty()) {
    throw BackendRejected("gemini response has no candidates");
  }

  const auto &candidate = body["candidates"][0];
  if (!candidate.is_object()) {
    throw BackendRejected("gemini candidate is malformed");
  }
  if (candidate.contains("finishReason") && candidate["finishReason"] == "SAFETY") {
    throw BackendRejected("gemini blocked the response for safety reasons");
  }

  std::string text;
  if (candidate.contains("content") && candidate["content"].is_object() &&
      candidate["content"].contains("parts") && candidate["content"]["parts"].is_array()) {
    for (const auto &part : candidate["content"]["parts"]) {
      if (part.is_object() && part.contains("text") && part["text"].is_string()) {
        text += part["text"].get<std::string>();
      }
    }
  }
  if (text.find_first_not_of(" \t\r\n") == std::string::npos) {
    throw BackendRejected("gemini returned no text");
  }
  return text;
}

}  // namespace artmatch_core
