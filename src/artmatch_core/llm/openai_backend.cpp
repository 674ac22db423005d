#include "artmatch_core/llm/openai_backend.hpp"

#include <nlohmann/json.hpp>

namespace artmatch_core {

OpenAiCompatibleBackend::OpenAiCompatibleBackend(std::string name, std::string base_url,
                                                 std::string model, std::string api_key,
                                                 std::shared_ptr<HttpTransport> transport)
    : name_(std::move(name)),
      base_url_(std::move(base_url)),
      model_(std::move(model)),
      api_key_(std::move(api_key)),
      transport_(std::move(transport)) {
  while (!base_url_.empty() && base_url_.back() == '/') {
    base_url_.pop_back();
  }
}

bool OpenAiCompatibleBackend::is_available() const {
  return transport_ != nullptr && !api_key_.empty() && !base_url_.empty() && !model_.empty();
}

std::string OpenAiCompatibleBackend::attempt(const GenerationRequest &request) {
  nlohmann::json payload = {
      {"model", model_},
      {"messages", nlohmann::json::array({{{"role", "user"}, {"content", request.prompt}}})},
      {"max_tokens", request.max_tokens},
      {"temperature", request.temperature}};

  HttpResponse response =
      transport_->post_json(base_url_ + "/chat/completions",
                            {{"Authorization", "Bearer " + api_key_}}, payload.dump(),
                            request.timeout);
  throw_for_status(name_, response);

  auto body = nlohmann::json::parse(response.body, nullptr, false);
  if (body.is_discarded()) {
    throw BackendRejected(name_ + " returned a malformed response body");
  }
  if (!body.contains("choices") || !body["choices"].is_array() || body["choices"].empty()) {
    throw BackendRejected(name_ + " response has no choices");
  }
  const auto &choice = body["choices"][0];
  std::string text;
  if (choice.is_object() && choice.contains("message") && choice["message"].is_object() &&
      choice["message"].contains("content") && choice["message"]["content"].is_string()) {
    text = choice["message"]["content"].get<std::string>();
  }
  if (text.find_first_not_of(" \t\r\n") == std::string::npos) {
    throw BackendRejected(name_ + " returned empty content");
  }
  return text;
}

}  // namespace artmatch_core
