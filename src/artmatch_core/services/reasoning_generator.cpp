#include "artmatch_core/services/reasoning_generator.hpp"

#include <iostream>

#include "artmatch_core/llm/template_backend.hpp"
#include "artmatch_core/types/recommendation.hpp"

namespace artmatch_core {

ReasoningGenerator::ReasoningGenerator(std::vector<std::shared_ptr<TextBackend>> backends,
                                       ReasoningSettings settings)
    : settings_(settings) {
  for (auto &backend : backends) {
    if (backend && backend->is_available()) {
      backends_.push_back(std::move(backend));
    } else if (backend) {
      std::cerr << "Reasoning backend '" << backend->name()
                << "' is not configured, skipping" << std::endl;
    }
  }
  backends_.push_back(std::make_shared<TemplateBackend>());
}

std::vector<std::string> ReasoningGenerator::chain() const {
  std::vector<std::string> names;
  for (const auto &backend : backends_) {
    names.push_back(backend->name());
  }
  return names;
}

std::string ReasoningGenerator::build_prompt(const ReasoningInput &input) {
  std::string prompt = "Write 1-2 sentences explaining why the " + input.artwork_style +
                       " artwork \"" + input.artwork_title + "\" matches a " +
                       (input.room_style.empty() ? std::string("modern") : input.room_style) +
                       " room";
  if (!input.colors.empty()) {
    prompt += " with colors like " + input.colors[0];
    if (input.colors.size() > 1) {
      prompt += ", " + input.colors[1];
    }
  }
  prompt += ". Focus on style harmony and aesthetic benefits.";
  return prompt;
}

Reasoning ReasoningGenerator::explain(const ReasoningInput &input) const {
  GenerationRequest request;
  request.input = input;
  request.prompt = build_prompt(input);
  request.max_tokens = settings_.max_tokens;
  request.temperature = settings_.temperature;
  request.timeout = settings_.timeout;

  Reasoning reasoning;
  for (size_t i = 0; i < backends_.size(); ++i) {
    const auto &backend = backends_[i];
    try {
      reasoning.text = backend->attempt(request);
      reasoning.provenance = backend->name();
      reasoning.from_preferred = (i == 0) && backend->name() != TEMPLATE_PROVENANCE;
      return reasoning;
    } catch (const BackendError &e) {
      std::cerr << "Warning: reasoning backend '" << backend->name() << "' failed (" << e.kind()
                << "): " << e.what() << std::endl;
      reasoning.attempts.push_back(BackendAttempt{backend->name(), e.kind()});
    } catch (const std::exception &e) {
      std::cerr << "Warning: reasoning backend '" << backend->name()
                << "' failed unexpectedly: " << e.what() << std::endl;
      reasoning.attempts.push_back(BackendAttempt{backend->name(), "error"});
    }
  }

  // Only reachable if the template itself failed
  reasoning.text = TemplateBackend::render(input);
  reasoning.provenance = TEMPLATE_PROVENANCE;
  return reasoning;
}

}  // namespace artmatch_core
