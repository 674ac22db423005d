#pragma once

#include <string>

#include "artmatch_core/llm/text_backend.hpp"

namespace artmatch_core {

// Deterministic last resort. Always available and never throws.
class TemplateBackend : public TextBackend {
 public:
  std::string name() const override;
  bool is_available() const override { return true; }
  std::string attempt(const GenerationRequest &request) override;

  static std::string render(const ReasoningInput &input);
};

}  // namespace artmatch_core
