#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "artmatch_core/llm/text_backend.hpp"

namespace artmatch_core {

struct ReasoningSettings {
  std::chrono::milliseconds timeout{20000};
  int max_tokens = 150;
  float temperature = 0.7f;
};

struct BackendAttempt {
  std::string backend;
  std::string failure;  // failure kind, e.g. "timeout"
};

struct Reasoning {
  std::string text;
  std::string provenance;
  std::vector<BackendAttempt> attempts;  // failed attempts, in order
  // True when the text came from the first available backend
  bool from_preferred = false;
};

/**
 * @class ReasoningGenerator
 * @brief Chain of responsibility over text backends, ending in the template.
 *
 * Backend availability is resolved once at construction. Each attempt
 * carries its own timeout and is made at most once, so the worst case for
 * one explain() call is (available backends x timeout). explain() never throws.
 */
class ReasoningGenerator {
 public:
  ReasoningGenerator(std::vector<std::shared_ptr<TextBackend>> backends,
                     ReasoningSettings settings);

  Reasoning explain(const ReasoningInput &input) const;

  // Names of the chain in order, template last.
  std::vector<std::string> chain() const;

  bool has_remote_backends() const { return backends_.size() > 1; }

  static std::string build_prompt(const ReasoningInput &input);

 private:
  std::vector<std::shared_ptr<TextBackend>> backends_;  // available only, template last
  ReasoningSettings settings_;
};

}  // namespace artmatch_core
