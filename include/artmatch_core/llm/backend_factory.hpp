#pragma once

#include <memory>
#include <vector>

#include "artmatch_core/config.hpp"
#include "artmatch_core/llm/http_transport.hpp"
#include "artmatch_core/llm/text_backend.hpp"

namespace artmatch_core {

// Builds the configured backends in preference order. Disabled entries are skipped.
// The template fallback is not included; the reasoning generator appends it.
std::vector<std::shared_ptr<TextBackend>> make_text_backends(
    const ReasoningConfig &config, std::shared_ptr<HttpTransport> transport);

}  // namespace artmatch_core
