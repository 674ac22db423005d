#include "artmatch_core/llm/template_backend.hpp"

#include <cmath>

#include "artmatch_core/types/recommendation.hpp"

namespace artmatch_core {

std::string TemplateBackend::name() const {
  return TEMPLATE_PROVENANCE;
}

std::string TemplateBackend::attempt(const GenerationRequest &request) {
  return render(request.input);
}

std::string TemplateBackend::render(const ReasoningInput &input) {
  const std::string style = input.artwork_style.empty() ? "Contemporary" : input.artwork_style;
  const std::string room = input.room_style.empty() ? "room" : input.room_style;
  const long score = std::lround(input.match_score);

  std::string text = "This " + style + " piece complements your " + room + " with a " +
                     std::to_string(score) + "% match.";
  if (input.colors.size() >= 2) {
    text += " Its palette works with " + input.colors[0] + " and " + input.colors[1] + " tones.";
  } else if (input.colors.size() == 1) {
    text += " Its palette works with " + input.colors[0] + " tones.";
  }
  return text;
}

}  // namespace artmatch_core
