#include "artmatch_core/services/default_candidates.hpp"

#include <algorithm>
#include <stdexcept>

namespace artmatch_core {

namespace {

DefaultCandidate seed(const std::string &id, const std::string &title, const std::string &artist,
                      double price, const std::string &photo, std::vector<std::string> tags,
                      const std::string &style, const std::string &medium,
                      const std::string &dimensions, float match_score) {
  DefaultCandidate candidate;
  candidate.item.id = id;
  candidate.item.metadata.title = title;
  candidate.item.metadata.artist = artist;
  candidate.item.metadata.price = price;
  candidate.item.metadata.image_url = "https://images.unsplash.com/" + photo + "?w=800";
  candidate.item.metadata.thumbnail_url = "https://images.unsplash.com/" + photo + "?w=400";
  candidate.item.metadata.tags = std::move(tags);
  candidate.item.metadata.style = style;
  candidate.item.metadata.medium = medium;
  candidate.item.metadata.dimensions = dimensions;
  candidate.match_score = match_score;
  return candidate;
}

}  // namespace

DefaultCandidateSet::DefaultCandidateSet(std::vector<DefaultCandidate> candidates)
    : candidates_(std::move(candidates)) {
  if (candidates_.empty()) {
    throw std::invalid_argument("Default candidate set cannot be empty");
  }
  for (const auto &candidate : candidates_) {
    if (candidate.item.id.empty()) {
      throw std::invalid_argument("Default candidate is missing an id");
    }
    if (candidate.match_score < 0.0f || candidate.match_score > 100.0f) {
      throw std::invalid_argument("Default candidate '" + candidate.item.id +
                                  "' has a match_score outside [0, 100]");
    }
  }
  std::stable_sort(candidates_.begin(), candidates_.end(),
                   [](const DefaultCandidate &a, const DefaultCandidate &b) {
                     return a.match_score > b.match_score;
                   });
}

DefaultCandidateSet DefaultCandidateSet::builtin() {
  return DefaultCandidateSet({
      seed("artwork_001", "Abstract Geometric Canvas", "Modern Art Studio", 249.0,
           "photo-1541961017774-22349e4a1262", {"Modern", "Abstract", "Geometric"}, "Modern",
           "Canvas Print", "24x36 inches", 95.0f),
      seed("artwork_002", "Botanical Line Art Print", "Nature Studio", 129.0,
           "photo-1513519245088-0e12902e35ca", {"Botanical", "Minimalist", "Line Art"},
           "Contemporary", "Framed Print", "18x24 inches", 92.0f),
      seed("artwork_003", "Sunset Watercolor", "Color Waves", 189.0,
           "photo-1578926375605-eaf7559b0220", {"Watercolor", "Warm Tones", "Abstract"},
           "Abstract", "Watercolor Print", "20x30 inches", 88.0f),
  });
}

DefaultCandidateSet DefaultCandidateSet::from_json(const std::vector<nlohmann::json> &items) {
  std::vector<DefaultCandidate> candidates;
  for (const auto &entry : items) {
    if (!entry.is_object() || !entry.contains("match_score")) {
      throw std::invalid_argument("Default candidate entries need a match_score");
    }
    DefaultCandidate candidate;
    try {
      candidate.item = entry.get<CatalogItem>();
      candidate.match_score = entry.at("match_score").get<float>();
    } catch (const nlohmann::json::exception &e) {
      throw std::invalid_argument(std::string("Invalid default candidate: ") + e.what());
    }
    candidates.push_back(std::move(candidate));
  }
  return DefaultCandidateSet(std::move(candidates));
}

std::vector<DefaultCandidate> DefaultCandidateSet::select(size_t k) const {
  const size_t count = std::min(k, candidates_.size());
  return std::vector<DefaultCandidate>(candidates_.begin(), candidates_.begin() + count);
}

}  // namespace artmatch_core
