#pragma once

#include <vector>

#include <nlohmann/json.hpp>

#include "artmatch_core/types/catalog_item.hpp"

namespace artmatch_core {

struct DefaultCandidate {
  CatalogItem item;
  float match_score = 0.0f;
};

/**
 * @class DefaultCandidateSet
 * @brief Curated, always-available candidates served when the catalog index is empty.
 *
 * The set is fixed at startup. select(k) returns the k highest-scoring items,
 * keeping listed order among equal scores.
 */
class DefaultCandidateSet {
 public:
  // Throws std::invalid_argument for an empty set or a score outside [0, 100].
  explicit DefaultCandidateSet(std::vector<DefaultCandidate> candidates);

  // Built-in three-piece seed set.
  static DefaultCandidateSet builtin();

  // Parses catalog item objects that each carry a "match_score".
  static DefaultCandidateSet from_json(const std::vector<nlohmann::json> &items);

  std::vector<DefaultCandidate> select(size_t k) const;

  size_t size() const { return candidates_.size(); }

 private:
  std::vector<DefaultCandidate> candidates_;  // sorted, best first
};

}  // namespace artmatch_core
