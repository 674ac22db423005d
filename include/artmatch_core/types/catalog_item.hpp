#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace artmatch_core {

struct ArtworkMetadata {
  std::string title = "Untitled";
  std::string artist = "Unknown Artist";
  double price = 0.0;
  std::string image_url;
  std::string thumbnail_url;
  std::vector<std::string> tags;
  std::string style = "Contemporary";
  std::string medium;
  std::string dimensions = "Standard";
};

struct CatalogItem {
  std::string id;
  std::vector<float> embedding;
  ArtworkMetadata metadata;
};

// Missing display fields fall back to the ArtworkMetadata defaults. A missing
// "embedding" key yields an empty vector, which the index and store reject.
void from_json(const nlohmann::json &j, ArtworkMetadata &metadata);
void to_json(nlohmann::json &j, const ArtworkMetadata &metadata);
void from_json(const nlohmann::json &j, CatalogItem &item);
void to_json(nlohmann::json &j, const CatalogItem &item);

}  // namespace artmatch_core
