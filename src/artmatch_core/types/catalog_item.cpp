#include "artmatch_core/types/catalog_item.hpp"

namespace artmatch_core {

void from_json(const nlohmann::json &j, ArtworkMetadata &metadata) {
  ArtworkMetadata defaults;
  metadata.title = j.value("title", defaults.title);
  metadata.artist = j.value("artist", defaults.artist);
  metadata.price = j.value("price", defaults.price);
  metadata.image_url = j.value("image_url", defaults.image_url);
  metadata.thumbnail_url = j.value("thumbnail_url", defaults.thumbnail_url);
  metadata.tags = j.value("tags", defaults.tags);
  metadata.style = j.value("style", defaults.style);
  metadata.medium = j.value("medium", defaults.medium);
  metadata.dimensions = j.value("dimensions", defaults.dimensions);
}

void to_json(nlohmann::json &j, const ArtworkMetadata &metadata) {
  j = nlohmann::json{{"title", metadata.title},
                     {"artist", metadata.artist},
                     {"price", metadata.price},
                     {"image_url", metadata.image_url},
                     {"thumbnail_url", metadata.thumbnail_url},
                     {"tags", metadata.tags},
                     {"style", metadata.style},
                     {"medium", metadata.medium},
                     {"dimensions", metadata.dimensions}};
}

void from_json(const nlohmann::json &j, CatalogItem &item) {
  item.id = j.at("id").get<std::string>();
  item.embedding = j.value("embedding", std::vector<float>{});
  item.metadata = j.get<ArtworkMetadata>();
}

void to_json(nlohmann::json &j, const CatalogItem &item) {
  j = item.metadata;
  j["id"] = item.id;
  j["embedding"] = item.embedding;
}

}  // namespace artmatch_core
