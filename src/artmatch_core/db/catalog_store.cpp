#include "artmatch_core/db/catalog_store.hpp"

#include <cstdint>
#include <cstring>
#include <iostream>

#include "artmatch_core/types/embedding.hpp"
#include "artmatch_core/types/errors.hpp"

namespace artmatch_core {

namespace {

std::string format_db_error(const std::string &operation, const sqlite::sqlite_exception &e) {
  return "Catalog store " + operation + " failed: " + e.errstr() +
         " [code=" + std::to_string(e.get_code()) + "]";
}

}  // namespace

CatalogStore::CatalogStore(const std::filesystem::path &db_path, size_t embedding_dimension)
    : db_([&db_path]() {
        if (db_path.has_parent_path()) {
          std::filesystem::create_directories(db_path.parent_path());
        }
        return db_path.string();
      }()),
      embedding_dimension_(embedding_dimension) {
  if (embedding_dimension_ == 0) {
    throw CatalogStoreError("Embedding dimension must be greater than 0");
  }
  create_tables();
}

void CatalogStore::create_tables() {
  try {
    // seq preserves insertion order across reloads
    db_ << "CREATE TABLE IF NOT EXISTS catalog_items ("
           "seq INTEGER PRIMARY KEY AUTOINCREMENT, "
           "id TEXT NOT NULL UNIQUE, "
           "title TEXT NOT NULL, "
           "artist TEXT, "
           "price REAL, "
           "image_url TEXT, "
           "thumbnail_url TEXT, "
           "tags TEXT, "
           "style TEXT, "
           "medium TEXT, "
           "dimensions TEXT, "
           "embedding_blob BLOB NOT NULL)";
  } catch (const sqlite::sqlite_exception &e) {
    throw CatalogStoreError(format_db_error("create_tables", e));
  }
}

void CatalogStore::validate_item(const CatalogItem &item) const {
  if (item.id.empty()) {
    throw CatalogStoreError("Catalog item id cannot be empty");
  }
  validate_embedding(item.embedding, embedding_dimension_,
                     "Catalog item '" + item.id + "' embedding");
}

void CatalogStore::add_item(const CatalogItem &item) {
  add_items({item});
}

void CatalogStore::add_items(const std::vector<CatalogItem> &items) {
  for (const auto &item : items) {
    validate_item(item);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  for (size_t i = 0; i < items.size(); ++i) {
    if (contains_unlocked(items[i].id)) {
      throw CatalogStoreError("Catalog item '" + items[i].id + "' already exists");
    }
    for (size_t j = 0; j < i; ++j) {
      if (items[j].id == items[i].id) {
        throw CatalogStoreError("Duplicate catalog item id '" + items[i].id + "' in batch");
      }
    }
  }

  try {
    db_ << "BEGIN IMMEDIATE";
    try {
      for (const auto &item : items) {
        const ArtworkMetadata &metadata = item.metadata;
        db_ << "INSERT INTO catalog_items (id, title, artist, price, image_url, thumbnail_url, "
               "tags, style, medium, dimensions, embedding_blob) VALUES (?,?,?,?,?,?,?,?,?,?,?)"
            << item.id << metadata.title << metadata.artist << metadata.price
            << metadata.image_url << metadata.thumbnail_url << nlohmann::json(metadata.tags).dump()
            << metadata.style << metadata.medium << metadata.dimensions
            << embedding_to_blob(item.embedding);
      }
      db_ << "COMMIT";
    } catch (const sqlite::sqlite_exception &) {
      db_ << "ROLLBACK";
      throw;
    }
  } catch (const sqlite::sqlite_exception &e) {
    throw CatalogStoreError(format_db_error("add_items", e));
  }
  std::cerr << "Added " << items.size() << " items to catalog store." << std::endl;
}

std::vector<CatalogItem> CatalogStore::list_items() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<CatalogItem> items;
  try {
    db_ << "SELECT id, title, artist, price, image_url, thumbnail_url, tags, style, medium, "
           "dimensions, embedding_blob FROM catalog_items ORDER BY seq" >>
        [&](std::string id, std::string title, std::string artist, double price,
            std::string image_url, std::string thumbnail_url, std::string tags, std::string style,
            std::string medium, std::string dimensions, std::vector<char> embedding_blob) {
          // A catalog built with another encoder cannot be searched with this one
          if (embedding_blob.size() != embedding_dimension_ * sizeof(float)) {
            throw DimensionMismatch("Catalog item '" + id + "' stores a " +
                                    std::to_string(embedding_blob.size() / sizeof(float)) +
                                    "-dim embedding, deployment expects " +
                                    std::to_string(embedding_dimension_));
          }
          CatalogItem item;
          item.id = std::move(id);
          item.embedding = blob_to_embedding(embedding_blob);
          item.metadata.title = std::move(title);
          item.metadata.artist = std::move(artist);
          item.metadata.price = price;
          item.metadata.image_url = std::move(image_url);
          item.metadata.thumbnail_url = std::move(thumbnail_url);
          auto parsed_tags = nlohmann::json::parse(tags, nullptr, false);
          if (parsed_tags.is_array()) {
            item.metadata.tags = parsed_tags.get<std::vector<std::string>>();
          }
          item.metadata.style = std::move(style);
          item.metadata.medium = std::move(medium);
          item.metadata.dimensions = std::move(dimensions);
          items.push_back(std::move(item));
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw CatalogStoreError(format_db_error("list_items", e));
  }
  return items;
}

std::optional<CatalogItem> CatalogStore::get_item(const std::string &id) const {
  // Catalogs are small; a scan keeps the row mapping in one place
  for (auto &item : list_items()) {
    if (item.id == id) {
      return item;
    }
  }
  return std::nullopt;
}

bool CatalogStore::contains(const std::string &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return contains_unlocked(id);
}

bool CatalogStore::contains_unlocked(const std::string &id) const {
  bool exists = false;
  try {
    db_ << "SELECT 1 FROM catalog_items WHERE id = ? LIMIT 1" << id >> [&](int /*dummy*/) {
      exists = true;
    };
  } catch (const sqlite::sqlite_exception &e) {
    throw CatalogStoreError(format_db_error("contains", e));
  }
  return exists;
}

size_t CatalogStore::count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  int64_t total = 0;
  try {
    db_ << "SELECT COUNT(*) FROM catalog_items" >> total;
  } catch (const sqlite::sqlite_exception &e) {
    throw CatalogStoreError(format_db_error("count", e));
  }
  return static_cast<size_t>(total);
}

std::vector<char> CatalogStore::embedding_to_blob(const std::vector<float> &embedding) {
  std::vector<char> blob(embedding.size() * sizeof(float));
  std::memcpy(blob.data(), embedding.data(), blob.size());
  return blob;
}

std::vector<float> CatalogStore::blob_to_embedding(const std::vector<char> &blob) const {
  std::vector<float> embedding(embedding_dimension_);
  std::memcpy(embedding.data(), blob.data(), blob.size());
  return embedding;
}

}  // namespace artmatch_core
