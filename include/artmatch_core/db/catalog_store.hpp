#pragma once

#include <sqlite_modern_cpp.h>

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "artmatch_core/types/catalog_item.hpp"

namespace artmatch_core {

class CatalogStoreError : public std::exception {
 public:
  explicit CatalogStoreError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/**
 * @class CatalogStore
 * @brief SQLite persistence for catalog artwork and its precomputed embeddings.
 *
 * Items keep their insertion order, which the vector index relies on for
 * deterministic tie-breaking. Writes happen at catalog-build time only.
 */
class CatalogStore {
 public:
  CatalogStore(const std::filesystem::path &db_path, size_t embedding_dimension);
  ~CatalogStore() = default;

  // Disable copy constructor and assignment
  CatalogStore(const CatalogStore &) = delete;
  CatalogStore &operator=(const CatalogStore &) = delete;

  // Non-movable to keep the database handle stable
  CatalogStore(CatalogStore &&) = delete;
  CatalogStore &operator=(CatalogStore &&) = delete;

  // Inserts all items in one transaction. Nothing is written if any item is invalid.
  void add_items(const std::vector<CatalogItem> &items);
  void add_item(const CatalogItem &item);

  // Throws DimensionMismatch when a stored embedding has a different width
  // than this store was opened with.
  std::vector<CatalogItem> list_items() const;
  std::optional<CatalogItem> get_item(const std::string &id) const;
  bool contains(const std::string &id) const;
  size_t count() const;

  size_t embedding_dimension() const { return embedding_dimension_; }

 private:
  mutable sqlite::database db_;
  mutable std::mutex mutex_;
  size_t embedding_dimension_;

  void create_tables();
  void validate_item(const CatalogItem &item) const;
  bool contains_unlocked(const std::string &id) const;

  static std::vector<char> embedding_to_blob(const std::vector<float> &embedding);
  std::vector<float> blob_to_embedding(const std::vector<char> &blob) const;
};

}  // namespace artmatch_core
