#pragma once

#include <faiss/IndexFlat.h>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "artmatch_core/types/catalog_item.hpp"
#include "artmatch_core/types/errors.hpp"

namespace artmatch_core {

class CatalogStore;

class EmptyIndexError : public std::exception {
 public:
  explicit EmptyIndexError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class VectorIndexError : public std::exception {
 public:
  explicit VectorIndexError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct IndexHit {
  float distance;   // squared L2 distance to the query
  size_t position;  // insertion order within the index
  CatalogItem item;
};

/**
 * @class VectorIndex
 * @brief In-memory nearest-neighbour index over catalog embeddings.
 *
 * Backed by an exact faiss flat L2 index. Readers search an immutable
 * snapshot; add() and load() build a new snapshot and swap it in, so a
 * search never observes a half-written index. Results are ordered by
 * ascending distance with ties broken by insertion order.
 */
class VectorIndex {
 public:
  explicit VectorIndex(size_t dimension);
  virtual ~VectorIndex() = default;

  // Disable copy constructor and assignment
  VectorIndex(const VectorIndex &) = delete;
  VectorIndex &operator=(const VectorIndex &) = delete;

  // Appends the items. Every embedding is validated before anything becomes visible.
  void add(const std::vector<CatalogItem> &items);

  // Replaces the index contents with everything in the store, in store order.
  void load(const CatalogStore &store);

  // Returns at most k hits. Throws DimensionMismatch for a malformed query
  // and EmptyIndexError when there is nothing to search; VectorIndexError
  // when faiss fails.
  virtual std::vector<IndexHit> search(const std::vector<float> &query_vector, size_t k) const;

  size_t size() const;
  bool empty() const;
  size_t dimension() const { return dimension_; }

 private:
  struct Snapshot {
    std::unique_ptr<faiss::IndexFlatL2> index;
    std::vector<float> vectors_flat;
    std::vector<CatalogItem> items;
  };

  // Extra neighbours fetched so that ties at the cut-off can be re-ordered by position
  static constexpr size_t TIE_MARGIN = 32;

  size_t dimension_;
  mutable std::mutex snapshot_mutex_;  // guards snapshot_ only
  std::mutex write_mutex_;             // serializes add/load
  std::shared_ptr<const Snapshot> snapshot_;

  std::shared_ptr<const Snapshot> current_snapshot() const;
  std::shared_ptr<const Snapshot> build_snapshot(std::vector<CatalogItem> items) const;
  void publish(std::shared_ptr<const Snapshot> snapshot);
};

}  // namespace artmatch_core
