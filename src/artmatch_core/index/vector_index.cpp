#include "artmatch_core/index/vector_index.hpp"

#include <faiss/impl/FaissException.h>

#include <algorithm>
#include <iostream>

#include "artmatch_core/db/catalog_store.hpp"
#include "artmatch_core/types/embedding.hpp"

namespace artmatch_core {

VectorIndex::VectorIndex(size_t dimension) : dimension_(dimension) {
  if (dimension_ == 0) {
    throw VectorIndexError("Vector index dimension must be greater than 0");
  }
  snapshot_ = build_snapshot({});
}

std::shared_ptr<const VectorIndex::Snapshot> VectorIndex::current_snapshot() const {
  std::lock_guard<std::mutex> lock(snapshot_mutex_);
  return snapshot_;
}

void VectorIndex::publish(std::shared_ptr<const Snapshot> snapshot) {
  std::lock_guard<std::mutex> lock(snapshot_mutex_);
  snapshot_ = std::move(snapshot);
}

std::shared_ptr<const VectorIndex::Snapshot> VectorIndex::build_snapshot(
    std::vector<CatalogItem> items) const {
  auto snapshot = std::make_shared<Snapshot>();
  snapshot->index = std::make_unique<faiss::IndexFlatL2>(static_cast<faiss::idx_t>(dimension_));
  snapshot->vectors_flat.reserve(items.size() * dimension_);
  for (const auto &item : items) {
    snapshot->vectors_flat.insert(snapshot->vectors_flat.end(), item.embedding.begin(),
                                  item.embedding.end());
  }
  if (!items.empty()) {
    try {
      snapshot->index->add(static_cast<faiss::idx_t>(items.size()),
                           snapshot->vectors_flat.data());
    } catch (const faiss::FaissException &e) {
      throw VectorIndexError("Failed to build faiss index: " + std::string(e.what()));
    }
  }
  snapshot->items = std::move(items);
  return snapshot;
}

void VectorIndex::add(const std::vector<CatalogItem> &items) {
  for (const auto &item : items) {
    validate_embedding(item.embedding, dimension_, "Catalog item '" + item.id + "' embedding");
  }
  if (items.empty()) {
    return;
  }

  std::lock_guard<std::mutex> write_lock(write_mutex_);
  auto current = current_snapshot();
  std::vector<CatalogItem> combined;
  combined.reserve(current->items.size() + items.size());
  combined.insert(combined.end(), current->items.begin(), current->items.end());
  combined.insert(combined.end(), items.begin(), items.end());
  publish(build_snapshot(std::move(combined)));
  std::cerr << "Added " << items.size() << " vectors to index (" << size() << " total)"
            << std::endl;
}

void VectorIndex::load(const CatalogStore &store) {
  if (store.embedding_dimension() != dimension_) {
    throw DimensionMismatch("Catalog store dimension mismatch. Expected " +
                            std::to_string(dimension_) + ", got " +
                            std::to_string(store.embedding_dimension()));
  }
  std::vector<CatalogItem> items = store.list_items();
  for (const auto &item : items) {
    validate_embedding(item.embedding, dimension_, "Catalog item '" + item.id + "' embedding");
  }

  std::lock_guard<std::mutex> write_lock(write_mutex_);
  publish(build_snapshot(std::move(items)));
  std::cerr << "Loaded vector index with " << size() << " vectors" << std::endl;
}

std::vector<IndexHit> VectorIndex::search(const std::vector<float> &query_vector,
                                          size_t k) const {
  validate_embedding(query_vector, dimension_, "Query vector");

  auto snapshot = current_snapshot();
  const size_t total = snapshot->items.size();
  if (total == 0) {
    throw EmptyIndexError("Vector index is empty. Cannot perform search.");
  }
  if (k == 0) {
    return {};
  }

  const size_t fetch = std::min(total, k + TIE_MARGIN);
  std::vector<float> distances(fetch);
  std::vector<faiss::idx_t> labels(fetch);
  try {
    snapshot->index->search(1, query_vector.data(), static_cast<faiss::idx_t>(fetch),
                            distances.data(), labels.data());
  } catch (const faiss::FaissException &e) {
    throw VectorIndexError("Faiss search failed: " + std::string(e.what()));
  }

  std::vector<IndexHit> hits;
  hits.reserve(fetch);
  for (size_t i = 0; i < fetch; ++i) {
    if (labels[i] < 0 || static_cast<size_t>(labels[i]) >= total) {
      continue;
    }
    const auto position = static_cast<size_t>(labels[i]);
    hits.push_back(IndexHit{distances[i], position, snapshot->items[position]});
  }

  std::sort(hits.begin(), hits.end(), [](const IndexHit &a, const IndexHit &b) {
    if (a.distance != b.distance) {
      return a.distance < b.distance;
    }
    return a.position < b.position;
  });
  if (hits.size() > k) {
    hits.resize(k);
  }
  return hits;
}

size_t VectorIndex::size() const {
  return current_snapshot()->items.size();
}

bool VectorIndex::empty() const {
  return size() == 0;
}

}  // namespace artmatch_core
