#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace peerrec::internal {

// Search result: catalog rowid + similarity score
struct SearchResult {
  uint64_t rowid;
  float score;  // inner product; cosine similarity for unit vectors
};

// Abstract interface for vector similarity search
class VectorIndex {
 public:
  virtual ~VectorIndex() = default;

  // Add (or replace) the embedding labelled by rowid
  // Returns true on success
  virtual bool Add(const std::vector<float>& embedding, uint64_t rowid) = 0;

  // Search for k nearest neighbors
  // Returns (rowid, score) pairs sorted by score descending
  virtual std::vector<SearchResult> Search(const std::vector<float>& query,
                                           size_t k) const = 0;

  // Mark rowid as deleted; it is skipped by later searches
  virtual bool MarkDeleted(uint64_t rowid) = 0;

  // Persistence. Save writes the index file plus a ".meta" sidecar.
  // Load fails when either file is missing or the dimension differs.
  virtual bool Save(const std::string& path) = 0;
  virtual bool Load(const std::string& path) = 0;

  // Stats
  virtual size_t Size() const = 0;
  virtual size_t Dimension() const = 0;
  virtual size_t DeletedCount() const = 0;

  // Set search parameters (ef_search for HNSW)
  virtual void SetSearchParam(const std::string& key, int value) = 0;
};

// Factory function for HNSW index (hnswlib, inner product space)
// - dimension: embedding dimension
// - max_elements: initial capacity (will grow automatically)
// - m: max connections per node (default 16)
// - ef_construction: build-time search depth (default 200)
std::unique_ptr<VectorIndex> CreateHNSWIndex(
    size_t dimension,
    size_t max_elements = 10000,
    int m = 16,
    int ef_construction = 200);

}  // namespace peerrec::internal
