#include <peerrec/vector_index.hpp>

#include <hnswlib/hnswlib.h>

#include <algorithm>
#include <fstream>
#include <mutex>
#include <queue>

namespace peerrec::internal {

namespace {
constexpr uint32_t kMetaMagic = 0x50524958;  // "PRIX"
constexpr uint32_t kMetaVersion = 1;
}  // namespace

// HNSW implementation using hnswlib. Labels are catalog rowids.
class HNSWIndex : public VectorIndex {
 public:
  HNSWIndex(size_t dimension, size_t max_elements, int m, int ef_construction)
      : dimension_(dimension),
        max_elements_(std::max<size_t>(max_elements, 1)),
        m_(m),
        ef_construction_(ef_construction),
        ef_search_(50) {
    // Inner product space: distance = 1 - <a, b>
    space_ = std::make_unique<hnswlib::InnerProductSpace>(dimension);
    index_ = std::make_unique<hnswlib::HierarchicalNSW<float>>(
        space_.get(), max_elements_, m, ef_construction);
    index_->setEf(ef_search_);
  }

  bool Add(const std::vector<float>& embedding, uint64_t rowid) override {
    std::lock_guard<std::mutex> lock(mutex_);

    if (embedding.size() != dimension_) {
      return false;
    }

    // Grow index if needed
    if (index_->getCurrentElementCount() >= max_elements_) {
      size_t new_max = max_elements_ * 2;
      try {
        index_->resizeIndex(new_max);
      } catch (const std::exception&) {
        return false;
      }
      max_elements_ = new_max;
    }

    try {
      index_->addPoint(embedding.data(), static_cast<hnswlib::labeltype>(rowid));
    } catch (const std::exception&) {
      return false;
    }
    return true;
  }

  std::vector<SearchResult> Search(const std::vector<float>& query,
                                   size_t k) const override {
    std::lock_guard<std::mutex> lock(mutex_);

    size_t live = LiveCount();
    if (query.size() != dimension_ || live == 0 || k == 0) {
      return {};
    }
    size_t search_k = std::min(k, live);

    std::priority_queue<std::pair<float, hnswlib::labeltype>> result;
    try {
      result = index_->searchKnn(query.data(), search_k);
    } catch (const std::exception&) {
      return {};
    }

    std::vector<SearchResult> results;
    results.reserve(result.size());

    // Max-heap on distance: farthest first
    while (!result.empty()) {
      auto [distance, label] = result.top();
      result.pop();
      results.push_back({static_cast<uint64_t>(label), 1.0f - distance});
    }

    std::reverse(results.begin(), results.end());
    return results;
  }

  bool MarkDeleted(uint64_t rowid) override {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
      index_->markDelete(static_cast<hnswlib::labeltype>(rowid));
    } catch (const std::exception&) {
      return false;
    }
    return true;
  }

  bool Save(const std::string& path) override {
    std::lock_guard<std::mutex> lock(mutex_);

    try {
      index_->saveIndex(path);

      std::ofstream ofs(path + ".meta", std::ios::binary);
      if (!ofs) return false;

      uint64_t dimension = dimension_;
      uint64_t count = index_->getCurrentElementCount();
      ofs.write(reinterpret_cast<const char*>(&kMetaMagic), sizeof(kMetaMagic));
      ofs.write(reinterpret_cast<const char*>(&kMetaVersion), sizeof(kMetaVersion));
      ofs.write(reinterpret_cast<const char*>(&dimension), sizeof(dimension));
      ofs.write(reinterpret_cast<const char*>(&count), sizeof(count));
      ofs.write(reinterpret_cast<const char*>(&m_), sizeof(m_));
      ofs.write(reinterpret_cast<const char*>(&ef_construction_), sizeof(ef_construction_));

      ofs.flush();
      return ofs.good();
    } catch (const std::exception&) {
      return false;
    }
  }

  bool Load(const std::string& path) override {
    std::lock_guard<std::mutex> lock(mutex_);

    try {
      std::ifstream check(path, std::ios::binary);
      if (!check.good()) return false;
      check.close();

      std::ifstream ifs(path + ".meta", std::ios::binary);
      if (!ifs) return false;

      uint32_t magic = 0;
      uint32_t version = 0;
      uint64_t dimension = 0;
      uint64_t count = 0;
      int m = 0;
      int ef_construction = 0;
      ifs.read(reinterpret_cast<char*>(&magic), sizeof(magic));
      ifs.read(reinterpret_cast<char*>(&version), sizeof(version));
      ifs.read(reinterpret_cast<char*>(&dimension), sizeof(dimension));
      ifs.read(reinterpret_cast<char*>(&count), sizeof(count));
      ifs.read(reinterpret_cast<char*>(&m), sizeof(m));
      ifs.read(reinterpret_cast<char*>(&ef_construction), sizeof(ef_construction));
      if (!ifs.good() || magic != kMetaMagic || version != kMetaVersion) return false;
      if (dimension != dimension_) return false;

      auto loaded = std::make_unique<hnswlib::HierarchicalNSW<float>>(space_.get(), path);
      if (loaded->getCurrentElementCount() != count) return false;
      loaded->setEf(ef_search_);

      index_ = std::move(loaded);
      max_elements_ = index_->getMaxElements();
      m_ = m;
      ef_construction_ = ef_construction;
      return true;
    } catch (const std::exception&) {
      return false;
    }
  }

  size_t Size() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    return LiveCount();
  }

  size_t Dimension() const override {
    return dimension_;
  }

  size_t DeletedCount() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    return index_->getDeletedCount();
  }

  void SetSearchParam(const std::string& key, int value) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if ((key == "ef_search" || key == "ef") && value > 0) {
      ef_search_ = value;
      index_->setEf(value);
    }
  }

 private:
  // Caller must hold mutex
  size_t LiveCount() const {
    return index_->getCurrentElementCount() - index_->getDeletedCount();
  }

  size_t dimension_;
  size_t max_elements_;
  int m_;
  int ef_construction_;
  int ef_search_;

  std::unique_ptr<hnswlib::InnerProductSpace> space_;
  std::unique_ptr<hnswlib::HierarchicalNSW<float>> index_;

  mutable std::mutex mutex_;
};

std::unique_ptr<VectorIndex> CreateHNSWIndex(
    size_t dimension,
    size_t max_elements,
    int m,
    int ef_construction) {
  return std::make_unique<HNSWIndex>(dimension, max_elements, m, ef_construction);
}

}  // namespace peerrec::internal
