// Unit tests for peerrec/similarity_cache.hpp, peerrec/ann_source.hpp and
// peerrec/vector_index.hpp
// Tests: HNSW index, ANN neighbour resolution, cache policy, unified pipeline

#include <gtest/gtest.h>

#include <peerrec/ann_source.hpp>
#include <peerrec/similarity_cache.hpp>
#include <peerrec/test_utils.hpp>
#include <peerrec/vector_index.hpp>

#include <cmath>
#include <limits>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace peerrec {
namespace {

using testing::AxisEmbedding;
using testing::MakeVideo;
using testing::RotatedEmbedding;

constexpr size_t kDim = 8;

// Records counters emitted by the store and the similarity layer.
class CountingSink : public MetricsSink {
 public:
  void Counter(std::string_view name, uint64_t delta) override {
    std::lock_guard<std::mutex> lk(mu_);
    counters_[std::string(name)] += delta;
  }
  void Histogram(std::string_view, uint64_t) override {}

  uint64_t Get(const std::string& name) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = counters_.find(name);
    return it == counters_.end() ? 0 : it->second;
  }

 private:
  mutable std::mutex mu_;
  std::map<std::string, uint64_t> counters_;
};

// =============================================================================
// HNSW Index
// =============================================================================

class HnswIndexTest : public testing::StoreFixture {};

TEST_F(HnswIndexTest, SearchOrdersByInnerProduct) {
  auto index = internal::CreateHNSWIndex(kDim, 16);
  ASSERT_TRUE(index->Add(RotatedEmbedding(kDim, 0, 1, 0.2), 1));
  ASSERT_TRUE(index->Add(RotatedEmbedding(kDim, 0, 1, 0.8), 2));
  ASSERT_TRUE(index->Add(AxisEmbedding(kDim, 4), 3));
  EXPECT_EQ(index->Size(), 3u);
  EXPECT_EQ(index->Dimension(), kDim);

  auto hits = index->Search(AxisEmbedding(kDim, 0), 3);
  ASSERT_EQ(hits.size(), 3u);
  EXPECT_EQ(hits[0].rowid, 1u);
  EXPECT_EQ(hits[1].rowid, 2u);
  EXPECT_EQ(hits[2].rowid, 3u);
  EXPECT_NEAR(hits[0].score, std::cos(0.2), 1e-5);
  EXPECT_NEAR(hits[2].score, 0.0, 1e-5);
}

TEST_F(HnswIndexTest, RejectsWrongDimension) {
  auto index = internal::CreateHNSWIndex(kDim, 4);
  EXPECT_FALSE(index->Add(std::vector<float>(kDim + 1, 0.1f), 1));
  EXPECT_TRUE(index->Search(std::vector<float>(3, 1.0f), 5).empty());
  EXPECT_TRUE(index->Search(AxisEmbedding(kDim, 0), 5).empty());
}

TEST_F(HnswIndexTest, GrowsPastInitialCapacity) {
  auto index = internal::CreateHNSWIndex(kDim, 2);
  for (uint64_t i = 1; i <= 10; ++i) {
    ASSERT_TRUE(index->Add(testing::DeterministicEmbedding(std::to_string(i), kDim), i));
  }
  EXPECT_EQ(index->Size(), 10u);
}

TEST_F(HnswIndexTest, MarkDeletedHidesRow) {
  auto index = internal::CreateHNSWIndex(kDim, 8);
  ASSERT_TRUE(index->Add(AxisEmbedding(kDim, 0), 1));
  ASSERT_TRUE(index->Add(RotatedEmbedding(kDim, 0, 1, 0.3), 2));

  ASSERT_TRUE(index->MarkDeleted(1));
  EXPECT_EQ(index->DeletedCount(), 1u);
  EXPECT_EQ(index->Size(), 1u);

  auto hits = index->Search(AxisEmbedding(kDim, 0), 5);
  ASSERT_EQ(hits.size(), 1u);
  EXPECT_EQ(hits[0].rowid, 2u);
}

TEST_F(HnswIndexTest, SaveAndLoad) {
  const std::string path = (test_dir_ / "videos.hnsw").string();
  {
    auto index = internal::CreateHNSWIndex(kDim, 8);
    ASSERT_TRUE(index->Add(AxisEmbedding(kDim, 0), 7));
    ASSERT_TRUE(index->Add(AxisEmbedding(kDim, 1), 9));
    ASSERT_TRUE(index->Save(path));
  }

  auto loaded = internal::CreateHNSWIndex(kDim, 1);
  ASSERT_TRUE(loaded->Load(path));
  EXPECT_EQ(loaded->Size(), 2u);
  auto hits = loaded->Search(AxisEmbedding(kDim, 1), 1);
  ASSERT_EQ(hits.size(), 1u);
  EXPECT_EQ(hits[0].rowid, 9u);

  auto wrong_dim = internal::CreateHNSWIndex(kDim * 2, 1);
  EXPECT_FALSE(wrong_dim->Load(path));

  auto missing = internal::CreateHNSWIndex(kDim, 1);
  EXPECT_FALSE(missing->Load((test_dir_ / "absent.hnsw").string()));
}

// =============================================================================
// AnnSimilaritySource
// =============================================================================

/**
 * Catalog around a seed on axis 0:
 *   near  (cos 0.2 rad), mid (cos 0.6 rad), far (cos 1.2 rad), ortho (axis 5).
 */
class AnnSourceTest : public testing::StoreFixture {
 protected:
  void SetUp() override {
    testing::StoreFixture::SetUp();
    Options opt;
    opt.metrics = sink_;
    ASSERT_TRUE(OpenStore(opt).ok());

    index_ = internal::CreateHNSWIndex(kDim, 32);
    Add(MakeVideo("seed", "a.example", "chan-seed"), AxisEmbedding(kDim, 0));
    Add(MakeVideo("near", "b.example", "chan-b"), RotatedEmbedding(kDim, 0, 1, 0.2));
    Add(MakeVideo("mid", "b.example", "chan-b"), RotatedEmbedding(kDim, 0, 2, 0.6));
    Add(MakeVideo("far", "a.example", "chan-seed"), RotatedEmbedding(kDim, 0, 3, 1.2));
    Add(MakeVideo("ortho", "c.example", "chan-c"), AxisEmbedding(kDim, 5));

    ASSERT_TRUE(store_->FindSeed("seed", "", "a.example", LookupOrder::kIdFirst, &seed_).ok());
  }

  void Add(const VideoRecord& video, const std::vector<float>& embedding) {
    uint64_t rowid = AddVideo(video, embedding);
    ASSERT_TRUE(index_->Add(embedding, rowid));
  }

  static std::vector<std::string> Ids(const std::vector<SimilarItem>& items) {
    std::vector<std::string> out;
    for (const auto& item : items) out.push_back(item.video_id);
    return out;
  }

  std::shared_ptr<CountingSink> sink_ = std::make_shared<CountingSink>();
  std::unique_ptr<internal::VectorIndex> index_;
  SeedVideo seed_;
};

TEST_F(AnnSourceTest, RanksNeighboursExcludingSeed) {
  AnnSearchOptions opt;
  opt.max_per_author = 0;
  AnnSimilaritySource ann(store_.get(), index_.get(), opt);

  std::vector<SimilarItem> items;
  ASSERT_TRUE(ann.GetCandidates(seed_, 10, &items).ok());

  EXPECT_EQ(Ids(items), (std::vector<std::string>{"near", "mid", "far", "ortho"}));
  for (size_t i = 0; i < items.size(); ++i) {
    EXPECT_EQ(items[i].rank, i + 1);
  }
  EXPECT_NEAR(items[0].score, std::cos(0.2), 1e-5);
  EXPECT_EQ(sink_->Get("peerrec.ann.calls"), 1u);
}

TEST_F(AnnSourceTest, LimitAndAuthorCap) {
  AnnSimilaritySource ann(store_.get(), index_.get());  // max_per_author = 1

  std::vector<SimilarItem> items;
  ASSERT_TRUE(ann.GetCandidates(seed_, 10, &items).ok());
  // mid shares chan-b@b.example with near.
  EXPECT_EQ(Ids(items), (std::vector<std::string>{"near", "far", "ortho"}));

  ASSERT_TRUE(ann.GetCandidates(seed_, 2, &items).ok());
  EXPECT_EQ(Ids(items), (std::vector<std::string>{"near", "far"}));
}

TEST_F(AnnSourceTest, ExcludeSourceAuthor) {
  AnnSearchOptions opt;
  opt.max_per_author = 0;
  opt.exclude_source_author = true;
  AnnSimilaritySource ann(store_.get(), index_.get(), opt);

  std::vector<SimilarItem> items;
  ASSERT_TRUE(ann.GetCandidates(seed_, 10, &items).ok());
  EXPECT_EQ(Ids(items), (std::vector<std::string>{"near", "mid", "ortho"}));
}

TEST_F(AnnSourceTest, DegenerateSeedYieldsNothing) {
  AnnSimilaritySource ann(store_.get(), index_.get());
  std::vector<SimilarItem> items;

  SeedVideo empty = seed_;
  empty.embedding.clear();
  ASSERT_TRUE(ann.GetCandidates(empty, 10, &items).ok());
  EXPECT_TRUE(items.empty());

  SeedVideo zero = seed_;
  zero.embedding.assign(kDim, 0.0f);
  ASSERT_TRUE(ann.GetCandidates(zero, 10, &items).ok());
  EXPECT_TRUE(items.empty());

  AnnSimilaritySource unconfigured(store_.get(), nullptr);
  EXPECT_TRUE(unconfigured.GetCandidates(seed_, 10, &items).IsInvalidArgument());
}

// =============================================================================
// SimilarityCache
// =============================================================================

class SimilarityCacheTest : public testing::StoreFixture {
 protected:
  void SetUp() override {
    testing::StoreFixture::SetUp();
    ASSERT_TRUE(OpenStore().ok());
  }

  static std::vector<SimilarItem> Items(size_t n) {
    std::vector<SimilarItem> items;
    for (size_t i = 0; i < n; ++i) {
      SimilarItem item;
      item.video_id = "n" + std::to_string(i);
      item.instance_domain = "b.example";
      item.score = 0.9 - 0.1 * static_cast<double>(i);
      items.push_back(item);
    }
    return items;
  }

  const std::string source_ = LikeKey("seed", "a.example");
};

TEST_F(SimilarityCacheTest, MissWhenNothingStored) {
  SimilarityCache cache(store_.get());
  std::vector<SimilarItem> out;
  ASSERT_TRUE(cache.ReadCached(source_, 5, CachePolicy{}, &out).ok());
  EXPECT_TRUE(out.empty());

  bool should_write = false;
  ASSERT_TRUE(cache.ShouldWrite(source_, CachePolicy{}, &should_write).ok());
  EXPECT_TRUE(should_write);
}

TEST_F(SimilarityCacheTest, WriteThenRead) {
  SimilarityCache cache(store_.get());
  bool written = false;
  ASSERT_TRUE(cache.WriteCache(source_, Items(3), 1000, CachePolicy{}, &written).ok());
  EXPECT_TRUE(written);

  std::vector<SimilarItem> out;
  ASSERT_TRUE(cache.ReadCached(source_, 3, CachePolicy{}, &out).ok());
  ASSERT_EQ(out.size(), 3u);
  EXPECT_EQ(out[0].video_id, "n0");
  EXPECT_EQ(out[2].rank, 3u);

  // A shorter read is served from the same set.
  ASSERT_TRUE(cache.ReadCached(source_, 2, CachePolicy{}, &out).ok());
  EXPECT_EQ(out.size(), 2u);

  // Existing sets are not overwritten without refresh.
  ASSERT_TRUE(cache.WriteCache(source_, Items(1), 2000, CachePolicy{}, &written).ok());
  EXPECT_FALSE(written);
  SimilaritySourceMeta meta;
  ASSERT_TRUE(store_->GetSimilaritySource(source_, &meta).ok());
  EXPECT_EQ(meta.count, 3u);
  EXPECT_EQ(meta.computed_at, 1000);
}

TEST_F(SimilarityCacheTest, PolicySwitches) {
  SimilarityCache cache(store_.get());
  ASSERT_TRUE(cache.WriteCache(source_, Items(3), 1000, CachePolicy{}).ok());
  std::vector<SimilarItem> out;

  CachePolicy full;
  full.require_full = true;
  ASSERT_TRUE(cache.ReadCached(source_, 5, full, &out).ok());
  EXPECT_TRUE(out.empty());
  ASSERT_TRUE(cache.ReadCached(source_, 3, full, &out).ok());
  EXPECT_EQ(out.size(), 3u);

  CachePolicy refresh;
  refresh.refresh = true;
  ASSERT_TRUE(cache.ReadCached(source_, 3, refresh, &out).ok());
  EXPECT_TRUE(out.empty());
  bool written = false;
  ASSERT_TRUE(cache.WriteCache(source_, Items(1), 2000, refresh, &written).ok());
  EXPECT_TRUE(written);

  CachePolicy no_read;
  no_read.allow_read = false;
  ASSERT_TRUE(cache.ReadCached(source_, 1, no_read, &out).ok());
  EXPECT_TRUE(out.empty());

  CachePolicy no_write;
  no_write.allow_write = false;
  no_write.refresh = true;
  bool should_write = true;
  ASSERT_TRUE(cache.ShouldWrite(source_, no_write, &should_write).ok());
  EXPECT_FALSE(should_write);
}

TEST_F(SimilarityCacheTest, NonFiniteScoreIsAMiss) {
  auto items = Items(2);
  items[1].score = std::numeric_limits<double>::quiet_NaN();
  ASSERT_TRUE(store_->ReplaceSimilarItems(source_, items, 1000).ok());

  SimilarityCache cache(store_.get());
  std::vector<SimilarItem> out;
  ASSERT_TRUE(cache.ReadCached(source_, 2, CachePolicy{}, &out).ok());
  EXPECT_TRUE(out.empty());
}

// =============================================================================
// SimilarityService
// =============================================================================

class SimilarityServiceTest : public AnnSourceTest {
 protected:
  static std::vector<std::string> RowIds(const std::vector<CandidateRow>& rows) {
    std::vector<std::string> out;
    for (const auto& r : rows) out.push_back(r.video.video_id);
    return out;
  }
};

TEST_F(SimilarityServiceTest, ComputesThenServesFromCache) {
  AnnSearchOptions opt;
  opt.max_per_author = 0;
  AnnSimilaritySource ann(store_.get(), index_.get(), opt);
  SimilarityService service(store_.get(), &ann);

  std::vector<CandidateRow> rows;
  ASSERT_TRUE(service.GetSimilarCandidates(seed_, 3, SimilarCandidatesPolicy{}, &rows).ok());
  EXPECT_EQ(RowIds(rows), (std::vector<std::string>{"near", "mid", "far"}));
  EXPECT_TRUE(rows[0].has_similarity);
  EXPECT_NEAR(rows[0].similarity_score, std::cos(0.2), 1e-5);
  EXPECT_EQ(sink_->Get("peerrec.similarity.cache_miss_total"), 1u);

  SimilaritySourceMeta meta;
  ASSERT_TRUE(store_->GetSimilaritySource(seed_.video.Key(), &meta).ok());
  EXPECT_EQ(meta.count, 3u);

  // Served from the cache without the index; the default per-author cap
  // of one drops mid.
  SimilarityService cached_only(store_.get(), nullptr);
  ASSERT_TRUE(cached_only.GetSimilarCandidates(seed_, 3, SimilarCandidatesPolicy{}, &rows).ok());
  EXPECT_EQ(RowIds(rows), (std::vector<std::string>{"near", "far"}));
  EXPECT_EQ(sink_->Get("peerrec.similarity.cache_hit_total"), 1u);
}

TEST_F(SimilarityServiceTest, NoComputeOnMissWhenDisallowed) {
  AnnSimilaritySource ann(store_.get(), index_.get());
  SimilarityService service(store_.get(), &ann);

  SimilarCandidatesPolicy policy;
  policy.allow_compute = false;
  std::vector<CandidateRow> rows;
  ASSERT_TRUE(service.GetSimilarCandidates(seed_, 3, policy, &rows).ok());
  EXPECT_TRUE(rows.empty());
  EXPECT_EQ(sink_->Get("peerrec.ann.calls"), 0u);
}

TEST_F(SimilarityServiceTest, CacheDisabledSkipsWrite) {
  AnnSimilaritySource ann(store_.get(), index_.get());
  SimilarityService service(store_.get(), &ann);

  SimilarCandidatesPolicy policy;
  policy.use_cache = false;
  std::vector<CandidateRow> rows;
  ASSERT_TRUE(service.GetSimilarCandidates(seed_, 3, policy, &rows).ok());
  EXPECT_FALSE(rows.empty());

  SimilaritySourceMeta meta;
  EXPECT_TRUE(store_->GetSimilaritySource(seed_.video.Key(), &meta).IsNotFound());
}

TEST_F(SimilarityServiceTest, CachedRowsMissingFromCatalogAreSkipped) {
  std::vector<SimilarItem> items(2);
  items[0].video_id = "gone";
  items[0].instance_domain = "x.example";
  items[0].score = 0.99;
  items[1].video_id = "near";
  items[1].instance_domain = "b.example";
  items[1].score = 0.98;
  ASSERT_TRUE(store_->ReplaceSimilarItems(seed_.video.Key(), items, 1000).ok());

  SimilarityService service(store_.get(), nullptr);
  std::vector<CandidateRow> rows;
  ASSERT_TRUE(service.GetSimilarCandidates(seed_, 2, SimilarCandidatesPolicy{}, &rows).ok());
  EXPECT_EQ(RowIds(rows), (std::vector<std::string>{"near"}));
}

}  // namespace
}  // namespace peerrec
