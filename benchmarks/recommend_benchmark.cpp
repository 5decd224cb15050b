// Performance benchmarks for the peerrec catalog and recommendation pipeline
// Uses Google Benchmark for accurate measurement and CI regression tracking
//
// Organization:
// 1. MICROBENCHMARKS: CPU-bound operations (encoding, similarity, mixing)
//    - No I/O, no database operations
// 2. MACROBENCHMARKS: Store and recommender operations
//    - Full database operations with I/O against a synthetic catalog
//
// Benchmark hygiene:
// - Pre-generate all test data outside timing loops
// - Use fixed dataset sizes and seeds for reproducible results

#include <benchmark/benchmark.h>

#include <peerrec/ann_source.hpp>
#include <peerrec/diversify.hpp>
#include <peerrec/internal.hpp>
#include <peerrec/mixer.hpp>
#include <peerrec/recommender.hpp>
#include <peerrec/store.hpp>
#include <peerrec/vector_index.hpp>

#include <filesystem>
#include <random>
#include <string>
#include <vector>

namespace {

constexpr size_t kDim = 64;
constexpr int kCatalogSize = 2000;
constexpr int kInstances = 40;
constexpr int kChannels = 300;

std::vector<float> RandomUnitVector(std::mt19937& gen) {
  std::normal_distribution<float> dis(0.0f, 1.0f);
  std::vector<float> v(kDim);
  for (auto& x : v) x = dis(gen);
  peerrec::internal::NormalizeL2(&v);
  return v;
}

peerrec::VideoRecord SyntheticVideo(int i) {
  peerrec::VideoRecord v;
  v.video_id = "v" + std::to_string(i);
  v.video_uuid = "uuid-" + std::to_string(i);
  v.instance_domain = "i" + std::to_string(i % kInstances) + ".example";
  v.channel_id = "c" + std::to_string(i % kChannels);
  v.title = "Video " + std::to_string(i);
  v.published_at = 1700000000000 - static_cast<int64_t>(i) * 3600000;
  v.views = (i * 37) % 5000;
  v.likes = (i * 11) % 300;
  return v;
}

std::vector<peerrec::CandidateRow> SyntheticRows(size_t n, std::mt19937& gen) {
  std::uniform_real_distribution<double> score(0.0, 1.0);
  std::vector<peerrec::CandidateRow> rows;
  rows.reserve(n);
  for (size_t i = 0; i < n; ++i) {
    peerrec::CandidateRow row;
    row.video = SyntheticVideo(static_cast<int>(i));
    row.similarity_score = score(gen);
    row.has_similarity = true;
    rows.push_back(std::move(row));
  }
  return rows;
}

// =============================================================================
// Benchmark Fixture
// =============================================================================

class CatalogBenchmark : public benchmark::Fixture {
 protected:
  void SetUp(const benchmark::State& state) override {
    std::error_code ec;
    test_dir_ = std::filesystem::temp_directory_path(ec) / ("peerrec_bench_" + RandomSuffix());
    std::filesystem::create_directories(test_dir_, ec);
    db_path_ = (test_dir_ / "bench_db").string();
  }

  void TearDown(const benchmark::State& state) override {
    recommender_.reset();
    ann_.reset();
    index_.reset();
    store_.reset();
    std::error_code ec;
    std::filesystem::remove_all(test_dir_, ec);
  }

  // Opens the store and loads kCatalogSize videos into store and index.
  bool BuildCatalog() {
    if (!peerrec::Store::Open(db_path_, &store_).ok()) return false;
    index_ = peerrec::internal::CreateHNSWIndex(kDim, kCatalogSize);

    std::mt19937 gen(7);
    for (int i = 0; i < kCatalogSize; ++i) {
      std::vector<float> embedding = RandomUnitVector(gen);
      uint64_t rowid = 0;
      if (!store_->PutVideo(SyntheticVideo(i), embedding, &rowid).ok()) return false;
      if (!index_->Add(embedding, rowid)) return false;
    }

    uint64_t updated = 0;
    if (!store_->RecomputePopularity(false, 2.0, 1700000000000, &updated).ok()) return false;

    for (int i = 0; i < 10; ++i) {
      peerrec::VideoRecord liked = SyntheticVideo(i * 97);
      peerrec::LikeEntry like;
      like.video_id = liked.video_id;
      like.instance_domain = liked.instance_domain;
      like.video_uuid = liked.video_uuid;
      like.created_at = 1700000000000 - i;
      if (!store_->AddLike("bench-user", like).ok()) return false;
    }

    ann_ = std::make_unique<peerrec::AnnSimilaritySource>(store_.get(), index_.get());
    return peerrec::Recommender::Create(store_.get(), ann_.get(),
                                        peerrec::DefaultRecommendationConfig(),
                                        peerrec::RecommenderOptions{}, &recommender_)
        .ok();
  }

  std::string RandomSuffix() {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 999999);
    return std::to_string(dis(gen));
  }

  std::filesystem::path test_dir_;
  std::string db_path_;
  std::unique_ptr<peerrec::Store> store_;
  std::unique_ptr<peerrec::internal::VectorIndex> index_;
  std::unique_ptr<peerrec::AnnSimilaritySource> ann_;
  std::unique_ptr<peerrec::Recommender> recommender_;
};

}  // namespace

// =============================================================================
// PART 1: MICROBENCHMARKS - CPU-bound operations without I/O
// =============================================================================

static void BM_SHA256_EventId(benchmark::State& state) {
  std::string event_id = "https://peertube.example/videos/watch/" + std::string(state.range(0), 'x');
  for (auto _ : state) {
    auto digest = peerrec::internal::Sha256::Digest(event_id);
    benchmark::DoNotOptimize(digest);
  }
  state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(event_id.size()));
}
BENCHMARK(BM_SHA256_EventId)->Range(16, 1024);

static void BM_Embedding_Serialize(benchmark::State& state) {
  std::mt19937 gen(1);
  std::vector<float> embedding = RandomUnitVector(gen);
  for (auto _ : state) {
    auto serialized = peerrec::internal::SerializeEmbedding(embedding);
    benchmark::DoNotOptimize(serialized);
  }
}
BENCHMARK(BM_Embedding_Serialize);

static void BM_Embedding_Deserialize(benchmark::State& state) {
  std::mt19937 gen(1);
  std::string serialized = peerrec::internal::SerializeEmbedding(RandomUnitVector(gen));
  std::vector<float> result;
  for (auto _ : state) {
    peerrec::internal::DeserializeEmbedding(serialized, &result);
    benchmark::DoNotOptimize(result);
  }
}
BENCHMARK(BM_Embedding_Deserialize);

static void BM_MaxAffinity(benchmark::State& state) {
  std::mt19937 gen(2);
  std::vector<float> candidate = RandomUnitVector(gen);
  std::vector<std::vector<float>> liked;
  for (int i = 0; i < state.range(0); ++i) liked.push_back(RandomUnitVector(gen));
  for (auto _ : state) {
    double affinity = peerrec::internal::MaxAffinity(candidate, liked);
    benchmark::DoNotOptimize(affinity);
  }
}
BENCHMARK(BM_MaxAffinity)->Arg(1)->Arg(5)->Arg(10);

static void BM_Diversify(benchmark::State& state) {
  std::mt19937 gen(3);
  auto rows = SyntheticRows(static_cast<size_t>(state.range(0)), gen);
  peerrec::DiversityCaps caps;
  caps.max_per_author = 3;
  caps.max_per_instance = 5;
  for (auto _ : state) {
    auto kept = peerrec::Diversify(rows, 48, caps);
    benchmark::DoNotOptimize(kept);
  }
}
BENCHMARK(BM_Diversify)->Range(64, 4096);

static void BM_SoftMix_HomeProfile(benchmark::State& state) {
  std::mt19937 gen(4);
  peerrec::RecommendationConfig config = peerrec::DefaultRecommendationConfig();
  const peerrec::Profile& profile = *config.Find("home");

  peerrec::LayeredRows layers;
  for (const auto& name : profile.ResolvedOrder()) {
    layers.emplace_back(name, SyntheticRows(static_cast<size_t>(state.range(0)), gen));
  }

  for (auto _ : state) {
    auto mixed = peerrec::SoftMix(layers, profile, 48, {}, 1700000000000);
    benchmark::DoNotOptimize(mixed);
  }
}
BENCHMARK(BM_SoftMix_HomeProfile)->Range(16, 1024);

// =============================================================================
// PART 2: MACROBENCHMARKS - Store and recommender operations with I/O
// =============================================================================

BENCHMARK_DEFINE_F(CatalogBenchmark, PutVideo)(benchmark::State& state) {
  if (!peerrec::Store::Open(db_path_, &store_).ok()) {
    state.SkipWithError("store open failed");
    return;
  }

  std::mt19937 gen(5);
  std::vector<std::vector<float>> embeddings;
  for (int i = 0; i < 1000; ++i) embeddings.push_back(RandomUnitVector(gen));

  int i = 0;
  for (auto _ : state) {
    auto status = store_->PutVideo(SyntheticVideo(i), embeddings[i % 1000]);
    benchmark::DoNotOptimize(status);
    ++i;
  }
}
BENCHMARK_REGISTER_F(CatalogBenchmark, PutVideo);

BENCHMARK_DEFINE_F(CatalogBenchmark, FindSeed)(benchmark::State& state) {
  if (!BuildCatalog()) {
    state.SkipWithError("catalog setup failed");
    return;
  }

  int i = 0;
  peerrec::SeedVideo seed;
  for (auto _ : state) {
    peerrec::VideoRecord v = SyntheticVideo(i % kCatalogSize);
    auto status = store_->FindSeed("", v.video_uuid, v.instance_domain,
                                   peerrec::LookupOrder::kUuidFirst, &seed);
    benchmark::DoNotOptimize(status);
    ++i;
  }
}
BENCHMARK_REGISTER_F(CatalogBenchmark, FindSeed);

BENCHMARK_DEFINE_F(CatalogBenchmark, RecommendHome)(benchmark::State& state) {
  if (!BuildCatalog()) {
    state.SkipWithError("catalog setup failed");
    return;
  }

  peerrec::Random rng(6);
  peerrec::RequestContext ctx;
  ctx.rng = &rng;
  peerrec::RecommendRequest req;
  req.user_id = "bench-user";

  peerrec::RecommendResponse resp;
  for (auto _ : state) {
    auto status = recommender_->Recommend(ctx, req, &resp);
    benchmark::DoNotOptimize(status);
  }
  state.counters["rows"] = static_cast<double>(resp.rows.size());
}
BENCHMARK_REGISTER_F(CatalogBenchmark, RecommendHome)->Unit(benchmark::kMillisecond);

BENCHMARK_DEFINE_F(CatalogBenchmark, RecommendRelated)(benchmark::State& state) {
  if (!BuildCatalog()) {
    state.SkipWithError("catalog setup failed");
    return;
  }

  peerrec::Random rng(8);
  peerrec::RequestContext ctx;
  ctx.rng = &rng;
  peerrec::RecommendRequest req;
  req.user_id = "bench-user";
  req.refresh_cache = state.range(0) != 0;

  int i = 0;
  peerrec::RecommendResponse resp;
  for (auto _ : state) {
    req.video_id = SyntheticVideo(i % 50).video_id;
    auto status = recommender_->Recommend(ctx, req, &resp);
    benchmark::DoNotOptimize(status);
    ++i;
  }
}
// 0: served from the similarity cache after the first pass, 1: ANN every time
BENCHMARK_REGISTER_F(CatalogBenchmark, RecommendRelated)->Arg(0)->Arg(1)->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();
