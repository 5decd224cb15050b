#include <peerrec/generators.hpp>

#include <peerrec/diversify.hpp>
#include <peerrec/internal.hpp>

#include <algorithm>
#include <unordered_map>

namespace peerrec {

namespace {

// Capped random pools are refetched at most this many times.
constexpr int kMaxPoolAttempts = 5;

inline void EmitHistogram(const Store* store, const std::string& name, uint64_t value) {
  if (store->options().metrics) store->options().metrics->Histogram(name, value);
}

std::vector<CandidateRow> ToRows(std::vector<VideoRecord>&& records) {
  std::vector<CandidateRow> rows;
  rows.reserve(records.size());
  for (auto& record : records) {
    CandidateRow row;
    row.video = std::move(record);
    rows.push_back(std::move(row));
  }
  return rows;
}

DiversityCaps PoolCaps(const GeneratorConfig& cfg) {
  DiversityCaps caps;
  caps.max_per_author = cfg.max_per_author;
  caps.max_per_instance = cfg.max_per_instance;
  caps.dedup = true;
  return caps;
}

std::vector<CandidateRow> SampleRows(const RequestContext& ctx,
                                     const std::vector<CandidateRow>& pool,
                                     size_t limit) {
  return ctx.rng->Sample(pool, limit);
}

/**
 * Set similarity_score on every row to its affinity with the user's likes.
 * scored is false (and rows untouched) when either side has no embeddings.
 */
rocksdb::Status AttachAffinity(const Store& store, const UserTaste& taste,
                               std::vector<CandidateRow>* rows, bool* scored) {
  *scored = false;
  if (taste.liked_embeddings.empty() || rows->empty()) return rocksdb::Status::OK();

  std::vector<VideoIdentity> ids;
  ids.reserve(rows->size());
  for (const auto& row : *rows) ids.push_back(row.video.Identity());

  std::unordered_map<std::string, std::vector<float>> embeddings;
  rocksdb::Status s = store.GetEmbeddings(ids, &embeddings);
  if (!s.ok()) return s;
  if (embeddings.empty()) return rocksdb::Status::OK();

  for (auto& row : *rows) {
    double affinity = 0.0;
    auto it = embeddings.find(row.Key());
    if (it != embeddings.end()) affinity = internal::MaxAffinity(it->second, taste.liked_embeddings);
    row.similarity_score = affinity;
    row.has_similarity = true;
  }
  *scored = true;
  return rocksdb::Status::OK();
}

// ---------------------------------------------------------------------------
// exploit
// ---------------------------------------------------------------------------

class ExploitGenerator : public CandidateGenerator {
 public:
  explicit ExploitGenerator(const GeneratorDeps& deps) : deps_(deps) {}

  const char* name() const override { return "exploit"; }

  rocksdb::Status Generate(const RequestContext& ctx,
                           const GeneratorRequest& req,
                           std::vector<CandidateRow>* out) const override {
    out->clear();
    if (req.limit == 0) return rocksdb::Status::OK();

    for (const CandidateSource* source : {deps_.likes_source, deps_.likes_fallback}) {
      if (!source) continue;
      rocksdb::Status s = source->GetCandidates(ctx, req.user_id, req.limit, req.refresh_cache, out);
      if (!s.ok()) return s;
      if (!out->empty()) return rocksdb::Status::OK();
    }

    return FetchRandomPool(ctx, *deps_.store, req.limit, out);
  }

 private:
  GeneratorDeps deps_;
};

// ---------------------------------------------------------------------------
// popular / fresh
// ---------------------------------------------------------------------------

class IndexedPoolGenerator : public CandidateGenerator {
 public:
  enum class Index { kPopular, kRecent };

  IndexedPoolGenerator(const GeneratorDeps& deps, Index index) : deps_(deps), index_(index) {}

  const char* name() const override { return index_ == Index::kPopular ? "popular" : "fresh"; }

  rocksdb::Status Generate(const RequestContext& ctx,
                           const GeneratorRequest& req,
                           std::vector<CandidateRow>* out) const override {
    out->clear();
    if (req.limit == 0) return rocksdb::Status::OK();

    const size_t pool_limit = std::max(req.config->pool_size, req.limit);
    std::vector<VideoRecord> records;
    rocksdb::Status s = index_ == Index::kPopular
                            ? deps_.store->FetchPopularVideos(pool_limit, &records)
                            : deps_.store->FetchRecentVideos(pool_limit, &records);
    if (!s.ok()) return s;

    std::vector<CandidateRow> pool = Diversify(ToRows(std::move(records)), 0, PoolCaps(*req.config));
    EmitHistogram(deps_.store, std::string("peerrec.generator.") + name() + ".pool_size", pool.size());
    if (pool.empty()) return rocksdb::Status::OK();

    if (req.taste->has_likes()) {
      bool scored = false;
      s = AttachAffinity(*deps_.store, *req.taste, &pool, &scored);
      if (!s.ok()) return s;
    }
    *out = SampleRows(ctx, pool, req.limit);
    return rocksdb::Status::OK();
  }

 private:
  GeneratorDeps deps_;
  Index index_;
};

// ---------------------------------------------------------------------------
// random
// ---------------------------------------------------------------------------

class RandomGenerator : public CandidateGenerator {
 public:
  explicit RandomGenerator(const GeneratorDeps& deps) : deps_(deps) {}

  const char* name() const override { return "random"; }

  rocksdb::Status Generate(const RequestContext& ctx,
                           const GeneratorRequest& req,
                           std::vector<CandidateRow>* out) const override {
    out->clear();
    if (req.limit == 0) return rocksdb::Status::OK();
    const GeneratorConfig& cfg = *req.config;

    std::vector<CandidateRow> pool;
    rocksdb::Status s = FetchCappedPool(ctx, cfg, req.limit, &pool);
    if (!s.ok()) return s;
    EmitHistogram(deps_.store, "peerrec.generator.random.pool_size", pool.size());
    if (pool.empty()) return rocksdb::Status::OK();

    if (!cfg.below_explore_min || !req.taste->has_likes()) {
      *out = std::move(pool);
      return rocksdb::Status::OK();
    }

    bool scored = false;
    s = AttachAffinity(*deps_.store, *req.taste, &pool, &scored);
    if (!s.ok()) return s;
    if (!scored) {
      *out = std::move(pool);
      return rocksdb::Status::OK();
    }

    std::vector<CandidateRow> below;
    for (const auto& row : pool) {
      if (row.similarity_score < cfg.explore_min) below.push_back(row);
    }
    if (below.empty()) {
      *out = std::move(pool);
      return rocksdb::Status::OK();
    }
    if (below.size() > req.limit) below = SampleRows(ctx, below, req.limit);
    *out = std::move(below);
    return rocksdb::Status::OK();
  }

 private:
  rocksdb::Status FetchCappedPool(const RequestContext& ctx, const GeneratorConfig& cfg,
                                  size_t limit, std::vector<CandidateRow>* out) const {
    if (cfg.max_per_author <= 0 && cfg.max_per_instance <= 0) {
      return FetchRandomPool(ctx, *deps_.store, limit, out);
    }

    out->clear();
    DiversifyState state;
    for (int attempt = 0; attempt < kMaxPoolAttempts && out->size() < limit; ++attempt) {
      std::vector<CandidateRow> batch;
      rocksdb::Status s = FetchRandomPool(ctx, *deps_.store, limit, &batch);
      if (!s.ok()) return s;
      if (batch.empty()) break;
      for (auto& row : Diversify(batch, limit - out->size(), PoolCaps(cfg), &state)) {
        out->push_back(std::move(row));
      }
    }
    return rocksdb::Status::OK();
  }

  GeneratorDeps deps_;
};

// ---------------------------------------------------------------------------
// explore
// ---------------------------------------------------------------------------

class ExploreGenerator : public CandidateGenerator {
 public:
  explicit ExploreGenerator(const GeneratorDeps& deps) : deps_(deps) {}

  const char* name() const override { return "explore"; }

  rocksdb::Status Generate(const RequestContext& ctx,
                           const GeneratorRequest& req,
                           std::vector<CandidateRow>* out) const override {
    out->clear();
    if (req.limit == 0 || !req.taste->has_likes()) return rocksdb::Status::OK();
    const GeneratorConfig& cfg = *req.config;

    std::vector<CandidateRow> raw;
    rocksdb::Status s = FetchRandomPool(ctx, *deps_.store, std::max(cfg.pool_size, req.limit), &raw);
    if (!s.ok()) return s;
    std::vector<CandidateRow> pool = Diversify(raw, 0, PoolCaps(cfg));
    EmitHistogram(deps_.store, "peerrec.generator.explore.pool_size", pool.size());
    if (pool.empty()) return rocksdb::Status::OK();

    bool scored = false;
    s = AttachAffinity(*deps_.store, *req.taste, &pool, &scored);
    if (!s.ok()) return s;
    if (!scored) {
      *out = SampleRows(ctx, pool, req.limit);
      return rocksdb::Status::OK();
    }

    std::vector<CandidateRow> in_range;
    for (const auto& row : pool) {
      if (row.similarity_score >= cfg.similarity_min && row.similarity_score < cfg.similarity_max) {
        in_range.push_back(row);
      }
    }
    const size_t in_range_count = in_range.size();
    EmitHistogram(deps_.store, "peerrec.generator.explore.in_range", in_range_count);

    if (in_range.size() > req.limit) {
      in_range = SampleRows(ctx, in_range, req.limit);
    } else {
      std::stable_sort(in_range.begin(), in_range.end(),
                       [](const CandidateRow& a, const CandidateRow& b) {
                         return a.similarity_score > b.similarity_score;
                       });
    }
    for (auto& row : in_range) {
      row.debug.explore_pool_size = static_cast<int>(pool.size());
      row.debug.explore_in_range = static_cast<int>(in_range_count);
    }
    *out = std::move(in_range);
    return rocksdb::Status::OK();
  }

 private:
  GeneratorDeps deps_;
};

}  // namespace

rocksdb::Status FetchRandomPool(const RequestContext& ctx,
                                const Store& store,
                                size_t limit,
                                std::vector<CandidateRow>* out) {
  out->clear();
  std::vector<VideoRecord> records;
  rocksdb::Status s = store.FetchRandomCachedVideos(limit, ctx.rng, &records);
  if (!s.ok()) return s;
  if (records.empty()) {
    s = store.SampleRandomVideos(limit, ctx.rng, &records);
    if (!s.ok()) return s;
  }
  *out = ToRows(std::move(records));
  return rocksdb::Status::OK();
}

rocksdb::Status LoadUserTaste(const RequestContext& ctx,
                              const Store& store,
                              std::string_view user_id,
                              size_t max_likes,
                              UserTaste* out) {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  *out = UserTaste{};

  rocksdb::Status s = FetchRecentLikes(ctx, store, user_id, max_likes, &out->likes);
  if (!s.ok() || out->likes.empty()) return s;

  std::vector<VideoIdentity> ids;
  ids.reserve(out->likes.size());
  for (const auto& like : out->likes) {
    out->liked_keys.insert(like.Key());
    ids.push_back({like.video_id, like.instance_domain});
  }

  std::unordered_map<std::string, std::vector<float>> embeddings;
  s = store.GetEmbeddings(ids, &embeddings);
  if (!s.ok()) return s;

  std::vector<std::vector<float>> raw;
  raw.reserve(embeddings.size());
  for (auto& [key, embedding] : embeddings) raw.push_back(std::move(embedding));
  out->liked_embeddings = internal::NormalizedVectors(raw);
  return rocksdb::Status::OK();
}

std::unique_ptr<CandidateGenerator> CreateGenerator(std::string_view name,
                                                    const GeneratorDeps& deps) {
  if (!deps.store) return nullptr;
  if (name == "exploit") {
    if (!deps.likes_source) return nullptr;
    return std::make_unique<ExploitGenerator>(deps);
  }
  if (name == "explore") return std::make_unique<ExploreGenerator>(deps);
  if (name == "popular") {
    return std::make_unique<IndexedPoolGenerator>(deps, IndexedPoolGenerator::Index::kPopular);
  }
  if (name == "fresh") {
    return std::make_unique<IndexedPoolGenerator>(deps, IndexedPoolGenerator::Index::kRecent);
  }
  if (name == "random") return std::make_unique<RandomGenerator>(deps);
  return nullptr;
}

}  // namespace peerrec
