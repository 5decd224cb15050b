#include <peerrec/recommender.hpp>

#include <peerrec/diversify.hpp>
#include <peerrec/internal.hpp>
#include <peerrec/mixer.hpp>
#include <peerrec/scoring.hpp>

#include <algorithm>

namespace peerrec {

namespace {

constexpr const char* kGeneratorNames[] = {"exploit", "explore", "popular", "random", "fresh"};

inline void EmitCounter(const Store* store, std::string_view name, uint64_t delta = 1) {
  if (store->options().metrics) store->options().metrics->Counter(name, delta);
}

inline void EmitHistogram(const Store* store, std::string_view name, uint64_t value) {
  if (store->options().metrics) store->options().metrics->Histogram(name, value);
}

const char* PathMetric(RecommendPath path) {
  switch (path) {
    case RecommendPath::kRandom:
      return "peerrec.recommend.random_total";
    case RecommendPath::kHome:
      return "peerrec.recommend.home_total";
    case RecommendPath::kHomeRandomFill:
      return "peerrec.recommend.home_random_fill_total";
    case RecommendPath::kRelated:
      return "peerrec.recommend.related_total";
  }
  return "peerrec.recommend.unknown_total";
}

}  // namespace

Recommender::Recommender(Store* store, RecommendationConfig config, RecommenderOptions opt)
    : store_(store), config_(std::move(config)), opt_(std::move(opt)) {}

rocksdb::Status Recommender::Create(Store* store,
                                    const AnnSimilaritySource* ann,
                                    RecommendationConfig config,
                                    RecommenderOptions opt,
                                    std::unique_ptr<Recommender>* out) {
  if (!store) return rocksdb::Status::InvalidArgument("store is null");
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  std::unique_ptr<Recommender> rec(new Recommender(store, std::move(config), std::move(opt)));
  rec->similarity_ = std::make_unique<SimilarityService>(store, ann);

  CandidateSourceDeps deps;
  deps.store = store;
  deps.similarity = rec->similarity_.get();

  std::string error;
  rec->likes_source_ = CreateCandidateSource(rec->opt_.likes_source, deps, rec->opt_.likes, &error);
  if (!rec->likes_source_) return rocksdb::Status::InvalidArgument(error);
  if (std::string_view(rec->likes_source_->name()) == kCacheOptimizedSourceName) {
    rec->likes_fallback_ = CreateCandidateSource(kAnnSourceName, deps, rec->opt_.likes, &error);
    if (!rec->likes_fallback_) return rocksdb::Status::InvalidArgument(error);
  }

  GeneratorDeps gdeps;
  gdeps.store = store;
  gdeps.likes_source = rec->likes_source_.get();
  gdeps.likes_fallback = rec->likes_fallback_.get();
  for (const char* name : kGeneratorNames) {
    rec->generators_[name] = CreateGenerator(name, gdeps);
  }

  rec->reranker_ = std::make_unique<PersonalizedReranker>(store, rec->opt_.personalization);
  *out = std::move(rec);
  return rocksdb::Status::OK();
}

size_t Recommender::ClampLimit(size_t requested) const {
  if (requested == 0) return opt_.default_limit;
  if (opt_.default_limit > 0) return std::min(requested, opt_.default_limit);
  return requested;
}

rocksdb::Status Recommender::Recommend(const RequestContext& ctx,
                                       const RecommendRequest& req,
                                       RecommendResponse* out) const {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  if (!ctx.rng) return rocksdb::Status::InvalidArgument("request has no random source");
  *out = RecommendResponse{};

  const uint64_t op_start_us = internal::NowMicros();
  const size_t limit = ClampLimit(req.limit);
  const bool refresh = req.refresh_cache || opt_.refresh_similarity_cache;

  UserTaste taste;
  rocksdb::Status s = LoadUserTaste(ctx, *store_, req.user_id, opt_.likes.max_likes, &taste);
  if (!s.ok()) return s;

  DiversityCaps caps;
  bool personalize = false;

  if (req.random) {
    out->path = RecommendPath::kRandom;
    s = RandomRows(ctx, limit, &out->rows);
  } else if (req.HasSeed()) {
    SeedVideo seed;
    s = store_->FindSeed(req.video_id, req.video_uuid, req.host, LookupOrder::kUuidFirst, &seed);
    if (s.IsNotFound()) {
      return rocksdb::Status::InvalidArgument("Missing vector or video reference");
    }
    if (!s.ok()) return s;

    out->path = RecommendPath::kRelated;
    out->mode = req.mode.empty() ? "upnext" : req.mode;
    const Profile* profile = ResolveProfile(config_, out->mode, taste.has_likes());
    out->profile = profile->name;
    out->has_seed = true;
    out->seed = seed.video;
    caps = profile->diversity;
    personalize = true;
    s = RelatedRows(ctx, seed, *profile, out->mode, refresh, &out->rows);
  } else {
    out->path = RecommendPath::kHome;
    out->mode = req.mode.empty() ? "home" : req.mode;
    const Profile* profile = ResolveProfile(config_, out->mode, taste.has_likes());
    out->profile = profile->name;
    caps = profile->diversity;
    s = MixForUser(ctx, taste, *profile, req.user_id, limit, refresh, &out->rows);
    if (s.ok() && out->rows.empty()) {
      out->path = RecommendPath::kHomeRandomFill;
      caps = DiversityCaps{};
      s = RandomRows(ctx, limit, &out->rows);
    }
  }
  if (!s.ok()) return s;

  s = FinishRows(ctx, taste, caps, req.user_id, personalize, limit, out);
  if (!s.ok()) return s;

  EmitCounter(store_, PathMetric(out->path), 1);
  EmitHistogram(store_, "peerrec.recommend.rows", out->rows.size());
  EmitHistogram(store_, "peerrec.recommend.latency_us", internal::NowMicros() - op_start_us);
  return rocksdb::Status::OK();
}

rocksdb::Status Recommender::MixForUser(const RequestContext& ctx,
                                        const UserTaste& taste,
                                        const Profile& profile,
                                        std::string_view user_id,
                                        size_t limit,
                                        bool refresh_cache,
                                        std::vector<CandidateRow>* out) const {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  out->clear();

  size_t batch_size = limit;
  if (profile.batch_size > 0) {
    batch_size = std::min(limit > 0 ? limit : profile.batch_size, profile.batch_size);
  }
  if (batch_size == 0 || profile.generators.empty()) return rocksdb::Status::OK();

  const std::vector<std::string> order = profile.ResolvedOrder();
  const LayerShares fetch_limits = ResolveFetchLimits(profile, order, batch_size, taste.has_likes());

  LayeredRows layers;
  for (const auto& [name, fetch_limit] : fetch_limits) {
    auto gen = generators_.find(name);
    if (gen == generators_.end() || !gen->second || fetch_limit == 0) continue;

    GeneratorRequest request;
    request.user_id = user_id;
    request.limit = fetch_limit;
    request.refresh_cache = refresh_cache;
    request.config = profile.FindGenerator(name);
    request.taste = &taste;

    const uint64_t layer_start_us = internal::NowMicros();
    std::vector<CandidateRow> rows;
    rocksdb::Status s = gen->second->Generate(ctx, request, &rows);
    if (!s.ok()) return s;
    EmitHistogram(store_, "peerrec.recommend.layer_latency_us", internal::NowMicros() - layer_start_us);

    if (request.config->shuffle) ctx.rng->Shuffle(&rows);
    layers.emplace_back(name, std::move(rows));
  }

  const int64_t now_ms = ctx.now_ms > 0 ? ctx.now_ms : internal::WallClockMillis();
  *out = SoftMix(std::move(layers), profile, batch_size, taste.liked_keys, now_ms);
  return rocksdb::Status::OK();
}

rocksdb::Status Recommender::RandomRows(const RequestContext& ctx, size_t limit,
                                        std::vector<CandidateRow>* out) const {
  return FetchRandomPool(ctx, *store_, limit, out);
}

rocksdb::Status Recommender::RelatedRows(const RequestContext& ctx,
                                         const SeedVideo& seed,
                                         const Profile& profile,
                                         std::string_view mode,
                                         bool refresh_cache,
                                         std::vector<CandidateRow>* out) const {
  SimilarCandidatesPolicy policy;
  policy.refresh_cache = refresh_cache;
  policy.require_full_cache = opt_.likes.require_full_cache;

  rocksdb::Status s =
      similarity_->GetSimilarCandidates(seed, opt_.likes.similar_per_like, policy, out);
  if (!s.ok() || out->empty()) return s;

  const int64_t now_ms = ctx.now_ms > 0 ? ctx.now_ms : internal::WallClockMillis();
  ScoreAndRank(out, profile.scoring, mode, now_ms);
  for (auto& row : *out) row.debug.profile = profile.name;
  return rocksdb::Status::OK();
}

rocksdb::Status Recommender::FinishRows(const RequestContext& ctx,
                                        const UserTaste& taste,
                                        const DiversityCaps& caps,
                                        std::string_view user_id,
                                        bool personalize,
                                        size_t limit,
                                        RecommendResponse* out) const {
  DiversityCaps tail_caps = caps;
  tail_caps.dedup = true;
  DiversifyState state;
  state.seen = taste.liked_keys;
  std::vector<CandidateRow> rows = Diversify(out->rows, limit, tail_caps, &state);

  if (personalize) {
    rocksdb::Status s = reranker_->Rerank(ctx, user_id, &rows);
    if (!s.ok()) return s;
  }

  if (opt_.moderation.Any()) {
    ModerationLists lists;
    rocksdb::Status s = store_->LoadModerationLists(&lists);
    if (!s.ok()) return s;
    rows = ApplyModeration(rows, lists, opt_.moderation, &out->moderation);
    if (out->moderation.total_filtered() > 0) {
      EmitCounter(store_, "peerrec.moderation.filtered_total", out->moderation.total_filtered());
    }
  }

  if (limit > 0 && rows.size() > limit) rows.resize(limit);
  out->rows = std::move(rows);
  return rocksdb::Status::OK();
}

}  // namespace peerrec
