#include <peerrec/candidate_source.hpp>

#include <peerrec/internal.hpp>

#include <unordered_set>

namespace peerrec {

namespace {

inline void EmitCounter(const Store* store, std::string_view name, uint64_t delta = 1) {
  if (store->options().metrics) store->options().metrics->Counter(name, delta);
}

inline void EmitHistogram(const Store* store, std::string_view name, uint64_t value) {
  if (store->options().metrics) store->options().metrics->Histogram(name, value);
}

class SimilarFromLikesSource : public CandidateSource {
 public:
  SimilarFromLikesSource(const char* name,
                         const CandidateSourceDeps& deps,
                         const LikesSourceSettings& settings,
                         bool allow_compute)
      : name_(name), deps_(deps), settings_(settings), allow_compute_(allow_compute) {}

  const char* name() const override { return name_; }

  rocksdb::Status GetCandidates(const RequestContext& ctx,
                                std::string_view user_id,
                                size_t limit,
                                bool refresh_cache,
                                std::vector<CandidateRow>* out) const override;

 private:
  const char* name_;
  CandidateSourceDeps deps_;
  LikesSourceSettings settings_;
  bool allow_compute_;
};

rocksdb::Status SimilarFromLikesSource::GetCandidates(const RequestContext& ctx,
                                                      std::string_view user_id,
                                                      size_t limit,
                                                      bool refresh_cache,
                                                      std::vector<CandidateRow>* out) const {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  out->clear();
  if (!ctx.rng) return rocksdb::Status::InvalidArgument("request has no random source");
  if (limit == 0) return rocksdb::Status::OK();

  const uint64_t op_start_us = internal::NowMicros();

  std::vector<LikeEntry> likes;
  rocksdb::Status s = FetchRecentLikes(ctx, *deps_.store, user_id, settings_.max_likes, &likes);
  if (!s.ok()) return s;
  if (likes.empty()) return rocksdb::Status::OK();

  if (settings_.max_likes_for_recs > 0 && likes.size() > settings_.max_likes_for_recs) {
    likes = ctx.rng->Sample(likes, settings_.max_likes_for_recs);
  }

  std::unordered_set<std::string> liked_keys;
  for (const auto& like : likes) liked_keys.insert(like.Key());

  SimilarCandidatesPolicy policy;
  policy.refresh_cache = refresh_cache;
  policy.require_full_cache = settings_.require_full_cache;
  policy.allow_compute = allow_compute_;

  std::unordered_set<std::string> seen;
  uint64_t resolved = 0;
  uint64_t skipped = 0;

  for (const auto& like : likes) {
    SeedVideo seed;
    s = deps_.store->FindSeed(like.video_id, like.video_uuid, like.instance_domain,
                              LookupOrder::kIdFirst, &seed);
    if (s.IsNotFound()) {
      ++skipped;
      continue;
    }
    if (!s.ok()) return s;
    ++resolved;

    std::vector<CandidateRow> rows;
    s = deps_.similarity->GetSimilarCandidates(seed, settings_.similar_per_like, policy, &rows);
    if (!s.ok()) return s;

    for (auto& row : rows) {
      std::string key = row.Key();
      if (liked_keys.count(key) || !seen.insert(std::move(key)).second) continue;
      out->push_back(std::move(row));
    }
  }

  ctx.rng->Shuffle(out);
  if (out->size() > limit) out->resize(limit);

  EmitCounter(deps_.store, "peerrec.candidates.seeds_resolved_total", resolved);
  EmitCounter(deps_.store, "peerrec.candidates.seeds_skipped_total", skipped);
  EmitHistogram(deps_.store, "peerrec.candidates.pool_size", out->size());
  EmitHistogram(deps_.store, "peerrec.candidates.latency_us", internal::NowMicros() - op_start_us);
  return rocksdb::Status::OK();
}

}  // namespace

std::unique_ptr<CandidateSource> CreateCandidateSource(std::string_view name,
                                                       const CandidateSourceDeps& deps,
                                                       const LikesSourceSettings& settings,
                                                       std::string* error_out) {
  if (!deps.store || !deps.similarity) {
    if (error_out) *error_out = "candidate source needs a store and a similarity service";
    return nullptr;
  }
  if (name == kAnnSourceName) {
    return std::make_unique<SimilarFromLikesSource>(kAnnSourceName, deps, settings, true);
  }
  if (name == kCacheOptimizedSourceName) {
    return std::make_unique<SimilarFromLikesSource>(kCacheOptimizedSourceName, deps, settings,
                                                    settings.allow_ann_on_cache_miss);
  }
  if (error_out) *error_out = "Unknown candidate source: " + std::string(name);
  return nullptr;
}

}  // namespace peerrec
