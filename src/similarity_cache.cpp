#include <peerrec/similarity_cache.hpp>

#include <peerrec/internal.hpp>

#include <algorithm>
#include <cmath>
#include <unordered_map>

namespace peerrec {

namespace {

inline void EmitCounter(const Store* store, std::string_view name, uint64_t delta = 1) {
  if (store->options().metrics) store->options().metrics->Counter(name, delta);
}

inline void EmitHistogram(const Store* store, std::string_view name, uint64_t value) {
  if (store->options().metrics) store->options().metrics->Histogram(name, value);
}

}  // namespace

// ---------------------------------------------------------------------------
// SimilarityCache
// ---------------------------------------------------------------------------

SimilarityCache::SimilarityCache(Store* store) : store_(store) {}

rocksdb::Status SimilarityCache::ReadCached(std::string_view source_key,
                                            size_t limit,
                                            const CachePolicy& policy,
                                            std::vector<SimilarItem>* out) const {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  out->clear();
  if (!policy.allow_read || policy.refresh || limit == 0) return rocksdb::Status::OK();

  SimilaritySourceMeta meta;
  rocksdb::Status s = store_->GetSimilaritySource(source_key, &meta);
  if (s.IsNotFound()) return rocksdb::Status::OK();
  if (!s.ok()) return s;

  if (policy.require_full && meta.count != limit) return rocksdb::Status::OK();

  std::vector<SimilarItem> items;
  s = store_->ReadSimilarItems(source_key, limit, &items);
  if (!s.ok()) return s;

  const size_t expected = std::min<size_t>(meta.count, limit);
  if (items.size() != expected) return rocksdb::Status::OK();
  for (const auto& item : items) {
    if (!std::isfinite(item.score)) return rocksdb::Status::OK();
  }

  *out = std::move(items);
  return rocksdb::Status::OK();
}

rocksdb::Status SimilarityCache::ShouldWrite(std::string_view source_key,
                                             const CachePolicy& policy,
                                             bool* out) const {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  *out = false;
  if (!policy.allow_write) return rocksdb::Status::OK();
  if (policy.refresh) {
    *out = true;
    return rocksdb::Status::OK();
  }

  SimilaritySourceMeta meta;
  rocksdb::Status s = store_->GetSimilaritySource(source_key, &meta);
  if (s.IsNotFound()) {
    *out = true;
    return rocksdb::Status::OK();
  }
  return s;
}

rocksdb::Status SimilarityCache::WriteCache(std::string_view source_key,
                                            const std::vector<SimilarItem>& items,
                                            int64_t computed_at,
                                            const CachePolicy& policy,
                                            bool* written) {
  if (written) *written = false;

  bool should_write = false;
  rocksdb::Status s = ShouldWrite(source_key, policy, &should_write);
  if (!s.ok() || !should_write) return s;

  s = store_->ReplaceSimilarItems(source_key, items, computed_at);
  if (s.ok() && written) *written = true;
  return s;
}

// ---------------------------------------------------------------------------
// SimilarityService
// ---------------------------------------------------------------------------

SimilarityService::SimilarityService(Store* store, const AnnSimilaritySource* ann)
    : store_(store), ann_(ann), cache_(store) {}

rocksdb::Status SimilarityService::GetSimilarCandidates(const SeedVideo& seed,
                                                        size_t limit,
                                                        const SimilarCandidatesPolicy& policy,
                                                        std::vector<CandidateRow>* out) const {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  out->clear();
  if (limit == 0) return rocksdb::Status::OK();

  const uint64_t op_start_us = internal::NowMicros();
  const std::string source_key = seed.video.Key();

  CachePolicy cache_policy;
  cache_policy.refresh = policy.refresh_cache;
  cache_policy.require_full = policy.require_full_cache;
  cache_policy.allow_read = policy.use_cache;
  cache_policy.allow_write = policy.use_cache && policy.allow_cache_write;

  std::vector<SimilarItem> items;
  rocksdb::Status s = cache_.ReadCached(source_key, limit, cache_policy, &items);
  if (!s.ok()) {
    EmitCounter(store_, "peerrec.similarity.cache_error_total", 1);
    items.clear();
  }

  if (!items.empty()) {
    EmitCounter(store_, "peerrec.similarity.cache_hit_total", 1);
  } else {
    EmitCounter(store_, "peerrec.similarity.cache_miss_total", 1);
    if (!policy.allow_compute || !ann_) return rocksdb::Status::OK();

    s = ann_->GetCandidates(seed, limit, &items);
    if (!s.ok()) return s;

    if (!items.empty()) {
      rocksdb::Status ws = cache_.WriteCache(source_key, items,
                                             internal::WallClockMillis(), cache_policy);
      if (!ws.ok()) EmitCounter(store_, "peerrec.similarity.cache_error_total", 1);
    }
  }
  if (items.empty()) return rocksdb::Status::OK();

  std::vector<VideoIdentity> ids;
  ids.reserve(items.size());
  for (const auto& item : items) ids.push_back({item.video_id, item.instance_domain});

  std::unordered_map<std::string, VideoRecord> records;
  s = store_->GetVideosByKeys(ids, &records);
  if (!s.ok()) return s;

  const AnnSearchOptions ann_opt = ann_ ? ann_->options() : AnnSearchOptions{};
  const std::string seed_author = seed.video.Author();
  std::unordered_map<std::string, int> author_counts;

  for (const auto& item : items) {
    if (out->size() >= limit) break;
    const std::string key = item.Key();
    if (key == source_key) continue;

    auto it = records.find(key);
    if (it == records.end()) continue;
    const VideoRecord& record = it->second;

    const std::string author = record.Author();
    if (ann_opt.exclude_source_author && !seed_author.empty() && author == seed_author) continue;
    if (ann_opt.max_per_author > 0 && !author.empty()) {
      int& count = author_counts[author];
      if (count >= ann_opt.max_per_author) continue;
      ++count;
    }

    CandidateRow row;
    row.video = record;
    row.score = item.score;
    row.has_score = true;
    row.similarity_score = item.score;
    row.has_similarity = true;
    out->push_back(std::move(row));
  }

  EmitHistogram(store_, "peerrec.similarity.latency_us", internal::NowMicros() - op_start_us);
  return rocksdb::Status::OK();
}

}  // namespace peerrec
