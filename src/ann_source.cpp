#include <peerrec/ann_source.hpp>

#include <peerrec/internal.hpp>

#include <algorithm>
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

AnnSimilaritySource::AnnSimilaritySource(const Store* store,
                                         const internal::VectorIndex* index,
                                         AnnSearchOptions opt)
    : store_(store), index_(index), opt_(opt) {}

rocksdb::Status AnnSimilaritySource::GetCandidates(const SeedVideo& seed,
                                                   size_t limit,
                                                   std::vector<SimilarItem>* out) const {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  out->clear();
  if (!store_ || !index_) return rocksdb::Status::InvalidArgument("ANN source is not configured");
  if (limit == 0 || seed.embedding.empty()) return rocksdb::Status::OK();

  EmitCounter(store_, "peerrec.ann.calls", 1);
  const uint64_t op_start_us = internal::NowMicros();

  std::vector<float> query = seed.embedding;
  if (opt_.normalize_queries && !internal::NormalizeL2(&query)) {
    return rocksdb::Status::OK();
  }

  const size_t k = std::max(limit + 1, opt_.search_limit);
  std::vector<internal::SearchResult> hits = index_->Search(query, k);
  EmitHistogram(store_, "peerrec.ann.search_us", internal::NowMicros() - op_start_us);
  if (hits.empty()) return rocksdb::Status::OK();

  std::vector<uint64_t> rowids;
  rowids.reserve(hits.size());
  for (const auto& hit : hits) {
    if (hit.rowid == seed.video.rowid) continue;
    rowids.push_back(hit.rowid);
  }

  std::vector<VideoRecord> records;
  rocksdb::Status s = store_->GetVideosByRowids(rowids, &records);
  if (!s.ok()) return s;

  std::unordered_map<uint64_t, const VideoRecord*> by_rowid;
  by_rowid.reserve(records.size());
  for (const auto& record : records) by_rowid.emplace(record.rowid, &record);

  const std::string seed_key = seed.video.Key();
  const std::string seed_author = seed.video.Author();
  std::unordered_map<std::string, int> author_counts;
  uint64_t missing = 0;

  for (const auto& hit : hits) {
    if (out->size() >= limit) break;
    if (hit.rowid == seed.video.rowid) continue;

    auto it = by_rowid.find(hit.rowid);
    if (it == by_rowid.end()) {
      ++missing;
      continue;
    }
    const VideoRecord& record = *it->second;
    if (record.Key() == seed_key) continue;

    const std::string author = record.Author();
    if (opt_.exclude_source_author && !seed_author.empty() && author == seed_author) continue;
    if (opt_.max_per_author > 0 && !author.empty()) {
      int& count = author_counts[author];
      if (count >= opt_.max_per_author) continue;
      ++count;
    }

    SimilarItem item;
    item.video_id = record.video_id;
    item.instance_domain = record.instance_domain;
    item.score = hit.score;
    item.rank = static_cast<uint32_t>(out->size() + 1);
    out->push_back(std::move(item));
  }

  if (missing > 0) EmitCounter(store_, "peerrec.ann.missing_metadata_total", missing);
  EmitHistogram(store_, "peerrec.ann.latency_us", internal::NowMicros() - op_start_us);
  EmitHistogram(store_, "peerrec.ann.results", out->size());
  return rocksdb::Status::OK();
}

}  // namespace peerrec
