#include <peerrec/store.hpp>

#include <rocksdb/advanced_cache.h>
#include <rocksdb/cache.h>
#include <rocksdb/filter_policy.h>
#include <rocksdb/statistics.h>
#include <rocksdb/table.h>
#include <rocksdb/utilities/transaction.h>
#include <rocksdb/write_batch.h>

#include <algorithm>
#include <cmath>
#include <cstring>

#include <peerrec/internal.hpp>
#include <peerrec/popularity.hpp>

namespace peerrec {

namespace {

constexpr const char* kVideosCF            = "peerrec_videos";
constexpr const char* kEmbeddingsCF        = "peerrec_embeddings";
constexpr const char* kRowidsCF            = "peerrec_rowids";
constexpr const char* kUuidIndexCF         = "peerrec_uuid_index";
constexpr const char* kRecentIndexCF       = "peerrec_recent_index";
constexpr const char* kPopularityIndexCF   = "peerrec_popularity_index";
constexpr const char* kLikesCF             = "peerrec_likes";
constexpr const char* kSimilaritySourcesCF = "peerrec_similarity_sources";
constexpr const char* kSimilarityItemsCF   = "peerrec_similarity_items";
constexpr const char* kRandomRowidsCF      = "peerrec_random_rowids";
constexpr const char* kModerationCF        = "peerrec_moderation";
constexpr const char* kEventsCF            = "peerrec_events";
constexpr const char* kSignalsCF           = "peerrec_signals";

// Keys in the default column family.
constexpr const char* kNextRowidKey       = "meta:next_rowid";
constexpr const char* kEmbeddingDimKey    = "meta:embedding_dim";
constexpr const char* kRandomCacheSizeKey = "meta:random_cache_size";

constexpr const char* kDeniedHostPrefix     = "host:";
constexpr const char* kBlockedChannelPrefix = "channel:";

constexpr size_t kWriteBatchRows = 1000;

// --------------------------
// Observability helpers
// --------------------------
inline void EmitCounter(const peerrec::Options& opt,
                        std::string_view name,
                        uint64_t delta = 1) {
  if (opt.metrics) opt.metrics->Counter(name, delta);
}

inline void EmitHistogram(const peerrec::Options& opt,
                          std::string_view name,
                          uint64_t value) {
  if (opt.metrics) opt.metrics->Histogram(name, value);
}

inline void EmitGauge(const peerrec::Options& opt,
                      std::string_view name,
                      double value) {
  if (opt.metrics) opt.metrics->Gauge(name, value);
}

// Map RocksDB statuses to low-cardinality strings for tracing.
inline std::string_view StatusKind(const rocksdb::Status& s) {
  if (s.ok()) return "ok";
  if (s.IsNotFound()) return "not_found";
  if (s.IsInvalidArgument()) return "invalid_argument";
  if (s.IsTimedOut()) return "timed_out";
  if (s.IsBusy()) return "busy";
  if (s.IsTryAgain()) return "try_again";
  if (s.IsAborted()) return "aborted";
  if (s.IsCorruption()) return "corruption";
  if (s.IsIOError()) return "io_error";
  return "other";
}

inline void SpanAttr(peerrec::TraceSpan* span,
                     std::string_view key,
                     uint64_t value) {
  if (span) span->SetAttribute(key, value);
}

inline void SpanAttr(peerrec::TraceSpan* span,
                     std::string_view key,
                     std::string_view value) {
  if (span) span->SetAttribute(key, value);
}

// Helper: build a ColumnFamilyOptions with shared cache + bloom
rocksdb::ColumnFamilyOptions MakeCFOptions(const std::shared_ptr<rocksdb::Cache>& cache,
                                           int bloom_bits_per_key) {
  rocksdb::BlockBasedTableOptions table;
  table.block_cache = cache;
  table.filter_policy.reset(rocksdb::NewBloomFilterPolicy(bloom_bits_per_key, false));
  table.whole_key_filtering = true;

  rocksdb::ColumnFamilyOptions cfo;
  cfo.table_factory.reset(rocksdb::NewBlockBasedTableFactory(table));
  return cfo;
}

inline rocksdb::Slice ToSlice(std::string_view s) {
  return rocksdb::Slice(s.data(), s.size());
}

inline std::string_view ToView(const rocksdb::Slice& s) {
  return std::string_view(s.data(), s.size());
}

// --------------------------
// Key layouts
// --------------------------

// [~published_at:8 BE][like_key]; newest first under bytewise order.
std::string RecentKey(int64_t published_at, std::string_view like_key) {
  std::string key;
  key.reserve(8 + like_key.size());
  internal::PutU64BE(&key, ~static_cast<uint64_t>(std::max<int64_t>(0, published_at)));
  key.append(like_key.data(), like_key.size());
  return key;
}

// [~score_bits:8 BE][like_key]; non-negative doubles order like their bits.
std::string PopularityKey(double score, std::string_view like_key) {
  if (!std::isfinite(score) || score < 0.0) score = 0.0;
  std::string key;
  key.reserve(8 + like_key.size());
  internal::PutU64BE(&key, ~internal::DoubleBits(score));
  key.append(like_key.data(), like_key.size());
  return key;
}

std::string LikesPrefix(std::string_view user_id) {
  std::string key(user_id);
  key.push_back('\0');
  return key;
}

// [user_id][\0][~created_at:8 BE][like_key]; most recent first per user.
std::string LikeIndexKey(std::string_view user_id, int64_t created_at,
                         std::string_view like_key) {
  std::string key = LikesPrefix(user_id);
  internal::PutU64BE(&key, ~static_cast<uint64_t>(std::max<int64_t>(0, created_at)));
  key.append(like_key.data(), like_key.size());
  return key;
}

std::string SimilarityPrefix(std::string_view source_key) {
  std::string key(source_key);
  key.push_back('\0');
  return key;
}

std::string SimilarityItemKey(std::string_view source_key, uint32_t rank) {
  std::string key = SimilarityPrefix(source_key);
  internal::PutU32BE(&key, rank);
  return key;
}

std::string BlockedChannelKey(std::string_view channel_id, std::string_view host) {
  std::string key(kBlockedChannelPrefix);
  key.append(channel_id.data(), channel_id.size());
  key.push_back('\0');
  key.append(host.data(), host.size());
  return key;
}

std::string EventKey(std::string_view event_id) {
  auto digest = internal::Sha256::Digest(event_id);
  return internal::ToBytes(digest.data(), digest.size());
}

// Embedding value: [rowid:8 LE][float32 LE ...]
std::string EncodeEmbeddingValue(uint64_t rowid, const std::vector<float>& embedding) {
  std::string out = internal::EncodeU64LE(rowid);
  out.append(internal::SerializeEmbedding(embedding));
  return out;
}

bool DecodeEmbeddingValue(std::string_view value, uint64_t* rowid,
                          std::vector<float>* embedding) {
  if (value.size() < 8) return false;
  if (!internal::DecodeU64LE(value.substr(0, 8), rowid)) return false;
  return internal::DeserializeEmbedding(value.substr(8), embedding);
}

std::string EncodeSimilarItemValue(const SimilarItem& item) {
  internal::RecordWriter w;
  w.PutDouble(item.score);
  w.PutString(item.video_id);
  w.PutString(item.instance_domain);
  return w.Release();
}

bool DecodeSimilarItemValue(std::string_view value, SimilarItem* out) {
  internal::RecordReader r(value);
  return r.GetDouble(&out->score) &&
         r.GetString(&out->video_id) &&
         r.GetString(&out->instance_domain) &&
         r.AtEnd();
}

std::string EncodeLikeValue(const LikeEntry& like) {
  internal::RecordWriter w;
  w.PutString(like.video_id);
  w.PutString(like.instance_domain);
  w.PutString(like.video_uuid);
  w.PutI64(like.created_at);
  return w.Release();
}

bool DecodeLikeValue(std::string_view value, LikeEntry* out) {
  internal::RecordReader r(value);
  return r.GetString(&out->video_id) &&
         r.GetString(&out->instance_domain) &&
         r.GetString(&out->video_uuid) &&
         r.GetI64(&out->created_at) &&
         r.AtEnd();
}

// Runs body inside a pessimistic transaction and commits, retrying on
// lock conflicts. body must reset any outputs it writes, since it may run
// more than once.
rocksdb::Status RunTransaction(rocksdb::TransactionDB* db,
                               const Options& opt,
                               std::string_view retry_metric,
                               const std::function<rocksdb::Status(rocksdb::Transaction*)>& body) {
  rocksdb::WriteOptions wo;
  rocksdb::TransactionOptions to;
  to.lock_timeout = opt.lock_timeout_ms;

  for (int attempt = 0; attempt < opt.max_retries; ++attempt) {
    std::unique_ptr<rocksdb::Transaction> txn(db->BeginTransaction(wo, to));
    if (!txn) return rocksdb::Status::IOError("BeginTransaction returned null");

    rocksdb::Status s = body(txn.get());
    if (s.ok()) s = txn->Commit();
    if (s.ok()) return s;

    rocksdb::Status rs = txn->Rollback();
    (void)rs;  // a failed commit may already have released the transaction

    if (internal::IsRetryableTxnStatus(s)) {
      EmitCounter(opt, retry_metric, 1);
      continue;
    }
    return s;
  }
  return rocksdb::Status::TimedOut("transaction exceeded max_retries");
}

}  // namespace

Store::Store(const Options& opt) : opt_(opt) {}

Store::~Store() { Close(); }

rocksdb::Status Store::Open(const std::string& db_path,
                            std::unique_ptr<Store>* out,
                            const Options& opt) {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  if (opt.max_retries <= 0) return rocksdb::Status::InvalidArgument("max_retries must be positive");

  auto store = std::unique_ptr<Store>(new Store(opt));

  rocksdb::Options options;
  options.create_if_missing = true;
  options.create_missing_column_families = true;

  auto statistics = rocksdb::CreateDBStatistics();
  options.statistics = statistics;

  rocksdb::TransactionDBOptions txn_opts;

  // Shared cache for all CFs
  auto cache = rocksdb::NewLRUCache(opt.block_cache_bytes);
  store->block_cache_ = cache;
  store->statistics_ = statistics;

  const char* cf_names[] = {
      kVideosCF, kEmbeddingsCF, kRowidsCF, kUuidIndexCF, kRecentIndexCF,
      kPopularityIndexCF, kLikesCF, kSimilaritySourcesCF, kSimilarityItemsCF,
      kRandomRowidsCF, kModerationCF, kEventsCF, kSignalsCF};

  std::vector<rocksdb::ColumnFamilyDescriptor> cfs;
  cfs.emplace_back(rocksdb::kDefaultColumnFamilyName, MakeCFOptions(cache, opt.bloom_bits_per_key));
  for (const char* name : cf_names) {
    cfs.emplace_back(name, MakeCFOptions(cache, opt.bloom_bits_per_key));
  }

  std::vector<rocksdb::ColumnFamilyHandle*> handles;
  rocksdb::TransactionDB* db = nullptr;

  rocksdb::Status s = rocksdb::TransactionDB::Open(options, txn_opts, db_path, cfs, &handles, &db);
  if (!s.ok()) {
    for (auto* h : handles) delete h;
    return s;
  }

  store->db_ = db;
  store->handles_ = std::move(handles);

  // Descriptor order = handle order
  store->default_cf_     = store->handles_[0];
  store->videos_cf_      = store->handles_[1];
  store->embeddings_cf_  = store->handles_[2];
  store->rowids_cf_      = store->handles_[3];
  store->uuid_cf_        = store->handles_[4];
  store->recent_cf_      = store->handles_[5];
  store->popularity_cf_  = store->handles_[6];
  store->likes_cf_       = store->handles_[7];
  store->sim_sources_cf_ = store->handles_[8];
  store->sim_items_cf_   = store->handles_[9];
  store->random_cf_      = store->handles_[10];
  store->moderation_cf_  = store->handles_[11];
  store->events_cf_      = store->handles_[12];
  store->signals_cf_     = store->handles_[13];

  *out = std::move(store);
  return rocksdb::Status::OK();
}

void Store::Close() {
  std::lock_guard<std::mutex> catalog_lock(catalog_mu_);
  if (!db_) return;

  for (auto* h : handles_) delete h;
  handles_.clear();
  delete db_;
  db_ = nullptr;
  default_cf_ = videos_cf_ = embeddings_cf_ = rowids_cf_ = uuid_cf_ = nullptr;
  recent_cf_ = popularity_cf_ = likes_cf_ = sim_sources_cf_ = sim_items_cf_ = nullptr;
  random_cf_ = moderation_cf_ = events_cf_ = signals_cf_ = nullptr;
}

bool Store::PassesErrorThreshold(const VideoRecord& record) const {
  return opt_.video_error_threshold <= 0 ||
         record.error_count < opt_.video_error_threshold;
}

rocksdb::Status Store::ReadU64Locked(std::string_view key, uint64_t* out) const {
  std::string raw;
  rocksdb::Status s = db_->Get(rocksdb::ReadOptions(), default_cf_, ToSlice(key), &raw);
  if (s.IsNotFound()) {
    *out = 0;
    return rocksdb::Status::OK();
  }
  if (!s.ok()) return s;
  if (!internal::DecodeU64LE(raw, out)) {
    return rocksdb::Status::Corruption("meta value is not uint64_le");
  }
  return rocksdb::Status::OK();
}

// ---------------------------------------------------------------------------
// Catalog
// ---------------------------------------------------------------------------

rocksdb::Status Store::PutVideo(const VideoRecord& record,
                                const std::vector<float>& embedding,
                                uint64_t* assigned_rowid) {
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");
  if (record.video_id.empty()) return rocksdb::Status::InvalidArgument("video_id is required");
  if (record.instance_domain.empty()) {
    return rocksdb::Status::InvalidArgument("instance_domain is required");
  }
  for (float x : embedding) {
    if (!std::isfinite(x)) {
      return rocksdb::Status::InvalidArgument("embedding contains non-finite values");
    }
  }

  EmitCounter(opt_, "peerrec.put_video.calls", 1);
  const uint64_t op_start_us = internal::NowMicros();

  std::lock_guard<std::mutex> lock(catalog_mu_);
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");

  const std::string key = record.Key();
  rocksdb::ReadOptions ro;
  uint64_t rowid_out = 0;

  rocksdb::Status s = RunTransaction(db_, opt_, "peerrec.put_video.retry_total",
                                     [&](rocksdb::Transaction* txn) -> rocksdb::Status {
    // Deployment dimension is fixed by the first stored embedding.
    uint64_t dim = 0;
    {
      std::string raw;
      rocksdb::Status ds = txn->GetForUpdate(ro, default_cf_, kEmbeddingDimKey, &raw);
      if (ds.ok()) {
        if (!internal::DecodeU64LE(raw, &dim)) {
          return rocksdb::Status::Corruption("embedding_dim is not uint64_le");
        }
      } else if (!ds.IsNotFound()) {
        return ds;
      }
    }
    if (!embedding.empty()) {
      if (dim == 0) {
        rocksdb::Status ps = txn->Put(default_cf_, kEmbeddingDimKey,
                                      internal::EncodeU64LE(embedding.size()));
        if (!ps.ok()) return ps;
      } else if (dim != embedding.size()) {
        return rocksdb::Status::InvalidArgument(
            "embedding dimension " + std::to_string(embedding.size()) +
            " does not match deployment dimension " + std::to_string(dim));
      }
    }

    VideoRecord old;
    bool had_old = false;
    {
      std::string raw;
      rocksdb::Status gs = txn->GetForUpdate(ro, videos_cf_, key, &raw);
      if (gs.ok()) {
        if (!VideoRecord::Deserialize(raw, &old)) {
          return rocksdb::Status::Corruption("video record for " + key);
        }
        had_old = true;
      } else if (!gs.IsNotFound()) {
        return gs;
      }
    }

    VideoRecord next = record;
    if (had_old) {
      next.rowid = old.rowid;
      if (embedding.empty()) next.embedding_dim = old.embedding_dim;
    } else {
      uint64_t next_id = 1;
      std::string raw;
      rocksdb::Status ns = txn->GetForUpdate(ro, default_cf_, kNextRowidKey, &raw);
      if (ns.ok()) {
        if (!internal::DecodeU64LE(raw, &next_id)) {
          return rocksdb::Status::Corruption("next_rowid is not uint64_le");
        }
      } else if (!ns.IsNotFound()) {
        return ns;
      }
      next.rowid = next_id;
      rocksdb::Status ps = txn->Put(default_cf_, kNextRowidKey, internal::EncodeU64LE(next_id + 1));
      if (!ps.ok()) return ps;
    }
    if (!embedding.empty()) next.embedding_dim = static_cast<uint32_t>(embedding.size());

    // Drop secondary entries of the previous version.
    if (had_old) {
      rocksdb::Status ds;
      if (!old.video_uuid.empty()) {
        ds = txn->Delete(uuid_cf_, LikeKey(old.video_uuid, old.instance_domain));
        if (!ds.ok()) return ds;
      }
      ds = txn->Delete(recent_cf_, RecentKey(old.published_at, key));
      if (!ds.ok()) return ds;
      if (old.has_popularity) {
        ds = txn->Delete(popularity_cf_, PopularityKey(old.popularity, key));
        if (!ds.ok()) return ds;
      }
    }

    rocksdb::Status ws = txn->Put(videos_cf_, key, next.Serialize());
    if (!ws.ok()) return ws;
    ws = txn->Put(rowids_cf_, internal::EncodeU64BE(next.rowid), key);
    if (!ws.ok()) return ws;
    if (!next.video_uuid.empty()) {
      ws = txn->Put(uuid_cf_, LikeKey(next.video_uuid, next.instance_domain), key);
      if (!ws.ok()) return ws;
    }
    ws = txn->Put(recent_cf_, RecentKey(next.published_at, key), rocksdb::Slice());
    if (!ws.ok()) return ws;
    if (next.has_popularity) {
      ws = txn->Put(popularity_cf_, PopularityKey(next.popularity, key), rocksdb::Slice());
      if (!ws.ok()) return ws;
    }
    if (!embedding.empty()) {
      ws = txn->Put(embeddings_cf_, key, EncodeEmbeddingValue(next.rowid, embedding));
      if (!ws.ok()) return ws;
    }

    rowid_out = next.rowid;
    return rocksdb::Status::OK();
  });

  EmitHistogram(opt_, "peerrec.put_video.latency_us", internal::NowMicros() - op_start_us);
  if (!s.ok()) {
    EmitCounter(opt_, "peerrec.put_video.error_total", 1);
    return s;
  }
  if (assigned_rowid) *assigned_rowid = rowid_out;
  return s;
}

rocksdb::Status Store::GetVideoLocked(std::string_view key, VideoRecord* out) const {
  std::string raw;
  rocksdb::Status s = db_->Get(rocksdb::ReadOptions(), videos_cf_, ToSlice(key), &raw);
  if (!s.ok()) return s;
  if (!VideoRecord::Deserialize(raw, out)) {
    return rocksdb::Status::Corruption("video record for " + std::string(key));
  }
  return rocksdb::Status::OK();
}

rocksdb::Status Store::GetEmbeddingLocked(std::string_view key, std::vector<float>* out) const {
  std::string raw;
  rocksdb::Status s = db_->Get(rocksdb::ReadOptions(), embeddings_cf_, ToSlice(key), &raw);
  if (!s.ok()) return s;
  uint64_t rowid = 0;
  if (!DecodeEmbeddingValue(raw, &rowid, out)) {
    return rocksdb::Status::Corruption("embedding for " + std::string(key));
  }
  return rocksdb::Status::OK();
}

rocksdb::Status Store::GetVideo(std::string_view video_id,
                                std::string_view instance_domain,
                                VideoRecord* out) const {
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  std::lock_guard<std::mutex> lock(catalog_mu_);
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");
  return GetVideoLocked(LikeKey(video_id, instance_domain), out);
}

rocksdb::Status Store::FindVideoLocked(std::string_view video_id,
                                       std::string_view uuid,
                                       std::string_view host,
                                       LookupOrder order,
                                       VideoRecord* out) const {
  rocksdb::ReadOptions ro;

  auto by_uuid = [&]() -> rocksdb::Status {
    if (uuid.empty()) return rocksdb::Status::NotFound();
    std::string key;
    if (!host.empty()) {
      rocksdb::Status s = db_->Get(ro, uuid_cf_, LikeKey(uuid, host), &key);
      if (!s.ok()) return s;
      return GetVideoLocked(key, out);
    }
    const std::string prefix = LikeKey(uuid, "");
    std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(ro, uuid_cf_));
    it->Seek(prefix);
    if (it->Valid() && it->key().starts_with(prefix)) {
      key.assign(it->value().data(), it->value().size());
    }
    if (!it->status().ok()) return it->status();
    if (key.empty()) return rocksdb::Status::NotFound();
    return GetVideoLocked(key, out);
  };

  auto by_id = [&]() -> rocksdb::Status {
    if (video_id.empty()) return rocksdb::Status::NotFound();
    if (!host.empty()) return GetVideoLocked(LikeKey(video_id, host), out);
    const std::string prefix = LikeKey(video_id, "");
    std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(ro, videos_cf_));
    it->Seek(prefix);
    bool found = false;
    if (it->Valid() && it->key().starts_with(prefix)) {
      if (!VideoRecord::Deserialize(ToView(it->value()), out)) {
        return rocksdb::Status::Corruption("video record");
      }
      found = true;
    }
    if (!it->status().ok()) return it->status();
    return found ? rocksdb::Status::OK() : rocksdb::Status::NotFound();
  };

  rocksdb::Status first = order == LookupOrder::kUuidFirst ? by_uuid() : by_id();
  if (first.ok() || !first.IsNotFound()) return first;
  rocksdb::Status second = order == LookupOrder::kUuidFirst ? by_id() : by_uuid();
  if (second.ok() || !second.IsNotFound()) return second;
  return rocksdb::Status::NotFound("Video not found");
}

rocksdb::Status Store::FindVideo(std::string_view video_id,
                                 std::string_view uuid,
                                 std::string_view host,
                                 LookupOrder order,
                                 VideoRecord* out) const {
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  if (video_id.empty() && uuid.empty()) {
    return rocksdb::Status::InvalidArgument("Missing video_id or uuid");
  }

  std::lock_guard<std::mutex> lock(catalog_mu_);
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");
  return FindVideoLocked(video_id, uuid, host, order, out);
}

rocksdb::Status Store::FindSeed(std::string_view video_id,
                                std::string_view uuid,
                                std::string_view host,
                                LookupOrder order,
                                SeedVideo* out) const {
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  if (video_id.empty() && uuid.empty()) {
    return rocksdb::Status::InvalidArgument("Missing video_id or uuid");
  }

  EmitCounter(opt_, "peerrec.find_seed.calls", 1);

  std::lock_guard<std::mutex> lock(catalog_mu_);
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");

  SeedVideo seed;
  rocksdb::Status s = FindVideoLocked(video_id, uuid, host, order, &seed.video);
  if (!s.ok()) return s;

  s = GetEmbeddingLocked(seed.video.Key(), &seed.embedding);
  if (s.IsNotFound() || (s.ok() && seed.embedding.empty())) {
    EmitCounter(opt_, "peerrec.find_seed.invalid_total", 1);
    return rocksdb::Status::NotFound("seed has no embedding");
  }
  if (!s.ok()) return s;

  uint64_t dim = 0;
  s = ReadU64Locked(kEmbeddingDimKey, &dim);
  if (!s.ok()) return s;
  if (dim != 0 && dim != seed.embedding.size()) {
    EmitCounter(opt_, "peerrec.find_seed.invalid_total", 1);
    return rocksdb::Status::NotFound("seed embedding dimension mismatch");
  }

  *out = std::move(seed);
  return rocksdb::Status::OK();
}

rocksdb::Status Store::GetVideosByKeys(const std::vector<VideoIdentity>& ids,
                                       std::unordered_map<std::string, VideoRecord>* out) const {
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  out->clear();

  std::lock_guard<std::mutex> lock(catalog_mu_);
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");

  for (const auto& id : ids) {
    const std::string key = LikeKey(id);
    if (out->count(key)) continue;
    VideoRecord record;
    rocksdb::Status s = GetVideoLocked(key, &record);
    if (s.IsNotFound()) continue;
    if (!s.ok()) return s;
    if (!PassesErrorThreshold(record)) continue;
    out->emplace(key, std::move(record));
  }
  return rocksdb::Status::OK();
}

rocksdb::Status Store::ResolveRowidsLocked(const std::vector<uint64_t>& rowids,
                                           std::vector<VideoRecord>* out) const {
  rocksdb::ReadOptions ro;
  for (uint64_t rowid : rowids) {
    std::string key;
    rocksdb::Status s = db_->Get(ro, rowids_cf_, internal::EncodeU64BE(rowid), &key);
    if (s.IsNotFound()) continue;
    if (!s.ok()) return s;

    VideoRecord record;
    s = GetVideoLocked(key, &record);
    if (s.IsNotFound()) continue;
    if (!s.ok()) return s;
    if (!PassesErrorThreshold(record)) continue;
    out->push_back(std::move(record));
  }
  return rocksdb::Status::OK();
}

rocksdb::Status Store::GetVideosByRowids(const std::vector<uint64_t>& rowids,
                                         std::vector<VideoRecord>* out) const {
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  out->clear();

  std::lock_guard<std::mutex> lock(catalog_mu_);
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");
  return ResolveRowidsLocked(rowids, out);
}

rocksdb::Status Store::GetEmbeddings(
    const std::vector<VideoIdentity>& ids,
    std::unordered_map<std::string, std::vector<float>>* out) const {
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  out->clear();

  std::lock_guard<std::mutex> lock(catalog_mu_);
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");

  for (const auto& id : ids) {
    const std::string key = LikeKey(id);
    if (out->count(key)) continue;
    std::vector<float> embedding;
    rocksdb::Status s = GetEmbeddingLocked(key, &embedding);
    if (s.IsNotFound()) continue;
    if (!s.ok()) return s;
    if (embedding.empty()) continue;
    out->emplace(key, std::move(embedding));
  }
  return rocksdb::Status::OK();
}

rocksdb::Status Store::ForEachEmbedding(
    const std::function<bool(uint64_t rowid, const std::vector<float>& embedding)>& fn) const {
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");

  const rocksdb::Snapshot* snapshot = db_->GetSnapshot();
  rocksdb::ReadOptions ro;
  ro.snapshot = snapshot;

  rocksdb::Status result;
  {
    std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(ro, rowids_cf_));
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
      std::string raw;
      rocksdb::Status s = db_->Get(ro, embeddings_cf_, it->value(), &raw);
      if (s.IsNotFound()) continue;
      if (!s.ok()) {
        result = s;
        break;
      }
      uint64_t rowid = 0;
      std::vector<float> embedding;
      if (!DecodeEmbeddingValue(raw, &rowid, &embedding)) {
        result = rocksdb::Status::Corruption("embedding value");
        break;
      }
      if (embedding.empty()) continue;
      if (!fn(rowid, embedding)) break;
    }
    if (result.ok()) result = it->status();
  }

  db_->ReleaseSnapshot(snapshot);
  return result;
}

rocksdb::Status Store::SampleRandomVideos(size_t limit, Random* rng,
                                          std::vector<VideoRecord>* out) const {
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");
  if (!out || !rng) return rocksdb::Status::InvalidArgument("out or rng is null");
  out->clear();
  if (limit == 0) return rocksdb::Status::OK();

  EmitCounter(opt_, "peerrec.random_pool.calls", 1);

  std::lock_guard<std::mutex> lock(catalog_mu_);
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");

  uint64_t next_rowid = 0;
  rocksdb::Status s = ReadU64Locked(kNextRowidKey, &next_rowid);
  if (!s.ok()) return s;
  if (next_rowid <= 1) return rocksdb::Status::OK();

  const uint64_t max_rowid = next_rowid - 1;
  const uint64_t start = 1 + rng->Uniform(max_rowid);

  std::vector<uint64_t> rowids;
  {
    std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(rocksdb::ReadOptions(), rowids_cf_));
    for (it->Seek(internal::EncodeU64BE(start)); it->Valid() && rowids.size() < limit; it->Next()) {
      uint64_t rowid = 0;
      if (internal::DecodeU64BE(ToView(it->key()), &rowid)) rowids.push_back(rowid);
    }
    for (it->SeekToFirst(); it->Valid() && rowids.size() < limit; it->Next()) {
      uint64_t rowid = 0;
      if (!internal::DecodeU64BE(ToView(it->key()), &rowid)) continue;
      if (rowid >= start) break;
      rowids.push_back(rowid);
    }
    if (!it->status().ok()) return it->status();
  }

  s = ResolveRowidsLocked(rowids, out);
  if (!s.ok()) return s;
  rng->Shuffle(out);
  return rocksdb::Status::OK();
}

rocksdb::Status Store::CollectIndexLocked(rocksdb::ColumnFamilyHandle* index_cf,
                                          size_t limit,
                                          std::vector<VideoRecord>* out) const {
  std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(rocksdb::ReadOptions(), index_cf));
  for (it->SeekToFirst(); it->Valid() && out->size() < limit; it->Next()) {
    std::string_view key = ToView(it->key());
    if (key.size() <= 8) continue;
    VideoRecord record;
    rocksdb::Status s = GetVideoLocked(key.substr(8), &record);
    if (s.IsNotFound()) continue;
    if (!s.ok()) return s;
    if (!PassesErrorThreshold(record)) continue;
    out->push_back(std::move(record));
  }
  return it->status();
}

rocksdb::Status Store::FetchPopularVideos(size_t limit, std::vector<VideoRecord>* out) const {
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  out->clear();

  std::lock_guard<std::mutex> lock(catalog_mu_);
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");
  return CollectIndexLocked(popularity_cf_, limit, out);
}

rocksdb::Status Store::FetchRecentVideos(size_t limit, std::vector<VideoRecord>* out) const {
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  out->clear();

  std::lock_guard<std::mutex> lock(catalog_mu_);
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");
  return CollectIndexLocked(recent_cf_, limit, out);
}

rocksdb::Status Store::CountVideos(uint64_t* out) const {
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  const rocksdb::Snapshot* snapshot = db_->GetSnapshot();
  rocksdb::ReadOptions ro;
  ro.snapshot = snapshot;

  uint64_t count = 0;
  rocksdb::Status iter_status;
  {
    std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(ro, videos_cf_));
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
      ++count;
    }
    iter_status = it->status();
  }

  db_->ReleaseSnapshot(snapshot);
  if (!iter_status.ok()) return iter_status;

  *out = count;
  return rocksdb::Status::OK();
}

rocksdb::Status Store::CountEmbeddingsApprox(uint64_t* out) const {
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  uint64_t value = 0;
  if (!db_->GetIntProperty(embeddings_cf_, "rocksdb.estimate-num-keys", &value)) {
    return rocksdb::Status::NotSupported("rocksdb.estimate-num-keys unavailable");
  }
  *out = value;
  return rocksdb::Status::OK();
}

rocksdb::Status Store::EmbeddingDimension(uint32_t* out) const {
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  std::lock_guard<std::mutex> lock(catalog_mu_);
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");

  uint64_t dim = 0;
  rocksdb::Status s = ReadU64Locked(kEmbeddingDimKey, &dim);
  if (!s.ok()) return s;
  *out = static_cast<uint32_t>(dim);
  return rocksdb::Status::OK();
}

// ---------------------------------------------------------------------------
// Popularity
// ---------------------------------------------------------------------------

rocksdb::Status Store::RecomputePopularity(bool incremental,
                                           double like_weight,
                                           int64_t now_ms,
                                           uint64_t* updated) {
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");
  if (!updated) return rocksdb::Status::InvalidArgument("updated is null");
  *updated = 0;

  const uint64_t op_start_us = internal::NowMicros();

  std::lock_guard<std::mutex> lock(catalog_mu_);
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");

  const rocksdb::Snapshot* snapshot = db_->GetSnapshot();
  rocksdb::ReadOptions ro;
  ro.snapshot = snapshot;

  rocksdb::WriteOptions wo;
  rocksdb::WriteBatch batch;
  size_t batch_rows = 0;
  rocksdb::Status result;

  {
    std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(ro, videos_cf_));
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
      VideoRecord record;
      if (!VideoRecord::Deserialize(ToView(it->value()), &record)) {
        result = rocksdb::Status::Corruption("video record");
        break;
      }
      if (incremental && record.has_popularity && record.popularity != 0.0) continue;

      int64_t likes = record.likes;
      if (!record.video_uuid.empty()) {
        std::string raw;
        rocksdb::Status ss = db_->Get(ro, signals_cf_,
                                      LikeKey(record.video_uuid, record.instance_domain), &raw);
        InteractionSignals signals;
        if (ss.ok() && InteractionSignals::Deserialize(raw, &signals)) {
          likes += signals.NetLikes();
        } else if (!ss.ok() && !ss.IsNotFound()) {
          result = ss;
          break;
        }
      }

      const std::string key = record.Key();
      if (record.has_popularity) {
        batch.Delete(popularity_cf_, PopularityKey(record.popularity, key));
      }
      record.popularity = PopularityScore(record.views, likes, record.published_at,
                                          now_ms, like_weight);
      record.has_popularity = true;
      batch.Put(videos_cf_, key, record.Serialize());
      batch.Put(popularity_cf_, PopularityKey(record.popularity, key), rocksdb::Slice());
      ++(*updated);

      if (++batch_rows >= kWriteBatchRows) {
        result = db_->Write(wo, &batch);
        if (!result.ok()) break;
        batch.Clear();
        batch_rows = 0;
      }
    }
    if (result.ok()) result = it->status();
  }

  db_->ReleaseSnapshot(snapshot);
  if (result.ok() && batch_rows > 0) result = db_->Write(wo, &batch);

  EmitHistogram(opt_, "peerrec.popularity.recompute_us", internal::NowMicros() - op_start_us);
  if (result.ok()) EmitCounter(opt_, "peerrec.popularity.updated_total", *updated);
  return result;
}

// ---------------------------------------------------------------------------
// Random cache
// ---------------------------------------------------------------------------

rocksdb::Status Store::PopulateRandomCache(const RandomCacheSettings& settings,
                                           Random* rng,
                                           uint64_t* count) {
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");
  if (!rng || !count) return rocksdb::Status::InvalidArgument("rng or count is null");
  *count = 0;
  if (settings.size == 0) return rocksdb::Status::OK();

  const uint64_t op_start_us = internal::NowMicros();

  std::lock_guard<std::mutex> lock(catalog_mu_);
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");

  uint64_t existing = 0;
  rocksdb::Status s = ReadU64Locked(kRandomCacheSizeKey, &existing);
  if (!s.ok()) return s;
  if (!settings.refresh && existing >= settings.size) {
    *count = existing;
    return rocksdb::Status::OK();
  }

  rocksdb::WriteOptions wo;

  // Clear the previous cache.
  {
    rocksdb::WriteBatch batch;
    std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(rocksdb::ReadOptions(), random_cf_));
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
      batch.Delete(random_cf_, it->key());
    }
    if (!it->status().ok()) return it->status();
    batch.Put(default_cf_, kRandomCacheSizeKey, internal::EncodeU64LE(0));
    s = db_->Write(wo, &batch);
    if (!s.ok()) return s;
  }

  uint64_t next_rowid = 0;
  s = ReadU64Locked(kNextRowidKey, &next_rowid);
  if (!s.ok()) return s;
  if (next_rowid <= 1) return rocksdb::Status::OK();

  const uint64_t max_rowid = next_rowid - 1;
  const uint64_t target = std::min<uint64_t>(settings.size, max_rowid);
  const uint64_t start = 1 + rng->Uniform(max_rowid);
  const bool capped = settings.filtered_mode &&
                      (settings.max_per_instance > 0 || settings.max_per_author > 0);

  std::vector<uint64_t> rowids;
  std::unordered_map<std::string, int> instance_counts;
  std::unordered_map<std::string, int> author_counts;
  uint64_t scanned = 0;

  auto try_add = [&](uint64_t rowid, std::string_view key) -> rocksdb::Status {
    if (!capped) {
      rowids.push_back(rowid);
      return rocksdb::Status::OK();
    }
    VideoRecord record;
    rocksdb::Status rs = GetVideoLocked(key, &record);
    if (rs.IsNotFound()) return rocksdb::Status::OK();
    if (!rs.ok()) return rs;

    const std::string& instance = record.instance_domain;
    if (settings.max_per_instance > 0 && !instance.empty() &&
        instance_counts[instance] >= settings.max_per_instance) {
      return rocksdb::Status::OK();
    }
    const std::string author = record.Author();
    if (settings.max_per_author > 0 && !author.empty() &&
        author_counts[author] >= settings.max_per_author) {
      return rocksdb::Status::OK();
    }
    rowids.push_back(rowid);
    if (!instance.empty()) ++instance_counts[instance];
    if (!author.empty()) ++author_counts[author];
    return rocksdb::Status::OK();
  };

  {
    std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(rocksdb::ReadOptions(), rowids_cf_));
    for (it->Seek(internal::EncodeU64BE(start)); it->Valid() && rowids.size() < target; it->Next()) {
      uint64_t rowid = 0;
      if (!internal::DecodeU64BE(ToView(it->key()), &rowid)) continue;
      ++scanned;
      s = try_add(rowid, ToView(it->value()));
      if (!s.ok()) return s;
    }
    for (it->SeekToFirst(); it->Valid() && rowids.size() < target; it->Next()) {
      uint64_t rowid = 0;
      if (!internal::DecodeU64BE(ToView(it->key()), &rowid)) continue;
      if (rowid >= start) break;
      ++scanned;
      s = try_add(rowid, ToView(it->value()));
      if (!s.ok()) return s;
    }
    if (!it->status().ok()) return it->status();
  }

  rng->Shuffle(&rowids);

  rocksdb::WriteBatch batch;
  for (size_t i = 0; i < rowids.size(); ++i) {
    batch.Put(random_cf_, internal::EncodeU64BE(i + 1), internal::EncodeU64LE(rowids[i]));
    if (batch.Count() >= kWriteBatchRows) {
      s = db_->Write(wo, &batch);
      if (!s.ok()) return s;
      batch.Clear();
    }
  }
  batch.Put(default_cf_, kRandomCacheSizeKey, internal::EncodeU64LE(rowids.size()));
  s = db_->Write(wo, &batch);
  if (!s.ok()) return s;

  EmitHistogram(opt_, "peerrec.random_cache.populate_us", internal::NowMicros() - op_start_us);
  EmitHistogram(opt_, "peerrec.random_cache.scanned", scanned);
  EmitGauge(opt_, "peerrec.random_cache.size", static_cast<double>(rowids.size()));
  *count = rowids.size();
  return rocksdb::Status::OK();
}

rocksdb::Status Store::FetchRandomCachedVideos(size_t limit, Random* rng,
                                               std::vector<VideoRecord>* out) const {
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");
  if (!out || !rng) return rocksdb::Status::InvalidArgument("out or rng is null");
  out->clear();
  if (limit == 0) return rocksdb::Status::OK();

  std::lock_guard<std::mutex> lock(catalog_mu_);
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");

  uint64_t size = 0;
  rocksdb::Status s = ReadU64Locked(kRandomCacheSizeKey, &size);
  if (!s.ok()) return s;
  if (size == 0) {
    EmitCounter(opt_, "peerrec.random_cache.empty_total", 1);
    return rocksdb::Status::OK();
  }

  const uint64_t window = std::min<uint64_t>(limit, size);
  const uint64_t start = 1 + rng->Uniform(size - window + 1);

  std::vector<uint64_t> rowids;
  {
    std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(rocksdb::ReadOptions(), random_cf_));
    for (it->Seek(internal::EncodeU64BE(start)); it->Valid() && rowids.size() < window; it->Next()) {
      uint64_t rowid = 0;
      if (internal::DecodeU64LE(ToView(it->value()), &rowid)) rowids.push_back(rowid);
    }
    if (!it->status().ok()) return it->status();
  }

  return ResolveRowidsLocked(rowids, out);
}

rocksdb::Status Store::RandomCacheSize(uint64_t* out) const {
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  std::lock_guard<std::mutex> lock(catalog_mu_);
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");
  return ReadU64Locked(kRandomCacheSizeKey, out);
}

// ---------------------------------------------------------------------------
// Likes
// ---------------------------------------------------------------------------

rocksdb::Status Store::AddLike(std::string_view user_id, const LikeEntry& like) {
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");
  if (user_id.empty()) return rocksdb::Status::InvalidArgument("user_id is required");
  if (like.video_id.empty() || like.instance_domain.empty()) {
    return rocksdb::Status::InvalidArgument("like requires video_id and instance_domain");
  }

  LikeEntry entry = like;
  if (entry.created_at <= 0) entry.created_at = internal::WallClockMillis();
  const std::string like_key = entry.Key();
  const std::string prefix = LikesPrefix(user_id);

  std::lock_guard<std::mutex> lock(likes_mu_);
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");

  rocksdb::WriteBatch batch;
  std::vector<std::string> keys;
  {
    std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(rocksdb::ReadOptions(), likes_cf_));
    for (it->Seek(prefix); it->Valid() && it->key().starts_with(prefix); it->Next()) {
      std::string_view key = ToView(it->key());
      if (key.substr(prefix.size() + 8) == like_key) {
        batch.Delete(likes_cf_, it->key());
        continue;
      }
      keys.emplace_back(key);
    }
    if (!it->status().ok()) return it->status();
  }

  const std::string new_key = LikeIndexKey(user_id, entry.created_at, like_key);
  batch.Put(likes_cf_, new_key, EncodeLikeValue(entry));

  // Keys sort newest first; everything past the cap is dropped.
  if (opt_.max_likes_per_user > 0) {
    keys.push_back(new_key);
    std::sort(keys.begin(), keys.end());
    for (size_t i = opt_.max_likes_per_user; i < keys.size(); ++i) {
      batch.Delete(likes_cf_, keys[i]);
    }
  }

  rocksdb::Status s = db_->Write(rocksdb::WriteOptions(), &batch);
  if (s.ok()) EmitCounter(opt_, "peerrec.likes.added_total", 1);
  return s;
}

rocksdb::Status Store::RemoveLike(std::string_view user_id, const VideoIdentity& id) {
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");
  if (user_id.empty()) return rocksdb::Status::InvalidArgument("user_id is required");

  const std::string like_key = LikeKey(id);
  const std::string prefix = LikesPrefix(user_id);

  std::lock_guard<std::mutex> lock(likes_mu_);
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");

  rocksdb::WriteBatch batch;
  {
    std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(rocksdb::ReadOptions(), likes_cf_));
    for (it->Seek(prefix); it->Valid() && it->key().starts_with(prefix); it->Next()) {
      if (ToView(it->key()).substr(prefix.size() + 8) == like_key) {
        batch.Delete(likes_cf_, it->key());
      }
    }
    if (!it->status().ok()) return it->status();
  }
  if (batch.Count() == 0) return rocksdb::Status::NotFound("like not found");
  return db_->Write(rocksdb::WriteOptions(), &batch);
}

rocksdb::Status Store::FetchRecentLikes(std::string_view user_id,
                                        size_t limit,
                                        std::vector<LikeEntry>* out) const {
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  out->clear();
  if (user_id.empty()) return rocksdb::Status::OK();

  const std::string prefix = LikesPrefix(user_id);

  std::lock_guard<std::mutex> lock(likes_mu_);
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");

  std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(rocksdb::ReadOptions(), likes_cf_));
  for (it->Seek(prefix); it->Valid() && it->key().starts_with(prefix); it->Next()) {
    if (limit != 0 && out->size() >= limit) break;
    LikeEntry like;
    if (!DecodeLikeValue(ToView(it->value()), &like)) {
      return rocksdb::Status::Corruption("like value");
    }
    out->push_back(std::move(like));
  }
  return it->status();
}

rocksdb::Status Store::CountLikes(std::string_view user_id, uint64_t* out) const {
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  *out = 0;
  if (user_id.empty()) return rocksdb::Status::OK();

  const std::string prefix = LikesPrefix(user_id);

  std::lock_guard<std::mutex> lock(likes_mu_);
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");

  std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(rocksdb::ReadOptions(), likes_cf_));
  for (it->Seek(prefix); it->Valid() && it->key().starts_with(prefix); it->Next()) {
    ++(*out);
  }
  return it->status();
}

// ---------------------------------------------------------------------------
// Similarity cache
// ---------------------------------------------------------------------------

rocksdb::Status Store::GetSimilaritySource(std::string_view source_key,
                                           SimilaritySourceMeta* out) const {
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  std::string raw;
  rocksdb::Status s = db_->Get(rocksdb::ReadOptions(), sim_sources_cf_, ToSlice(source_key), &raw);
  if (!s.ok()) return s;

  uint64_t computed_at = 0;
  if (raw.size() != 16 ||
      !internal::DecodeU64LE(std::string_view(raw).substr(0, 8), &computed_at) ||
      !internal::DecodeU64LE(std::string_view(raw).substr(8, 8), &out->count)) {
    return rocksdb::Status::Corruption("similarity source meta");
  }
  out->computed_at = static_cast<int64_t>(computed_at);
  return rocksdb::Status::OK();
}

rocksdb::Status Store::ReadSimilarItems(std::string_view source_key,
                                        size_t limit,
                                        std::vector<SimilarItem>* out) const {
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  out->clear();

  const std::string prefix = SimilarityPrefix(source_key);

  const rocksdb::Snapshot* snapshot = db_->GetSnapshot();
  rocksdb::ReadOptions ro;
  ro.snapshot = snapshot;

  rocksdb::Status result;
  {
    std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(ro, sim_items_cf_));
    for (it->Seek(prefix); it->Valid() && it->key().starts_with(prefix); it->Next()) {
      if (limit != 0 && out->size() >= limit) break;
      SimilarItem item;
      uint32_t rank = 0;
      if (!internal::DecodeU32BE(ToView(it->key()).substr(prefix.size()), &rank) ||
          !DecodeSimilarItemValue(ToView(it->value()), &item)) {
        result = rocksdb::Status::Corruption("similarity item");
        break;
      }
      item.rank = rank;
      out->push_back(std::move(item));
    }
    if (result.ok()) result = it->status();
  }

  db_->ReleaseSnapshot(snapshot);
  return result;
}

rocksdb::Status Store::ReplaceSimilarItems(std::string_view source_key,
                                           const std::vector<SimilarItem>& items,
                                           int64_t computed_at) {
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");
  if (source_key.empty()) return rocksdb::Status::InvalidArgument("source_key is empty");

  const std::string prefix = SimilarityPrefix(source_key);
  rocksdb::ReadOptions ro;

  rocksdb::Status s = RunTransaction(db_, opt_, "peerrec.similarity.write_retry_total",
                                     [&](rocksdb::Transaction* txn) -> rocksdb::Status {
    // Locks the source row so concurrent replaces serialize.
    std::string existing;
    rocksdb::Status gs = txn->GetForUpdate(ro, sim_sources_cf_, ToSlice(source_key), &existing);
    if (!gs.ok() && !gs.IsNotFound()) return gs;

    std::vector<std::string> stale;
    {
      std::unique_ptr<rocksdb::Iterator> it(txn->GetIterator(ro, sim_items_cf_));
      for (it->Seek(prefix); it->Valid() && it->key().starts_with(prefix); it->Next()) {
        stale.emplace_back(it->key().data(), it->key().size());
      }
      if (!it->status().ok()) return it->status();
    }
    for (const auto& key : stale) {
      rocksdb::Status ds = txn->Delete(sim_items_cf_, key);
      if (!ds.ok()) return ds;
    }

    for (size_t i = 0; i < items.size(); ++i) {
      rocksdb::Status ps = txn->Put(sim_items_cf_,
                                    SimilarityItemKey(source_key, static_cast<uint32_t>(i + 1)),
                                    EncodeSimilarItemValue(items[i]));
      if (!ps.ok()) return ps;
    }

    std::string meta = internal::EncodeU64LE(static_cast<uint64_t>(computed_at));
    meta.append(internal::EncodeU64LE(items.size()));
    return txn->Put(sim_sources_cf_, ToSlice(source_key), meta);
  });

  if (s.ok()) {
    EmitCounter(opt_, "peerrec.similarity.write_total", 1);
    EmitHistogram(opt_, "peerrec.similarity.write_items", items.size());
  }
  return s;
}

// ---------------------------------------------------------------------------
// Moderation
// ---------------------------------------------------------------------------

rocksdb::Status Store::AddDeniedHost(std::string_view host) {
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");
  std::string normalized;
  if (!NormalizeHost(host, &normalized)) {
    return rocksdb::Status::InvalidArgument("Invalid host: " + std::string(host));
  }

  std::lock_guard<std::mutex> lock(catalog_mu_);
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");
  return db_->Put(rocksdb::WriteOptions(), moderation_cf_,
                  std::string(kDeniedHostPrefix) + normalized, rocksdb::Slice());
}

rocksdb::Status Store::RemoveDeniedHost(std::string_view host) {
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");
  std::string normalized;
  if (!NormalizeHost(host, &normalized)) {
    return rocksdb::Status::InvalidArgument("Invalid host: " + std::string(host));
  }

  std::lock_guard<std::mutex> lock(catalog_mu_);
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");
  return db_->Delete(rocksdb::WriteOptions(), moderation_cf_,
                     std::string(kDeniedHostPrefix) + normalized);
}

rocksdb::Status Store::AddBlockedChannel(std::string_view channel_id, std::string_view host) {
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");
  const std::string channel = internal::TrimWhitespace(channel_id);
  if (channel.empty()) return rocksdb::Status::InvalidArgument("channel_id is required");
  std::string normalized;
  if (!NormalizeHost(host, &normalized)) {
    return rocksdb::Status::InvalidArgument("Invalid host: " + std::string(host));
  }

  std::lock_guard<std::mutex> lock(catalog_mu_);
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");
  return db_->Put(rocksdb::WriteOptions(), moderation_cf_,
                  BlockedChannelKey(channel, normalized), rocksdb::Slice());
}

rocksdb::Status Store::RemoveBlockedChannel(std::string_view channel_id, std::string_view host) {
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");
  const std::string channel = internal::TrimWhitespace(channel_id);
  std::string normalized;
  if (channel.empty() || !NormalizeHost(host, &normalized)) {
    return rocksdb::Status::InvalidArgument("channel_id and a valid host are required");
  }

  std::lock_guard<std::mutex> lock(catalog_mu_);
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");
  return db_->Delete(rocksdb::WriteOptions(), moderation_cf_,
                     BlockedChannelKey(channel, normalized));
}

rocksdb::Status Store::LoadModerationLists(ModerationLists* out) const {
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  out->denied_hosts.clear();
  out->blocked_channels.clear();

  std::lock_guard<std::mutex> lock(catalog_mu_);
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");

  const std::string_view host_prefix(kDeniedHostPrefix);
  const std::string_view channel_prefix(kBlockedChannelPrefix);

  std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(rocksdb::ReadOptions(), moderation_cf_));
  for (it->SeekToFirst(); it->Valid(); it->Next()) {
    std::string_view key = ToView(it->key());
    if (key.substr(0, host_prefix.size()) == host_prefix) {
      out->denied_hosts.emplace(key.substr(host_prefix.size()));
    } else if (key.substr(0, channel_prefix.size()) == channel_prefix) {
      std::string_view rest = key.substr(channel_prefix.size());
      size_t sep = rest.find('\0');
      if (sep == std::string_view::npos) continue;
      out->blocked_channels.emplace(std::string(rest.substr(0, sep)),
                                    std::string(rest.substr(sep + 1)));
    }
  }
  return it->status();
}

// ---------------------------------------------------------------------------
// Interaction events
// ---------------------------------------------------------------------------

rocksdb::Status Store::IngestEvent(const InteractionEvent& event, bool* duplicate) {
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");
  if (!duplicate) return rocksdb::Status::InvalidArgument("duplicate is null");
  if (event.event_id.empty()) return rocksdb::Status::InvalidArgument("Missing event_id");

  const std::string event_key = EventKey(event.event_id);
  const std::string signal_key = LikeKey(event.video_uuid, event.instance_domain);
  rocksdb::ReadOptions ro;

  std::lock_guard<std::mutex> lock(catalog_mu_);
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");

  std::unique_ptr<TraceSpan> span;
  if (opt_.tracer) span = opt_.tracer->StartSpan("peerrec.IngestEvent");
  SpanAttr(span.get(), "event_type", EventTypeName(event.type));

  rocksdb::Status s = RunTransaction(db_, opt_, "peerrec.events.retry_total",
                                     [&](rocksdb::Transaction* txn) -> rocksdb::Status {
    *duplicate = false;

    std::string existing;
    rocksdb::Status gs = txn->GetForUpdate(ro, events_cf_, event_key, &existing);
    if (gs.ok()) {
      *duplicate = true;
      return rocksdb::Status::OK();
    }
    if (!gs.IsNotFound()) return gs;

    rocksdb::Status ps = txn->Put(events_cf_, event_key, event.Serialize());
    if (!ps.ok()) return ps;

    InteractionSignals signals;
    std::string raw;
    gs = txn->GetForUpdate(ro, signals_cf_, signal_key, &raw);
    if (gs.ok()) {
      if (!InteractionSignals::Deserialize(raw, &signals)) {
        return rocksdb::Status::Corruption("interaction signals for " + signal_key);
      }
    } else if (!gs.IsNotFound()) {
      return gs;
    }

    signals.Apply(event.type, event.ingested_at);
    return txn->Put(signals_cf_, signal_key, signals.Serialize());
  });

  if (s.ok()) {
    EmitCounter(opt_, *duplicate ? "peerrec.events.duplicate_total"
                                 : "peerrec.events.ingested_total", 1);
  } else {
    EmitCounter(opt_, "peerrec.events.error_total", 1);
  }
  if (span) {
    SpanAttr(span.get(), "duplicate", static_cast<uint64_t>(*duplicate ? 1 : 0));
    SpanAttr(span.get(), "status", StatusKind(s));
    span->End(s);
  }
  return s;
}

rocksdb::Status Store::GetSignals(std::string_view video_uuid,
                                  std::string_view instance_domain,
                                  InteractionSignals* out) const {
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  std::lock_guard<std::mutex> lock(catalog_mu_);
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");

  std::string raw;
  rocksdb::Status s = db_->Get(rocksdb::ReadOptions(), signals_cf_,
                               LikeKey(video_uuid, instance_domain), &raw);
  if (!s.ok()) return s;
  if (!InteractionSignals::Deserialize(raw, out)) {
    return rocksdb::Status::Corruption("interaction signals");
  }
  return rocksdb::Status::OK();
}

void Store::EmitCacheMetrics() {
  if (!opt_.metrics) return;

  if (block_cache_) {
    size_t usage = block_cache_->GetUsage();
    size_t capacity = block_cache_->GetCapacity();
    double fill_ratio = capacity > 0 ? static_cast<double>(usage) / capacity : 0.0;

    EmitGauge(opt_, "peerrec.cache.fill_ratio", fill_ratio);
    EmitGauge(opt_, "peerrec.cache.usage_bytes", static_cast<double>(usage));
    EmitGauge(opt_, "peerrec.cache.capacity_bytes", static_cast<double>(capacity));
  }

  if (statistics_) {
    uint64_t hits = statistics_->getTickerCount(rocksdb::BLOCK_CACHE_HIT);
    uint64_t misses = statistics_->getTickerCount(rocksdb::BLOCK_CACHE_MISS);

    // Emit deltas since last call
    if (hits >= last_cache_hits_) {
      EmitCounter(opt_, "peerrec.cache.hit_total", hits - last_cache_hits_);
    }
    if (misses >= last_cache_misses_) {
      EmitCounter(opt_, "peerrec.cache.miss_total", misses - last_cache_misses_);
    }

    last_cache_hits_ = hits;
    last_cache_misses_ = misses;
  }
}

}  // namespace peerrec
