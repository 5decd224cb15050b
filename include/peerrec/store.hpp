#pragma once

#include <peerrec/events.hpp>
#include <peerrec/moderation.hpp>
#include <peerrec/random.hpp>
#include <peerrec/types.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <rocksdb/cache.h>
#include <rocksdb/options.h>
#include <rocksdb/statistics.h>
#include <rocksdb/status.h>
#include <rocksdb/slice.h>
#include <rocksdb/utilities/transaction_db.h>

namespace peerrec {

/** A minimal metrics sink interface (counters + histograms + gauges). */
struct MetricsSink {
  virtual ~MetricsSink() = default;

  /** Monotonic counters (e.g., calls, cache hits, fallbacks). */
  virtual void Counter(std::string_view name, uint64_t delta) = 0;

  /** Histograms (e.g., latency in microseconds, pool sizes). */
  virtual void Histogram(std::string_view name, uint64_t value) = 0;

  /** Gauges for point-in-time values. Default implementation does nothing. */
  virtual void Gauge(std::string_view name, double value) { (void)name; (void)value; }
};

/** A trace span interface (very small surface area). */
struct TraceSpan {
  virtual ~TraceSpan() = default;

  virtual void SetAttribute(std::string_view key, uint64_t value) = 0;
  virtual void SetAttribute(std::string_view key, std::string_view value) = 0;
  virtual void AddEvent(std::string_view name) = 0;

  /** Must be called exactly once to finish the span. */
  virtual void End(const rocksdb::Status& status) = 0;
};

/** A tracer creates spans. If unset, tracing is disabled. */
struct Tracer {
  virtual ~Tracer() = default;
  virtual std::unique_ptr<TraceSpan> StartSpan(std::string_view name) = 0;
};

/**
 * Options for the peerrec catalog store.
 *
 * These are layered on top of RocksDB's Options/TransactionDBOptions. The store
 * creates its own column families and uses RocksDB TransactionDB for atomic
 * multi-key updates.
 */
struct Options {
  // RocksDB performance knobs
  size_t block_cache_bytes = 256ull * 1024ull * 1024ull;
  int bloom_bits_per_key = 10;

  // Transaction behavior
  int lock_timeout_ms = 2000;
  int max_retries = 16;

  // Rows whose error_count reaches this value are hidden from batch reads
  // and random/popular pools (0 = disabled).
  int64_t video_error_threshold = 3;

  // Most recent likes retained per user; older ones are dropped on insert.
  size_t max_likes_per_user = 100;

  // Observability hooks (optional)
  std::shared_ptr<MetricsSink> metrics;
  std::shared_ptr<Tracer> tracer;
};

/** Random cache population settings. */
struct RandomCacheSettings {
  uint64_t size = 500000;
  bool refresh = false;
  // When false, caps are ignored and a contiguous rowid window is sampled.
  bool filtered_mode = true;
  int max_per_instance = 0;  // 0 = unlimited
  int max_per_author = 100;  // 0 = unlimited
};

/** Bookkeeping row of one cached similarity set. */
struct SimilaritySourceMeta {
  int64_t computed_at = 0;
  uint64_t count = 0;
};

/** Which identity a seed lookup tries first. */
enum class LookupOrder {
  kUuidFirst,  // endpoint lookups: uuid (+host), then video_id (+host)
  kIdFirst     // like resolution: video_id (+host), then uuid (+host)
};

/**
 * peerrec::Store
 *
 * RocksDB-backed catalog for the recommendation engine:
 *  - video metadata, embeddings and secondary indexes (uuid, recency, popularity)
 *  - per-user likes
 *  - the persisted similarity cache
 *  - the random rowid cache
 *  - moderation lists
 *  - idempotent interaction events and their aggregated signals
 *
 * Catalog operations serialize on one mutex and likes operations on another.
 * No method holds both. Similarity cache operations rely on RocksDB
 * transactions only (last writer wins).
 */
class Store {
 public:
  ~Store();

  Store(const Store&) = delete;
  Store& operator=(const Store&) = delete;

  /**
   * Open or create a peerrec store at db_path.
   *
   * Column families:
   * - peerrec_videos, peerrec_embeddings, peerrec_rowids, peerrec_uuid_index
   * - peerrec_recent_index, peerrec_popularity_index
   * - peerrec_likes
   * - peerrec_similarity_sources, peerrec_similarity_items
   * - peerrec_random_rowids
   * - peerrec_moderation
   * - peerrec_events, peerrec_signals
   */
  static rocksdb::Status Open(const std::string& db_path,
                              std::unique_ptr<Store>* out,
                              const Options& opt = Options{});

  /** Close the store and release RocksDB resources. Safe to call multiple times. */
  void Close();

  const Options& options() const { return opt_; }

  // ---------------------------------------------------------------------------
  // Catalog
  // ---------------------------------------------------------------------------

  /**
   * Insert or replace a video and its embedding.
   * Assigns a rowid on first insert (record.rowid is ignored) and keeps the
   * uuid, recency and popularity indexes in sync. The first non-empty
   * embedding fixes the deployment dimension; later mismatches are rejected.
   * @param assigned_rowid Optional output: the row's rowid
   */
  rocksdb::Status PutVideo(const VideoRecord& record,
                           const std::vector<float>& embedding,
                           uint64_t* assigned_rowid = nullptr);

  /** Get one video by natural key. Ignores the error threshold. */
  rocksdb::Status GetVideo(std::string_view video_id,
                           std::string_view instance_domain,
                           VideoRecord* out) const;

  /**
   * Resolve a video from any of video_id / uuid, optionally pinned to a host.
   * Empty arguments are skipped. NotFound when nothing matches.
   */
  rocksdb::Status FindVideo(std::string_view video_id,
                            std::string_view uuid,
                            std::string_view host,
                            LookupOrder order,
                            VideoRecord* out) const;

  /**
   * Resolve a seed (video plus embedding). NotFound when the video is
   * missing, its embedding is empty, or its dimension differs from the
   * deployment dimension.
   */
  rocksdb::Status FindSeed(std::string_view video_id,
                           std::string_view uuid,
                           std::string_view host,
                           LookupOrder order,
                           SeedVideo* out) const;

  /** Batch fetch by identity, keyed by LikeKey. Applies the error threshold. */
  rocksdb::Status GetVideosByKeys(const std::vector<VideoIdentity>& ids,
                                  std::unordered_map<std::string, VideoRecord>* out) const;

  /** Batch fetch by rowid, in input order, skipping misses. Applies the error threshold. */
  rocksdb::Status GetVideosByRowids(const std::vector<uint64_t>& rowids,
                                    std::vector<VideoRecord>* out) const;

  /** Batch fetch embeddings keyed by LikeKey; identities without one are omitted. */
  rocksdb::Status GetEmbeddings(const std::vector<VideoIdentity>& ids,
                                std::unordered_map<std::string, std::vector<float>>* out) const;

  /**
   * Visit every stored embedding in rowid order. Return false from fn to stop.
   * Runs under a snapshot without holding the catalog lock.
   */
  rocksdb::Status ForEachEmbedding(
      const std::function<bool(uint64_t rowid, const std::vector<float>& embedding)>& fn) const;

  /** Raw random pool: a wrapped rowid window from a random start, shuffled. */
  rocksdb::Status SampleRandomVideos(size_t limit, Random* rng,
                                     std::vector<VideoRecord>* out) const;

  /** Highest popularity first. Rows without a score are not indexed. */
  rocksdb::Status FetchPopularVideos(size_t limit, std::vector<VideoRecord>* out) const;

  /** Most recently published first. */
  rocksdb::Status FetchRecentVideos(size_t limit, std::vector<VideoRecord>* out) const;

  /** Exact number of videos (O(N) scan). */
  rocksdb::Status CountVideos(uint64_t* out) const;

  /** Approximate number of embeddings (O(1)). */
  rocksdb::Status CountEmbeddingsApprox(uint64_t* out) const;

  /** Deployment embedding dimension; 0 before the first embedding is stored. */
  rocksdb::Status EmbeddingDimension(uint32_t* out) const;

  // ---------------------------------------------------------------------------
  // Popularity
  // ---------------------------------------------------------------------------

  /**
   * Recompute popularity scores. With incremental=true only rows without a
   * score (or with score 0) are touched. Likes include net like signals.
   */
  rocksdb::Status RecomputePopularity(bool incremental,
                                      double like_weight,
                                      int64_t now_ms,
                                      uint64_t* updated);

  // ---------------------------------------------------------------------------
  // Random cache
  // ---------------------------------------------------------------------------

  /**
   * Fill the random rowid cache. Keeps an existing cache of sufficient size
   * unless settings.refresh is set.
   * @param count Output: number of cached rowids
   */
  rocksdb::Status PopulateRandomCache(const RandomCacheSettings& settings,
                                      Random* rng,
                                      uint64_t* count);

  /** A random contiguous window of cached rowids, resolved to videos. */
  rocksdb::Status FetchRandomCachedVideos(size_t limit, Random* rng,
                                          std::vector<VideoRecord>* out) const;

  rocksdb::Status RandomCacheSize(uint64_t* out) const;

  // ---------------------------------------------------------------------------
  // Likes
  // ---------------------------------------------------------------------------

  /** Record a like; re-liking moves the video to the front. */
  rocksdb::Status AddLike(std::string_view user_id, const LikeEntry& like);

  rocksdb::Status RemoveLike(std::string_view user_id, const VideoIdentity& id);

  /** Up to limit likes, most recent first. Unknown users yield an empty list. */
  rocksdb::Status FetchRecentLikes(std::string_view user_id,
                                   size_t limit,
                                   std::vector<LikeEntry>* out) const;

  rocksdb::Status CountLikes(std::string_view user_id, uint64_t* out) const;

  // ---------------------------------------------------------------------------
  // Similarity cache
  // ---------------------------------------------------------------------------

  /** NotFound when no set is cached for source_key. */
  rocksdb::Status GetSimilaritySource(std::string_view source_key,
                                      SimilaritySourceMeta* out) const;

  /** Cached items in rank order, at most limit (0 = all). */
  rocksdb::Status ReadSimilarItems(std::string_view source_key,
                                   size_t limit,
                                   std::vector<SimilarItem>* out) const;

  /**
   * Replace the cached set for source_key in one transaction.
   * Ranks are rewritten as 1..N in item order.
   */
  rocksdb::Status ReplaceSimilarItems(std::string_view source_key,
                                      const std::vector<SimilarItem>& items,
                                      int64_t computed_at);

  // ---------------------------------------------------------------------------
  // Moderation
  // ---------------------------------------------------------------------------

  rocksdb::Status AddDeniedHost(std::string_view host);
  rocksdb::Status RemoveDeniedHost(std::string_view host);
  rocksdb::Status AddBlockedChannel(std::string_view channel_id, std::string_view host);
  rocksdb::Status RemoveBlockedChannel(std::string_view channel_id, std::string_view host);
  rocksdb::Status LoadModerationLists(ModerationLists* out) const;

  // ---------------------------------------------------------------------------
  // Interaction events
  // ---------------------------------------------------------------------------

  /**
   * Store one validated event and update its signals. A repeated event_id
   * changes nothing and reports duplicate=true.
   */
  rocksdb::Status IngestEvent(const InteractionEvent& event, bool* duplicate);

  /** NotFound when no event touched (video_uuid, instance_domain). */
  rocksdb::Status GetSignals(std::string_view video_uuid,
                             std::string_view instance_domain,
                             InteractionSignals* out) const;

  /** Emit block cache statistics to the metrics sink. */
  void EmitCacheMetrics();

 private:
  explicit Store(const Options& opt);

  rocksdb::Status GetVideoLocked(std::string_view key, VideoRecord* out) const;
  rocksdb::Status GetEmbeddingLocked(std::string_view key, std::vector<float>* out) const;
  rocksdb::Status FindVideoLocked(std::string_view video_id,
                                  std::string_view uuid,
                                  std::string_view host,
                                  LookupOrder order,
                                  VideoRecord* out) const;
  rocksdb::Status ResolveRowidsLocked(const std::vector<uint64_t>& rowids,
                                      std::vector<VideoRecord>* out) const;
  rocksdb::Status CollectIndexLocked(rocksdb::ColumnFamilyHandle* index_cf,
                                     size_t limit,
                                     std::vector<VideoRecord>* out) const;
  rocksdb::Status ReadU64Locked(std::string_view key, uint64_t* out) const;
  bool PassesErrorThreshold(const VideoRecord& record) const;

  Options opt_;

  rocksdb::TransactionDB* db_ = nullptr;
  std::vector<rocksdb::ColumnFamilyHandle*> handles_;

  std::shared_ptr<rocksdb::Cache> block_cache_;
  std::shared_ptr<rocksdb::Statistics> statistics_;
  uint64_t last_cache_hits_ = 0;
  uint64_t last_cache_misses_ = 0;

  rocksdb::ColumnFamilyHandle* default_cf_ = nullptr;
  rocksdb::ColumnFamilyHandle* videos_cf_ = nullptr;
  rocksdb::ColumnFamilyHandle* embeddings_cf_ = nullptr;
  rocksdb::ColumnFamilyHandle* rowids_cf_ = nullptr;
  rocksdb::ColumnFamilyHandle* uuid_cf_ = nullptr;
  rocksdb::ColumnFamilyHandle* recent_cf_ = nullptr;
  rocksdb::ColumnFamilyHandle* popularity_cf_ = nullptr;
  rocksdb::ColumnFamilyHandle* likes_cf_ = nullptr;
  rocksdb::ColumnFamilyHandle* sim_sources_cf_ = nullptr;
  rocksdb::ColumnFamilyHandle* sim_items_cf_ = nullptr;
  rocksdb::ColumnFamilyHandle* random_cf_ = nullptr;
  rocksdb::ColumnFamilyHandle* moderation_cf_ = nullptr;
  rocksdb::ColumnFamilyHandle* events_cf_ = nullptr;
  rocksdb::ColumnFamilyHandle* signals_cf_ = nullptr;

  // Metadata/content domain: videos, embeddings, indexes, random cache,
  // popularity, moderation, events.
  mutable std::mutex catalog_mu_;
  // Per-user likes domain.
  mutable std::mutex likes_mu_;
};

}  // namespace peerrec
