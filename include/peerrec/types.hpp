#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace peerrec {

/** Natural key of a video: (video_id, instance_domain). */
struct VideoIdentity {
  std::string video_id;
  std::string instance_domain;

  bool operator==(const VideoIdentity& other) const {
    return video_id == other.video_id && instance_domain == other.instance_domain;
  }
};

/** Identity key "video_id::instance_domain" used for dedup and storage. */
inline std::string LikeKey(std::string_view video_id, std::string_view instance_domain) {
  std::string key;
  key.reserve(video_id.size() + 2 + instance_domain.size());
  key.append(video_id.data(), video_id.size());
  key.append("::");
  key.append(instance_domain.data(), instance_domain.size());
  return key;
}

inline std::string LikeKey(const VideoIdentity& id) {
  return LikeKey(id.video_id, id.instance_domain);
}

/** Author key "channel_id::instance_domain"; empty when channel_id is empty. */
inline std::string AuthorKey(std::string_view channel_id, std::string_view instance_domain) {
  if (channel_id.empty()) return {};
  return LikeKey(channel_id, instance_domain);
}

/**
 * Catalog row for one video. Timestamps are milliseconds since epoch;
 * 0 means unknown.
 */
struct VideoRecord {
  uint64_t rowid = 0;  // ANN label, assigned by the store

  std::string video_id;
  std::string video_uuid;
  int64_t video_numeric_id = 0;
  std::string instance_domain;

  std::string channel_id;
  std::string channel_name;
  std::string channel_url;
  std::string channel_display_name;
  std::string channel_avatar_url;
  std::string account_name;
  std::string account_url;

  std::string title;
  std::string description;
  std::string tags_json;
  std::string category;
  int64_t published_at = 0;
  std::string video_url;
  int64_t duration = 0;
  std::string thumbnail_url;
  std::string embed_path;
  std::string preview_path;

  int64_t views = 0;
  int64_t likes = 0;
  int64_t dislikes = 0;
  int64_t comments_count = 0;
  bool nsfw = false;
  int64_t last_checked_at = 0;
  int64_t error_count = 0;

  double popularity = 0.0;
  bool has_popularity = false;

  uint32_t embedding_dim = 0;
  std::string model_name;

  std::string Key() const { return LikeKey(video_id, instance_domain); }
  std::string Author() const { return AuthorKey(channel_id, instance_domain); }
  VideoIdentity Identity() const { return {video_id, instance_domain}; }

  std::string Serialize() const;
  static bool Deserialize(std::string_view data, VideoRecord* out);
};

/** One recorded like, most recent first when listed. */
struct LikeEntry {
  std::string video_id;
  std::string instance_domain;
  std::string video_uuid;
  int64_t created_at = 0;

  std::string Key() const { return LikeKey(video_id, instance_domain); }
};

/** A resolved seed video: catalog row plus its embedding. */
struct SeedVideo {
  VideoRecord video;
  std::vector<float> embedding;
};

/** One neighbour in an ANN answer or a cached similarity set. */
struct SimilarItem {
  std::string video_id;
  std::string instance_domain;
  double score = 0.0;
  uint32_t rank = 0;  // 1-based

  std::string Key() const { return LikeKey(video_id, instance_domain); }
};

/** Per-candidate diagnostics attached to debug responses. */
struct CandidateDebug {
  std::string layer;
  std::string profile;
  double freshness_score = 0.0;
  double popularity_score = 0.0;
  int rank_before = 0;
  int rank_after = 0;

  bool has_pool_bounds = false;
  double pool_min = 0.0;
  double pool_max = 0.0;

  bool has_explore_stats = false;
  double explore_min = 0.0;
  double explore_max = 0.0;
  bool explore_empty = false;
  int explore_pool_size = 0;
  int explore_in_range = 0;
  int exploit_pool_size = 0;
  int exploit_in_range = 0;
};

/** A candidate under consideration within one request. */
struct CandidateRow {
  VideoRecord video;

  // Ranking score. ANN neighbours start with their similarity.
  double score = 0.0;
  bool has_score = false;

  double similarity_score = 0.0;
  bool has_similarity = false;

  CandidateDebug debug;

  std::string Key() const { return video.Key(); }
};

}  // namespace peerrec
