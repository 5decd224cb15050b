#include <peerrec/types.hpp>

#include <peerrec/internal.hpp>

namespace peerrec {

namespace {

// Bump when fields are appended; older values decode with defaults.
constexpr uint64_t kVideoRecordVersion = 1;

}  // namespace

// Serialization format:
//   [version:8 LE][rowid:8 LE] followed by the fields in declaration order,
//   strings length-prefixed, integers and doubles 8 bytes LE, bools 1 byte.
std::string VideoRecord::Serialize() const {
  internal::RecordWriter w;
  w.PutU64(kVideoRecordVersion);
  w.PutU64(rowid);

  w.PutString(video_id);
  w.PutString(video_uuid);
  w.PutI64(video_numeric_id);
  w.PutString(instance_domain);

  w.PutString(channel_id);
  w.PutString(channel_name);
  w.PutString(channel_url);
  w.PutString(channel_display_name);
  w.PutString(channel_avatar_url);
  w.PutString(account_name);
  w.PutString(account_url);

  w.PutString(title);
  w.PutString(description);
  w.PutString(tags_json);
  w.PutString(category);
  w.PutI64(published_at);
  w.PutString(video_url);
  w.PutI64(duration);
  w.PutString(thumbnail_url);
  w.PutString(embed_path);
  w.PutString(preview_path);

  w.PutI64(views);
  w.PutI64(likes);
  w.PutI64(dislikes);
  w.PutI64(comments_count);
  w.PutBool(nsfw);
  w.PutI64(last_checked_at);
  w.PutI64(error_count);

  w.PutDouble(popularity);
  w.PutBool(has_popularity);

  w.PutU64(embedding_dim);
  w.PutString(model_name);
  return w.Release();
}

bool VideoRecord::Deserialize(std::string_view data, VideoRecord* out) {
  if (!out) return false;
  internal::RecordReader r(data);

  uint64_t version = 0;
  if (!r.GetU64(&version) || version == 0 || version > kVideoRecordVersion) return false;

  VideoRecord v;
  uint64_t dim = 0;
  bool ok = r.GetU64(&v.rowid) &&
            r.GetString(&v.video_id) &&
            r.GetString(&v.video_uuid) &&
            r.GetI64(&v.video_numeric_id) &&
            r.GetString(&v.instance_domain) &&
            r.GetString(&v.channel_id) &&
            r.GetString(&v.channel_name) &&
            r.GetString(&v.channel_url) &&
            r.GetString(&v.channel_display_name) &&
            r.GetString(&v.channel_avatar_url) &&
            r.GetString(&v.account_name) &&
            r.GetString(&v.account_url) &&
            r.GetString(&v.title) &&
            r.GetString(&v.description) &&
            r.GetString(&v.tags_json) &&
            r.GetString(&v.category) &&
            r.GetI64(&v.published_at) &&
            r.GetString(&v.video_url) &&
            r.GetI64(&v.duration) &&
            r.GetString(&v.thumbnail_url) &&
            r.GetString(&v.embed_path) &&
            r.GetString(&v.preview_path) &&
            r.GetI64(&v.views) &&
            r.GetI64(&v.likes) &&
            r.GetI64(&v.dislikes) &&
            r.GetI64(&v.comments_count) &&
            r.GetBool(&v.nsfw) &&
            r.GetI64(&v.last_checked_at) &&
            r.GetI64(&v.error_count) &&
            r.GetDouble(&v.popularity) &&
            r.GetBool(&v.has_popularity) &&
            r.GetU64(&dim) &&
            r.GetString(&v.model_name);
  if (!ok || !r.AtEnd()) return false;

  v.embedding_dim = static_cast<uint32_t>(dim);
  *out = std::move(v);
  return true;
}

}  // namespace peerrec
