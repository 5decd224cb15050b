#include <peerrec/events.hpp>

#include <peerrec/internal.hpp>

#include <algorithm>

namespace peerrec {

const char* EventTypeName(EventType type) {
  switch (type) {
    case EventType::kLike:
      return "Like";
    case EventType::kUndoLike:
      return "UndoLike";
    case EventType::kComment:
      return "Comment";
  }
  return "Like";
}

bool ParseEventType(std::string_view name, EventType* out) {
  if (name == "Like") {
    *out = EventType::kLike;
  } else if (name == "UndoLike") {
    *out = EventType::kUndoLike;
  } else if (name == "Comment") {
    *out = EventType::kComment;
  } else {
    return false;
  }
  return true;
}

rocksdb::Status NormalizeEvent(const RawEventFields& raw,
                               int64_t now_ms,
                               InteractionEvent* out) {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  InteractionEvent event;
  event.event_id = internal::TrimWhitespace(raw.event_id);
  if (event.event_id.empty()) {
    return rocksdb::Status::InvalidArgument("Missing event_id");
  }
  if (!ParseEventType(internal::TrimWhitespace(raw.event_type), &event.type)) {
    return rocksdb::Status::InvalidArgument("Unsupported event_type");
  }
  if (!raw.has_object) {
    return rocksdb::Status::InvalidArgument("Missing object");
  }

  event.video_uuid = internal::TrimWhitespace(raw.video_uuid);
  event.instance_domain = internal::TrimWhitespace(raw.instance_domain);
  if (event.video_uuid.empty()) {
    return rocksdb::Status::InvalidArgument("Missing object.video_uuid");
  }
  if (event.instance_domain.empty()) {
    return rocksdb::Status::InvalidArgument("Missing object.instance_domain");
  }

  event.actor_id = internal::TrimWhitespace(raw.actor_id);
  event.canonical_url = internal::TrimWhitespace(raw.canonical_url);
  event.source_instance = internal::TrimWhitespace(raw.source_instance);
  event.published_at = raw.has_published_at ? raw.published_at : now_ms;
  event.raw_payload_json = raw.raw_payload_json.empty() ? "{}" : raw.raw_payload_json;
  event.ingested_at = now_ms;

  *out = std::move(event);
  return rocksdb::Status::OK();
}

// ---------------------------------------------------------------------------
// Serialization
// ---------------------------------------------------------------------------

std::string InteractionEvent::Serialize() const {
  internal::RecordWriter w;
  w.PutString(event_id);
  w.PutString(EventTypeName(type));
  w.PutString(actor_id);
  w.PutString(video_uuid);
  w.PutString(instance_domain);
  w.PutString(canonical_url);
  w.PutString(source_instance);
  w.PutI64(published_at);
  w.PutString(raw_payload_json);
  w.PutI64(ingested_at);
  return w.Release();
}

bool InteractionEvent::Deserialize(std::string_view data, InteractionEvent* out) {
  if (!out) return false;
  internal::RecordReader r(data);
  InteractionEvent e;
  std::string type_name;
  bool ok = r.GetString(&e.event_id) &&
            r.GetString(&type_name) &&
            r.GetString(&e.actor_id) &&
            r.GetString(&e.video_uuid) &&
            r.GetString(&e.instance_domain) &&
            r.GetString(&e.canonical_url) &&
            r.GetString(&e.source_instance) &&
            r.GetI64(&e.published_at) &&
            r.GetString(&e.raw_payload_json) &&
            r.GetI64(&e.ingested_at);
  if (!ok || !r.AtEnd()) return false;
  if (!ParseEventType(type_name, &e.type)) return false;
  *out = std::move(e);
  return true;
}

void InteractionSignals::Apply(EventType type, int64_t now_ms) {
  switch (type) {
    case EventType::kLike:
      likes_count += 1;
      signal_score += 1.0;
      break;
    case EventType::kUndoLike:
      likes_count -= 1;
      undo_likes_count += 1;
      signal_score -= 1.0;
      break;
    case EventType::kComment:
      comments_count += 1;
      signal_score += 0.25;
      break;
  }
  likes_count = std::max<int64_t>(0, likes_count);
  undo_likes_count = std::max<int64_t>(0, undo_likes_count);
  comments_count = std::max<int64_t>(0, comments_count);
  signal_score = std::max(0.0, signal_score);
  updated_at = now_ms;
}

int64_t InteractionSignals::NetLikes() const {
  return std::max<int64_t>(0, likes_count - undo_likes_count);
}

std::string InteractionSignals::Serialize() const {
  internal::RecordWriter w;
  w.PutI64(likes_count);
  w.PutI64(undo_likes_count);
  w.PutI64(comments_count);
  w.PutDouble(signal_score);
  w.PutI64(updated_at);
  return w.Release();
}

bool InteractionSignals::Deserialize(std::string_view data, InteractionSignals* out) {
  if (!out) return false;
  internal::RecordReader r(data);
  InteractionSignals s;
  bool ok = r.GetI64(&s.likes_count) &&
            r.GetI64(&s.undo_likes_count) &&
            r.GetI64(&s.comments_count) &&
            r.GetDouble(&s.signal_score) &&
            r.GetI64(&s.updated_at);
  if (!ok || !r.AtEnd()) return false;
  *out = s;
  return true;
}

}  // namespace peerrec
