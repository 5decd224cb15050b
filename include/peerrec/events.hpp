#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <rocksdb/status.h>

namespace peerrec {

/** Interaction types accepted from the federation bridge. */
enum class EventType {
  kLike,
  kUndoLike,
  kComment
};

const char* EventTypeName(EventType type);
bool ParseEventType(std::string_view name, EventType* out);

/**
 * Event fields as extracted from a request body, before validation.
 * Strings are untrimmed; has_* flags record presence of non-string fields.
 */
struct RawEventFields {
  std::string event_id;
  std::string event_type;
  std::string actor_id;
  bool has_object = false;
  std::string video_uuid;
  std::string instance_domain;
  std::string canonical_url;
  std::string source_instance;
  bool has_published_at = false;
  int64_t published_at = 0;
  std::string raw_payload_json;  // "{}" when absent or not an object
};

/** A validated interaction event. */
struct InteractionEvent {
  std::string event_id;
  EventType type = EventType::kLike;
  std::string actor_id;
  std::string video_uuid;
  std::string instance_domain;
  std::string canonical_url;
  std::string source_instance;
  int64_t published_at = 0;
  std::string raw_payload_json;
  int64_t ingested_at = 0;

  std::string Serialize() const;
  static bool Deserialize(std::string_view data, InteractionEvent* out);
};

/** Aggregated counters per (video_uuid, instance_domain). Never negative. */
struct InteractionSignals {
  int64_t likes_count = 0;
  int64_t undo_likes_count = 0;
  int64_t comments_count = 0;
  double signal_score = 0.0;
  int64_t updated_at = 0;

  /** Apply the deltas of one event, clamping every counter at zero. */
  void Apply(EventType type, int64_t now_ms);

  /** likes_count - undo_likes_count, floored at zero. */
  int64_t NetLikes() const;

  std::string Serialize() const;
  static bool Deserialize(std::string_view data, InteractionSignals* out);
};

/**
 * Validate and normalize raw event fields.
 * Returns InvalidArgument with a client-facing message on failure.
 * A missing published_at defaults to now_ms.
 */
rocksdb::Status NormalizeEvent(const RawEventFields& raw,
                               int64_t now_ms,
                               InteractionEvent* out);

}  // namespace peerrec
