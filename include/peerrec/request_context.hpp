#pragma once

#include <peerrec/random.hpp>
#include <peerrec/store.hpp>
#include <peerrec/types.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include <rocksdb/status.h>

namespace peerrec {

/**
 * Per-request state, created at request entry and passed by reference
 * through candidate generation and re-ranking.
 */
struct RequestContext {
  std::string request_id;

  // Source of shuffles and samples for this request. Must be set.
  Random* rng = nullptr;

  // When set, client_likes replaces the stored likes of the user.
  bool use_client_likes = false;
  std::vector<LikeEntry> client_likes;

  // Request time in milliseconds; 0 means "read the wall clock".
  int64_t now_ms = 0;
};

/**
 * Most recent likes of user_id, at most limit (0 = all): the caller-supplied
 * likes when the context carries them, the stored likes otherwise.
 */
rocksdb::Status FetchRecentLikes(const RequestContext& ctx,
                                 const Store& store,
                                 std::string_view user_id,
                                 size_t limit,
                                 std::vector<LikeEntry>* out);

}  // namespace peerrec
