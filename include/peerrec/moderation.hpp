#pragma once

#include <peerrec/types.hpp>

#include <set>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

namespace peerrec {

/** Active moderation lists, loaded from the store per request. */
struct ModerationLists {
  std::unordered_set<std::string> denied_hosts;
  // (channel_id, normalized host)
  std::set<std::pair<std::string, std::string>> blocked_channels;
};

/** Independently toggleable moderation rules. */
struct ModerationSettings {
  bool apply_instance_filter = true;
  bool apply_channel_filter = true;

  bool Any() const { return apply_instance_filter || apply_channel_filter; }
};

/** Rows removed by each rule during one filtering pass. */
struct ModerationFilterStats {
  int filtered_by_denylist = 0;
  int filtered_by_blocked_channel = 0;

  int total_filtered() const { return filtered_by_denylist + filtered_by_blocked_channel; }
};

/**
 * Normalize a host string: lowercase, drop scheme, userinfo, port and path,
 * trim surrounding dots. Returns false for empty or whitespace-bearing hosts.
 */
bool NormalizeHost(std::string_view value, std::string* out);

/**
 * Return the rows that pass the enabled rules, in input order.
 * The input is never modified. stats may be null.
 */
std::vector<CandidateRow> ApplyModeration(const std::vector<CandidateRow>& rows,
                                          const ModerationLists& lists,
                                          const ModerationSettings& settings,
                                          ModerationFilterStats* stats);

}  // namespace peerrec
