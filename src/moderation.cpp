#include <peerrec/moderation.hpp>

#include <peerrec/internal.hpp>

#include <algorithm>
#include <cctype>

namespace peerrec {

bool NormalizeHost(std::string_view value, std::string* out) {
  if (!out) return false;

  std::string host = internal::TrimWhitespace(value);
  std::transform(host.begin(), host.end(), host.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (host.empty()) return false;

  size_t scheme = host.find("://");
  if (scheme != std::string::npos) host = host.substr(scheme + 3);

  size_t path = host.find_first_of("/?#");
  if (path != std::string::npos) host = host.substr(0, path);

  size_t at = host.rfind('@');
  if (at != std::string::npos) host = host.substr(at + 1);

  size_t port = host.rfind(':');
  if (port != std::string::npos) host = host.substr(0, port);

  size_t first = host.find_first_not_of('.');
  if (first == std::string::npos) return false;
  size_t last = host.find_last_not_of('.');
  host = host.substr(first, last - first + 1);

  if (host.empty()) return false;
  for (unsigned char c : host) {
    if (std::isspace(c)) return false;
  }

  *out = std::move(host);
  return true;
}

std::vector<CandidateRow> ApplyModeration(const std::vector<CandidateRow>& rows,
                                          const ModerationLists& lists,
                                          const ModerationSettings& settings,
                                          ModerationFilterStats* stats) {
  ModerationFilterStats local;
  std::vector<CandidateRow> kept;
  kept.reserve(rows.size());

  for (const auto& row : rows) {
    std::string host;
    bool has_host = NormalizeHost(row.video.instance_domain, &host);

    if (settings.apply_instance_filter && has_host &&
        lists.denied_hosts.count(host) > 0) {
      ++local.filtered_by_denylist;
      continue;
    }
    if (settings.apply_channel_filter && has_host && !row.video.channel_id.empty() &&
        lists.blocked_channels.count({row.video.channel_id, host}) > 0) {
      ++local.filtered_by_blocked_channel;
      continue;
    }
    kept.push_back(row);
  }

  if (stats) *stats = local;
  return kept;
}

}  // namespace peerrec
