// Unit tests for peerrec/moderation.hpp
// Tests: host normalization, instance denylist, channel blocklist

#include <gtest/gtest.h>

#include <peerrec/moderation.hpp>
#include <peerrec/test_utils.hpp>

#include <string>
#include <vector>

namespace peerrec {
namespace {

using testing::MakeRow;
using testing::MakeVideo;

// =============================================================================
// NormalizeHost
// =============================================================================

TEST(NormalizeHostTest, StripsDecorations) {
  const std::pair<const char*, const char*> cases[] = {
      {"PeerTube.Example", "peertube.example"},
      {"  tube.example  ", "tube.example"},
      {"https://tube.example/videos/watch/1", "tube.example"},
      {"http://user@tube.example:9000", "tube.example"},
      {"tube.example:443", "tube.example"},
      {".tube.example.", "tube.example"},
      {"tube.example?x=1", "tube.example"},
  };
  for (const auto& c : cases) {
    std::string out;
    ASSERT_TRUE(NormalizeHost(c.first, &out)) << c.first;
    EXPECT_EQ(out, c.second) << c.first;
  }
}

TEST(NormalizeHostTest, RejectsInvalid) {
  std::string out = "unchanged";
  EXPECT_FALSE(NormalizeHost("", &out));
  EXPECT_FALSE(NormalizeHost("   ", &out));
  EXPECT_FALSE(NormalizeHost("...", &out));
  EXPECT_FALSE(NormalizeHost("bad host.example", &out));
  EXPECT_EQ(out, "unchanged");
}

// =============================================================================
// ApplyModeration
// =============================================================================

class ApplyModerationTest : public ::testing::Test {
 protected:
  void SetUp() override {
    rows_ = {
        MakeRow(MakeVideo("1", "good.example", "chan-a")),
        MakeRow(MakeVideo("2", "Denied.Example", "chan-a")),
        MakeRow(MakeVideo("3", "good.example", "chan-bad")),
        MakeRow(MakeVideo("4", "other.example", "chan-bad")),
        MakeRow(MakeVideo("5", "good.example", "")),
    };
    lists_.denied_hosts.insert("denied.example");
    lists_.blocked_channels.insert({"chan-bad", "good.example"});
  }

  static std::vector<std::string> Ids(const std::vector<CandidateRow>& rows) {
    std::vector<std::string> out;
    for (const auto& r : rows) out.push_back(r.video.video_id);
    return out;
  }

  std::vector<CandidateRow> rows_;
  ModerationLists lists_;
};

TEST_F(ApplyModerationTest, BothRules) {
  ModerationFilterStats stats;
  auto kept = ApplyModeration(rows_, lists_, ModerationSettings{}, &stats);

  EXPECT_EQ(Ids(kept), (std::vector<std::string>{"1", "4", "5"}));
  EXPECT_EQ(stats.filtered_by_denylist, 1);
  EXPECT_EQ(stats.filtered_by_blocked_channel, 1);
  EXPECT_EQ(stats.total_filtered(), 2);
  // Input untouched.
  EXPECT_EQ(rows_.size(), 5u);
}

TEST_F(ApplyModerationTest, RulesToggleIndependently) {
  ModerationSettings instance_only;
  instance_only.apply_channel_filter = false;
  ModerationFilterStats stats;
  auto kept = ApplyModeration(rows_, lists_, instance_only, &stats);
  EXPECT_EQ(Ids(kept), (std::vector<std::string>{"1", "3", "4", "5"}));
  EXPECT_EQ(stats.filtered_by_blocked_channel, 0);

  ModerationSettings channel_only;
  channel_only.apply_instance_filter = false;
  kept = ApplyModeration(rows_, lists_, channel_only, &stats);
  EXPECT_EQ(Ids(kept), (std::vector<std::string>{"1", "2", "4", "5"}));
  EXPECT_EQ(stats.filtered_by_denylist, 0);

  ModerationSettings none;
  none.apply_instance_filter = false;
  none.apply_channel_filter = false;
  EXPECT_FALSE(none.Any());
  EXPECT_EQ(ApplyModeration(rows_, lists_, none, nullptr).size(), 5u);
}

TEST_F(ApplyModerationTest, EmptyListsKeepEverything) {
  ModerationFilterStats stats;
  auto kept = ApplyModeration(rows_, ModerationLists{}, ModerationSettings{}, &stats);
  EXPECT_EQ(kept.size(), rows_.size());
  EXPECT_EQ(stats.total_filtered(), 0);
}

}  // namespace
}  // namespace peerrec
