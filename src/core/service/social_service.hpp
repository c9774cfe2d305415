#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/content/content_store.hpp"
#include "core/events/event_log.hpp"
#include "core/graph/social_graph.hpp"
#include "core/identity/identity_registry.hpp"
#include "core/model/types.hpp"
#include "core/rewards/reward_sink.hpp"

namespace chirp {

// Single logical store for profiles, follow graph, posts, reactions and
// comments. Every public call holds one exclusive lock for its whole
// duration, and validates all preconditions before the first mutation,
// so each call either applies completely or leaves state untouched.
//
// Event listeners run under the lock in commit order and must not call
// back into the service. A listener that throws does not undo the call;
// the failure shows up in status().
class SocialService {
public:
  // Rejects an invalid config (ConfigError) or a null sink (InvalidArgument).
  static ValueResult<std::unique_ptr<SocialService>> create(EngineConfig config,
                                                            std::unique_ptr<RewardSink> sink);

  Result create_profile(const Identity& caller, std::string_view username, std::string_view bio);
  [[nodiscard]] std::optional<Profile> get_profile(std::string_view identity) const;

  Result follow(const Identity& caller, const Identity& target);
  Result unfollow(const Identity& caller, const Identity& target);
  [[nodiscard]] bool is_following(std::string_view target, std::string_view follower) const;
  [[nodiscard]] std::vector<Identity> list_followers(std::string_view target) const;
  [[nodiscard]] std::size_t follower_count(std::string_view target) const;

  ValueResult<PostId> create_post(const Identity& caller, std::string_view content, bool is_private);
  [[nodiscard]] ValueResult<PostSnapshot> get_post(std::string_view caller, PostId id) const;

  Result react(const Identity& caller, PostId post_id, bool liked);

  ValueResult<std::size_t> add_comment(const Identity& caller, PostId post_id,
                                       std::string_view content);
  [[nodiscard]] ValueResult<std::vector<Comment>> get_comments(std::string_view caller,
                                                               PostId post_id) const;

  void subscribe(EventListener listener);
  [[nodiscard]] std::vector<EventEnvelope> events_since(std::uint64_t sequence) const;

  [[nodiscard]] std::int64_t like_reward_units() const { return like_reward_units_; }
  [[nodiscard]] std::int64_t reward_balance(std::string_view identity) const;
  [[nodiscard]] std::vector<RewardBalanceSummary> reward_balances() const;
  [[nodiscard]] EngineStatus status() const;

private:
  SocialService(EngineConfig config, std::int64_t like_reward_units,
                std::unique_ptr<RewardSink> sink);

  [[nodiscard]] std::string state_dump() const;

  EngineConfig config_;
  std::int64_t like_reward_units_ = 0;

  mutable std::mutex mutex_;
  IdentityRegistry identities_;
  SocialGraph graph_;
  ContentStore content_;
  EventLog events_;
  std::unique_ptr<RewardSink> sink_;
  LedgerRewardSink* ledger_ = nullptr;
};

}  // namespace chirp
