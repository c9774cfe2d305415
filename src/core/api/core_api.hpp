#pragma once

#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include "core/model/types.hpp"
#include "core/rewards/reward_sink.hpp"
#include "core/service/social_service.hpp"

namespace chirp {

class CoreApi {
public:
  // Uses the in-process ledger as reward sink.
  Result init(const EngineConfig& config);
  Result init(const EngineConfig& config, std::unique_ptr<RewardSink> sink);
  Result init_from_file(std::string_view config_path);

  [[nodiscard]] bool initialized() const { return service_ != nullptr; }

  Result create_profile(const Identity& caller, std::string_view username, std::string_view bio);
  ValueResult<PostId> create_post(const Identity& caller, std::string_view content, bool is_private);
  ValueResult<std::size_t> add_comment(const Identity& caller, PostId post_id,
                                       std::string_view content);
  Result react(const Identity& caller, PostId post_id, bool liked);
  Result follow(const Identity& caller, const Identity& target);
  Result unfollow(const Identity& caller, const Identity& target);

  std::optional<Profile> get_profile(std::string_view identity) const;
  ValueResult<PostSnapshot> get_post(std::string_view caller, PostId id) const;
  ValueResult<std::vector<Comment>> get_comments(std::string_view caller, PostId post_id) const;
  std::vector<Identity> list_followers(std::string_view identity) const;
  bool is_following(std::string_view target, std::string_view follower) const;
  std::size_t follower_count(std::string_view identity) const;

  Result subscribe(EventListener listener);
  std::vector<EventEnvelope> events_since(std::uint64_t sequence) const;

  std::int64_t reward_balance(std::string_view identity) const;
  std::vector<RewardBalanceSummary> reward_balances() const;
  EngineStatus status() const;

private:
  static Result not_initialized();

  std::unique_ptr<SocialService> service_;
};

}  // namespace chirp
