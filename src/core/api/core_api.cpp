#include "core/api/core_api.hpp"

#include <utility>

#include "core/config/config_file.hpp"
#include "core/util/hash.hpp"

namespace chirp {

Result CoreApi::init(const EngineConfig& config) {
  return init(config, make_ledger_reward_sink());
}

Result CoreApi::init(const EngineConfig& config, std::unique_ptr<RewardSink> sink) {
  if (const Result hashing = util::initialize_hashing(); !hashing.ok) {
    return hashing;
  }
  auto created = SocialService::create(config, std::move(sink));
  if (!created.ok()) {
    return created.status;
  }
  service_ = std::move(created.value);
  return Result::success("Social core initialized.");
}

Result CoreApi::init_from_file(std::string_view config_path) {
  const auto loaded = load_engine_config(config_path);
  if (!loaded.ok()) {
    return loaded.status;
  }
  return init(loaded.value);
}

Result CoreApi::not_initialized() {
  return Result::failure(ErrorKind::NotInitialized, "Social core is not initialized.");
}

Result CoreApi::create_profile(const Identity& caller, std::string_view username,
                               std::string_view bio) {
  if (!service_) {
    return not_initialized();
  }
  return service_->create_profile(caller, username, bio);
}

ValueResult<PostId> CoreApi::create_post(const Identity& caller, std::string_view content,
                                         bool is_private) {
  if (!service_) {
    return ValueResult<PostId>::failure(not_initialized());
  }
  return service_->create_post(caller, content, is_private);
}

ValueResult<std::size_t> CoreApi::add_comment(const Identity& caller, PostId post_id,
                                              std::string_view content) {
  if (!service_) {
    return ValueResult<std::size_t>::failure(not_initialized());
  }
  return service_->add_comment(caller, post_id, content);
}

Result CoreApi::react(const Identity& caller, PostId post_id, bool liked) {
  if (!service_) {
    return not_initialized();
  }
  return service_->react(caller, post_id, liked);
}

Result CoreApi::follow(const Identity& caller, const Identity& target) {
  if (!service_) {
    return not_initialized();
  }
  return service_->follow(caller, target);
}

Result CoreApi::unfollow(const Identity& caller, const Identity& target) {
  if (!service_) {
    return not_initialized();
  }
  return service_->unfollow(caller, target);
}

std::optional<Profile> CoreApi::get_profile(std::string_view identity) const {
  if (!service_) {
    return std::nullopt;
  }
  return service_->get_profile(identity);
}

ValueResult<PostSnapshot> CoreApi::get_post(std::string_view caller, PostId id) const {
  if (!service_) {
    return ValueResult<PostSnapshot>::failure(not_initialized());
  }
  return service_->get_post(caller, id);
}

ValueResult<std::vector<Comment>> CoreApi::get_comments(std::string_view caller,
                                                        PostId post_id) const {
  if (!service_) {
    return ValueResult<std::vector<Comment>>::failure(not_initialized());
  }
  return service_->get_comments(caller, post_id);
}

std::vector<Identity> CoreApi::list_followers(std::string_view identity) const {
  if (!service_) {
    return {};
  }
  return service_->list_followers(identity);
}

bool CoreApi::is_following(std::string_view target, std::string_view follower) const {
  return service_ != nullptr && service_->is_following(target, follower);
}

std::size_t CoreApi::follower_count(std::string_view identity) const {
  return service_ ? service_->follower_count(identity) : 0U;
}

Result CoreApi::subscribe(EventListener listener) {
  if (!service_) {
    return not_initialized();
  }
  service_->subscribe(std::move(listener));
  return Result::success("Listener subscribed.");
}

std::vector<EventEnvelope> CoreApi::events_since(std::uint64_t sequence) const {
  if (!service_) {
    return {};
  }
  return service_->events_since(sequence);
}

std::int64_t CoreApi::reward_balance(std::string_view identity) const {
  return service_ ? service_->reward_balance(identity) : 0;
}

std::vector<RewardBalanceSummary> CoreApi::reward_balances() const {
  if (!service_) {
    return {};
  }
  return service_->reward_balances();
}

EngineStatus CoreApi::status() const {
  if (!service_) {
    return {};
  }
  return service_->status();
}

}  // namespace chirp
