#include "core/service/social_service.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

#include "core/util/canonical.hpp"
#include "core/util/hash.hpp"

namespace chirp {
namespace {

std::string bool_field(bool value) {
  return value ? "true" : "false";
}

Result denied(ErrorKind kind, PostId id) {
  if (kind == ErrorKind::CommentForbidden) {
    return Result::failure(kind, "Post " + std::to_string(id) +
                                     " is private; only the author and followers may comment.");
  }
  return Result::failure(kind, "Post " + std::to_string(id) +
                                   " is private; only the author and followers may read it.");
}

}  // namespace

ValueResult<std::unique_ptr<SocialService>> SocialService::create(
    EngineConfig config, std::unique_ptr<RewardSink> sink) {
  using Created = ValueResult<std::unique_ptr<SocialService>>;
  const auto units = reward_units(config.like_reward_tokens, config.token_decimals);
  if (!units.ok()) {
    return Created::failure(units.status);
  }
  if (!sink) {
    return Created::failure(
        Result::failure(ErrorKind::InvalidArgument, "A reward sink is required."));
  }
  return Created::success(std::unique_ptr<SocialService>(
      new SocialService(config, units.value, std::move(sink))));
}

SocialService::SocialService(EngineConfig config, std::int64_t like_reward_units,
                             std::unique_ptr<RewardSink> sink)
    : config_(config),
      like_reward_units_(like_reward_units),
      sink_(std::move(sink)),
      ledger_(dynamic_cast<LedgerRewardSink*>(sink_.get())) {}

Result SocialService::create_profile(const Identity& caller, std::string_view username,
                                     std::string_view bio) {
  std::lock_guard lock(mutex_);
  if (const Result check = identities_.check_create(caller, username); !check.ok) {
    return check;
  }

  const std::int64_t now = util::unix_timestamp_now();
  const Profile& profile = identities_.insert({
      .identity = caller,
      .username = std::string{username},
      .bio = std::string{bio},
      .created_unix = now,
  });
  events_.emit(EventKind::ProfileCreated, caller, now,
               {{"identity", profile.identity},
                {"username", profile.username},
                {"bio", profile.bio}});
  return Result::success("Profile created.", profile.username);
}

std::optional<Profile> SocialService::get_profile(std::string_view identity) const {
  std::lock_guard lock(mutex_);
  return identities_.find(identity);
}

Result SocialService::follow(const Identity& caller, const Identity& target) {
  std::lock_guard lock(mutex_);
  if (const Result check = graph_.check_follow(caller, target); !check.ok) {
    return check;
  }

  graph_.add_edge(caller, target);
  events_.emit(EventKind::Followed, caller, util::unix_timestamp_now(),
               {{"follower", caller}, {"target", target}});
  return Result::success("Now following " + target + ".");
}

Result SocialService::unfollow(const Identity& caller, const Identity& target) {
  std::lock_guard lock(mutex_);
  if (const Result check = graph_.check_unfollow(caller, target); !check.ok) {
    return check;
  }

  graph_.remove_edge(caller, target);
  events_.emit(EventKind::Unfollowed, caller, util::unix_timestamp_now(),
               {{"follower", caller}, {"target", target}});
  return Result::success("Stopped following " + target + ".");
}

bool SocialService::is_following(std::string_view target, std::string_view follower) const {
  std::lock_guard lock(mutex_);
  return graph_.is_following(target, follower);
}

std::vector<Identity> SocialService::list_followers(std::string_view target) const {
  std::lock_guard lock(mutex_);
  return graph_.followers(target);
}

std::size_t SocialService::follower_count(std::string_view target) const {
  std::lock_guard lock(mutex_);
  return graph_.follower_count(target);
}

ValueResult<PostId> SocialService::create_post(const Identity& caller, std::string_view content,
                                               bool is_private) {
  std::lock_guard lock(mutex_);
  if (!identities_.has_profile(caller)) {
    return ValueResult<PostId>::failure(
        Result::failure(ErrorKind::ProfileRequired, "Create a profile before posting."));
  }

  const std::int64_t now = util::unix_timestamp_now();
  const PostId id = content_.create(caller, std::string{content}, is_private, now);
  events_.emit(EventKind::PostCreated, caller, now,
               {{"id", std::to_string(id)},
                {"author", caller},
                {"content", std::string{content}},
                {"is_private", bool_field(is_private)}});
  return ValueResult<PostId>::success(id, "Post created.");
}

ValueResult<PostSnapshot> SocialService::get_post(std::string_view caller, PostId id) const {
  std::lock_guard lock(mutex_);
  const Post* post = content_.find(id);
  if (post == nullptr) {
    return ValueResult<PostSnapshot>::failure(content_.require(id));
  }
  if (!post_visible_to(*post, caller, graph_)) {
    return ValueResult<PostSnapshot>::failure(denied(ErrorKind::PrivateAccessDenied, id));
  }
  return ValueResult<PostSnapshot>::success(snapshot_of(*post));
}

Result SocialService::react(const Identity& caller, PostId post_id, bool liked) {
  std::lock_guard lock(mutex_);
  Post* post = content_.find(post_id);
  if (post == nullptr) {
    return content_.require(post_id);
  }
  if (const Result check = post->reactions.check_react(caller); !check.ok) {
    return check;
  }

  // Credit before recording: a refused credit leaves the reaction unrecorded.
  if (liked) {
    const Result credited = sink_->credit(post->author, like_reward_units_);
    if (!credited.ok) {
      return Result::failure(ErrorKind::RewardFailed,
                             "Reward credit failed; reaction not recorded: " + credited.message);
    }
  }

  post->reactions.record(caller, liked);
  events_.emit(EventKind::ReactionAdded, caller, util::unix_timestamp_now(),
               {{"post_id", std::to_string(post_id)},
                {"reactor", caller},
                {"liked", bool_field(liked)}});
  return Result::success(liked ? "Liked." : "Disliked.");
}

ValueResult<std::size_t> SocialService::add_comment(const Identity& caller, PostId post_id,
                                                    std::string_view content) {
  std::lock_guard lock(mutex_);
  Post* post = content_.find(post_id);
  if (post == nullptr) {
    return ValueResult<std::size_t>::failure(content_.require(post_id));
  }
  if (caller.empty()) {
    return ValueResult<std::size_t>::failure(
        Result::failure(ErrorKind::InvalidArgument, "Comment requires a caller identity."));
  }
  if (!post_visible_to(*post, caller, graph_)) {
    return ValueResult<std::size_t>::failure(denied(ErrorKind::CommentForbidden, post_id));
  }

  const std::int64_t now = util::unix_timestamp_now();
  const std::size_t index = post->comments.append({
      .commenter = caller,
      .content = std::string{content},
      .created_unix = now,
  });
  events_.emit(EventKind::CommentAdded, caller, now,
               {{"post_id", std::to_string(post_id)},
                {"commenter", caller},
                {"content", std::string{content}}});
  return ValueResult<std::size_t>::success(index, "Comment added.");
}

ValueResult<std::vector<Comment>> SocialService::get_comments(std::string_view caller,
                                                              PostId post_id) const {
  std::lock_guard lock(mutex_);
  const Post* post = content_.find(post_id);
  if (post == nullptr) {
    return ValueResult<std::vector<Comment>>::failure(content_.require(post_id));
  }
  if (config_.gate_comment_reads && !post_visible_to(*post, caller, graph_)) {
    return ValueResult<std::vector<Comment>>::failure(
        denied(ErrorKind::PrivateAccessDenied, post_id));
  }
  return ValueResult<std::vector<Comment>>::success(post->comments.entries());
}

void SocialService::subscribe(EventListener listener) {
  std::lock_guard lock(mutex_);
  events_.subscribe(std::move(listener));
}

std::vector<EventEnvelope> SocialService::events_since(std::uint64_t sequence) const {
  std::lock_guard lock(mutex_);
  return events_.since(sequence);
}

std::int64_t SocialService::reward_balance(std::string_view identity) const {
  std::lock_guard lock(mutex_);
  return ledger_ == nullptr ? 0 : ledger_->balance(identity);
}

std::vector<RewardBalanceSummary> SocialService::reward_balances() const {
  std::lock_guard lock(mutex_);
  return ledger_ == nullptr ? std::vector<RewardBalanceSummary>{} : ledger_->balances();
}

EngineStatus SocialService::status() const {
  std::lock_guard lock(mutex_);
  return {
      .profile_count = identities_.size(),
      .post_count = content_.size(),
      .comment_count = content_.comment_total(),
      .follow_edge_count = graph_.edge_count(),
      .reaction_count = content_.reaction_total(),
      .event_count = static_cast<std::size_t>(events_.emitted()),
      .listener_failure_count = events_.listener_failures(),
      .last_listener_error = events_.last_listener_error(),
      .next_post_id = content_.next_id(),
      .like_reward_units = like_reward_units_,
      .gate_comment_reads = config_.gate_comment_reads,
      .state_hash = util::sha256_hex(state_dump()),
  };
}

std::string SocialService::state_dump() const {
  std::ostringstream out;

  std::vector<const Profile*> profiles;
  profiles.reserve(identities_.size());
  for (const auto& [identity, profile] : identities_.all()) {
    profiles.push_back(&profile);
  }
  std::ranges::sort(profiles, [](const Profile* lhs, const Profile* rhs) {
    return lhs->identity < rhs->identity;
  });
  for (const Profile* profile : profiles) {
    out << util::canonical_join({{"kind", "profile"},
                                 {"identity", profile->identity},
                                 {"username", profile->username},
                                 {"bio", profile->bio}});
  }

  std::vector<std::pair<Identity, Identity>> edges;
  edges.reserve(graph_.edge_count());
  graph_.for_each_edge([&edges](const Identity& follower, const Identity& target) {
    edges.emplace_back(target, follower);
  });
  std::ranges::sort(edges);
  for (const auto& [target, follower] : edges) {
    out << util::canonical_join({{"kind", "edge"}, {"target", target}, {"follower", follower}});
  }

  for (const auto& post : content_.all()) {
    out << util::canonical_join({{"kind", "post"},
                                 {"id", std::to_string(post.id)},
                                 {"author", post.author},
                                 {"content", post.content},
                                 {"is_private", bool_field(post.is_private)},
                                 {"created_unix", std::to_string(post.created_unix)},
                                 {"likes", std::to_string(post.reactions.likes())},
                                 {"dislikes", std::to_string(post.reactions.dislikes())}});
    for (const auto& reactor : post.reactions.reactors()) {
      out << util::canonical_join({{"kind", "reactor"}, {"reactor", reactor}});
    }
    for (const auto& comment : post.comments.entries()) {
      out << util::canonical_join({{"kind", "comment"},
                                   {"commenter", comment.commenter},
                                   {"content", comment.content},
                                   {"created_unix", std::to_string(comment.created_unix)}});
    }
  }

  out << "next_post_id=" << content_.next_id() << '\n';
  return out.str();
}

}  // namespace chirp
