#include "core/graph/social_graph.hpp"

#include <string>
#include <utility>

namespace chirp {

Result SocialGraph::check_follow(std::string_view follower, std::string_view target) const {
  if (follower.empty() || target.empty()) {
    return Result::failure(ErrorKind::InvalidArgument, "Follow requires both identities.");
  }
  if (follower == target) {
    return Result::failure(ErrorKind::SelfFollow, "Cannot follow yourself.");
  }
  if (is_following(target, follower)) {
    return Result::failure(ErrorKind::AlreadyFollowing, "Already following this identity.");
  }
  return Result::success();
}

Result SocialGraph::check_unfollow(std::string_view follower, std::string_view target) const {
  if (!is_following(target, follower)) {
    return Result::failure(ErrorKind::NotFollowing, "Not following this identity.");
  }
  return Result::success();
}

void SocialGraph::add_edge(const Identity& follower, const Identity& target) {
  FollowerSet& set = followers_[target];
  set.position.emplace(follower, set.sequence.size());
  set.sequence.push_back(follower);
  ++edge_count_;
}

void SocialGraph::remove_edge(const Identity& follower, const Identity& target) {
  const auto set_it = followers_.find(target);
  if (set_it == followers_.end()) {
    return;
  }
  FollowerSet& set = set_it->second;
  const auto pos_it = set.position.find(follower);
  if (pos_it == set.position.end()) {
    return;
  }

  const std::size_t index = pos_it->second;
  const std::size_t last = set.sequence.size() - 1U;
  if (index != last) {
    set.sequence[index] = std::move(set.sequence[last]);
    set.position[set.sequence[index]] = index;
  }
  set.sequence.pop_back();
  set.position.erase(follower);
  --edge_count_;

  if (set.sequence.empty()) {
    followers_.erase(set_it);
  }
}

bool SocialGraph::is_following(std::string_view target, std::string_view follower) const {
  const FollowerSet* set = find_set(target);
  return set != nullptr && set->position.contains(std::string{follower});
}

std::vector<Identity> SocialGraph::followers(std::string_view target) const {
  const FollowerSet* set = find_set(target);
  if (set == nullptr) {
    return {};
  }
  return set->sequence;
}

std::size_t SocialGraph::follower_count(std::string_view target) const {
  const FollowerSet* set = find_set(target);
  return set == nullptr ? 0U : set->sequence.size();
}

const SocialGraph::FollowerSet* SocialGraph::find_set(std::string_view target) const {
  const auto it = followers_.find(std::string{target});
  return it == followers_.end() ? nullptr : &it->second;
}

}  // namespace chirp
