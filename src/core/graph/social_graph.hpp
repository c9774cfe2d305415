#pragma once

#include <string_view>
#include <unordered_map>
#include <vector>

#include "core/model/types.hpp"

namespace chirp {

// Directed follow edges, stored per followed identity as a follower
// sequence plus a position index. Removal swaps with the last entry, so
// follower enumeration order is not stable across unfollows.
class SocialGraph {
public:
  [[nodiscard]] Result check_follow(std::string_view follower, std::string_view target) const;
  [[nodiscard]] Result check_unfollow(std::string_view follower, std::string_view target) const;

  // Both require the matching check to have passed.
  void add_edge(const Identity& follower, const Identity& target);
  void remove_edge(const Identity& follower, const Identity& target);

  [[nodiscard]] bool is_following(std::string_view target, std::string_view follower) const;
  [[nodiscard]] std::vector<Identity> followers(std::string_view target) const;
  [[nodiscard]] std::size_t follower_count(std::string_view target) const;
  [[nodiscard]] std::size_t edge_count() const { return edge_count_; }

  template <typename Fn>
  void for_each_edge(Fn&& fn) const {
    for (const auto& [target, set] : followers_) {
      for (const auto& follower : set.sequence) {
        fn(follower, target);
      }
    }
  }

private:
  struct FollowerSet {
    std::vector<Identity> sequence;
    std::unordered_map<Identity, std::size_t> position;
  };

  [[nodiscard]] const FollowerSet* find_set(std::string_view target) const;

  std::unordered_map<Identity, FollowerSet> followers_;
  std::size_t edge_count_ = 0;
};

}  // namespace chirp
