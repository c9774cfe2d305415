#pragma once

#include <cstdint>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "core/model/types.hpp"

namespace chirp {

// Per-post reactions. A reactor is recorded once and never removed, so
// likes + dislikes always equals the number of reactors.
class ReactionLedger {
public:
  [[nodiscard]] Result check_react(std::string_view reactor) const;
  void record(const Identity& reactor, bool liked);

  [[nodiscard]] bool has_reacted(std::string_view reactor) const;
  [[nodiscard]] std::uint64_t likes() const { return likes_; }
  [[nodiscard]] std::uint64_t dislikes() const { return dislikes_; }
  [[nodiscard]] std::size_t reactor_count() const { return reacted_by_.size(); }
  // Sorted, for fingerprinting.
  [[nodiscard]] std::vector<Identity> reactors() const;

private:
  std::unordered_set<Identity> reacted_by_;
  std::uint64_t likes_ = 0;
  std::uint64_t dislikes_ = 0;
};

}  // namespace chirp
