#include "core/content/reaction_ledger.hpp"

#include <algorithm>
#include <string>

namespace chirp {

Result ReactionLedger::check_react(std::string_view reactor) const {
  if (reactor.empty()) {
    return Result::failure(ErrorKind::InvalidArgument, "Reaction requires a caller identity.");
  }
  if (has_reacted(reactor)) {
    return Result::failure(ErrorKind::AlreadyReacted, "Identity already reacted to this post.");
  }
  return Result::success();
}

void ReactionLedger::record(const Identity& reactor, bool liked) {
  reacted_by_.insert(reactor);
  if (liked) {
    ++likes_;
  } else {
    ++dislikes_;
  }
}

bool ReactionLedger::has_reacted(std::string_view reactor) const {
  return reacted_by_.contains(std::string{reactor});
}

std::vector<Identity> ReactionLedger::reactors() const {
  std::vector<Identity> out(reacted_by_.begin(), reacted_by_.end());
  std::ranges::sort(out);
  return out;
}

}  // namespace chirp
