#include "core/rewards/reward_sink.hpp"

#include <algorithm>
#include <limits>
#include <string>

#include "core/model/app_meta.hpp"

namespace chirp {

Result LedgerRewardSink::credit(const Identity& recipient, std::int64_t amount) {
  if (recipient.empty()) {
    return Result::failure(ErrorKind::RewardFailed, "Reward credit requires a recipient.");
  }
  if (amount <= 0) {
    return Result::failure(ErrorKind::RewardFailed, "Reward credit amount must be positive.");
  }
  constexpr std::int64_t kMax = std::numeric_limits<std::int64_t>::max();
  const auto it = balances_.find(recipient);
  const std::int64_t current = it == balances_.end() ? 0 : it->second;
  if (current > kMax - amount || issued_total_ > kMax - amount) {
    return Result::failure(ErrorKind::RewardFailed, "Reward credit would overflow the ledger.");
  }

  balances_[recipient] = current + amount;
  issued_total_ += amount;
  return Result::success("Reward credited.", std::to_string(amount));
}

std::int64_t LedgerRewardSink::balance(std::string_view identity) const {
  const auto it = balances_.find(std::string{identity});
  return it == balances_.end() ? 0 : it->second;
}

std::vector<RewardBalanceSummary> LedgerRewardSink::balances() const {
  std::vector<RewardBalanceSummary> out;
  out.reserve(balances_.size());
  for (const auto& [identity, balance] : balances_) {
    out.push_back({.identity = identity, .balance = balance});
  }
  std::ranges::sort(out, [](const auto& lhs, const auto& rhs) {
    if (lhs.balance != rhs.balance) {
      return lhs.balance > rhs.balance;
    }
    return lhs.identity < rhs.identity;
  });
  return out;
}

ValueResult<std::int64_t> reward_units(std::int64_t tokens, int decimals) {
  if (tokens <= 0) {
    return ValueResult<std::int64_t>::failure(
        Result::failure(ErrorKind::ConfigError, "Like reward must be a positive token amount."));
  }
  if (decimals < 0 || decimals > kMaxTokenDecimals) {
    return ValueResult<std::int64_t>::failure(Result::failure(
        ErrorKind::ConfigError,
        "Token decimals must be between 0 and " + std::to_string(kMaxTokenDecimals) + "."));
  }

  std::int64_t units = tokens;
  for (int i = 0; i < decimals; ++i) {
    if (units > std::numeric_limits<std::int64_t>::max() / 10) {
      return ValueResult<std::int64_t>::failure(
          Result::failure(ErrorKind::ConfigError, "Like reward overflows 64-bit minor units."));
    }
    units *= 10;
  }
  return ValueResult<std::int64_t>::success(units);
}

std::unique_ptr<LedgerRewardSink> make_ledger_reward_sink() {
  return std::make_unique<LedgerRewardSink>();
}

}  // namespace chirp
