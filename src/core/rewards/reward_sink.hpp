#pragma once

#include <cstdint>
#include <memory>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "core/model/types.hpp"

namespace chirp {

// Mintable balance sink credited when a post is liked. A failed credit
// must leave the sink unchanged.
class RewardSink {
public:
  virtual ~RewardSink() = default;

  virtual Result credit(const Identity& recipient, std::int64_t amount) = 0;
};

class LedgerRewardSink final : public RewardSink {
public:
  Result credit(const Identity& recipient, std::int64_t amount) override;

  [[nodiscard]] std::int64_t balance(std::string_view identity) const;
  [[nodiscard]] std::vector<RewardBalanceSummary> balances() const;
  [[nodiscard]] std::int64_t issued_total() const { return issued_total_; }

private:
  std::unordered_map<Identity, std::int64_t> balances_;
  std::int64_t issued_total_ = 0;
};

// Scales whole tokens to minor units, failing on overflow.
ValueResult<std::int64_t> reward_units(std::int64_t tokens, int decimals);

std::unique_ptr<LedgerRewardSink> make_ledger_reward_sink();

}  // namespace chirp
