#pragma once

#include <string_view>

#include "core/model/types.hpp"

namespace chirp {

// key=value lines; blank lines and lines starting with '#' are skipped.
// Keys: like_reward_tokens, token_decimals, gate_comment_reads.
// Unknown keys are rejected.
ValueResult<EngineConfig> parse_engine_config(std::string_view text);
ValueResult<EngineConfig> load_engine_config(std::string_view path);

Result validate_engine_config(const EngineConfig& config);

}  // namespace chirp
