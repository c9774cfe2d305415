#pragma once

#include <cstdint>
#include <string_view>

#ifndef CHIRP_APP_VERSION
#define CHIRP_APP_VERSION "0.3.0"
#endif

#ifndef CHIRP_BUILD_RELEASE
#define CHIRP_BUILD_RELEASE "Social Core"
#endif

namespace chirp {

inline constexpr std::string_view kAppDisplayName = "Chirp Social Core";
inline constexpr std::string_view kAppVersion = CHIRP_APP_VERSION;
inline constexpr std::string_view kBuildRelease = CHIRP_BUILD_RELEASE;

// Reward credited to a post author per like, in whole tokens.
inline constexpr std::int64_t kDefaultLikeRewardTokens = 10;
// Minor units per token are 10^decimals.
inline constexpr int kDefaultTokenDecimals = 10;
inline constexpr int kMaxTokenDecimals = 15;

inline constexpr std::string_view kIdentityPrefix = "cid-";
inline constexpr std::string_view kEventIdPrefix = "evt-";

}  // namespace chirp
