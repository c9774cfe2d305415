#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "core/model/app_meta.hpp"

namespace chirp {

using Identity = std::string;
using PostId = std::uint64_t;

inline constexpr PostId kNoPost = 0;

enum class ErrorKind {
  None,
  InvalidArgument,
  AlreadyExists,
  ProfileRequired,
  NotFound,
  PrivateAccessDenied,
  CommentForbidden,
  AlreadyReacted,
  SelfFollow,
  AlreadyFollowing,
  NotFollowing,
  RewardFailed,
  ConfigError,
  NotInitialized,
};

std::string_view error_kind_name(ErrorKind kind);

struct Result {
  bool ok = false;
  ErrorKind error = ErrorKind::None;
  std::string message;
  std::string data;

  static Result success(std::string msg = {}, std::string payload = {}) {
    return {true, ErrorKind::None, std::move(msg), std::move(payload)};
  }

  static Result failure(ErrorKind kind, std::string msg) {
    return {false, kind, std::move(msg), {}};
  }
};

template <typename T>
struct ValueResult {
  Result status;
  T value{};

  [[nodiscard]] bool ok() const { return status.ok; }

  static ValueResult success(T v, std::string msg = {}) {
    return {Result::success(std::move(msg)), std::move(v)};
  }

  static ValueResult failure(Result failed) {
    return {std::move(failed), T{}};
  }
};

struct Profile {
  Identity identity;
  std::string username;
  std::string bio;
  std::int64_t created_unix = 0;

  [[nodiscard]] bool exists() const { return !username.empty(); }
};

struct Comment {
  Identity commenter;
  std::string content;
  std::int64_t created_unix = 0;
};

struct PostSnapshot {
  PostId id = kNoPost;
  Identity author;
  std::string content;
  bool is_private = false;
  std::int64_t created_unix = 0;
  std::uint64_t likes = 0;
  std::uint64_t dislikes = 0;
  std::size_t comment_count = 0;
};

enum class EventKind {
  ProfileCreated,
  PostCreated,
  CommentAdded,
  ReactionAdded,
  Followed,
  Unfollowed,
};

std::string_view event_kind_name(EventKind kind);

struct EventEnvelope {
  std::uint64_t sequence = 0;
  std::string event_id;
  EventKind kind = EventKind::ProfileCreated;
  Identity actor;
  std::int64_t unix_ts = 0;
  std::string payload;
};

struct RewardBalanceSummary {
  Identity identity;
  std::int64_t balance = 0;
};

struct EngineStatus {
  std::size_t profile_count = 0;
  std::size_t post_count = 0;
  std::size_t comment_count = 0;
  std::size_t follow_edge_count = 0;
  std::size_t reaction_count = 0;
  std::size_t event_count = 0;
  std::uint64_t listener_failure_count = 0;
  std::string last_listener_error;
  PostId next_post_id = 1;
  std::int64_t like_reward_units = 0;
  bool gate_comment_reads = true;
  std::string state_hash;
};

struct EngineConfig {
  std::int64_t like_reward_tokens = kDefaultLikeRewardTokens;
  int token_decimals = kDefaultTokenDecimals;
  bool gate_comment_reads = true;
};

}  // namespace chirp
