#include "core/model/types.hpp"

namespace chirp {

std::string_view error_kind_name(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::None:
      return "None";
    case ErrorKind::InvalidArgument:
      return "InvalidArgument";
    case ErrorKind::AlreadyExists:
      return "AlreadyExists";
    case ErrorKind::ProfileRequired:
      return "ProfileRequired";
    case ErrorKind::NotFound:
      return "NotFound";
    case ErrorKind::PrivateAccessDenied:
      return "PrivateAccessDenied";
    case ErrorKind::CommentForbidden:
      return "CommentForbidden";
    case ErrorKind::AlreadyReacted:
      return "AlreadyReacted";
    case ErrorKind::SelfFollow:
      return "SelfFollow";
    case ErrorKind::AlreadyFollowing:
      return "AlreadyFollowing";
    case ErrorKind::NotFollowing:
      return "NotFollowing";
    case ErrorKind::RewardFailed:
      return "RewardFailed";
    case ErrorKind::ConfigError:
      return "ConfigError";
    case ErrorKind::NotInitialized:
      return "NotInitialized";
  }
  return "Unknown";
}

std::string_view event_kind_name(EventKind kind) {
  switch (kind) {
    case EventKind::ProfileCreated:
      return "ProfileCreated";
    case EventKind::PostCreated:
      return "PostCreated";
    case EventKind::CommentAdded:
      return "CommentAdded";
    case EventKind::ReactionAdded:
      return "ReactionAdded";
    case EventKind::Followed:
      return "Followed";
    case EventKind::Unfollowed:
      return "Unfollowed";
  }
  return "Unknown";
}

}  // namespace chirp
