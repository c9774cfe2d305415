#include "core/identity/identity_registry.hpp"

#include <string>
#include <utility>

namespace chirp {

Result IdentityRegistry::check_create(std::string_view identity, std::string_view username) const {
  if (identity.empty()) {
    return Result::failure(ErrorKind::InvalidArgument, "Profile requires a caller identity.");
  }
  if (username.empty()) {
    return Result::failure(ErrorKind::InvalidArgument, "Profile requires a non-empty username.");
  }
  if (has_profile(identity)) {
    return Result::failure(ErrorKind::AlreadyExists, "Profile already exists for this identity.");
  }
  return Result::success();
}

const Profile& IdentityRegistry::insert(Profile profile) {
  Identity key = profile.identity;
  return profiles_.insert_or_assign(std::move(key), std::move(profile)).first->second;
}

bool IdentityRegistry::has_profile(std::string_view identity) const {
  const auto it = profiles_.find(std::string{identity});
  return it != profiles_.end() && it->second.exists();
}

std::optional<Profile> IdentityRegistry::find(std::string_view identity) const {
  const auto it = profiles_.find(std::string{identity});
  if (it == profiles_.end() || !it->second.exists()) {
    return std::nullopt;
  }
  return it->second;
}

}  // namespace chirp
