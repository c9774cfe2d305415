#pragma once

#include <optional>
#include <string_view>
#include <unordered_map>

#include "core/model/types.hpp"

namespace chirp {

class IdentityRegistry {
public:
  // Precondition check only; does not mutate.
  [[nodiscard]] Result check_create(std::string_view identity, std::string_view username) const;
  // Caller must have passed check_create.
  const Profile& insert(Profile profile);

  [[nodiscard]] bool has_profile(std::string_view identity) const;
  [[nodiscard]] std::optional<Profile> find(std::string_view identity) const;
  [[nodiscard]] std::size_t size() const { return profiles_.size(); }
  [[nodiscard]] const std::unordered_map<Identity, Profile>& all() const { return profiles_; }

private:
  std::unordered_map<Identity, Profile> profiles_;
};

}  // namespace chirp
