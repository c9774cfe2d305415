#pragma once

#include <cstddef>
#include <vector>

#include "core/model/types.hpp"

namespace chirp {

class CommentLog {
public:
  // Returns the zero-based index of the appended comment.
  std::size_t append(Comment comment);

  [[nodiscard]] std::size_t size() const { return comments_.size(); }
  [[nodiscard]] const std::vector<Comment>& entries() const { return comments_; }

private:
  std::vector<Comment> comments_;
};

}  // namespace chirp
