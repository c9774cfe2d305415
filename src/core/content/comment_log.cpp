#include "core/content/comment_log.hpp"

#include <utility>

namespace chirp {

std::size_t CommentLog::append(Comment comment) {
  comments_.push_back(std::move(comment));
  return comments_.size() - 1U;
}

}  // namespace chirp
