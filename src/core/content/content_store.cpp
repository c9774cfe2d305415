#include "core/content/content_store.hpp"

#include <utility>

namespace chirp {

bool post_visible_to(const Post& post, std::string_view viewer, const SocialGraph& graph) {
  if (!post.is_private) {
    return true;
  }
  if (viewer.empty()) {
    return false;
  }
  return viewer == post.author || graph.is_following(post.author, viewer);
}

PostSnapshot snapshot_of(const Post& post) {
  return {
      .id = post.id,
      .author = post.author,
      .content = post.content,
      .is_private = post.is_private,
      .created_unix = post.created_unix,
      .likes = post.reactions.likes(),
      .dislikes = post.reactions.dislikes(),
      .comment_count = post.comments.size(),
  };
}

PostId ContentStore::create(const Identity& author, std::string content, bool is_private,
                            std::int64_t created_unix) {
  Post post;
  post.id = next_id_++;
  post.author = author;
  post.content = std::move(content);
  post.is_private = is_private;
  post.created_unix = created_unix;
  posts_.push_back(std::move(post));
  return posts_.back().id;
}

const Post* ContentStore::find(PostId id) const {
  if (id == kNoPost || id > posts_.size()) {
    return nullptr;
  }
  return &posts_[id - 1U];
}

Post* ContentStore::find(PostId id) {
  if (id == kNoPost || id > posts_.size()) {
    return nullptr;
  }
  return &posts_[id - 1U];
}

Result ContentStore::require(PostId id) const {
  if (find(id) == nullptr) {
    return Result::failure(ErrorKind::NotFound, "Post " + std::to_string(id) + " was not found.");
  }
  return Result::success();
}

std::size_t ContentStore::comment_total() const {
  std::size_t total = 0;
  for (const auto& post : posts_) {
    total += post.comments.size();
  }
  return total;
}

std::size_t ContentStore::reaction_total() const {
  std::size_t total = 0;
  for (const auto& post : posts_) {
    total += post.reactions.reactor_count();
  }
  return total;
}

}  // namespace chirp
