#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "core/content/comment_log.hpp"
#include "core/content/reaction_ledger.hpp"
#include "core/graph/social_graph.hpp"
#include "core/model/types.hpp"

namespace chirp {

struct Post {
  PostId id = kNoPost;
  Identity author;
  std::string content;
  bool is_private = false;
  std::int64_t created_unix = 0;
  ReactionLedger reactions;
  CommentLog comments;
};

// A post is visible to a viewer when it is public, when the viewer wrote
// it, or when the viewer currently follows its author.
[[nodiscard]] bool post_visible_to(const Post& post, std::string_view viewer,
                                   const SocialGraph& graph);

[[nodiscard]] PostSnapshot snapshot_of(const Post& post);

class ContentStore {
public:
  PostId create(const Identity& author, std::string content, bool is_private,
                std::int64_t created_unix);

  [[nodiscard]] const Post* find(PostId id) const;
  [[nodiscard]] Post* find(PostId id);
  [[nodiscard]] Result require(PostId id) const;

  [[nodiscard]] PostId next_id() const { return next_id_; }
  [[nodiscard]] std::size_t size() const { return posts_.size(); }
  [[nodiscard]] std::size_t comment_total() const;
  [[nodiscard]] std::size_t reaction_total() const;
  [[nodiscard]] const std::vector<Post>& all() const { return posts_; }

private:
  // posts_[i] holds id i + 1; ids are dense because posts are never removed.
  std::vector<Post> posts_;
  PostId next_id_ = 1;
};

}  // namespace chirp
