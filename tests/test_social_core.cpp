#include <algorithm>
#include <atomic>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "core/api/core_api.hpp"
#include "core/config/config_file.hpp"
#include "core/content/content_store.hpp"
#include "core/events/event_log.hpp"
#include "core/graph/social_graph.hpp"
#include "core/rewards/reward_sink.hpp"
#include "core/service/social_service.hpp"
#include "core/util/canonical.hpp"
#include "core/util/hash.hpp"

namespace {

class RecordingSink final : public chirp::RewardSink {
public:
  struct Credit {
    chirp::Identity recipient;
    std::int64_t amount = 0;
  };

  chirp::Result credit(const chirp::Identity& recipient, std::int64_t amount) override {
    credits.push_back({recipient, amount});
    return chirp::Result::success("recorded");
  }

  std::vector<Credit> credits;
};

class FailingSink final : public chirp::RewardSink {
public:
  chirp::Result credit(const chirp::Identity&, std::int64_t) override {
    ++attempts;
    return chirp::Result::failure(chirp::ErrorKind::RewardFailed, "ledger offline");
  }

  int attempts = 0;
};

std::filesystem::path temp_dir(const std::string& name) {
  const auto root = std::filesystem::temp_directory_path() / "chirp-tests" / name;
  std::error_code ec;
  std::filesystem::remove_all(root, ec);
  std::filesystem::create_directories(root, ec);
  return root;
}

chirp::CoreApi make_api() {
  chirp::CoreApi api;
  const chirp::Result init = api.init(chirp::EngineConfig{});
  assert(init.ok);
  return api;
}

void test_profiles_are_write_once() {
  chirp::CoreApi api = make_api();

  assert(!api.get_profile("alice").has_value());

  chirp::Result created = api.create_profile("alice", "Alice", "first bio");
  assert(created.ok);

  const std::string before = api.status().state_hash;
  chirp::Result again = api.create_profile("alice", "Mallory", "second bio");
  assert(!again.ok);
  assert(again.error == chirp::ErrorKind::AlreadyExists);
  assert(api.status().state_hash == before);

  const auto profile = api.get_profile("alice");
  assert(profile.has_value());
  assert(profile->username == "Alice");
  assert(profile->bio == "first bio");

  // Usernames are not unique across identities.
  assert(api.create_profile("bob", "Alice", "").ok);

  const chirp::Result empty_name = api.create_profile("carol", "", "bio");
  assert(!empty_name.ok);
  assert(empty_name.error == chirp::ErrorKind::InvalidArgument);
  assert(!api.get_profile("carol").has_value());
  assert(api.status().profile_count == 2);
}

void test_posting_requires_profile_and_ids_are_sequential() {
  chirp::CoreApi api = make_api();

  const auto orphan = api.create_post("alice", "hello", false);
  assert(!orphan.ok());
  assert(orphan.status.error == chirp::ErrorKind::ProfileRequired);
  assert(api.status().post_count == 0);
  assert(api.status().next_post_id == 1);

  assert(api.create_profile("alice", "Alice", "").ok);
  assert(api.create_profile("bob", "Bob", "").ok);

  assert(api.create_post("alice", "one", false).value == 1);
  assert(api.create_post("bob", "two", true).value == 2);
  assert(!api.create_post("carol", "nope", false).ok());
  assert(api.create_post("alice", "three", false).value == 3);

  const auto missing = api.get_post("alice", 4);
  assert(!missing.ok());
  assert(missing.status.error == chirp::ErrorKind::NotFound);
  assert(api.get_post("alice", chirp::kNoPost).status.error == chirp::ErrorKind::NotFound);

  const auto second = api.get_post("bob", 2);
  assert(second.ok());
  assert(second.value.author == "bob");
  assert(second.value.is_private);
  assert(second.value.likes == 0 && second.value.dislikes == 0 && second.value.comment_count == 0);
}

void test_follow_graph_rules() {
  chirp::CoreApi api = make_api();

  const std::string before = api.status().state_hash;
  const chirp::Result self = api.follow("alice", "alice");
  assert(!self.ok);
  assert(self.error == chirp::ErrorKind::SelfFollow);
  assert(api.status().state_hash == before);

  // No profile is needed on either side of an edge.
  assert(api.follow("bob", "alice").ok);
  assert(api.is_following("alice", "bob"));
  assert(!api.is_following("bob", "alice"));

  const chirp::Result twice = api.follow("bob", "alice");
  assert(!twice.ok);
  assert(twice.error == chirp::ErrorKind::AlreadyFollowing);
  assert(api.is_following("alice", "bob"));

  const chirp::Result stranger = api.unfollow("carol", "alice");
  assert(!stranger.ok);
  assert(stranger.error == chirp::ErrorKind::NotFollowing);

  assert(api.follow("carol", "alice").ok);
  assert(api.follow("dave", "alice").ok);
  auto followers = api.list_followers("alice");
  assert(followers.size() == 3);

  assert(api.unfollow("bob", "alice").ok);
  assert(!api.is_following("alice", "bob"));
  followers = api.list_followers("alice");
  assert(followers.size() == 2);
  assert(std::ranges::find(followers, std::string{"bob"}) == followers.end());
  assert(std::ranges::find(followers, std::string{"carol"}) != followers.end());
  assert(std::ranges::find(followers, std::string{"dave"}) != followers.end());

  assert(api.follower_count("alice") == 2);
  assert(api.list_followers("nobody").empty());
  assert(api.status().follow_edge_count == 2);
}

void test_graph_swap_removal_keeps_index_consistent() {
  chirp::SocialGraph graph;
  for (const std::string follower : {"a", "b", "c", "d"}) {
    assert(graph.check_follow(follower, "t").ok);
    graph.add_edge(follower, "t");
  }

  assert(graph.check_unfollow("a", "t").ok);
  graph.remove_edge("a", "t");
  assert(graph.check_unfollow("b", "t").ok);
  graph.remove_edge("b", "t");

  assert(graph.follower_count("t") == 2);
  assert(!graph.is_following("t", "a"));
  assert(!graph.is_following("t", "b"));
  assert(graph.is_following("t", "c"));
  assert(graph.is_following("t", "d"));

  assert(graph.check_unfollow("d", "t").ok);
  graph.remove_edge("d", "t");
  assert(graph.followers("t") == std::vector<chirp::Identity>{"c"});

  graph.remove_edge("c", "t");
  assert(graph.followers("t").empty());
  assert(graph.edge_count() == 0);
  assert(graph.check_follow("c", "t").ok);
}

void test_reactions_are_single_and_pay_the_author() {
  auto sink = std::make_unique<RecordingSink>();
  RecordingSink* recorder = sink.get();
  chirp::CoreApi api;
  assert(api.init(chirp::EngineConfig{}, std::move(sink)).ok);

  assert(api.create_profile("alice", "Alice", "").ok);
  const chirp::PostId id = api.create_post("alice", "Hello", false).value;

  const chirp::Result missing = api.react("bob", 99, true);
  assert(!missing.ok);
  assert(missing.error == chirp::ErrorKind::NotFound);

  assert(api.react("bob", id, true).ok);
  assert(recorder->credits.size() == 1);
  assert(recorder->credits.front().recipient == "alice");
  assert(recorder->credits.front().amount == api.status().like_reward_units);
  assert(api.status().like_reward_units == 10 * 10000000000LL);

  const chirp::Result switched = api.react("bob", id, false);
  assert(!switched.ok);
  assert(switched.error == chirp::ErrorKind::AlreadyReacted);

  assert(api.react("carol", id, false).ok);
  assert(recorder->credits.size() == 1);

  const auto post = api.get_post("dave", id);
  assert(post.ok());
  assert(post.value.likes == 1);
  assert(post.value.dislikes == 1);
  assert(api.status().reaction_count == 2);
}

void test_failed_reward_rolls_back_reaction() {
  auto sink = std::make_unique<FailingSink>();
  FailingSink* failing = sink.get();
  chirp::CoreApi api;
  assert(api.init(chirp::EngineConfig{}, std::move(sink)).ok);

  assert(api.create_profile("alice", "Alice", "").ok);
  const chirp::PostId id = api.create_post("alice", "Hello", false).value;
  const auto events_before = api.status().event_count;
  const std::string before = api.status().state_hash;

  const chirp::Result liked = api.react("bob", id, true);
  assert(!liked.ok);
  assert(liked.error == chirp::ErrorKind::RewardFailed);
  assert(failing->attempts == 1);
  assert(api.status().state_hash == before);
  assert(api.status().event_count == events_before);

  const auto post = api.get_post("bob", id);
  assert(post.value.likes == 0);
  assert(post.value.dislikes == 0);

  // Nothing was recorded, so bob may still dislike without touching the sink.
  assert(api.react("bob", id, false).ok);
  assert(failing->attempts == 1);
  assert(api.get_post("bob", id).value.dislikes == 1);
}

void test_ledger_sink_balances() {
  chirp::CoreApi api = make_api();
  assert(api.create_profile("alice", "Alice", "").ok);
  assert(api.create_profile("bob", "Bob", "").ok);
  const chirp::PostId first = api.create_post("alice", "a", false).value;
  const chirp::PostId second = api.create_post("bob", "b", false).value;

  assert(api.react("bob", first, true).ok);
  assert(api.react("carol", first, true).ok);
  assert(api.react("alice", second, true).ok);
  assert(api.react("carol", second, false).ok);

  const std::int64_t unit = api.status().like_reward_units;
  assert(api.reward_balance("alice") == 2 * unit);
  assert(api.reward_balance("bob") == unit);
  assert(api.reward_balance("carol") == 0);

  const auto balances = api.reward_balances();
  assert(balances.size() == 2);
  assert(balances.front().identity == "alice");

  chirp::LedgerRewardSink ledger;
  assert(!ledger.credit("", 5).ok);
  assert(!ledger.credit("x", 0).ok);
  assert(ledger.credit("x", 5).ok);
  assert(ledger.issued_total() == 5);
}

void test_private_posts_follow_visibility() {
  chirp::CoreApi api = make_api();
  assert(api.create_profile("alice", "Alice", "").ok);
  const chirp::PostId id = api.create_post("alice", "secret", true).value;

  const auto denied = api.get_post("bob", id);
  assert(!denied.ok());
  assert(denied.status.error == chirp::ErrorKind::PrivateAccessDenied);

  const auto forbidden = api.add_comment("bob", id, "let me in");
  assert(!forbidden.ok());
  assert(forbidden.status.error == chirp::ErrorKind::CommentForbidden);

  const auto hidden_comments = api.get_comments("bob", id);
  assert(!hidden_comments.ok());
  assert(hidden_comments.status.error == chirp::ErrorKind::PrivateAccessDenied);

  assert(api.get_post("alice", id).ok());
  assert(api.add_comment("alice", id, "note to self").ok());

  assert(api.follow("bob", "alice").ok);
  assert(api.get_post("bob", id).ok());
  const auto added = api.add_comment("bob", id, "hi");
  assert(added.ok());
  assert(added.value == 1);
  assert(api.get_comments("bob", id).value.size() == 2);

  // Visibility is evaluated on every access.
  assert(api.unfollow("bob", "alice").ok);
  assert(api.get_post("bob", id).status.error == chirp::ErrorKind::PrivateAccessDenied);
  assert(api.add_comment("bob", id, "again").status.error == chirp::ErrorKind::CommentForbidden);

  // Reacting does not depend on visibility.
  assert(api.react("bob", id, false).ok);
}

void test_ungated_comment_reads() {
  chirp::CoreApi api;
  assert(api.init({.gate_comment_reads = false}).ok);
  assert(api.create_profile("alice", "Alice", "").ok);
  const chirp::PostId id = api.create_post("alice", "secret", true).value;
  assert(api.add_comment("alice", id, "mine").ok());

  const auto comments = api.get_comments("stranger", id);
  assert(comments.ok());
  assert(comments.value.size() == 1);
  assert(!api.status().gate_comment_reads);
}

void test_comments_in_append_order() {
  chirp::CoreApi api = make_api();
  assert(api.create_profile("alice", "Alice", "").ok);
  const chirp::PostId id = api.create_post("alice", "thread", false).value;

  const auto empty = api.get_comments("bob", id);
  assert(empty.ok());
  assert(empty.value.empty());

  const auto missing = api.get_comments("bob", 42);
  assert(!missing.ok());
  assert(missing.status.error == chirp::ErrorKind::NotFound);
  assert(api.add_comment("bob", 42, "x").status.error == chirp::ErrorKind::NotFound);

  assert(api.add_comment("bob", id, "first").value == 0);
  assert(api.add_comment("carol", id, "second").value == 1);
  assert(api.add_comment("bob", id, "third").value == 2);

  const auto comments = api.get_comments("dave", id);
  assert(comments.value.size() == 3);
  assert(comments.value[0].commenter == "bob" && comments.value[0].content == "first");
  assert(comments.value[1].commenter == "carol");
  assert(comments.value[2].content == "third");
  assert(api.get_post("dave", id).value.comment_count == 3);
}

void test_end_to_end_flow() {
  chirp::CoreApi api = make_api();
  assert(api.create_profile("A", "Alice", "bio").ok);
  const auto post = api.create_post("A", "Hello", false);
  assert(post.ok());

  assert(api.react("B", post.value, true).ok);
  const auto liked = api.get_post("B", post.value);
  assert(liked.value.likes == 1);
  assert(liked.value.dislikes == 0);

  assert(api.add_comment("B", post.value, "Nice!").ok());
  const auto comments = api.get_comments("B", post.value);
  assert(comments.value.size() == 1);
  assert(comments.value.front().commenter == "B");
  assert(comments.value.front().content == "Nice!");
  assert(api.reward_balance("A") == api.status().like_reward_units);
}

void test_events_emitted_once_per_success() {
  chirp::CoreApi api = make_api();
  std::vector<chirp::EventEnvelope> seen;
  assert(api.subscribe([&seen](const chirp::EventEnvelope& event) { seen.push_back(event); }).ok);

  assert(api.create_profile("alice", "Alice", "hi").ok);
  assert(!api.create_profile("alice", "Alice", "hi").ok);
  const chirp::PostId id = api.create_post("alice", "Hello", true).value;
  assert(api.follow("bob", "alice").ok);
  assert(!api.follow("bob", "alice").ok);
  assert(api.react("bob", id, true).ok);
  assert(api.add_comment("bob", id, "Nice").ok());
  assert(api.unfollow("bob", "alice").ok);
  assert(!api.unfollow("bob", "alice").ok);

  assert(seen.size() == 6);
  assert(seen[0].kind == chirp::EventKind::ProfileCreated);
  assert(seen[1].kind == chirp::EventKind::PostCreated);
  assert(seen[2].kind == chirp::EventKind::Followed);
  assert(seen[3].kind == chirp::EventKind::ReactionAdded);
  assert(seen[4].kind == chirp::EventKind::CommentAdded);
  assert(seen[5].kind == chirp::EventKind::Unfollowed);

  const auto profile_fields = chirp::util::parse_canonical_map(seen[0].payload);
  assert(profile_fields.at("identity") == "alice");
  assert(profile_fields.at("username") == "Alice");
  assert(profile_fields.at("bio") == "hi");

  const auto post_fields = chirp::util::parse_canonical_map(seen[1].payload);
  assert(post_fields.at("id") == std::to_string(id));
  assert(post_fields.at("is_private") == "true");

  const auto reaction_fields = chirp::util::parse_canonical_map(seen[3].payload);
  assert(reaction_fields.at("reactor") == "bob");
  assert(reaction_fields.at("liked") == "true");

  const auto follow_fields = chirp::util::parse_canonical_map(seen[2].payload);
  assert(follow_fields.at("follower") == "bob");
  assert(follow_fields.at("target") == "alice");
  assert(seen[2].actor == "bob");

  const auto comment_fields = chirp::util::parse_canonical_map(seen[4].payload);
  assert(comment_fields.at("post_id") == std::to_string(id));
  assert(comment_fields.at("commenter") == "bob");
  assert(comment_fields.at("content") == "Nice");

  const auto unfollow_fields = chirp::util::parse_canonical_map(seen[5].payload);
  assert(unfollow_fields.at("follower") == "bob");
  assert(unfollow_fields.at("target") == "alice");

  for (std::size_t i = 0; i < seen.size(); ++i) {
    assert(seen[i].sequence == i + 1);
    assert(seen[i].event_id.starts_with("evt-"));
    assert(seen[i].event_id.size() == 28);
  }

  const auto tail = api.events_since(4);
  assert(tail.size() == 2);
  assert(tail.front().event_id == seen[4].event_id);
  assert(api.status().event_count == 6);
}

void test_event_log_retains_every_event() {
  chirp::EventLog log;
  for (int i = 0; i < 500; ++i) {
    const std::string follower = "user-" + std::to_string(i);
    log.emit(chirp::EventKind::Followed, follower, i, {{"follower", follower}, {"target", "hub"}});
  }
  assert(log.emitted() == 500);
  assert(log.retained() == 500);
  const auto all = log.since(0);
  assert(all.size() == 500);
  assert(all.front().sequence == 1);
  assert(all.back().sequence == 500);
  assert(log.since(499).size() == 1);
  assert(log.since(500).empty());

  chirp::CoreApi api = make_api();
  assert(api.create_profile("hub", "Hub", "").ok);
  for (int i = 0; i < 200; ++i) {
    assert(api.follow("fan-" + std::to_string(i), "hub").ok);
  }
  assert(api.status().event_count == 201);
  assert(api.events_since(0).size() == api.status().event_count);
  assert(api.events_since(0).front().kind == chirp::EventKind::ProfileCreated);
}

void test_throwing_listener_does_not_undo_commit() {
  chirp::CoreApi api = make_api();
  int delivered = 0;
  assert(api.subscribe([](const chirp::EventEnvelope& event) {
    if (event.kind == chirp::EventKind::ReactionAdded) {
      throw std::runtime_error("listener exploded");
    }
  }).ok);
  assert(api.subscribe([&delivered](const chirp::EventEnvelope&) { ++delivered; }).ok);

  assert(api.create_profile("alice", "Alice", "").ok);
  const chirp::PostId id = api.create_post("alice", "Hello", false).value;
  assert(delivered == 2);

  const chirp::Result liked = api.react("bob", id, true);
  assert(liked.ok);
  assert(delivered == 3);
  assert(api.get_post("bob", id).value.likes == 1);
  assert(api.reward_balance("alice") == api.status().like_reward_units);

  const chirp::EngineStatus status = api.status();
  assert(status.listener_failure_count == 1);
  assert(status.last_listener_error.find("listener exploded") != std::string::npos);
  assert(status.event_count == 3);

  const chirp::Result again = api.react("bob", id, false);
  assert(!again.ok);
  assert(again.error == chirp::ErrorKind::AlreadyReacted);
  assert(api.status().listener_failure_count == 1);
}

void test_service_rejects_invalid_construction() {
  const auto zero_reward =
      chirp::SocialService::create({.like_reward_tokens = 0}, chirp::make_ledger_reward_sink());
  assert(!zero_reward.ok());
  assert(zero_reward.status.error == chirp::ErrorKind::ConfigError);
  assert(zero_reward.value == nullptr);

  const auto too_precise =
      chirp::SocialService::create({.token_decimals = 99}, chirp::make_ledger_reward_sink());
  assert(too_precise.status.error == chirp::ErrorKind::ConfigError);

  const auto no_sink = chirp::SocialService::create(chirp::EngineConfig{}, nullptr);
  assert(!no_sink.ok());
  assert(no_sink.status.error == chirp::ErrorKind::InvalidArgument);

  const auto created =
      chirp::SocialService::create(chirp::EngineConfig{}, chirp::make_ledger_reward_sink());
  assert(created.ok());
  assert(created.value->like_reward_units() == 100000000000LL);
}

void test_config_loading() {
  const auto dir = temp_dir("config");
  const auto path = dir / "chirp.conf";
  {
    std::ofstream out(path);
    out << "# engine settings\n"
        << "like_reward_tokens = 5\n"
        << "token_decimals=2\n"
        << "\n"
        << "gate_comment_reads=off\n";
  }

  const auto loaded = chirp::load_engine_config(path.string());
  assert(loaded.ok());
  assert(loaded.value.like_reward_tokens == 5);
  assert(loaded.value.token_decimals == 2);
  assert(!loaded.value.gate_comment_reads);

  chirp::CoreApi api;
  assert(api.init_from_file(path.string()).ok);
  assert(api.status().like_reward_units == 500);

  assert(chirp::load_engine_config((dir / "missing.conf").string()).status.error ==
         chirp::ErrorKind::ConfigError);
  assert(!chirp::parse_engine_config("token_decimals=99\n").ok());
  assert(!chirp::parse_engine_config("like_reward_tokens=0\n").ok());
  assert(!chirp::parse_engine_config("like_reward_tokens=ten\n").ok());
  assert(!chirp::parse_engine_config("colour=blue\n").ok());
  assert(!chirp::parse_engine_config("event_log_capacity=1\n").ok());
  assert(!chirp::parse_engine_config("gate_comment_reads=maybe\n").ok());
  assert(chirp::parse_engine_config("gate_comment_reads=0\n").value.gate_comment_reads == false);
  assert(!chirp::parse_engine_config("just-a-line\n").ok());
  assert(!chirp::parse_engine_config("like_reward_tokens=9000000000\ntoken_decimals=15\n").ok());
  assert(chirp::parse_engine_config("").ok());

  chirp::CoreApi rejected;
  const chirp::Result bad = rejected.init({.like_reward_tokens = -1});
  assert(!bad.ok);
  assert(bad.error == chirp::ErrorKind::ConfigError);
  assert(!rejected.initialized());
  assert(rejected.create_profile("alice", "Alice", "").error == chirp::ErrorKind::NotInitialized);
}

void test_hash_utilities() {
  assert(chirp::util::initialize_hashing().ok);
  assert(chirp::util::sha256_hex("abc") ==
         "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

  const std::string lower(64, 'a');
  const std::string upper(64, 'A');
  const auto a = chirp::util::identity_from_public_key(upper);
  const auto b = chirp::util::identity_from_public_key(" " + lower + " ");
  assert(a.ok() && b.ok());
  assert(a.value == b.value);
  assert(a.value.starts_with("cid-"));
  assert(a.value.size() == 44);
  assert(chirp::util::identity_from_public_key(std::string(64, 'b')).value != a.value);

  assert(chirp::util::identity_from_public_key("abcd").status.error ==
         chirp::ErrorKind::InvalidArgument);
  assert(!chirp::util::identity_from_public_key(std::string(64, 'z')).ok());
  assert(!chirp::util::identity_from_public_key(std::string(66, 'a')).ok());
  assert(!chirp::util::identity_from_public_key("").ok());

  assert(chirp::util::parse_bool("on") == true);
  assert(chirp::util::parse_bool("0") == false);
  assert(!chirp::util::parse_bool("maybe").has_value());
  assert(!chirp::util::parse_bool("TRUE").has_value());
}

void test_concurrent_callers_are_serialized() {
  chirp::CoreApi api = make_api();
  assert(api.create_profile("author", "Author", "").ok);
  const chirp::PostId id = api.create_post("author", "popular", false).value;

  constexpr int kThreads = 8;
  constexpr int kPerThread = 50;
  std::atomic<int> successes{0};
  std::vector<std::thread> workers;
  for (int t = 0; t < kThreads; ++t) {
    workers.emplace_back([&api, &successes, id, t] {
      for (int i = 0; i < kPerThread; ++i) {
        const std::string me = "user-" + std::to_string(t) + "-" + std::to_string(i);
        if (api.react(me, id, (i % 2) == 0).ok) {
          ++successes;
        }
        // Every thread also races on the same reactor.
        if (api.react("shared", id, true).ok) {
          ++successes;
        }
        (void)api.follow(me, "author");
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }

  const auto post = api.get_post("author", id);
  assert(successes.load() == kThreads * kPerThread + 1);
  assert(post.value.likes + post.value.dislikes ==
         static_cast<std::uint64_t>(kThreads * kPerThread + 1));
  assert(api.status().reaction_count == static_cast<std::size_t>(kThreads * kPerThread + 1));
  assert(api.list_followers("author").size() == static_cast<std::size_t>(kThreads * kPerThread));
}

}  // namespace

int main() {
  test_hash_utilities();
  test_profiles_are_write_once();
  test_posting_requires_profile_and_ids_are_sequential();
  test_follow_graph_rules();
  test_graph_swap_removal_keeps_index_consistent();
  test_reactions_are_single_and_pay_the_author();
  test_failed_reward_rolls_back_reaction();
  test_ledger_sink_balances();
  test_private_posts_follow_visibility();
  test_ungated_comment_reads();
  test_comments_in_append_order();
  test_end_to_end_flow();
  test_events_emitted_once_per_success();
  test_event_log_retains_every_event();
  test_throwing_listener_does_not_undo_commit();
  test_service_rejects_invalid_construction();
  test_config_loading();
  test_concurrent_callers_are_serialized();

  std::cout << "chirp_unit_tests passed\n";
  return 0;
}
