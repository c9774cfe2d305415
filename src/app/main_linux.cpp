#include <cstdint>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "core/api/core_api.hpp"
#include "core/model/app_meta.hpp"
#include "core/util/canonical.hpp"
#include "core/util/hash.hpp"

namespace {

struct Command {
  std::string caller;
  std::string op;
  std::string rest;
};

Command split_command(const std::string& line) {
  Command command;
  std::istringstream in(line);
  in >> command.caller >> command.op;
  std::getline(in, command.rest);
  command.rest = chirp::util::trim_copy(command.rest);
  return command;
}

std::pair<std::string, std::string> split_first(std::string_view text) {
  const std::string trimmed = chirp::util::trim_copy(text);
  const std::size_t space = trimmed.find(' ');
  if (space == std::string::npos) {
    return {trimmed, {}};
  }
  return {trimmed.substr(0, space), chirp::util::trim_copy(trimmed.substr(space + 1))};
}

std::optional<chirp::PostId> parse_post_id(std::string_view text) {
  const auto parsed = chirp::util::parse_int64(text);
  if (!parsed.has_value() || *parsed <= 0) {
    return std::nullopt;
  }
  return static_cast<chirp::PostId>(*parsed);
}

constexpr std::string_view kPublicKeyCallerPrefix = "key:";

// A caller is either a literal identity or key:<hex public key>.
chirp::ValueResult<chirp::Identity> resolve_caller(const std::string& token) {
  if (!token.starts_with(kPublicKeyCallerPrefix)) {
    return chirp::ValueResult<chirp::Identity>::success(token);
  }
  return chirp::util::identity_from_public_key(
      std::string_view{token}.substr(kPublicKeyCallerPrefix.size()));
}

void report(const chirp::Result& result) {
  if (result.ok) {
    std::cout << "ok: " << result.message << '\n';
    return;
  }
  std::cerr << "error[" << chirp::error_kind_name(result.error) << "]: " << result.message << '\n';
}

void print_post(const chirp::PostSnapshot& post) {
  std::cout << "post " << post.id << " by " << post.author << (post.is_private ? " [private]" : "")
            << " likes=" << post.likes << " dislikes=" << post.dislikes
            << " comments=" << post.comment_count << "\n  " << post.content << '\n';
}

void print_help() {
  std::cout << "usage: <caller> <op> [args]\n"
            << "  profile <username> <bio...>     post <content...>\n"
            << "  post-private <content...>       like <post-id>\n"
            << "  dislike <post-id>               comment <post-id> <content...>\n"
            << "  follow <identity>               unfollow <identity>\n"
            << "  show-profile <identity>         show-post <post-id>\n"
            << "  comments <post-id>              followers <identity>\n"
            << "  is-following <target>           balance [identity]\n"
            << "  events [after-sequence]         status\n"
            << "  whoami\n"
            << "<caller> is an identity or key:<hex ed25519 public key>\n";
}

void run_command(chirp::CoreApi& api, const Command& command) {
  const auto resolved = resolve_caller(command.caller);
  if (!resolved.ok()) {
    report(resolved.status);
    return;
  }
  const std::string& caller = resolved.value;
  const std::string& op = command.op;

  if (op == "whoami") {
    std::cout << caller << '\n';
  } else if (op == "profile") {
    const auto [username, bio] = split_first(command.rest);
    report(api.create_profile(caller, username, bio));
  } else if (op == "post" || op == "post-private") {
    const auto created = api.create_post(caller, command.rest, op == "post-private");
    report(created.status);
    if (created.ok()) {
      std::cout << "post-id: " << created.value << '\n';
    }
  } else if (op == "like" || op == "dislike") {
    const auto id = parse_post_id(command.rest);
    if (!id.has_value()) {
      std::cerr << "error: " << op << " requires a numeric post id\n";
      return;
    }
    report(api.react(caller, *id, op == "like"));
  } else if (op == "comment") {
    const auto [id_text, content] = split_first(command.rest);
    const auto id = parse_post_id(id_text);
    if (!id.has_value()) {
      std::cerr << "error: comment requires a numeric post id\n";
      return;
    }
    const auto added = api.add_comment(caller, *id, content);
    report(added.status);
  } else if (op == "follow") {
    report(api.follow(caller, command.rest));
  } else if (op == "unfollow") {
    report(api.unfollow(caller, command.rest));
  } else if (op == "show-profile") {
    const auto profile = api.get_profile(command.rest.empty() ? caller : command.rest);
    if (!profile.has_value()) {
      std::cout << "no profile\n";
      return;
    }
    std::cout << profile->identity << ": " << profile->username << " - " << profile->bio << '\n';
  } else if (op == "show-post") {
    const auto id = parse_post_id(command.rest);
    if (!id.has_value()) {
      std::cerr << "error: show-post requires a numeric post id\n";
      return;
    }
    const auto post = api.get_post(caller, *id);
    if (!post.ok()) {
      report(post.status);
      return;
    }
    print_post(post.value);
  } else if (op == "comments") {
    const auto id = parse_post_id(command.rest);
    if (!id.has_value()) {
      std::cerr << "error: comments requires a numeric post id\n";
      return;
    }
    const auto comments = api.get_comments(caller, *id);
    if (!comments.ok()) {
      report(comments.status);
      return;
    }
    for (std::size_t i = 0; i < comments.value.size(); ++i) {
      std::cout << "#" << i << " " << comments.value[i].commenter << ": "
                << comments.value[i].content << '\n';
    }
  } else if (op == "followers") {
    const std::string target = command.rest.empty() ? caller : command.rest;
    for (const auto& follower : api.list_followers(target)) {
      std::cout << follower << '\n';
    }
  } else if (op == "is-following") {
    std::cout << (api.is_following(command.rest, caller) ? "yes" : "no") << '\n';
  } else if (op == "balance") {
    const std::string target = command.rest.empty() ? caller : command.rest;
    std::cout << target << " balance=" << api.reward_balance(target) << '\n';
  } else if (op == "events") {
    const auto after = chirp::util::parse_int64(command.rest).value_or(0);
    for (const auto& event : api.events_since(static_cast<std::uint64_t>(after < 0 ? 0 : after))) {
      std::cout << event.sequence << ' ' << event.event_id << ' '
                << chirp::event_kind_name(event.kind) << " by " << event.actor << '\n';
    }
  } else if (op == "status") {
    const auto status = api.status();
    std::cout << "profiles=" << status.profile_count << " posts=" << status.post_count
              << " comments=" << status.comment_count << " edges=" << status.follow_edge_count
              << " reactions=" << status.reaction_count << " events=" << status.event_count
              << " like_reward=" << status.like_reward_units << "\nstate=" << status.state_hash
              << '\n';
  } else {
    std::cerr << "error: unknown op '" << op << "'\n";
    print_help();
  }
}

}  // namespace

int main(int argc, char** argv) {
  std::string config_path;
  std::string script_path;
  for (int i = 1; i < argc; ++i) {
    const std::string_view arg{argv[i]};
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--help" || arg == "-h") {
      print_help();
      return 0;
    } else {
      script_path = std::string{arg};
    }
  }

  chirp::CoreApi api;
  const chirp::Result init =
      config_path.empty() ? api.init(chirp::EngineConfig{}) : api.init_from_file(config_path);
  if (!init.ok) {
    std::cerr << "chirp init failed: " << init.message << '\n';
    return 1;
  }

  std::ifstream script;
  if (!script_path.empty()) {
    script.open(script_path);
    if (!script) {
      std::cerr << "chirp: unable to open script " << script_path << '\n';
      return 1;
    }
  }
  std::istream& in = script_path.empty() ? std::cin : script;

  std::cout << chirp::kAppDisplayName << ' ' << chirp::kAppVersion << " (" << chirp::kBuildRelease
            << ")\n";
  std::string line;
  while (std::getline(in, line)) {
    const std::string trimmed = chirp::util::trim_copy(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    const Command command = split_command(trimmed);
    if (command.op.empty()) {
      print_help();
      continue;
    }
    run_command(api, command);
  }
  return 0;
}
