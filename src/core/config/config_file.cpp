#include "core/config/config_file.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <utility>

#include "core/rewards/reward_sink.hpp"
#include "core/util/canonical.hpp"

namespace chirp {
namespace {

ValueResult<EngineConfig> config_error(std::string message) {
  return ValueResult<EngineConfig>::failure(
      Result::failure(ErrorKind::ConfigError, std::move(message)));
}

}  // namespace

ValueResult<EngineConfig> parse_engine_config(std::string_view text) {
  std::string filtered;
  std::istringstream lines{std::string{text}};
  std::string line;
  std::size_t line_number = 0;
  while (std::getline(lines, line)) {
    ++line_number;
    const std::string trimmed = util::trim_copy(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    if (trimmed.find('=') == std::string::npos) {
      return config_error("Config line " + std::to_string(line_number) + " is missing '='.");
    }
    filtered += trimmed;
    filtered.push_back('\n');
  }

  EngineConfig config;
  for (const auto& [raw_key, value] : util::parse_canonical_map(filtered)) {
    const std::string key = util::trim_copy(raw_key);
    if (key == "like_reward_tokens") {
      const auto parsed = util::parse_int64(value);
      if (!parsed.has_value()) {
        return config_error("like_reward_tokens is not an integer: " + value);
      }
      config.like_reward_tokens = *parsed;
    } else if (key == "token_decimals") {
      const auto parsed = util::parse_int64(value);
      if (!parsed.has_value() || *parsed < 0 || *parsed > kMaxTokenDecimals) {
        return config_error("token_decimals is out of range: " + value);
      }
      config.token_decimals = static_cast<int>(*parsed);
    } else if (key == "gate_comment_reads") {
      const auto parsed = util::parse_bool(value);
      if (!parsed.has_value()) {
        return config_error("gate_comment_reads is not a boolean: " + value);
      }
      config.gate_comment_reads = *parsed;
    } else {
      return config_error("Unknown config key: " + key);
    }
  }

  if (const Result valid = validate_engine_config(config); !valid.ok) {
    return ValueResult<EngineConfig>::failure(valid);
  }
  return ValueResult<EngineConfig>::success(config, "Config parsed.");
}

ValueResult<EngineConfig> load_engine_config(std::string_view path) {
  const std::filesystem::path file{std::string{path}};
  std::error_code ec;
  if (!std::filesystem::is_regular_file(file, ec)) {
    return config_error("Config file not found: " + file.string());
  }

  std::ifstream in(file, std::ios::binary);
  if (!in) {
    return config_error("Unable to open config file: " + file.string());
  }
  std::ostringstream contents;
  contents << in.rdbuf();
  return parse_engine_config(contents.str());
}

Result validate_engine_config(const EngineConfig& config) {
  const auto units = reward_units(config.like_reward_tokens, config.token_decimals);
  if (!units.ok()) {
    return units.status;
  }
  return Result::success();
}

}  // namespace chirp
