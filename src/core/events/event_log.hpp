#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "core/model/types.hpp"

namespace chirp {

using EventListener = std::function<void(const EventEnvelope&)>;

// Every emitted envelope is retained for the lifetime of the log.
class EventLog {
public:
  // Assigns sequence and event id, retains the envelope and notifies
  // listeners in subscription order. The envelope is committed before any
  // listener runs; a listener that throws is counted and skipped, and the
  // remaining listeners still run.
  const EventEnvelope& emit(EventKind kind, const Identity& actor, std::int64_t unix_ts,
                            std::vector<std::pair<std::string, std::string>> fields);

  void subscribe(EventListener listener);

  [[nodiscard]] std::vector<EventEnvelope> since(std::uint64_t sequence) const;
  [[nodiscard]] std::size_t retained() const { return events_.size(); }
  [[nodiscard]] std::uint64_t emitted() const { return events_.size(); }
  [[nodiscard]] std::uint64_t listener_failures() const { return listener_failures_; }
  [[nodiscard]] const std::string& last_listener_error() const { return last_listener_error_; }

private:
  void notify(const EventEnvelope& event);

  std::vector<EventEnvelope> events_;
  std::vector<EventListener> listeners_;
  std::uint64_t listener_failures_ = 0;
  std::string last_listener_error_;
};

}  // namespace chirp
