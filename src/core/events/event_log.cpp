#include "core/events/event_log.hpp"

#include <exception>

#include "core/model/app_meta.hpp"
#include "core/util/canonical.hpp"
#include "core/util/hash.hpp"

namespace chirp {

const EventEnvelope& EventLog::emit(EventKind kind, const Identity& actor, std::int64_t unix_ts,
                                    std::vector<std::pair<std::string, std::string>> fields) {
  EventEnvelope event;
  event.sequence = events_.size() + 1U;
  event.kind = kind;
  event.actor = actor;
  event.unix_ts = unix_ts;
  event.payload = util::canonical_join(std::move(fields));
  event.event_id =
      std::string{kEventIdPrefix} +
      util::sha256_hex(std::to_string(event.sequence) + "|" +
                       std::string{event_kind_name(kind)} + "|" + event.payload)
          .substr(0, 24);

  events_.push_back(std::move(event));
  const EventEnvelope& stored = events_.back();
  notify(stored);
  return stored;
}

void EventLog::subscribe(EventListener listener) {
  if (listener) {
    listeners_.push_back(std::move(listener));
  }
}

std::vector<EventEnvelope> EventLog::since(std::uint64_t sequence) const {
  if (sequence >= events_.size()) {
    return {};
  }
  return {events_.begin() + static_cast<std::ptrdiff_t>(sequence), events_.end()};
}

void EventLog::notify(const EventEnvelope& event) {
  for (const auto& listener : listeners_) {
    try {
      listener(event);
    } catch (const std::exception& ex) {
      ++listener_failures_;
      last_listener_error_ = std::string{event.event_id} + ": " + ex.what();
    } catch (...) {
      ++listener_failures_;
      last_listener_error_ = std::string{event.event_id} + ": non-standard exception";
    }
  }
}

}  // namespace chirp
