#pragma once

#include <covenant/schema/event.hpp>
#include <covenant/schema/primitives.hpp>
#include <functional>
#include <initializer_list>
#include <string>
#include <utility>

namespace covenant::execution {

/// Answers whether the ambient caller may act as `principal`.
using authorizer_t =
    std::function<bool(const covenant::schema::address_t& principal)>;

/// Fire-and-forget notification sink.
using event_sink_t = std::function<void(const covenant::schema::event_t& event)>;

/// Current ledger time in seconds.
using ledger_clock_t = std::function<covenant::schema::timestamp_seconds_t()>;

/// Reports whether an external party has an open violation against a
/// commitment.
using violation_oracle_t =
    std::function<bool(const covenant::schema::commitment_id_t& commitment_id)>;

/// Collaborators a component is constructed with. Every component gets its own
/// copy; nothing here is process-wide.
struct host final {
  authorizer_t authorizer;
  event_sink_t event_sink;
  ledger_clock_t clock;

  /// False when no authorizer is installed or it rejects `principal`.
  bool require_auth(const covenant::schema::address_t& principal) const;

  /// Deliver `event` to the sink. Anything the sink throws is logged at warn
  /// and never propagates, so committed state is never rolled back by a
  /// publish.
  void publish(const covenant::schema::event_t& event) const;

  /// Ledger time from the installed clock, or the system clock when none.
  covenant::schema::timestamp_seconds_t now() const;
};

/// Build an event with the given topic and attributes; the first attribute is
/// marked indexed.
covenant::schema::event_t make_event(
    std::string topic,
    std::initializer_list<std::pair<std::string, std::string>> attributes);

}  // namespace covenant::execution
