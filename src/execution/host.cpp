#include <spdlog/spdlog.h>
#include <chrono>
#include <covenant/execution/host.hpp>
#include <exception>
#include <utility>

namespace covenant::execution {

bool host::require_auth(const covenant::schema::address_t& principal) const {
  if (!authorizer) {
    spdlog::warn("No authorizer installed; denying {}",
                 covenant::schema::to_hex(principal));
    return false;
  }
  return authorizer(principal);
}

void host::publish(const covenant::schema::event_t& event) const {
  if (!event_sink) {
    return;
  }
  try {
    event_sink(event);
  } catch (const std::exception& ex) {
    spdlog::warn("Event sink rejected '{}' event: {}", event.topic, ex.what());
  } catch (...) {
    spdlog::warn("Event sink rejected '{}' event with a non-standard exception",
                 event.topic);
  }
}

covenant::schema::timestamp_seconds_t host::now() const {
  if (clock) {
    return clock();
  }
  auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<covenant::schema::timestamp_seconds_t>(
      std::chrono::duration_cast<std::chrono::seconds>(since_epoch).count());
}

covenant::schema::event_t make_event(
    std::string topic,
    std::initializer_list<std::pair<std::string, std::string>> attributes) {
  auto event = covenant::schema::event_t{};
  event.topic = std::move(topic);
  event.attributes.reserve(attributes.size());
  for (const auto& [key, value] : attributes) {
    event.attributes.push_back(covenant::schema::event_attribute_t{
        .key = key, .value = value, .index = event.attributes.empty()});
  }
  return event;
}

}  // namespace covenant::execution
