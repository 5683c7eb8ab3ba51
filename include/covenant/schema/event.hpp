#pragma once

#include <cstdint>
#include <string>
#include <vector>

// Schema type: event.
// Notification published after a committed mutation (mint, transfer, settle,
// attest, ...). Attributes flagged `index` are meant for consumers that filter
// on them.
namespace covenant::schema {

template <uint16_t Version>
struct event_attribute;

template <>
struct event_attribute<1> final {
  uint16_t version{1};
  std::string key;
  std::string value;
  bool index{};
};

using event_attribute_t = event_attribute<1>;

template <uint16_t Version>
struct event;

template <>
struct event<1> final {
  uint16_t version{1};
  std::string topic;
  std::vector<event_attribute_t> attributes;
};

using event_t = event<1>;

}  // namespace covenant::schema
