#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace ferry::schema {

template <uint16_t Version>
struct event_attribute;

template <>
struct event_attribute<1> final {
  std::string key;
  std::string value;
  bool index{};
};

using event_attribute_t = event_attribute<1>;

template <uint16_t Version>
struct event;

// Emitted by a state transition. Only committed transitions publish their
// events.
template <>
struct event<1> final {
  std::string type;
  std::vector<event_attribute_t> attributes;

  const std::string* find(const std::string& key) const {
    for (const auto& attribute : attributes) {
      if (attribute.key == key) {
        return &attribute.value;
      }
    }
    return nullptr;
  }
};

using event_t = event<1>;

}  // namespace ferry::schema
