#pragma once
#include <ferry/schema/primitives.hpp>

#include <cstdint>
#include <vector>

namespace ferry::schema {

template <uint16_t Version>
struct remote_endpoints;

// Trusted source addresses for one remote chain.
template <>
struct remote_endpoints<1> final {
  std::vector<address_t> addresses;

  bool operator==(const remote_endpoints&) const = default;
};

using remote_endpoints_t = remote_endpoints<1>;

template <uint16_t Version>
struct handler_binding;

// Local handlers a message type is routed to. A stored binding with no
// handlers is a deliberate no-op route.
template <>
struct handler_binding<1> final {
  std::vector<address_t> handlers;

  bool operator==(const handler_binding&) const = default;
};

using handler_binding_t = handler_binding<1>;

}  // namespace ferry::schema
