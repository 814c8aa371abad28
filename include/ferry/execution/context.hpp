#pragma once
#include <ferry/execution/write_set.hpp>
#include <ferry/schema/event.hpp>
#include <ferry/schema/primitives.hpp>

#include <string>
#include <vector>

namespace ferry::execution {

/// One operation against one chain: the pending state, the block time it
/// executes at, and the authenticated caller.
struct context final {
  write_set& state;
  schema::chain_id_t chain_id{};
  schema::timestamp_seconds_t now{};
  schema::address_t caller{};
  std::vector<schema::event_t> events;

  void emit(std::string type, std::vector<schema::event_attribute_t> attributes);
};

schema::event_attribute_t make_attribute(std::string key,
                                         std::string value,
                                         bool index = false);
schema::event_attribute_t make_attribute(std::string key,
                                         const schema::hash32_t& value,
                                         bool index = false);
schema::event_attribute_t make_attribute(std::string key, uint64_t value);

}  // namespace ferry::execution
