#include <ferry/execution/context.hpp>

#include <utility>

namespace ferry::execution {

void context::emit(std::string type,
                   std::vector<schema::event_attribute_t> attributes) {
  events.push_back(schema::event_t{.type = std::move(type),
                                   .attributes = std::move(attributes)});
}

schema::event_attribute_t make_attribute(std::string key,
                                         std::string value,
                                         const bool index) {
  return schema::event_attribute_t{
      .key = std::move(key), .value = std::move(value), .index = index};
}

schema::event_attribute_t make_attribute(std::string key,
                                         const schema::hash32_t& value,
                                         const bool index) {
  return make_attribute(std::move(key), schema::to_hex(value), index);
}

schema::event_attribute_t make_attribute(std::string key, const uint64_t value) {
  return make_attribute(std::move(key), std::to_string(value), false);
}

}  // namespace ferry::execution
