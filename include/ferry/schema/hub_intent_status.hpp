#pragma once

#include <ferry/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace ferry::schema {

enum class intent_flow_t : uint8_t { inflow = 0, outflow = 1 };

// requirements_sent -> escrow_confirmed -> fulfilled (inflow)
// requirements_sent -> fulfilled | cancelled (outflow)
enum class hub_intent_status_t : uint8_t {
  requirements_sent = 0,
  escrow_confirmed = 1,
  fulfilled = 2,
  cancelled = 3
};

inline constexpr auto kIntentFlowMappings =
    std::array{enum_mapping_t<intent_flow_t>{"inflow", intent_flow_t::inflow},
               enum_mapping_t<intent_flow_t>{"outflow", intent_flow_t::outflow}};

inline constexpr auto kHubIntentStatusMappings = std::array{
    enum_mapping_t<hub_intent_status_t>{"requirements_sent",
                                        hub_intent_status_t::requirements_sent},
    enum_mapping_t<hub_intent_status_t>{"escrow_confirmed",
                                        hub_intent_status_t::escrow_confirmed},
    enum_mapping_t<hub_intent_status_t>{"fulfilled",
                                        hub_intent_status_t::fulfilled},
    enum_mapping_t<hub_intent_status_t>{"cancelled",
                                        hub_intent_status_t::cancelled}};

template <>
inline std::optional<intent_flow_t> try_from_string<intent_flow_t>(
    const std::string_view value) {
  return from_string(value, kIntentFlowMappings);
}

inline constexpr std::string_view to_string(const intent_flow_t value) {
  return to_string(value, kIntentFlowMappings).value_or("unknown");
}

inline constexpr std::string_view to_string(const hub_intent_status_t value) {
  return to_string(value, kHubIntentStatusMappings).value_or("unknown");
}

}  // namespace ferry::schema
