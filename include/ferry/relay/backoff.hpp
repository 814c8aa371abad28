#pragma once

#include <chrono>
#include <cstdint>

namespace ferry::relay {

/// Exponential retry delay. Attempts are never capped, only the delay is.
struct backoff_policy final {
  std::chrono::milliseconds base{500};
  std::chrono::milliseconds max{30000};

  std::chrono::milliseconds delay(uint32_t failures) const {
    auto delay = base;
    for (auto i = uint32_t{1}; i < failures && delay < max; ++i) {
      delay *= 2;
    }
    return delay < max ? delay : max;
  }
};

}  // namespace ferry::relay
