#pragma once

#include <ferry/schema/error_code.hpp>
#include <ferry/schema/event.hpp>
#include <ferry/schema/primitives.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ferry::schema {

inline constexpr auto kCodespaceEndpoint = std::string_view{"ferry.endpoint"};
inline constexpr auto kCodespaceEscrow = std::string_view{"ferry.escrow"};
inline constexpr auto kCodespaceOutflow = std::string_view{"ferry.outflow"};
inline constexpr auto kCodespaceHub = std::string_view{"ferry.hub"};
inline constexpr auto kCodespaceToken = std::string_view{"ferry.token"};
inline constexpr auto kCodespaceNode = std::string_view{"ferry.node"};

template <uint16_t Version>
struct operation_result;

template <>
struct operation_result<1> final {
  error_code_t code{error_code_t::ok};
  bytes_t data;
  std::string log;
  std::string codespace;
  std::vector<event_t> events;

  bool ok() const { return code == error_code_t::ok; }
};

using operation_result_t = operation_result<1>;

inline operation_result_t make_error_result(const error_code_t code,
                                            const std::string_view codespace,
                                            std::string log) {
  auto result = operation_result_t{};
  result.code = code;
  result.codespace = std::string{codespace};
  result.log = std::move(log);
  return result;
}

}  // namespace ferry::schema
