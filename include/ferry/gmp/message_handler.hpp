#pragma once
#include <ferry/execution/context.hpp>
#include <ferry/schema/message.hpp>
#include <ferry/schema/operation_result.hpp>
#include <ferry/schema/primitives.hpp>

namespace ferry::gmp {

/// A local module the endpoint routes decoded messages to. A handler that
/// returns a failure aborts the whole delivery.
class message_handler {
 public:
  virtual ~message_handler() = default;

  virtual const schema::address_t& address() const = 0;

  virtual schema::operation_result_t on_message(
      execution::context& ctx,
      schema::chain_id_t src_chain_id,
      const schema::address_t& src_addr,
      const schema::message_t& message) = 0;
};

}  // namespace ferry::gmp
