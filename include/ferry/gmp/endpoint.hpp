#pragma once
#include <ferry/execution/context.hpp>
#include <ferry/gmp/message_handler.hpp>
#include <ferry/schema/endpoint_records.hpp>
#include <ferry/schema/message_type.hpp>
#include <ferry/schema/operation_result.hpp>
#include <ferry/schema/outbound_message.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <vector>

namespace ferry::gmp {

/// Per-chain GMP endpoint. Holds the relay allow-list, the trusted remote
/// addresses per source chain, the message routes, the delivery ledger and the
/// outbound mailbox. All state lives in the operation's write set.
class endpoint final {
 public:
  explicit endpoint(schema::address_t admin);

  endpoint(const endpoint&) = delete;
  endpoint& operator=(const endpoint&) = delete;

  const schema::address_t& admin() const { return admin_; }

  /// Binds a handler address to an in-process module. Routes name handlers
  /// by address only.
  void register_handler(message_handler& handler);
  bool is_local_handler(const schema::address_t& address) const;

  /// First run only: the admin becomes the first relay and the outbound nonce
  /// starts at 1.
  void initialize(execution::context& ctx);

  schema::operation_result_t add_relay(execution::context& ctx,
                                       const schema::address_t& relay);
  schema::operation_result_t remove_relay(execution::context& ctx,
                                          const schema::address_t& relay);
  bool is_relay_authorized(execution::context& ctx,
                           const schema::address_t& relay) const;

  /// Replaces every trusted address for `chain_id`.
  schema::operation_result_t set_remote_endpoint(
      execution::context& ctx,
      schema::chain_id_t chain_id,
      const schema::address_t& address);
  schema::operation_result_t add_remote_endpoint(
      execution::context& ctx,
      schema::chain_id_t chain_id,
      const schema::address_t& address);
  std::vector<schema::address_t> remote_endpoints(
      execution::context& ctx,
      schema::chain_id_t chain_id) const;
  bool has_remote_endpoint(execution::context& ctx,
                           schema::chain_id_t chain_id) const;

  /// An empty handler list stores a deliberate no-op route.
  schema::operation_result_t set_handlers(
      execution::context& ctx,
      schema::message_type_t type,
      std::vector<schema::address_t> handlers);
  std::optional<schema::handler_binding_t> handlers(
      execution::context& ctx,
      schema::message_type_t type) const;

  schema::operation_result_t deliver(execution::context& ctx,
                                     schema::chain_id_t src_chain_id,
                                     const schema::address_t& src_addr,
                                     const schema::bytes_view_t& payload);

  /// Appends to the outbound mailbox. On success `data` carries the assigned
  /// nonce, 8 bytes big-endian.
  schema::operation_result_t send(execution::context& ctx,
                                  const schema::address_t& sender,
                                  schema::chain_id_t dst_chain_id,
                                  const schema::address_t& dst_addr,
                                  const schema::bytes_view_t& payload);

  /// Mailbox entries with nonce > `after`, oldest first.
  std::vector<schema::outbound_message_t> list_outbound(
      execution::context& ctx,
      schema::nonce_t after,
      std::size_t limit) const;
  schema::nonce_t next_nonce(execution::context& ctx) const;

  bool is_delivered(execution::context& ctx,
                    const schema::intent_id_t& intent_id,
                    schema::message_type_t type) const;

 private:
  bool is_admin(const execution::context& ctx) const;

  schema::address_t admin_;
  std::map<schema::address_t, message_handler*> handlers_;
};

/// Nonce assigned by a successful send().
std::optional<schema::nonce_t> sent_nonce(
    const schema::operation_result_t& result);

}  // namespace ferry::gmp
