#include <ferry/execution/token_book.hpp>
#include <ferry/schema/key/ledger_keys.hpp>

#include <spdlog/fmt/fmt.h>

#include <limits>

namespace ferry::execution {

schema::amount_t balance_of(context& ctx,
                            const schema::address_t& token,
                            const schema::address_t& account) {
  return ctx.state
      .get<schema::amount_t>(schema::key::make_balance_key(token, account))
      .value_or(0);
}

schema::operation_result_t mint(context& ctx,
                                const schema::address_t& token,
                                const schema::address_t& account,
                                const schema::amount_t amount) {
  auto balance = balance_of(ctx, token, account);
  if (amount > std::numeric_limits<schema::amount_t>::max() - balance) {
    return schema::make_error_result(schema::error_code_t::amount_overflow,
                                     schema::kCodespaceToken,
                                     "mint overflows balance");
  }
  ctx.state.put(schema::key::make_balance_key(token, account),
                balance + amount);
  ctx.emit("token_minted", {make_attribute("token", token),
                            make_attribute("account", account, true),
                            make_attribute("amount", amount)});
  return {};
}

schema::operation_result_t transfer(context& ctx,
                                    const schema::address_t& token,
                                    const schema::address_t& from,
                                    const schema::address_t& to,
                                    const schema::amount_t amount) {
  auto from_balance = balance_of(ctx, token, from);
  if (from_balance < amount) {
    return schema::make_error_result(
        schema::error_code_t::insufficient_balance, schema::kCodespaceToken,
        fmt::format("balance {} below required {}", from_balance, amount));
  }
  if (from == to || amount == 0) {
    return {};
  }
  auto to_balance = balance_of(ctx, token, to);
  if (amount > std::numeric_limits<schema::amount_t>::max() - to_balance) {
    return schema::make_error_result(schema::error_code_t::amount_overflow,
                                     schema::kCodespaceToken,
                                     "transfer overflows balance");
  }
  ctx.state.put(schema::key::make_balance_key(token, from),
                from_balance - amount);
  ctx.state.put(schema::key::make_balance_key(token, to), to_balance + amount);
  ctx.emit("token_transferred", {make_attribute("token", token),
                                 make_attribute("from", from, true),
                                 make_attribute("to", to, true),
                                 make_attribute("amount", amount)});
  return {};
}

}  // namespace ferry::execution
