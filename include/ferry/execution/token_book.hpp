#pragma once
#include <ferry/execution/context.hpp>
#include <ferry/schema/operation_result.hpp>
#include <ferry/schema/primitives.hpp>

// Fungible balances per (token, account). Custody accounts are module
// addresses.
namespace ferry::execution {

schema::amount_t balance_of(context& ctx,
                            const schema::address_t& token,
                            const schema::address_t& account);

schema::operation_result_t mint(context& ctx,
                                const schema::address_t& token,
                                const schema::address_t& account,
                                schema::amount_t amount);

schema::operation_result_t transfer(context& ctx,
                                    const schema::address_t& token,
                                    const schema::address_t& from,
                                    const schema::address_t& to,
                                    schema::amount_t amount);

}  // namespace ferry::execution
