#pragma once

#include <ferry/schema/primitives.hpp>

#include <optional>

namespace ferry::crypto {

/// True when the linked OpenSSL exposes both ed25519 and secp256k1.
bool available();

bool verify_signature(const ferry::schema::bytes_view_t& message,
                      const ferry::schema::signer_id_t& signer,
                      const ferry::schema::signature_t& signature);

std::optional<ferry::schema::ed25519_signer_id> ed25519_public_key(
    const ferry::schema::ed25519_seed_t& seed);

std::optional<ferry::schema::ed25519_signature_t> sign_ed25519(
    const ferry::schema::bytes_view_t& message,
    const ferry::schema::ed25519_seed_t& seed);

}  // namespace ferry::crypto
