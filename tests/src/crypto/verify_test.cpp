#include <ferry/crypto/verify.hpp>
#include <ferry/relay/delivery_signature.hpp>
#include <ferry/testing/common.hpp>
#include <gtest/gtest.h>
#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>

#include <array>
#include <optional>
#include <vector>

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#endif

namespace {

struct secp_fixture_t final {
  ferry::schema::secp256k1_signer_id signer;
  ferry::schema::secp256k1_signature_t signature;
  std::vector<uint8_t> message;
};

// Signs `message` with a fresh secp256k1 key and returns [v || r || s].
std::optional<secp_fixture_t> make_secp_fixture(std::vector<uint8_t> message) {
  auto* ec_key = EC_KEY_new_by_curve_name(NID_secp256k1);
  if (ec_key == nullptr) {
    return std::nullopt;
  }
  if (EC_KEY_generate_key(ec_key) != 1) {
    EC_KEY_free(ec_key);
    return std::nullopt;
  }
  EC_KEY_set_conv_form(ec_key, POINT_CONVERSION_COMPRESSED);

  auto compressed = std::array<uint8_t, 33>{};
  auto* pub_ptr = compressed.data();
  if (i2o_ECPublicKey(ec_key, &pub_ptr) != static_cast<int>(compressed.size())) {
    EC_KEY_free(ec_key);
    return std::nullopt;
  }

  auto* pkey = EVP_PKEY_new();
  if (pkey == nullptr || EVP_PKEY_assign_EC_KEY(pkey, ec_key) != 1) {
    EVP_PKEY_free(pkey);
    EC_KEY_free(ec_key);
    return std::nullopt;
  }

  auto* sign_ctx = EVP_MD_CTX_new();
  auto der_size = size_t{};
  auto der = std::vector<uint8_t>{};
  auto signed_ok =
      sign_ctx != nullptr &&
      EVP_DigestSignInit(sign_ctx, nullptr, EVP_sha256(), nullptr, pkey) == 1 &&
      EVP_DigestSign(sign_ctx, nullptr, &der_size, message.data(),
                     message.size()) == 1;
  if (signed_ok) {
    der.resize(der_size);
    signed_ok = EVP_DigestSign(sign_ctx, der.data(), &der_size, message.data(),
                               message.size()) == 1;
  }
  EVP_MD_CTX_free(sign_ctx);
  EVP_PKEY_free(pkey);
  if (!signed_ok) {
    return std::nullopt;
  }

  const auto* der_ptr = static_cast<const unsigned char*>(der.data());
  auto* sig = d2i_ECDSA_SIG(nullptr, &der_ptr, static_cast<long>(der_size));
  if (sig == nullptr) {
    return std::nullopt;
  }
  const auto* r = static_cast<const BIGNUM*>(nullptr);
  const auto* s = static_cast<const BIGNUM*>(nullptr);
  ECDSA_SIG_get0(sig, &r, &s);

  auto compact = ferry::schema::secp256k1_signature_t{};
  compact[0] = 0;
  auto ok_r = BN_bn2binpad(r, compact.data() + 1, 32);
  auto ok_s = BN_bn2binpad(s, compact.data() + 33, 32);
  ECDSA_SIG_free(sig);
  if (ok_r != 32 || ok_s != 32) {
    return std::nullopt;
  }

  return secp_fixture_t{
      .signer = ferry::schema::secp256k1_signer_id{.public_key = compressed},
      .signature = compact,
      .message = std::move(message)};
}

ferry::schema::ed25519_seed_t make_seed(const uint8_t seed) {
  return ferry::testing::make_hash(seed);
}

}  // namespace

TEST(crypto_verify, verifies_ed25519_signatures) {
  if (!ferry::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto seed = make_seed(0x11);
  auto signer = ferry::crypto::ed25519_public_key(seed);
  ASSERT_TRUE(signer.has_value());

  auto message = std::vector<uint8_t>{'f', 'e', 'r', 'r', 'y'};
  auto signature = ferry::crypto::sign_ed25519(
      ferry::schema::bytes_view_t{message.data(), message.size()}, seed);
  ASSERT_TRUE(signature.has_value());

  EXPECT_TRUE(ferry::crypto::verify_signature(
      ferry::schema::bytes_view_t{message.data(), message.size()},
      ferry::schema::signer_id_t{*signer},
      ferry::schema::signature_t{*signature}));

  message[0] ^= 0x01;
  EXPECT_FALSE(ferry::crypto::verify_signature(
      ferry::schema::bytes_view_t{message.data(), message.size()},
      ferry::schema::signer_id_t{*signer},
      ferry::schema::signature_t{*signature}));
}

TEST(crypto_verify, ed25519_keys_are_deterministic_per_seed) {
  if (!ferry::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto first = ferry::crypto::ed25519_public_key(make_seed(0x21));
  auto again = ferry::crypto::ed25519_public_key(make_seed(0x21));
  auto other = ferry::crypto::ed25519_public_key(make_seed(0x22));
  ASSERT_TRUE(first && again && other);
  EXPECT_EQ(first->public_key, again->public_key);
  EXPECT_NE(first->public_key, other->public_key);
}

TEST(crypto_verify, verifies_secp256k1_signatures) {
  if (!ferry::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto fixture = make_secp_fixture({'s', 'e', 'c', 'p', '-', 'm', 's', 'g'});
  ASSERT_TRUE(fixture.has_value());
  auto message = ferry::schema::bytes_view_t{fixture->message.data(),
                                             fixture->message.size()};

  EXPECT_TRUE(ferry::crypto::verify_signature(
      message, ferry::schema::signer_id_t{fixture->signer},
      ferry::schema::signature_t{fixture->signature}));

  auto tampered = fixture->message;
  tampered[0] ^= 0x01;
  EXPECT_FALSE(ferry::crypto::verify_signature(
      ferry::schema::bytes_view_t{tampered.data(), tampered.size()},
      ferry::schema::signer_id_t{fixture->signer},
      ferry::schema::signature_t{fixture->signature}));
}

TEST(crypto_verify, rejects_mismatched_signer_and_signature_variants) {
  auto ed_signer = ferry::schema::ed25519_signer_id{};
  ed_signer.public_key[0] = 1;
  auto secp_signature = ferry::schema::secp256k1_signature_t{};

  EXPECT_FALSE(ferry::crypto::verify_signature(
      ferry::schema::bytes_view_t{}, ferry::schema::signer_id_t{ed_signer},
      ferry::schema::signature_t{secp_signature}));
}

TEST(crypto_verify, delivery_signature_binds_source_chain) {
  if (!ferry::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto seed = make_seed(0x31);
  auto relay = ferry::crypto::ed25519_public_key(seed);
  ASSERT_TRUE(relay.has_value());
  auto src_addr = ferry::testing::make_hash(0x10);
  auto payload = ferry::schema::bytes_t{0x03, 0x04, 0x05};

  auto signed_bytes = ferry::relay::make_delivery_signing_bytes(
      1, 30, src_addr, ferry::schema::make_bytes_view(payload));
  ASSERT_EQ(signed_bytes.size(), 4u + 4u + 32u + payload.size());
  EXPECT_EQ(signed_bytes[3], 0x01);
  EXPECT_EQ(signed_bytes[7], 30);

  auto signature = ferry::crypto::sign_ed25519(
      ferry::schema::make_bytes_view(signed_bytes), seed);
  ASSERT_TRUE(signature.has_value());

  auto other_chain = ferry::relay::make_delivery_signing_bytes(
      2, 30, src_addr, ferry::schema::make_bytes_view(payload));
  EXPECT_FALSE(ferry::crypto::verify_signature(
      ferry::schema::make_bytes_view(other_chain),
      ferry::schema::signer_id_t{*relay},
      ferry::schema::signature_t{*signature}));
  EXPECT_TRUE(ferry::crypto::verify_signature(
      ferry::schema::make_bytes_view(signed_bytes),
      ferry::schema::signer_id_t{*relay},
      ferry::schema::signature_t{*signature}));
}

TEST(crypto_verify, delivery_signature_binds_destination_chain) {
  if (!ferry::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto seed = make_seed(0x32);
  auto relay = ferry::crypto::ed25519_public_key(seed);
  ASSERT_TRUE(relay.has_value());
  auto src_addr = ferry::testing::make_hash(0x10);
  auto payload = ferry::schema::bytes_t{0x03, 0x04, 0x05};
  auto view = ferry::schema::make_bytes_view(payload);

  auto signed_bytes =
      ferry::relay::make_delivery_signing_bytes(1, 30, src_addr, view);
  auto signature = ferry::crypto::sign_ed25519(
      ferry::schema::make_bytes_view(signed_bytes), seed);
  ASSERT_TRUE(signature.has_value());

  auto accepted = ferry::relay::verify_delivery_signature(
      30, 1, 30, src_addr, view, *relay, *signature);
  EXPECT_TRUE(accepted.ok());

  // Replayed to chain 31 with the original destination field.
  auto replayed = ferry::relay::verify_delivery_signature(
      31, 1, 30, src_addr, view, *relay, *signature);
  EXPECT_EQ(replayed.code,
            ferry::schema::error_code_t::wrong_destination_chain);

  // Replayed to chain 31 with the destination field rewritten.
  auto rewritten = ferry::relay::verify_delivery_signature(
      31, 1, 31, src_addr, view, *relay, *signature);
  EXPECT_EQ(rewritten.code, ferry::schema::error_code_t::invalid_signature);
}

#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif
