#include <ferry/codec/message_codec.hpp>

#include <boost/endian/conversion.hpp>

#include <algorithm>
#include <array>
#include <iterator>

namespace ferry::codec {

namespace {

struct writer final {
  ferry::schema::bytes_t& out;

  void put(const uint8_t value) { out.push_back(value); }

  void put(const ferry::schema::hash32_t& value) {
    out.insert(std::end(out), std::begin(value), std::end(value));
  }

  void put_u64(const uint64_t value) {
    auto buffer = std::array<uint8_t, 8>{};
    boost::endian::store_big_u64(buffer.data(), value);
    out.insert(std::end(out), std::begin(buffer), std::end(buffer));
  }
};

struct reader final {
  ferry::schema::bytes_view_t in;
  std::size_t offset{1};

  ferry::schema::hash32_t take_hash() {
    auto value = ferry::schema::hash32_t{};
    std::copy_n(in.data() + offset, value.size(), value.data());
    offset += value.size();
    return value;
  }

  uint64_t take_u64() {
    auto value = boost::endian::load_big_u64(in.data() + offset);
    offset += sizeof(uint64_t);
    return value;
  }
};

ferry::schema::message_t read_body(const ferry::schema::message_type_t type,
                                   reader& in) {
  switch (type) {
    case ferry::schema::message_type_t::intent_requirements: {
      auto body = ferry::schema::intent_requirements_t{};
      body.intent_id = in.take_hash();
      body.requester_addr = in.take_hash();
      body.amount_required = in.take_u64();
      body.token_addr = in.take_hash();
      body.solver_addr = in.take_hash();
      body.expiry = in.take_u64();
      return body;
    }
    case ferry::schema::message_type_t::escrow_confirmation: {
      auto body = ferry::schema::escrow_confirmation_t{};
      body.intent_id = in.take_hash();
      body.escrow_id = in.take_hash();
      body.amount_escrowed = in.take_u64();
      body.token_addr = in.take_hash();
      body.creator_addr = in.take_hash();
      return body;
    }
    case ferry::schema::message_type_t::fulfillment_proof:
      break;
  }
  auto body = ferry::schema::fulfillment_proof_t{};
  body.intent_id = in.take_hash();
  body.solver_addr = in.take_hash();
  body.amount_fulfilled = in.take_u64();
  body.timestamp = in.take_u64();
  return body;
}

}  // namespace

ferry::schema::bytes_t encode(const ferry::schema::message_t& message) {
  auto type = ferry::schema::type_of(message);
  auto out = ferry::schema::bytes_t{};
  out.reserve(encoded_size(type));
  auto w = writer{out};
  w.put(static_cast<uint8_t>(type));
  std::visit(overloaded{[&](const ferry::schema::intent_requirements_t& body) {
                          w.put(body.intent_id);
                          w.put(body.requester_addr);
                          w.put_u64(body.amount_required);
                          w.put(body.token_addr);
                          w.put(body.solver_addr);
                          w.put_u64(body.expiry);
                        },
                        [&](const ferry::schema::escrow_confirmation_t& body) {
                          w.put(body.intent_id);
                          w.put(body.escrow_id);
                          w.put_u64(body.amount_escrowed);
                          w.put(body.token_addr);
                          w.put(body.creator_addr);
                        },
                        [&](const ferry::schema::fulfillment_proof_t& body) {
                          w.put(body.intent_id);
                          w.put(body.solver_addr);
                          w.put_u64(body.amount_fulfilled);
                          w.put_u64(body.timestamp);
                        }},
             message);
  return out;
}

std::optional<ferry::schema::message_type_t> peek_type(
    const ferry::schema::bytes_view_t& payload,
    ferry::schema::error_code_t& error) {
  if (payload.empty()) {
    error = ferry::schema::error_code_t::empty_payload;
    return std::nullopt;
  }
  auto type = ferry::schema::try_make_message_type(payload[0]);
  if (!type) {
    error = ferry::schema::error_code_t::unknown_message_type;
    return std::nullopt;
  }
  return type;
}

std::optional<ferry::schema::message_t> try_decode(
    const ferry::schema::bytes_view_t& payload,
    ferry::schema::error_code_t& error) {
  auto type = peek_type(payload, error);
  if (!type) {
    return std::nullopt;
  }
  if (payload.size() != encoded_size(*type)) {
    error = ferry::schema::error_code_t::invalid_length;
    return std::nullopt;
  }
  auto in = reader{payload};
  return read_body(*type, in);
}

std::optional<std::pair<ferry::schema::message_type_t,
                        ferry::schema::intent_id_t>>
peek_prefix(const ferry::schema::bytes_view_t& payload,
            ferry::schema::error_code_t& error) {
  if (payload.size() < kPrefixSize) {
    error = ferry::schema::error_code_t::invalid_payload;
    return std::nullopt;
  }
  auto type = ferry::schema::try_make_message_type(payload[0]);
  if (!type) {
    error = ferry::schema::error_code_t::invalid_payload;
    return std::nullopt;
  }
  auto in = reader{payload};
  return std::pair{*type, in.take_hash()};
}

}  // namespace ferry::codec
