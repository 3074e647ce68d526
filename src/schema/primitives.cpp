#include <flowcap/common/critical.hpp>
#include <flowcap/schema/primitives.hpp>

#include <algorithm>
#include <iterator>
#include <string_view>

namespace flowcap::schema {

namespace {

std::string_view normalize_hex(std::string_view input) {
  if (input.size() >= 2 && input[0] == '0' &&
      (input[1] == 'x' || input[1] == 'X')) {
    input.remove_prefix(2);
  }
  return input;
}

std::optional<uint8_t> hex_nibble(const char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  }
  if (c >= 'a' && c <= 'f') {
    return static_cast<uint8_t>(c - 'a' + 10);
  }
  if (c >= 'A' && c <= 'F') {
    return static_cast<uint8_t>(c - 'A' + 10);
  }
  return std::nullopt;
}

std::optional<hash32_t> try_make_hash32_internal(std::string_view input) {
  auto hex = normalize_hex(input);

  // A bare 32 character string is taken verbatim as the identifier bytes.
  if (hex.size() == 32 && hex.size() == input.size()) {
    auto hash = hash32_t{};
    std::copy_n(std::begin(hex), hash.size(), std::begin(hash));
    return hash;
  }
  if (hex.size() != 64) {
    return std::nullopt;
  }

  auto hash = hash32_t{};
  for (size_t i = 0; i < hash.size(); ++i) {
    auto high = hex_nibble(hex[2 * i]);
    auto low = hex_nibble(hex[(2 * i) + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    hash[i] = static_cast<uint8_t>((*high << 4u) | *low);
  }
  return hash;
}

}  // namespace

hash32_t make_hash32(const bytes_t& bytes) {
  if (bytes.size() != 32) {
    flowcap::common::critical("make_hash32 expected exactly 32 bytes");
  }
  auto hash = hash32_t{};
  std::copy(std::begin(bytes), std::end(bytes), std::begin(hash));
  return hash;
}

hash32_t make_hash32(const std::string& bytes) {
  return make_hash32(std::string_view{bytes});
}

hash32_t make_hash32(const std::string_view& bytes) {
  auto hash = try_make_hash32_internal(bytes);
  if (!hash) {
    flowcap::common::critical("invalid hash32 input '{}'", bytes);
  }
  return *hash;
}

std::optional<hash32_t> try_make_hash32(const std::string& bytes) {
  return try_make_hash32_internal(bytes);
}

std::optional<hash32_t> try_make_hash32(const std::string_view& bytes) {
  return try_make_hash32_internal(bytes);
}

hash32_t make_zero_hash() {
  return {};
}

std::optional<hash32_t> try_make_label_hash(const std::string_view& label) {
  auto hash = hash32_t{};
  if (label.empty() || label.size() > hash.size()) {
    return std::nullopt;
  }
  std::copy(std::begin(label), std::end(label), std::begin(hash));
  return hash;
}

std::string to_hex(const hash32_t& hash) {
  return to_hex(bytes_view_t{hash.data(), hash.size()});
}

std::string to_hex(const bytes_view_t& bytes) {
  static constexpr auto kHex = std::string_view{"0123456789abcdef"};
  auto out = std::string{};
  out.resize(bytes.size() * 2);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    out[(2 * i)] = kHex[(bytes[i] >> 4u) & 0x0Fu];
    out[(2 * i) + 1] = kHex[bytes[i] & 0x0Fu];
  }
  return out;
}

std::optional<amount_t> try_make_amount(const std::string_view& decimal) {
  if (decimal.empty()) {
    return std::nullopt;
  }

  static const auto kTen = amount_t{10};
  auto value = amount_t{};
  for (const auto ch : decimal) {
    if (ch < '0' || ch > '9') {
      return std::nullopt;
    }
    auto digit = amount_t{static_cast<unsigned>(ch - '0')};
    if (value > (max_amount() - digit) / kTen) {
      return std::nullopt;
    }
    value = (value * kTen) + digit;
  }
  return value;
}

amount_t make_amount(const std::string_view& decimal) {
  auto amount = try_make_amount(decimal);
  if (!amount) {
    flowcap::common::critical("invalid amount '{}'", decimal);
  }
  return *amount;
}

std::string to_string(const amount_t& amount) {
  return amount.str();
}

}  // namespace flowcap::schema
