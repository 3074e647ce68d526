#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace flowcap::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using subject_id_t = hash32_t;
using actor_id_t = hash32_t;
using amount_t = boost::multiprecision::uint256_t;
using timestamp_milliseconds_t = uint64_t;
using duration_milliseconds_t = uint64_t;
using epoch_index_t = uint64_t;

inline constexpr auto kMillisecondsPerHour = duration_milliseconds_t{3600000};
inline constexpr auto kDefaultEpochLength = 6 * kMillisecondsPerHour;

/// Largest representable amount; used as the saturated ceiling and as the
/// headroom reported for subjects without a limit.
inline const amount_t& max_amount() {
  static const auto value = std::numeric_limits<amount_t>::max();
  return value;
}

hash32_t make_hash32(const bytes_t& bytes);
hash32_t make_hash32(const std::string& bytes);
hash32_t make_hash32(const std::string_view& bytes);
std::optional<hash32_t> try_make_hash32(const std::string& bytes);
std::optional<hash32_t> try_make_hash32(const std::string_view& bytes);
hash32_t make_zero_hash();

/// Build an identifier from a short human label (at most 32 bytes), zero
/// padded on the right. Used where operators name subjects by ticker.
std::optional<hash32_t> try_make_label_hash(const std::string_view& label);

std::string to_hex(const hash32_t& hash);
std::string to_hex(const bytes_view_t& bytes);

/// Parse a non-negative decimal amount. Rejects signs, separators, and
/// values that do not fit in 256 bits.
std::optional<amount_t> try_make_amount(const std::string_view& decimal);
amount_t make_amount(const std::string_view& decimal);

std::string to_string(const amount_t& amount);

}  // namespace flowcap::schema
