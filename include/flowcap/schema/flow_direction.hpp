#pragma once

#include <flowcap/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: flow direction.
// Flow accounting: which side of the boundary volume crosses. Each direction
// is checked against the opposing direction's counter plus the limit.
namespace flowcap::schema {

enum class flow_direction_t : uint8_t {
  outflow = 0,
  inflow = 1,
};

inline constexpr auto kFlowDirectionMappings = std::array{
    std::pair<std::string_view, flow_direction_t>{"out",
                                                  flow_direction_t::outflow},
    std::pair<std::string_view, flow_direction_t>{"in",
                                                  flow_direction_t::inflow},
};

template <>
inline std::optional<flow_direction_t> try_from_string<flow_direction_t>(
    const std::string_view value) {
  return from_string(value, kFlowDirectionMappings);
}

inline constexpr std::string_view to_string(const flow_direction_t value) {
  return to_string(value, kFlowDirectionMappings).value_or("unknown");
}

inline constexpr flow_direction_t opposite(const flow_direction_t value) {
  return value == flow_direction_t::outflow ? flow_direction_t::inflow
                                            : flow_direction_t::outflow;
}

}  // namespace flowcap::schema
