#pragma once

#include <flowcap/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

// Schema type: flow error code.
// Flow accounting: stable numeric codes returned in flow_result. Zero is
// success.
namespace flowcap::schema {

enum class flow_error_code : uint32_t {
  ok = 0,
  flow_limit_exceeded = 1,
  length_mismatch = 2,
};

inline constexpr auto kFlowErrorCodeMappings = std::array{
    std::pair<std::string_view, flow_error_code>{"ok", flow_error_code::ok},
    std::pair<std::string_view, flow_error_code>{
        "flow_limit_exceeded", flow_error_code::flow_limit_exceeded},
    std::pair<std::string_view, flow_error_code>{
        "length_mismatch", flow_error_code::length_mismatch},
};

inline constexpr std::string_view to_string(const flow_error_code value) {
  return to_string(value, kFlowErrorCodeMappings).value_or("unknown");
}

}  // namespace flowcap::schema
