#pragma once

#include <flowcap/schema/flow_error_code.hpp>
#include <flowcap/schema/flow_limit_exceeded.hpp>
#include <cstdint>
#include <optional>
#include <string>

// Schema type: flow result.
// Flow accounting: outcome envelope of record and batch calls. A non-zero
// code means nothing was mutated.
namespace flowcap::schema {

template <uint16_t Version>
struct flow_result;

template <>
struct flow_result<1> final {
  uint16_t version{1};
  flow_error_code code{flow_error_code::ok};
  std::string log;
  std::string codespace;
  std::optional<flow_limit_exceeded_t> exceeded;

  bool ok() const { return code == flow_error_code::ok; }
  explicit operator bool() const { return ok(); }
};

using flow_result_t = flow_result<1>;

}  // namespace flowcap::schema
