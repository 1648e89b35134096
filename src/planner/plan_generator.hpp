#pragma once

#include "planner/plan_model.hpp"

#include <string>
#include <string_view>

namespace detplan::planner {

// Shared planning contract used by the reproducibility harness.
//
// The harness has no preference between implementations: the deterministic
// assembler, the drift baseline and the remote-agent placeholder all plug in
// here and are compared through the same canonicalization path.
class IPlanGenerator {
public:
  virtual ~IPlanGenerator() = default;

  // Short identifier for logs and reports ("deterministic", "drift", ...).
  virtual std::string_view Name() const = 0;

  // Produces one plan for `request`.
  //
  // Contract:
  // - true: `plan` holds a freshly built plan, `error` is cleared.
  // - false: `plan` is unspecified and `error` says why no plan exists.
  // No determinism is promised by the interface itself.
  virtual bool Generate(std::string_view request, Plan& plan, std::string& error) = 0;
};

} // namespace detplan::planner
