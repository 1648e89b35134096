#pragma once

#include "core/json_dom.hpp"
#include "planner/plan_model.hpp"

#include <string>

namespace detplan::planner {

// DOM view of a plan with every object key-sorted. Parameter insertion order
// is dropped here; step order is kept because it is execution order.
core::json::Value ToJsonValue(const Plan& plan);

// Equality oracle for plans.
//
// Output is compact JSON with keys in byte-wise ascending order at every depth,
// integral numbers without a fraction and non-ASCII bytes unescaped.
// Structurally equal plans always produce identical text and structurally
// different plans produce different text.
std::string Canonicalize(const Plan& plan);

// Same rules for an arbitrary JSON document.
std::string Canonicalize(const core::json::Value& value);

} // namespace detplan::planner
