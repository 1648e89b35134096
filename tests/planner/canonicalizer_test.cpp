#include "planner/canonicalizer.hpp"
#include "planner/plan_assembler.hpp"
#include "planner/plan_json.hpp"

#include <catch2/catch.hpp>

#include <string>
#include <utility>

using detplan::planner::AssemblePlan;
using detplan::planner::Canonicalize;
using detplan::planner::Plan;

namespace json = detplan::core::json;

TEST_CASE("Canonical form sorts keys at every depth", "[planner][canonical]") {
  REQUIRE(Canonicalize(AssemblePlan("Today's news")) ==
          R"({"constraints":{"max_latency_ms":8000,"must_be_reproducible":true},)"
          R"("goal":"fetch_news","original_request":"Today's news","steps":[)"
          R"({"action":"search","id":1,"params":{"query":"Today's news","source":"news_api","top_k":5}},)"
          R"({"action":"summarize","id":2,"params":{"max_items":5,"style":"bullet_points"}}]})");
}

TEST_CASE("Parameter insertion order does not affect equality", "[planner][canonical]") {
  Plan forward = AssemblePlan("Hello there");
  Plan reversed = forward;
  auto& params = reversed.steps[0].params;
  std::swap(params.front(), params.back());

  REQUIRE(detplan::planner::ToJson(forward) != detplan::planner::ToJson(reversed));
  REQUIRE(Canonicalize(forward) == Canonicalize(reversed));
}

TEST_CASE("Structurally different plans differ", "[planner][canonical]") {
  const Plan base = AssemblePlan("Hello there");

  Plan changed_param = base;
  detplan::planner::SetParam(changed_param.steps[0], "top_k", json::MakeNumber(4));
  REQUIRE(Canonicalize(base) != Canonicalize(changed_param));

  Plan reordered = base;
  std::swap(reordered.steps[0], reordered.steps[1]);
  REQUIRE(Canonicalize(base) != Canonicalize(reordered));

  Plan no_budget = base;
  no_budget.constraints.max_latency_ms.reset();
  const std::string text = Canonicalize(no_budget);
  REQUIRE(text.find(R"("max_latency_ms":null)") != std::string::npos);
  REQUIRE(text != Canonicalize(base));
}

TEST_CASE("Non-ASCII text is emitted unescaped", "[planner][canonical]") {
  const std::string request = "R\xC3\xA9sum\xC3\xA9 des news";
  const std::string text = Canonicalize(AssemblePlan(request));
  REQUIRE(text.find(request) != std::string::npos);
  REQUIRE(text.find("\\u00") == std::string::npos);
}

TEST_CASE("Arbitrary documents canonicalize independent of key order", "[planner][canonical]") {
  json::Value lhs;
  json::Value rhs;
  std::string error;
  REQUIRE(json::Parse(R"({"b": {"y": 1.0, "x": [2, "z"]}, "a": null})", lhs, error));
  REQUIRE(json::Parse(R"({"a": null, "b": {"x": [2, "z"], "y": 1}})", rhs, error));
  REQUIRE(Canonicalize(lhs) == R"({"a":null,"b":{"x":[2,"z"],"y":1}})");
  REQUIRE(Canonicalize(lhs) == Canonicalize(rhs));
}
