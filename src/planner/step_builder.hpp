#pragma once

#include "planner/goal_classifier.hpp"
#include "planner/plan_model.hpp"

#include <string_view>
#include <vector>

namespace detplan::planner {

// Returns the fixed step template for `goal`, with every `query` parameter
// bound to the verbatim `request`. Ids run 1..n in template order.
//
// | goal                      | steps                                  |
// |---------------------------|----------------------------------------|
// | find_papers_and_summarize | search -> extract -> summarize         |
// | find_papers               | search                                 |
// | compare_sources           | identify_entities -> fetch_facts -> compare |
// | generate_report           | gather_context -> outline -> write     |
// | fetch_news                | search -> summarize                    |
// | generic_information_task  | search -> summarize                    |
std::vector<Step> BuildSteps(GoalTag goal, std::string_view request);

} // namespace detplan::planner
