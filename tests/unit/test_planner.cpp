#include <atomic>
#include <memory>
#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "helpers/fake_provider.hpp"
#include "runtime/planner.hpp"

namespace {

using helm::core::config::PlanningMode;
using helm::core::errors::ErrorCategory;
using helm::core::errors::get_error;
using helm::core::errors::get_value;
using helm::core::errors::is_error;
using helm::runtime::Planner;
using helm::runtime::ReplanRequest;
using helm::testing::FakeProvider;
using nlohmann::json;

TEST(PlannerTest, ModeOffAndAlwaysIgnoreTheMessage) {
    EXPECT_FALSE(Planner::should_plan("refactor everything", PlanningMode::Off));
    EXPECT_TRUE(Planner::should_plan("Hi", PlanningMode::Always));
}

TEST(PlannerTest, AutoModeLooksForComplexityHints) {
    EXPECT_FALSE(Planner::should_plan("Hi", PlanningMode::Auto));
    EXPECT_FALSE(Planner::should_plan("what is in a.txt?", PlanningMode::Auto));
    EXPECT_TRUE(Planner::should_plan("Please REFACTOR the parser", PlanningMode::Auto));
    EXPECT_TRUE(Planner::should_plan("read a.txt then b.txt", PlanningMode::Auto));
    EXPECT_TRUE(Planner::should_plan(std::string(120, 'a'), PlanningMode::Auto));
}

TEST(PlannerTest, ParsePlanCapsStepsAndClampsBudget) {
    json steps = json::array();
    for (int i = 0; i < 10; ++i) {
        steps.push_back("step " + std::to_string(i));
    }
    const auto plan = Planner::parse_plan(
        json{{"summary", "  Do it  "}, {"steps", steps}, {"toolBudget", 40}}.dump());
    ASSERT_TRUE(plan.has_value());
    EXPECT_EQ(plan->summary, "Do it");
    EXPECT_EQ(plan->steps.size(), 8u);
    EXPECT_EQ(plan->tool_budget, 12);

    const auto low = Planner::parse_plan(R"({"steps":["a"],"toolBudget":0})");
    ASSERT_TRUE(low.has_value());
    EXPECT_EQ(low->tool_budget, 1);
}

TEST(PlannerTest, ParsePlanDefaultsAndAlternateBudgetKey) {
    const auto defaulted = Planner::parse_plan(R"({"summary":"s","steps":["a"," ",3]})");
    ASSERT_TRUE(defaulted.has_value());
    EXPECT_EQ(defaulted->tool_budget, 6);
    EXPECT_EQ(defaulted->steps.size(), 1u);

    const auto snake = Planner::parse_plan(
        "Here is my plan:\n```json\n{\"summary\":\"s\",\"tool_budget\":3}\n```");
    ASSERT_TRUE(snake.has_value());
    EXPECT_EQ(snake->tool_budget, 3);
}

TEST(PlannerTest, ParsePlanRejectsUnusableReplies) {
    EXPECT_FALSE(Planner::parse_plan("I would start by reading files.").has_value());
    EXPECT_FALSE(Planner::parse_plan(R"({"toolBudget":3})").has_value());
}

TEST(PlannerTest, ProviderFailureMeansNoPlan) {
    auto provider = std::make_shared<FakeProvider>();
    provider->reply_error({ErrorCategory::Provider, "down", "provider_unreachable"});
    Planner planner(provider);

    auto result = planner.plan_turn("refactor it", nullptr);
    ASSERT_FALSE(is_error(result));
    EXPECT_FALSE(get_value(result).has_value());
    ASSERT_EQ(provider->call_count(), 1u);
    EXPECT_NE(provider->requests()[0].prompt.find("refactor it"), std::string::npos);
}

TEST(PlannerTest, CancellationPropagates) {
    auto provider = std::make_shared<FakeProvider>();
    provider->reply_error(helm::core::errors::task_aborted("provider call"));
    Planner planner(provider);

    auto result = planner.plan_turn("refactor it", nullptr);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "task_aborted");

    auto token = std::make_shared<std::atomic_bool>(true);
    auto before = planner.plan_turn("refactor it", token);
    ASSERT_TRUE(is_error(before));
    EXPECT_EQ(get_error(before).category, ErrorCategory::Cancelled);
    EXPECT_EQ(provider->call_count(), 1u);
}

TEST(PlannerTest, ReplanGrowsTheBudget) {
    auto provider = std::make_shared<FakeProvider>();
    provider->reply_text(R"({"summary":"finish","steps":["write file"],"toolBudget":2})");
    Planner planner(provider);

    ReplanRequest request;
    request.user_message = "implement the feature";
    request.previous_plan = {"start", {"read", "write"}, 5};
    request.tool_calls_so_far = {"read_file {\"path\":\"a\"}"};

    auto result = planner.replan_turn(request, nullptr);
    ASSERT_FALSE(is_error(result));
    const auto& plan = get_value(result);
    ASSERT_TRUE(plan.has_value());
    EXPECT_EQ(plan->summary, "finish");
    EXPECT_EQ(plan->tool_budget, 6);

    const std::string& prompt = provider->requests()[0].prompt;
    EXPECT_NE(prompt.find("Tool budget: 5 (exhausted)"), std::string::npos);
    EXPECT_NE(prompt.find("- read_file {\"path\":\"a\"}"), std::string::npos);
}

}  // namespace
