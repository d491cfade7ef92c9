#include <string>
#include <gtest/gtest.h>
#include "prompt/system_prompt.hpp"
#include "runtime/action_normalizer.hpp"

namespace {

using helm::prompt::build_system_prompt;
using helm::prompt::format_history;
using helm::prompt::PromptInputs;
using helm::prompt::render_plan;
using helm::protocol::ConversationHistory;
using helm::protocol::Message;
using helm::protocol::Plan;
using helm::protocol::Role;
using helm::protocol::Skill;
using helm::protocol::ToolCall;
using helm::protocol::ToolResultRecord;
using helm::protocol::TurnPolicy;

bool contains(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}

TEST(SystemPromptTest, TextModeIncludesResponseFormatAndSchemas) {
    PromptInputs inputs;
    inputs.workspace_dir = "/work/project";
    const std::string prompt = build_system_prompt(inputs);

    EXPECT_TRUE(contains(prompt, "Workspace root: /work/project"));
    EXPECT_TRUE(contains(prompt, "Shell auto approval: OFF"));
    EXPECT_TRUE(contains(prompt, "RESPONSE FORMAT:"));
    EXPECT_TRUE(contains(prompt, "TOOL SCHEMAS:"));
    EXPECT_FALSE(contains(prompt, "ACTIVE PLAN:"));
    EXPECT_FALSE(contains(prompt, "TURN EXECUTION CONTRACT:"));
}

TEST(SystemPromptTest, NativeModeOmitsTheJsonContract) {
    PromptInputs inputs;
    inputs.native_tools = true;
    inputs.auto_approve = true;
    const std::string prompt = build_system_prompt(inputs);

    EXPECT_TRUE(contains(prompt, "Shell auto approval: ON"));
    EXPECT_FALSE(contains(prompt, "RESPONSE FORMAT:"));
    EXPECT_FALSE(contains(prompt, "TOOL SCHEMAS:"));
}

TEST(SystemPromptTest, RendersSkillsPlanInstructionsAndPolicy) {
    PromptInputs inputs;
    inputs.active_skills = {Skill{"cmake", {}, "CMake help", "Prefer target_link_libraries.", {}},
                            Skill{"gtest", {}, "", "Use TEST_F for fixtures.", {}}};
    inputs.active_plan = Plan{"Fix the build", {"read CMakeLists.txt", "patch it"}, 4};
    inputs.project_instructions = "Always run the tests.";
    TurnPolicy policy;
    policy.name = "repo_diff_summary";
    policy.max_tool_calls = 2;
    policy.allowed_tools = {"shell"};
    policy.allowed_command_prefixes = {"git diff", "git status"};
    policy.require_commit_message = true;
    inputs.turn_policy = policy;

    const std::string prompt = build_system_prompt(inputs);
    EXPECT_TRUE(contains(prompt, "ACTIVE SKILLS: cmake, gtest"));
    EXPECT_TRUE(contains(prompt, "SKILL cmake:\nPrefer target_link_libraries."));
    EXPECT_TRUE(contains(prompt, "SKILL gtest:\nUse TEST_F for fixtures."));
    EXPECT_TRUE(contains(prompt, "ACTIVE PLAN:\nSummary: Fix the build\n1. read CMakeLists.txt\n2. patch it\nTool budget: 4"));
    EXPECT_TRUE(contains(prompt, "PROJECT INSTRUCTIONS:\nAlways run the tests."));
    EXPECT_TRUE(contains(prompt, "- Intent: repo_diff_summary"));
    EXPECT_TRUE(contains(prompt, "- Maximum tool calls this turn: 2"));
    EXPECT_TRUE(contains(prompt, "- Allowed shell commands: git diff, git status"));
    EXPECT_TRUE(contains(prompt, "- Final answer must include a suggested commit message."));
}

TEST(SystemPromptTest, LongSkillBodiesAreTruncated) {
    PromptInputs inputs;
    inputs.active_skills = {Skill{"big", {}, "", std::string(helm::prompt::kMaxSkillBodyChars + 10, 'x'), {}}};

    const std::string prompt = build_system_prompt(inputs);
    EXPECT_TRUE(contains(prompt, std::string(helm::prompt::kMaxSkillBodyChars, 'x') +
                                     "\n... [skill truncated]"));
    EXPECT_FALSE(contains(prompt, std::string(helm::prompt::kMaxSkillBodyChars + 1, 'x')));
}

TEST(SystemPromptTest, RenderPlanCapsStepsAtEight) {
    Plan plan;
    plan.summary = "Big job";
    for (int i = 1; i <= 10; ++i) {
        plan.steps.push_back("step " + std::to_string(i));
    }
    const std::string rendered = render_plan(plan);
    EXPECT_TRUE(contains(rendered, "8. step 8"));
    EXPECT_FALSE(contains(rendered, "9. step 9"));
}

TEST(SystemPromptTest, FormatHistoryRendersEveryEntryKind) {
    ConversationHistory history;
    Message user;
    user.role = Role::User;
    user.content = "what is in a.txt?";
    history.push_back(user);
    history.push_back(helm::runtime::make_tool_call_message(
        ToolCall{"c1", "read_file", {{"path", "a.txt"}}}, "inspect it"));
    history.push_back(helm::runtime::make_tool_result_message(ToolResultRecord{"c1", "read_file", "alpha"}));
    Message thought;
    thought.role = Role::Assistant;
    thought.content = helm::runtime::encode_thought_content("it is short");
    history.push_back(thought);

    EXPECT_EQ(format_history(history),
              "USER: what is in a.txt?\n"
              "ASSISTANT: Tool Use: read_file\nInput: {\"path\":\"a.txt\"}\nReason: inspect it\n"
              "USER: Tool Result: read_file\nalpha\n"
              "ASSISTANT: Thought: it is short");
}

TEST(SystemPromptTest, FormatHistoryTruncatesLargeResults) {
    const std::string big(helm::prompt::kMaxHistoryResultChars + 500, 'x');
    ConversationHistory history = {
        helm::runtime::make_tool_result_message(ToolResultRecord{"c1", "shell", big})};
    const std::string text = format_history(history);
    EXPECT_TRUE(contains(text, "[truncated for context budget]"));
    EXPECT_TRUE(contains(text, "(result chars: " + std::to_string(big.size()) + ")"));
    EXPECT_LT(text.size(), big.size());
}

}  // namespace
