#include <cstdlib>
#include <filesystem>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "core/config/agent_settings.hpp"

namespace {

using helm::core::config::AgentSettings;
using helm::core::config::apply_environment;
using helm::core::config::NativeFormat;
using helm::core::config::parse_native_format;
using helm::core::config::parse_planning_mode;
using helm::core::config::PlanningMode;
using helm::core::errors::get_error;
using helm::core::errors::get_value;
using helm::core::errors::is_error;

const std::vector<const char*> kVariables = {
    "HELM_BASE_URL",      "HELM_MODEL",      "HELM_API_KEY",        "OPENAI_API_KEY",
    "HELM_NATIVE_TOOLS",  "HELM_AUTO_APPROVE", "HELM_NATIVE_FORMAT", "HELM_PLANNING",
    "HELM_MAX_ITERATIONS", "HELM_CHECKPOINT_INTERVAL", "HELM_SKILLS", "HELM_SKILLS_DIR"};

// Clears every variable the settings layer reads, before and after each test.
class AgentSettingsTest : public ::testing::Test {
protected:
    void SetUp() override { clear(); }
    void TearDown() override { clear(); }

    static void clear() {
        for (const char* name : kVariables) {
            unsetenv(name);
        }
    }
};

TEST_F(AgentSettingsTest, DefaultsWithoutEnvironment) {
    auto result = apply_environment(AgentSettings{});
    ASSERT_FALSE(is_error(result));
    const auto& settings = get_value(result);
    EXPECT_EQ(settings.provider.base_url, "https://api.openai.com/v1");
    EXPECT_EQ(settings.provider.model, "gpt-4o-mini");
    EXPECT_TRUE(settings.provider.api_key.empty());
    EXPECT_FALSE(settings.native_tools);
    EXPECT_FALSE(settings.auto_approve);
    EXPECT_EQ(settings.planning, PlanningMode::Auto);
    EXPECT_EQ(settings.max_iterations, 40u);
    EXPECT_EQ(settings.checkpoint_interval, 20u);
}

TEST_F(AgentSettingsTest, EnvironmentOverridesDefaults) {
    setenv("HELM_BASE_URL", "http://localhost:1234/v1", 1);
    setenv("HELM_MODEL", "qwen", 1);
    setenv("HELM_API_KEY", "sk-helm", 1);
    setenv("OPENAI_API_KEY", "sk-openai", 1);
    setenv("HELM_NATIVE_TOOLS", "TRUE", 1);
    setenv("HELM_AUTO_APPROVE", "1", 1);
    setenv("HELM_NATIVE_FORMAT", "Anthropic", 1);
    setenv("HELM_PLANNING", "off", 1);
    setenv("HELM_MAX_ITERATIONS", "12", 1);
    setenv("HELM_CHECKPOINT_INTERVAL", "4", 1);

    auto result = apply_environment(AgentSettings{});
    ASSERT_FALSE(is_error(result));
    const auto& settings = get_value(result);
    EXPECT_EQ(settings.provider.base_url, "http://localhost:1234/v1");
    EXPECT_EQ(settings.provider.model, "qwen");
    EXPECT_EQ(settings.provider.api_key, "sk-helm");
    EXPECT_TRUE(settings.native_tools);
    EXPECT_TRUE(settings.auto_approve);
    EXPECT_EQ(settings.native_format, NativeFormat::Anthropic);
    EXPECT_EQ(settings.planning, PlanningMode::Off);
    EXPECT_EQ(settings.max_iterations, 12u);
    EXPECT_EQ(settings.checkpoint_interval, 4u);
}

TEST_F(AgentSettingsTest, SkillListsAreCommaSeparated) {
    setenv("HELM_SKILLS", "cmake, gtest,,", 1);
    setenv("HELM_SKILLS_DIR", "/opt/skills,shared/skills", 1);

    auto result = apply_environment(AgentSettings{});
    ASSERT_FALSE(is_error(result));
    const auto& settings = get_value(result);
    EXPECT_EQ(settings.skills, (std::vector<std::string>{"cmake", "gtest"}));
    ASSERT_EQ(settings.skill_dirs.size(), 2u);
    EXPECT_EQ(settings.skill_dirs[0], std::filesystem::path("/opt/skills"));
    EXPECT_EQ(settings.skill_dirs[1], std::filesystem::path("shared/skills"));
}

TEST_F(AgentSettingsTest, FallsBackToOpenAiKey) {
    setenv("OPENAI_API_KEY", "sk-openai", 1);
    auto result = apply_environment(AgentSettings{});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).provider.api_key, "sk-openai");
}

TEST_F(AgentSettingsTest, EmptyVariablesAreIgnored) {
    setenv("HELM_MODEL", "", 1);
    setenv("HELM_NATIVE_TOOLS", "no", 1);
    AgentSettings base;
    base.native_tools = true;

    auto result = apply_environment(base);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).provider.model, "gpt-4o-mini");
    EXPECT_FALSE(get_value(result).native_tools);
}

TEST_F(AgentSettingsTest, InvalidValuesAreErrors) {
    setenv("HELM_MAX_ITERATIONS", "lots", 1);
    auto not_a_number = apply_environment(AgentSettings{});
    ASSERT_TRUE(is_error(not_a_number));
    EXPECT_EQ(get_error(not_a_number).code, "invalid_integer");

    setenv("HELM_MAX_ITERATIONS", "5000", 1);
    auto too_big = apply_environment(AgentSettings{});
    ASSERT_TRUE(is_error(too_big));
    EXPECT_EQ(get_error(too_big).code, "bounds_error");

    unsetenv("HELM_MAX_ITERATIONS");
    setenv("HELM_PLANNING", "maybe", 1);
    auto planning = apply_environment(AgentSettings{});
    ASSERT_TRUE(is_error(planning));
    EXPECT_EQ(get_error(planning).code, "invalid_planning_mode");
}

TEST(AgentSettingsParseTest, ModesAndFormatsRoundTripThroughNames) {
    for (const auto mode : {PlanningMode::Off, PlanningMode::Auto, PlanningMode::Always}) {
        auto parsed = parse_planning_mode(helm::core::config::to_string(mode));
        ASSERT_FALSE(is_error(parsed));
        EXPECT_EQ(get_value(parsed), mode);
    }
    EXPECT_EQ(get_value(parse_native_format("OPENAI")), NativeFormat::OpenAI);
    EXPECT_TRUE(is_error(parse_native_format("")));
}

}  // namespace
