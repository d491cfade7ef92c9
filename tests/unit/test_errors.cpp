#include <gtest/gtest.h>
#include "core/errors/agent_errors.hpp"

using namespace helm::core::errors;

// A dummy function to simulate a tool failing
Result<std::string> simulate_read_file(bool should_fail) {
    if (should_fail) {
        return AgentError{ErrorCategory::Execution, "File not found", "file_not_found"};
    }
    return std::string("file contents here");
}

TEST(ErrorModelTest, HandlesSuccess) {
    auto result = simulate_read_file(false);

    EXPECT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "file contents here");
}

TEST(ErrorModelTest, HandlesFailure) {
    auto result = simulate_read_file(true);

    EXPECT_TRUE(is_error(result));

    auto error = get_error(result);
    EXPECT_EQ(error.category, ErrorCategory::Execution);
    EXPECT_EQ(error.message, "File not found");
    EXPECT_EQ(error.code, "file_not_found");
    EXPECT_FALSE(is_cancellation(error));
}

TEST(ErrorModelTest, DefaultsCodeAndHint) {
    const AgentError error{ErrorCategory::Internal, "boom"};
    EXPECT_EQ(error.code, "unknown_error");
    EXPECT_TRUE(error.hint.empty());
}

TEST(ErrorModelTest, TaskAbortedIsACancellation) {
    const auto bare = task_aborted();
    EXPECT_EQ(bare.category, ErrorCategory::Cancelled);
    EXPECT_EQ(bare.code, "task_aborted");
    EXPECT_EQ(bare.message, "Task aborted.");
    EXPECT_TRUE(is_cancellation(bare));

    EXPECT_EQ(task_aborted("shell command").message, "Task aborted during shell command.");
}

TEST(ErrorModelTest, CategoryNames) {
    EXPECT_EQ(to_string(ErrorCategory::Provider), "provider");
    EXPECT_EQ(to_string(ErrorCategory::Policy), "policy");
    EXPECT_EQ(to_string(ErrorCategory::Cancelled), "cancelled");
}
