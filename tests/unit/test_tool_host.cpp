#include <atomic>
#include <filesystem>
#include <memory>
#include <string>
#include <gtest/gtest.h>
#include "core/errors/agent_errors.hpp"
#include "helpers/temp_workspace.hpp"
#include "tools/tool_host.hpp"

namespace {

using helm::core::errors::get_error;
using helm::core::errors::get_value;
using helm::core::errors::is_error;
using helm::testing::TempWorkspace;
using helm::testing::write_file;
using helm::tools::CommandRequest;
using helm::tools::ListRequest;
using helm::tools::SearchRequest;
using helm::tools::ToolHost;

TEST(ToolHostTest, ReadFileReturnsContent) {
    TempWorkspace workspace("host");
    write_file(workspace.root() / "notes.txt", "hello tool host");

    ToolHost host;
    auto result = host.read_file(workspace.root(), "notes.txt");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).text, "hello tool host");
    EXPECT_FALSE(get_value(result).no_op);
}

TEST(ToolHostTest, ReadFileRejectsPathOutsideWorkspace) {
    TempWorkspace workspace("host");
    ToolHost host;

    auto absolute = host.read_file(workspace.root(), "/etc/hostname");
    ASSERT_TRUE(is_error(absolute));
    EXPECT_EQ(get_error(absolute).code, "path_outside_workspace");

    auto relative = host.read_file(workspace.root(), "../outside.txt");
    ASSERT_TRUE(is_error(relative));
    EXPECT_EQ(get_error(relative).code, "path_outside_workspace");
}

TEST(ToolHostTest, ReadFileReportsMissingAndBinaryFiles) {
    TempWorkspace workspace("host");
    write_file(workspace.root() / "blob.bin", std::string("ab\0cd", 5));
    ToolHost host;

    auto missing = host.read_file(workspace.root(), "nope.txt");
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "file_not_found");

    auto binary = host.read_file(workspace.root(), "blob.bin");
    ASSERT_TRUE(is_error(binary));
    EXPECT_EQ(get_error(binary).code, "binary_file");
}

TEST(ToolHostTest, WriteFileCreatesParentDirectories) {
    TempWorkspace workspace("host");
    ToolHost host;

    auto result = host.write_file(workspace.root(), "src/new/file.txt", "content");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).text, "Wrote 7 bytes to src/new/file.txt");
    EXPECT_EQ(helm::testing::read_file(workspace.root() / "src/new/file.txt"), "content");

    auto outside = host.write_file(workspace.root(), "../escape.txt", "x");
    ASSERT_TRUE(is_error(outside));
    EXPECT_EQ(get_error(outside).code, "path_outside_workspace");
}

TEST(ToolHostTest, ListFilesWalksDepthFirstAndSkipsGit) {
    TempWorkspace workspace("host");
    write_file(workspace.root() / "b.txt", "b");
    write_file(workspace.root() / "a/inner.txt", "i");
    write_file(workspace.root() / ".git/HEAD", "ref");

    ToolHost host;
    auto result = host.list_files(workspace.root(), ListRequest{});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).text, "a/\nb.txt\na/inner.txt");
}

TEST(ToolHostTest, ListFilesHonorsMaxEntries) {
    TempWorkspace workspace("host");
    write_file(workspace.root() / "one.txt", "1");
    write_file(workspace.root() / "two.txt", "2");

    ToolHost host;
    ListRequest request;
    request.max_entries = 1;
    auto result = host.list_files(workspace.root(), request);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).text, "one.txt");
}

TEST(ToolHostTest, SearchFindsMatchesRecursively) {
    TempWorkspace workspace("host");
    write_file(workspace.root() / "a.cpp", "int needle = 1;\n");
    write_file(workspace.root() / "sub/b.cpp", "NEEDLE and more\n");
    write_file(workspace.root() / "sub/c.cpp", "no match here\n");
    write_file(workspace.root() / "build/d.cpp", "needle in build output\n");

    ToolHost host;
    SearchRequest request;
    request.regex = "needle";

    auto result = host.search(workspace.root(), request);
    ASSERT_FALSE(is_error(result));
    const std::string& text = get_value(result).text;
    EXPECT_NE(text.find("matches=2"), std::string::npos);
    EXPECT_NE(text.find("a.cpp:1:int needle = 1;"), std::string::npos);
    EXPECT_NE(text.find("sub/b.cpp:1:"), std::string::npos);
    EXPECT_EQ(text.find("build/d.cpp"), std::string::npos);
}

TEST(ToolHostTest, SearchCaseSensitiveAndFilePattern) {
    TempWorkspace workspace("host");
    write_file(workspace.root() / "a.cpp", "needle\n");
    write_file(workspace.root() / "b.txt", "needle\n");
    write_file(workspace.root() / "c.cpp", "NEEDLE\n");

    ToolHost host;
    SearchRequest request;
    request.regex = "needle";
    request.file_pattern = "*.cpp";
    request.case_sensitive = true;

    auto result = host.search(workspace.root(), request);
    ASSERT_FALSE(is_error(result));
    const std::string& text = get_value(result).text;
    EXPECT_NE(text.find("matches=1"), std::string::npos);
    EXPECT_NE(text.find("a.cpp:1:needle"), std::string::npos);
}

TEST(ToolHostTest, SearchReportsNoMatches) {
    TempWorkspace workspace("host");
    write_file(workspace.root() / "x.txt", "alpha beta gamma\n");

    ToolHost host;
    SearchRequest request;
    request.regex = "needle";

    auto result = host.search(workspace.root(), request);
    ASSERT_FALSE(is_error(result));
    EXPECT_NE(get_value(result).text.find("No matches found."), std::string::npos);
}

TEST(ToolHostTest, SearchRejectsBadPatterns) {
    TempWorkspace workspace("host");
    ToolHost host;

    SearchRequest empty;
    auto empty_result = host.search(workspace.root(), empty);
    ASSERT_TRUE(is_error(empty_result));
    EXPECT_EQ(get_error(empty_result).code, "empty_search_pattern");

    SearchRequest invalid;
    invalid.regex = "([unclosed";
    auto invalid_result = host.search(workspace.root(), invalid);
    ASSERT_TRUE(is_error(invalid_result));
    EXPECT_EQ(get_error(invalid_result).code, "invalid_search_pattern");
}

TEST(ToolHostTest, RunCommandReportsExitCodeAndStreams) {
    TempWorkspace workspace("host");
    ToolHost host;

    CommandRequest request;
    request.command = "printf 'hello'; printf 'oops' 1>&2; exit 3";
    request.timeout_ms = 5000;

    auto result = host.run_command(workspace.root(), request);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).text, "exit_code: 3\n\nstdout:\nhello\n\nstderr:\noops");
}

TEST(ToolHostTest, RunCommandMarksEmptyStreams) {
    TempWorkspace workspace("host");
    ToolHost host;

    CommandRequest request;
    request.command = "true";
    auto result = host.run_command(workspace.root(), request);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).text, "exit_code: 0\n\nstdout:\n<empty>\n\nstderr:\n<empty>");
}

TEST(ToolHostTest, RunCommandRunsInTheWorkspace) {
    TempWorkspace workspace("host");
    ToolHost host;

    CommandRequest request;
    request.command = "pwd";
    auto result = host.run_command(workspace.root(), request);
    ASSERT_FALSE(is_error(result));
    EXPECT_NE(get_value(result).text.find(workspace.root().string()), std::string::npos);
}

TEST(ToolHostTest, RunCommandRejectsBlockedOperation) {
    TempWorkspace workspace("host");
    ToolHost host;

    CommandRequest request;
    request.command = "sudo ls";
    auto result = host.run_command(workspace.root(), request);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "blocked_command");
}

TEST(ToolHostTest, RunCommandTimesOut) {
    TempWorkspace workspace("host");
    ToolHost host;

    CommandRequest request;
    request.command = "sleep 5";
    request.timeout_ms = 50;

    auto result = host.run_command(workspace.root(), request);
    ASSERT_FALSE(is_error(result));
    const std::string& text = get_value(result).text;
    EXPECT_EQ(text.rfind("Command timed out after 50 ms.", 0), 0u);
    EXPECT_NE(text.find("exit_code: 137"), std::string::npos);
}

TEST(ToolHostTest, RunCommandHonorsCancellationToken) {
    TempWorkspace workspace("host");
    ToolHost host;

    CommandRequest request;
    request.command = "sleep 5";
    request.cancel_token = std::make_shared<std::atomic_bool>(true);

    auto result = host.run_command(workspace.root(), request);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "task_aborted");
    EXPECT_TRUE(helm::core::errors::is_cancellation(get_error(result)));
}

}  // namespace
