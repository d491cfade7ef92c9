#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "tools/todo_store.hpp"

namespace {

using helm::core::errors::get_error;
using helm::core::errors::get_value;
using helm::core::errors::is_error;
using helm::tools::TodoStatus;
using helm::tools::TodoStore;
using nlohmann::json;

json todos(const json& items) {
    return {{"todos", items}};
}

TEST(TodoStoreTest, UpdateReplacesTheListAndRendersIt) {
    TodoStore store;
    auto result = store.update(todos(json::array({
        {{"content", "read code"}, {"status", "completed"}},
        {{"content", "write fix"}, {"status", "in_progress"}},
        {{"id", "t3"}, {"content", "run tests"}},
    })));
    ASSERT_FALSE(is_error(result));
    EXPECT_FALSE(get_value(result).no_op);
    EXPECT_EQ(get_value(result).text,
              "Todo list updated.\n[x] read code\n[~] write fix\n[ ] run tests");

    const auto items = store.items();
    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(items[0].id, "1");
    EXPECT_EQ(items[2].id, "t3");
    EXPECT_EQ(items[2].status, TodoStatus::Pending);
}

TEST(TodoStoreTest, IdenticalListIsANoOp) {
    TodoStore store;
    const json input = todos(json::array({{{"content", "a"}, {"status", "pending"}}}));
    ASSERT_FALSE(is_error(store.update(input)));

    auto again = store.update(input);
    ASSERT_FALSE(is_error(again));
    EXPECT_TRUE(get_value(again).no_op);
    EXPECT_EQ(get_value(again).text, "Todo list unchanged.\n[ ] a");
}

TEST(TodoStoreTest, AtMostOneInProgress) {
    TodoStore store;
    auto result = store.update(todos(json::array({
        {{"content", "a"}, {"status", "in_progress"}},
        {{"content", "b"}, {"status", "in_progress"}},
    })));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "too_many_in_progress");
    EXPECT_TRUE(store.items().empty());
}

TEST(TodoStoreTest, RejectsMalformedInput) {
    TodoStore store;

    auto no_list = store.update(json::object());
    ASSERT_TRUE(is_error(no_list));
    EXPECT_EQ(get_error(no_list).code, "invalid_todo_input");

    auto no_content = store.update(todos(json::array({{{"status", "pending"}}})));
    ASSERT_TRUE(is_error(no_content));
    EXPECT_EQ(get_error(no_content).code, "invalid_todo_input");

    auto bad_status = store.update(todos(json::array({{{"content", "a"}, {"status", "done"}}})));
    ASSERT_TRUE(is_error(bad_status));
    EXPECT_EQ(get_error(bad_status).code, "invalid_todo_status");
}

TEST(TodoStoreTest, ClearEmptiesTheList) {
    TodoStore store;
    ASSERT_FALSE(is_error(store.update(todos(json::array({{{"content", "a"}}})))));
    store.clear();
    EXPECT_TRUE(store.items().empty());

    auto empty = store.update(todos(json::array()));
    ASSERT_FALSE(is_error(empty));
    EXPECT_EQ(get_value(empty).text, "Todo list unchanged.\n(no todos)");
}

}  // namespace
