#include <gtest/gtest.h>
#include <atomic>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "app/dispatch_table.hpp"

using namespace whisperkeys;

TEST(DispatchTable, InitiallyEmpty)
{
    DispatchTable table;
    EXPECT_FALSE(table.contains("record_toggle"));
    EXPECT_EQ(table.handler_count("record_toggle"), 0u);
    EXPECT_EQ(table.invoke("record_toggle"), 0u);
}

TEST(DispatchTable, RejectsEmptyHandler)
{
    DispatchTable table;
    EXPECT_FALSE(table.add("record_toggle", nullptr));
    EXPECT_FALSE(table.contains("record_toggle"));
}

TEST(DispatchTable, HandlersRunInRegistrationOrder)
{
    DispatchTable    table;
    std::vector<int> order;
    table.add("copy_last", [&] { order.push_back(1); });
    table.add("copy_last", [&] { order.push_back(2); });
    table.add("copy_last", [&] { order.push_back(3); });

    EXPECT_EQ(table.invoke("copy_last"), 3u);
    std::vector<int> expected = {1, 2, 3};
    EXPECT_EQ(order, expected);
}

TEST(DispatchTable, IdsAreIndependent)
{
    DispatchTable table;
    int           a = 0, b = 0;
    table.add("a", [&] { ++a; });
    table.add("b", [&] { ++b; });
    table.invoke("a");
    EXPECT_EQ(a, 1);
    EXPECT_EQ(b, 0);
}

TEST(DispatchTable, ThrowingHandlerDoesNotStopOthers)
{
    DispatchTable table;
    int           after = 0;
    table.add("x", [] { throw std::runtime_error("clipboard unavailable"); });
    table.add("x", [&] { ++after; });
    table.add("x", [] { throw 42; });
    table.add("x", [&] { ++after; });

    EXPECT_NO_THROW(table.invoke("x"));
    EXPECT_EQ(after, 2);
}

TEST(DispatchTable, HandlerMayRegisterDuringInvoke)
{
    DispatchTable table;
    int           late = 0;
    table.add("x", [&] { table.add("x", [&] { ++late; }); });

    EXPECT_EQ(table.invoke("x"), 1u);
    EXPECT_EQ(late, 0);
    EXPECT_EQ(table.handler_count("x"), 2u);
}

TEST(DispatchTable, RemoveAndClear)
{
    DispatchTable table;
    table.add("a", [] {});
    table.add("b", [] {});
    table.remove("a");
    EXPECT_FALSE(table.contains("a"));
    EXPECT_TRUE(table.contains("b"));
    table.clear();
    EXPECT_FALSE(table.contains("b"));
}

TEST(DispatchTable, ConcurrentRegisterAndInvoke)
{
    DispatchTable    table;
    std::atomic<int> calls{0};
    table.add("x", [&] { calls.fetch_add(1); });

    std::thread writer(
        [&]
        {
            for (int i = 0; i < 200; ++i)
                table.add("x", [&] { calls.fetch_add(1); });
        });
    std::thread reader(
        [&]
        {
            for (int i = 0; i < 200; ++i)
                table.invoke("x");
        });
    writer.join();
    reader.join();

    EXPECT_EQ(table.handler_count("x"), 201u);
    EXPECT_GE(calls.load(), 200);
}
