#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "input/queued_key_source.hpp"

using namespace whisperkeys;

TEST(QueuedKeySource, EventsPushedBeforeOpenAreDelivered)
{
    QueuedKeySource source;
    source.press(keys::Pause);
    source.release(keys::Pause);
    EXPECT_EQ(source.pending(), 2u);

    ASSERT_TRUE(source.open());
    KeyEvent ev;
    ASSERT_TRUE(source.wait_event(ev));
    EXPECT_EQ(ev.key, keys::Pause);
    EXPECT_TRUE(ev.is_down());
    ASSERT_TRUE(source.wait_event(ev));
    EXPECT_FALSE(ev.is_down());
}

TEST(QueuedKeySource, ClosedSourceReturnsFalse)
{
    QueuedKeySource source;
    KeyEvent        ev;
    EXPECT_FALSE(source.wait_event(ev));

    ASSERT_TRUE(source.open());
    source.push(KeyEvent::down('A'));
    source.close();
    EXPECT_FALSE(source.wait_event(ev));
    EXPECT_EQ(source.pending(), 0u);
    EXPECT_FALSE(source.is_open());
}

TEST(QueuedKeySource, PushAfterCloseIsDropped)
{
    QueuedKeySource source;
    ASSERT_TRUE(source.open());
    source.close();
    for (int i = 0; i < 100; ++i)
        source.press(keys::Pause);
    EXPECT_EQ(source.pending(), 0u);

    // Reopening accepts events again
    ASSERT_TRUE(source.open());
    source.press('A');
    EXPECT_EQ(source.pending(), 1u);
    KeyEvent ev;
    ASSERT_TRUE(source.wait_event(ev));
    EXPECT_EQ(ev.key, 'A');
}

TEST(QueuedKeySource, CloseWakesBlockedWaiter)
{
    QueuedKeySource source;
    ASSERT_TRUE(source.open());

    std::atomic<bool> returned{false};
    bool              got = true;
    std::thread       waiter(
        [&]
        {
            KeyEvent ev;
            got = source.wait_event(ev);
            returned.store(true);
        });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_FALSE(returned.load());
    source.close();
    waiter.join();
    EXPECT_TRUE(returned.load());
    EXPECT_FALSE(got);
}

TEST(QueuedKeySource, CrossThreadFifo)
{
    QueuedKeySource source;
    ASSERT_TRUE(source.open());
    constexpr int N = 1000;

    std::thread producer(
        [&]
        {
            for (int i = 1; i <= N; ++i)
                source.push(KeyEvent::down(i));
        });

    std::vector<int> seen;
    KeyEvent         ev;
    while (static_cast<int>(seen.size()) < N && source.wait_event(ev))
        seen.push_back(ev.key);
    producer.join();

    ASSERT_EQ(seen.size(), static_cast<size_t>(N));
    for (int i = 0; i < N; ++i)
        EXPECT_EQ(seen[i], i + 1);
}
