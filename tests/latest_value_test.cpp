#include "beamproto/latest_value.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

TEST(LatestValueTest, StartsEmptyAndReplacesWholeValue) {
    BeamProto::LatestValue<std::vector<int>> cell;
    ASSERT_TRUE(cell.get()->empty());

    cell.publish({1, 2, 3});
    auto first = cell.get();
    cell.publish({4});

    // An earlier snapshot is never modified by later publishes.
    ASSERT_EQ(*first, (std::vector<int>{1, 2, 3}));
    ASSERT_EQ(*cell.get(), (std::vector<int>{4}));
}

TEST(LatestValueTest, WaitForSeesValuePublishedLater) {
    BeamProto::LatestValue<int> cell(0);

    std::thread writer([&cell]() {
        std::this_thread::sleep_for(50ms);
        cell.publish(7);
    });

    auto snapshot = cell.wait_for([](int value) { return value == 7; }, 5s);
    writer.join();

    ASSERT_TRUE(snapshot != nullptr);
    ASSERT_EQ(*snapshot, 7);
}

TEST(LatestValueTest, WaitForTimesOut) {
    BeamProto::LatestValue<int> cell(0);

    auto start = std::chrono::steady_clock::now();
    auto snapshot = cell.wait_for([](int value) { return value > 0; }, 50ms);

    ASSERT_TRUE(snapshot == nullptr);
    ASSERT_TRUE(std::chrono::steady_clock::now() - start >= 50ms);
}

TEST(LatestValueTest, NotifyWaitersRechecksExternalCondition) {
    BeamProto::LatestValue<int> cell(0);
    std::atomic<bool> stop{false};

    std::thread canceller([&]() {
        std::this_thread::sleep_for(50ms);
        stop = true;
        cell.notify_waiters();
    });

    auto snapshot = cell.wait_for([&](int) { return stop.load(); }, 5s);
    canceller.join();

    ASSERT_TRUE(snapshot != nullptr);
    ASSERT_EQ(*snapshot, 0);
}

TEST(LatestValueTest, ListenersSeeEveryPublishUntilUnsubscribed) {
    BeamProto::LatestValue<int> cell;
    std::vector<int> seen;

    auto id = cell.subscribe([&seen](const BeamProto::LatestValue<int>::Snapshot& value) { seen.push_back(*value); });
    cell.publish(1);
    cell.publish(2);
    cell.unsubscribe(id);
    cell.publish(3);

    ASSERT_EQ(seen, (std::vector<int>{1, 2}));
}

TEST(LatestValueTest, ReadersNeverSeePartialUpdates) {
    BeamProto::LatestValue<std::vector<int>> cell;
    std::atomic<bool> done{false};
    std::atomic<int> torn{0};

    std::thread writer([&]() {
        for (int n = 1; n <= 500; ++n) {
            cell.publish(std::vector<int>(static_cast<size_t>(n), n));
        }
        done = true;
    });

    std::vector<std::thread> readers;
    for (int r = 0; r < 4; ++r) {
        readers.emplace_back([&]() {
            while (!done) {
                auto snapshot = cell.get();
                for (int value : *snapshot) {
                    if (value != static_cast<int>(snapshot->size())) {
                        ++torn;
                        break;
                    }
                }
            }
        });
    }

    writer.join();
    for (auto& reader : readers) {
        reader.join();
    }
    ASSERT_EQ(torn.load(), 0);
    ASSERT_EQ(cell.get()->size(), 500u);
}
