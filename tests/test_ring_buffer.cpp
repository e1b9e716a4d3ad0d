#include <gtest/gtest.h>
#include <chrono>
#include <thread>
#include <vector>
#include "ringBuffer.hpp"
#include "types.hpp"

TEST(RingBuffer, FifoOrderAcrossWrap) {
    ringBuffer_C<int> rb(3);
    EXPECT_EQ(rb.capacity(), 3u);
    int v = 0;
    for (int round = 0; round < 3; round++) {
        ASSERT_TRUE(rb.push(round * 10 + 1));
        ASSERT_TRUE(rb.push(round * 10 + 2));
        EXPECT_EQ(rb.get_count(), 2u);
        ASSERT_TRUE(rb.pop(&v));
        EXPECT_EQ(v, round * 10 + 1);
        ASSERT_TRUE(rb.pop(&v));
        EXPECT_EQ(v, round * 10 + 2);
    }
    EXPECT_EQ(rb.get_count(), 0u);
}

TEST(RingBuffer, CapacityIsClamped) {
    EXPECT_EQ(ringBuffer_C<int>(0).capacity(), 1u);
    EXPECT_EQ(ringBuffer_C<int>(100000).capacity(), static_cast<size_t>(SEM_BUFFER_CAPACITY - 1));
}

TEST(RingBuffer, TryPopOnEmptyReturnsFalse) {
    ringBuffer_C<int> rb(4);
    int v = -1;
    EXPECT_FALSE(rb.try_pop(&v));
    EXPECT_EQ(v, -1);
    ASSERT_TRUE(rb.push(5));
    EXPECT_TRUE(rb.try_pop(&v));
    EXPECT_EQ(v, 5);
}

TEST(RingBuffer, CloseDrainsPendingThenStops) {
    ringBuffer_C<int> rb(4);
    ASSERT_TRUE(rb.push(1));
    ASSERT_TRUE(rb.push(2));
    rb.close();
    rb.close();
    EXPECT_TRUE(rb.is_closed());
    EXPECT_FALSE(rb.push(3));

    int v = 0;
    ASSERT_TRUE(rb.pop(&v));
    EXPECT_EQ(v, 1);
    ASSERT_TRUE(rb.pop(&v));
    EXPECT_EQ(v, 2);
    EXPECT_FALSE(rb.pop(&v));
    EXPECT_FALSE(rb.pop(&v));
    EXPECT_FALSE(rb.try_pop(&v));
}

TEST(RingBuffer, CloseWakesBlockedConsumer) {
    ringBuffer_C<int> rb(4);
    bool popped = true;
    std::thread consumer([&] {
        int v = 0;
        popped = rb.pop(&v);
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    rb.close();
    consumer.join();
    EXPECT_FALSE(popped);
}

TEST(RingBuffer, CloseWakesBlockedProducer) {
    ringBuffer_C<int> rb(1);
    ASSERT_TRUE(rb.push(1));
    bool pushed = true;
    std::thread producer([&] { pushed = rb.push(2); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    rb.close();
    producer.join();
    EXPECT_FALSE(pushed);
    int v = 0;
    ASSERT_TRUE(rb.pop(&v));
    EXPECT_EQ(v, 1);
}

TEST(RingBuffer, ProducerConsumerHandOffKeepsOrder) {
    constexpr int N = 5000;
    ringBuffer_C<sensor_sample_t> rb(16);
    std::thread producer([&] {
        for (int i = 0; i < N; i++) {
            sensor_sample_t s{};
            s.timestamp_s = i * 0.01;
            s.mic_rms = static_cast<double>(i);
            if (!rb.push(s)) {
                break;
            }
        }
        rb.close();
    });

    std::vector<double> seen;
    sensor_sample_t s{};
    while (rb.pop(&s)) {
        seen.push_back(s.mic_rms);
    }
    producer.join();

    ASSERT_EQ(seen.size(), static_cast<size_t>(N));
    for (int i = 0; i < N; i++) {
        ASSERT_EQ(seen[i], static_cast<double>(i));
    }
}
