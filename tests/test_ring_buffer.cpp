#include <catch2/catch_test_macros.hpp>

#include "ring_buffer.hpp"

#include <algorithm>
#include <cstdint>
#include <numeric>
#include <thread>
#include <vector>

TEST_CASE("RingBuffer", "[ring_buffer]") {
    constexpr size_t cap = 256;
    RingBuffer rb(cap);

    SECTION("WriteAndRead") {
        std::vector<int16_t> data(64);
        std::iota(data.begin(), data.end(), int16_t(-32));

        REQUIRE(rb.write(data.data(), data.size()) == 64);
        REQUIRE(rb.available() == 64);

        std::vector<int16_t> out(64);
        REQUIRE(rb.read(out.data(), out.size()) == 64);
        REQUIRE(out == data);
    }

    SECTION("Wraparound") {
        std::vector<int16_t> fill(200);
        std::iota(fill.begin(), fill.end(), int16_t(1));
        REQUIRE(rb.write(fill.data(), fill.size()) == 200);

        std::vector<int16_t> sink(200);
        REQUIRE(rb.read(sink.data(), sink.size()) == 200);
        REQUIRE(sink == fill);

        // write_pos and read_pos are at 200; 128 samples cross the end.
        std::vector<int16_t> wrap(128);
        std::iota(wrap.begin(), wrap.end(), int16_t(1000));
        REQUIRE(rb.write(wrap.data(), wrap.size()) == 128);

        std::vector<int16_t> out(128);
        REQUIRE(rb.read(out.data(), out.size()) == 128);
        REQUIRE(out == wrap);
    }

    SECTION("OverflowDropsAndCounts") {
        std::vector<int16_t> big(cap + 100, int16_t(0x1234));

        size_t written = rb.write(big.data(), big.size());
        REQUIRE(written == cap);
        REQUIRE(rb.available() == cap);
        REQUIRE(rb.dropped() == 100);

        // Full ring drops everything.
        REQUIRE(rb.write(big.data(), 10) == 0);
        REQUIRE(rb.dropped() == 110);
    }

    SECTION("DrainAll") {
        std::vector<int16_t> samples = {100, -200, 300, -400, 500};
        REQUIRE(rb.write(samples.data(), samples.size()) == samples.size());

        auto drained = rb.drain_all();
        REQUIRE(drained == samples);
        REQUIRE(rb.available() == 0);
    }

    SECTION("DrainAllKeepsWholeFrames") {
        std::vector<int16_t> interleaved = {1, -1, 2, -2, 3};
        rb.write(interleaved.data(), interleaved.size());

        auto drained = rb.drain_all(2);
        REQUIRE(drained == std::vector<int16_t>{1, -1, 2, -2});
        // The half frame waits for its partner.
        REQUIRE(rb.available() == 1);

        int16_t partner = -3;
        rb.write(&partner, 1);
        REQUIRE(rb.drain_all(2) == std::vector<int16_t>{3, -3});
    }

    SECTION("OverflowKeepsWholeFrames") {
        // Ten samples of room, three channels per frame.
        RingBuffer small(10);
        std::vector<int16_t> frames = {1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12};

        REQUIRE(small.write(frames.data(), frames.size(), 3) == 9);
        REQUIRE(small.dropped() == 3);
        REQUIRE(small.drain_all(3) == std::vector<int16_t>{1, 2, 3, 4, 5, 6, 7, 8, 9});
        REQUIRE(small.available() == 0);

        // Later frames stay aligned.
        std::vector<int16_t> next = {20, 21, 22};
        REQUIRE(small.write(next.data(), next.size(), 3) == 3);
        REQUIRE(small.drain_all(3) == next);

        // Less room than one frame drops the whole frame.
        std::vector<int16_t> fill(9, 0);
        REQUIRE(small.write(fill.data(), fill.size(), 3) == 9);
        REQUIRE(small.write(next.data(), next.size(), 3) == 0);
        REQUIRE(small.dropped() == 6);
    }

    SECTION("EmptyRead") {
        int16_t buf[16];
        REQUIRE(rb.read(buf, 16) == 0);
        REQUIRE(rb.drain_all().empty());
    }

    SECTION("ResetClearsState") {
        std::vector<int16_t> data(cap + 8, 7);
        rb.write(data.data(), data.size());
        REQUIRE(rb.available() == cap);
        REQUIRE(rb.dropped() == 8);

        rb.reset();
        REQUIRE(rb.available() == 0);
        REQUIRE(rb.dropped() == 0);
    }

    SECTION("MultipleWriteRead") {
        for (int round = 0; round < 10; ++round) {
            std::vector<int16_t> data(40, static_cast<int16_t>(round));

            REQUIRE(rb.write(data.data(), data.size()) == 40);
            std::vector<int16_t> out(40);
            REQUIRE(rb.read(out.data(), out.size()) == 40);
            REQUIRE(out == data);
        }
        REQUIRE(rb.available() == 0);
    }

    SECTION("ProducerThreadConsumerThread") {
        constexpr int16_t total = 20000;
        std::vector<int16_t> received;
        received.reserve(total);

        std::thread producer([&rb] {
            int16_t next = 0;
            while (next < total) {
                if (rb.write(&next, 1) == 1) ++next;
                else std::this_thread::yield();
            }
        });

        while (received.size() < static_cast<size_t>(total)) {
            auto chunk = rb.drain_all();
            received.insert(received.end(), chunk.begin(), chunk.end());
        }
        producer.join();

        REQUIRE(std::ranges::is_sorted(received));
        REQUIRE(received.front() == 0);
        REQUIRE(received.back() == total - 1);
    }
}
