#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "streaming_accumulator.hpp"

#include <cstdint>
#include <vector>

using Catch::Matchers::WithinAbs;

namespace {

RawAudioChunk chunk(std::vector<int16_t> samples, uint32_t rate = 48000, uint8_t channels = 1) {
    return RawAudioChunk{
        .samples = std::move(samples),
        .native_sample_rate = rate,
        .channel_count = channels,
        .captured_at = MonotonicClock::now(),
    };
}

} // namespace

TEST_CASE("StreamingAccumulator", "[accumulator]") {
    StreamingAccumulator acc;

    SECTION("StartsEmpty") {
        REQUIRE(acc.empty());
        REQUIRE(acc.sample_count() == 0);
        REQUIRE(acc.rms() == 0.0);
    }

    SECTION("TakeConcatenatesInOrder") {
        acc.append(chunk({1, 2, 3}));
        acc.append(chunk({4, 5}));
        acc.append(chunk({6}));
        REQUIRE(acc.chunk_count() == 3);
        REQUIRE(acc.sample_count() == 6);

        auto audio = acc.take();
        REQUIRE(audio.has_value());
        REQUIRE(audio->samples == std::vector<int16_t>{1, 2, 3, 4, 5, 6});
        REQUIRE(audio->sample_rate == 48000);
        REQUIRE(audio->channel_count == 1);
    }

    SECTION("TakeEmptiesTheBuffer") {
        acc.append(chunk({1, 2, 3}));
        REQUIRE(acc.take().has_value());
        REQUIRE(acc.empty());
        REQUIRE(acc.sample_count() == 0);

        auto again = acc.take();
        REQUIRE_FALSE(again.has_value());
        REQUIRE(again.error() == "no audio captured");
    }

    SECTION("EmptyChunksAreIgnored") {
        acc.append(chunk({}));
        REQUIRE(acc.empty());
    }

    SECTION("MixedRatesAreRejected") {
        acc.append(chunk({1, 2}, 48000));
        acc.append(chunk({3, 4}, 44100));

        auto audio = acc.take();
        REQUIRE_FALSE(audio.has_value());
        REQUIRE(audio.error().find("format changed") != std::string::npos);
    }

    SECTION("MixedChannelCountsAreRejected") {
        acc.append(chunk({1, 2}, 48000, 2));
        acc.append(chunk({3}, 48000, 1));
        REQUIRE_FALSE(acc.take().has_value());
    }

    SECTION("ClearDropsEverything") {
        acc.append(chunk({1, 2, 3}));
        acc.clear();
        REQUIRE(acc.empty());
        REQUIRE_FALSE(acc.take().has_value());
    }

    SECTION("RmsIsNormalized") {
        acc.append(chunk(std::vector<int16_t>(100, 16384)));
        REQUIRE_THAT(acc.rms(), WithinAbs(0.5, 1e-9));

        acc.append(chunk(std::vector<int16_t>(100, -16384)));
        REQUIRE_THAT(acc.rms(), WithinAbs(0.5, 1e-9));
    }
}
