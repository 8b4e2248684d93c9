/**
 * @file test_voice_pool.cpp
 * @brief Voice allocation, drop counting and saturating mix of the audio voice pool.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include <catch2/catch.hpp>

#include <cstdint>
#include <vector>

#include "ToneMapper.h"
#include "VoicePool.h"

TEST_CASE("VoicePool drops exactly the requests beyond its voice count", "[voices]") {
    VoicePool pool(3);
    std::vector<int16_t> buf(8, 100);
    for (int i = 0; i < 4; ++i) pool.tryStart(buf);
    REQUIRE(pool.accepted() == 3u);
    REQUIRE(pool.dropped() == 1u);
    REQUIRE(pool.activeVoices() == 3u);
    REQUIRE_FALSE(pool.hasFreeVoice());
}

TEST_CASE("VoicePool saturates the mix instead of wrapping", "[voices]") {
    VoicePool pool(2);
    const std::vector<int16_t> loud{32767, -32768, 20000, -20000};
    REQUIRE(pool.tryStart(loud));
    REQUIRE(pool.tryStart(loud));
    int16_t out[4] = {1, 1, 1, 1};
    pool.mix(out, 4);
    CHECK(out[0] == 32767);
    CHECK(out[1] == -32768);
    CHECK(out[2] == 32767);
    CHECK(out[3] == -32768);
}

TEST_CASE("VoicePool frees a voice once its buffer has played", "[voices]") {
    VoicePool pool(1);
    REQUIRE(pool.tryStart({1, 2, 3, 4}));
    int16_t out[2];

    pool.mix(out, 2);
    CHECK(out[0] == 1);
    CHECK(out[1] == 2);
    CHECK_FALSE(pool.tryStart({9, 9}));
    CHECK(pool.dropped() == 1u);

    pool.mix(out, 2);
    CHECK(out[0] == 3);
    CHECK(out[1] == 4);
    CHECK(pool.activeVoices() == 0u);

    CHECK(pool.tryStart({5, 6}));
    pool.mix(out, 2);
    CHECK(out[0] == 5);
    CHECK(pool.accepted() == 2u);
}

TEST_CASE("VoicePool outputs silence with no active voice", "[voices]") {
    VoicePool pool(4);
    int16_t out[3] = {7, 7, 7};
    pool.mix(out, 3);
    CHECK(out[0] == 0);
    CHECK(out[2] == 0);
}

TEST_CASE("VoicePool counts an empty buffer or an early refusal as a drop", "[voices]") {
    VoicePool pool(2);
    CHECK_FALSE(pool.tryStart(synthesizeTone(ToneRequest{}, 0.0, 44100)));
    pool.recordDrop();
    CHECK(pool.dropped() == 2u);
    CHECK(pool.accepted() == 0u);
    CHECK(pool.activeVoices() == 0u);
}
