/*************************************************************************/
/*  Skirmish combat timing and duel arena engine                         */
/*  (C) 2025 Xania Development Team                                      */
/*  See README for copyrights                                            */
/*************************************************************************/
#include "TickStatistics.hpp"

#include <catch2/catch.hpp>

TEST_CASE("tick statistics") {
    TickStatistics stats;

    SECTION("empty") {
        CHECK(stats.sample_count() == 0);
        CHECK(stats.average() == Micros::zero());
        CHECK(stats.maximum() == Micros::zero());
        CHECK(stats.p99() == Micros::zero());
    }
    SECTION("average and maximum") {
        stats.record(Micros(100));
        stats.record(Micros(300));
        stats.record(Micros(200));

        CHECK(stats.sample_count() == 3);
        CHECK(stats.average() == Micros(200));
        CHECK(stats.maximum() == Micros(300));
    }
    SECTION("no percentile from a handful of samples") {
        for (auto i = 0; i < 9; ++i)
            stats.record(Micros(1000));
        CHECK(stats.p99() == Micros::zero());
    }
    SECTION("99th percentile") {
        for (auto i = 1; i <= 100; ++i)
            stats.record(Micros(i));
        CHECK(stats.p99() == Micros(100));

        stats.reset();
        for (auto i = 1; i <= 1000; ++i)
            stats.record(Micros(i));
        CHECK(stats.p99() == Micros(991));
    }
    SECTION("only the most recent samples are kept") {
        stats.record(Micros(1'000'000));
        for (size_t i = 0; i < TickStatistics::Capacity; ++i)
            stats.record(Micros(10));

        CHECK(stats.sample_count() == TickStatistics::Capacity);
        CHECK(stats.maximum() == Micros(10));
        CHECK(stats.average() == Micros(10));
    }
    SECTION("reset") {
        stats.record(Micros(10));
        stats.reset();
        CHECK(stats.sample_count() == 0);
        CHECK(stats.maximum() == Micros::zero());
    }
}
