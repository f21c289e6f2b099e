#include <catch2/catch.hpp>

#include <oscil/scope/signal.hpp>

using namespace oscil;
using namespace oscil::scope;

TEST_CASE("Signal starts empty", "[scope][signal]") {
    Signal signal{};

    CHECK(signal.IsEmpty());
    CHECK(signal.Size() == 0);
    CHECK(signal.RetainedCount() == 0);
    CHECK(signal.BaseIndex() == 0);
}

TEST_CASE("Signal appends samples in order", "[scope][signal]") {
    Signal signal{};
    signal.Append({.time = 0.5, .amplitude = 1.0});
    signal.Append({.time = 0.6, .amplitude = -1.0});
    signal.Append({.time = 0.7, .amplitude = 0.25});

    REQUIRE(signal.Size() == 3);
    CHECK(signal.LastIndex() == 2);
    CHECK(signal.First() == Sample{0.5, 1.0});
    CHECK(signal.Last() == Sample{0.7, 0.25});
    CHECK(signal[1] == Sample{0.6, -1.0});
    CHECK(signal.Get(2) == signal.Last());
}

TEST_CASE("Signal clear resets indexing and the first sample", "[scope][signal]") {
    Signal signal{};
    for (int i = 0; i < 10; i++) {
        signal.Append({.time = i * 0.1, .amplitude = static_cast<float64>(i)});
    }
    signal.EvictBefore(5);
    signal.Clear();

    CHECK(signal.IsEmpty());
    CHECK(signal.BaseIndex() == 0);

    signal.Append({.time = 3.0, .amplitude = 2.0});
    CHECK(signal.First() == Sample{3.0, 2.0});
    CHECK(signal[0] == Sample{3.0, 2.0});
}

TEST_CASE("Signal eviction keeps logical indices", "[scope][signal]") {
    Signal signal{};
    for (int i = 0; i < 10; i++) {
        signal.Append({.time = i * 0.1, .amplitude = static_cast<float64>(i)});
    }

    SECTION("evicting drops the oldest samples only") {
        signal.EvictBefore(4);

        CHECK(signal.Size() == 10);
        CHECK(signal.RetainedCount() == 6);
        CHECK(signal.BaseIndex() == 4);
        CHECK(signal.LastIndex() == 9);
        CHECK(signal[4].amplitude == 4.0);
        CHECK(signal[9].amplitude == 9.0);
        CHECK(signal.First() == Sample{0.0, 0.0});
    }

    SECTION("evicting never moves backwards") {
        signal.EvictBefore(6);
        signal.EvictBefore(3);

        CHECK(signal.BaseIndex() == 6);
        CHECK(signal.RetainedCount() == 4);
    }

    SECTION("evicting past the end keeps the last sample") {
        signal.EvictBefore(100);

        CHECK(signal.RetainedCount() == 1);
        CHECK(signal.BaseIndex() == 9);
        CHECK(signal.Last().amplitude == 9.0);
    }

    SECTION("appending after eviction continues the logical sequence") {
        signal.EvictBefore(8);
        signal.Append({.time = 1.0, .amplitude = 10.0});

        CHECK(signal.LastIndex() == 10);
        CHECK(signal[10].amplitude == 10.0);
        CHECK(signal.RetainedCount() == 3);
    }
}

TEST_CASE("Signal eviction on an empty signal is a no-op", "[scope][signal]") {
    Signal signal{};
    signal.EvictBefore(5);

    CHECK(signal.IsEmpty());
    CHECK(signal.BaseIndex() == 0);
}
