#include <catch2/catch.hpp>

#include <oscil/util/callback.hpp>
#include <oscil/util/guarded.hpp>
#include <oscil/util/observable.hpp>
#include <oscil/util/scope_guard.hpp>

#include <thread>
#include <utility>
#include <vector>

TEST_CASE("Observable notifies on registration and on every change", "[util][observable]") {
    util::Observable<int> value{5};
    std::vector<int> seen{};

    util::ObserverHandle handle = value.Observe([&](const int &v) { seen.push_back(v); });
    value = 7;
    value.Set(9);
    value.Notify();

    CHECK(seen == std::vector<int>{5, 7, 9, 9});
    CHECK(value.Get() == 9);
}

TEST_CASE("Observers are unregistered with their handle", "[util][observable]") {
    util::Observable<int> value{1};
    int first = 0;
    int second = 0;

    util::ObserverHandle firstHandle = value.Observe([&](const int &v) { first = v; });
    {
        util::ObserverHandle secondHandle = value.Observe([&](const int &v) { second = v; });
        CHECK(value.GetObserverCount() == 2);
        value = 2;
    }
    CHECK(value.GetObserverCount() == 1);
    value = 3;
    CHECK(first == 3);
    CHECK(second == 2);

    SECTION("when reset explicitly") {
        firstHandle.Reset();
        CHECK_FALSE(firstHandle.IsActive());
        value = 4;
        CHECK(first == 3);
        CHECK(value.GetObserverCount() == 0);
    }

    SECTION("when moved into another handle that is then destroyed") {
        {
            util::ObserverHandle moved = std::move(firstHandle);
            CHECK(moved.IsActive());
            CHECK_FALSE(firstHandle.IsActive());
        }
        value = 5;
        CHECK(first == 3);
        CHECK(value.GetObserverCount() == 0);
    }
}

TEST_CASE("Observer handles may outlive the observed value", "[util][observable]") {
    util::ObserverHandle handle{};
    {
        util::Observable<int> value{1};
        handle = value.Observe([](const int &) {});
        CHECK(handle.IsActive());
    }
    handle.Reset();
    CHECK_FALSE(handle.IsActive());
}

TEST_CASE("Optional callbacks do nothing when unbound", "[util][callback]") {
    util::OptionalCallback<int(int)> unbound{};
    CHECK_FALSE(unbound.IsValid());
    CHECK(unbound(3) == 0);

    int base = 10;
    util::OptionalCallback<int(int)> bound{&base, [](int x, void *ctx) { return x + *static_cast<int *>(ctx); }};
    CHECK(bound.IsValid());
    CHECK(bound(3) == 13);
}

TEST_CASE("Scope guards run unless cancelled", "[util][scope_guard]") {
    int runs = 0;
    {
        util::ScopeGuard guard{[&] { runs++; }};
    }
    CHECK(runs == 1);
    {
        util::ScopeGuard guard{[&] { runs++; }};
        guard.Cancel();
    }
    CHECK(runs == 1);
}

TEST_CASE("Guarded values serialize access", "[util][guarded]") {
    util::Guarded<std::vector<int>> values{};

    std::vector<std::thread> threads{};
    for (int t = 0; t < 4; t++) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < 1000; i++) {
                values.Lock()->push_back(t);
            }
        });
    }
    for (auto &thread : threads) {
        thread.join();
    }

    CHECK(values.With([](const std::vector<int> &v) { return v.size(); }) == 4000);
}
