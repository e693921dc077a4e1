#include <catch2/catch.hpp>

#include "fake_object_store.hpp"

#include "irods/private/chunked_transfer/copy_pacer.hpp"

#include <chrono>
#include <numeric>

namespace ct = irods::experimental::io::chunked_transfer;

using chunked_transfer_test::fake_object_store;
using chunked_transfer_test::virtual_clock;

using namespace std::chrono_literals;

namespace
{
    ct::copy_handle pending_copy()
    {
        ct::copy_handle handle;
        handle.token = "copy-under-test";
        handle.completed = false;
        return handle;
    }

    std::chrono::milliseconds total(const std::vector<std::chrono::milliseconds>& _sleeps)
    {
        return std::accumulate(_sleeps.begin(), _sleeps.end(), std::chrono::milliseconds{0});
    }
}

TEST_CASE("sleep intervals grow toward the maximum", "[pacer]")
{
    SECTION("decay constant 1 doubles")
    {
        const ct::pacer_settings settings{100ms, 1000ms, 1};
        CHECK(ct::next_sleep_interval(100ms, settings) == 200ms);
        CHECK(ct::next_sleep_interval(200ms, settings) == 400ms);
        CHECK(ct::next_sleep_interval(800ms, settings) == 1000ms);
        CHECK(ct::next_sleep_interval(1000ms, settings) == 1000ms);
    }

    SECTION("a larger decay constant grows more slowly")
    {
        const ct::pacer_settings settings{100ms, 1000ms, 2};
        CHECK(ct::next_sleep_interval(300ms, settings) == 400ms);

        const ct::pacer_settings slower{100ms, 1000ms, 4};
        CHECK(ct::next_sleep_interval(150ms, slower) == 160ms);
    }

    SECTION("small intervals still grow")
    {
        const ct::pacer_settings settings{1ms, 10ms, 16};
        CHECK(ct::next_sleep_interval(1ms, settings) == 2ms);
    }

    SECTION("intervals below the minimum start from the minimum")
    {
        const ct::pacer_settings settings{100ms, 1000ms, 1};
        CHECK(ct::next_sleep_interval(0ms, settings) == 200ms);
    }

    SECTION("the sequence never decreases and never exceeds the maximum")
    {
        for (unsigned int decay = 1; decay <= 16; ++decay) {
            const ct::pacer_settings settings{10ms, 5000ms, decay};
            auto interval = settings.min_sleep;
            for (int i = 0; i < 200; ++i) {
                const auto next = ct::next_sleep_interval(interval, settings);
                REQUIRE(next >= interval);
                REQUIRE(next <= settings.max_sleep);
                interval = next;
            }
        }
    }
}

TEST_CASE("a completed handle needs no polling", "[pacer]")
{
    fake_object_store store;
    virtual_clock clock;

    ct::copy_handle handle;
    handle.completed = true;

    ct::copy_pacer pacer{store, ct::pacer_settings{100ms, 1000ms, 1}, clock, ct::cancellation_token{}};
    ct::copy_state state = ct::copy_state::REQUESTED;
    CHECK(pacer.wait_for_copy(handle, clock.now() + 10s, state).ok());

    CHECK(state == ct::copy_state::SUCCEEDED);
    CHECK(pacer.poll_count() == 0);
    CHECK(store.status_calls == 0);
}

TEST_CASE("polling stops when the copy succeeds", "[pacer]")
{
    fake_object_store store;
    store.polls_until_copy_done = 4;

    virtual_clock clock;
    ct::copy_pacer pacer{store, ct::pacer_settings{100ms, 1000ms, 1}, clock, ct::cancellation_token{}};

    ct::copy_state state = ct::copy_state::REQUESTED;
    CHECK(pacer.wait_for_copy(pending_copy(), clock.now() + 1min, state).ok());

    CHECK(state == ct::copy_state::SUCCEEDED);
    CHECK(pacer.poll_count() == 4);
    CHECK(clock.sleeps() == std::vector<std::chrono::milliseconds>{100ms, 200ms, 400ms});
}

TEST_CASE("a remote copy failure is terminal", "[pacer]")
{
    fake_object_store store;
    store.remote_copy_fails = true;

    virtual_clock clock;
    ct::copy_pacer pacer{store, ct::pacer_settings{100ms, 1000ms, 1}, clock, ct::cancellation_token{}};

    ct::copy_state state = ct::copy_state::REQUESTED;
    CHECK_FALSE(pacer.wait_for_copy(pending_copy(), clock.now() + 1min, state).ok());

    CHECK(state == ct::copy_state::FAILED);
    CHECK(pacer.poll_count() == 1);
    CHECK(clock.sleeps().empty());
}

TEST_CASE("transient status errors keep the copy in progress", "[pacer]")
{
    fake_object_store store;
    store.transient_status_failures = 2;
    store.polls_until_copy_done = 3;

    virtual_clock clock;
    ct::copy_pacer pacer{store, ct::pacer_settings{100ms, 1000ms, 1}, clock, ct::cancellation_token{}};

    ct::copy_state state = ct::copy_state::REQUESTED;
    CHECK(pacer.wait_for_copy(pending_copy(), clock.now() + 1min, state).ok());

    CHECK(state == ct::copy_state::SUCCEEDED);
    CHECK(pacer.poll_count() == 3);
}

TEST_CASE("a copy that never resolves times out at the deadline", "[pacer]")
{
    fake_object_store store;
    store.polls_until_copy_done = -1;

    virtual_clock clock;
    const auto start = clock.now();
    const auto timeout = std::chrono::milliseconds{1min};
    const ct::pacer_settings settings{100ms, 5000ms, 1};

    ct::copy_pacer pacer{store, settings, clock, ct::cancellation_token{}};

    ct::copy_state state = ct::copy_state::REQUESTED;
    CHECK_FALSE(pacer.wait_for_copy(pending_copy(), start + timeout, state).ok());

    CHECK(state == ct::copy_state::TIMED_OUT);

    const auto elapsed = clock.now() - start;
    CHECK(elapsed >= timeout);
    CHECK(elapsed < timeout + settings.max_sleep);

    // the intervals actually slept never shrink, including the last one
    const auto sleeps = clock.sleeps();
    REQUIRE(sleeps.size() > 1);
    CHECK(sleeps.front() == settings.min_sleep);
    CHECK(sleeps.back() == settings.max_sleep);
    for (std::size_t i = 0; i < sleeps.size(); ++i) {
        CHECK(sleeps[i] <= settings.max_sleep);
        if (i > 0) {
            CHECK(sleeps[i] >= sleeps[i - 1]);
        }
    }

    CHECK(total(sleeps) == std::chrono::milliseconds{61300});
    CHECK(pacer.poll_count() == static_cast<int>(sleeps.size()) + 1);
}

TEST_CASE("a deadline reached before the maximum interval", "[pacer]")
{
    fake_object_store store;
    store.polls_until_copy_done = -1;

    virtual_clock clock;
    const auto start = clock.now();

    ct::copy_pacer pacer{store, ct::pacer_settings{100ms, 5000ms, 1}, clock, ct::cancellation_token{}};

    ct::copy_state state = ct::copy_state::REQUESTED;
    CHECK_FALSE(pacer.wait_for_copy(pending_copy(), start + 1s, state).ok());

    CHECK(state == ct::copy_state::TIMED_OUT);
    CHECK(clock.sleeps() == std::vector<std::chrono::milliseconds>{100ms, 200ms, 400ms, 800ms});
    CHECK(clock.now() - start == std::chrono::milliseconds{1500});
    CHECK(pacer.poll_count() == 5);
}

TEST_CASE("cancellation ends polling", "[pacer]")
{
    fake_object_store store;
    store.polls_until_copy_done = -1;

    ct::cancellation_token token;

    virtual_clock clock;
    clock.on_sleep = [&](std::chrono::milliseconds) {
        if (clock.sleeps().size() == 2) {
            token.request_cancellation();
        }
    };

    ct::copy_pacer pacer{store, ct::pacer_settings{100ms, 1000ms, 1}, clock, token};

    ct::copy_state state = ct::copy_state::REQUESTED;
    CHECK_FALSE(pacer.wait_for_copy(pending_copy(), clock.now() + 1h, state).ok());

    CHECK(state == ct::copy_state::TIMED_OUT);
    CHECK(pacer.poll_count() == 2);
}
