#include <catch2/catch_test_macros.hpp>
#include "network/runtime.hpp"
#include "network_test_helpers.hpp"
#include <atomic>
#include <boost/asio/post.hpp>

using namespace palm::network;
using palm::test::WaitFor;

TEST_CASE("Runtime lifecycle is idempotent", "[network][runtime]") {
    Runtime rt(2);
    REQUIRE(rt.thread_count() == 2);

    // Not running before run()
    CHECK_FALSE(rt.is_running());

    // stop() without run() should be safe
    rt.stop();

    // run() starts, second run() is no-op
    rt.run();
    CHECK(rt.is_running());
    rt.run();
    CHECK(rt.is_running());

    // stop() is idempotent
    rt.stop();
    rt.stop();
    CHECK_FALSE(rt.is_running());

    // Can be started again after stop
    rt.run();
    CHECK(rt.is_running());
    rt.stop();
}

TEST_CASE("Runtime runs posted work on its I/O threads", "[network][runtime]") {
    Runtime rt(3);
    rt.run();

    std::atomic<int> done{0};
    for (int i = 0; i < 100; ++i) {
        boost::asio::post(rt.io_context(), [&done]() { done++; });
    }
    REQUIRE(WaitFor([&]() { return done == 100; }));

    // Still alive after the queue went empty (work guard)
    boost::asio::post(rt.io_context(), [&done]() { done++; });
    REQUIRE(WaitFor([&]() { return done == 101; }));
    rt.stop();
}

TEST_CASE("Runtime defaults to at least one thread", "[network][runtime]") {
    Runtime rt;
    CHECK(rt.thread_count() >= 1);
}
