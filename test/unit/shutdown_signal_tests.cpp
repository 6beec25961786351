// Copyright (c) 2025 The Palm developers
// Distributed under the MIT software license
// Unit tests for ShutdownSignal / ShutdownListener

#include <catch2/catch_test_macros.hpp>
#include "util/shutdown_signal.hpp"
#include <boost/asio/io_context.hpp>

using namespace palm::util;

TEST_CASE("ShutdownSignal - raise wakes every listener once", "[util][shutdown]") {
    boost::asio::io_context io;
    ShutdownSignal signal;
    auto l1 = signal.listener();
    auto l2 = signal.listener();

    int fired1 = 0, fired2 = 0;
    l1.async_wait(io.get_executor(), [&]() { fired1++; });
    l2.async_wait(io.get_executor(), [&]() { fired2++; });
    REQUIRE(l1.pending_waits() == 2);  // listeners share state

    io.run();
    REQUIRE(fired1 == 0);

    signal.raise();
    signal.raise();  // coalesced
    io.restart();
    io.run();

    REQUIRE(fired1 == 1);
    REQUIRE(fired2 == 1);
    REQUIRE(l1.pending_waits() == 0);
}

TEST_CASE("ShutdownSignal - level-triggered for late listeners", "[util][shutdown]") {
    boost::asio::io_context io;
    ShutdownSignal signal;
    signal.raise();
    REQUIRE(signal.is_raised());

    auto late = signal.listener();
    REQUIRE(late.is_raised());

    bool fired = false;
    late.async_wait(io.get_executor(), [&]() { fired = true; });
    io.run();
    REQUIRE(fired);
}

TEST_CASE("ShutdownSignal - reset clears the level", "[util][shutdown]") {
    boost::asio::io_context io;
    ShutdownSignal signal;
    auto listener = signal.listener();

    signal.raise();
    signal.reset();
    REQUIRE_FALSE(signal.is_raised());
    REQUIRE_FALSE(listener.is_raised());

    bool fired = false;
    listener.async_wait(io.get_executor(), [&]() { fired = true; });
    io.run();
    REQUIRE_FALSE(fired);

    // Raising again after reset is a new edge
    signal.raise();
    io.restart();
    io.run();
    REQUIRE(fired);
}

TEST_CASE("ShutdownListener - cancel", "[util][shutdown]") {
    boost::asio::io_context io;
    ShutdownSignal signal;
    auto listener = signal.listener();

    bool fired = false;
    auto id = listener.async_wait(io.get_executor(), [&]() { fired = true; });
    REQUIRE(listener.cancel(id));
    REQUIRE_FALSE(listener.cancel(id));
    REQUIRE(listener.pending_waits() == 0);

    signal.raise();
    io.run();
    REQUIRE_FALSE(fired);
}

TEST_CASE("ShutdownListener - outlives its signal", "[util][shutdown]") {
    ShutdownListener listener;
    REQUIRE_FALSE(listener.valid());
    REQUIRE_FALSE(listener.is_raised());
    REQUIRE(listener.pending_waits() == 0);

    {
        ShutdownSignal signal;
        listener = signal.listener();
        signal.raise();
    }
    REQUIRE(listener.valid());
    REQUIRE(listener.is_raised());
}
