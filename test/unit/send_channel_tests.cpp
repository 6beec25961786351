// Copyright (c) 2025 The Palm developers
// Distributed under the MIT software license
// Unit tests for SendChannel / SendReceiver (bounded broadcast)

#include <catch2/catch_test_macros.hpp>
#include "network/send_channel.hpp"
#include <boost/asio/io_context.hpp>
#include <vector>

using namespace palm::network;

namespace {

// Collects what a receiver hands out when the io_context runs
struct Collector {
    std::vector<std::optional<DataPacket>> got;

    SendReceiver::Handler handler() {
        return [this](std::optional<DataPacket> p) { got.push_back(std::move(p)); };
    }
};

} // namespace

TEST_CASE("SendChannel - publish without receivers", "[network][send_channel]") {
    SendChannel channel;
    REQUIRE(channel.receiver_count() == 0);
    REQUIRE(channel.publish(DataPacket::local({1})) == 0);
}

TEST_CASE("SendChannel - every receiver gets every packet", "[network][send_channel]") {
    boost::asio::io_context io;
    SendChannel channel;
    auto a = channel.subscribe();
    auto b = channel.subscribe();
    REQUIRE(channel.receiver_count() == 2);

    REQUIRE(channel.publish(DataPacket::local({1})) == 2);
    REQUIRE(channel.publish(DataPacket::local({2})) == 2);
    REQUIRE(a->queued() == 2);
    REQUIRE(b->queued() == 2);

    Collector ca, cb;
    a->async_receive(io.get_executor(), ca.handler());
    b->async_receive(io.get_executor(), cb.handler());
    io.run();

    REQUIRE(ca.got.size() == 1);
    REQUIRE(ca.got[0]->payload() == std::vector<uint8_t>{1});
    REQUIRE(cb.got[0]->payload() == std::vector<uint8_t>{1});
    REQUIRE(a->queued() == 1);
}

TEST_CASE("SendReceiver - pending wait completes on publish", "[network][send_channel]") {
    boost::asio::io_context io;
    SendChannel channel;
    auto r = channel.subscribe();

    Collector c;
    r->async_receive(io.get_executor(), c.handler());
    io.run();
    REQUIRE(c.got.empty());  // nothing to hand out yet

    REQUIRE(channel.publish(DataPacket::local({0xDE, 0xAD})) == 1);
    io.restart();
    io.run();
    REQUIRE(c.got.size() == 1);
    REQUIRE(c.got[0].has_value());
    REQUIRE(c.got[0]->payload() == std::vector<uint8_t>{0xDE, 0xAD});
    REQUIRE(r->queued() == 0);
}

TEST_CASE("SendReceiver - close", "[network][send_channel]") {
    boost::asio::io_context io;
    SendChannel channel;
    auto r = channel.subscribe();

    SECTION("Pending wait completes with nullopt") {
        Collector c;
        r->async_receive(io.get_executor(), c.handler());
        r->close();
        io.run();
        REQUIRE(c.got.size() == 1);
        REQUIRE_FALSE(c.got[0].has_value());
    }

    SECTION("Queued packets are dropped and later waits see nullopt") {
        channel.publish(DataPacket::local({1}));
        r->close();
        REQUIRE(r->queued() == 0);

        Collector c;
        r->async_receive(io.get_executor(), c.handler());
        io.run();
        REQUIRE(c.got.size() == 1);
        REQUIRE_FALSE(c.got[0].has_value());
    }

    SECTION("Closed receivers no longer count") {
        r->close();
        REQUIRE(r->is_closed());
        REQUIRE(channel.receiver_count() == 0);
        REQUIRE(channel.publish(DataPacket::local({1})) == 0);
    }
}

TEST_CASE("SendChannel - destroyed receivers are pruned", "[network][send_channel]") {
    SendChannel channel;
    {
        auto r = channel.subscribe();
        REQUIRE(channel.receiver_count() == 1);
    }
    REQUIRE(channel.receiver_count() == 0);
    REQUIRE(channel.publish(DataPacket::local({1})) == 0);
}

TEST_CASE("SendReceiver - overflow drops the oldest packets", "[network][send_channel]") {
    boost::asio::io_context io;
    SendChannel channel(3);
    auto r = channel.subscribe();

    for (uint8_t i = 0; i < 5; ++i) {
        REQUIRE(channel.publish(DataPacket::local({i})) == 1);
    }
    REQUIRE(r->queued() == 3);
    REQUIRE(r->lagged() == 2);

    // Oldest survivors first: 2, 3, 4
    Collector c;
    for (int i = 0; i < 3; ++i) {
        r->async_receive(io.get_executor(), c.handler());
        io.restart();
        io.run();
    }
    REQUIRE(c.got.size() == 3);
    REQUIRE(c.got[0]->payload() == std::vector<uint8_t>{2});
    REQUIRE(c.got[1]->payload() == std::vector<uint8_t>{3});
    REQUIRE(c.got[2]->payload() == std::vector<uint8_t>{4});
}
