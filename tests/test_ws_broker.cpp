/*
 * File: tests/test_ws_broker.cpp
 * Project: Rep Session Bridge
 * Purpose: WsServer over loopback with real Beast clients
 * Notes:
 *  - State files live under --root, see DESIGN.md
 *  - Workout-id writes are atomic via include/atomic_write.hpp
 *  - Events go out over WebSocket as {topic, payload}
 * Last updated: 2026-10-18
 */

#include <catch2/catch.hpp>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <nlohmann/json.hpp>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include "bridge_ws.hpp"

using tcp = boost::asio::ip::tcp;
using json = nlohmann::json;

namespace {

// WsServer on an ephemeral loopback port, served by its own io thread.
struct Broker {
boost::asio::io_context ioc{1};
std::shared_ptr<WsServer> server;
std::thread io;
Broker(){
    server = std::make_shared<WsServer>(ioc, tcp::endpoint{boost::asio::ip::make_address("127.0.0.1"), 0});
    server->start();
    io = std::thread([this]{ ioc.run(); });
}
~Broker(){
    ioc.stop();
    io.join();
    server.reset();
}
// true once n subscribers are registered
bool wait_for_clients(std::size_t n){
    for (int i = 0; i < 100 && server->client_count() < n; ++i)
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    return server->client_count() >= n;
}
// true if the io thread runs a posted handler within the timeout
bool io_responsive(){
    auto ran = std::make_shared<std::promise<void>>();
    auto f = ran->get_future();
    boost::asio::post(ioc, [ran]{ ran->set_value(); });
    return f.wait_for(std::chrono::seconds(2)) == std::future_status::ready;
}
};

struct Subscriber {
boost::asio::io_context ioc;
websocket::stream<tcp::socket> ws{ioc};
explicit Subscriber(unsigned short port){
    ws.next_layer().connect(tcp::endpoint{boost::asio::ip::make_address("127.0.0.1"), port});
    ws.handshake("127.0.0.1", "/");
}
json next(){
    boost::beast::flat_buffer b;
    ws.read(b);
    return json::parse(boost::beast::buffers_to_string(b.data()));
}
};

}


TEST_CASE("events reach every subscriber in publish order"){
Broker b;
Subscriber one(b.server->port()), two(b.server->port());
REQUIRE(b.wait_for_clients(2));

std::thread producer([&]{
    b.server->publish(kFrameTopic, "A");
    b.server->publish(kFrameTopic, "B");
    b.server->publish(kFrameTopic, "C");
});
producer.join();

for (auto* s : {&one, &two}) {
    REQUIRE(s->next() == json{{"topic", "cv-frame"}, {"payload", "A"}});
    REQUIRE(s->next()["payload"] == "B");
    REQUIRE(s->next()["payload"] == "C");
}
}


TEST_CASE("publish with no subscribers is a no-op"){
Broker b;
b.server->publish(kFrameTopic, "nobody listens");
REQUIRE(b.io_responsive());
REQUIRE(b.server->client_count() == 0);
}


TEST_CASE("a departed subscriber is unregistered and the rest keep receiving"){
Broker b;
Subscriber stays(b.server->port());
{
    Subscriber leaves(b.server->port());
    REQUIRE(b.wait_for_clients(2));
    leaves.ws.close(websocket::close_code::normal);
}
for (int i = 0; i < 100 && b.server->client_count() > 1; ++i)
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
REQUIRE(b.server->client_count() == 1);
b.server->publish(kFrameTopic, "still here");
REQUIRE(stays.next()["payload"] == "still here");
}


TEST_CASE("a stalled subscriber blocks neither the publisher nor the io thread"){
Broker b;
// completes the handshake, then never reads
Subscriber stalled(b.server->port());
Subscriber healthy(b.server->port());
REQUIRE(b.wait_for_clients(2));

const std::string padding(64 * 1024, 'x');
const int frames = 500;
std::vector<unsigned long> seen;
std::thread reader([&]{
    for (;;) {
        auto payload = healthy.next()["payload"].get<std::string>();
        if (payload == "done") break;
        seen.push_back(std::stoul(payload));
    }
});

auto t0 = std::chrono::steady_clock::now();
std::thread producer([&]{
    for (int i = 0; i < frames; ++i)
        b.server->publish(kFrameTopic, std::to_string(i) + padding);
    b.server->publish(kFrameTopic, "done");
});
producer.join();
auto elapsed = std::chrono::steady_clock::now() - t0;
bool responsive = b.io_responsive();
reader.join();

// far more than the stalled socket can buffer went out without waiting on it
REQUIRE(elapsed < std::chrono::seconds(10));
REQUIRE(responsive);
// a new subscriber is still accepted while the stalled one is connected
Subscriber late(b.server->port());
REQUIRE(b.wait_for_clients(3));
REQUIRE_FALSE(seen.empty());
for (std::size_t i = 1; i < seen.size(); ++i)
    REQUIRE(seen[i - 1] < seen[i]);
}


TEST_CASE("a connection that never upgrades does not hold up other subscribers"){
Broker b;
boost::asio::io_context cioc;
tcp::socket idle(cioc);
idle.connect(tcp::endpoint{boost::asio::ip::make_address("127.0.0.1"), b.server->port()});

Subscriber s(b.server->port());
REQUIRE(b.wait_for_clients(1));
b.server->publish(kFrameTopic, "A");
REQUIRE(s.next() == json{{"topic", "cv-frame"}, {"payload", "A"}});
REQUIRE(b.io_responsive());
}
