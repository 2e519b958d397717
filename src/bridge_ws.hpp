/*
 * File: src/bridge_ws.hpp
 * Project: Rep Session Bridge
 * Purpose: WebSocket event broker, the production EventPublisher
 * Notes:
 *  - State files live under --root, see DESIGN.md
 *  - Workout-id writes are atomic via include/atomic_write.hpp
 *  - Events go out over WebSocket as {topic, payload}
 * Last updated: 2026-10-18
 */

#pragma once
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/asio.hpp>
#include <nlohmann/json.hpp>
#include <atomic>
#include <cstddef>
#include <deque>
#include <iostream>
#include <memory>
#include <string>
#include <unordered_set>
#include "event_publisher.hpp"

namespace websocket = boost::beast::websocket;

// Per-subscriber backlog. Past this the oldest unsent frames are dropped.
inline constexpr std::size_t kMaxQueuedFrames = 64;

// Event broker: every published event goes to every connected client as
// {"topic": ..., "payload": ...}. Clients only listen; what they send is dropped.
//
// All socket work and the client registry belong to the io thread. publish()
// may be called from any thread; it only posts. Call start() once the server
// is owned by a shared_ptr.
class WsServer : public EventPublisher, public std::enable_shared_from_this<WsServer>
{
    struct Session;

    boost::asio::io_context &ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::unordered_set<std::shared_ptr<Session>> clients_; // io thread only
    std::atomic<std::size_t> client_count_{0};

public:
    WsServer(boost::asio::io_context &ioc, boost::asio::ip::tcp::endpoint ep)
        : ioc_(ioc), acceptor_(ioc)
    {
        acceptor_.open(ep.protocol());
        acceptor_.set_option(boost::asio::socket_base::reuse_address(true));
        acceptor_.bind(ep);
        acceptor_.listen(boost::asio::socket_base::max_listen_connections);
    }

    void start() { do_accept(); }

    unsigned short port() const { return acceptor_.local_endpoint().port(); }

    // Subscribers that finished the handshake and have not gone away.
    std::size_t client_count() const { return client_count_.load(); }

    // Never blocks. Once the io_context has stopped, or this server is gone,
    // the event is dropped.
    void publish(const std::string &topic, const std::string &payload) override
    {
        auto msg = std::make_shared<const std::string>(
            nlohmann::json{{"topic", topic}, {"payload", payload}}.dump());
        boost::asio::post(ioc_, [w = weak_from_this(), msg]
                          {
            if (auto self = w.lock())
                self->broadcast(msg); });
    }

private:
    void broadcast(const std::shared_ptr<const std::string> &msg)
    {
        for (auto &s : clients_)
            s->send(msg);
    }

    void add(const std::shared_ptr<Session> &s)
    {
        if (clients_.insert(s).second)
            ++client_count_;
    }

    void remove(const std::shared_ptr<Session> &s)
    {
        if (clients_.erase(s))
            --client_count_;
    }

    void do_accept()
    {
        acceptor_.async_accept([w = weak_from_this()](boost::system::error_code ec, boost::asio::ip::tcp::socket sock)
                               {
            auto self = w.lock();
            if (!self || ec == boost::asio::error::operation_aborted)
                return;
            if (!ec)
                std::make_shared<Session>(std::move(sock), self)->run();
            else
                std::cerr << "WARN: websocket accept failed: " << ec.message() << "\n";
            self->do_accept(); });
    }

    struct Session : std::enable_shared_from_this<Session>
    {
        websocket::stream<boost::asio::ip::tcp::socket> ws;
        boost::beast::flat_buffer buffer;
        std::weak_ptr<WsServer> server;
        std::deque<std::shared_ptr<const std::string>> queue; // front is being written
        bool gone = false;
        bool warned = false;

        Session(boost::asio::ip::tcp::socket &&s, const std::shared_ptr<WsServer> &srv)
            : ws(std::move(s)), server(srv) {}

        void run()
        {
            ws.set_option(websocket::stream_base::timeout::suggested(boost::beast::role_type::server));
            ws.text(true);
            ws.async_accept([self = shared_from_this()](boost::beast::error_code ec)
                            {
                if (ec)
                {
                    std::cerr << "WARN: websocket handshake failed: " << ec.message() << "\n";
                    return;
                }
                if (auto srv = self->server.lock())
                    srv->add(self);
                self->do_read(); });
        }

        void do_read()
        {
            ws.async_read(buffer, [self = shared_from_this()](boost::beast::error_code ec, std::size_t)
                          {
                if (ec)
                {
                    self->drop();
                    return;
                }
                self->buffer.consume(self->buffer.size());
                self->do_read(); });
        }

        void send(const std::shared_ptr<const std::string> &msg)
        {
            if (gone)
                return;
            if (queue.size() >= kMaxQueuedFrames)
            {
                if (!warned)
                    std::cerr << "WARN: websocket subscriber falling behind, dropping frames\n";
                warned = true;
                queue.erase(queue.begin() + 1);
            }
            queue.push_back(msg);
            if (queue.size() == 1)
                do_write();
        }

        void do_write()
        {
            ws.async_write(boost::asio::buffer(*queue.front()), [self = shared_from_this()](boost::beast::error_code ec, std::size_t)
                           {
                if (ec || self->gone)
                {
                    self->drop();
                    return;
                }
                self->queue.pop_front();
                if (!self->queue.empty())
                    self->do_write(); });
        }

        // Unregisters. The frame in flight stays queued until its write completes.
        void drop()
        {
            if (gone)
                return;
            gone = true;
            if (auto srv = server.lock())
                srv->remove(shared_from_this());
        }
    };
};
