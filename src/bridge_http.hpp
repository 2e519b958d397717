/*
 * File: src/bridge_http.hpp
 * Project: Rep Session Bridge
 * Purpose: HTTP routing and handlers
 * Notes:
 *  - State files live under --root, see DESIGN.md
 *  - Workout-id writes are atomic via include/atomic_write.hpp
 *  - Events go out over WebSocket as {topic, payload}
 * Last updated: 2026-10-18
 */

#pragma once
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "bridge_state.hpp"
#include "common/session_config.hpp"
#include "common/state_files.hpp"

namespace http = boost::beast::http;

using HttpRequest = http::request<http::string_body>;
using HttpResponse = http::response<http::string_body>;

inline HttpResponse json_response(http::status st, unsigned version, const nlohmann::json &body)
{
    HttpResponse res{st, version};
    res.set(http::field::content_type, "application/json");
    res.body() = body.dump();
    res.prepare_payload();
    return res;
}

// Routes one request against the bridge. Never throws for bad input; the
// caller-visible failures (spawn, workout-id write) come back as 500s.
inline HttpResponse handle_request(BridgeState &state, const HttpRequest &req)
{
    using nlohmann::json;
    const auto v = req.version();

    // GET /health
    if (req.method() == http::verb::get && req.target() == "/health")
    {
        auto up = std::chrono::duration<double>(std::chrono::steady_clock::now() - state.start).count();
        bool running = state.supervisor && state.supervisor->running();
        return json_response(http::status::ok, v,
                             json{{"status", "ok"}, {"uptime_s", up}, {"session", running ? "running" : "idle"}});
    }

    // POST /v1/session/start
    if (req.method() == http::verb::post && req.target() == "/v1/session/start")
    {
        if (!state.supervisor)
            return json_response(http::status::service_unavailable, v, json{{"error", "supervisor not ready"}});
        try
        {
            auto r = state.supervisor->start();
            json body{{"status", to_string(r)}};
            if (auto pid = state.supervisor->primary_pid())
                body["pid"] = *pid;
            return json_response(http::status::ok, v, body);
        }
        catch (const SpawnError &e)
        {
            std::cerr << "bridge error: " << e.what() << "\n";
            return json_response(http::status::internal_server_error, v,
                                 json{{"error", "spawn failed"}, {"what", e.what()}});
        }
    }

    // POST /v1/session/stop
    if (req.method() == http::verb::post && req.target() == "/v1/session/stop")
    {
        if (state.supervisor)
            state.supervisor->stop();
        return json_response(http::status::ok, v, json{{"status", "stopped"}});
    }

    // POST /v1/workout
    // Body (JSON): { "workout_id": "squat", "session": "on" | "off" }
    if (req.method() == http::verb::post && req.target() == "/v1/workout")
    {
        auto body = json::parse(req.body(), nullptr, false);
        if (body.is_discarded() || !body.is_object())
            return json_response(http::status::bad_request, v, json{{"error", "bad json"}});
        auto id = body.find("workout_id");
        auto session = body.find("session");
        if (id == body.end() || session == body.end() || !id->is_string() || !session->is_string())
            return json_response(http::status::bad_request, v,
                                 json{{"error", "missing fields"}, {"required", json::array({"workout_id", "session"})}});
        try
        {
            auto rec = write_workout_id(state.paths.workout_id(), id->get<std::string>(), session->get<std::string>());
            return json_response(http::status::ok, v, rec);
        }
        catch (const StateFileError &e)
        {
            return json_response(http::status::internal_server_error, v,
                                 json{{"error", "workout id write failed"}, {"what", e.what()}});
        }
    }

    // GET /v1/reps
    if (req.method() == http::verb::get && req.target() == "/v1/reps")
    {
        return json_response(http::status::ok, v, rep_count_to_json(read_rep_count(state.paths.rep_log())));
    }

    // GET /v1/metrics/live  (204 until the CV process has written something parseable)
    if (req.method() == http::verb::get && req.target() == "/v1/metrics/live")
    {
        auto m = read_live_metrics(state.paths.live_metrics());
        if (!m)
        {
            HttpResponse res{http::status::no_content, v};
            res.prepare_payload();
            return res;
        }
        return json_response(http::status::ok, v, *m);
    }

    // GET /v1/config
    if (req.method() == http::verb::get && req.target() == "/v1/config")
    {
        auto cfg = load_session_config(state.paths.session_config());
        return json_response(http::status::ok, v,
                             json{{"root", state.paths.root.string()},
                                  {"ws_port", state.ws_port},
                                  {"session_scripts", cfg.session_scripts}});
    }

    // 404 fallback
    HttpResponse res{http::status::not_found, v};
    res.set(http::field::content_type, "application/json");
    res.body() = R"({"error":"not found"})";
    res.prepare_payload();
    return res;
}

// -------- HTTP server --------

class HttpServer
{
    boost::asio::ip::tcp::acceptor acceptor_;
    boost::asio::ip::tcp::socket socket_;
    BridgeState &state_;

public:
    HttpServer(boost::asio::io_context &ioc, boost::asio::ip::tcp::endpoint ep, BridgeState &s)
        : acceptor_(ioc), socket_(ioc), state_(s)
    {
        acceptor_.open(ep.protocol());
        acceptor_.set_option(boost::asio::socket_base::reuse_address(true));
        acceptor_.bind(ep);
        acceptor_.listen(boost::asio::socket_base::max_listen_connections);
        do_accept();
    }

private:
    void do_accept()
    {
        acceptor_.async_accept(socket_, [this](auto ec)
                               {
            if (!ec) std::make_shared<Session>(std::move(socket_), state_)->run();
            do_accept(); });
    }

    struct Session : std::enable_shared_from_this<Session>
    {
        boost::asio::ip::tcp::socket socket;
        boost::beast::flat_buffer buffer;
        HttpRequest req;
        BridgeState &state;

        Session(boost::asio::ip::tcp::socket &&s, BridgeState &st)
            : socket(std::move(s)), state(st) {}

        void run() { do_read(); }

        void do_read()
        {
            auto self = shared_from_this();
            http::async_read(socket, buffer, req, [self](auto ec, auto)
                             {
                if (!ec) self->respond(self->handle()); });
        }

        HttpResponse handle()
        {
            try
            {
                return handle_request(state, req);
            }
            catch (const std::exception &e)
            {
                // lock failures and the like; the bridge itself is in trouble
                std::cerr << "bridge error: " << req.target() << ": " << e.what() << "\n";
                return json_response(http::status::internal_server_error, req.version(),
                                     nlohmann::json{{"error", "internal"}, {"what", e.what()}});
            }
        }

        // keep response alive through async_write
        void respond(HttpResponse &&res)
        {
            auto self = shared_from_this();
            auto sp = std::make_shared<HttpResponse>(std::move(res));
            sp->set(http::field::server, "session-bridge");
            sp->set(http::field::access_control_allow_origin, "*");

            http::async_write(socket, *sp, [self, sp](boost::beast::error_code, std::size_t)
                              {
                boost::system::error_code ignored;
                self->socket.shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored); });
        }
    };
};
