/*
 * File: src/bridge_main.cpp
 * Project: Rep Session Bridge
 * Purpose: Main server binary: HTTP /v1/* control endpoints, WS event broker
 * Notes:
 *  - State files live under --root, see DESIGN.md
 *  - Workout-id writes are atomic via include/atomic_write.hpp
 *  - Events go out over WebSocket as {topic, payload}
 * Last updated: 2026-10-18
 */

#include <iostream>
#include <filesystem>
#include <csignal>
#include <stdexcept>
#include <utility>
#include <vector>
#include <boost/asio.hpp>
#include "bridge_http.hpp"
#include "bridge_ws.hpp"
#include "bridge_state.hpp"
#include "session_supervisor.hpp"

int main(int argc, char **argv)
{
    std::string http_bind = "127.0.0.1:8080";
    std::string ws_bind = "127.0.0.1:8090";
    SupervisorOptions opts;
    std::vector<std::string> launchers;
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--http" && i + 1 < argc)
            http_bind = argv[++i];
        else if (a == "--ws" && i + 1 < argc)
            ws_bind = argv[++i];
        else if (a == "--root" && i + 1 < argc)
            opts.paths.root = argv[++i];
        else if (a == "--script" && i + 1 < argc)
            opts.script = argv[++i];
        else if (a == "--launcher" && i + 1 < argc)
            launchers.push_back(argv[++i]);
        else
        {
            std::cerr << "usage: session_bridge [--http host:port] [--ws host:port] [--root dir]"
                         " [--script path] [--launcher name]...\n";
            return 2;
        }
    }
    if (!launchers.empty())
        opts.launchers = launchers;

    try
    {
        auto split = [](const std::string &s)
        {
            auto p = s.rfind(':');
            if (p == std::string::npos)
                throw std::runtime_error("expected host:port, got " + s);
            return std::pair{s.substr(0, p), static_cast<unsigned short>(std::stoi(s.substr(p + 1)))};
        };
        auto [http_host, http_port] = split(http_bind);
        auto [ws_host, ws_port] = split(ws_bind);

        std::error_code ec;
        if (!std::filesystem::is_directory(opts.paths.root, ec))
        {
            std::cerr << "bridge error: root " << opts.paths.root << " is not a directory\n";
            return 1;
        }
        opts.paths.root = std::filesystem::absolute(opts.paths.root);

        boost::asio::io_context ioc{1};

        // declared after the io_context: its supervisor joins the output pumps,
        // which post to ioc, and holds the last reference to the WsServer
        BridgeState state;
        state.paths = opts.paths;
        state.ws_port = ws_port;

        boost::asio::ip::tcp::endpoint http_ep{boost::asio::ip::make_address(http_host), http_port};
        boost::asio::ip::tcp::endpoint ws_ep{boost::asio::ip::make_address(ws_host), ws_port};

        HttpServer http{ioc, http_ep, state};
        auto ws = std::make_shared<WsServer>(ioc, ws_ep);
        ws->start();
        state.supervisor = std::make_unique<SessionSupervisor>(opts, ws);

        boost::asio::signal_set signals{ioc, SIGINT, SIGTERM};
        signals.async_wait([&](const boost::system::error_code &, int sig)
                           {
            std::cout << "bridge: signal " << sig << ", shutting down\n";
            state.supervisor->stop();
            ioc.stop(); });

        std::cout << "bridge listening http=" << http_bind << " ws=" << ws_bind
                  << " root=" << state.paths.root.string() << "\n";
        ioc.run();

        state.supervisor.reset();
        return 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "bridge error: " << e.what() << "\n";
        return 1;
    }
}
