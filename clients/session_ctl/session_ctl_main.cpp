/*
 * File: clients/session_ctl/session_ctl_main.cpp
 * Project: Rep Session Bridge
 * Purpose: Command-line control client for the bridge HTTP API
 * Notes:
 *  - State files live under --root, see DESIGN.md
 *  - Workout-id writes are atomic via include/atomic_write.hpp
 *  - Events go out over WebSocket as {topic, payload}
 * Last updated: 2026-10-18
 */

#include <iostream>
#include <string>
#include <vector>
#include <boost/asio.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/core/flat_buffer.hpp>

#include <nlohmann/json.hpp>

namespace http = boost::beast::http;
using json = nlohmann::json;

static int usage()
{
    std::cerr << "usage: session_ctl [--http http://host:port] [--pretty] "
                 "start | stop | health | reps | metrics | config | workout <id> <on|off>\n";
    return 2;
}

int main(int argc, char **argv)
{
    bool pretty = false;
    std::string base = "http://localhost:8080";
    std::vector<std::string> cmd;
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--http" && i + 1 < argc)
            base = argv[++i];
        else if (a == "--pretty")
            pretty = true;
        else
            cmd.push_back(a);
    }
    if (cmd.empty())
        return usage();

    http::verb verb = http::verb::get;
    std::string target;
    std::string body;
    const auto &c = cmd[0];
    if (c == "start" || c == "stop")
    {
        verb = http::verb::post;
        target = "/v1/session/" + c;
    }
    else if (c == "health")
        target = "/health";
    else if (c == "reps")
        target = "/v1/reps";
    else if (c == "metrics")
        target = "/v1/metrics/live";
    else if (c == "config")
        target = "/v1/config";
    else if (c == "workout" && cmd.size() == 3)
    {
        verb = http::verb::post;
        target = "/v1/workout";
        body = json{{"workout_id", cmd[1]}, {"session", cmd[2]}}.dump();
    }
    else
        return usage();

    try
    {
        boost::asio::io_context ioc;
        boost::asio::ip::tcp::resolver res{ioc};
        auto pos = base.find("//");
        auto hp = (pos == std::string::npos) ? base : base.substr(pos + 2);
        auto colon = hp.find(':');
        auto host = hp.substr(0, colon);
        auto port = (colon == std::string::npos) ? std::string("80") : hp.substr(colon + 1);
        auto results = res.resolve(host, port);

        boost::asio::ip::tcp::socket sock{ioc};
        boost::asio::connect(sock, results.begin(), results.end());
        http::request<http::string_body> req{verb, target, 11};
        req.set(http::field::host, host);
        if (!body.empty())
        {
            req.set(http::field::content_type, "application/json");
            req.body() = body;
        }
        req.prepare_payload();
        http::write(sock, req);
        boost::beast::flat_buffer buf;
        http::response<http::string_body> resp;
        http::read(sock, buf, resp);

        boost::system::error_code ignored;
        sock.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);

        std::cout << "[session_ctl] status=" << resp.result_int();
        if (resp.body().empty())
        {
            std::cout << " (no body)" << std::endl;
        }
        else
        {
            auto j = json::parse(resp.body(), nullptr, false);
            if (j.is_discarded())
                std::cout << " raw body=" << resp.body() << std::endl;
            else
                std::cout << " body:\n" << (pretty ? j.dump(2) : j.dump()) << std::endl;
        }
        return resp.result_int() < 400 ? 0 : 1;
    }
    catch (const std::exception &e)
    {
        std::cerr << "session_ctl error: " << e.what() << "\n";
        return 1;
    }
}
