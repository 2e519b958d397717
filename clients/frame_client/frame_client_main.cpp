#include <iostream>
#include <string>
#include <boost/asio.hpp>
#include <boost/beast/websocket.hpp>
#include <nlohmann/json.hpp>
#include <boost/beast/core/buffers_to_string.hpp>

using json = nlohmann::json;
namespace websocket = boost::beast::websocket;

int main(int argc, char **argv)
{
    std::string ws_url = "ws://localhost:8090/ws";
    long max_frames = -1; // run until the server closes
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--ws" && i + 1 < argc)
            ws_url = argv[++i];
        else if (a == "--max" && i + 1 < argc)
            max_frames = std::stol(argv[++i]);
    }

    try
    {
        // connect WS and print one line per cv-frame event
        boost::asio::io_context ioc;
        boost::asio::ip::tcp::resolver res{ioc};
        auto pos = ws_url.find("//");
        auto hp = (pos == std::string::npos) ? ws_url : ws_url.substr(pos + 2);
        auto slash = hp.find('/');
        auto target = (slash == std::string::npos) ? std::string("/") : hp.substr(slash);
        hp = hp.substr(0, slash);
        auto colon = hp.find(':');
        auto host = hp.substr(0, colon);
        auto port = (colon == std::string::npos) ? std::string("80") : hp.substr(colon + 1);
        auto const results = res.resolve(host, port);
        boost::asio::ip::tcp::socket sock{ioc};
        boost::asio::connect(sock, results.begin(), results.end());
        websocket::stream<boost::asio::ip::tcp::socket> ws{std::move(sock)};
        ws.handshake(host, target);
        std::cerr << "frame_client: connected to " << ws_url << "\n";

        boost::beast::flat_buffer buf;
        long seen = 0;
        while (max_frames < 0 || seen < max_frames)
        {
            ws.read(buf);
            auto s = boost::beast::buffers_to_string(buf.data());
            buf.consume(buf.size());
            auto j = json::parse(s, nullptr, false);
            if (!j.is_object() || j.value("topic", std::string()) != "cv-frame")
                continue;
            auto payload = j.value("payload", std::string());
            std::cout << "frame " << seen << " bytes=" << payload.size() << "\n";
            ++seen;
        }
        ws.close(websocket::close_code::normal);
        return 0;
    }
    catch (const boost::system::system_error &e)
    {
        if (e.code() == websocket::error::closed)
            return 0;
        std::cerr << "frame_client error: " << e.what() << "\n";
        return 1;
    }
    catch (const std::exception &e)
    {
        std::cerr << "frame_client error: " << e.what() << "\n";
        return 1;
    }
}
