/*
 * File: src/output_pump.hpp
 * Project: Rep Session Bridge
 * Purpose: Primary stdout -> "cv-frame" events, one per line
 * Notes:
 *  - State files live under --root, see DESIGN.md
 *  - Workout-id writes are atomic via include/atomic_write.hpp
 *  - Events go out over WebSocket as {topic, payload}
 * Last updated: 2026-10-18
 */

#pragma once
#include <atomic>
#include <exception>
#include <iostream>
#include <istream>
#include <memory>
#include <string>
#include <thread>
#include "event_publisher.hpp"

// Reads until EOF or a read error, publishing each line in order. Lines are
// opaque (base64 frames in production) and are never decoded here.
// Returns the number of lines read.
inline std::size_t pump_lines(std::istream &in, EventPublisher &pub)
{
    std::size_t n = 0;
    bool warned = false;
    std::string line;
    while (std::getline(in, line))
    {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        ++n;
        try
        {
            pub.publish(kFrameTopic, line);
        }
        catch (const std::exception &e)
        {
            // frame dropped, keep reading
            if (!warned)
                std::cerr << "WARN: publish failed (further failures not logged): " << e.what() << "\n";
            warned = true;
        }
    }
    return n;
}

// A running pump. The thread ends when the stream closes; the only way to
// end it early is to kill the writing process. Owners must join it.
struct OutputPump
{
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done = std::make_shared<std::atomic<bool>>(false);
};

// Runs pump_lines on its own thread. Throws std::system_error if the thread
// cannot be created.
template <class Stream>
OutputPump start_output_pump(std::shared_ptr<Stream> stream, std::shared_ptr<EventPublisher> pub)
{
    OutputPump p;
    p.thread = std::thread([stream = std::move(stream), pub = std::move(pub), done = p.done]
                           {
        auto n = pump_lines(*stream, *pub);
        std::cout << "bridge: output pump finished after " << n << " lines\n";
        done->store(true); });
    return p;
}
