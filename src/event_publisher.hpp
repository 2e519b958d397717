#pragma once
#include <string>

// Topic every primary-process stdout line is published under.
inline constexpr const char* kFrameTopic = "cv-frame";

// Fan-out boundary between the output pump and whoever is listening.
// Implementations must tolerate calls from a non-io thread.
class EventPublisher
{
public:
    virtual ~EventPublisher() = default;
    virtual void publish(const std::string &topic, const std::string &payload) = 0;
};
