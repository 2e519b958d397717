#pragma once
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <mutex>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include "event_publisher.hpp"

namespace fs = std::filesystem;

// Fresh directory under the system temp dir, removed on scope exit.
struct TempRoot {
fs::path path;
TempRoot(){
    std::random_device rd;
    path = fs::temp_directory_path() / ("session_bridge_test_" + std::to_string(rd()) + std::to_string(rd()));
    fs::create_directories(path / "cv");
}
~TempRoot(){ std::error_code ec; fs::remove_all(path, ec); }
TempRoot(const TempRoot&) = delete;
TempRoot& operator=(const TempRoot&) = delete;
};

inline void write_file(const fs::path& p, const std::string& content){
fs::create_directories(p.parent_path());
std::ofstream f(p, std::ios::binary | std::ios::trunc);
f << content;
}

inline std::string read_file(const fs::path& p){
std::ifstream f(p, std::ios::binary);
return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
}

class RecordingPublisher : public EventPublisher {
std::mutex m_;
std::condition_variable cv_;
std::vector<std::pair<std::string, std::string>> events_;
public:
void publish(const std::string& topic, const std::string& payload) override {
    { std::scoped_lock lk(m_); events_.emplace_back(topic, payload); }
    cv_.notify_all();
}
// Waits until at least n events arrived (or the timeout passed) and returns a snapshot.
std::vector<std::pair<std::string, std::string>> wait_for(std::size_t n, std::chrono::milliseconds timeout = std::chrono::seconds(5)){
    std::unique_lock lk(m_);
    cv_.wait_for(lk, timeout, [&]{ return events_.size() >= n; });
    return events_;
}
std::vector<std::pair<std::string, std::string>> events(){ std::scoped_lock lk(m_); return events_; }
};

// Publisher whose every delivery fails.
struct ThrowingPublisher : EventPublisher {
int calls = 0;
void publish(const std::string&, const std::string&) override { ++calls; throw std::runtime_error("no subscribers"); }
};
