/*
 * File: include/common/session_config.hpp
 * Project: Rep Session Bridge
 * Purpose: session_config.json loader (auxiliary session scripts)
 * Notes:
 *  - State files live under --root, see DESIGN.md
 *  - Workout-id writes are atomic via include/atomic_write.hpp
 *  - Events go out over WebSocket as {topic, payload}
 * Last updated: 2026-10-18
 */

#pragma once
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>


struct SessionConfig {
std::vector<std::string> session_scripts; // one shell-style command line each
};


// Split a command line on runs of whitespace: "python a.py  -v" -> {python, a.py, -v}
inline std::vector<std::string> split_command(const std::string& cmdline){
std::istringstream iss(cmdline);
std::vector<std::string> tokens;
std::string token;
while (iss >> token) tokens.push_back(token);
return tokens;
}


// Parse the config document. Throws on bad shape.
inline SessionConfig session_config_from_json(const nlohmann::json& j){
SessionConfig cfg;
if (!j.is_object()) throw std::runtime_error("session config must be a JSON object");
auto it = j.find("session_scripts");
if (it != j.end() && !it->is_null())
    cfg.session_scripts = it->get<std::vector<std::string>>();
return cfg;
}


// Missing file or bad document both mean "no session scripts".
inline SessionConfig load_session_config(const std::filesystem::path& path) noexcept {
try {
    std::ifstream f(path);
    if (!f) return {};
    std::ostringstream ss;
    ss << f.rdbuf();
    auto j = nlohmann::json::parse(ss.str(), nullptr, false);
    if (j.is_discarded()) {
        std::cerr << "WARN: ignoring unparsable " << path.string() << "\n";
        return {};
    }
    return session_config_from_json(j);
}
catch (const std::exception& e) {
    std::cerr << "WARN: ignoring " << path.string() << ": " << e.what() << "\n";
    return {};
}
}
