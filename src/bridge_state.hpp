/*
 * File: src/bridge_state.hpp
 * Project: Rep Session Bridge
 * Purpose: Context object shared by the HTTP and WebSocket servers
 * Notes:
 *  - State files live under --root, see DESIGN.md
 *  - Workout-id writes are atomic via include/atomic_write.hpp
 *  - Events go out over WebSocket as {topic, payload}
 * Last updated: 2026-10-18
 */

#pragma once
#include <memory>
#include <string>
#include <chrono>
#include "common/state_files.hpp"
#include "session_supervisor.hpp"


struct BridgeState {
BridgePaths paths;
std::unique_ptr<SessionSupervisor> supervisor; // set once the publisher exists
unsigned short ws_port{8090};
std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();
};
