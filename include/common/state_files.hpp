/*
 * File: include/common/state_files.hpp
 * Project: Rep Session Bridge
 * Purpose: Readers/writer for the JSON files shared with the CV process
 * Notes:
 *  - State files live under --root, see DESIGN.md
 *  - Workout-id writes are atomic via include/atomic_write.hpp
 *  - Events go out over WebSocket as {topic, payload}
 * Last updated: 2026-10-18
 */

#pragma once
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <boost/algorithm/string/predicate.hpp>
#include <nlohmann/json.hpp>
#include "atomic_write.hpp"


// Locations of everything the bridge reads or writes, relative to one root.
struct BridgePaths {
std::filesystem::path root{"."};
std::filesystem::path session_config() const { return root / "session_config.json"; }
std::filesystem::path rep_log() const { return root / "cv" / "reps_log.jsonl"; }
std::filesystem::path live_metrics() const { return root / "cv" / "session_live.json"; }
std::filesystem::path workout_id() const { return root / "workout_id.json"; }
};


struct StateFileError : std::runtime_error {
using std::runtime_error::runtime_error;
};


struct RepLogEntry {
std::optional<uint64_t> timestamp_ms;
std::optional<nlohmann::json> summary;
};


struct RepCount {
uint32_t count{0};
std::optional<nlohmann::json> last_summary;
std::vector<uint64_t> rep_timestamps;
};


inline nlohmann::json rep_count_to_json(const RepCount& rc){
nlohmann::json j{{"count", rc.count}, {"rep_timestamps", rc.rep_timestamps}};
if (rc.last_summary) j["last_summary"] = *rc.last_summary;
return j;
}


// nullopt when the line is not a JSON object or timestamp_ms is not an unsigned integer.
inline std::optional<RepLogEntry> parse_rep_log_entry(const std::string& line){
auto j = nlohmann::json::parse(line, nullptr, false);
if (j.is_discarded() || !j.is_object()) return std::nullopt;
RepLogEntry e;
auto ts = j.find("timestamp_ms");
if (ts != j.end() && !ts->is_null()) {
    if (!ts->is_number_unsigned()) return std::nullopt;
    e.timestamp_ms = ts->get<uint64_t>();
}
auto sm = j.find("summary");
if (sm != j.end() && !sm->is_null()) e.summary.emplace(*sm);
return e;
}


inline bool read_text_file(const std::filesystem::path& p, std::string& out){
std::ifstream f(p, std::ios::binary);
if (!f) return false;
std::ostringstream ss;
ss << f.rdbuf();
out = ss.str();
return true;
}


// Non-empty lines of a JSON-lines document; "\r\n" endings are accepted.
inline std::vector<std::string> non_empty_lines(const std::string& content){
std::vector<std::string> lines;
std::istringstream in(content);
std::string line;
while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (!line.empty()) lines.push_back(std::move(line));
}
return lines;
}


// A log that does not exist yet is a session with no reps, not an error.
inline RepCount read_rep_count(const std::filesystem::path& log_path){
RepCount rc;
std::string content;
if (!read_text_file(log_path, content)) return rc;
auto lines = non_empty_lines(content);
rc.count = static_cast<uint32_t>(lines.size());
rc.rep_timestamps.reserve(lines.size());
for (const auto& line : lines) {
    auto e = parse_rep_log_entry(line);
    if (e && e->timestamp_ms) rc.rep_timestamps.push_back(*e->timestamp_ms);
}
if (!lines.empty()) {
    auto last = parse_rep_log_entry(lines.back());
    if (last) rc.last_summary = std::move(last->summary);
}
return rc;
}


// The CV process rewrites this file at will; missing or mid-write both read as "nothing yet".
inline std::optional<nlohmann::json> read_live_metrics(const std::filesystem::path& path){
std::string content;
if (!read_text_file(path, content)) return std::nullopt;
auto j = nlohmann::json::parse(content, nullptr, false);
if (j.is_discarded()) return std::nullopt;
return std::make_optional(std::move(j));
}


inline std::string normalize_session_flag(const std::string& session){
return boost::algorithm::iequals(session, "on") ? "on" : "off";
}


// Overwrites the workout-id file with one line and returns the record written.
inline nlohmann::json write_workout_id(const std::filesystem::path& path,
                                       const std::string& workout_id,
                                       const std::string& session){
nlohmann::json rec{{"workout_id", workout_id}, {"session", normalize_session_flag(session)}};
try {
    write_atomic(path, rec.dump() + "\n");
}
catch (const std::exception& e) {
    throw StateFileError(e.what());
}
return rec;
}
