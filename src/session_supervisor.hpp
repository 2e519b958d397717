/*
 * File: src/session_supervisor.hpp
 * Project: Rep Session Bridge
 * Purpose: Owns the CV pipeline process and the per-session scripts
 * Notes:
 *  - State files live under --root, see DESIGN.md
 *  - Workout-id writes are atomic via include/atomic_write.hpp
 *  - Events go out over WebSocket as {topic, payload}
 * Last updated: 2026-10-18
 */

#pragma once
#include <boost/process.hpp>

#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include "common/session_config.hpp"
#include "common/state_files.hpp"
#include "event_publisher.hpp"
#include "output_pump.hpp"

namespace bp = boost::process;

// Primary process could not be launched by any launcher.
struct SpawnError : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

struct SupervisorOptions
{
    BridgePaths paths;
    std::vector<std::string> launchers{"python3", "python"}; // tried in order
    std::filesystem::path script{"cv/cv_stdout_frames.py"}; // relative to paths.root
};

enum class StartResult
{
    started,
    already_running
};

inline const char *to_string(StartResult r)
{
    return r == StartResult::started ? "started" : "already_running";
}

// Bare names are looked up on PATH; anything with a slash is taken as a path
// (relative ones against root). Empty result means "not found".
inline boost::filesystem::path resolve_program(const std::string &name, const std::filesystem::path &root)
{
    if (name.find('/') != std::string::npos)
    {
        std::filesystem::path p(name);
        if (p.is_relative())
            p = root / p;
        std::error_code ec;
        if (!std::filesystem::exists(p, ec))
            return {};
        return boost::filesystem::path(p.string());
    }
    return bp::search_path(name);
}

class SessionSupervisor
{
    SupervisorOptions opts_;
    std::shared_ptr<EventPublisher> pub_;
    mutable std::mutex mtx_;
    std::optional<bp::child> primary_;  // present iff a session is running
    std::vector<bp::child> auxiliary_;
    std::vector<OutputPump> pumps_;     // one per start, joined on destruction

public:
    SessionSupervisor(SupervisorOptions opts, std::shared_ptr<EventPublisher> pub)
        : opts_(std::move(opts)), pub_(std::move(pub))
    {
        opts_.paths.root = std::filesystem::absolute(opts_.paths.root);
    }

    SessionSupervisor(const SessionSupervisor &) = delete;
    SessionSupervisor &operator=(const SessionSupervisor &) = delete;

    ~SessionSupervisor()
    {
        try
        {
            stop();
            // the primary is dead, so every pump sees EOF; after this no thread
            // can reach the publisher through us
            for (auto &p : pumps_)
                if (p.thread.joinable())
                    p.thread.join();
        }
        catch (const std::system_error &e)
        {
            std::cerr << "bridge error: teardown failed: " << e.what() << "\n";
        }
    }

    // Idempotent. Throws SpawnError if the primary process cannot be launched,
    // std::system_error if its pump thread cannot be created; either way nothing
    // is left running. Session scripts are best effort and never fail the start.
    StartResult start()
    {
        {
            // held across the spawn so two racing starts cannot both launch
            std::scoped_lock lk(mtx_);
            if (primary_)
                return StartResult::already_running;

            reap_finished_pumps();
            pumps_.reserve(pumps_.size() + 1);
            auto launched = spawn_primary();
            OutputPump pump;
            try
            {
                pump = start_output_pump(std::move(launched.out), pub_);
            }
            catch (const std::system_error &)
            {
                std::error_code ec;
                launched.child.terminate(ec);
                throw;
            }
            primary_.emplace(std::move(launched.child));
            pumps_.push_back(std::move(pump));
            std::cout << "bridge: primary started pid=" << primary_->id() << "\n";
        }
        spawn_session_scripts();
        return StartResult::started;
    }

    // Kills everything we own. Does not wait for the processes to exit.
    void stop()
    {
        std::scoped_lock lk(mtx_);
        std::error_code ec;
        if (primary_)
        {
            primary_->terminate(ec);
            std::cout << "bridge: primary stopped pid=" << primary_->id() << "\n";
            primary_.reset();
        }
        for (auto &c : auxiliary_)
            c.terminate(ec);
        auxiliary_.clear();
    }

    bool running() const
    {
        std::scoped_lock lk(mtx_);
        return primary_.has_value();
    }

    std::optional<bp::pid_t> primary_pid() const
    {
        std::scoped_lock lk(mtx_);
        if (!primary_)
            return std::nullopt;
        return primary_->id();
    }

    std::size_t auxiliary_count() const
    {
        std::scoped_lock lk(mtx_);
        return auxiliary_.size();
    }

private:
    struct Launched
    {
        bp::child child;
        std::shared_ptr<bp::ipstream> out;
    };

    // Pumps of earlier sessions that already saw EOF. Caller holds mtx_.
    void reap_finished_pumps()
    {
        for (auto it = pumps_.begin(); it != pumps_.end();)
        {
            if (it->done->load())
            {
                it->thread.join();
                it = pumps_.erase(it);
            }
            else
                ++it;
        }
    }

    Launched spawn_primary()
    {
        const auto &root = opts_.paths.root;
        const auto script = root / opts_.script;
        std::error_code ec;
        if (!std::filesystem::exists(script, ec))
            throw SpawnError("primary script not found at " + script.string());

        std::string last_error = "no launcher configured";
        for (const auto &launcher : opts_.launchers)
        {
            auto exe = resolve_program(launcher, root);
            if (exe.empty())
            {
                last_error = launcher + ": not found";
                std::cerr << "WARN: launcher " << last_error << "\n";
                continue;
            }
            // a failed launch consumes the pipe's write end, so each attempt gets its own
            auto out = std::make_shared<bp::ipstream>();
            try
            {
                // stderr stays inherited so pipeline diagnostics reach the operator
                bp::child c(bp::exe = exe,
                            bp::args = std::vector<std::string>{script.string()},
                            bp::start_dir = root.string(),
                            bp::std_out > *out);
                return Launched{std::move(c), std::move(out)};
            }
            catch (const bp::process_error &e)
            {
                last_error = launcher + ": " + e.what();
                std::cerr << "WARN: launcher " << last_error << "\n";
            }
        }
        throw SpawnError("Failed to run primary pipeline: " + last_error);
    }

    void spawn_session_scripts()
    {
        const auto &root = opts_.paths.root;
        auto cfg = load_session_config(opts_.paths.session_config());
        for (const auto &cmd : cfg.session_scripts)
        {
            auto parts = split_command(cmd);
            if (parts.empty())
                continue;
            auto exe = resolve_program(parts[0], root);
            if (exe.empty())
            {
                std::cerr << "WARN: session script skipped, not found: " << parts[0] << "\n";
                continue;
            }
            std::vector<std::string> args(parts.begin() + 1, parts.end());
            try
            {
                bp::child c(bp::exe = exe,
                            bp::args = args,
                            bp::start_dir = root.string(),
                            bp::std_out > bp::null,
                            bp::std_err > bp::null);
                std::scoped_lock lk(mtx_);
                if (!primary_)
                {
                    // stop() ran while we were spawning
                    std::error_code ec;
                    c.terminate(ec);
                    continue;
                }
                std::cout << "bridge: session script started pid=" << c.id() << " cmd=" << cmd << "\n";
                auxiliary_.push_back(std::move(c));
            }
            catch (const bp::process_error &e)
            {
                std::cerr << "WARN: session script skipped: " << cmd << ": " << e.what() << "\n";
            }
        }
    }
};
