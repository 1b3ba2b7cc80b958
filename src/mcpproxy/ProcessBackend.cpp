//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProcessBackend.cpp
// Purpose: Child-process MCP backend using Boost.Process pipe streams
//==========================================================================================================

#include <csignal>
#include <thread>
#include <mutex>
#include <system_error>

#include <boost/filesystem/path.hpp>
#include <boost/process/args.hpp>
#include <boost/process/child.hpp>
#include <boost/process/io.hpp>
#include <boost/process/pipe.hpp>
#include <boost/process/search_path.hpp>

#include "mcpproxy/ProcessBackend.hpp"
#include "mcpproxy/ResponseNormalizer.h"
#include "mcpproxy/errors/Errors.h"
#include "logging/Logger.h"

namespace mcpproxy {
namespace bp = boost::process;

class ProcessBackend::Impl {
public:
    ProcessBackend::Options opts;
    std::string displayName;

    bp::opstream toChild;
    bp::ipstream fromChild;
    bp::ipstream errFromChild;
    bp::child child;
    std::thread stderrThread;
    bool started{false};
    bool closed{false};
    std::optional<int> exitCode;
    mutable std::mutex mutex;

    explicit Impl(const ProcessBackend::Options& o) : opts(o) {
        auto slash = opts.command.rfind('/');
        displayName = (slash == std::string::npos) ? opts.command : opts.command.substr(slash + 1);
    }

    ~Impl() {
        try {
            shutdown();
        } catch (const std::exception& e) {
            LOG_ERROR("ProcessBackend: shutdown failed: {}", e.what());
        }
    }

    boost::filesystem::path resolveExecutable() const {
        if (opts.command.find('/') != std::string::npos) {
            return boost::filesystem::path(opts.command);
        }
        return bp::search_path(opts.command);
    }

    void spawn() {
        if (started) {
            return;
        }
        if (closed) {
            throw errors::BackendError(errors::ErrorKind::ProcessIoError, "Backend process was already shut down");
        }
        if (opts.command.empty()) {
            throw errors::BackendError(errors::ErrorKind::ProcessIoError, "No command configured for process backend");
        }
        // A dead child must surface as a failed write, not as SIGPIPE
        std::signal(SIGPIPE, SIG_IGN);

        boost::filesystem::path exe = resolveExecutable();
        if (exe.empty()) {
            throw errors::BackendError(errors::ErrorKind::ProcessIoError,
                "Failed to spawn '" + opts.command + "': not found in PATH");
        }
        try {
            child = bp::child(exe, bp::args(opts.args),
                              bp::std_in < toChild,
                              bp::std_out > fromChild,
                              bp::std_err > errFromChild);
        } catch (const bp::process_error& e) {
            throw errors::BackendError(errors::ErrorKind::ProcessIoError,
                "Failed to spawn '" + opts.command + "': " + e.what());
        }
        started = true;
        LOG_INFO("ProcessBackend: started '{}' (pid {})", exe.string(), child.id());

        stderrThread = std::thread([this]() {
            std::string line;
            while (std::getline(errFromChild, line)) {
                if (!line.empty() && line.back() == '\r') {
                    line.pop_back();
                }
                LOG_DEBUG("[{}] {}", displayName, line);
            }
        });
    }

    bool running() {
        if (!started || closed) {
            return false;
        }
        std::error_code ec;
        bool alive = child.running(ec);
        return alive && !ec;
    }

    std::string exitDescription() {
        std::error_code ec;
        if (!child.running(ec) && !ec) {
            return " (exit code " + std::to_string(child.exit_code()) + ")";
        }
        return std::string();
    }

    void shutdown() {
        if (!started || closed) {
            closed = true;
            return;
        }
        closed = true;

        // EOF on stdin is the polite way to ask a stdio MCP server to exit
        toChild.pipe().close();

        std::error_code ec;
        const auto deadline = std::chrono::steady_clock::now() + opts.shutdownGrace;
        while (child.running(ec) && !ec && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        ec.clear();
        if (child.running(ec) && !ec) {
            LOG_WARN("ProcessBackend: '{}' did not exit within {} ms, terminating", displayName, opts.shutdownGrace.count());
            child.terminate(ec);
            if (ec) {
                LOG_ERROR("ProcessBackend: terminate failed: {}", ec.message());
            }
        }
        ec.clear();
        child.wait(ec);
        if (!ec) {
            exitCode = child.exit_code();
            LOG_INFO("ProcessBackend: '{}' exited with code {}", displayName, *exitCode);
        }

        if (stderrThread.joinable()) {
            stderrThread.join();
        }
    }

    JSONValue roundTrip(const ToolRequest& request) {
        spawn();
        if (!running()) {
            throw errors::BackendError(errors::ErrorKind::ProcessIoError,
                "Backend process '" + displayName + "' is not running" + exitDescription());
        }

        const std::string payload = BuildBackendEnvelope(request).Serialize();
        LOG_DEBUG("ProcessBackend: -> {}", payload);
        toChild << payload << '\n';
        toChild.flush();
        if (!toChild) {
            throw errors::BackendError(errors::ErrorKind::ProcessIoError,
                "Failed to write request to backend process '" + displayName + "'" + exitDescription());
        }

        std::string line;
        if (!std::getline(fromChild, line)) {
            throw errors::BackendError(errors::ErrorKind::ProcessIoError,
                "Backend process '" + displayName + "' closed its output" + exitDescription());
        }
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        LOG_DEBUG("ProcessBackend: <- {}", line);
        return ParseBackendLine(line);
    }
};

ProcessBackend::ProcessBackend(const Options& opts)
    : pImpl(std::make_unique<Impl>(opts)) {}

ProcessBackend::ProcessBackend(ProcessBackend&&) noexcept = default;
ProcessBackend& ProcessBackend::operator=(ProcessBackend&&) noexcept = default;

ProcessBackend::~ProcessBackend() = default;

void ProcessBackend::Start() {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    pImpl->spawn();
}

void ProcessBackend::Close() {
    FUNC_SCOPE();
    if (!pImpl) {
        return;
    }
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    pImpl->shutdown();
}

bool ProcessBackend::IsRunning() const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    return pImpl->running();
}

std::optional<int> ProcessBackend::ExitCode() const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    return pImpl->exitCode;
}

JSONValue ProcessBackend::RoundTrip(const ToolRequest& request) {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    return pImpl->roundTrip(request);
}

std::string ProcessBackend::Describe() const {
    std::string d = std::string("process ") + pImpl->opts.command;
    for (const auto& a : pImpl->opts.args) {
        d += " " + a;
    }
    return d;
}

} // namespace mcpproxy
