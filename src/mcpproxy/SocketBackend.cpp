//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SocketBackend.cpp
// Purpose: Unix domain socket MCP backend (Boost.Asio local streams) with POSIX FIFO fallback
//==========================================================================================================

#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <sys/stat.h>
#include <csignal>
#include <cstring>
#include <utility>

#include <boost/asio.hpp>

#include "mcpproxy/SocketBackend.hpp"
#include "mcpproxy/ResponseNormalizer.h"
#include "mcpproxy/errors/Errors.h"
#include "logging/Logger.h"

namespace mcpproxy {
namespace net = boost::asio;
using local_stream = net::local::stream_protocol;

namespace {

// Closes a POSIX descriptor on scope exit.
struct FdGuard {
    int fd{-1};
    explicit FdGuard(int f) : fd(f) {}
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;
    ~FdGuard() {
        if (fd >= 0) {
            ::close(fd);
        }
    }
};

std::string errnoText(int err) {
    return std::string(::strerror(err)) + " (errno=" + std::to_string(err) + ")";
}

void stripLineEnd(std::string& line) {
    if (!line.empty() && line.back() == '\n') {
        line.pop_back();
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
}

} // namespace

class SocketBackend::Impl {
public:
    SocketBackend::Options opts;
    net::io_context ioc;

    explicit Impl(const SocketBackend::Options& o) : opts(o) {}

    std::string exchangeOverSocket(local_stream::socket& socket, const std::string& frame) {
        boost::system::error_code ec;
        net::write(socket, net::buffer(frame), ec);
        if (ec) {
            throw errors::BackendError(errors::ErrorKind::SocketFailure,
                "Failed to write request to socket " + opts.path + ": " + ec.message());
        }

        std::string reply;
        std::size_t n = net::read_until(socket, net::dynamic_buffer(reply), '\n', ec);
        if (ec && ec != net::error::eof) {
            throw errors::BackendError(errors::ErrorKind::SocketFailure,
                "Failed to read response from socket " + opts.path + ": " + ec.message());
        }
        if (!ec) {
            reply.resize(n);
        } else if (reply.empty()) {
            throw errors::BackendError(errors::ErrorKind::SocketFailure,
                "Socket " + opts.path + " closed without a response");
        }
        stripLineEnd(reply);

        socket.shutdown(local_stream::socket::shutdown_both, ec);
        socket.close(ec);
        return reply;
    }

    std::string exchangeOverFifo(const std::string& frame) {
        LOG_DEBUG("SocketBackend: using FIFO fallback for {}", opts.path);
        // A reader that went away must surface as a failed write, not as SIGPIPE
        std::signal(SIGPIPE, SIG_IGN);
        {
            FdGuard out(::open(opts.path.c_str(), O_WRONLY | O_CLOEXEC));
            if (out.fd < 0) {
                throw errors::BackendError(errors::ErrorKind::SocketFailure,
                    "Failed to open pipe " + opts.path + " for writing: " + errnoText(errno));
            }
            std::size_t off = 0;
            while (off < frame.size()) {
                ssize_t w = ::write(out.fd, frame.data() + off, frame.size() - off);
                if (w < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    throw errors::BackendError(errors::ErrorKind::SocketFailure,
                        "Failed to write request to pipe " + opts.path + ": " + errnoText(errno));
                }
                off += static_cast<std::size_t>(w);
            }
        }

        FdGuard in(::open(opts.path.c_str(), O_RDONLY | O_CLOEXEC));
        if (in.fd < 0) {
            throw errors::BackendError(errors::ErrorKind::SocketFailure,
                "Failed to open pipe " + opts.path + " for reading: " + errnoText(errno));
        }
        std::string reply;
        char buf[4096];
        while (reply.find('\n') == std::string::npos) {
            ssize_t r = ::read(in.fd, buf, sizeof(buf));
            if (r < 0) {
                if (errno == EINTR) {
                    continue;
                }
                throw errors::BackendError(errors::ErrorKind::SocketFailure,
                    "Failed to read response from pipe " + opts.path + ": " + errnoText(errno));
            }
            if (r == 0) {
                break;
            }
            reply.append(buf, static_cast<std::size_t>(r));
        }
        std::size_t nl = reply.find('\n');
        if (nl != std::string::npos) {
            reply.resize(nl + 1);
        } else if (reply.empty()) {
            throw errors::BackendError(errors::ErrorKind::SocketFailure,
                "Pipe " + opts.path + " closed without a response");
        }
        stripLineEnd(reply);
        return reply;
    }

    std::string exchange(const std::string& line) {
        const std::string frame = line + "\n";

        local_stream::socket socket(ioc);
        boost::system::error_code connectEc;
        try {
            socket.connect(local_stream::endpoint(opts.path), connectEc);
        } catch (const boost::system::system_error& e) {
            // Paths longer than sun_path cannot be sockets; the FIFO shim may still apply
            connectEc = e.code();
        }
        if (!connectEc) {
            LOG_DEBUG("SocketBackend: connected to {}", opts.path);
            return exchangeOverSocket(socket, frame);
        }
        LOG_DEBUG("SocketBackend: connect to {} failed: {}", opts.path, connectEc.message());

        struct stat st{};
        if (::stat(opts.path.c_str(), &st) != 0) {
            const int err = errno;
            throw errors::BackendError(errors::ErrorKind::SocketFailure,
                "Failed to connect to " + opts.path + ": " + connectEc.message() + "; " + errnoText(err));
        }
        if (!S_ISFIFO(st.st_mode)) {
            throw errors::BackendError(errors::ErrorKind::SocketFailure,
                "Failed to connect to " + opts.path + ": " + connectEc.message() + "; path is not a FIFO either");
        }
        return exchangeOverFifo(frame);
    }
};

SocketBackend::SocketBackend(const Options& opts)
    : pImpl(std::make_unique<Impl>(opts)) {}

SocketBackend::SocketBackend(SocketBackend&&) noexcept = default;
SocketBackend& SocketBackend::operator=(SocketBackend&&) noexcept = default;

SocketBackend::~SocketBackend() = default;

std::string SocketBackend::Exchange(const std::string& line) {
    FUNC_SCOPE();
    return pImpl->exchange(line);
}

JSONValue SocketBackend::RoundTrip(const ToolRequest& request) {
    FUNC_SCOPE();
    const std::string payload = BuildBackendEnvelope(request).Serialize();
    LOG_DEBUG("SocketBackend: -> {}", payload);
    std::string reply = pImpl->exchange(payload);
    LOG_DEBUG("SocketBackend: <- {}", reply);
    return ParseBackendLine(reply);
}

std::string SocketBackend::Describe() const {
    return std::string("socket ") + pImpl->opts.path;
}

} // namespace mcpproxy
