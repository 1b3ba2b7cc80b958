//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcpproxy/HTTPBackend.cpp
// Purpose: HTTP/HTTPS MCP backend using Boost.Beast coroutines (TLS via OpenSSL)
//==========================================================================================================

//==========================================================================================================
#include <utility>
#include <thread>
#include <atomic>
#include <future>
#include <mutex>
#include <chrono>
#include <exception>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/http.hpp>

#include "logging/Logger.h"
#include "mcpproxy/HTTPBackend.hpp"
#include "mcpproxy/ResponseNormalizer.h"
#include "mcpproxy/errors/Errors.h"
#include "mcpproxy/version.h"

#include <openssl/err.h>
#include <openssl/ssl.h>

namespace mcpproxy {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {
// Extra wait beyond the request deadline before the caller stops waiting for the coroutine.
constexpr std::chrono::milliseconds kCompletionSlack{250};
}

class HTTPBackend::Impl {
public:
    HTTPBackend::Options opts;

    // ------------------------------------------------------------------------------------------------------
    // URL parsing helpers (adequate for http[s]://host[:port][/path][?query])
    // ------------------------------------------------------------------------------------------------------
    struct UrlParts {
        std::string scheme;
        std::string host;
        std::string port;
        std::string target;
        bool defaultPort{true};
        bool bracketed{false};
    };
    UrlParts url;

    net::io_context ioc;
    std::thread ioThread;
    std::unique_ptr<ssl::context> sslCtx; // present when https
    std::unique_ptr<net::executor_work_guard<net::io_context::executor_type>> workGuard;
    std::mutex lifecycleMutex;
    std::atomic<bool> running{false};

    explicit Impl(const HTTPBackend::Options& o) : opts(o) {
        while (opts.url.size() > 1 && opts.url.back() == '/') {
            opts.url.pop_back();
        }
        url = parseUrl(opts.url);
        if (url.scheme != "http" && url.scheme != "https") {
            throw errors::ConfigError("Unsupported URL scheme '" + url.scheme + "' (expected http or https)");
        }
        if (url.host.empty()) {
            throw errors::ConfigError("URL has no host: " + opts.url);
        }
        if (url.scheme == "https") {
            sslCtx = std::make_unique<ssl::context>(ssl::context::tls_client);
            ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_2_VERSION);
            if (!opts.caFile.empty()) {
                boost::system::error_code ec;
                sslCtx->load_verify_file(opts.caFile, ec);
                if (ec) {
                    throw errors::ConfigError("HTTPS: failed to load CA file '" + opts.caFile + "': " + ec.message());
                }
            } else {
                boost::system::error_code ec;
                sslCtx->set_default_verify_paths(ec);
                if (ec) {
                    LOG_WARN("HTTPS: set_default_verify_paths failed: {}", ec.message());
                }
            }
            sslCtx->set_verify_mode(ssl::verify_peer);
        }
    }

    ~Impl() {
        stop();
    }

    static UrlParts parseUrl(const std::string& u) {
        UrlParts parts;
        std::size_t pos = 0;

        std::size_t schemeEnd = u.find("://");
        if (schemeEnd != std::string::npos) {
            parts.scheme = u.substr(0, schemeEnd);
            for (auto& c : parts.scheme) {
                c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
            }
            pos = schemeEnd + 3;
        } else {
            parts.scheme = std::string("http");
            pos = 0;
        }

        std::size_t slash = u.find_first_of("/?", pos);
        std::string hostPort;
        if (slash == std::string::npos) {
            hostPort = u.substr(pos);
            parts.target = std::string("/");
        } else {
            hostPort = u.substr(pos, slash - pos);
            parts.target = u.substr(slash);
            if (parts.target.front() == '?') {
                parts.target.insert(parts.target.begin(), '/');
            }
        }

        // [v6addr] or [v6addr]:port; the brackets stay in the Host header only
        std::string portText;
        if (!hostPort.empty() && hostPort.front() == '[') {
            std::size_t close = hostPort.find(']');
            if (close == std::string::npos) {
                return parts;
            }
            parts.host = hostPort.substr(1, close - 1);
            parts.bracketed = true;
            if (close + 1 < hostPort.size()) {
                if (hostPort[close + 1] != ':') {
                    parts.host.clear();
                    return parts;
                }
                portText = hostPort.substr(close + 2);
            }
        } else {
            std::size_t colon = hostPort.rfind(':');
            if (colon == std::string::npos) {
                parts.host = hostPort;
            } else {
                parts.host = hostPort.substr(0, colon);
                portText = hostPort.substr(colon + 1);
            }
        }
        if (portText.empty()) {
            parts.port = (parts.scheme == std::string("https")) ? std::string("443") : std::string("80");
        } else {
            parts.port = portText;
            parts.defaultPort = false;
        }
        return parts;
    }

    std::string hostHeader() const {
        const std::string name = url.bracketed ? "[" + url.host + "]" : url.host;
        return url.defaultPort ? name : name + ":" + url.port;
    }

    void start() {
        std::lock_guard<std::mutex> lk(lifecycleMutex);
        if (running.load()) {
            return;
        }
        ioc.restart();
        workGuard = std::make_unique<net::executor_work_guard<net::io_context::executor_type>>(net::make_work_guard(ioc));
        ioThread = std::thread([this]() {
            try {
                ioc.run();
            } catch (const std::exception& e) {
                LOG_ERROR("HTTPBackend: io_context terminated: {}", e.what());
            }
        });
        running.store(true);
        LOG_DEBUG("HTTPBackend: worker started for {}", opts.url);
    }

    void stop() {
        std::lock_guard<std::mutex> lk(lifecycleMutex);
        if (workGuard) {
            workGuard->reset();
            workGuard.reset();
        }
        ioc.stop();
        if (ioThread.joinable()) {
            ioThread.join();
        }
        running.store(false);
    }

    http::request<http::string_body> makeRequest(const std::string& body) const {
        http::request<http::string_body> req{http::verb::post, url.target, 11};
        req.set(http::field::host, hostHeader());
        req.set(http::field::content_type, "application/json");
        req.set(http::field::accept, "application/json, text/event-stream");
        req.set(http::field::user_agent, std::string(kServerName) + "/" + getVersionString());
        req.set(http::field::connection, "close");
        req.body() = body;
        req.prepare_payload();
        return req;
    }

    static HTTPBackend::HttpReply toReply(http::response<http::string_body>&& res) {
        HTTPBackend::HttpReply reply;
        reply.status = static_cast<int>(res.result_int());
        reply.contentType = std::string(res[http::field::content_type]);
        reply.body = std::move(res.body());
        return reply;
    }

    // Coroutine: POST JSON and return the status and full body
    net::awaitable<HTTPBackend::HttpReply> coPostJson(const std::string body) {
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(opts.timeoutMs);
        auto req = makeRequest(body);

        // The stream deadline starts at connect, so resolution gets its own timer on the same deadline
        tcp::resolver resolver(co_await net::this_coro::executor);
        net::steady_timer resolveTimer(co_await net::this_coro::executor);
        resolveTimer.expires_at(deadline);
        bool resolveExpired = false;
        resolveTimer.async_wait([&resolver, &resolveExpired](const boost::system::error_code& ec) {
            if (!ec) {
                resolveExpired = true;
                resolver.cancel();
            }
        });
        boost::system::error_code resolveEc;
        auto results = co_await resolver.async_resolve(url.host, url.port,
                                                       net::redirect_error(net::use_awaitable, resolveEc));
        resolveTimer.cancel();
        if (resolveExpired) {
            throw boost::system::system_error(boost::beast::error::timeout, "resolve");
        }
        if (resolveEc) {
            throw boost::system::system_error(resolveEc, "resolve");
        }
        LOG_DEBUG("HTTPBackend: resolved {}:{} target={}", url.host, url.port, url.target);

        boost::beast::flat_buffer buffer;
        http::response_parser<http::string_body> parser;
        parser.body_limit(opts.bodyLimit);

        if (url.scheme == "https") {
            boost::beast::ssl_stream<boost::beast::tcp_stream> stream(co_await net::this_coro::executor, *sslCtx);
            if (!::SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
                throw boost::system::system_error(
                    boost::system::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()),
                    "HTTPS: failed to set SNI hostname");
            }
            if (!::SSL_set1_host(stream.native_handle(), url.host.c_str())) {
                throw boost::system::system_error(
                    boost::system::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()),
                    "HTTPS: failed to set expected peer hostname");
            }

            boost::beast::get_lowest_layer(stream).expires_at(deadline);
            co_await boost::beast::get_lowest_layer(stream).async_connect(results, net::use_awaitable);
            co_await stream.async_handshake(ssl::stream_base::client, net::use_awaitable);
            co_await http::async_write(stream, req, net::use_awaitable);
            LOG_DEBUG("HTTPBackend: https wrote request bytes={}", req.body().size());
            co_await http::async_read(stream, buffer, parser, net::use_awaitable);
            LOG_DEBUG("HTTPBackend: https read response bytes={}", parser.get().body().size());

            // Servers frequently drop the connection without close_notify; that is not an error here
            boost::system::error_code ec;
            co_await stream.async_shutdown(net::redirect_error(net::use_awaitable, ec));
            co_return toReply(parser.release());
        } else {
            boost::beast::tcp_stream stream(co_await net::this_coro::executor);
            stream.expires_at(deadline);
            co_await stream.async_connect(results, net::use_awaitable);
            LOG_DEBUG("HTTPBackend: http connected");
            co_await http::async_write(stream, req, net::use_awaitable);
            LOG_DEBUG("HTTPBackend: http wrote request bytes={}", req.body().size());
            co_await http::async_read(stream, buffer, parser, net::use_awaitable);
            LOG_DEBUG("HTTPBackend: http read response bytes={}", parser.get().body().size());
            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_both, ec);
            co_return toReply(parser.release());
        }
    }
};

HTTPBackend::HTTPBackend(const Options& opts)
    : pImpl(std::make_unique<Impl>(opts)) {}

HTTPBackend::HTTPBackend(HTTPBackend&&) noexcept = default;
HTTPBackend& HTTPBackend::operator=(HTTPBackend&&) noexcept = default;

HTTPBackend::~HTTPBackend() = default;

void HTTPBackend::Start() {
    FUNC_SCOPE();
    pImpl->start();
}

void HTTPBackend::Close() {
    FUNC_SCOPE();
    if (pImpl) {
        pImpl->stop();
    }
}

HTTPBackend::HttpReply HTTPBackend::Post(const std::string& jsonBody) {
    FUNC_SCOPE();
    if (!pImpl->running.load()) {
        pImpl->start();
    }

    std::promise<HttpReply> promise;
    auto fut = promise.get_future();
    Impl* impl = pImpl.get();
    net::co_spawn(impl->ioc, impl->coPostJson(jsonBody),
        [pr = std::move(promise)](std::exception_ptr eptr, HttpReply reply) mutable {
            if (eptr) {
                pr.set_exception(eptr);
                return;
            }
            pr.set_value(std::move(reply));
        });

    // A getaddrinfo call already in flight cannot be cancelled, so the wait itself is bounded too
    const auto bound = std::chrono::milliseconds(impl->opts.timeoutMs) + kCompletionSlack;
    if (fut.wait_for(bound) != std::future_status::ready) {
        LOG_WARN("HTTPBackend: no completion within {} ms, abandoning request", bound.count());
        throw errors::BackendError(errors::ErrorKind::HttpFailure,
            std::string("Request to MCP server timed out after ") + std::to_string(impl->opts.timeoutMs) + " ms");
    }

    try {
        return fut.get();
    } catch (const boost::system::system_error& e) {
        if (e.code() == boost::beast::error::timeout) {
            throw errors::BackendError(errors::ErrorKind::HttpFailure,
                std::string("Request to MCP server timed out after ") + std::to_string(impl->opts.timeoutMs) + " ms");
        }
        throw errors::BackendError(errors::ErrorKind::HttpFailure,
            std::string("Failed to send request to MCP server: ") + e.what());
    } catch (const errors::BackendError&) {
        throw;
    } catch (const std::exception& e) {
        throw errors::BackendError(errors::ErrorKind::HttpFailure,
            std::string("Failed to send request to MCP server: ") + e.what());
    }
}

JSONValue HTTPBackend::RoundTrip(const ToolRequest& request) {
    FUNC_SCOPE();
    const std::string payload = BuildBackendEnvelope(request).Serialize();
    LOG_DEBUG("HTTPBackend: POST {} {}", pImpl->opts.url, payload);
    HttpReply reply = Post(payload);
    LOG_DEBUG("HTTPBackend: status {} content-type '{}' body {} bytes", reply.status, reply.contentType, reply.body.size());

    if (reply.status < 200 || reply.status >= 300) {
        LOG_WARN("MCP server returned error: {}", reply.status);
        LOG_WARN("Response body: {}", reply.body);
    }
    return NormalizeHttpBody(reply.status, reply.body);
}

std::string HTTPBackend::Describe() const {
    return std::string("http ") + pImpl->opts.url + " (timeout " + std::to_string(pImpl->opts.timeoutMs) + " ms)";
}

} // namespace mcpproxy
