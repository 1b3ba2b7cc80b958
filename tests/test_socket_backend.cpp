//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_socket_backend.cpp
// Purpose: SocketBackend against a Unix domain socket peer and a FIFO peer
//==========================================================================================================

#include <gtest/gtest.h>

#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>

#include <cstdio>
#include <mutex>
#include <string>
#include <thread>

#include <boost/asio.hpp>

#include "mcpproxy/SocketBackend.hpp"
#include "mcpproxy/errors/Errors.h"

using namespace mcpproxy;

namespace {

using local_stream = boost::asio::local::stream_protocol;

std::string tempPath(const std::string& tag) {
    return "/tmp/mcpproxy_test_" + std::to_string(::getpid()) + "_" + tag;
}

// Accepts `count` connections; answers each request line with `reply` and records the request.
struct SocketPeer {
    std::string path;
    std::string reply;
    boost::asio::io_context io;
    local_stream::acceptor acceptor{io};
    std::thread thr;
    std::mutex mtx;
    std::string lastRequest;

    SocketPeer(std::string p, std::string r) : path(std::move(p)), reply(std::move(r)) {
        std::remove(path.c_str());
        acceptor.open(local_stream());
        acceptor.bind(local_stream::endpoint(path));
        acceptor.listen();
    }

    ~SocketPeer() {
        if (thr.joinable()) {
            thr.join();
        }
        boost::system::error_code ec;
        acceptor.close(ec);
        std::remove(path.c_str());
    }

    void serve(int count) {
        thr = std::thread([this, count]() {
            for (int i = 0; i < count; ++i) {
                boost::system::error_code ec;
                local_stream::socket socket(io);
                acceptor.accept(socket, ec);
                if (ec) {
                    return;
                }
                std::string request;
                std::size_t n = boost::asio::read_until(socket, boost::asio::dynamic_buffer(request), '\n', ec);
                if (!ec) {
                    std::lock_guard<std::mutex> lk(mtx);
                    lastRequest = request.substr(0, n);
                }
                if (!reply.empty()) {
                    boost::asio::write(socket, boost::asio::buffer(reply), ec);
                }
                socket.close(ec);
            }
        });
    }
};

// Reads one request line from the FIFO, then writes the reply into it.
struct FifoPeer {
    std::string path;
    std::string reply;
    std::thread thr;
    std::string request;

    FifoPeer(std::string p, std::string r) : path(std::move(p)), reply(std::move(r)) {
        std::remove(path.c_str());
        if (::mkfifo(path.c_str(), 0600) != 0) {
            ADD_FAILURE() << "mkfifo failed for " << path;
        }
    }

    ~FifoPeer() {
        if (thr.joinable()) {
            thr.join();
        }
        std::remove(path.c_str());
    }

    void serve() {
        thr = std::thread([this]() {
            int in = ::open(path.c_str(), O_RDONLY);
            if (in < 0) {
                return;
            }
            char buf[1024];
            ssize_t r;
            while ((r = ::read(in, buf, sizeof(buf))) > 0) {
                request.append(buf, static_cast<std::size_t>(r));
                if (request.find('\n') != std::string::npos) {
                    break;
                }
            }
            ::close(in);

            int out = ::open(path.c_str(), O_WRONLY);
            if (out < 0) {
                return;
            }
            ssize_t w = ::write(out, reply.data(), reply.size());
            (void)w;
            ::close(out);
        });
    }
};

ToolRequest listTools() {
    return ToolRequest{"tools/list", JSONValue(JSONValue::Object{})};
}

} // namespace

TEST(SocketBackend, RoundTripOverUnixSocket) {
    SocketPeer peer(tempPath("rt.sock"), "{\"jsonrpc\":\"2.0\",\"id\":1,\"result\":{\"tools\":[]}}\n");
    peer.serve(1);

    SocketBackend backend(SocketBackend::Options{peer.path});
    JSONValue reply = backend.RoundTrip(listTools());
    EXPECT_EQ(reply, ParseJSON(R"({"jsonrpc":"2.0","id":1,"result":{"tools":[]}})"));

    std::lock_guard<std::mutex> lk(peer.mtx);
    ASSERT_FALSE(peer.lastRequest.empty());
    EXPECT_EQ(peer.lastRequest.back(), '\n');
    EXPECT_EQ(ParseJSON(peer.lastRequest), ParseJSON(R"({"jsonrpc":"2.0","id":1,"method":"tools/list","params":{}})"));
}

TEST(SocketBackend, ConnectsFreshForEachExchange) {
    SocketPeer peer(tempPath("multi.sock"), "{\"result\":{}}\r\n");
    peer.serve(3);

    SocketBackend backend(SocketBackend::Options{peer.path});
    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(backend.Exchange("{\"n\":" + std::to_string(i) + "}"), "{\"result\":{}}");
    }
}

TEST(SocketBackend, ReplyWithoutTrailingNewlineIsAccepted) {
    SocketPeer peer(tempPath("eof.sock"), "{\"result\":{\"ok\":true}}");
    peer.serve(1);

    SocketBackend backend(SocketBackend::Options{peer.path});
    JSONValue reply = backend.RoundTrip(listTools());
    EXPECT_TRUE(std::get<bool>(reply.Find("result")->Find("ok")->value));
}

TEST(SocketBackend, PeerClosingWithoutReplyFails) {
    SocketPeer peer(tempPath("silent.sock"), "");
    peer.serve(1);

    SocketBackend backend(SocketBackend::Options{peer.path});
    try {
        (void)backend.RoundTrip(listTools());
        FAIL() << "expected SocketFailure";
    } catch (const errors::BackendError& e) {
        EXPECT_EQ(e.kind(), errors::ErrorKind::SocketFailure);
    }
}

TEST(SocketBackend, FifoFallback) {
    FifoPeer peer(tempPath("fifo"), "{\"jsonrpc\":\"2.0\",\"id\":1,\"result\":{\"tools\":[{\"name\":\"f\"}]}}\n");
    peer.serve();

    SocketBackend backend(SocketBackend::Options{peer.path});
    JSONValue reply = backend.RoundTrip(listTools());
    peer.thr.join();

    EXPECT_NE(reply.Find("result"), nullptr);
    EXPECT_EQ(ParseJSON(peer.request), ParseJSON(R"({"jsonrpc":"2.0","id":1,"method":"tools/list","params":{}})"));
}

TEST(SocketBackend, MissingPathFails) {
    SocketBackend backend(SocketBackend::Options{tempPath("does-not-exist.sock")});
    try {
        (void)backend.RoundTrip(listTools());
        FAIL() << "expected SocketFailure";
    } catch (const errors::BackendError& e) {
        EXPECT_EQ(e.kind(), errors::ErrorKind::SocketFailure);
        EXPECT_NE(std::string(e.what()).find("does-not-exist.sock"), std::string::npos);
    }
}

TEST(SocketBackend, RegularFileIsNotAFifo) {
    const std::string path = tempPath("regular");
    FILE* f = std::fopen(path.c_str(), "w");
    ASSERT_NE(f, nullptr);
    std::fclose(f);

    SocketBackend backend(SocketBackend::Options{path});
    EXPECT_THROW((void)backend.Exchange("{}"), errors::BackendError);
    std::remove(path.c_str());
}

TEST(SocketBackend, GarbageReplyIsJsonParseError) {
    SocketPeer peer(tempPath("garbage.sock"), "hello\n");
    peer.serve(1);

    SocketBackend backend(SocketBackend::Options{peer.path});
    try {
        (void)backend.RoundTrip(listTools());
        FAIL() << "expected JsonParseError";
    } catch (const errors::BackendError& e) {
        EXPECT_EQ(e.kind(), errors::ErrorKind::JsonParseError);
    }
}
