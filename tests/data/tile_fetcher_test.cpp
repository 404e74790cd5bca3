// Copyright (c) 2025 DEM Query Project
// SPDX-License-Identifier: MIT

#include <dem_query/data/tile_fetcher.h>
#include <dem_query/errors.h>

#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cstdint>
#include <cstdlib>
#include <string>
#include <thread>
#include <utility>

namespace dem_query {
namespace {

/// Loopback HTTP server answering exactly one request with a canned response
class OneShotHttpServer {
public:
    OneShotHttpServer(std::string status_line, std::string body)
        : status_line_(std::move(status_line)), body_(std::move(body)) {
        listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        if (listen_fd_ < 0) {
            return;
        }

        // accept() gives up if the client never connects
        timeval timeout{};
        timeout.tv_sec = 5;
        ::setsockopt(listen_fd_, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        socklen_t addr_len = sizeof(addr);
        if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
            ::listen(listen_fd_, 1) != 0 ||
            ::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &addr_len) != 0) {
            ::close(listen_fd_);
            listen_fd_ = -1;
            return;
        }
        port_ = ntohs(addr.sin_port);

        thread_ = std::thread([this] { ServeOne(); });
    }

    ~OneShotHttpServer() {
        Wait();
        if (listen_fd_ >= 0) {
            ::close(listen_fd_);
        }
    }

    bool IsListening() const { return listen_fd_ >= 0; }

    std::string GetURL(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(port_) + path;
    }

    /// Block until the request has been answered
    void Wait() {
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    /// Request head as received; read only after Wait()
    const std::string& GetRequest() const { return request_; }

private:
    void ServeOne() {
        const int client_fd = ::accept(listen_fd_, nullptr, nullptr);
        if (client_fd < 0) {
            return;
        }

        char buffer[1024];
        while (request_.find("\r\n\r\n") == std::string::npos) {
            const ssize_t received = ::recv(client_fd, buffer, sizeof(buffer), 0);
            if (received <= 0) {
                break;
            }
            request_.append(buffer, static_cast<std::size_t>(received));
        }

        const std::string response = "HTTP/1.1 " + status_line_ + "\r\n" +
                                     "Content-Length: " + std::to_string(body_.size()) + "\r\n" +
                                     "Connection: close\r\n\r\n" + body_;
        std::size_t sent = 0;
        while (sent < response.size()) {
            const ssize_t n = ::send(client_fd, response.data() + sent, response.size() - sent, 0);
            if (n <= 0) {
                break;
            }
            sent += static_cast<std::size_t>(n);
        }
        ::close(client_fd);
    }

    std::string status_line_;
    std::string body_;
    std::string request_;
    int listen_fd_ = -1;
    std::uint16_t port_ = 0;
    std::thread thread_;
};

/// Test fixture for the libcurl tile fetcher
class TileFetcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Loopback requests must not be routed through an environment proxy
        for (const char* name : {"http_proxy", "HTTP_PROXY", "all_proxy", "ALL_PROXY"}) {
            ::unsetenv(name);
        }

        config_.timeout_seconds = 1;
        config_.user_agent = "DEMQueryTest/0.1";
    }

    TileFetcherConfig config_;
};

TEST_F(TileFetcherTest, CreateReturnsFetcher) {
    EXPECT_NE(TileFetcher::Create(config_), nullptr);
    EXPECT_NE(TileFetcher::Create(TileFetcherConfig{}), nullptr);
}

TEST_F(TileFetcherTest, SuccessReturnsStatusAndBody) {
    OneShotHttpServer server("200 OK", "tile-bytes");
    ASSERT_TRUE(server.IsListening());

    const auto fetcher = TileFetcher::Create(config_);
    const HttpResponse response = fetcher->Fetch(server.GetURL("/dem_png/15/29105/12903.png"));

    EXPECT_EQ(response.status_code, 200u);
    EXPECT_EQ(std::string(response.body.begin(), response.body.end()), "tile-bytes");
    EXPECT_EQ(ClassifyResponse(response.status_code), ResponseClass::SUCCESS);
}

TEST_F(TileFetcherTest, NotFoundIsReturnedNotThrown) {
    OneShotHttpServer server("404 Not Found", "missing");
    ASSERT_TRUE(server.IsListening());

    const auto fetcher = TileFetcher::Create(config_);
    const HttpResponse response = fetcher->Fetch(server.GetURL("/dem5a_png/15/1/2.png"));

    EXPECT_EQ(response.status_code, 404u);
    EXPECT_EQ(ClassifyResponse(response.status_code), ResponseClass::NOT_FOUND);
}

TEST_F(TileFetcherTest, ServerErrorStatusPassesThrough) {
    OneShotHttpServer server("503 Service Unavailable", "");
    ASSERT_TRUE(server.IsListening());

    const auto fetcher = TileFetcher::Create(config_);
    const HttpResponse response = fetcher->Fetch(server.GetURL("/tile.png"));

    EXPECT_EQ(response.status_code, 503u);
    EXPECT_TRUE(response.body.empty());
}

TEST_F(TileFetcherTest, RequestCarriesPathAndUserAgent) {
    OneShotHttpServer server("200 OK", "x");
    ASSERT_TRUE(server.IsListening());

    const auto fetcher = TileFetcher::Create(config_);
    (void)fetcher->Fetch(server.GetURL("/dem_png/14/14552/6451.png"));
    server.Wait();

    const std::string& request = server.GetRequest();
    EXPECT_EQ(request.rfind("GET /dem_png/14/14552/6451.png HTTP/1.1\r\n", 0), 0u) << request;
    EXPECT_NE(request.find("User-Agent: DEMQueryTest/0.1\r\n"), std::string::npos) << request;
}

TEST_F(TileFetcherTest, RefusedConnectionIsTransportError) {
    // Port 1 on loopback has no listener
    const std::string url = "http://127.0.0.1:1/dem_png/15/0/0.png";
    const auto fetcher = TileFetcher::Create(config_);

    try {
        (void)fetcher->Fetch(url);
        FAIL() << "Expected TransportError";
    } catch (const TransportError& e) {
        EXPECT_EQ(e.GetURL(), url);
    }
}

TEST_F(TileFetcherTest, UnsupportedSchemeIsTransportError) {
    const auto fetcher = TileFetcher::Create(config_);
    EXPECT_THROW((void)fetcher->Fetch("notaproto://dem.example.com/15/0/0.png"), TransportError);
}

} // namespace
} // namespace dem_query
