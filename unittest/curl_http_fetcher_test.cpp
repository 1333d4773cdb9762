#include <gtest/gtest.h>
#include "backup/curl_http_fetcher.hpp"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <cstdlib>
#include <initializer_list>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

namespace {

std::string httpResponse(int status, const std::string& reason, const std::string& body) {
    return "HTTP/1.1 " + std::to_string(status) + " " + reason + "\r\n" +
           "Content-Type: application/octet-stream\r\n" +
           "Content-Length: " + std::to_string(body.size()) + "\r\n" +
           "Connection: close\r\n\r\n" + body;
}

std::string pattern(size_t size) {
    std::string data(size, '\0');
    for (size_t i = 0; i < size; ++i) {
        data[i] = static_cast<char>('A' + i % 23);
    }
    return data;
}

// Serves one canned response to the first connection on 127.0.0.1.
// With holdOpen the connection stays up after sending until the client leaves.
class LoopbackResponder {
public:
    explicit LoopbackResponder(std::string response, bool holdOpen = false)
        : response_(std::move(response)), holdOpen_(holdOpen) {
        listenFd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        if (listenFd_ < 0) {
            throw std::runtime_error("socket failed");
        }

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        socklen_t len = sizeof(addr);
        if (::bind(listenFd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
            ::listen(listenFd_, 4) != 0 ||
            ::getsockname(listenFd_, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
            ::close(listenFd_);
            throw std::runtime_error("failed to listen on loopback");
        }
        port_ = ntohs(addr.sin_port);
        thread_ = std::thread(&LoopbackResponder::serve, this);
    }

    ~LoopbackResponder() {
        // Wakes a pending accept()
        ::shutdown(listenFd_, SHUT_RDWR);
        if (thread_.joinable()) {
            thread_.join();
        }
        ::close(listenFd_);
    }

    LoopbackResponder(const LoopbackResponder&) = delete;
    LoopbackResponder& operator=(const LoopbackResponder&) = delete;

    std::string url(const std::string& path = "/backup.zip") const {
        return "http://127.0.0.1:" + std::to_string(port_) + path;
    }

    std::string request() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return request_;
    }

private:
    void serve() {
        int client = ::accept(listenFd_, nullptr, nullptr);
        if (client < 0) {
            return;
        }

        timeval timeout{5, 0};
        ::setsockopt(client, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));

        std::string received;
        char buffer[1024];
        while (received.find("\r\n\r\n") == std::string::npos) {
            ssize_t n = ::recv(client, buffer, sizeof(buffer), 0);
            if (n <= 0) {
                break;
            }
            received.append(buffer, static_cast<size_t>(n));
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            request_ = received;
        }

        size_t sent = 0;
        while (sent < response_.size()) {
            ssize_t n = ::send(client, response_.data() + sent, response_.size() - sent, MSG_NOSIGNAL);
            if (n <= 0) {
                break;
            }
            sent += static_cast<size_t>(n);
        }

        if (holdOpen_) {
            while (::recv(client, buffer, sizeof(buffer), 0) > 0) {
            }
        }
        ::close(client);
    }

    std::string response_;
    bool holdOpen_;
    int listenFd_{-1};
    int port_{0};
    std::thread thread_;
    mutable std::mutex mutex_;
    std::string request_;
};

} // namespace

class CurlHttpFetcherTest : public ::testing::Test {
protected:
    HttpFetcher::ChunkSink collectingSink() {
        return [this](const char* data, size_t size) {
            body_.append(data, size);
            return true;
        };
    }

    CurlHttpFetcher fetcher_{std::chrono::seconds(10)};
    CancellationToken token_;
    std::string body_;
};

TEST_F(CurlHttpFetcherTest, StreamsSuccessfulBodyToSink) {
    std::string payload = pattern(256 * 1024 + 3);
    LoopbackResponder server(httpResponse(200, "OK", payload));

    FetchResult result = fetcher_.fetch(server.url(), collectingSink(), token_);

    EXPECT_TRUE(result.transferred) << result.error;
    EXPECT_FALSE(result.cancelled);
    EXPECT_EQ(result.statusCode, 200);
    EXPECT_TRUE(result.isSuccessStatus());
    EXPECT_EQ(result.bytesWritten, payload.size());
    EXPECT_EQ(body_, payload);
    EXPECT_TRUE(result.bodySnippet.empty());

    std::string request = server.request();
    EXPECT_EQ(request.rfind("GET /backup.zip HTTP/1.1\r\n", 0), 0u);
    EXPECT_NE(request.find("User-Agent: httpbackup/1.0\r\n"), std::string::npos);
}

TEST_F(CurlHttpFetcherTest, EmptySuccessfulBody) {
    LoopbackResponder server(httpResponse(200, "OK", ""));

    FetchResult result = fetcher_.fetch(server.url(), collectingSink(), token_);

    EXPECT_TRUE(result.transferred) << result.error;
    EXPECT_EQ(result.statusCode, 200);
    EXPECT_EQ(result.bytesWritten, 0u);
    EXPECT_TRUE(body_.empty());
}

// A long error body is cut at the snippet limit and never reaches the sink
TEST_F(CurlHttpFetcherTest, ErrorStatusKeepsBoundedSnippet) {
    std::string errorBody = pattern(2000);
    LoopbackResponder server(httpResponse(404, "Not Found", errorBody));

    FetchResult result = fetcher_.fetch(server.url(), collectingSink(), token_);

    EXPECT_TRUE(result.transferred) << result.error;
    EXPECT_FALSE(result.cancelled);
    EXPECT_EQ(result.statusCode, 404);
    EXPECT_FALSE(result.isSuccessStatus());
    EXPECT_EQ(result.bodySnippet.size(), HttpFetcher::kMaxSnippetBytes);
    EXPECT_EQ(result.bodySnippet, errorBody.substr(0, HttpFetcher::kMaxSnippetBytes));
    EXPECT_EQ(result.bytesWritten, 0u);
    EXPECT_TRUE(body_.empty());
}

TEST_F(CurlHttpFetcherTest, ShortErrorBodyIsKeptWhole) {
    LoopbackResponder server(httpResponse(500, "Internal Server Error", "database offline"));

    FetchResult result = fetcher_.fetch(server.url(), collectingSink(), token_);

    EXPECT_TRUE(result.transferred) << result.error;
    EXPECT_EQ(result.statusCode, 500);
    EXPECT_EQ(result.bodySnippet, "database offline");
    EXPECT_TRUE(body_.empty());
}

TEST_F(CurlHttpFetcherTest, CancelledTokenSkipsRequest) {
    token_.cancel();

    FetchResult result = fetcher_.fetch("http://127.0.0.1:9/backup.zip", collectingSink(), token_);

    EXPECT_TRUE(result.cancelled);
    EXPECT_FALSE(result.transferred);
    EXPECT_EQ(result.statusCode, 0);
}

// The progress callback aborts a stalled transfer once the token is cancelled
TEST_F(CurlHttpFetcherTest, CancelAbortsTransferInProgress) {
    std::string head = "HTTP/1.1 200 OK\r\nContent-Length: 1000000\r\nConnection: close\r\n\r\n";
    LoopbackResponder server(head + pattern(100), true);

    std::thread canceller([this] {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        token_.cancel();
    });

    auto started = std::chrono::steady_clock::now();
    FetchResult result = fetcher_.fetch(server.url(), collectingSink(), token_);
    auto elapsed = std::chrono::steady_clock::now() - started;
    canceller.join();

    EXPECT_TRUE(result.cancelled);
    EXPECT_FALSE(result.transferred);
    EXPECT_FALSE(result.error.empty());
    EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST_F(CurlHttpFetcherTest, RefusingSinkFailsTransfer) {
    LoopbackResponder server(httpResponse(200, "OK", pattern(4096)));
    HttpFetcher::ChunkSink refusing = [](const char*, size_t) { return false; };

    FetchResult result = fetcher_.fetch(server.url(), refusing, token_);

    EXPECT_FALSE(result.transferred);
    EXPECT_FALSE(result.cancelled);
    EXPECT_EQ(result.error, "failed to write response body");
}

TEST_F(CurlHttpFetcherTest, ConnectionRefusedIsTransportError) {
    // Reserve a free port, then release it so nothing is listening
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    ASSERT_GE(fd, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    socklen_t len = sizeof(addr);
    ASSERT_EQ(::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);
    ASSERT_EQ(::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len), 0);
    int port = ntohs(addr.sin_port);
    ::close(fd);

    FetchResult result = fetcher_.fetch("http://127.0.0.1:" + std::to_string(port) + "/backup.zip",
                                        collectingSink(), token_);

    EXPECT_FALSE(result.transferred);
    EXPECT_FALSE(result.cancelled);
    EXPECT_FALSE(result.error.empty());
    EXPECT_EQ(result.statusCode, 0);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    // Loopback requests must not be routed through a proxy from the environment
    for (const char* name : {"http_proxy", "HTTP_PROXY", "all_proxy", "ALL_PROXY"}) {
        ::unsetenv(name);
    }
    CurlHttpFetcher::globalInit();
    int rc = RUN_ALL_TESTS();
    CurlHttpFetcher::globalCleanup();
    return rc;
}
