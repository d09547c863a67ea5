/**
 * CurlTransport against a loopback HTTP server.
 *
 * The server answers every request with a redirect back to itself, so a
 * transport that followed redirects would connect more than once and would
 * resend the signed headers.
 */

#include "../include/riskgov/exchange/http_transport.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace riskgov;
using namespace riskgov::exchange;

#define TEST(name) void name()
#define RUN_TEST(name)                                                                                                 \
    do {                                                                                                               \
        std::cout << "  " << #name << "... ";                                                                          \
        name();                                                                                                        \
        std::cout << "PASSED\n";                                                                                       \
    } while (0)

#define ASSERT_EQ(a, b) assert((a) == (b))
#define ASSERT_TRUE(x) assert(x)
#define ASSERT_FALSE(x) assert(!(x))

/**
 * Single-threaded loopback server. Every connection gets one response with
 * the given status and a Location header pointing back at the server.
 */
class RedirectServer {
public:
    explicit RedirectServer(int status) : status_(status) {
        listen_fd_ = socket(AF_INET, SOCK_STREAM, 0);
        assert(listen_fd_ >= 0);
        int one = 1;
        setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        int rc = bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        assert(rc == 0);
        rc = listen(listen_fd_, 8);
        assert(rc == 0);

        socklen_t len = sizeof(addr);
        rc = getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        assert(rc == 0);
        port_ = ntohs(addr.sin_port);

        thread_ = std::thread([this]() { serve(); });
    }

    ~RedirectServer() { stop(); }

    void stop() {
        if (stopping_.exchange(true))
            return;
        thread_.join();
        close(listen_fd_);
    }

    std::string url(const std::string& path) const { return "http://127.0.0.1:" + std::to_string(port_) + path; }

    int connections() const { return connections_.load(); }

    std::vector<std::string> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

private:
    void serve() {
        while (!stopping_.load()) {
            pollfd pfd{listen_fd_, POLLIN, 0};
            if (poll(&pfd, 1, 50) <= 0)
                continue;
            int fd = accept(listen_fd_, nullptr, nullptr);
            if (fd < 0)
                continue;
            connections_++;
            handle(fd);
            close(fd);
        }
    }

    void handle(int fd) {
        std::string request;
        char buf[1024];
        while (request.find("\r\n\r\n") == std::string::npos) {
            ssize_t n = read(fd, buf, sizeof(buf));
            if (n <= 0)
                break;
            request.append(buf, static_cast<size_t>(n));
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(request);
        }

        std::string response = "HTTP/1.1 " + std::to_string(status_) + " Moved\r\n" +
                               "Location: " + url("/elsewhere") + "\r\n" +
                               "Content-Length: 0\r\n"
                               "Connection: close\r\n\r\n";
        ssize_t sent = write(fd, response.data(), response.size());
        (void)sent;
    }

    int status_;
    int listen_fd_ = -1;
    int port_ = 0;
    std::atomic<bool> stopping_{false};
    std::atomic<int> connections_{0};
    mutable std::mutex mutex_;
    std::vector<std::string> requests_;
    std::thread thread_;
};

TEST(get_does_not_follow_redirect) {
    RedirectServer server(302);
    CurlTransport transport(5);

    HttpResponse r = transport.get(server.url("/AP/GetLevel1"), HttpHeaders{{"Signature", "abc123"}});
    server.stop();

    ASSERT_EQ(r.status, 302L);
    ASSERT_EQ(server.connections(), 1);

    auto requests = server.requests();
    ASSERT_EQ(requests.size(), 1u);
    ASSERT_TRUE(requests[0].find("GET /AP/GetLevel1") == 0);
    ASSERT_TRUE(requests[0].find("Signature: abc123") != std::string::npos);
}

TEST(post_does_not_follow_redirect) {
    RedirectServer server(307);
    CurlTransport transport(5);

    HttpResponse r = transport.post(server.url("/AP/SendOrder"), HttpHeaders{{"Signature", "abc123"}}, "{}");
    server.stop();

    // The 307 reaches the caller, which classifies it as a rejection
    ASSERT_EQ(r.status, 307L);
    ASSERT_EQ(server.connections(), 1);
    ASSERT_EQ(server.requests().size(), 1u);
}

TEST(transport_reuse_after_redirect) {
    RedirectServer server(301);
    CurlTransport transport(5);

    for (int i = 0; i < 3; ++i) {
        ASSERT_EQ(transport.get(server.url("/AP/GetAccountPositions"), HttpHeaders{}).status, 301L);
    }
    server.stop();
    ASSERT_EQ(server.connections(), 3);
}

int main() {
    std::cout << "\n=== CurlTransport Tests ===\n\n";

    RUN_TEST(get_does_not_follow_redirect);
    RUN_TEST(post_does_not_follow_redirect);
    RUN_TEST(transport_reuse_after_redirect);

    std::cout << "\n=== All CurlTransport Tests Passed! ===\n";
    return 0;
}
