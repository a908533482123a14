/**
 * AgenticLetters C++ client - libcurl transport against loopback sockets.
 *
 * No external network access: every endpoint is a socket on 127.0.0.1
 * opened by the test itself.
 */

#include <letters/letters.hpp>

#include "test_harness.hpp"

#include <cstdlib>
#include <cstring>
#include <string>
#include <thread>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

/**
 * Listening socket on an ephemeral loopback port. Connections complete in
 * the kernel backlog even if nobody accepts them.
 */
class LoopbackListener {
public:
    LoopbackListener() : fd_(-1), port_(0) {
        fd_ = socket(AF_INET, SOCK_STREAM, 0);
        if (fd_ < 0) throw std::runtime_error("socket() failed");

        int one = 1;
        setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

        struct sockaddr_in addr;
        std::memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (bind(fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) != 0) {
            close(fd_);
            throw std::runtime_error("bind() failed");
        }
        if (listen(fd_, 4) != 0) {
            close(fd_);
            throw std::runtime_error("listen() failed");
        }

        socklen_t len = sizeof(addr);
        getsockname(fd_, reinterpret_cast<struct sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);
    }

    ~LoopbackListener() { shutdown(); }

    LoopbackListener(const LoopbackListener&) = delete;
    LoopbackListener& operator=(const LoopbackListener&) = delete;

    void shutdown() {
        if (fd_ >= 0) {
            close(fd_);
            fd_ = -1;
        }
    }

    int fd() const { return fd_; }

    std::string url() const {
        return "http://127.0.0.1:" + std::to_string(port_) + "/api";
    }

private:
    int fd_;
    int port_;
};

/**
 * Accept one connection, read the request head (and body, if
 * Content-Length says so), answer with a canned response and close.
 */
static void serve_once(int listen_fd, const std::string& response, std::string* request_out) {
    int conn = accept(listen_fd, NULL, NULL);
    if (conn < 0) return;

    std::string request;
    char buf[4096];
    size_t head_end = std::string::npos;
    size_t content_length = 0;
    for (;;) {
        ssize_t n = recv(conn, buf, sizeof(buf), 0);
        if (n <= 0) break;
        request.append(buf, static_cast<size_t>(n));
        if (head_end == std::string::npos) {
            head_end = request.find("\r\n\r\n");
            if (head_end != std::string::npos) {
                size_t cl = request.find("Content-Length: ");
                if (cl != std::string::npos && cl < head_end) {
                    content_length = std::strtoul(request.c_str() + cl + 16, NULL, 10);
                }
            }
        }
        if (head_end != std::string::npos && request.size() >= head_end + 4 + content_length) {
            break;
        }
    }
    if (request_out) *request_out = request;

    send(conn, response.data(), response.size(), 0);
    close(conn);
}

/** Joins the server thread on every exit path of a test. */
class ThreadJoiner {
public:
    explicit ThreadJoiner(std::thread& t) : t_(t) {}
    ~ThreadJoiner() { join(); }
    void join() { if (t_.joinable()) t_.join(); }

private:
    std::thread& t_;
};

static std::string http_response(const std::string& status_line, const std::string& body) {
    return status_line + "\r\n"
           "Content-Type: application/json\r\n"
           "Content-Length: " + std::to_string(body.size()) + "\r\n"
           "Connection: close\r\n"
           "\r\n" + body;
}

static letters::Config loopback_config(const std::string& url, int timeout_ms) {
    letters::Config cfg;
    cfg.api_key = "al_loopback";
    cfg.base_url = url;
    cfg.timeout_ms = timeout_ms;
    return cfg;
}

int main() {
    std::cout << "AgenticLetters Transport Tests" << std::endl;
    std::cout << "==============================" << std::endl;

    unsetenv(letters::LOG_FILE_ENV_VAR);

    RUN_TEST("Refused connection is a network error", {
        std::string url;
        {
            LoopbackListener closed;
            url = closed.url();
        }
        letters::CurlHttpClient http;
        letters::HttpResponse resp = http.get(url + "/credits", letters::HttpHeaders(), 5000);
        EXPECT_TRUE(resp.network_error);
        EXPECT_TRUE(!resp.timeout);
        EXPECT_EQ(resp.status, 0L);
        EXPECT_TRUE(!resp.network_error_message.empty());

        letters::Client client(loopback_config(url, 5000));
        try {
            client.getCredits();
            throw std::runtime_error("expected NetworkError");
        } catch (const letters::TimeoutError&) {
            throw std::runtime_error("refused connection classified as timeout");
        } catch (const letters::NetworkError& e) {
            EXPECT_EQ(std::string(e.what()), std::string("Could not reach the API"));
            EXPECT_EQ(e.http_status(), 0);
        }
    });

    RUN_TEST("Silent server times out", {
        LoopbackListener silent;
        letters::CurlHttpClient http;
        letters::HttpResponse resp = http.get(silent.url() + "/credits", letters::HttpHeaders(), 300);
        EXPECT_TRUE(resp.timeout);
        EXPECT_EQ(resp.status, 0L);

        letters::Client client(loopback_config(silent.url(), 300));
        try {
            client.listLetters();
            throw std::runtime_error("expected TimeoutError");
        } catch (const letters::TimeoutError& e) {
            EXPECT_EQ(e.origin(), letters::ORIGIN_NETWORK);
            EXPECT_EQ(std::string(e.what()), std::string("Request timed out after 0.3 seconds"));
        }
    });

    RUN_TEST("Success response over HTTP", {
        LoopbackListener server;
        std::string request;
        std::thread worker(serve_once, server.fd(),
                           http_response("HTTP/1.1 200 OK", "{\"credits\":42}"), &request);
        ThreadJoiner joiner(worker);

        letters::Client client(loopback_config(server.url(), 5000));
        letters::ApiResult result = client.getCredits();
        joiner.join();

        EXPECT_EQ(letters::format_result(result), std::string("{\n  \"credits\": 42\n}"));
        EXPECT_TRUE(request.find("GET /api/credits HTTP/1.1\r\n") == 0);
        EXPECT_TRUE(request.find("Authorization: Bearer al_loopback\r\n") != std::string::npos);
        EXPECT_TRUE(request.find("User-Agent: agentic-letters-skill/1.0\r\n") != std::string::npos);
        EXPECT_TRUE(request.find("Content-Type: application/json\r\n") != std::string::npos);
    });

    RUN_TEST("Letter id with URL syntax reaches the server escaped", {
        const char* ids[] = { "abc def", "../credits" };
        const char* lines[] = { "GET /api/letters/abc%20def HTTP/1.1\r\n",
                                "GET /api/letters/..%2Fcredits HTTP/1.1\r\n" };
        for (int i = 0; i < 2; ++i) {
            LoopbackListener server;
            std::string request;
            std::thread worker(serve_once, server.fd(),
                               http_response("HTTP/1.1 404 Not Found",
                                             "{\"error\":\"Letter not found\"}"), &request);
            ThreadJoiner joiner(worker);

            letters::Client client(loopback_config(server.url(), 5000));
            try {
                client.getLetter(ids[i]);
                throw std::runtime_error("expected ServerError");
            } catch (const letters::ServerError& e) {
                EXPECT_EQ(e.http_status(), 404);
                EXPECT_EQ(std::string(e.what()), std::string("Letter not found"));
            }
            joiner.join();
            EXPECT_TRUE(request.find(lines[i]) == 0);
        }
    });

    RUN_TEST("Error response carries the reason phrase", {
        LoopbackListener server;
        std::thread worker(serve_once, server.fd(),
                           http_response("HTTP/1.1 502 Bad Gateway From Proxy", "<html>oops</html>"),
                           static_cast<std::string*>(NULL));
        ThreadJoiner joiner(worker);

        letters::Client client(loopback_config(server.url(), 5000));
        try {
            client.getLetter("L-1");
            throw std::runtime_error("expected ServerError");
        } catch (const letters::ServerError& e) {
            EXPECT_EQ(e.http_status(), 502);
            EXPECT_EQ(std::string(e.what()), std::string("HTTP 502 with non-JSON response"));
            EXPECT_EQ(e.detail(), std::string("Bad Gateway From Proxy"));
        }
    });

    RUN_TEST("Validation error over HTTP", {
        LoopbackListener server;
        std::string request;
        std::thread worker(serve_once, server.fd(),
                           http_response("HTTP/1.1 422 Unprocessable Entity",
                                         "{\"error\":\"invalid zip\",\"field\":\"zip\"}"),
                           &request);
        ThreadJoiner joiner(worker);

        letters::CurlHttpClient http;
        letters::HttpHeaders headers;
        headers["Content-Type"] = "application/json";
        letters::HttpResponse resp = http.post_json(server.url() + "/letters", headers,
                                                    "{\"type\":\"standard\"}", 5000);
        joiner.join();

        EXPECT_EQ(resp.status, 422L);
        EXPECT_EQ(resp.reason, std::string("Unprocessable Entity"));
        EXPECT_EQ(resp.body, std::string("{\"error\":\"invalid zip\",\"field\":\"zip\"}"));
        EXPECT_TRUE(request.find("POST /api/letters HTTP/1.1\r\n") == 0);
        EXPECT_TRUE(request.find("{\"type\":\"standard\"}") != std::string::npos);
    });

    RUN_TEST("Default reason phrases", {
        EXPECT_EQ(std::string(letters::default_reason_phrase(500)), std::string("Internal Server Error"));
        EXPECT_EQ(std::string(letters::default_reason_phrase(422)), std::string("Unprocessable Entity"));
        EXPECT_TRUE(std::string(letters::default_reason_phrase(599)).empty());
    });

    return report();
}
