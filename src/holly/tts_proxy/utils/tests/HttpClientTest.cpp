#include "holly/tts_proxy/utils/HttpClient.h"
#include "holly/tts_proxy/utils/HttpTypes.h"

#include "httplib.h"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace holly::tts_proxy::utils;

namespace holly::tts_proxy::utils {
class HttpClientTestAccessor {
public:
    static HttpErrorType Classify(const HttpResponse& r) {
        return HttpClient::classify(r);
    }
    static std::string PathOf(const HttpClient& c, const std::string& url) {
        return c.pathOf(url);
    }
    static bool IsRetryable(const HttpClient& c, const HttpResponse& r) {
        return c.isRetryableError(r);
    }
};
} // namespace holly::tts_proxy::utils

namespace {

struct ServerGuard {
    httplib::Server& server;
    std::thread th;
    explicit ServerGuard(httplib::Server& s) : server(s) {}
    ~ServerGuard() {
        server.stop();
        if (th.joinable()) th.join();
    }
};

std::string localUrl(int port) {
    return "http://127.0.0.1:" + std::to_string(port);
}

} // namespace

TEST(HttpClientTests, ClassifyStatuses) {
    HttpResponse network;
    EXPECT_EQ(HttpClientTestAccessor::Classify(network), HttpErrorType::Network);

    HttpResponse timeout;
    timeout.timedOut = true;
    EXPECT_EQ(HttpClientTestAccessor::Classify(timeout), HttpErrorType::Timeout);

    HttpResponse r408;
    r408.statusCode = 408;
    EXPECT_EQ(HttpClientTestAccessor::Classify(r408), HttpErrorType::Timeout);

    HttpResponse cancelled;
    cancelled.cancelled = true;
    EXPECT_EQ(HttpClientTestAccessor::Classify(cancelled), HttpErrorType::Cancelled);

    HttpResponse r404;
    r404.statusCode = 404;
    EXPECT_EQ(HttpClientTestAccessor::Classify(r404), HttpErrorType::Client);

    HttpResponse r503;
    r503.statusCode = 503;
    EXPECT_EQ(HttpClientTestAccessor::Classify(r503), HttpErrorType::Server);

    HttpResponse r504;
    r504.statusCode = 504;
    EXPECT_EQ(HttpClientTestAccessor::Classify(r504), HttpErrorType::Timeout);

    HttpResponse ok;
    ok.statusCode = 200;
    EXPECT_EQ(HttpClientTestAccessor::Classify(ok), HttpErrorType::None);
}

TEST(HttpClientTests, OnlyTimeoutsAreRetriedByDefault) {
    HttpClient client("http://127.0.0.1:1");
    HttpResponse timeout;
    timeout.timedOut = true;
    EXPECT_TRUE(HttpClientTestAccessor::IsRetryable(client, timeout));

    HttpResponse network;
    EXPECT_FALSE(HttpClientTestAccessor::IsRetryable(client, network));

    HttpResponse r500;
    r500.statusCode = 500;
    EXPECT_FALSE(HttpClientTestAccessor::IsRetryable(client, r500));
}

TEST(HttpClientTests, PathOfJoinsBasePrefix) {
    HttpClient plain("http://localhost:11434");
    EXPECT_EQ(HttpClientTestAccessor::PathOf(plain, "/api/generate"), "/api/generate");
    EXPECT_EQ(HttpClientTestAccessor::PathOf(plain, ""), "/");

    HttpClient prefixed("http://localhost:8000/tts/");
    EXPECT_EQ(HttpClientTestAccessor::PathOf(prefixed, "/speak"), "/tts/speak");
    EXPECT_EQ(HttpClientTestAccessor::PathOf(prefixed, "health"), "/tts/health");
    EXPECT_EQ(HttpClientTestAccessor::PathOf(prefixed, "http://other:1/x?y=1"), "/x?y=1");
}

TEST(HttpClientTests, PostJsonReturnsBodyAndHeaders) {
    httplib::Server server;
    server.Post("/echo", [](const httplib::Request& req, httplib::Response& res) {
        res.set_header("X-Seen-Type", req.get_header_value("Content-Type"));
        res.set_content(req.body, "application/json");
    });
    const int port = server.bind_to_any_port("127.0.0.1");
    ASSERT_GT(port, 0);
    ServerGuard guard(server);
    guard.th = std::thread([&]() { server.listen_after_bind(); });
    server.wait_until_ready();

    HttpClient client(localUrl(port));
    const auto resp = client.postJson("/echo", R"({"a":1})");
    ASSERT_TRUE(resp.isSuccess()) << resp.error;
    EXPECT_EQ(resp.body, R"({"a":1})");
    EXPECT_TRUE(resp.isJson());
    EXPECT_EQ(resp.getHeader("x-seen-type").value_or(""), "application/json");
    auto j = resp.asJson();
    ASSERT_TRUE(j.has_value());
    EXPECT_EQ((*j)["a"], 1);
}

TEST(HttpClientTests, TimeoutIsRetriedExactlyOnce) {
    std::atomic<int> hits{0};
    httplib::Server server;
    server.Post("/slow", [&](const httplib::Request&, httplib::Response& res) {
        hits++;
        std::this_thread::sleep_for(std::chrono::milliseconds(600));
        res.set_content("{}", "application/json");
    });
    const int port = server.bind_to_any_port("127.0.0.1");
    ASSERT_GT(port, 0);
    ServerGuard guard(server);
    guard.th = std::thread([&]() { server.listen_after_bind(); });
    server.wait_until_ready();

    HttpClient client(localUrl(port));
    client.setTimeout(150);
    int retries = 0;
    RetryConfig cfg;
    cfg.retryLogger = [&](int, const HttpResponse&) { retries++; };
    client.setRetryConfig(cfg);

    HttpRequest req;
    req.method = HttpMethod::POST;
    req.url = "/slow";
    req.body = "{}";
    req.timeoutMs = 150;
    const auto resp = client.execute(req);

    EXPECT_FALSE(resp.isSuccess());
    EXPECT_TRUE(resp.timedOut) << resp.error;
    EXPECT_EQ(hits.load(), 2);
    EXPECT_EQ(retries, 1);
}

TEST(HttpClientTests, StreamDeliversChunksInOrder) {
    httplib::Server server;
    server.Post("/stream", [](const httplib::Request&, httplib::Response& res) {
        res.set_chunked_content_provider("application/x-ndjson", [](size_t, httplib::DataSink& sink) {
            const std::vector<std::string> parts{"one\n", "two\n", "three\n"};
            for (const auto& p : parts) {
                if (!sink.write(p.data(), p.size())) return false;
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
            }
            sink.done();
            return true;
        });
    });
    const int port = server.bind_to_any_port("127.0.0.1");
    ASSERT_GT(port, 0);
    ServerGuard guard(server);
    guard.th = std::thread([&]() { server.listen_after_bind(); });
    server.wait_until_ready();

    HttpClient client(localUrl(port));
    std::string received;
    int statusSeen = 0;
    HttpRequest req;
    req.method = HttpMethod::POST;
    req.url = "/stream";
    req.body = "{}";
    req.responseHandler = [&](int status) { statusSeen = status; };
    req.streamHandler = [&](std::string_view chunk) {
        received.append(chunk.data(), chunk.size());
        return true;
    };
    const auto resp = client.executeStream(req);

    EXPECT_EQ(resp.statusCode, 200) << resp.error;
    EXPECT_EQ(statusSeen, 200);
    EXPECT_EQ(received, "one\ntwo\nthree\n");
    EXPECT_TRUE(resp.body.empty());
}

TEST(HttpClientTests, StreamErrorBodyIsCapped) {
    httplib::Server server;
    server.Post("/fail", [](const httplib::Request&, httplib::Response& res) {
        res.status = 500;
        res.set_content(std::string(10000, 'x'), "text/plain");
    });
    const int port = server.bind_to_any_port("127.0.0.1");
    ASSERT_GT(port, 0);
    ServerGuard guard(server);
    guard.th = std::thread([&]() { server.listen_after_bind(); });
    server.wait_until_ready();

    HttpClient client(localUrl(port));
    bool handlerCalled = false;
    HttpRequest req;
    req.method = HttpMethod::POST;
    req.url = "/fail";
    req.streamHandler = [&](std::string_view) {
        handlerCalled = true;
        return true;
    };
    const auto resp = client.executeStream(req);

    EXPECT_EQ(resp.statusCode, 500);
    EXPECT_EQ(resp.body.size(), 4096u);
    EXPECT_FALSE(handlerCalled);
}

TEST(HttpClientTests, CancelTokenStopsInFlightStream) {
    httplib::Server server;
    server.Post("/endless", [](const httplib::Request&, httplib::Response& res) {
        res.set_chunked_content_provider("text/plain", [](size_t, httplib::DataSink& sink) {
            for (int i = 0; i < 200; ++i) {
                if (!sink.write("tick\n", 5)) return false;
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
            sink.done();
            return true;
        });
    });
    const int port = server.bind_to_any_port("127.0.0.1");
    ASSERT_GT(port, 0);
    ServerGuard guard(server);
    guard.th = std::thread([&]() { server.listen_after_bind(); });
    server.wait_until_ready();

    HttpClient client(localUrl(port));
    CancelToken token;
    HttpRequest req;
    req.method = HttpMethod::POST;
    req.url = "/endless";
    req.cancelToken = token;
    req.streamHandler = [](std::string_view) { return true; };

    std::thread canceller([token]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        token.cancel();
    });

    const auto started = std::chrono::steady_clock::now();
    const auto resp = client.executeStream(req);
    const auto elapsed = std::chrono::steady_clock::now() - started;
    canceller.join();

    EXPECT_TRUE(resp.cancelled);
    EXPECT_LT(elapsed, std::chrono::milliseconds(1500));
}

TEST(HttpClientTests, CancelledTokenSkipsRequest) {
    HttpClient client("http://127.0.0.1:1");
    CancelToken token;
    token.cancel();
    HttpRequest req;
    req.url = "/never";
    req.cancelToken = token;
    const auto resp = client.executeStream(req);
    EXPECT_TRUE(resp.cancelled);
    EXPECT_EQ(resp.statusCode, 0);
}

TEST(HttpClientTests, CancelTokenCallbacks) {
    CancelToken token;
    int calls = 0;
    const auto id = token.addCallback([&]() { calls++; });
    const auto removed = token.addCallback([&]() { calls += 100; });
    token.removeCallback(removed);

    CancelToken copy = token;
    copy.cancel();
    copy.cancel();
    EXPECT_TRUE(token.isCancelled());
    EXPECT_EQ(calls, 1);

    // 已取消时注册的回调立即执行
    token.addCallback([&]() { calls++; });
    EXPECT_EQ(calls, 2);
    token.removeCallback(id);
}
