#include "holly/tts_proxy/ProxyServer.h"
#include "holly/tts_proxy/ConfigManager.h"
#include "holly/tts_proxy/ResponseFramer.h"
#include "RawHttp.h"

#include "httplib.h"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace holly::tts_proxy;
namespace ts = holly::tts_proxy::test_support;

namespace {

ErrorHandler& quietErrors() {
    static ErrorHandler handler = [] {
        ErrorHandler h;
        ErrorHandler::LoggerConfig cfg;
        cfg.enabled = false;
        h.setLoggerConfig(cfg);
        return h;
    }();
    return handler;
}

struct EventLog {
    std::mutex mu;
    std::vector<std::string> events;

    void push(std::string e) {
        std::lock_guard<std::mutex> lk(mu);
        events.push_back(std::move(e));
    }
    bool contains(const std::string& e) {
        std::lock_guard<std::mutex> lk(mu);
        return std::find(events.begin(), events.end(), e) != events.end();
    }
    long indexOf(const std::string& e) {
        std::lock_guard<std::mutex> lk(mu);
        auto it = std::find(events.begin(), events.end(), e);
        return it == events.end() ? -1 : static_cast<long>(it - events.begin());
    }
};

/**
 * @brief 按脚本输出若干块的 worker；interval > 0 时每块之间等待，terminate() 后立即结束
 */
class ScriptedWorker : public SynthesisWorker {
public:
    ScriptedWorker(std::string name, EventLog& log, std::vector<std::string> chunks,
                   std::chrono::milliseconds interval = std::chrono::milliseconds(0), int exitCode = 0)
        : m_name(std::move(name)), m_log(log), m_chunks(std::move(chunks)), m_interval(interval),
          m_exitCode(exitCode) {}

    void start(const SynthesisJob&) override { m_log.push("spawn:" + m_name); }
    std::optional<std::string> readChunk() override {
        if (m_interval.count() > 0) std::this_thread::sleep_for(m_interval);
        if (terminated.load() || m_next >= m_chunks.size()) return std::nullopt;
        return m_chunks[m_next++];
    }
    void terminate() noexcept override {
        if (!terminated.exchange(true)) m_log.push("terminate:" + m_name);
    }
    int wait() override { return terminated.load() ? 128 + SIGTERM : m_exitCode; }
    std::string diagnostics() const override { return {}; }
    const char* backendName() const override { return "scripted"; }

    std::atomic<bool> terminated{false};

private:
    std::string m_name;
    EventLog& m_log;
    std::vector<std::string> m_chunks;
    std::size_t m_next{0};
    std::chrono::milliseconds m_interval;
    int m_exitCode;
};

const std::string kMp3Header("\xFF\xFB\x90\x64", 4);

/**
 * @brief 本地文本生成服务 + 代理服务器
 */
struct ProxyHarness {
    ConfigManager cfg;
    httplib::Server llm;
    std::thread llmThread;
    std::unique_ptr<ProxyServer> proxy;
    std::thread proxyThread;
    int port{-1};
    std::string transcript{"Why did the chicken cross the road?"};
    std::atomic<int> llmHits{0};

    ProxyHarness() {
        llm.Post("/api/generate", [this](const httplib::Request& req, httplib::Response& res) {
            llmHits++;
            const auto body = nlohmann::json::parse(req.body);
            const auto prompt = body.value("prompt", std::string());
            if (prompt == "fail") {
                res.status = 500;
                res.set_content(R"({"error":"model crashed"})", "application/json");
                return;
            }
            if (prompt == "slow") {
                std::this_thread::sleep_for(std::chrono::milliseconds(500));
            }
            const std::string text = prompt == "blank" ? std::string("   ") : transcript;
            res.set_content(nlohmann::json{{"response", text}}.dump(), "application/json");
        });
        const int llmPort = llm.bind_to_any_port("127.0.0.1");
        llmThread = std::thread([this]() { llm.listen_after_bind(); });
        llm.wait_until_ready();

        cfg.set("text_generation.base_url", "http://127.0.0.1:" + std::to_string(llmPort));
        cfg.set("text_generation.timeout_ms", 5000);
        cfg.set("session.disconnect_poll_ms", 10);
        cfg.set("synthesis.command", "/bin/sh");
        cfg.set("synthesis.args", nlohmann::json::array({"-c", "printf '\\377\\373\\220\\144'; cat"}));
    }

    bool start(WorkerFactory factory = {}) {
        proxy = std::make_unique<ProxyServer>(cfg, quietErrors(), std::move(factory));
        port = proxy->bindToAnyPort();
        if (port <= 0) return false;
        proxyThread = std::thread([this]() { proxy->listenAfterBind(); });
        for (int i = 0; i < 500 && !proxy->isRunning(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return proxy->isRunning();
    }

    ts::RawResponse post(const nlohmann::json& body) {
        return ts::request(port, "POST", "/tts", body.dump());
    }

    ~ProxyHarness() {
        if (proxy) proxy->stop();
        if (proxyThread.joinable()) proxyThread.join();
        proxy.reset();
        llm.stop();
        if (llmThread.joinable()) llmThread.join();
    }
};

nlohmann::json jsonBody(const ts::RawResponse& resp) {
    auto j = nlohmann::json::parse(resp.body, nullptr, false);
    return j.is_discarded() ? nlohmann::json::object() : j;
}

bool waitFor(const std::function<bool()>& pred, int ms = 2000) {
    for (int i = 0; i < ms / 5; ++i) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

// 发送请求，读到 minBytes 字节后直接关闭连接
void postAndHangUp(int port, const std::string& body, std::size_t minBytes) {
    const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    ASSERT_GE(fd, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    ASSERT_EQ(::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);

    const std::string req = "POST /tts HTTP/1.1\r\nHost: 127.0.0.1\r\nContent-Type: application/json\r\n"
                            "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body;
    ASSERT_EQ(::send(fd, req.data(), req.size(), MSG_NOSIGNAL), static_cast<ssize_t>(req.size()));

    std::size_t got = 0;
    char buf[4096];
    while (got < minBytes) {
        const auto n = ::recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) break;
        got += static_cast<std::size_t>(n);
    }
    ::close(fd);
}

} // namespace

TEST(ProxyServerTests, StreamedResponseCarriesTranscriptTrailer) {
    ProxyHarness h;
    ASSERT_TRUE(h.start());

    const auto resp = h.post({{"prompt", "Tell me a joke"}, {"generate", true}, {"stream", true}});
    EXPECT_EQ(resp.status, 200);
    EXPECT_TRUE(resp.chunked);
    EXPECT_TRUE(resp.complete);
    EXPECT_EQ(resp.header("Content-Type"), "audio/mpeg");
    EXPECT_EQ(resp.header("Access-Control-Allow-Origin"), "*");
    // worker 把 stdin 上的转写文本原样回显在 MP3 帧头之后
    EXPECT_EQ(resp.body, kMp3Header + h.transcript + "\n");
    EXPECT_EQ(resp.trailer("X-Transcript"), h.transcript);
    EXPECT_EQ(h.llmHits.load(), 1);
}

TEST(ProxyServerTests, BufferedResponseHasLengthAndTranscriptHeader) {
    ProxyHarness h;
    ASSERT_TRUE(h.start());

    const auto resp = h.post({{"text", "Hello there"}});
    EXPECT_EQ(resp.status, 200);
    EXPECT_FALSE(resp.chunked);
    EXPECT_TRUE(resp.complete);
    EXPECT_EQ(resp.body, kMp3Header + "Hello there\n");
    EXPECT_EQ(resp.header("Content-Length"), std::to_string(resp.body.size()));
    EXPECT_EQ(resp.header("X-Transcript"), "Hello there");
    EXPECT_EQ(h.llmHits.load(), 0);
}

TEST(ProxyServerTests, FramedStreamEndsWithEndFrame) {
    EventLog log;
    ProxyHarness h;
    ASSERT_TRUE(h.start([&log]() {
        return std::make_shared<ScriptedWorker>("1", log, std::vector<std::string>{"ID3", "aaaa", "bb"});
    }));

    const auto resp = h.post({{"text", "hi"}, {"stream", true}, {"framed", true}});
    EXPECT_EQ(resp.status, 200);
    EXPECT_EQ(resp.header("X-Audio-Framing"), ResponseFramer::kFramingScheme);
    const auto frames = ts::parseFrames(resp.body);
    ASSERT_EQ(frames.size(), 4u);
    EXPECT_EQ(frames[0].type, ResponseFramer::kFrameAudio);
    EXPECT_EQ(frames[0].payload, "ID3");
    EXPECT_EQ(frames[1].payload, "aaaa");
    EXPECT_EQ(frames[2].payload, "bb");
    EXPECT_EQ(frames[3].type, ResponseFramer::kFrameEnd);
    EXPECT_TRUE(frames[3].payload.empty());
}

TEST(ProxyServerTests, JsonOnlyNeverStartsSynthesis) {
    EventLog log;
    std::atomic<int> spawns{0};
    ProxyHarness h;
    ASSERT_TRUE(h.start([&]() {
        spawns++;
        return std::make_shared<ScriptedWorker>("1", log, std::vector<std::string>{"ID3"});
    }));

    const auto resp = h.post({{"prompt", "Tell me a joke"}, {"generate", true}, {"json", true}, {"stream", true}});
    EXPECT_EQ(resp.status, 200);
    EXPECT_EQ(jsonBody(resp)["response"], h.transcript);
    EXPECT_EQ(spawns.load(), 0);
    EXPECT_EQ(h.proxy->supervisor().current(), nullptr);
}

TEST(ProxyServerTests, InvalidAudioHeaderIsFormatError) {
    EventLog log;
    ProxyHarness h;
    ASSERT_TRUE(h.start([&log]() {
        return std::make_shared<ScriptedWorker>("1", log, std::vector<std::string>{std::string("\0\0\1\2", 4)});
    }));

    const auto resp = h.post({{"text", "hi"}, {"stream", true}});
    EXPECT_EQ(resp.status, 500);
    const auto body = jsonBody(resp);
    EXPECT_EQ(body["type"], "FormatError");
    EXPECT_EQ(body["stage"], "format_check");
    EXPECT_EQ(body["error"], "TTS output failed format validation");
    EXPECT_TRUE(resp.trailer("X-Transcript").empty());
}

TEST(ProxyServerTests, SilentWorkerIsSynthesisError) {
    EventLog log;
    ProxyHarness h;
    ASSERT_TRUE(h.start([&log]() {
        return std::make_shared<ScriptedWorker>("1", log, std::vector<std::string>{});
    }));

    const auto resp = h.post({{"text", "hi"}, {"stream", true}});
    EXPECT_EQ(resp.status, 500);
    EXPECT_EQ(jsonBody(resp)["type"], "SynthesisError");
    EXPECT_EQ(h.proxy->supervisor().current(), nullptr);
}

TEST(ProxyServerTests, MissingPromptIsRejected) {
    ProxyHarness h;
    ASSERT_TRUE(h.start());

    const auto empty = h.post(nlohmann::json::object());
    EXPECT_EQ(empty.status, 400);
    EXPECT_EQ(jsonBody(empty)["error"], "Prompt is required");
    EXPECT_EQ(jsonBody(empty)["type"], "ValidationError");

    const auto garbage = ts::request(h.port, "POST", "/tts", "{not json");
    EXPECT_EQ(garbage.status, 400);
    EXPECT_EQ(h.llmHits.load(), 0);
}

TEST(ProxyServerTests, TextGenerationFailuresMapToGatewayErrors) {
    ProxyHarness h;
    ASSERT_TRUE(h.start());

    const auto failed = h.post({{"prompt", "fail"}, {"generate", true}});
    EXPECT_EQ(failed.status, 502);
    EXPECT_EQ(jsonBody(failed)["type"], "UpstreamError");
    EXPECT_EQ(jsonBody(failed)["error"], "model crashed");

    const auto blank = h.post({{"prompt", "blank"}, {"generate", true}});
    EXPECT_EQ(blank.status, 502);
    EXPECT_EQ(jsonBody(blank)["stage"], "text_generation");
}

TEST(ProxyServerTests, NewerRequestSupersedesStreamingOne) {
    EventLog log;
    std::atomic<int> count{0};
    ProxyHarness h;
    ASSERT_TRUE(h.start([&]() -> std::shared_ptr<SynthesisWorker> {
        const int n = ++count;
        if (n == 1) {
            std::vector<std::string> endless(1000, "frame");
            endless.front() = "ID3";
            return std::make_shared<ScriptedWorker>("1", log, std::move(endless), std::chrono::milliseconds(20));
        }
        return std::make_shared<ScriptedWorker>(std::to_string(n), log, std::vector<std::string>{"ID3", "second"});
    }));

    ts::RawResponse first;
    std::thread r1([&]() { first = h.post({{"text", "first"}, {"stream", true}}); });
    ASSERT_TRUE(waitFor([&]() { return log.contains("spawn:1"); }));
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    const auto second = h.post({{"text", "second"}, {"stream", true}});
    r1.join();

    EXPECT_EQ(second.status, 200);
    EXPECT_TRUE(second.complete);
    EXPECT_EQ(second.body, "ID3second");
    EXPECT_EQ(second.trailer("X-Transcript"), "second");

    // 被取代的流不得收到 trailer
    EXPECT_EQ(first.status, 200);
    EXPECT_FALSE(first.complete);
    EXPECT_TRUE(first.trailer("X-Transcript").empty());

    // 旧 worker 的终止信号先于新 worker 启动
    const auto terminated = log.indexOf("terminate:1");
    const auto spawned = log.indexOf("spawn:2");
    ASSERT_GE(terminated, 0);
    ASSERT_GE(spawned, 0);
    EXPECT_LT(terminated, spawned);
}

TEST(ProxyServerTests, ClientHangUpMidStreamTerminatesWorker) {
    EventLog log;
    ProxyHarness h;
    ASSERT_TRUE(h.start([&log]() {
        std::vector<std::string> endless(1000, std::string(512, 'x'));
        endless.front() = "ID3";
        return std::make_shared<ScriptedWorker>("1", log, std::move(endless), std::chrono::milliseconds(5));
    }));

    postAndHangUp(h.port, R"({"text":"long","stream":true})", 2048);
    EXPECT_TRUE(waitFor([&]() { return log.contains("terminate:1"); }, 5000));
    EXPECT_TRUE(waitFor([&]() { return h.proxy->supervisor().current() == nullptr; }));
}

TEST(ProxyServerTests, HangUpWhileWorkerIsSilentReleasesSession) {
    ProxyHarness h;
    // 首帧之后 worker 长时间不再输出
    h.cfg.set("synthesis.args", nlohmann::json::array({"-c", "printf '\\377\\373\\220\\144'; sleep 30"}));
    ASSERT_TRUE(h.start());

    postAndHangUp(h.port, R"({"text":"quiet","stream":true})", 1);
    EXPECT_TRUE(waitFor([&]() { return h.proxy->supervisor().current() == nullptr; }, 5000));
}

TEST(ProxyServerTests, HangUpDuringTextGenerationSkipsSynthesis) {
    EventLog log;
    std::atomic<int> spawns{0};
    ProxyHarness h;
    ASSERT_TRUE(h.start([&]() {
        spawns++;
        return std::make_shared<ScriptedWorker>("1", log, std::vector<std::string>{"ID3"});
    }));

    postAndHangUp(h.port, R"({"prompt":"slow","generate":true,"stream":true})", 0);
    std::this_thread::sleep_for(std::chrono::milliseconds(1000));
    EXPECT_EQ(spawns.load(), 0);
}

TEST(ProxyServerTests, HealthAndPreflight) {
    ProxyHarness h;
    ASSERT_TRUE(h.start());

    const auto health = ts::request(h.port, "GET", "/health");
    EXPECT_EQ(health.status, 200);
    const auto body = jsonBody(health);
    EXPECT_EQ(body["ok"], true);
    EXPECT_EQ(body["synthesis"]["backend"], "subprocess");
    EXPECT_EQ(body["synthesis"]["alive"], true);

    const auto preflight = ts::request(h.port, "OPTIONS", "/tts");
    EXPECT_EQ(preflight.status, 204);
    EXPECT_EQ(preflight.header("Access-Control-Allow-Origin"), "*");
    EXPECT_NE(preflight.header("Access-Control-Allow-Methods").find("POST"), std::string::npos);
    EXPECT_NE(preflight.header("Access-Control-Expose-Headers").find("X-Transcript"), std::string::npos);
}
