#pragma once

#include "holly/tts_proxy/AbortCoordinator.h"
#include "holly/tts_proxy/ErrorHandler.h"
#include "holly/tts_proxy/RequestDispatcher.h"
#include "holly/tts_proxy/SessionSupervisor.h"
#include "holly/tts_proxy/SynthesisPipeline.h"
#include "holly/tts_proxy/TranscriptAccumulator.h"

#include <atomic>
#include <cstddef>
#include <memory>
#include <string>

namespace httplib {
    class Server;
}

namespace holly::tts_proxy {

class ConfigManager;

/**
 * @brief HTTP 入口：POST /tts、GET /health、CORS 预检
 *
 * 使用示例：
 * ```
 * ConfigManager cfg;
 * cfg.loadFromFile("config/holly.json");
 * ErrorHandler errors;
 * ProxyServer server(cfg, errors);
 * server.listen();   // 阻塞直到 stop()
 * ```
 */
class ProxyServer {
public:
    struct Config {
        std::string host{"0.0.0.0"};
        int port{3001};
        std::string corsOrigin{"*"};
        std::size_t threadPoolSize{8};

        static Config loadConfig(const ConfigManager& cfg);
    };

    // factory 为空时按 synthesis.backend 创建 worker
    ProxyServer(const ConfigManager& cfg, const ErrorHandler& errors, WorkerFactory factory = {});
    ~ProxyServer();

    ProxyServer(const ProxyServer&) = delete;
    ProxyServer& operator=(const ProxyServer&) = delete;

    // 绑定 host:port 并阻塞服务；绑定失败返回 false
    bool listen();

    // 绑定到随机端口（测试用）；返回端口号，失败返回 -1
    int bindToAnyPort(const std::string& host = "127.0.0.1");
    bool listenAfterBind();

    void stop();
    bool isRunning() const;

    const Config& config() const { return m_config; }
    SessionSupervisor& supervisor() { return m_supervisor; }
    const SynthesisPipeline& pipeline() const { return m_pipeline; }

    // GET /health 的响应体
    nlohmann::json healthStatus() const;

private:
    void setupRoutes();

    Config m_config;
    const ErrorHandler& m_errors;

    SessionSupervisor m_supervisor;
    TranscriptAccumulator m_accumulator;
    SynthesisPipeline m_pipeline;
    RequestDispatcher m_dispatcher;

    std::unique_ptr<httplib::Server> m_server;
};

} // namespace holly::tts_proxy
