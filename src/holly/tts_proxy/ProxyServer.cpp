#include "holly/tts_proxy/ProxyServer.h"

#include "holly/tts_proxy/ConfigManager.h"

#include "httplib.h"

namespace holly::tts_proxy {

ProxyServer::Config ProxyServer::Config::loadConfig(const ConfigManager& cfg) {
    Config c;
    if (auto j = cfg.get("server.host"); j && j->is_string()) c.host = j->get<std::string>();
    if (auto j = cfg.get("server.port"); j && j->is_number_integer()) c.port = j->get<int>();
    if (auto j = cfg.get("server.cors_origin"); j && j->is_string()) c.corsOrigin = j->get<std::string>();
    if (auto j = cfg.get("server.thread_pool_size"); j && j->is_number_integer() && j->get<int>() > 0) {
        c.threadPoolSize = j->get<std::size_t>();
    }
    return c;
}

ProxyServer::ProxyServer(const ConfigManager& cfg, const ErrorHandler& errors, WorkerFactory factory)
    : m_config(Config::loadConfig(cfg))
    , m_errors(errors)
    , m_supervisor(errors)
    , m_accumulator(TranscriptAccumulator::Config::loadConfig(cfg), errors)
    , m_pipeline(SynthesisPipeline::Config::loadConfig(cfg), errors, std::move(factory))
    , m_dispatcher(m_supervisor, m_accumulator, m_pipeline, AbortCoordinator::Policy::loadConfig(cfg), errors)
    , m_server(std::make_unique<httplib::Server>())
{
    setupRoutes();
}

ProxyServer::~ProxyServer() {
    stop();
    // 仍在进行的会话随进程退出终止
    if (auto current = m_supervisor.current()) {
        current->cancel();
    }
}

void ProxyServer::setupRoutes() {
    const auto poolSize = m_config.threadPoolSize;
    m_server->new_task_queue = [poolSize]() { return new httplib::ThreadPool(poolSize); };

    m_server->set_default_headers({
        {"Access-Control-Allow-Origin", m_config.corsOrigin},
        {"Access-Control-Allow-Methods", "GET, POST, OPTIONS"},
        {"Access-Control-Allow-Headers", "Content-Type"},
        {"Access-Control-Expose-Headers", "X-Transcript, X-Audio-Framing"}
    });

    m_server->Options(R"(.*)", [](const httplib::Request&, httplib::Response& res) {
        res.status = 204;
    });

    // req 比 res 后析构：流式 provider 的 releaser 停止轮询之前 req 始终有效
    m_server->Post("/tts", [this](const httplib::Request& req, httplib::Response& res) {
        m_dispatcher.handle(req.body, [&req]() { return req.is_connection_closed(); }, res);
    });

    m_server->Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        res.set_content(healthStatus().dump(), "application/json");
    });

    m_server->set_logger([this](const httplib::Request& req, const httplib::Response& res) {
        m_errors.log(ErrorHandler::LogLevel::Debug,
                     req.method + " " + req.path + " -> " + std::to_string(res.status));
    });
}

nlohmann::json ProxyServer::healthStatus() const {
    return nlohmann::json{
        {"ok", true},
        {"synthesis", {
            {"backend", m_pipeline.backendName()},
            {"alive", m_pipeline.isAlive()}
        }}
    };
}

bool ProxyServer::listen() {
    m_errors.log(ErrorHandler::LogLevel::Info,
                 "Holly TTS proxy listening on " + m_config.host + ":" + std::to_string(m_config.port));
    if (!m_server->listen(m_config.host, m_config.port)) {
        ErrorInfo info;
        info.errorType = ErrorType::UnknownError;
        info.stage = "server";
        info.message = "Failed to bind " + m_config.host + ":" + std::to_string(m_config.port);
        m_errors.log(ErrorHandler::LogLevel::Error, "Server stopped", info);
        return false;
    }
    return true;
}

int ProxyServer::bindToAnyPort(const std::string& host) {
    return m_server->bind_to_any_port(host);
}

bool ProxyServer::listenAfterBind() {
    return m_server->listen_after_bind();
}

void ProxyServer::stop() {
    if (m_server) m_server->stop();
}

bool ProxyServer::isRunning() const {
    return m_server && m_server->is_running();
}

} // namespace holly::tts_proxy
