#include "holly/tts_proxy/RemoteSynthesisWorker.h"
#include "holly/tts_proxy/utils/HttpClient.h"
#include "holly/tts_proxy/utils/HttpSerialization.h"

#include <algorithm>
#include <csignal>

namespace holly::tts_proxy {

RemoteSynthesisWorker::RemoteSynthesisWorker(Options options, const ErrorHandler& errors)
    : m_options(std::move(options))
    , m_errors(errors)
{
    if (m_options.queueChunks == 0) m_options.queueChunks = 1;
}

RemoteSynthesisWorker::~RemoteSynthesisWorker() {
    terminate();
    joinReader();
}

void RemoteSynthesisWorker::start(const SynthesisJob& job) {
    if (m_cancel.isCancelled()) {
        throw ProxyError(ErrorType::SynthesisError, "synthesis", kSessionSupersededMessage);
    }

    nlohmann::json body{
        {"text", job.text},
        {"speed", job.speed},
        {"format", FormatSniffer::formatName(job.format)}
    };
    if (job.sampleRate.has_value()) body["sample_rate"] = *job.sampleRate;

    m_reader = std::thread(&RemoteSynthesisWorker::run, this, utils::toJsonBody(body));

    std::unique_lock<std::mutex> lk(m_mu);
    m_cv.wait(lk, [this]() { return m_responded || m_finished; });
    if (m_responded || m_cancel.isCancelled()) {
        return;
    }

    // 连接阶段失败：等同于进程启动失败
    const auto diag = m_diag;
    lk.unlock();
    joinReader();

    ErrorInfo info;
    info.errorType = ErrorType::ProcessSpawnError;
    info.stage = "synthesis_spawn";
    info.message = "TTS service unreachable";
    info.details = nlohmann::json{
        {"base_url", m_options.baseUrl},
        {"reason", diag}
    };
    throw ProxyError(info);
}

void RemoteSynthesisWorker::run(std::string body) {
    utils::HttpClient client(m_options.baseUrl);
    client.setTimeout(m_options.timeoutMs);

    utils::HttpRequest req;
    req.method = utils::HttpMethod::POST;
    req.url = m_options.endpoint;
    req.body = std::move(body);
    req.timeoutMs = m_options.timeoutMs;
    req.setHeader("Content-Type", "application/json");
    req.setHeader("Accept", "audio/*");
    req.cancelToken = m_cancel;
    req.responseHandler = [this](int status) {
        std::lock_guard<std::mutex> lk(m_mu);
        m_responded = true;
        m_status = status;
        m_cv.notify_all();
    };
    req.streamHandler = [this](std::string_view chunk) {
        return push(std::string(chunk));
    };

    const auto resp = client.executeStream(req);

    std::lock_guard<std::mutex> lk(m_mu);
    m_finished = true;
    if (resp.statusCode != 0) m_status = resp.statusCode;
    if (!resp.cancelled && !resp.isSuccess()) {
        m_transportFailed = resp.statusCode == 0;
        m_diag = ErrorHandler::capText(resp.statusCode == 0 ? resp.error : resp.body,
                                       ErrorHandler::kMaxSnippetChars);
    }
    m_cv.notify_all();
}

bool RemoteSynthesisWorker::push(std::string chunk) {
    std::unique_lock<std::mutex> lk(m_mu);
    m_cv.wait(lk, [this]() {
        return m_queue.size() < m_options.queueChunks || m_cancel.isCancelled();
    });
    if (m_cancel.isCancelled()) return false;
    m_queue.push_back(std::move(chunk));
    m_cv.notify_all();
    return true;
}

std::optional<std::string> RemoteSynthesisWorker::readChunk() {
    std::unique_lock<std::mutex> lk(m_mu);
    m_cv.wait(lk, [this]() {
        return !m_queue.empty() || m_finished || m_cancel.isCancelled();
    });
    if (m_cancel.isCancelled() || m_queue.empty()) {
        return std::nullopt;
    }
    auto chunk = std::move(m_queue.front());
    m_queue.pop_front();
    m_cv.notify_all();
    return chunk;
}

void RemoteSynthesisWorker::terminate() noexcept {
    m_cancel.cancel();
    {
        // 与等待方的谓词检查串行化，避免丢失唤醒
        std::lock_guard<std::mutex> lk(m_mu);
    }
    m_cv.notify_all();
}

int RemoteSynthesisWorker::wait() {
    joinReader();

    std::lock_guard<std::mutex> lk(m_mu);
    if (m_cancel.isCancelled()) {
        return 128 + SIGTERM;
    }
    if (m_status >= 200 && m_status < 300 && !m_transportFailed) {
        return 0;
    }

    ErrorInfo info;
    info.errorType = ErrorType::SynthesisError;
    info.errorCode = m_status;
    info.stage = "synthesis";
    info.message = m_transportFailed ? "Synthesis service connection lost"
                                     : "Synthesis service returned HTTP " + std::to_string(m_status);
    if (!m_diag.empty()) info.details = nlohmann::json{{"body", m_diag}};
    m_errors.log(ErrorHandler::LogLevel::Warning, "Synthesis worker finished abnormally", info);
    return 1;
}

std::string RemoteSynthesisWorker::diagnostics() const {
    std::lock_guard<std::mutex> lk(m_mu);
    return m_diag;
}

bool RemoteSynthesisWorker::probeHealth(const Options& options) {
    utils::HttpClient client(options.baseUrl);
    client.setTimeout(std::min(options.timeoutMs, 2000));
    utils::RetryConfig noRetry;
    noRetry.maxRetries = 0;
    client.setRetryConfig(noRetry);
    return client.get(options.healthEndpoint).isSuccess();
}

void RemoteSynthesisWorker::joinReader() {
    if (m_reader.joinable() && m_reader.get_id() != std::this_thread::get_id()) {
        m_reader.join();
    }
}

} // namespace holly::tts_proxy
