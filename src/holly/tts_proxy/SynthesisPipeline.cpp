#include "holly/tts_proxy/SynthesisPipeline.h"

#include "holly/tts_proxy/ConfigManager.h"

#include <algorithm>

namespace holly::tts_proxy {

namespace {

bool isContinuationByte(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

} // namespace

// ========== SynthesisRun ==========

SynthesisRun::SynthesisRun(std::shared_ptr<SynthesisWorker> worker,
                           std::shared_ptr<Session> session,
                           std::string firstFrame,
                           bool outputEnded,
                           AudioFormat format,
                           const ErrorHandler& errors)
    : m_worker(std::move(worker))
    , m_session(std::move(session))
    , m_firstFrame(std::move(firstFrame))
    , m_ended(outputEnded)
    , m_format(format)
    , m_errors(errors)
{}

SynthesisRun::~SynthesisRun() {
    if (m_exitCode.has_value()) return;
    m_worker->terminate();
    try {
        reap();
    } catch (const std::exception& e) {
        m_errors.log(ErrorHandler::LogLevel::Warning, std::string("Failed to reap synthesis worker: ") + e.what());
    }
}

std::optional<std::string> SynthesisRun::next() {
    if (!m_firstTaken) {
        m_firstTaken = true;
        return std::move(m_firstFrame);
    }
    if (m_ended) return std::nullopt;
    auto chunk = m_worker->readChunk();
    if (!chunk) m_ended = true;
    return chunk;
}

void SynthesisRun::complete(uint64_t bytesForwarded) {
    // 未读完的输出不再需要
    if (!m_ended) m_worker->terminate();
    const int code = reap();
    if (code == 0 && bytesForwarded > 0) {
        m_errors.log(ErrorHandler::LogLevel::Debug,
                     "Synthesis finished: " + std::to_string(bytesForwarded) + " bytes");
        return;
    }

    ErrorInfo info;
    info.errorType = ErrorType::SynthesisError;
    info.errorCode = code;
    info.stage = "synthesis";
    info.message = code == 0 ? "TTS generation produced no audio" : "TTS generation failed";
    info.details = nlohmann::json{
        {"exit_code", code},
        {"bytes_forwarded", bytesForwarded}
    };
    if (const auto diag = m_worker->diagnostics(); !diag.empty()) {
        (*info.details)["stderr"] = ErrorHandler::capText(diag, ErrorHandler::kMaxSnippetChars);
    }
    throw ProxyError(info);
}

void SynthesisRun::abort() noexcept {
    m_worker->terminate();
}

int SynthesisRun::reap() {
    if (!m_exitCode) m_exitCode = m_worker->wait();
    return *m_exitCode;
}

// ========== SynthesisPipeline ==========

SynthesisPipeline::Config SynthesisPipeline::Config::loadConfig(const ConfigManager& cfg) {
    Config c;
    if (auto j = cfg.get("synthesis.backend"); j && j->is_string()) {
        c.backend = j->get<std::string>() == "remote" ? Backend::Remote : Backend::Subprocess;
    }
    if (auto j = cfg.get("synthesis.command"); j && j->is_string()) c.command = j->get<std::string>();
    if (auto j = cfg.get("synthesis.args"); j && j->is_array()) {
        c.args.clear();
        for (const auto& a : *j) {
            if (a.is_string()) c.args.push_back(a.get<std::string>());
        }
    }
    if (auto j = cfg.get("synthesis.format"); j && j->is_string()) {
        if (auto f = FormatSniffer::parseFormat(j->get<std::string>())) c.format = *f;
    }
    if (auto j = cfg.get("synthesis.max_chars"); j && j->is_number_integer() && j->get<int64_t>() > 0) {
        c.maxChars = j->get<std::size_t>();
    }
    if (auto j = cfg.get("synthesis.truncation_marker"); j && j->is_string()) c.truncationMarker = j->get<std::string>();
    if (auto j = cfg.get("synthesis.default_speed"); j && j->is_number()) {
        c.defaultSpeed = types::TextRequest::clampSpeed(j->get<double>());
    }
    if (auto j = cfg.get("synthesis.read_chunk_bytes"); j && j->is_number_integer() && j->get<int64_t>() > 0) {
        c.readChunkBytes = j->get<std::size_t>();
    }

    if (auto j = cfg.get("synthesis.remote.base_url"); j && j->is_string()) c.remote.baseUrl = j->get<std::string>();
    if (auto j = cfg.get("synthesis.remote.endpoint"); j && j->is_string()) c.remote.endpoint = j->get<std::string>();
    if (auto j = cfg.get("synthesis.remote.health_endpoint"); j && j->is_string()) {
        c.remote.healthEndpoint = j->get<std::string>();
    }
    if (auto j = cfg.get("synthesis.remote.timeout_ms"); j && j->is_number_integer()) c.remote.timeoutMs = j->get<int>();
    if (auto j = cfg.get("synthesis.remote.queue_chunks"); j && j->is_number_integer() && j->get<int64_t>() > 0) {
        c.remote.queueChunks = j->get<std::size_t>();
    }
    return c;
}

SynthesisPipeline::SynthesisPipeline(Config config, const ErrorHandler& errors, WorkerFactory factory)
    : m_config(std::move(config))
    , m_errors(errors)
    , m_factory(std::move(factory))
{
    if (m_config.maxChars == 0 || m_config.maxChars > kMaxTranscriptChars) {
        m_errors.log(ErrorHandler::LogLevel::Warning,
                     "synthesis.max_chars out of range, using " + std::to_string(kMaxTranscriptChars));
        m_config.maxChars = kMaxTranscriptChars;
    }
    if (m_config.truncationMarker.size() > kMaxMarkerBytes) {
        m_errors.log(ErrorHandler::LogLevel::Warning, "synthesis.truncation_marker too long, using \"...\"");
        m_config.truncationMarker = "...";
    }
    if (!m_factory) {
        m_factory = [this]() { return makeDefaultWorker(); };
    }
}

std::string SynthesisPipeline::capTranscript(const std::string& text, std::size_t maxChars,
                                             const std::string& marker) {
    std::size_t chars = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (isContinuationByte(static_cast<unsigned char>(text[i]))) continue;
        if (chars == maxChars) {
            // i 是第 maxChars+1 个字符的起始字节
            return text.substr(0, i) + marker;
        }
        ++chars;
    }
    return text;
}

std::unique_ptr<SynthesisRun> SynthesisPipeline::start(const std::shared_ptr<Session>& session,
                                                       const std::string& transcript,
                                                       const types::TextRequest& request) const {
    SynthesisJob job;
    job.text = capTranscript(transcript, m_config.maxChars, m_config.truncationMarker);
    job.speed = request.effectiveSpeed(m_config.defaultSpeed);
    job.sampleRate = request.sampleRate;
    job.format = m_config.format;

    if (job.text.size() != transcript.size()) {
        m_errors.log(ErrorHandler::LogLevel::Info,
                     "Transcript truncated to " + std::to_string(m_config.maxChars) + " characters for session " +
                     session->id());
    }

    auto worker = m_factory();
    if (!worker) {
        throw ProxyError(ErrorType::ProcessSpawnError, "synthesis_spawn", "No synthesis worker available");
    }
    if (!session->attachWorker(worker)) {
        throw ProxyError(ErrorType::SynthesisError, "synthesis", kSessionSupersededMessage);
    }
    session->advance(SessionState::Synthesizing);

    try {
        worker->start(job);
    } catch (const ProxyError& e) {
        m_errors.log(session->isCancelled() ? ErrorHandler::LogLevel::Info : ErrorHandler::LogLevel::Error,
                     "Failed to start synthesis worker", e.errorInfo());
        worker->terminate();
        worker->wait();
        throw;
    }

    // 收集输出直到 FormatSniffer 能下结论；未通过校验的字节一律不转发
    std::string prefix;
    bool ended = false;
    FormatSniffer::Result verdict;
    for (;;) {
        std::optional<std::string> chunk;
        try {
            chunk = worker->readChunk();
        } catch (const ProxyError& e) {
            ErrorInfo info = e.errorInfo();
            failAndReap(*worker, info);
        }
        if (!chunk) {
            ended = true;
            break;
        }
        if (chunk->empty()) continue;
        prefix.append(*chunk);
        verdict = FormatSniffer::classify(prefix, job.format);
        if (verdict.verdict != FormatSniffer::Verdict::NeedMore) break;
    }

    if (ended && prefix.empty()) {
        const int code = worker->wait();
        ErrorInfo info;
        info.errorType = ErrorType::SynthesisError;
        info.errorCode = code;
        info.stage = "synthesis";
        info.message = session->isCancelled() ? kSessionSupersededMessage : "TTS generation failed";
        nlohmann::json details{{"exit_code", code}, {"bytes_forwarded", 0}};
        if (const auto diag = worker->diagnostics(); !diag.empty()) {
            details["stderr"] = ErrorHandler::capText(diag, ErrorHandler::kMaxSnippetChars);
        }
        info.details = std::move(details);
        throw ProxyError(info);
    }
    if (ended) {
        verdict = FormatSniffer::classify(prefix, job.format, true);
    }

    if (!verdict.valid()) {
        m_errors.log(ErrorHandler::LogLevel::Warning,
                     "Invalid " + std::string(FormatSniffer::formatName(job.format)) + " header: " +
                     FormatSniffer::hexPrefix(prefix));
        ErrorInfo info;
        info.errorType = ErrorType::FormatError;
        info.stage = "format_check";
        info.message = "TTS output failed format validation";
        info.details = nlohmann::json{
            {"expected", FormatSniffer::formatName(job.format)},
            {"reason", verdict.reason},
            {"first_bytes", FormatSniffer::hexPrefix(prefix)}
        };
        failAndReap(*worker, std::move(info));
    }

    m_errors.log(ErrorHandler::LogLevel::Debug,
                 "First synthesis chunk validated for session " + session->id() + ": " +
                 std::to_string(prefix.size()) + " bytes, first bytes " + FormatSniffer::hexPrefix(prefix));

    return std::make_unique<SynthesisRun>(worker, session, std::move(prefix), ended, job.format, m_errors);
}

void SynthesisPipeline::failAndReap(SynthesisWorker& worker, ErrorInfo info) const {
    worker.terminate();
    const int code = worker.wait();
    if (info.errorCode == 0) info.errorCode = code;
    throw ProxyError(info);
}

bool SynthesisPipeline::isAlive() const {
    if (m_config.backend == Backend::Remote) {
        return RemoteSynthesisWorker::probeHealth(m_config.remote);
    }
    return SubprocessSynthesisWorker::commandResolvable(m_config.command);
}

const char* SynthesisPipeline::backendName() const {
    return m_config.backend == Backend::Remote ? "remote" : "subprocess";
}

std::shared_ptr<SynthesisWorker> SynthesisPipeline::makeDefaultWorker() const {
    if (m_config.backend == Backend::Remote) {
        return std::make_shared<RemoteSynthesisWorker>(m_config.remote, m_errors);
    }
    SubprocessSynthesisWorker::Options opt;
    opt.command = m_config.command;
    opt.args = m_config.args;
    opt.readChunkBytes = m_config.readChunkBytes;
    return std::make_shared<SubprocessSynthesisWorker>(std::move(opt), m_errors);
}

} // namespace holly::tts_proxy
