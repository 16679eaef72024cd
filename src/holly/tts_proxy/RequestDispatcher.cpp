#include "holly/tts_proxy/RequestDispatcher.h"

#include "holly/tts_proxy/ResponseFramer.h"
#include "holly/tts_proxy/utils/HttpSerialization.h"

#include "httplib.h"

namespace holly::tts_proxy {

using types::ResponseMode;
using types::TextRequest;

RequestDispatcher::RequestDispatcher(SessionSupervisor& supervisor,
                                     const TranscriptAccumulator& accumulator,
                                     const SynthesisPipeline& pipeline,
                                     AbortCoordinator::Policy abortPolicy,
                                     const ErrorHandler& errors)
    : m_supervisor(supervisor)
    , m_accumulator(accumulator)
    , m_pipeline(pipeline)
    , m_abortPolicy(abortPolicy)
    , m_errors(errors)
{}

TextRequest RequestDispatcher::parseRequest(const std::string& body) {
    std::string parseErr;
    auto j = utils::parseJsonSafe(body, &parseErr);
    if (!j) {
        ErrorInfo info;
        info.errorType = ErrorType::ValidationError;
        info.stage = "request";
        info.message = "Request body must be valid JSON";
        info.details = nlohmann::json{{"reason", ErrorHandler::capText(parseErr)}};
        throw ProxyError(info);
    }
    auto req = TextRequest::fromJson(*j);
    if (!req) {
        throw ProxyError(ErrorType::ValidationError, "request", "Request body must be a JSON object");
    }
    if (!req->hasLiteralText() && !req->hasPrompt()) {
        throw ProxyError(ErrorType::ValidationError, "request", "Prompt is required");
    }
    return *req;
}

std::string RequestDispatcher::acquireTranscript(const TextRequest& request, const utils::CancelToken& cancel) const {
    if (request.hasLiteralText()) {
        return *request.text;
    }
    if (!request.needsTextGeneration()) {
        return *request.prompt;
    }
    m_errors.log(ErrorHandler::LogLevel::Debug, "Requesting transcript from text generation service");
    auto transcript = m_accumulator.generate(*request.prompt, cancel);
    m_errors.log(ErrorHandler::LogLevel::Info,
                 "Transcript generated: " + std::to_string(transcript.size()) + " bytes");
    return transcript;
}

void RequestDispatcher::handle(const std::string& body, std::function<bool()> connectionClosed,
                               httplib::Response& res) {
    TextRequest request;
    try {
        request = parseRequest(body);
    } catch (const ProxyError& e) {
        m_errors.log(ErrorHandler::LogLevel::Info, "Rejected /tts request", e.errorInfo());
        ResponseFramer(ResponseMode::Buffered, m_errors).writeError(res, e.errorInfo());
        return;
    }

    const auto mode = request.responseMode();
    auto framer = std::make_shared<ResponseFramer>(mode, m_errors);
    utils::CancelToken textCancel;
    auto abort = std::make_shared<AbortCoordinator>(m_abortPolicy, mode, textCancel, m_errors);
    abort->watch(std::move(connectionClosed));

    m_errors.log(ErrorHandler::LogLevel::Info,
                 std::string("POST /tts mode=") + types::responseModeToString(mode) +
                 (request.hasLiteralText() ? " source=text" : request.needsTextGeneration() ? " source=generate"
                                                                                         : " source=prompt"));

    std::shared_ptr<Session> session;
    try {
        const auto transcript = acquireTranscript(request, textCancel);
        if (abort->disconnected()) {
            throw ProxyError(ErrorType::ClientDisconnected, "text_generation", "Client disconnected");
        }

        if (mode == ResponseMode::JsonOnly) {
            abort->stopWatching();
            framer->writeJson(res, transcript);
            return;
        }

        if (types::text_request_detail::isBlank(transcript)) {
            throw ProxyError(ErrorType::UpstreamError, "text_generation",
                             "Text generation returned an empty transcript");
        }

        session = m_supervisor.createSession();
        const auto epoch = m_supervisor.install(session);
        abort->bindSession(session);

        auto isCurrent = [this, epoch]() { return m_supervisor.isCurrent(epoch); };

        std::shared_ptr<SynthesisRun> run = m_pipeline.start(session, transcript, request);
        if (!isCurrent()) {
            throw ProxyError(ErrorType::SynthesisError, "synthesis", kSessionSupersededMessage);
        }

        if (mode == ResponseMode::Buffered) {
            framer->writeBuffered(res, *run, transcript, isCurrent);
            abort->stopWatching();
            abort->recordForwarded(framer->state().bytesWritten);
            session->advance(SessionState::Streaming);
            session->advance(SessionState::Closed);
            m_supervisor.release(session);
            m_errors.log(ErrorHandler::LogLevel::Info,
                         "Session " + session->id() + " completed (buffered, " +
                         std::to_string(framer->state().bytesWritten) + " bytes)");
            return;
        }

        // 流式阶段继续轮询：worker 长时间无输出时也能发现客户端断开
        session->advance(SessionState::Streaming);

        StreamCallbacks callbacks;
        callbacks.isCurrent = isCurrent;
        callbacks.onForwarded = [abort](std::size_t n) { abort->recordForwarded(n); };
        callbacks.onClientGone = [abort]() { abort->onDisconnect(); };
        SessionSupervisor& supervisor = m_supervisor;
        const ErrorHandler& errors = m_errors;
        callbacks.onFinished = [&supervisor, &errors, session, abort](bool ok) {
            abort->stopWatching();
            session->advance(SessionState::Closed);
            supervisor.release(session);
            errors.log(ErrorHandler::LogLevel::Info,
                       "Session " + session->id() + (ok ? " completed (" : " closed without trailer (") +
                       std::to_string(abort->bytesForwarded()) + " audio bytes)");
        };
        framer->beginStream(res, std::move(run), transcript, std::move(callbacks));
    } catch (const ProxyError& e) {
        abort->stopWatching();
        if (session) {
            session->advance(SessionState::Closed);
            m_supervisor.release(session);
        }
        if (e.type() == ErrorType::ClientDisconnected || abort->disconnected()) {
            m_errors.log(ErrorHandler::LogLevel::Info, "Request abandoned after client disconnect", e.errorInfo());
        } else {
            m_errors.log(ErrorHandler::LogLevel::Warning, "Error in /tts", e.errorInfo());
        }
        framer->writeError(res, e.errorInfo());
    } catch (const std::exception& e) {
        abort->stopWatching();
        if (session) {
            session->advance(SessionState::Closed);
            m_supervisor.release(session);
        }
        ErrorInfo info;
        info.errorType = ErrorType::UnknownError;
        info.stage = "request";
        info.message = ErrorHandler::capText(e.what());
        m_errors.log(ErrorHandler::LogLevel::Error, "Unexpected error in /tts", info);
        framer->writeError(res, info);
    }
}

} // namespace holly::tts_proxy
