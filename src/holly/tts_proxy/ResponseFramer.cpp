#include "holly/tts_proxy/ResponseFramer.h"

#include "httplib.h"

namespace holly::tts_proxy {

using types::ResponseMode;

ResponseFramer::ResponseFramer(ResponseMode mode, const ErrorHandler& errors)
    : m_errors(errors)
{
    m_state.mode = mode;
}

std::string ResponseFramer::encodeFrame(uint8_t type, std::string_view payload) {
    const auto len = static_cast<uint32_t>(payload.size());
    std::string out;
    out.reserve(5 + payload.size());
    out.push_back(static_cast<char>(type));
    out.push_back(static_cast<char>((len >> 24) & 0xFF));
    out.push_back(static_cast<char>((len >> 16) & 0xFF));
    out.push_back(static_cast<char>((len >> 8) & 0xFF));
    out.push_back(static_cast<char>(len & 0xFF));
    out.append(payload.data(), payload.size());
    return out;
}

std::string ResponseFramer::sanitizeHeaderValue(const std::string& value) {
    std::string out = value;
    for (auto& ch : out) {
        const auto c = static_cast<unsigned char>(ch);
        if (c < 0x20 || c == 0x7F) ch = ' ';
    }
    return out;
}

void ResponseFramer::writeJson(httplib::Response& res, const std::string& transcript) {
    res.status = 200;
    res.set_content(nlohmann::json{{"response", transcript}}.dump(), "application/json");
    m_state.headersCommitted = true;
}

void ResponseFramer::writeError(httplib::Response& res, const ErrorInfo& err) {
    if (m_state.headersCommitted) {
        m_errors.log(ErrorHandler::LogLevel::Warning, "Error after response commit; closing stream", err);
        return;
    }
    res.status = ErrorInfo::httpStatusFor(err.errorType);
    res.set_content(ErrorHandler::toErrorBody(err).dump(), "application/json");
}

void ResponseFramer::writeBuffered(httplib::Response& res, SynthesisRun& run, const std::string& transcript,
                                   const std::function<bool()>& isCurrent) {
    std::string body;
    while (auto chunk = run.next()) {
        if (isCurrent && !isCurrent()) {
            run.abort();
            throw ProxyError(ErrorType::SynthesisError, "synthesis", kSessionSupersededMessage);
        }
        body.append(*chunk);
    }
    run.complete(body.size());
    if (isCurrent && !isCurrent()) {
        throw ProxyError(ErrorType::SynthesisError, "synthesis", kSessionSupersededMessage);
    }

    const auto format = run.format();
    res.status = 200;
    res.set_header("Content-Disposition",
                   std::string("inline; filename=\"output.") + FormatSniffer::fileExtension(format) + "\"");
    res.set_header(kTranscriptHeader, sanitizeHeaderValue(transcript));
    res.set_content(std::move(body), FormatSniffer::contentType(format));
    m_state.headersCommitted = true;
    m_state.bytesWritten = res.body.size();
}

void ResponseFramer::beginStream(httplib::Response& res, std::shared_ptr<SynthesisRun> run,
                                 std::string transcript, StreamCallbacks callbacks) {
    m_run = std::move(run);
    m_transcript = std::move(transcript);
    m_callbacks = std::move(callbacks);

    const bool framed = m_state.mode == ResponseMode::FramedStream;
    const std::string contentType = framed ? "application/octet-stream" : FormatSniffer::contentType(m_run->format());

    res.status = 200;
    if (framed) {
        res.set_header(kFramingHeader, kFramingScheme);
    } else {
        res.set_header("Trailer", kTranscriptHeader);
    }

    auto self = shared_from_this();
    res.set_chunked_content_provider(
        contentType,
        [self](size_t /*offset*/, httplib::DataSink& sink) {
            return self->pump(sink);
        },
        [self](bool success) {
            // provider 未跑完（连接提前断开）时也在这里收尾
            self->finish(success && self->m_finished);
        });
    m_state.headersCommitted = true;
}

bool ResponseFramer::pump(httplib::DataSink& sink) {
    const bool framed = m_state.mode == ResponseMode::FramedStream;
    try {
        while (auto chunk = m_run->next()) {
            if (m_callbacks.isCurrent && !m_callbacks.isCurrent()) {
                m_errors.log(ErrorHandler::LogLevel::Info, "Stale session output dropped; closing stream");
                m_run->abort();
                return false;
            }
            if (chunk->empty()) continue;
            if (!writeOut(sink, framed ? encodeFrame(kFrameAudio, *chunk) : *chunk)) {
                m_run->abort();
                if (m_callbacks.onClientGone) m_callbacks.onClientGone();
                return false;
            }
            m_audioBytes += chunk->size();
            if (m_callbacks.onForwarded) m_callbacks.onForwarded(chunk->size());
        }

        m_run->complete(m_audioBytes);
    } catch (const ProxyError& e) {
        m_errors.log(ErrorHandler::LogLevel::Warning, "Synthesis failed after response commit", e.errorInfo());
        return false;
    }

    // 被取代的会话不得再写 trailer / 结束帧
    if (m_callbacks.isCurrent && !m_callbacks.isCurrent()) {
        m_errors.log(ErrorHandler::LogLevel::Info, "Session superseded before stream end; no trailer sent");
        return false;
    }

    if (framed) {
        if (!writeOut(sink, encodeFrame(kFrameEnd, {}))) {
            if (m_callbacks.onClientGone) m_callbacks.onClientGone();
            return false;
        }
        sink.done();
    } else {
        sink.done_with_trailer({{kTranscriptHeader, sanitizeHeaderValue(m_transcript)}});
    }
    m_finished = true;
    return true;
}

bool ResponseFramer::writeOut(httplib::DataSink& sink, const std::string& data) {
    if (!sink.write(data.data(), data.size())) {
        return false;
    }
    m_state.bytesWritten += data.size();
    return true;
}

void ResponseFramer::finish(bool success) {
    // 先回收 worker，再释放会话槽
    m_run.reset();
    if (m_callbacks.onFinished) {
        auto onFinished = std::move(m_callbacks.onFinished);
        m_callbacks.onFinished = nullptr;
        onFinished(success);
    }
}

} // namespace holly::tts_proxy
