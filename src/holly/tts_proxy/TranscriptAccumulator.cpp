#include "holly/tts_proxy/TranscriptAccumulator.h"

#include "holly/tts_proxy/ConfigManager.h"
#include "holly/tts_proxy/utils/HttpClient.h"
#include "holly/tts_proxy/utils/HttpSerialization.h"

#include <algorithm>
#include <cctype>

using holly::tts_proxy::utils::CancelToken;
using holly::tts_proxy::utils::HttpClient;
using holly::tts_proxy::utils::HttpMethod;
using holly::tts_proxy::utils::HttpRequest;
using holly::tts_proxy::utils::HttpResponse;
using holly::tts_proxy::utils::RetryConfig;

namespace holly::tts_proxy {

namespace {

std::string trimCopy(std::string s) {
    auto notSpace = [](int ch) { return !std::isspace(ch); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
    s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
    return s;
}

bool isUnresolvedPlaceholder(const std::string& s) {
    return s.rfind("${", 0) == 0 && s.find('}') != std::string::npos;
}

[[noreturn]] void throwCancelled() {
    throw ProxyError(ErrorType::ClientDisconnected, "text_generation", "Text generation cancelled");
}

} // namespace

// ========== FragmentDecoder ==========

FragmentDecoder::FragmentDecoder(std::string textField)
    : m_textField(std::move(textField))
{}

void FragmentDecoder::feed(std::string_view chunk) {
    m_buf.append(chunk.data(), chunk.size());
}

std::vector<std::string> FragmentDecoder::drain() {
    std::vector<std::string> out;
    for (;;) {
        const auto eol = m_buf.find('\n');
        if (eol == std::string::npos) break;
        std::string line = m_buf.substr(0, eol);
        m_buf.erase(0, eol + 1);
        parseLine(std::move(line), out);
    }
    return out;
}

std::vector<std::string> FragmentDecoder::finish() {
    auto out = drain();
    if (!m_buf.empty()) {
        std::string rest;
        rest.swap(m_buf);
        parseLine(std::move(rest), out);
    }
    return out;
}

void FragmentDecoder::parseLine(std::string line, std::vector<std::string>& out) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (trimCopy(line).empty()) return;

    auto j = utils::parseJsonSafe(line);
    if (!j.has_value() || !j->is_object()) {
        // 坏行跳过，不中断整个流
        m_skipped++;
        return;
    }
    if (auto delta = utils::stringField(*j, m_textField); delta && !delta->empty()) {
        out.push_back(std::move(*delta));
    }
    if (auto it = j->find("done"); it != j->end() && it->is_boolean() && it->get<bool>()) {
        m_done = true;
    }
}

// ========== TranscriptAccumulator ==========

TranscriptAccumulator::Config TranscriptAccumulator::Config::loadConfig(const ConfigManager& cfg) {
    Config c;
    if (auto j = cfg.get("text_generation.base_url"); j && j->is_string()) c.baseUrl = trimCopy(j->get<std::string>());
    if (auto j = cfg.get("text_generation.endpoint"); j && j->is_string()) c.endpoint = j->get<std::string>();
    if (auto j = cfg.get("text_generation.model"); j && j->is_string()) c.model = j->get<std::string>();
    if (auto j = cfg.get("text_generation.mode"); j && j->is_string()) {
        c.mode = j->get<std::string>() == "stream" ? Mode::FragmentStream : Mode::Batch;
    }
    if (auto j = cfg.get("text_generation.text_field"); j && j->is_string()) c.textField = j->get<std::string>();
    if (auto j = cfg.get("text_generation.timeout_ms"); j && j->is_number_integer()) c.timeoutMs = j->get<int>();
    if (auto j = cfg.get("text_generation.max_retries"); j && j->is_number_integer()) c.maxRetries = j->get<int>();
    if (auto j = cfg.get("text_generation.api_key"); j && j->is_string()) {
        const auto key = trimCopy(j->get<std::string>());
        if (!isUnresolvedPlaceholder(key)) c.apiKey = key;
    }
    return c;
}

TranscriptAccumulator::TranscriptAccumulator(Config config, const ErrorHandler& errors)
    : m_config(std::move(config))
    , m_errors(errors)
{}

std::string TranscriptAccumulator::generate(const std::string& prompt, const CancelToken& cancel) const {
    if (cancel.isCancelled()) throwCancelled();
    return m_config.mode == Mode::FragmentStream ? generateFragments(prompt, cancel)
                                                 : generateBatch(prompt, cancel);
}

HttpRequest TranscriptAccumulator::buildRequest(const std::string& prompt, bool stream,
                                                const CancelToken& cancel) const {
    HttpRequest req;
    req.method = HttpMethod::POST;
    req.url = m_config.endpoint;
    req.timeoutMs = m_config.timeoutMs;
    req.body = utils::toJsonBody(nlohmann::json{
        {"model", m_config.model},
        {"prompt", prompt},
        {"stream", stream}
    });
    req.headers["Content-Type"] = "application/json";
    if (!m_config.apiKey.empty()) {
        req.headers["Authorization"] = "Bearer " + m_config.apiKey;
    }
    req.cancelToken = cancel;
    return req;
}

std::string TranscriptAccumulator::generateBatch(const std::string& prompt, const CancelToken& cancel) const {
    HttpClient client(m_config.baseUrl);
    client.setTimeout(m_config.timeoutMs);

    int attempts = 1;
    RetryConfig retry;
    retry.maxRetries = std::max(0, m_config.maxRetries);
    retry.retryOnTimeout = true;
    retry.retryLogger = [this, &attempts](int attempt, const HttpResponse& resp) {
        attempts = attempt + 2;
        m_errors.log(ErrorHandler::LogLevel::Warning,
                     "Text generation timed out, retrying (attempt " + std::to_string(attempt + 2) + ")",
                     ErrorHandler::fromHttpResponse(resp));
    };
    client.setRetryConfig(retry);

    const auto req = buildRequest(prompt, false, cancel);
    const auto resp = client.execute(req);
    if (resp.cancelled || cancel.isCancelled()) throwCancelled();
    if (!resp.isSuccess()) throwFailure(resp, req, attempts);

    std::string parseErr;
    auto j = utils::parseJsonSafe(resp.body, &parseErr);
    if (!j.has_value() || !j->is_object()) {
        ErrorInfo info;
        info.errorType = ErrorType::UpstreamError;
        info.errorCode = resp.statusCode;
        info.stage = "text_generation";
        info.message = "Unparsable text generation response";
        info.details = nlohmann::json{
            {"parse_error", ErrorHandler::capText(parseErr)},
            {"body_snippet", ErrorHandler::capText(resp.body, ErrorHandler::kMaxSnippetChars)}
        };
        throw ProxyError(info);
    }
    auto text = utils::stringField(*j, m_config.textField);
    if (!text.has_value()) {
        ErrorInfo info;
        info.errorType = ErrorType::UpstreamError;
        info.errorCode = resp.statusCode;
        info.stage = "text_generation";
        info.message = "Text generation response has no '" + m_config.textField + "' string";
        info.details = nlohmann::json{
            {"body_snippet", ErrorHandler::capText(resp.body, ErrorHandler::kMaxSnippetChars)}
        };
        throw ProxyError(info);
    }
    return *text;
}

std::string TranscriptAccumulator::generateFragments(const std::string& prompt, const CancelToken& cancel) const {
    HttpClient client(m_config.baseUrl);
    client.setTimeout(m_config.timeoutMs);

    const auto req0 = buildRequest(prompt, true, cancel);
    const int maxAttempts = std::max(0, m_config.maxRetries) + 1;

    for (int attempt = 1; ; ++attempt) {
        FragmentDecoder decoder(m_config.textField);
        std::string transcript;
        bool receivedAny = false;

        auto req = req0;
        req.streamHandler = [&](std::string_view chunk) {
            receivedAny = true;
            decoder.feed(chunk);
            for (auto& delta : decoder.drain()) transcript += delta;
            return true;
        };

        const auto resp = client.executeStream(req);
        if (resp.cancelled || cancel.isCancelled()) throwCancelled();

        if (resp.isSuccess() && resp.error.empty()) {
            for (auto& delta : decoder.finish()) transcript += delta;
            if (decoder.skippedCount() > 0) {
                m_errors.log(ErrorHandler::LogLevel::Debug,
                             "Skipped " + std::to_string(decoder.skippedCount()) + " malformed fragment(s)");
            }
            return transcript;
        }

        // 已收到片段后超时不能重试（上游会从头再生成一遍）
        const bool timedOut = HttpClient::classify(resp) == utils::HttpErrorType::Timeout;
        if (timedOut && !receivedAny && attempt < maxAttempts) {
            m_errors.log(ErrorHandler::LogLevel::Warning,
                         "Text generation timed out, retrying (attempt " + std::to_string(attempt + 1) + ")");
            continue;
        }
        throwFailure(resp, req0, attempt);
    }
}

void TranscriptAccumulator::throwFailure(const HttpResponse& resp, const HttpRequest& req, int attempts) const {
    auto info = ErrorHandler::fromHttpResponse(resp, req);
    if (info.errorType == ErrorType::TimeoutError) {
        info.message = "Text generation timed out after " + std::to_string(attempts) + " attempt(s)";
    }
    throw ProxyError(info);
}

} // namespace holly::tts_proxy
