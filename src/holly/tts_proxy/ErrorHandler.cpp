#include "holly/tts_proxy/ErrorHandler.h"
#include "holly/tts_proxy/ConfigManager.h"

#include <algorithm>
#include <chrono>
#include <cctype>
#include <cstdio>
#include <optional>
#include <sstream>
#include <string>

namespace holly::tts_proxy {

static uint64_t nowEpochMs() {
    using namespace std::chrono;
    return static_cast<uint64_t>(duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

static std::string toLowerCopy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

void ErrorHandler::setLoggerConfig(LoggerConfig cfg) {
    m_loggerCfg = cfg;
}

const ErrorHandler::LoggerConfig& ErrorHandler::getLoggerConfig() const {
    return m_loggerCfg;
}

ErrorHandler::LoggerConfig ErrorHandler::loadLoggerConfig(const ConfigManager& cfg) {
    LoggerConfig out;
    if (auto j = cfg.get("logging.level"); j && j->is_string()) {
        if (auto lv = parseLogLevel(j->get<std::string>())) {
            out.minLevel = *lv;
        }
    }
    if (auto j = cfg.get("logging.enabled"); j && j->is_boolean()) {
        out.enabled = j->get<bool>();
    }
    return out;
}

const char* ErrorHandler::logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Error: return "ERROR";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Info: return "INFO";
        default: return "DEBUG";
    }
}

std::optional<ErrorHandler::LogLevel> ErrorHandler::parseLogLevel(const std::string& s) {
    const auto low = toLowerCopy(s);
    if (low == "error") return LogLevel::Error;
    if (low == "warning" || low == "warn") return LogLevel::Warning;
    if (low == "info") return LogLevel::Info;
    if (low == "debug") return LogLevel::Debug;
    return std::nullopt;
}

std::string ErrorHandler::capText(const std::string& s, std::size_t maxChars) {
    if (s.size() <= maxChars) return s;
    // 按字节截断后回退到 UTF-8 字符边界
    std::size_t cut = maxChars;
    while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return s.substr(0, cut);
}

ErrorType ErrorHandler::mapUpstreamFailure(const utils::HttpResponse& resp) {
    if (resp.timedOut || resp.statusCode == 408 || resp.statusCode == 504) {
        return ErrorType::TimeoutError;
    }
    return ErrorType::UpstreamError;
}

ErrorInfo ErrorHandler::fromHttpResponse(
    const utils::HttpResponse& resp,
    const std::optional<utils::HttpRequest>& req) {

    ErrorInfo info;
    info.timestamp = std::chrono::system_clock::now();
    info.errorCode = resp.statusCode;
    info.errorType = mapUpstreamFailure(resp);
    info.stage = "text_generation";

    // message：优先上游 JSON 的 error 字段 -> 传输错误 -> 状态码
    std::string message;
    std::optional<nlohmann::json> parsed;
    if (!resp.body.empty()) {
        parsed = resp.asJson();
        if (parsed && parsed->is_object() && parsed->contains("error")) {
            const auto& e = parsed->at("error");
            if (e.is_string()) {
                message = e.get<std::string>();
            } else if (e.is_object() && e.contains("message") && e.at("message").is_string()) {
                message = e.at("message").get<std::string>();
            }
        }
    }
    if (message.empty() && !resp.error.empty()) {
        message = resp.error;
    }
    if (message.empty()) {
        message = resp.statusCode > 0
            ? "Text generation service returned HTTP " + std::to_string(resp.statusCode)
            : "Text generation service unreachable";
    }
    info.message = capText(message, kMaxMessageChars);

    nlohmann::json d;
    d["http_status"] = resp.statusCode;
    if (!resp.error.empty()) d["transport_error"] = capText(resp.error, kMaxMessageChars);
    if (!resp.body.empty()) d["body_snippet"] = capText(resp.body, kMaxSnippetChars);
    info.details = d;

    // context：只记录 method/url，不记录请求头（可能含 Authorization）
    if (req.has_value()) {
        std::map<std::string, std::string> ctx;
        ctx["url"] = req->url;
        ctx["method"] = req->method == utils::HttpMethod::GET ? "GET" : "POST";
        info.context = std::move(ctx);
    }

    return info;
}

nlohmann::json ErrorHandler::toErrorBody(const ErrorInfo& err) {
    nlohmann::json j;
    j["error"] = capText(err.message, kMaxMessageChars);
    j["type"] = ErrorInfo::errorTypeToString(err.errorType);
    j["stage"] = err.stage.empty() ? "request" : err.stage;
    return j;
}

void ErrorHandler::log(LogLevel level, const std::string& message, const std::optional<ErrorInfo>& err) const {
    if (!m_loggerCfg.enabled) return;

    auto levelRank = [](LogLevel lv) {
        switch (lv) {
            case LogLevel::Error: return 0;
            case LogLevel::Warning: return 1;
            case LogLevel::Info: return 2;
            default: return 3;
        }
    };
    if (levelRank(level) > levelRank(m_loggerCfg.minLevel)) return;

    // 结构化输出到 stderr：timestamp + level + message + optional error json
    std::ostringstream oss;
    oss << "[" << nowEpochMs() << "] "
        << logLevelToString(level) << " "
        << message;
    if (err.has_value()) {
        oss << " " << err->toString();
    }
    oss << "\n";
    const auto line = oss.str();
    std::fwrite(line.c_str(), 1, line.size(), stderr);
    std::fflush(stderr);
}

} // namespace holly::tts_proxy
