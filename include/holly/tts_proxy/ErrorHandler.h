#pragma once

#include "holly/tts_proxy/ErrorTypes.h"
#include "holly/tts_proxy/utils/HttpTypes.h"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace holly::tts_proxy {

class ConfigManager;

class ErrorHandler {
public:
    // 上游错误文本写入日志/响应前的长度上限
    static constexpr std::size_t kMaxMessageChars = 256;
    static constexpr std::size_t kMaxSnippetChars = 1024;

    enum class LogLevel {
        Error,
        Warning,
        Info,
        Debug
    };

    struct LoggerConfig {
        LogLevel minLevel{LogLevel::Info};
        bool enabled{true};
    };

    ErrorHandler() = default;

    void setLoggerConfig(LoggerConfig cfg);
    const LoggerConfig& getLoggerConfig() const;

    // 从 logging.level / logging.enabled 读取日志配置
    static LoggerConfig loadLoggerConfig(const ConfigManager& cfg);

    // ========== 识别/解析 ==========
    // 文本生成服务返回的状态/传输错误 -> ErrorType（超时单独归类，其余一律视为上游错误）
    static ErrorType mapUpstreamFailure(const utils::HttpResponse& resp);

    // 从上游 HttpResponse 生成 ErrorInfo（message/snippet 均截断）
    static ErrorInfo fromHttpResponse(
        const utils::HttpResponse& resp,
        const std::optional<utils::HttpRequest>& req = std::nullopt);

    // 响应头提交前写回客户端的 JSON 错误体
    static nlohmann::json toErrorBody(const ErrorInfo& err);

    static std::string capText(const std::string& s, std::size_t maxChars = kMaxMessageChars);

    // ========== 日志 ==========
    void log(LogLevel level, const std::string& message, const std::optional<ErrorInfo>& err = std::nullopt) const;

    static const char* logLevelToString(LogLevel level);
    static std::optional<LogLevel> parseLogLevel(const std::string& s);

private:
    LoggerConfig m_loggerCfg;
};

} // namespace holly::tts_proxy
