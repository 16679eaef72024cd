#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>

#include "nlohmann/json.hpp"

namespace holly::tts_proxy {

/**
 * @brief 统一错误类型
 */
enum class ErrorType {
    ValidationError,     // 请求缺少可朗读文本（400）
    UpstreamError,       // 文本生成服务不可达或返回非 2xx（502）
    TimeoutError,        // 文本生成超时（重试一次后仍超时）
    FormatError,         // 合成输出首块未通过签名校验
    SynthesisError,      // worker 非零退出或未产出任何字节
    ProcessSpawnError,   // worker 启动失败
    ClientDisconnected,  // 客户端已断开（仅记录日志，不会写回）
    UnknownError
};

/**
 * @brief 结构化错误信息
 */
struct ErrorInfo {
    ErrorType errorType{ErrorType::UnknownError};
    int errorCode{0}; // 上游 HTTP status、worker 退出码或 errno（0 表示无/未知）
    std::string message;
    std::string stage; // 出错阶段：request / text_generation / synthesis_spawn / format_check / synthesis
    std::optional<nlohmann::json> details;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
    std::optional<std::map<std::string, std::string>> context;

    static const char* errorTypeToString(ErrorType t) {
        switch (t) {
            case ErrorType::ValidationError: return "ValidationError";
            case ErrorType::UpstreamError: return "UpstreamError";
            case ErrorType::TimeoutError: return "TimeoutError";
            case ErrorType::FormatError: return "FormatError";
            case ErrorType::SynthesisError: return "SynthesisError";
            case ErrorType::ProcessSpawnError: return "ProcessSpawnError";
            case ErrorType::ClientDisconnected: return "ClientDisconnected";
            default: return "UnknownError";
        }
    }

    /**
     * @brief 错误类型对应的 HTTP 状态码（仅在响应头尚未提交时使用）
     */
    static int httpStatusFor(ErrorType t) {
        switch (t) {
            case ErrorType::ValidationError: return 400;
            case ErrorType::UpstreamError: return 502;
            case ErrorType::TimeoutError: return 504;
            case ErrorType::ClientDisconnected: return 499;
            default: return 500;
        }
    }

    nlohmann::json toJson() const {
        nlohmann::json j;
        j["error_type"] = errorTypeToString(errorType);
        j["error_code"] = errorCode;
        j["message"] = message;
        if (!stage.empty()) j["stage"] = stage;
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
        j["timestamp_ms"] = ms;
        if (details.has_value()) j["details"] = details.value();
        if (context.has_value()) j["context"] = context.value();
        return j;
    }

    std::string toString() const {
        // JSON 作为统一字符串化输出，便于日志/调试
        return toJson().dump();
    }
};

/**
 * @brief 组件边界上抛出的异常，携带 ErrorInfo
 */
class ProxyError : public std::runtime_error {
public:
    explicit ProxyError(const ErrorInfo& info)
        : std::runtime_error(info.message)
        , m_info(info)
    {}

    ProxyError(ErrorType type, std::string stage, std::string message, int code = 0)
        : std::runtime_error(message)
    {
        m_info.errorType = type;
        m_info.stage = std::move(stage);
        m_info.message = std::move(message);
        m_info.errorCode = code;
    }

    const ErrorInfo& errorInfo() const { return m_info; }
    ErrorType type() const { return m_info.errorType; }

private:
    ErrorInfo m_info;
};

} // namespace holly::tts_proxy
