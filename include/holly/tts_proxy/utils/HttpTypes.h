#pragma once

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "nlohmann/json.hpp"

namespace holly::tts_proxy::utils {

/**
 * @brief HTTP请求方法枚举（上游只用到 GET/POST）
 */
enum class HttpMethod {
    GET,
    POST
};

/**
 * @brief 跨线程取消标志；由 AbortCoordinator 置位，由请求循环轮询
 *
 * 拷贝共享同一状态。回调在内部锁下执行，必须短小且不能再操作同一个 token。
 */
class CancelToken {
public:
    CancelToken() : m_state(std::make_shared<State>()) {}

    void cancel() const {
        std::lock_guard<std::mutex> lk(m_state->mu);
        if (m_state->cancelled.exchange(true)) return;
        for (auto& [id, cb] : m_state->callbacks) {
            if (cb) cb();
        }
    }

    bool isCancelled() const { return m_state->cancelled.load(); }

    // 注册取消回调；已取消时立即执行。返回值用于 removeCallback
    std::size_t addCallback(std::function<void()> cb) const {
        std::lock_guard<std::mutex> lk(m_state->mu);
        const auto id = ++m_state->nextId;
        if (m_state->cancelled.load()) {
            if (cb) cb();
            return id;
        }
        m_state->callbacks.emplace(id, std::move(cb));
        return id;
    }

    // 返回后回调保证不会再被调用
    void removeCallback(std::size_t id) const {
        std::lock_guard<std::mutex> lk(m_state->mu);
        m_state->callbacks.erase(id);
    }

private:
    struct State {
        std::mutex mu;
        std::atomic<bool> cancelled{false};
        std::size_t nextId{0};
        std::map<std::size_t, std::function<void()>> callbacks;
    };
    std::shared_ptr<State> m_state;
};

// 流式回调：按块接收响应正文；返回 false 表示中止读取
using StreamHandler = std::function<bool(std::string_view chunk)>;

/**
 * @brief HTTP请求结构
 */
struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;
    int timeoutMs = 30000;  // 默认30秒超时

    // 非空时走 executeStream：2xx 正文逐块交给 handler，不再缓存到 HttpResponse::body
    StreamHandler streamHandler;
    // 流式请求收到状态行与响应头时回调（早于任何正文）
    std::function<void(int statusCode)> responseHandler;
    std::optional<CancelToken> cancelToken;

    void setHeader(const std::string& key, const std::string& value) {
        headers[key] = value;
    }

    std::optional<std::string> getHeader(const std::string& key) const {
        auto it = headers.find(key);
        if (it != headers.end()) {
            return it->second;
        }
        return std::nullopt;
    }
};

/**
 * @brief HTTP错误/状态分类
 */
enum class HttpErrorType {
    None,
    Network,       // statusCode == 0 且非超时
    Timeout,       // 408/504 或本地读/连接超时
    Cancelled,     // CancelToken 置位或 handler 返回 false
    Client,        // 4xx
    Server         // 5xx（504 除外）
};

struct HttpHeaders {
    // 小写键 -> 多值列表（按插入顺序保留）
    std::map<std::string, std::vector<std::string>> entries;

    static std::string toLower(const std::string& s) {
        std::string out = s;
        std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c){ return std::tolower(c); });
        return out;
    }

    void add(const std::string& key, const std::string& value) {
        entries[toLower(key)].push_back(value);
    }

    bool has(const std::string& key) const {
        return entries.find(toLower(key)) != entries.end();
    }

    std::optional<std::string> getFirst(const std::string& key) const {
        auto it = entries.find(toLower(key));
        if (it == entries.end() || it->second.empty()) return std::nullopt;
        return it->second.front();
    }

    std::optional<std::string> contentType() const {
        return getFirst("content-type");
    }
};

/**
 * @brief HTTP响应结构
 */
struct HttpResponse {
    int statusCode = 0;
    HttpHeaders headers;
    std::string body;
    std::string error;      // 传输层错误信息（如果有）
    bool timedOut = false;  // 读/连接超时
    bool cancelled = false; // 被 CancelToken 或 handler 中止

    bool isSuccess() const {
        return statusCode >= 200 && statusCode < 300;
    }

    std::optional<std::string> getHeader(const std::string& key) const {
        return headers.getFirst(key);
    }

    bool isJson() const {
        auto ct = headers.contentType();
        return ct.has_value() && ct->find("application/json") != std::string::npos;
    }

    /**
     * @brief 解析正文为 JSON；失败返回 nullopt
     */
    std::optional<nlohmann::json> asJson(std::string* error = nullptr) const {
        try {
            return nlohmann::json::parse(body);
        } catch (const std::exception& e) {
            if (error) *error = e.what();
            return std::nullopt;
        }
    }
};

/**
 * @brief 重试配置
 *
 * 文本生成只对超时重试一次；其余错误直接上抛。
 */
struct RetryConfig {
    int maxRetries = 1;
    std::chrono::milliseconds delay{0};
    bool retryOnTimeout = true;
    bool retryOnNetworkError = false;
    bool retryOnServerError = false;
    // 可选重试日志回调：入参 attempt、HttpResponse
    std::function<void(int, const HttpResponse&)> retryLogger;
};

} // namespace holly::tts_proxy::utils
