#pragma once

#include "HttpTypes.h"

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>

// 前向声明，避免包含整个httplib.h头文件
// 实际使用时会在cpp文件中包含
namespace httplib {
    class Client;
}

namespace holly::tts_proxy::utils {

/**
 * @brief 上游 HTTP 客户端封装
 *
 * 基于cpp-httplib实现，每个实例绑定一个 base URL（host 级别复用同一个 httplib::Client）。
 * - execute()：缓冲正文，按 RetryConfig 重试
 * - executeStream()：正文逐块回调，支持 CancelToken
 * - stop()：可从其他线程调用，立即关闭进行中的连接
 *
 * 使用示例：
 * ```
 * HttpClient client("http://localhost:11434");
 * HttpRequest req;
 * req.method = HttpMethod::POST;
 * req.url = "/api/generate";
 * req.body = R"({"model":"llama3","prompt":"hi","stream":false})";
 * auto resp = client.execute(req);
 * ```
 */
class HttpClient {
public:
    explicit HttpClient(const std::string& baseUrl = "");
    ~HttpClient();

    // 禁止拷贝与移动（含mutex，不可安全移动）
    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;
    HttpClient(HttpClient&&) = delete;
    HttpClient& operator=(HttpClient&&) = delete;

    void setRetryConfig(const RetryConfig& config);

    /**
     * @brief 设置读超时时间（毫秒），同时作为连接超时上限
     */
    void setTimeout(int timeoutMs);

    // ========== 同步请求方法 ==========

    HttpResponse get(const std::string& path,
                     const std::map<std::string, std::string>& headers = {});

    HttpResponse postJson(const std::string& path,
                          const std::string& jsonBody,
                          const std::map<std::string, std::string>& headers = {});

    /**
     * @brief 通用请求方法（带重试）
     */
    HttpResponse execute(const HttpRequest& request);

    /**
     * @brief 流式请求：2xx 正文交给 request.streamHandler；非 2xx 正文仍缓存到 body 便于报错
     *
     * 不重试（已交付的分片无法撤回）。
     */
    HttpResponse executeStream(const HttpRequest& request);

    /**
     * @brief 中断进行中的请求（线程安全，fire-and-forget）
     */
    void stop();

    // 状态/传输结果分类；408、504 与本地超时同属 Timeout
    static HttpErrorType classify(const HttpResponse& response);

    // 测试辅助访问（gtest友元）
    friend class HttpClientTestAccessor;

private:
    std::shared_ptr<httplib::Client> getOrCreateClient();

    HttpResponse executeWithRetry(const HttpRequest& request);
    HttpResponse executeOnce(const HttpRequest& request);

    std::string pathOf(const std::string& url) const;

    bool isRetryableError(const HttpResponse& response) const;

    std::map<std::string, std::string> mergeHeaders(
        const std::map<std::string, std::string>& requestHeaders) const;

    std::string m_baseUrl;
    std::map<std::string, std::string> m_defaultHeaders;
    RetryConfig m_retryConfig;
    int m_timeoutMs;

    mutable std::mutex m_clientMutex;
    std::shared_ptr<httplib::Client> m_client;
};

} // namespace holly::tts_proxy::utils
