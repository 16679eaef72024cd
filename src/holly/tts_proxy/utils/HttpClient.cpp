#include "holly/tts_proxy/utils/HttpClient.h"
#include "holly/tts_proxy/utils/HttpTypes.h"

// 包含cpp-httplib头文件
// 注意：如果需要 HTTPS 上游，需在编译层开启 CPPHTTPLIB_OPENSSL_SUPPORT
#include "httplib.h"

#include <algorithm>
#include <chrono>
#include <thread>
#include <utility>

namespace holly::tts_proxy::utils {

namespace {

// "http://host:port/prefix" -> ("http://host:port", "/prefix")
std::pair<std::string, std::string> splitBaseUrl(const std::string& url) {
    const auto schemeEnd = url.find("://");
    const auto searchStart = (schemeEnd == std::string::npos) ? 0 : schemeEnd + 3;
    const auto pathStart = url.find('/', searchStart);
    if (pathStart == std::string::npos) {
        return {url, ""};
    }
    std::string prefix = url.substr(pathStart);
    while (!prefix.empty() && prefix.back() == '/') prefix.pop_back();
    return {url.substr(0, pathStart), prefix};
}

httplib::Headers toHttplibHeaders(const std::map<std::string, std::string>& headers) {
    httplib::Headers out;
    for (const auto& [key, value] : headers) {
        out.emplace(key, value);
    }
    return out;
}

void copyHeaders(const httplib::Headers& from, HttpHeaders& to) {
    for (const auto& [key, value] : from) {
        to.add(key, value);
    }
}

// 请求期间把 CancelToken 接到 HttpClient::stop()，离开作用域即解除
class StopOnCancel {
public:
    StopOnCancel(const std::optional<CancelToken>& token, HttpClient& client)
        : m_token(token)
    {
        if (m_token) {
            m_id = m_token->addCallback([&client]() { client.stop(); });
        }
    }
    ~StopOnCancel() {
        if (m_token) m_token->removeCallback(m_id);
    }

    StopOnCancel(const StopOnCancel&) = delete;
    StopOnCancel& operator=(const StopOnCancel&) = delete;

private:
    const std::optional<CancelToken>& m_token;
    std::size_t m_id{0};
};

} // namespace

// ========== HttpClient 实现 ==========

HttpClient::HttpClient(const std::string& baseUrl)
    : m_baseUrl(baseUrl)
    , m_timeoutMs(30000)
{
    m_defaultHeaders["User-Agent"] = "holly-tts-proxy/1.0";
}

HttpClient::~HttpClient() = default;

void HttpClient::setRetryConfig(const RetryConfig& config) {
    m_retryConfig = config;
}

void HttpClient::setTimeout(int timeoutMs) {
    m_timeoutMs = timeoutMs > 0 ? timeoutMs : 30000;
}

// ========== 同步请求方法 ==========

HttpResponse HttpClient::get(const std::string& path,
                             const std::map<std::string, std::string>& headers) {
    HttpRequest request;
    request.method = HttpMethod::GET;
    request.url = path;
    request.headers = headers;
    request.timeoutMs = m_timeoutMs;
    return execute(request);
}

HttpResponse HttpClient::postJson(const std::string& path,
                                  const std::string& jsonBody,
                                  const std::map<std::string, std::string>& headers) {
    HttpRequest request;
    request.method = HttpMethod::POST;
    request.url = path;
    request.body = jsonBody;
    request.headers = headers;
    request.headers["Content-Type"] = "application/json";
    request.timeoutMs = m_timeoutMs;
    return execute(request);
}

HttpResponse HttpClient::execute(const HttpRequest& request) {
    return executeWithRetry(request);
}

HttpResponse HttpClient::executeStream(const HttpRequest& request) {
    HttpResponse response;
    if (request.cancelToken && request.cancelToken->isCancelled()) {
        response.cancelled = true;
        response.error = "Request cancelled before start";
        return response;
    }

    try {
        auto client = getOrCreateClient();
        StopOnCancel stopGuard(request.cancelToken, *this);
        if (request.cancelToken && request.cancelToken->isCancelled()) {
            response.cancelled = true;
            response.error = "Request cancelled before start";
            return response;
        }

        httplib::Request hreq;
        hreq.method = request.method == HttpMethod::GET ? "GET" : "POST";
        hreq.path = pathOf(request.url);
        hreq.headers = toHttplibHeaders(mergeHeaders(request.headers));
        hreq.body = request.body;
        if (request.method == HttpMethod::POST && !hreq.has_header("Content-Type")) {
            hreq.set_header("Content-Type", "application/json");
        }

        int status = 0;
        bool handlerAborted = false;
        hreq.response_handler = [&](const httplib::Response& r) {
            status = r.status;
            copyHeaders(r.headers, response.headers);
            if (request.responseHandler) request.responseHandler(r.status);
            return !(request.cancelToken && request.cancelToken->isCancelled());
        };
        hreq.content_receiver = [&](const char* data, size_t len, uint64_t, uint64_t) {
            if (request.cancelToken && request.cancelToken->isCancelled()) {
                return false;
            }
            if (status < 200 || status >= 300) {
                // 非 2xx：只保留前若干字节用于错误信息
                if (response.body.size() < 4096) {
                    response.body.append(data, std::min<size_t>(len, 4096 - response.body.size()));
                }
                return true;
            }
            if (request.streamHandler && !request.streamHandler(std::string_view(data, len))) {
                handlerAborted = true;
                return false;
            }
            return true;
        };

        const auto started = std::chrono::steady_clock::now();
        auto result = client->send(hreq);
        const auto elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started).count();

        response.statusCode = status;
        if (!result) {
            const auto err = result.error();
            const bool cancelled = handlerAborted || err == httplib::Error::Canceled ||
                                   (request.cancelToken && request.cancelToken->isCancelled());
            if (cancelled) {
                response.cancelled = true;
                response.error = "Request cancelled";
            } else {
                response.statusCode = 0;
                response.timedOut = err == httplib::Error::ConnectionTimeout ||
                                    (err == httplib::Error::Read && elapsedMs >= request.timeoutMs);
                response.error = (response.timedOut ? "Request timed out: " : "Request failed: ") +
                                 httplib::to_string(err);
            }
        }
    } catch (const std::exception& e) {
        response.statusCode = 0;
        response.error = "Exception: " + std::string(e.what());
    }
    return response;
}

void HttpClient::stop() {
    std::shared_ptr<httplib::Client> client;
    {
        std::lock_guard<std::mutex> lock(m_clientMutex);
        client = m_client;
    }
    if (client) {
        client->stop();
    }
}

// ========== 私有方法 ==========

std::shared_ptr<httplib::Client> HttpClient::getOrCreateClient() {
    std::lock_guard<std::mutex> lock(m_clientMutex);
    if (m_client) {
        return m_client;
    }

    const auto hostPart = splitBaseUrl(m_baseUrl).first;
    m_client = std::make_shared<httplib::Client>(hostPart);

    // 设置超时
    const int connectMs = std::min(m_timeoutMs, 10000);
    m_client->set_connection_timeout(connectMs / 1000, (connectMs % 1000) * 1000);
    m_client->set_read_timeout(m_timeoutMs / 1000, (m_timeoutMs % 1000) * 1000);
    m_client->set_write_timeout(5, 0);
    m_client->set_follow_location(true);
    return m_client;
}

HttpResponse HttpClient::executeWithRetry(const HttpRequest& request) {
    HttpResponse response;
    int attempt = 0;

    while (attempt <= m_retryConfig.maxRetries) {
        response = executeOnce(request);

        if (response.isSuccess() || !isRetryableError(response)) {
            break;
        }
        if (attempt >= m_retryConfig.maxRetries) {
            break;
        }
        if (m_retryConfig.retryLogger) {
            m_retryConfig.retryLogger(attempt, response);
        }
        if (m_retryConfig.delay.count() > 0) {
            std::this_thread::sleep_for(m_retryConfig.delay);
        }
        attempt++;
    }

    return response;
}

HttpResponse HttpClient::executeOnce(const HttpRequest& request) {
    HttpResponse response;
    if (request.cancelToken && request.cancelToken->isCancelled()) {
        response.cancelled = true;
        response.error = "Request cancelled before start";
        return response;
    }

    try {
        auto client = getOrCreateClient();
        StopOnCancel stopGuard(request.cancelToken, *this);
        if (request.cancelToken && request.cancelToken->isCancelled()) {
            response.cancelled = true;
            response.error = "Request cancelled before start";
            return response;
        }
        const auto headers = toHttplibHeaders(mergeHeaders(request.headers));
        const auto path = pathOf(request.url);

        const auto started = std::chrono::steady_clock::now();
        httplib::Result result;
        switch (request.method) {
            case HttpMethod::GET:
                result = client->Get(path, headers);
                break;
            case HttpMethod::POST:
                result = client->Post(path, headers, request.body,
                                      request.getHeader("Content-Type").value_or("application/json"));
                break;
        }
        const auto elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started).count();

        if (result) {
            response.statusCode = result->status;
            response.body = result->body;
            copyHeaders(result->headers, response.headers);
        } else {
            const auto err = result.error();
            response.statusCode = 0;
            if (err == httplib::Error::Canceled ||
                (request.cancelToken && request.cancelToken->isCancelled())) {
                response.cancelled = true;
                response.error = "Request cancelled";
            } else {
                response.timedOut = err == httplib::Error::ConnectionTimeout ||
                                    (err == httplib::Error::Read && elapsedMs >= request.timeoutMs);
                response.error = (response.timedOut ? "Request timed out: " : "Request failed: ") +
                                 httplib::to_string(err);
            }
        }
    } catch (const std::exception& e) {
        response.statusCode = 0;
        response.error = "Exception: " + std::string(e.what());
    }

    return response;
}

std::string HttpClient::pathOf(const std::string& url) const {
    // 完整 URL：直接取 host 之后的部分
    if (url.find("://") != std::string::npos) {
        const auto schemeEnd = url.find("://");
        const auto pathStart = url.find('/', schemeEnd + 3);
        return pathStart == std::string::npos ? "/" : url.substr(pathStart);
    }

    // 相对路径：拼接 base URL 中的前缀
    std::string prefix = splitBaseUrl(m_baseUrl).second;
    if (url.empty()) return prefix.empty() ? "/" : prefix;
    if (url.front() != '/') prefix += '/';
    return prefix + url;
}

bool HttpClient::isRetryableError(const HttpResponse& response) const {
    switch (classify(response)) {
        case HttpErrorType::Timeout:
            return m_retryConfig.retryOnTimeout;
        case HttpErrorType::Network:
            return m_retryConfig.retryOnNetworkError;
        case HttpErrorType::Server:
            return m_retryConfig.retryOnServerError;
        default:
            return false;
    }
}

std::map<std::string, std::string> HttpClient::mergeHeaders(
    const std::map<std::string, std::string>& requestHeaders) const {
    std::lock_guard<std::mutex> lock(m_clientMutex);
    std::map<std::string, std::string> merged = requestHeaders;
    // 请求头优先，默认头只补缺
    merged.insert(m_defaultHeaders.begin(), m_defaultHeaders.end());
    return merged;
}

HttpErrorType HttpClient::classify(const HttpResponse& response) {
    if (response.cancelled) {
        return HttpErrorType::Cancelled;
    }
    if (response.timedOut || response.statusCode == 408 || response.statusCode == 504) {
        return HttpErrorType::Timeout;
    }
    if (response.statusCode == 0) {
        return HttpErrorType::Network;
    }
    if (response.statusCode >= 500 && response.statusCode < 600) {
        return HttpErrorType::Server;
    }
    if (response.statusCode >= 400 && response.statusCode < 500) {
        return HttpErrorType::Client;
    }
    return HttpErrorType::None;
}

} // namespace holly::tts_proxy::utils
