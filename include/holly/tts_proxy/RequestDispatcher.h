#pragma once

#include "holly/tts_proxy/AbortCoordinator.h"
#include "holly/tts_proxy/ErrorHandler.h"
#include "holly/tts_proxy/SessionSupervisor.h"
#include "holly/tts_proxy/SynthesisPipeline.h"
#include "holly/tts_proxy/TranscriptAccumulator.h"
#include "holly/tts_proxy/types/TextRequest.h"

#include <functional>
#include <string>

namespace httplib {
    struct Response;
}

namespace holly::tts_proxy {

/**
 * @brief POST /tts 的逐请求编排
 *
 * 解析请求 -> 取得转写文本 -> install 新 session -> 启动合成并校验首块 -> 按模式写响应。
 * 头部提交前的任何失败都写成 JSON 错误体；session 在响应结束时释放。
 */
class RequestDispatcher {
public:
    RequestDispatcher(SessionSupervisor& supervisor,
                      const TranscriptAccumulator& accumulator,
                      const SynthesisPipeline& pipeline,
                      AbortCoordinator::Policy abortPolicy,
                      const ErrorHandler& errors);

    RequestDispatcher(const RequestDispatcher&) = delete;
    RequestDispatcher& operator=(const RequestDispatcher&) = delete;

    /**
     * @param body 原始请求体
     * @param connectionClosed 轮询客户端是否已断开；可为空
     */
    void handle(const std::string& body, std::function<bool()> connectionClosed, httplib::Response& res);

    // 解析并校验请求体；失败抛 ProxyError(ValidationError)
    static types::TextRequest parseRequest(const std::string& body);

private:
    std::string acquireTranscript(const types::TextRequest& request, const utils::CancelToken& cancel) const;

    SessionSupervisor& m_supervisor;
    const TranscriptAccumulator& m_accumulator;
    const SynthesisPipeline& m_pipeline;
    const AbortCoordinator::Policy m_abortPolicy;
    const ErrorHandler& m_errors;
};

} // namespace holly::tts_proxy
