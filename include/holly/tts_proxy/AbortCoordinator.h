#pragma once

#include "holly/tts_proxy/ErrorHandler.h"
#include "holly/tts_proxy/SessionSupervisor.h"
#include "holly/tts_proxy/types/TextRequest.h"
#include "holly/tts_proxy/utils/HttpTypes.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace holly::tts_proxy {

class ConfigManager;

/**
 * @brief 客户端断开时只拆除仍在进行且已无用的工作
 *
 * - JsonOnly：只取消文本生成
 * - 尚未转发任何音频字节：取消文本生成（受策略控制）并终止 worker
 * - 已转发音频：只终止 worker
 *
 * 后台线程轮询连接状态直到请求结束（流式响应在 provider 收尾时停止）；
 * 提交后写失败也会触发 onDisconnect()。
 */
class AbortCoordinator {
public:
    struct Policy {
        bool abortTextGenerationOnDisconnect{true};
        std::chrono::milliseconds pollInterval{50};

        static Policy loadConfig(const ConfigManager& cfg);
    };

    AbortCoordinator(Policy policy, types::ResponseMode mode, utils::CancelToken textGeneration,
                     const ErrorHandler& errors);
    ~AbortCoordinator();

    AbortCoordinator(const AbortCoordinator&) = delete;
    AbortCoordinator& operator=(const AbortCoordinator&) = delete;

    // connectionClosed 在后台线程中被周期调用，直到 stopWatching()
    void watch(std::function<bool()> connectionClosed);
    void stopWatching();

    // 已断开时立即取消该 session
    void bindSession(std::shared_ptr<Session> session);

    void recordForwarded(std::size_t bytes);
    uint64_t bytesForwarded() const { return m_bytesForwarded.load(); }

    // 幂等
    void onDisconnect();
    bool disconnected() const { return m_disconnected.load(); }

private:
    void watchLoop(std::function<bool()> connectionClosed);

    const Policy m_policy;
    const types::ResponseMode m_mode;
    utils::CancelToken m_textGeneration;
    const ErrorHandler& m_errors;

    std::mutex m_mu;
    std::condition_variable m_cv;
    bool m_stop{false};
    std::thread m_watcher;
    std::shared_ptr<Session> m_session;

    std::atomic<uint64_t> m_bytesForwarded{0};
    std::atomic<bool> m_disconnected{false};
};

} // namespace holly::tts_proxy
