#pragma once

#include "holly/tts_proxy/ErrorHandler.h"
#include "holly/tts_proxy/SynthesisWorker.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace holly::tts_proxy {

enum class SessionState {
    Initializing,   // 获取转写文本
    Synthesizing,   // worker 已启动，尚无通过校验的首帧
    Streaming,      // 首帧通过校验，响应头已提交
    Closed
};

const char* sessionStateToString(SessionState s);

/**
 * @brief 一次 prompt -> audio 请求的监管记录
 *
 * 状态只能前进；cancel() 是 fire-and-forget：只向 worker 发终止信号，不等待。
 */
class Session {
public:
    explicit Session(std::string id);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    const std::string& id() const { return m_id; }
    uint64_t epoch() const { return m_epoch.load(); }
    std::chrono::steady_clock::time_point createdAt() const { return m_createdAt; }

    SessionState state() const;

    // 单调推进；目标状态不晚于当前状态时返回 false 且不修改
    bool advance(SessionState next);

    bool isCancelled() const { return m_cancelled.load(); }
    void cancel() noexcept;

    // 已取消的 session 拒绝挂载并立即终止该 worker
    bool attachWorker(std::shared_ptr<SynthesisWorker> worker);
    std::shared_ptr<SynthesisWorker> worker() const;

private:
    friend class SessionSupervisor;

    const std::string m_id;
    const std::chrono::steady_clock::time_point m_createdAt;
    std::atomic<uint64_t> m_epoch{0};
    std::atomic<bool> m_cancelled{false};

    mutable std::mutex m_mu;
    SessionState m_state{SessionState::Initializing};
    std::shared_ptr<SynthesisWorker> m_worker;
};

/**
 * @brief 单槽 "当前 session" 寄存器
 *
 * install()：在同一临界区内取消旧 session、分配新 epoch、写入新 session（后来者胜）。
 * release()：只有槽里仍是该 session 时才清空。
 * 被取代的 session 的后续回调必须先用 isCurrent(epoch) 检查，不匹配时直接放弃。
 */
class SessionSupervisor {
public:
    explicit SessionSupervisor(const ErrorHandler& errors);

    SessionSupervisor(const SessionSupervisor&) = delete;
    SessionSupervisor& operator=(const SessionSupervisor&) = delete;

    std::shared_ptr<Session> createSession();

    // 返回分配给 session 的 epoch
    uint64_t install(const std::shared_ptr<Session>& session);

    bool release(const std::shared_ptr<Session>& session);

    bool isCurrent(uint64_t epoch) const;
    std::shared_ptr<Session> current() const;

private:
    const ErrorHandler& m_errors;

    mutable std::mutex m_mu;
    std::shared_ptr<Session> m_current;
    uint64_t m_epoch{0};
    std::atomic<uint64_t> m_nextId{1};
};

} // namespace holly::tts_proxy
