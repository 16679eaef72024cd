#include "holly/tts_proxy/AbortCoordinator.h"

#include "holly/tts_proxy/ConfigManager.h"

namespace holly::tts_proxy {

AbortCoordinator::Policy AbortCoordinator::Policy::loadConfig(const ConfigManager& cfg) {
    Policy p;
    if (auto j = cfg.get("session.abort_text_generation_on_disconnect"); j && j->is_boolean()) {
        p.abortTextGenerationOnDisconnect = j->get<bool>();
    }
    if (auto j = cfg.get("session.disconnect_poll_ms"); j && j->is_number_integer() && j->get<int>() > 0) {
        p.pollInterval = std::chrono::milliseconds(j->get<int>());
    }
    return p;
}

AbortCoordinator::AbortCoordinator(Policy policy, types::ResponseMode mode, utils::CancelToken textGeneration,
                                   const ErrorHandler& errors)
    : m_policy(policy)
    , m_mode(mode)
    , m_textGeneration(std::move(textGeneration))
    , m_errors(errors)
{}

AbortCoordinator::~AbortCoordinator() {
    stopWatching();
}

void AbortCoordinator::watch(std::function<bool()> connectionClosed) {
    if (!connectionClosed) return;
    std::lock_guard<std::mutex> lk(m_mu);
    if (m_watcher.joinable() || m_stop) return;
    m_watcher = std::thread(&AbortCoordinator::watchLoop, this, std::move(connectionClosed));
}

void AbortCoordinator::stopWatching() {
    std::thread watcher;
    {
        std::lock_guard<std::mutex> lk(m_mu);
        m_stop = true;
        watcher = std::move(m_watcher);
    }
    m_cv.notify_all();
    if (watcher.joinable() && watcher.get_id() != std::this_thread::get_id()) {
        watcher.join();
    } else if (watcher.joinable()) {
        watcher.detach();
    }
}

void AbortCoordinator::watchLoop(std::function<bool()> connectionClosed) {
    std::unique_lock<std::mutex> lk(m_mu);
    while (!m_stop) {
        if (m_cv.wait_for(lk, m_policy.pollInterval, [this]() { return m_stop; })) {
            return;
        }
        lk.unlock();
        const bool closed = connectionClosed();
        if (closed) {
            onDisconnect();
            return;
        }
        lk.lock();
    }
}

void AbortCoordinator::bindSession(std::shared_ptr<Session> session) {
    bool cancelNow = false;
    {
        std::lock_guard<std::mutex> lk(m_mu);
        m_session = session;
        cancelNow = m_disconnected.load();
    }
    if (cancelNow && session) {
        session->cancel();
    }
}

void AbortCoordinator::recordForwarded(std::size_t bytes) {
    m_bytesForwarded.fetch_add(bytes);
}

void AbortCoordinator::onDisconnect() {
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lk(m_mu);
        if (m_disconnected.exchange(true)) return;
        session = m_session;
    }

    if (m_mode == types::ResponseMode::JsonOnly) {
        if (m_policy.abortTextGenerationOnDisconnect) {
            m_textGeneration.cancel();
            m_errors.log(ErrorHandler::LogLevel::Info, "Client disconnected (json-only); text generation cancelled");
        }
        return;
    }

    const auto forwarded = m_bytesForwarded.load();
    if (forwarded == 0) {
        if (m_policy.abortTextGenerationOnDisconnect) m_textGeneration.cancel();
        if (session) session->cancel();
        m_errors.log(ErrorHandler::LogLevel::Info,
                     "Client disconnected before any audio; pending work cancelled" +
                     (session ? " (session " + session->id() + ")" : std::string()));
        return;
    }

    // 已发出的字节无法撤回，只停止继续合成
    if (session) session->cancel();
    m_errors.log(ErrorHandler::LogLevel::Info,
                 "Client disconnected after " + std::to_string(forwarded) + " audio bytes; worker terminated");
}

} // namespace holly::tts_proxy
