#include "holly/tts_proxy/SessionSupervisor.h"

namespace holly::tts_proxy {

const char* sessionStateToString(SessionState s) {
    switch (s) {
        case SessionState::Initializing: return "Initializing";
        case SessionState::Synthesizing: return "Synthesizing";
        case SessionState::Streaming: return "Streaming";
        case SessionState::Closed: return "Closed";
    }
    return "Unknown";
}

// ========== Session ==========

Session::Session(std::string id)
    : m_id(std::move(id))
    , m_createdAt(std::chrono::steady_clock::now())
{}

SessionState Session::state() const {
    std::lock_guard<std::mutex> lk(m_mu);
    return m_state;
}

bool Session::advance(SessionState next) {
    std::lock_guard<std::mutex> lk(m_mu);
    if (static_cast<int>(next) <= static_cast<int>(m_state)) {
        return false;
    }
    m_state = next;
    return true;
}

void Session::cancel() noexcept {
    std::shared_ptr<SynthesisWorker> worker;
    {
        std::lock_guard<std::mutex> lk(m_mu);
        if (m_cancelled.exchange(true)) return;
        worker = m_worker;
    }
    if (worker) {
        worker->terminate();
    }
}

bool Session::attachWorker(std::shared_ptr<SynthesisWorker> worker) {
    {
        std::lock_guard<std::mutex> lk(m_mu);
        if (!m_cancelled.load()) {
            m_worker = std::move(worker);
            return true;
        }
    }
    if (worker) {
        worker->terminate();
    }
    return false;
}

std::shared_ptr<SynthesisWorker> Session::worker() const {
    std::lock_guard<std::mutex> lk(m_mu);
    return m_worker;
}

// ========== SessionSupervisor ==========

SessionSupervisor::SessionSupervisor(const ErrorHandler& errors)
    : m_errors(errors)
{}

std::shared_ptr<Session> SessionSupervisor::createSession() {
    return std::make_shared<Session>("s-" + std::to_string(m_nextId.fetch_add(1)));
}

uint64_t SessionSupervisor::install(const std::shared_ptr<Session>& session) {
    std::shared_ptr<Session> previous;
    uint64_t epoch = 0;
    {
        std::lock_guard<std::mutex> lk(m_mu);
        previous = m_current;
        if (previous && previous != session) {
            // 终止信号在新 session 可见（进而 spawn）之前发出
            previous->cancel();
        }
        epoch = ++m_epoch;
        session->m_epoch.store(epoch);
        m_current = session;
    }

    if (previous && previous != session) {
        m_errors.log(ErrorHandler::LogLevel::Info,
                     "Session " + previous->id() + " (epoch " + std::to_string(previous->epoch()) +
                     ") superseded by " + session->id() + " (epoch " + std::to_string(epoch) + ")");
    } else {
        m_errors.log(ErrorHandler::LogLevel::Debug,
                     "Session " + session->id() + " installed (epoch " + std::to_string(epoch) + ")");
    }
    return epoch;
}

bool SessionSupervisor::release(const std::shared_ptr<Session>& session) {
    std::lock_guard<std::mutex> lk(m_mu);
    if (!session || m_current != session) {
        return false;
    }
    m_current.reset();
    return true;
}

bool SessionSupervisor::isCurrent(uint64_t epoch) const {
    std::lock_guard<std::mutex> lk(m_mu);
    return epoch != 0 && m_current && m_current->epoch() == epoch;
}

std::shared_ptr<Session> SessionSupervisor::current() const {
    std::lock_guard<std::mutex> lk(m_mu);
    return m_current;
}

} // namespace holly::tts_proxy
