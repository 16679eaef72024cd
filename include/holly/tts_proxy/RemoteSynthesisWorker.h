#pragma once

#include "holly/tts_proxy/ErrorHandler.h"
#include "holly/tts_proxy/SynthesisWorker.h"
#include "holly/tts_proxy/utils/HttpTypes.h"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <thread>

namespace holly::tts_proxy {

/**
 * @brief 远程合成服务 worker：POST {text, speed, sample_rate, format} 到 /speak
 *
 * 响应正文由后台线程读入有界队列；队列满时读线程阻塞，形成与子进程管道相同的背压。
 * start() 阻塞到收到响应头或连接失败为止；连接失败视为启动失败。
 */
class RemoteSynthesisWorker : public SynthesisWorker {
public:
    struct Options {
        std::string baseUrl{"http://localhost:8000"};
        std::string endpoint{"/speak"};
        std::string healthEndpoint{"/health"};
        int timeoutMs{60000};
        std::size_t queueChunks{16};
    };

    RemoteSynthesisWorker(Options options, const ErrorHandler& errors);
    ~RemoteSynthesisWorker() override;

    void start(const SynthesisJob& job) override;
    std::optional<std::string> readChunk() override;
    void terminate() noexcept override;
    int wait() override;
    std::string diagnostics() const override;
    const char* backendName() const override { return "remote"; }

    // GET health_endpoint 返回 2xx
    static bool probeHealth(const Options& options);

private:
    void run(std::string body);
    bool push(std::string chunk);
    void joinReader();

    Options m_options;
    const ErrorHandler& m_errors;
    utils::CancelToken m_cancel;

    mutable std::mutex m_mu;
    std::condition_variable m_cv;
    std::deque<std::string> m_queue;
    bool m_responded{false};   // 收到响应头
    bool m_finished{false};    // 读线程结束
    int m_status{0};
    bool m_transportFailed{false};
    std::string m_diag;

    std::thread m_reader;
};

} // namespace holly::tts_proxy
