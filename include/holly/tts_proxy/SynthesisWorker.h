#pragma once

#include "holly/tts_proxy/FormatSniffer.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace holly::tts_proxy {

// session 在 worker 启动前后被新请求取代时的错误文本
inline constexpr const char* kSessionSupersededMessage = "Session superseded by a newer request";

struct SynthesisJob {
    std::string text;                // 已截断的转写文本
    double speed{1.0};
    std::optional<uint32_t> sampleRate;
    AudioFormat format{AudioFormat::Mp3};
};

/**
 * @brief 一次合成任务的 worker（子进程或远程服务）
 *
 * 生命周期：start() -> readChunk()* -> wait()。
 * terminate() 可从任意线程调用，不阻塞；之后 readChunk() 会尽快返回 nullopt。
 */
class SynthesisWorker {
public:
    virtual ~SynthesisWorker() = default;

    // 启动失败抛 ProxyError(ProcessSpawnError)；start 之前已 terminate() 则抛 ProxyError(SynthesisError)
    virtual void start(const SynthesisJob& job) = 0;

    // 下一块音频；输出结束返回 nullopt
    virtual std::optional<std::string> readChunk() = 0;

    virtual void terminate() noexcept = 0;

    // 等待结束；返回退出码（0 表示成功，被信号终止为 128 + signo）
    virtual int wait() = 0;

    // 诊断文本（子进程 stderr / 远程错误信息），已截断
    virtual std::string diagnostics() const = 0;

    virtual const char* backendName() const = 0;
};

using WorkerFactory = std::function<std::shared_ptr<SynthesisWorker>()>;

} // namespace holly::tts_proxy
