#pragma once

#include "holly/tts_proxy/ErrorHandler.h"
#include "holly/tts_proxy/FormatSniffer.h"
#include "holly/tts_proxy/RemoteSynthesisWorker.h"
#include "holly/tts_proxy/SessionSupervisor.h"
#include "holly/tts_proxy/SubprocessSynthesisWorker.h"
#include "holly/tts_proxy/SynthesisWorker.h"
#include "holly/tts_proxy/types/TextRequest.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace holly::tts_proxy {

class ConfigManager;

/**
 * @brief 一次已通过首块校验的合成输出
 *
 * next() 先返回校验时收集到的首块，再依次返回后续块；complete() 等待 worker 退出并判定结果。
 * 析构时若尚未 complete()，会终止并回收 worker。
 */
class SynthesisRun {
public:
    SynthesisRun(std::shared_ptr<SynthesisWorker> worker,
                 std::shared_ptr<Session> session,
                 std::string firstFrame,
                 bool outputEnded,
                 AudioFormat format,
                 const ErrorHandler& errors);
    ~SynthesisRun();

    SynthesisRun(const SynthesisRun&) = delete;
    SynthesisRun& operator=(const SynthesisRun&) = delete;

    // 下一块音频；输出结束返回 nullopt
    std::optional<std::string> next();

    // 退出码为 0 且 bytesForwarded > 0 才算成功；否则抛 ProxyError(SynthesisError)
    void complete(uint64_t bytesForwarded);

    // 终止 worker（不等待）
    void abort() noexcept;

    AudioFormat format() const { return m_format; }
    const std::shared_ptr<Session>& session() const { return m_session; }
    std::optional<int> exitCode() const { return m_exitCode; }

private:
    int reap();

    std::shared_ptr<SynthesisWorker> m_worker;
    std::shared_ptr<Session> m_session;
    std::string m_firstFrame;
    bool m_firstTaken{false};
    bool m_ended{false};
    AudioFormat m_format;
    const ErrorHandler& m_errors;
    std::optional<int> m_exitCode;
};

/**
 * @brief 合成流水线：截断转写文本、启动 worker、首块格式校验
 */
class SynthesisPipeline {
public:
    // 转写一次性写入 worker stdin：maxChars * 4 + marker + '\n' 必须小于 64 KiB 管道缓冲
    static constexpr std::size_t kMaxTranscriptChars = 16000;
    static constexpr std::size_t kMaxMarkerBytes = 64;

    enum class Backend {
        Subprocess,
        Remote
    };

    struct Config {
        Backend backend{Backend::Subprocess};
        std::string command{"python3"};
        std::vector<std::string> args{"python/stream_tts.py"};
        AudioFormat format{AudioFormat::Mp3};
        std::size_t maxChars{1000};
        std::string truncationMarker{"..."};
        double defaultSpeed{1.0};
        std::size_t readChunkBytes{4096};
        RemoteSynthesisWorker::Options remote;

        static Config loadConfig(const ConfigManager& cfg);
    };

    // maxChars / truncationMarker 超出上限时收紧到上限
    SynthesisPipeline(Config config, const ErrorHandler& errors, WorkerFactory factory = {});

    SynthesisPipeline(const SynthesisPipeline&) = delete;
    SynthesisPipeline& operator=(const SynthesisPipeline&) = delete;

    /**
     * @brief 超过 maxChars 个字符（UTF-8 码点）时截断为恰好 maxChars 个字符并追加 marker
     */
    static std::string capTranscript(const std::string& text, std::size_t maxChars, const std::string& marker);

    /**
     * @brief 启动 worker 并读取到首块通过校验为止
     *
     * 成功时 session 进入 Synthesizing，返回的 run 持有首块（尚未转发）。
     * 失败抛 ProxyError：ProcessSpawnError / FormatError / SynthesisError；失败时 worker 已被终止并回收。
     */
    std::unique_ptr<SynthesisRun> start(const std::shared_ptr<Session>& session,
                                        const std::string& transcript,
                                        const types::TextRequest& request) const;

    // 合成后端是否可用（/health）
    bool isAlive() const;
    const char* backendName() const;

    const Config& config() const { return m_config; }

private:
    std::shared_ptr<SynthesisWorker> makeDefaultWorker() const;
    [[noreturn]] void failAndReap(SynthesisWorker& worker, ErrorInfo info) const;

    Config m_config;
    const ErrorHandler& m_errors;
    WorkerFactory m_factory;
};

} // namespace holly::tts_proxy
