#pragma once

#include "holly/tts_proxy/ErrorHandler.h"
#include "holly/tts_proxy/SynthesisWorker.h"
#include "holly/tts_proxy/utils/Subprocess.h"

#include <atomic>
#include <cstddef>
#include <string>
#include <vector>

namespace holly::tts_proxy {

/**
 * @brief 子进程 worker：stdin 写入转写文本（一行），stdout 读取音频，stderr 作为诊断
 *
 * speed / sample_rate 通过环境变量 HOLLY_TTS_SPEED / HOLLY_TTS_SAMPLE_RATE 传递。
 */
class SubprocessSynthesisWorker : public SynthesisWorker {
public:
    struct Options {
        std::string command{"python3"};
        std::vector<std::string> args;
        std::size_t readChunkBytes{4096};
        std::size_t stderrCapBytes{8 * 1024};
    };

    SubprocessSynthesisWorker(Options options, const ErrorHandler& errors);
    ~SubprocessSynthesisWorker() override = default;

    void start(const SynthesisJob& job) override;
    std::optional<std::string> readChunk() override;
    void terminate() noexcept override;
    int wait() override;
    std::string diagnostics() const override;
    const char* backendName() const override { return "subprocess"; }

    // 检查命令能否在 PATH 中找到（/health 用）
    static bool commandResolvable(const std::string& command);

private:
    Options m_options;
    const ErrorHandler& m_errors;
    utils::Subprocess m_proc;
    std::atomic<bool> m_terminateRequested{false};
};

} // namespace holly::tts_proxy
