#pragma once

#include "holly/tts_proxy/ErrorHandler.h"
#include "holly/tts_proxy/ErrorTypes.h"
#include "holly/tts_proxy/utils/HttpTypes.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace holly::tts_proxy {

class ConfigManager;

/**
 * @brief 换行分隔的 JSON 片段流解码器
 *
 * 网络分块可能把一行拆开：feed() 只缓存，drain() 只处理完整行，finish() 冲刷末尾无换行的一行。
 * 解析失败的行被跳过并计数，从不抛异常。
 */
class FragmentDecoder {
public:
    explicit FragmentDecoder(std::string textField = "response");

    void feed(std::string_view chunk);

    // 已完整到达的行中的文本增量（按到达顺序）
    std::vector<std::string> drain();

    // 流结束：处理缓冲区剩余内容
    std::vector<std::string> finish();

    std::size_t skippedCount() const { return m_skipped; }
    bool sawDone() const { return m_done; }

private:
    void parseLine(std::string line, std::vector<std::string>& out);

    std::string m_textField;
    std::string m_buf;
    std::size_t m_skipped{0};
    bool m_done{false};
};

/**
 * @brief 调用文本生成服务（Ollama 风格 /api/generate），把结果汇总为一条转写文本
 *
 * - Batch：{model, prompt, stream:false}，读取单个 JSON 对象的 text 字段
 * - FragmentStream：{model, prompt, stream:true}，逐行累加增量
 * 超时重试 maxRetries 次（默认 1）；其余失败抛 ProxyError(UpstreamError)。
 * CancelToken 置位后立即中止在途请求，并抛 ProxyError(ClientDisconnected)。
 */
class TranscriptAccumulator {
public:
    enum class Mode {
        Batch,
        FragmentStream
    };

    struct Config {
        std::string baseUrl{"http://localhost:11434"};
        std::string endpoint{"/api/generate"};
        std::string model{"llama3"};
        Mode mode{Mode::Batch};
        std::string textField{"response"};
        int timeoutMs{30000};
        int maxRetries{1};
        std::string apiKey;

        static Config loadConfig(const ConfigManager& cfg);
    };

    TranscriptAccumulator(Config config, const ErrorHandler& errors);

    TranscriptAccumulator(const TranscriptAccumulator&) = delete;
    TranscriptAccumulator& operator=(const TranscriptAccumulator&) = delete;

    std::string generate(const std::string& prompt, const utils::CancelToken& cancel) const;

    const Config& config() const { return m_config; }

private:
    std::string generateBatch(const std::string& prompt, const utils::CancelToken& cancel) const;
    std::string generateFragments(const std::string& prompt, const utils::CancelToken& cancel) const;

    utils::HttpRequest buildRequest(const std::string& prompt, bool stream, const utils::CancelToken& cancel) const;
    [[noreturn]] void throwFailure(const utils::HttpResponse& resp, const utils::HttpRequest& req, int attempts) const;

    Config m_config;
    const ErrorHandler& m_errors;
};

} // namespace holly::tts_proxy
