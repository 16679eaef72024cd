#pragma once

#include "holly/tts_proxy/ErrorHandler.h"
#include "holly/tts_proxy/SynthesisPipeline.h"
#include "holly/tts_proxy/types/TextRequest.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace httplib {
    struct Response;
    class DataSink;
}

namespace holly::tts_proxy {

/**
 * @brief 响应状态：头部最多提交一次
 */
struct ResponseState {
    types::ResponseMode mode{types::ResponseMode::Buffered};
    bool headersCommitted{false};
    uint64_t bytesWritten{0};   // 已写入连接的正文字节（含帧头）
};

/**
 * @brief 流式输出期间与会话/中止逻辑的连接点
 */
struct StreamCallbacks {
    std::function<bool()> isCurrent;                 // 会话仍在槽中
    std::function<void(std::size_t)> onForwarded;    // 已转发的音频字节
    std::function<void()> onClientGone;              // 写失败
    std::function<void(bool)> onFinished;            // 响应结束（是否成功），恰好一次
};

/**
 * @brief 按 ResponseMode 构造 httplib::Response
 *
 * - JsonOnly：200 {"response": transcript}
 * - Buffered：读完全部音频并判定成功后一次性写出，转写文本放在 X-Transcript 头
 * - StreamedWithTrailer：chunked，声明 Trailer: X-Transcript，结束时写 trailer
 * - FramedStream：[type:u8][len:u32 BE][payload]，0x01 音频，0xFF 结束帧
 *
 * 流式模式下头部由 httplib 在 handler 返回后写出，正文由 content provider 从 SynthesisRun 拉取。
 * 提交后出现的任何失败都只能让 provider 返回 false（关闭连接，不写 trailer/结束帧）。
 */
class ResponseFramer : public std::enable_shared_from_this<ResponseFramer> {
public:
    static constexpr uint8_t kFrameAudio = 0x01;
    static constexpr uint8_t kFrameEnd = 0xFF;
    static constexpr const char* kTranscriptHeader = "X-Transcript";
    static constexpr const char* kFramingHeader = "X-Audio-Framing";
    static constexpr const char* kFramingScheme = "type=u8; length=u32be; audio=0x01; end=0xff";

    ResponseFramer(types::ResponseMode mode, const ErrorHandler& errors);

    ResponseFramer(const ResponseFramer&) = delete;
    ResponseFramer& operator=(const ResponseFramer&) = delete;

    static std::string encodeFrame(uint8_t type, std::string_view payload);

    // 控制字符（含 CR/LF/TAB、DEL）替换为空格
    static std::string sanitizeHeaderValue(const std::string& value);

    const ResponseState& state() const { return m_state; }
    types::ResponseMode mode() const { return m_state.mode; }

    void writeJson(httplib::Response& res, const std::string& transcript);

    // 头部已提交时只记录日志
    void writeError(httplib::Response& res, const ErrorInfo& err);

    /**
     * @brief 在当前线程读完全部输出；失败抛 ProxyError 且不提交头部
     */
    void writeBuffered(httplib::Response& res, SynthesisRun& run, const std::string& transcript,
                       const std::function<bool()>& isCurrent);

    /**
     * @brief 安装 chunked content provider（StreamedWithTrailer / FramedStream）
     */
    void beginStream(httplib::Response& res, std::shared_ptr<SynthesisRun> run,
                     std::string transcript, StreamCallbacks callbacks);

private:
    bool pump(httplib::DataSink& sink);
    bool writeOut(httplib::DataSink& sink, const std::string& data);
    void finish(bool success);

    ResponseState m_state;
    const ErrorHandler& m_errors;

    // 流式期间持有
    std::shared_ptr<SynthesisRun> m_run;
    std::string m_transcript;
    StreamCallbacks m_callbacks;
    uint64_t m_audioBytes{0};
    bool m_finished{false};
};

} // namespace holly::tts_proxy
