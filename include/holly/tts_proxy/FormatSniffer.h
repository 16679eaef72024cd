#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace holly::tts_proxy {

enum class AudioFormat {
    Mp3,
    Wav,
    Ogg,
    Flac,
    Pcm
};

/**
 * @brief 音频首块签名校验（纯函数，无 I/O）
 *
 * mp3：以 "ID3" 开头，或 byte0 == 0xFF 且 byte1 高 3 位全为 1（帧同步）
 * wav："RIFF" ???? "WAVE"；ogg："OggS"；flac："fLaC"；pcm：任意非空字节
 */
class FormatSniffer {
public:
    enum class Verdict {
        Valid,
        Invalid,
        NeedMore   // 前缀短于签名且目前为止都匹配
    };

    struct Result {
        Verdict verdict{Verdict::NeedMore};
        std::string reason;

        bool valid() const { return verdict == Verdict::Valid; }
    };

    // endOfStream=true 时不再返回 NeedMore（不足的前缀判为 Invalid）
    static Result classify(std::string_view prefix, AudioFormat format, bool endOfStream = false);

    static std::optional<AudioFormat> parseFormat(const std::string& name);
    static const char* formatName(AudioFormat format);
    static const char* contentType(AudioFormat format);
    static const char* fileExtension(AudioFormat format);

    // 日志用：前 n 个字节的十六进制
    static std::string hexPrefix(std::string_view bytes, std::size_t n = 10);
};

} // namespace holly::tts_proxy
