#include "holly/tts_proxy/FormatSniffer.h"

#include <algorithm>
#include <cctype>

namespace holly::tts_proxy {

namespace {

using Verdict = FormatSniffer::Verdict;
using Result = FormatSniffer::Result;

// prefix 与 magic 在重叠部分逐字节比较
Result matchMagic(std::string_view prefix, std::string_view magic, std::size_t offset,
                  bool endOfStream, const char* label) {
    const std::size_t need = offset + magic.size();
    const std::size_t have = prefix.size() > offset ? std::min(prefix.size() - offset, magic.size()) : 0;
    if (have > 0 && prefix.substr(offset, have) != magic.substr(0, have)) {
        return {Verdict::Invalid, std::string("missing ") + label + " signature"};
    }
    if (prefix.size() < need) {
        if (endOfStream) return {Verdict::Invalid, std::string("truncated ") + label + " signature"};
        return {Verdict::NeedMore, ""};
    }
    return {Verdict::Valid, ""};
}

Result classifyMp3(std::string_view p, bool endOfStream) {
    const auto b0 = static_cast<unsigned char>(p[0]);
    if (b0 == 0xFF) {
        if (p.size() < 2) {
            if (endOfStream) return {Verdict::Invalid, "truncated MP3 frame sync"};
            return {Verdict::NeedMore, ""};
        }
        const auto b1 = static_cast<unsigned char>(p[1]);
        if ((b1 & 0xE0) == 0xE0) return {Verdict::Valid, ""};
        return {Verdict::Invalid, "invalid MP3 frame sync"};
    }
    if (b0 == 'I') {
        auto r = matchMagic(p, "ID3", 0, endOfStream, "ID3");
        if (r.verdict == Verdict::Invalid && r.reason.rfind("missing", 0) == 0) {
            r.reason = "invalid MP3 header";
        }
        return r;
    }
    return {Verdict::Invalid, "invalid MP3 header"};
}

Result classifyWav(std::string_view p, bool endOfStream) {
    auto r = matchMagic(p, "RIFF", 0, endOfStream, "RIFF");
    if (r.verdict != Verdict::Valid) return r;
    return matchMagic(p, "WAVE", 8, endOfStream, "WAVE");
}

} // namespace

FormatSniffer::Result FormatSniffer::classify(std::string_view prefix, AudioFormat format, bool endOfStream) {
    if (prefix.empty()) {
        if (endOfStream) return {Verdict::Invalid, "no audio bytes"};
        return {Verdict::NeedMore, ""};
    }
    switch (format) {
        case AudioFormat::Mp3: return classifyMp3(prefix, endOfStream);
        case AudioFormat::Wav: return classifyWav(prefix, endOfStream);
        case AudioFormat::Ogg: return matchMagic(prefix, "OggS", 0, endOfStream, "OggS");
        case AudioFormat::Flac: return matchMagic(prefix, "fLaC", 0, endOfStream, "fLaC");
        case AudioFormat::Pcm: return {Verdict::Valid, ""};
    }
    return {Verdict::Invalid, "unknown format"};
}

std::optional<AudioFormat> FormatSniffer::parseFormat(const std::string& name) {
    std::string low = name;
    std::transform(low.begin(), low.end(), low.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (low == "mp3" || low == "mpeg") return AudioFormat::Mp3;
    if (low == "wav" || low == "wave") return AudioFormat::Wav;
    if (low == "ogg") return AudioFormat::Ogg;
    if (low == "flac") return AudioFormat::Flac;
    if (low == "pcm") return AudioFormat::Pcm;
    return std::nullopt;
}

const char* FormatSniffer::formatName(AudioFormat format) {
    switch (format) {
        case AudioFormat::Mp3: return "mp3";
        case AudioFormat::Wav: return "wav";
        case AudioFormat::Ogg: return "ogg";
        case AudioFormat::Flac: return "flac";
        case AudioFormat::Pcm: return "pcm";
    }
    return "unknown";
}

const char* FormatSniffer::contentType(AudioFormat format) {
    switch (format) {
        case AudioFormat::Mp3: return "audio/mpeg";
        case AudioFormat::Wav: return "audio/wav";
        case AudioFormat::Ogg: return "audio/ogg";
        case AudioFormat::Flac: return "audio/flac";
        case AudioFormat::Pcm: return "audio/pcm";
    }
    return "application/octet-stream";
}

const char* FormatSniffer::fileExtension(AudioFormat format) {
    return formatName(format);
}

std::string FormatSniffer::hexPrefix(std::string_view bytes, std::size_t n) {
    static const char kHex[] = "0123456789abcdef";
    std::string out;
    const auto count = std::min(n, bytes.size());
    out.reserve(count * 2);
    for (std::size_t i = 0; i < count; ++i) {
        const auto c = static_cast<unsigned char>(bytes[i]);
        out.push_back(kHex[c >> 4]);
        out.push_back(kHex[c & 0x0F]);
    }
    return out;
}

} // namespace holly::tts_proxy
