#pragma once

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>

#include "nlohmann/json.hpp"

namespace holly::tts_proxy::types {

// 请求进入时确定一次，之后在各组件间原样传递
enum class ResponseMode {
    JsonOnly,
    Buffered,
    StreamedWithTrailer,
    FramedStream
};

inline const char* responseModeToString(ResponseMode m) {
    switch (m) {
        case ResponseMode::JsonOnly: return "JsonOnly";
        case ResponseMode::Buffered: return "Buffered";
        case ResponseMode::StreamedWithTrailer: return "StreamedWithTrailer";
        case ResponseMode::FramedStream: return "FramedStream";
    }
    return "Unknown";
}

inline ResponseMode selectResponseMode(bool json, bool stream, bool framed) {
    if (json) return ResponseMode::JsonOnly;
    if (stream && framed) return ResponseMode::FramedStream;
    if (stream) return ResponseMode::StreamedWithTrailer;
    return ResponseMode::Buffered;
}

namespace text_request_detail {

inline bool isBlank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

// bool 原样；数字非 0 为真；"true"/"1" 为真；其余一律为假
inline bool truthy(const nlohmann::json& j, const char* key) {
    if (!j.contains(key)) return false;
    const auto& v = j[key];
    if (v.is_boolean()) return v.get<bool>();
    if (v.is_number()) return v.get<double>() != 0.0;
    if (v.is_string()) {
        const auto s = v.get<std::string>();
        return s == "true" || s == "1";
    }
    return false;
}

// 只接受数字或能完整解析为有限数字的字符串
inline std::optional<double> parseFiniteNumber(const nlohmann::json& v) {
    double d = 0.0;
    if (v.is_number()) {
        d = v.get<double>();
    } else if (v.is_string()) {
        const auto s = v.get<std::string>();
        if (s.empty() || isBlank(s)) return std::nullopt;
        char* end = nullptr;
        d = std::strtod(s.c_str(), &end);
        if (!end || *end != '\0') return std::nullopt;
    } else {
        return std::nullopt;
    }
    if (!std::isfinite(d)) return std::nullopt;
    return d;
}

} // namespace text_request_detail

/**
 * @brief POST /tts 请求体
 *
 * text 与 prompt 只有一个驱动转写：text 存在时优先，文本生成被跳过。
 */
struct TextRequest {
    static constexpr double kMinSpeed = 0.5;
    static constexpr double kMaxSpeed = 2.0;

    std::optional<std::string> prompt;
    std::optional<std::string> text;
    bool generate{false};
    bool json{false};
    bool stream{false};
    bool framed{false};
    std::optional<double> speed;      // 已夹紧到 [0.5, 2.0]；非数值视为未设置
    std::optional<uint32_t> sampleRate;

    static double clampSpeed(double v) {
        return std::clamp(v, kMinSpeed, kMaxSpeed);
    }

    static std::optional<double> parseSpeed(const nlohmann::json& v) {
        auto d = text_request_detail::parseFiniteNumber(v);
        if (!d) return std::nullopt;
        return clampSpeed(*d);
    }

    static std::optional<uint32_t> parseSampleRate(const nlohmann::json& v) {
        auto d = text_request_detail::parseFiniteNumber(v);
        if (!d || *d <= 0.0 || *d > 1000000.0 || std::floor(*d) != *d) return std::nullopt;
        return static_cast<uint32_t>(*d);
    }

    // 根对象不是 JSON object 时返回 nullopt；字段类型不符时按缺失处理
    static std::optional<TextRequest> fromJson(const nlohmann::json& j) {
        if (!j.is_object()) return std::nullopt;

        TextRequest r;
        if (j.contains("prompt") && j["prompt"].is_string()) r.prompt = j["prompt"].get<std::string>();
        if (j.contains("text") && j["text"].is_string()) r.text = j["text"].get<std::string>();
        r.generate = text_request_detail::truthy(j, "generate");
        r.json = text_request_detail::truthy(j, "json");
        r.stream = text_request_detail::truthy(j, "stream");
        r.framed = text_request_detail::truthy(j, "framed");
        if (j.contains("speed")) r.speed = parseSpeed(j["speed"]);
        if (j.contains("sample_rate")) r.sampleRate = parseSampleRate(j["sample_rate"]);
        return r;
    }

    bool hasLiteralText() const {
        return text.has_value() && !text_request_detail::isBlank(*text);
    }

    bool hasPrompt() const {
        return prompt.has_value() && !text_request_detail::isBlank(*prompt);
    }

    // 需要调用文本生成服务：没有 literal text，且 generate=true
    bool needsTextGeneration() const {
        return !hasLiteralText() && hasPrompt() && generate;
    }

    ResponseMode responseMode() const {
        return selectResponseMode(json, stream, framed);
    }

    double effectiveSpeed(double defaultSpeed) const {
        return speed.value_or(clampSpeed(defaultSpeed));
    }
};

} // namespace holly::tts_proxy::types
