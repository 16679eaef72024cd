#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace holly::tts_proxy::utils {

// JSON 序列化为字符串（可选缩进）
std::string toJsonBody(const nlohmann::json& j, bool pretty = false);

// 安全解析 JSON，失败返回 std::nullopt，并可写入错误信息
std::optional<nlohmann::json> parseJsonSafe(const std::string& text, std::string* error = nullptr);

// 取 JSON 对象中的字符串字段；字段缺失或类型不符返回 nullopt
std::optional<std::string> stringField(const nlohmann::json& obj, const std::string& key);

} // namespace holly::tts_proxy::utils
