#include "holly/tts_proxy/utils/HttpSerialization.h"

namespace holly::tts_proxy::utils {

std::string toJsonBody(const nlohmann::json& j, bool pretty) {
    if (pretty) {
        return j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    }
    // 上游/worker 可能吐出非法 UTF-8，替换而不是抛异常
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::optional<nlohmann::json> parseJsonSafe(const std::string& text, std::string* error) {
    try {
        return nlohmann::json::parse(text);
    } catch (const std::exception& e) {
        if (error) {
            *error = e.what();
        }
        return std::nullopt;
    }
}

std::optional<std::string> stringField(const nlohmann::json& obj, const std::string& key) {
    if (!obj.is_object()) return std::nullopt;
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

} // namespace holly::tts_proxy::utils
