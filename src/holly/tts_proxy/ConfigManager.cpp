#include "holly/tts_proxy/ConfigManager.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace holly::tts_proxy {

static std::string trimCopy(std::string s) {
    auto notSpace = [](int ch) { return !std::isspace(ch); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
    s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
    return s;
}

static void setConfigError(ErrorInfo* err, int code, std::string message,
                           std::optional<nlohmann::json> details = std::nullopt) {
    if (!err) return;
    err->errorType = ErrorType::ValidationError;
    err->errorCode = code;
    err->stage = "config";
    err->message = std::move(message);
    err->details = std::move(details);
}

ConfigManager::ConfigManager()
    : m_cfg(makeDefaultConfig())
{}

bool ConfigManager::loadFromFile(const std::string& path, ErrorInfo* err) {
    std::ifstream ifs(path, std::ios::in | std::ios::binary);
    if (!ifs.is_open()) {
        // 1) 回退默认配置（内存）
        {
            std::lock_guard<std::mutex> lk(m_mu);
            m_cfg = makeDefaultConfig();
            applyEnvMappingOverrides(m_cfg);
            replaceEnvPlaceholdersRecursive(m_cfg);
        }

        // 2) 自动生成配置模板（落盘的是未替换 ${...} 的默认值）
        ErrorInfo saveErr;
        const bool saved = saveToFile(path, &saveErr);

        if (err) {
            err->errorType = ErrorType::UnknownError;
            err->errorCode = 0;
            err->stage = "config";
            err->message = "Config file not found, using default config: " + path;
            err->details = nlohmann::json{
                {"path", path},
                {"fallback", "default_config"},
                {"auto_created", saved}
            };
            if (!saved) {
                (*err->details)["auto_create_failed"] = saveErr.toJson();
            }
        }
        return true;
    }

    std::stringstream buffer;
    buffer << ifs.rdbuf();
    return loadFromString(buffer.str(), err);
}

bool ConfigManager::loadFromString(const std::string& jsonText, ErrorInfo* err) {
    nlohmann::json parsed;
    try {
        parsed = nlohmann::json::parse(jsonText);
    } catch (const std::exception& e) {
        setConfigError(err, 0, std::string("Config JSON parse failed: ") + e.what(),
                       nlohmann::json{{"snippet", jsonText.substr(0, 256)}});
        return false;
    }

    if (!parsed.is_object()) {
        setConfigError(err, 0, "Config root must be a JSON object");
        return false;
    }

    // 缺省字段以默认配置补齐，文件里只需写需要改的部分
    nlohmann::json merged = makeDefaultConfig();
    merged.merge_patch(parsed);

    // 在锁外处理 env 逻辑，避免长期占用
    applyEnvMappingOverrides(merged);
    replaceEnvPlaceholdersRecursive(merged);

    {
        std::lock_guard<std::mutex> lk(m_mu);
        m_cfg = std::move(merged);
    }
    return true;
}

nlohmann::json ConfigManager::getRaw() const {
    std::lock_guard<std::mutex> lk(m_mu);
    return m_cfg;
}

bool ConfigManager::saveToFile(const std::string& path, ErrorInfo* err) const {
    try {
        const std::filesystem::path p(path);
        const auto parent = p.parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec && !std::filesystem::exists(parent)) {
                setConfigError(err, 1, "Failed to create config directory: " + parent.string(),
                               nlohmann::json{{"path", path}, {"ec", ec.value()}, {"what", ec.message()}});
                return false;
            }
        }

        std::ofstream ofs(path, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            setConfigError(err, 2, "Failed to open config file for write: " + path,
                           nlohmann::json{{"path", path}});
            return false;
        }

        // 写盘时避免写入 env 替换后的敏感信息：始终以默认模板为准
        const auto tmpl = makeDefaultConfig();
        ofs << tmpl.dump(2) << "\n";
        ofs.flush();
        return true;
    } catch (const std::exception& e) {
        setConfigError(err, 3, std::string("Failed to save config file: ") + e.what(),
                       nlohmann::json{{"path", path}});
        return false;
    }
}

std::optional<nlohmann::json> ConfigManager::get(const std::string& keyPath) const {
    const auto parts = splitKeyPath(keyPath);
    if (parts.empty()) return std::nullopt;

    std::lock_guard<std::mutex> lk(m_mu);
    const nlohmann::json* p = getPtrByPath(m_cfg, parts);
    if (!p) return std::nullopt;
    return std::optional<nlohmann::json>{*p};
}

bool ConfigManager::set(const std::string& keyPath, const nlohmann::json& v, ErrorInfo* err) {
    const auto parts = splitKeyPath(keyPath);
    if (parts.empty()) {
        setConfigError(err, 0, "Empty keyPath");
        return false;
    }

    std::lock_guard<std::mutex> lk(m_mu);
    nlohmann::json* p = getOrCreatePtrByPath(m_cfg, parts);
    if (!p) {
        setConfigError(err, 0, "Failed to create keyPath: " + keyPath);
        return false;
    }
    *p = v;
    return true;
}

void ConfigManager::applyEnvironmentOverrides() {
    std::lock_guard<std::mutex> lk(m_mu);
    applyEnvMappingOverrides(m_cfg);
    replaceEnvPlaceholdersRecursive(m_cfg);
}

std::vector<std::string> ConfigManager::validate() const {
    return validateJson(getRaw());
}

nlohmann::json ConfigManager::makeDefaultConfig() {
    nlohmann::json j;
    j["_comment"] = "Holly TTS proxy config template (auto-generated). JSON has no comments; use _comment fields.";
    j["server"] = {
        {"host", "0.0.0.0"},
        {"port", 3001},
        {"cors_origin", "*"},
        {"thread_pool_size", 8}
    };
    j["text_generation"] = {
        {"_comment", "Ollama-compatible /api/generate. mode: batch (one JSON object) or stream (NDJSON fragments)."},
        {"base_url", "http://localhost:11434"},
        {"endpoint", "/api/generate"},
        {"model", "llama3"},
        {"mode", "batch"},
        {"text_field", "response"},
        {"timeout_ms", 30000},
        {"max_retries", 1},
        {"api_key", "${HOLLY_LLM_API_KEY}"}
    };
    j["synthesis"] = {
        {"_comment", "backend: subprocess (stdin text, stdout audio) or remote (POST {text, speed, sample_rate})."},
        {"backend", "subprocess"},
        {"command", "python3"},
        {"args", nlohmann::json::array({"python/stream_tts.py"})},
        {"format", "mp3"},
        {"max_chars", 1000},
        {"truncation_marker", "..."},
        {"default_speed", 1.0},
        {"read_chunk_bytes", 4096},
        {"remote", {
            {"base_url", "http://localhost:8000"},
            {"endpoint", "/speak"},
            {"health_endpoint", "/health"},
            {"timeout_ms", 60000},
            {"queue_chunks", 16}
        }}
    };
    j["session"] = {
        {"abort_text_generation_on_disconnect", true},
        {"disconnect_poll_ms", 50}
    };
    j["logging"] = {
        {"level", "info"},
        {"enabled", true}
    };
    return j;
}

std::string ConfigManager::redactSensitive(const std::string& keyPath, const std::string& value) {
    if (!isSensitiveKeyPath(keyPath)) return value;
    const auto v = trimCopy(value);
    if (v.size() <= 8) return "******";
    return v.substr(0, 2) + "******" + v.substr(v.size() - 2);
}

std::optional<std::string> ConfigManager::getEnv(const std::string& name) {
    if (name.empty()) return std::nullopt;
    const char* v = std::getenv(name.c_str());
    if (!v) return std::nullopt;
    std::string s = v;
    if (s.empty()) return std::nullopt;
    return s;
}

bool ConfigManager::isSensitiveKeyPath(const std::string& keyPath) {
    std::string low = keyPath;
    std::transform(low.begin(), low.end(), low.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return low.find("api_key") != std::string::npos || low.find("apikey") != std::string::npos || low.find("secret") != std::string::npos;
}

std::vector<std::string> ConfigManager::splitKeyPath(const std::string& keyPath) {
    std::vector<std::string> parts;
    std::string cur;
    for (char c : keyPath) {
        if (c == '.') {
            if (!cur.empty()) parts.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) parts.push_back(cur);
    return parts;
}

const nlohmann::json* ConfigManager::getPtrByPath(const nlohmann::json& root, const std::vector<std::string>& parts) {
    const nlohmann::json* p = &root;
    for (const auto& k : parts) {
        if (!p->is_object()) return nullptr;
        auto it = p->find(k);
        if (it == p->end()) return nullptr;
        p = &(*it);
    }
    return p;
}

nlohmann::json* ConfigManager::getOrCreatePtrByPath(nlohmann::json& root, const std::vector<std::string>& parts) {
    nlohmann::json* p = &root;
    for (const auto& k : parts) {
        if (!p->is_object()) {
            *p = nlohmann::json::object();
        }
        p = &((*p)[k]);
    }
    return p;
}

void ConfigManager::applyEnvMappingOverrides(nlohmann::json& root) {
    // 固定映射：env -> keyPath
    struct MapItem {
        const char* env;
        const char* keyPath;
        bool integer;
    };
    const MapItem mapping[] = {
        {"HOLLY_PORT", "server.port", true},
        {"HOLLY_HOST", "server.host", false},
        {"HOLLY_LLM_BASE_URL", "text_generation.base_url", false},
        {"HOLLY_LLM_MODEL", "text_generation.model", false},
        {"HOLLY_LLM_API_KEY", "text_generation.api_key", false},
        {"HOLLY_TTS_COMMAND", "synthesis.command", false},
        {"HOLLY_TTS_BASE_URL", "synthesis.remote.base_url", false},
        {"HOLLY_LOG_LEVEL", "logging.level", false},
    };

    for (const auto& m : mapping) {
        auto v = getEnv(m.env);
        if (!v.has_value()) continue;
        // 空字符串视为“未提供”
        const auto val = trimCopy(v.value());
        if (val.empty()) continue;
        nlohmann::json* p = getOrCreatePtrByPath(root, splitKeyPath(m.keyPath));
        if (m.integer) {
            // 解析失败时保留字符串，由 validate() 报错
            char* end = nullptr;
            const long long n = std::strtoll(val.c_str(), &end, 10);
            if (end && *end == '\0') {
                *p = n;
            } else {
                *p = val;
            }
        } else {
            *p = val;
        }
    }
}

void ConfigManager::replaceEnvPlaceholdersRecursive(nlohmann::json& node) {
    if (node.is_object()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            replaceEnvPlaceholdersRecursive(it.value());
        }
        return;
    }
    if (node.is_array()) {
        for (auto& v : node) {
            replaceEnvPlaceholdersRecursive(v);
        }
        return;
    }
    if (node.is_string()) {
        node = replaceEnvPlaceholdersInString(node.get<std::string>());
    }
}

std::string ConfigManager::replaceEnvPlaceholdersInString(const std::string& s) {
    // 替换 ${ENV_NAME} 形式的占位符；未找到 env 时保留原样
    std::string out;
    out.reserve(s.size());

    for (size_t i = 0; i < s.size();) {
        if (i + 2 < s.size() && s[i] == '$' && s[i + 1] == '{') {
            const auto end = s.find('}', i + 2);
            if (end != std::string::npos) {
                const auto name = s.substr(i + 2, end - (i + 2));
                auto v = getEnv(name);
                if (v.has_value()) {
                    out += v.value();
                } else {
                    out += s.substr(i, end - i + 1);
                }
                i = end + 1;
                continue;
            }
        }
        out.push_back(s[i]);
        i++;
    }
    return out;
}

std::vector<std::string> ConfigManager::validateJson(const nlohmann::json& cfgCopy) {
    std::vector<std::string> out;

    auto checkUrl = [&out](const nlohmann::json& obj, const std::string& key, const std::string& label) {
        if (!obj.contains(key) || !obj[key].is_string() || trimCopy(obj[key].get<std::string>()).empty()) {
            out.push_back("Missing or invalid '" + label + "' (string required)");
            return;
        }
        const auto url = trimCopy(obj[key].get<std::string>());
        if (!(startsWith(url, "http://") || startsWith(url, "https://"))) {
            out.push_back("Invalid '" + label + "' (must start with http:// or https://)");
        }
    };
    auto checkIntRange = [&out](const nlohmann::json& obj, const std::string& key, const std::string& label,
                                long long lo, long long hi) {
        if (!obj.contains(key)) return;
        if (!obj[key].is_number_integer()) {
            out.push_back("Invalid '" + label + "' (integer required)");
            return;
        }
        const auto v = obj[key].get<long long>();
        if (v < lo || v > hi) {
            out.push_back("Invalid '" + label + "' (range " + std::to_string(lo) + ".." + std::to_string(hi) + ")");
        }
    };

    // server
    if (!cfgCopy.contains("server") || !cfgCopy["server"].is_object()) {
        out.push_back("Missing or invalid 'server' object");
    } else {
        const auto& server = cfgCopy["server"];
        checkIntRange(server, "port", "server.port", 1, 65535);
        checkIntRange(server, "thread_pool_size", "server.thread_pool_size", 1, 1024);
        if (server.contains("host") && !server["host"].is_string()) {
            out.push_back("Invalid 'server.host' (string required)");
        }
    }

    // text_generation
    if (!cfgCopy.contains("text_generation") || !cfgCopy["text_generation"].is_object()) {
        out.push_back("Missing or invalid 'text_generation' object");
    } else {
        const auto& tg = cfgCopy["text_generation"];
        checkUrl(tg, "base_url", "text_generation.base_url");
        checkIntRange(tg, "timeout_ms", "text_generation.timeout_ms", 1, 600000);
        checkIntRange(tg, "max_retries", "text_generation.max_retries", 0, 5);
        if (tg.contains("mode")) {
            const auto& mode = tg["mode"];
            if (!mode.is_string() || (mode.get<std::string>() != "batch" && mode.get<std::string>() != "stream")) {
                out.push_back("Invalid 'text_generation.mode' (batch|stream)");
            }
        }
        if (!tg.contains("model") || !tg["model"].is_string() || trimCopy(tg["model"].get<std::string>()).empty()) {
            out.push_back("Missing or invalid 'text_generation.model' (string required)");
        }
        if (tg.contains("api_key") && tg["api_key"].is_string()) {
            const auto key = trimCopy(tg["api_key"].get<std::string>());
            if (startsWith(key, "${") && key.find('}') != std::string::npos) {
                // 本地 Ollama 通常不需要 key
                out.push_back("WARN: 'text_generation.api_key' has unresolved env placeholder: " +
                              redactSensitive("text_generation.api_key", key));
            }
        }
    }

    // synthesis
    if (!cfgCopy.contains("synthesis") || !cfgCopy["synthesis"].is_object()) {
        out.push_back("Missing or invalid 'synthesis' object");
    } else {
        const auto& syn = cfgCopy["synthesis"];
        const auto backend = syn.contains("backend") && syn["backend"].is_string()
            ? syn["backend"].get<std::string>() : std::string("subprocess");
        if (backend != "subprocess" && backend != "remote") {
            out.push_back("Invalid 'synthesis.backend' (subprocess|remote)");
        }
        if (backend == "subprocess") {
            if (!syn.contains("command") || !syn["command"].is_string() || trimCopy(syn["command"].get<std::string>()).empty()) {
                out.push_back("Missing or invalid 'synthesis.command' (string required)");
            }
            if (syn.contains("args") && !syn["args"].is_array()) {
                out.push_back("Invalid 'synthesis.args' (array required)");
            }
        } else if (backend == "remote") {
            if (!syn.contains("remote") || !syn["remote"].is_object()) {
                out.push_back("Missing or invalid 'synthesis.remote' object");
            } else {
                checkUrl(syn["remote"], "base_url", "synthesis.remote.base_url");
                checkIntRange(syn["remote"], "queue_chunks", "synthesis.remote.queue_chunks", 1, 4096);
            }
        }
        if (syn.contains("format")) {
            static const char* kFormats[] = {"mp3", "wav", "ogg", "flac", "pcm"};
            const bool ok = syn["format"].is_string() &&
                std::any_of(std::begin(kFormats), std::end(kFormats),
                            [&](const char* f) { return syn["format"].get<std::string>() == f; });
            if (!ok) out.push_back("Invalid 'synthesis.format' (mp3|wav|ogg|flac|pcm)");
        }
        // 转写一次性写入 worker stdin，需小于管道缓冲
        checkIntRange(syn, "max_chars", "synthesis.max_chars", 1, 16000);
        if (syn.contains("truncation_marker") &&
            (!syn["truncation_marker"].is_string() || syn["truncation_marker"].get<std::string>().size() > 64)) {
            out.push_back("Invalid 'synthesis.truncation_marker' (string of at most 64 bytes)");
        }
        checkIntRange(syn, "read_chunk_bytes", "synthesis.read_chunk_bytes", 1, 1 << 20);
        if (syn.contains("default_speed")) {
            if (!syn["default_speed"].is_number()) {
                out.push_back("Invalid 'synthesis.default_speed' (number required)");
            } else {
                const auto s = syn["default_speed"].get<double>();
                if (s < 0.5 || s > 2.0) out.push_back("WARN: 'synthesis.default_speed' outside 0.5..2.0, will be clamped");
            }
        }
    }

    // session
    if (cfgCopy.contains("session") && cfgCopy["session"].is_object()) {
        checkIntRange(cfgCopy["session"], "disconnect_poll_ms", "session.disconnect_poll_ms", 1, 10000);
    }

    // logging
    if (cfgCopy.contains("logging") && cfgCopy["logging"].is_object() && cfgCopy["logging"].contains("level")) {
        const auto& lv = cfgCopy["logging"]["level"];
        static const char* kLevels[] = {"error", "warning", "warn", "info", "debug"};
        const bool ok = lv.is_string() &&
            std::any_of(std::begin(kLevels), std::end(kLevels),
                        [&](const char* l) { return lv.get<std::string>() == l; });
        if (!ok) out.push_back("WARN: unknown 'logging.level', falling back to info");
    }

    return out;
}

bool ConfigManager::hasHardValidationErrors(const std::vector<std::string>& issues) {
    for (const auto& s : issues) {
        if (!startsWith(s, "WARN:")) return true;
    }
    return false;
}

bool ConfigManager::startsWith(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

} // namespace holly::tts_proxy
