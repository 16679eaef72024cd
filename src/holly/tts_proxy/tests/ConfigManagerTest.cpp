#include "holly/tts_proxy/ConfigManager.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace holly::tts_proxy;

namespace {

bool hasIssue(const std::vector<std::string>& issues, const std::string& needle) {
    return std::any_of(issues.begin(), issues.end(),
                       [&](const std::string& s) { return s.find(needle) != std::string::npos; });
}

struct EnvGuard {
    std::string name;
    EnvGuard(const std::string& n, const std::string& v) : name(n) { ::setenv(n.c_str(), v.c_str(), 1); }
    ~EnvGuard() { ::unsetenv(name.c_str()); }
};

} // namespace

TEST(ConfigManagerTests, DefaultsAreUsable) {
    ConfigManager cm;
    EXPECT_EQ(cm.get("server.port")->get<int>(), 3001);
    EXPECT_EQ(cm.get("text_generation.mode")->get<std::string>(), "batch");
    EXPECT_EQ(cm.get("synthesis.max_chars")->get<int>(), 1000);
    EXPECT_EQ(cm.get("synthesis.truncation_marker")->get<std::string>(), "...");
    EXPECT_TRUE(cm.get("session.abort_text_generation_on_disconnect")->get<bool>());
    EXPECT_FALSE(ConfigManager::hasHardValidationErrors(cm.validate()));
}

TEST(ConfigManagerTests, LoadFromStringMergesOverDefaults) {
    ConfigManager cm;
    ErrorInfo err;
    ASSERT_TRUE(cm.loadFromString(R"({"synthesis":{"max_chars":200,"format":"wav"}})", &err));
    EXPECT_EQ(cm.get("synthesis.max_chars")->get<int>(), 200);
    EXPECT_EQ(cm.get("synthesis.format")->get<std::string>(), "wav");
    // 未写出的键保持默认
    EXPECT_EQ(cm.get("synthesis.command")->get<std::string>(), "python3");
    EXPECT_EQ(cm.get("server.port")->get<int>(), 3001);
}

TEST(ConfigManagerTests, InvalidJsonKeepsPreviousConfig) {
    ConfigManager cm;
    ASSERT_TRUE(cm.loadFromString(R"({"server":{"port":4000}})"));
    ErrorInfo err;
    EXPECT_FALSE(cm.loadFromString("{not json", &err));
    EXPECT_EQ(err.stage, "config");
    EXPECT_EQ(cm.get("server.port")->get<int>(), 4000);

    EXPECT_FALSE(cm.loadFromString("[1,2,3]", &err));
}

TEST(ConfigManagerTests, KeyPathGetAndSet) {
    ConfigManager cm;
    EXPECT_FALSE(cm.get("synthesis.remote.missing").has_value());
    ASSERT_TRUE(cm.set("synthesis.remote.timeout_ms", 1234));
    EXPECT_EQ(cm.get("synthesis.remote.timeout_ms")->get<int>(), 1234);
    ASSERT_TRUE(cm.set("extra.nested.value", "x"));
    EXPECT_EQ(cm.get("extra.nested.value")->get<std::string>(), "x");
}

TEST(ConfigManagerTests, EnvironmentOverrides) {
    EnvGuard port("HOLLY_PORT", "4100");
    EnvGuard model("HOLLY_LLM_MODEL", "mistral");
    EnvGuard key("HOLLY_LLM_API_KEY", "sk-test-123456789");

    ConfigManager cm;
    ASSERT_TRUE(cm.loadFromString("{}"));
    cm.applyEnvironmentOverrides();
    EXPECT_EQ(cm.get("server.port")->get<int>(), 4100);
    EXPECT_EQ(cm.get("text_generation.model")->get<std::string>(), "mistral");
    EXPECT_EQ(cm.get("text_generation.api_key")->get<std::string>(), "sk-test-123456789");
    EXPECT_FALSE(hasIssue(cm.validate(), "api_key"));
}

TEST(ConfigManagerTests, NonNumericPortIsRejected) {
    EnvGuard port("HOLLY_PORT", "eighty");
    ConfigManager cm;
    ASSERT_TRUE(cm.loadFromString("{}"));
    const auto issues = cm.validate();
    EXPECT_TRUE(hasIssue(issues, "server.port"));
    EXPECT_TRUE(ConfigManager::hasHardValidationErrors(issues));
}

TEST(ConfigManagerTests, ValidateReportsHardErrorsAndWarnings) {
    ConfigManager cm;
    ASSERT_TRUE(cm.loadFromString(R"({
        "text_generation": {"mode": "chunky", "base_url": "localhost:11434"},
        "synthesis": {"backend": "subprocess", "max_chars": 0, "format": "aac", "default_speed": 3.0},
        "logging": {"level": "loud"}
    })"));
    const auto issues = cm.validate();
    EXPECT_TRUE(hasIssue(issues, "text_generation.mode"));
    EXPECT_TRUE(hasIssue(issues, "text_generation.base_url"));
    EXPECT_TRUE(hasIssue(issues, "synthesis.max_chars"));
    EXPECT_TRUE(hasIssue(issues, "synthesis.format"));
    EXPECT_TRUE(hasIssue(issues, "WARN: 'synthesis.default_speed'"));
    EXPECT_TRUE(hasIssue(issues, "WARN: unknown 'logging.level'"));
    EXPECT_TRUE(ConfigManager::hasHardValidationErrors(issues));

    EXPECT_FALSE(ConfigManager::hasHardValidationErrors({"WARN: only a warning"}));
}

TEST(ConfigManagerTests, TranscriptLimitsMustFitWorkerPipe) {
    ConfigManager cm;
    ASSERT_TRUE(cm.loadFromString(
        R"({"synthesis":{"max_chars":100000,"truncation_marker":")" + std::string(65, '.') + R"("}})"));
    const auto issues = cm.validate();
    EXPECT_TRUE(hasIssue(issues, "synthesis.max_chars"));
    EXPECT_TRUE(hasIssue(issues, "synthesis.truncation_marker"));
    EXPECT_TRUE(ConfigManager::hasHardValidationErrors(issues));
}

TEST(ConfigManagerTests, RemoteBackendRequiresBaseUrl) {
    ConfigManager cm;
    ASSERT_TRUE(cm.loadFromString(R"({"synthesis":{"backend":"remote","remote":{"base_url":""}}})"));
    EXPECT_TRUE(hasIssue(cm.validate(), "synthesis.remote.base_url"));
}

TEST(ConfigManagerTests, MissingFileFallsBackAndWritesTemplate) {
    const auto dir = std::filesystem::temp_directory_path() / "holly_cfg_test";
    std::filesystem::remove_all(dir);
    const auto path = (dir / "holly.json").string();

    ConfigManager cm;
    ErrorInfo err;
    ASSERT_TRUE(cm.loadFromFile(path, &err));
    EXPECT_EQ(err.stage, "config");
    EXPECT_TRUE(std::filesystem::exists(path));
    EXPECT_EQ(cm.get("server.port")->get<int>(), 3001);

    // 生成的模板可以再次加载
    ConfigManager reloaded;
    ErrorInfo err2;
    ASSERT_TRUE(reloaded.loadFromFile(path, &err2));
    EXPECT_EQ(reloaded.get("synthesis.format")->get<std::string>(), "mp3");
    std::filesystem::remove_all(dir);
}

TEST(ConfigManagerTests, RedactSensitive) {
    EXPECT_EQ(ConfigManager::redactSensitive("text_generation.api_key", "sk-1234567890"), "sk******90");
    EXPECT_EQ(ConfigManager::redactSensitive("text_generation.api_key", "short"), "******");
    EXPECT_EQ(ConfigManager::redactSensitive("text_generation.model", "llama3"), "llama3");
}
