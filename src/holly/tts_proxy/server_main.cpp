#include "holly/tts_proxy/ConfigManager.h"
#include "holly/tts_proxy/ErrorHandler.h"
#include "holly/tts_proxy/ProxyServer.h"

#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include <pthread.h>

using namespace holly::tts_proxy;

namespace {

void printUsage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [--config path]\n";
}

} // namespace

int main(int argc, char** argv) {
    std::string configPath = "config/holly.json";
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            printUsage(argv[0]);
            return 2;
        }
    }

    // 写已关闭的连接/管道时以 EPIPE 返回，而不是杀死进程
    std::signal(SIGPIPE, SIG_IGN);

    // SIGINT/SIGTERM 交给专用线程 sigwait；必须在创建其他线程前屏蔽
    sigset_t stopSignals;
    sigemptyset(&stopSignals);
    sigaddset(&stopSignals, SIGINT);
    sigaddset(&stopSignals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &stopSignals, nullptr);

    ErrorHandler errors;
    ConfigManager cfg;
    ErrorInfo loadErr;
    if (!cfg.loadFromFile(configPath, &loadErr)) {
        errors.log(ErrorHandler::LogLevel::Error, "Failed to load config: " + configPath, loadErr);
        return 1;
    }
    if (!loadErr.message.empty()) {
        errors.log(ErrorHandler::LogLevel::Warning, loadErr.message, loadErr);
    }
    cfg.applyEnvironmentOverrides();
    errors.setLoggerConfig(ErrorHandler::loadLoggerConfig(cfg));

    const auto issues = cfg.validate();
    for (const auto& issue : issues) {
        errors.log(issue.rfind("WARN:", 0) == 0 ? ErrorHandler::LogLevel::Warning : ErrorHandler::LogLevel::Error,
                   "Config: " + issue);
    }
    if (ConfigManager::hasHardValidationErrors(issues)) {
        errors.log(ErrorHandler::LogLevel::Error, "Refusing to start with invalid configuration");
        return 1;
    }

    ProxyServer server(cfg, errors);

    std::thread signalThread([&stopSignals, &server, &errors]() {
        int sig = 0;
        if (sigwait(&stopSignals, &sig) == 0) {
            errors.log(ErrorHandler::LogLevel::Info, "Received signal " + std::to_string(sig) + ", shutting down");
            server.stop();
        }
    });

    const bool ok = server.listen();
    if (!ok) {
        // 未能监听：唤醒信号线程使其退出
        pthread_kill(signalThread.native_handle(), SIGTERM);
    }
    signalThread.join();
    return ok ? 0 : 1;
}
