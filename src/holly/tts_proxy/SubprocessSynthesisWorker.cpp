#include "holly/tts_proxy/SubprocessSynthesisWorker.h"

#include <cerrno>
#include <cstdlib>
#include <sstream>
#include <system_error>

#include <unistd.h>

namespace holly::tts_proxy {

SubprocessSynthesisWorker::SubprocessSynthesisWorker(Options options, const ErrorHandler& errors)
    : m_options(std::move(options))
    , m_errors(errors)
{}

void SubprocessSynthesisWorker::start(const SynthesisJob& job) {
    utils::SubprocessOptions opt;
    opt.command = m_options.command;
    opt.args = m_options.args;
    opt.stderrCapBytes = m_options.stderrCapBytes;
    {
        std::ostringstream speed;
        speed << job.speed;
        opt.env["HOLLY_TTS_SPEED"] = speed.str();
    }
    if (job.sampleRate.has_value()) {
        opt.env["HOLLY_TTS_SAMPLE_RATE"] = std::to_string(*job.sampleRate);
    }
    opt.env["HOLLY_TTS_FORMAT"] = FormatSniffer::formatName(job.format);

    try {
        m_proc.spawn(opt);
    } catch (const utils::SubprocessError& e) {
        if (e.errorNumber() == ECANCELED) {
            // 启动前已被 terminate()：session 已被取代，不再产生进程
            throw ProxyError(ErrorType::SynthesisError, "synthesis", kSessionSupersededMessage);
        }
        ErrorInfo info;
        info.errorType = ErrorType::ProcessSpawnError;
        info.errorCode = e.errorNumber();
        info.stage = "synthesis_spawn";
        info.message = "TTS process error";
        info.details = nlohmann::json{
            {"command", m_options.command},
            {"reason", ErrorHandler::capText(e.what())}
        };
        throw ProxyError(info);
    }

    m_errors.log(ErrorHandler::LogLevel::Debug,
                 "Synthesis worker spawned: pid " + std::to_string(m_proc.pid()));

    std::string line = job.text;
    line.push_back('\n');
    if (!m_proc.writeStdin(line)) {
        // worker 提前关闭了 stdin；结果交给退出码判定
        m_errors.log(ErrorHandler::LogLevel::Warning, "Synthesis worker closed stdin before reading transcript");
    }
    m_proc.closeStdin();
}

std::optional<std::string> SubprocessSynthesisWorker::readChunk() {
    try {
        return m_proc.readStdout(m_options.readChunkBytes);
    } catch (const std::system_error& e) {
        throw ProxyError(ErrorType::SynthesisError, "synthesis",
                         std::string("Failed to read synthesis output: ") + e.what(), e.code().value());
    }
}

void SubprocessSynthesisWorker::terminate() noexcept {
    m_terminateRequested.store(true);
    m_proc.terminate();
}

int SubprocessSynthesisWorker::wait() {
    const auto status = m_proc.wait();
    const auto diag = m_proc.stderrOutput();
    if (!status.success()) {
        ErrorInfo info;
        info.errorType = ErrorType::SynthesisError;
        info.errorCode = status.exited ? status.code : 128 + status.signal;
        info.stage = "synthesis";
        info.message = "Synthesis worker " + status.toString();
        if (!diag.empty()) info.details = nlohmann::json{{"stderr", diag}};
        m_errors.log(m_terminateRequested.load() ? ErrorHandler::LogLevel::Debug : ErrorHandler::LogLevel::Warning,
                     "Synthesis worker finished abnormally", info);
    } else if (!diag.empty()) {
        m_errors.log(ErrorHandler::LogLevel::Debug,
                     "Synthesis worker stderr: " + ErrorHandler::capText(diag, ErrorHandler::kMaxSnippetChars));
    }
    if (status.exited) return status.code;
    return 128 + status.signal;
}

std::string SubprocessSynthesisWorker::diagnostics() const {
    return m_proc.stderrOutput();
}

bool SubprocessSynthesisWorker::commandResolvable(const std::string& command) {
    if (command.empty()) return false;
    if (command.find('/') != std::string::npos) {
        return ::access(command.c_str(), X_OK) == 0;
    }
    const char* path = std::getenv("PATH");
    if (!path) return false;
    std::istringstream iss(path);
    std::string dir;
    while (std::getline(iss, dir, ':')) {
        if (dir.empty()) dir = ".";
        const auto candidate = dir + "/" + command;
        if (::access(candidate.c_str(), X_OK) == 0) return true;
    }
    return false;
}

} // namespace holly::tts_proxy
